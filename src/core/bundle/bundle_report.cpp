#include "bundle_report.h"
#include <iostream>

namespace Relink {

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::CorruptBinary:        return "corrupt-binary";
        case DiagnosticKind::UnresolvedDependency: return "unresolved-dependency";
        case DiagnosticKind::CopyFailed:           return "copy-failed";
        case DiagnosticKind::RewriteFailed:        return "rewrite-failed";
        case DiagnosticKind::LeftoverReference:    return "leftover-reference";
        case DiagnosticKind::SignatureWarning:     return "signature-warning";
    }
    return "unknown";
}

void BundleReport::add(DiagnosticKind kind, const std::string& binary, const std::string& dependency,
                       const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex);
    diagnostics.push_back(Diagnostic{kind, binary, dependency, detail});
    if (!quiet) {
        std::cerr << "warning: " << diagnostic_kind_name(kind) << ": " << binary;
        if (!dependency.empty()) {
            std::cerr << " -> " << dependency;
        }
        if (!detail.empty()) {
            std::cerr << " (" << detail << ")";
        }
        std::cerr << std::endl;
    }
}

std::vector<Diagnostic> BundleReport::get_diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex);
    return diagnostics;
}

size_t BundleReport::count(DiagnosticKind kind) const {
    std::lock_guard<std::mutex> lock(mutex);
    size_t n = 0;
    for (const auto& d : diagnostics) {
        if (d.kind == kind) ++n;
    }
    return n;
}

bool BundleReport::has_runtime_risks() const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& d : diagnostics) {
        switch (d.kind) {
            case DiagnosticKind::UnresolvedDependency:
            case DiagnosticKind::CopyFailed:
            case DiagnosticKind::RewriteFailed:
            case DiagnosticKind::LeftoverReference:
                return true;
            default:
                break;
        }
    }
    return false;
}

void BundleReport::print(std::ostream& out) const {
    std::lock_guard<std::mutex> lock(mutex);

    size_t copied = 0;
    for (const auto& entry : vendored) {
        if (entry.state == VendorState::Copied) ++copied;
    }

    out << "=== Bundle relink report ===" << std::endl;
    out << "Passes: " << pass_count << std::endl;
    out << "Vendored libraries: " << copied << std::endl;
    for (const auto& entry : vendored) {
        out << "  " << entry.basename << " [" << vendor_state_name(entry.state) << "]";
        if (!entry.resolved_source_path.empty()) {
            out << " from " << entry.resolved_source_path;
        }
        out << std::endl;
    }
    out << "Touched binaries: " << touched.size() << std::endl;
    for (const auto& path : touched) {
        out << "  " << path << std::endl;
    }
    out << "Signed: " << signed_count << std::endl;

    out << "Diagnostics: " << diagnostics.size() << std::endl;
    for (const auto& d : diagnostics) {
        out << "  " << diagnostic_kind_name(d.kind) << ": " << d.binary;
        if (!d.dependency.empty()) out << " -> " << d.dependency;
        if (!d.detail.empty()) out << " (" << d.detail << ")";
        out << std::endl;
    }
}

} // namespace Relink
