#pragma once
#include "vendoring_registry.h"
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace Relink {

enum class DiagnosticKind {
    CorruptBinary,          // malformed Mach-O, skipped
    UnresolvedDependency,   // no candidate source exists
    CopyFailed,             // source found but could not be copied
    RewriteFailed,          // load command could not be patched
    LeftoverReference,      // non-portable reference still present after the run
    SignatureWarning        // re-signing failed
};

const char* diagnostic_kind_name(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind;
    std::string binary;
    std::string dependency;
    std::string detail;
};

// Outcome of one relinking run. Diagnostics may be added from worker threads.
class BundleReport {
public:
    BundleReport() = default;

    void set_quiet(bool value) { quiet = value; }

    // Record a diagnostic and echo it to stderr unless quiet
    void add(DiagnosticKind kind, const std::string& binary, const std::string& dependency,
             const std::string& detail);

    std::vector<Diagnostic> get_diagnostics() const;
    size_t count(DiagnosticKind kind) const;

    // True when the bundle may fail to load on another machine
    bool has_runtime_risks() const;

    void set_vendored(const std::vector<VendoredEntry>& entries) { vendored = entries; }
    void set_touched(const std::vector<std::string>& paths) { touched = paths; }
    void set_pass_count(size_t passes) { pass_count = passes; }
    void set_signed_count(size_t count) { signed_count = count; }

    const std::vector<VendoredEntry>& get_vendored() const { return vendored; }
    const std::vector<std::string>& get_touched() const { return touched; }
    size_t get_pass_count() const { return pass_count; }
    size_t get_signed_count() const { return signed_count; }

    void print(std::ostream& out) const;

private:
    mutable std::mutex mutex;
    std::vector<Diagnostic> diagnostics;
    std::vector<VendoredEntry> vendored;
    std::vector<std::string> touched;
    size_t pass_count = 0;
    size_t signed_count = 0;
    bool quiet = false;
};

} // namespace Relink
