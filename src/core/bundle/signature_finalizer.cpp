#include "signature_finalizer.h"
#include <cstdio>
#include <sys/wait.h>

namespace Relink {

CodesignToolSigner::CodesignToolSigner(const std::string& tool_path, const std::string& sign_identity)
    : tool(tool_path), identity(sign_identity) {}

std::string CodesignToolSigner::shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string CodesignToolSigner::command_for(const std::string& path) const {
    return shell_quote(tool) + " --force --sign " + shell_quote(identity) + " " + shell_quote(path) + " 2>&1";
}

bool CodesignToolSigner::sign(const std::string& path, std::string& error) {
    const std::string cmd = command_for(path);
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        error = "cannot run " + tool;
        return false;
    }

    std::string output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1) {
        error = "cannot wait for " + tool;
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
            output.pop_back();
        }
        error = tool + " failed";
        if (WIFEXITED(status)) {
            error += " with status " + std::to_string(WEXITSTATUS(status));
        }
        if (!output.empty()) {
            error += ": " + output;
        }
        return false;
    }
    return true;
}

SignatureFinalizer::SignatureFinalizer(CodeSigner* code_signer, BundleReport& bundle_report)
    : signer(code_signer), report(bundle_report) {}

bool SignatureFinalizer::resign(const std::string& binary) {
    if (!signer) {
        return true;
    }
    std::string error;
    if (!signer->sign(binary, error)) {
        report.add(DiagnosticKind::SignatureWarning, binary, std::string(), error);
        return false;
    }
    return true;
}

size_t SignatureFinalizer::finalize(const std::vector<std::string>& binaries) {
    if (!signer) {
        return 0;
    }
    size_t signed_count = 0;
    for (const auto& binary : binaries) {
        if (resign(binary)) {
            ++signed_count;
        }
    }
    return signed_count;
}

} // namespace Relink
