#pragma once
#include "bundle_report.h"
#include <string>
#include <vector>

namespace Relink {

// Signs one binary in place
class CodeSigner {
public:
    virtual ~CodeSigner() = default;
    virtual bool sign(const std::string& path, std::string& error) = 0;
};

// Runs `<tool> --force --sign <identity> <path>`. Identity "-" is ad-hoc.
class CodesignToolSigner : public CodeSigner {
public:
    explicit CodesignToolSigner(const std::string& tool = "codesign", const std::string& identity = "-");

    bool sign(const std::string& path, std::string& error) override;

    std::string command_for(const std::string& path) const;
    static std::string shell_quote(const std::string& value);

private:
    std::string tool;
    std::string identity;
};

// Re-signs touched binaries once every load command edit is finished.
// A null signer disables signing.
class SignatureFinalizer {
public:
    SignatureFinalizer(CodeSigner* signer, BundleReport& report);

    bool resign(const std::string& binary);

    // Number of binaries signed successfully
    size_t finalize(const std::vector<std::string>& binaries);

private:
    CodeSigner* signer;
    BundleReport& report;
};

} // namespace Relink
