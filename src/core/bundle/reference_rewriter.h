#pragma once
#include "vendoring_registry.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Relink {

// One mutex per file path, held for the whole read-patch-write of that file
class FileLockTable {
public:
    std::mutex& lock_for(const std::string& path);

private:
    std::mutex table_mutex;
    std::map<std::string, std::unique_ptr<std::mutex>> locks;
};

struct ReferenceChange {
    std::string old_reference;
    std::string new_reference;
};

struct RewriteFailure {
    std::string reference;   // empty for the identity
    std::string detail;
};

struct RewriteOutcome {
    bool modified = false;   // the file on disk was rewritten
    std::vector<RewriteFailure> failures;

    bool ok() const { return failures.empty(); }
};

// Points a consumer's load commands at vendored copies using
// @loader_path-relative names, and gives shared libraries a relative identity.
class ReferenceRewriter {
public:
    explicit ReferenceRewriter(FileLockTable& locks) : file_locks(locks) {}

    // "@loader_path/<path from consumer's directory to destination>"
    static std::string loader_relative_path(const std::string& consumer, const std::string& destination);

    // "@loader_path/<basename of library>"
    static std::string identity_for(const std::string& library);

    // Apply every change (and the identity when non-empty) to consumer in one
    // locked read-patch-write. A change that cannot be applied is reported and
    // leaves its command untouched; the others are still written.
    RewriteOutcome apply(const std::string& consumer, const std::vector<ReferenceChange>& changes,
                         const std::string& new_identity = std::string());

    bool rewrite(const std::string& consumer, const std::string& old_reference, const VendoredEntry& vendored,
                 std::string& error);
    bool rewrite_identity(const std::string& library, std::string& error);

private:
    FileLockTable& file_locks;
};

} // namespace Relink
