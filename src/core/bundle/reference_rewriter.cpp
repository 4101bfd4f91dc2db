#include "reference_rewriter.h"
#include "dependency_classifier.h"
#include "../macho/load_command_editor.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace Relink {

std::mutex& FileLockTable::lock_for(const std::string& path) {
    std::lock_guard<std::mutex> lock(table_mutex);
    auto& slot = locks[path];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::string ReferenceRewriter::loader_relative_path(const std::string& consumer, const std::string& destination) {
    const fs::path consumer_dir = fs::path(consumer).parent_path().lexically_normal();
    const fs::path target = fs::path(destination).lexically_normal();
    fs::path relative = target.lexically_relative(consumer_dir);
    if (relative.empty()) {
        relative = target.filename();
    }
    return "@loader_path/" + relative.generic_string();
}

std::string ReferenceRewriter::identity_for(const std::string& library) {
    return "@loader_path/" + DependencyClassifier::basename_of(library);
}

RewriteOutcome ReferenceRewriter::apply(const std::string& consumer, const std::vector<ReferenceChange>& changes,
                                        const std::string& new_identity) {
    RewriteOutcome outcome;
    std::lock_guard<std::mutex> lock(file_locks.lock_for(consumer));

    LoadCommandEditor editor;
    if (!editor.load(consumer)) {
        for (const auto& change : changes) {
            outcome.failures.push_back(RewriteFailure{change.old_reference, editor.get_error()});
        }
        if (!new_identity.empty()) {
            outcome.failures.push_back(RewriteFailure{std::string(), editor.get_error()});
        }
        return outcome;
    }

    for (const auto& change : changes) {
        if (!editor.change_dependency(change.old_reference, change.new_reference)) {
            outcome.failures.push_back(RewriteFailure{change.old_reference, editor.get_error()});
        }
    }
    if (!new_identity.empty() && !editor.change_identity(new_identity)) {
        outcome.failures.push_back(RewriteFailure{std::string(), editor.get_error()});
    }

    if (!editor.is_modified()) {
        return outcome;
    }
    if (!editor.save()) {
        // Nothing reached the disk, so every change counts as failed
        outcome.failures.clear();
        for (const auto& change : changes) {
            outcome.failures.push_back(RewriteFailure{change.old_reference, editor.get_error()});
        }
        if (!new_identity.empty()) {
            outcome.failures.push_back(RewriteFailure{std::string(), editor.get_error()});
        }
        return outcome;
    }
    outcome.modified = true;
    return outcome;
}

bool ReferenceRewriter::rewrite(const std::string& consumer, const std::string& old_reference,
                                const VendoredEntry& vendored, std::string& error) {
    if (vendored.state != VendorState::Copied) {
        error = vendored.basename + " was not vendored";
        return false;
    }
    std::vector<ReferenceChange> changes;
    changes.push_back(ReferenceChange{old_reference, loader_relative_path(consumer, vendored.destination_path)});
    RewriteOutcome outcome = apply(consumer, changes);
    if (!outcome.ok()) {
        error = outcome.failures.front().detail;
        return false;
    }
    return true;
}

bool ReferenceRewriter::rewrite_identity(const std::string& library, std::string& error) {
    RewriteOutcome outcome = apply(library, std::vector<ReferenceChange>(), identity_for(library));
    if (!outcome.ok()) {
        error = outcome.failures.front().detail;
        return false;
    }
    return true;
}

} // namespace Relink
