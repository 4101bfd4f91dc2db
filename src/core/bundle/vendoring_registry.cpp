#include "vendoring_registry.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace Relink {

const char* vendor_state_name(VendorState state) {
    switch (state) {
        case VendorState::Pending:    return "pending";
        case VendorState::Copied:     return "copied";
        case VendorState::Unresolved: return "unresolved";
        case VendorState::CopyFailed: return "copy-failed";
    }
    return "pending";
}

VendoringRegistry::VendoringRegistry(const std::string& dir) : lib_dir(dir) {}

VendoringRegistry::Slot& VendoringRegistry::slot_for(const std::string& basename) {
    std::lock_guard<std::mutex> lock(table_mutex);
    auto& slot = slots[basename];
    if (!slot) {
        slot = std::make_unique<Slot>();
        slot->entry.basename = basename;
        slot->entry.destination_path = destination_for(basename);
    }
    return *slot;
}

std::string VendoringRegistry::destination_for(const std::string& basename) const {
    return (fs::path(lib_dir) / basename).string();
}

VendoredEntry VendoringRegistry::vendor(const std::string& basename, const std::vector<std::string>& candidates,
                                        bool* newly_copied) {
    if (newly_copied) *newly_copied = false;

    Slot& slot = slot_for(basename);
    std::lock_guard<std::mutex> lock(slot.mutex);
    VendoredEntry& entry = slot.entry;

    if (entry.state == VendorState::Copied) {
        return entry;
    }

    entry.searched = candidates;
    entry.resolved_source_path.clear();
    entry.error.clear();

    // is_regular_file follows symlinks, so a link to a library resolves to its content
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!candidate.empty() && fs::is_regular_file(candidate, ec)) {
            entry.resolved_source_path = candidate;
            break;
        }
    }

    if (entry.resolved_source_path.empty()) {
        entry.state = VendorState::Unresolved;
        return entry;
    }

    if (!copy_into_place(entry)) {
        entry.state = VendorState::CopyFailed;
        return entry;
    }

    entry.state = VendorState::Copied;
    entry.copied = true;
    if (newly_copied) *newly_copied = true;
    return entry;
}

bool VendoringRegistry::copy_into_place(VendoredEntry& entry) {
    std::error_code ec;
    fs::create_directories(lib_dir, ec);
    if (ec) {
        entry.error = "cannot create " + lib_dir + ": " + ec.message();
        return false;
    }

    const fs::path source(entry.resolved_source_path);
    const fs::path destination(entry.destination_path);

    entry.in_place = fs::exists(destination, ec) && fs::equivalent(source, destination, ec);
    if (ec) {
        entry.error = "cannot compare " + source.string() + " with " + destination.string() + ": " + ec.message();
        return false;
    }

    if (!entry.in_place) {
        // A stale destination may be read-only or a symlink the copy would write through
        if (fs::exists(fs::symlink_status(destination, ec))) {
            fs::remove(destination, ec);
            if (ec) {
                entry.error = "cannot remove stale " + destination.string() + ": " + ec.message();
                return false;
            }
        }
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            entry.error = "cannot copy " + source.string() + " to " + destination.string() + ": " + ec.message();
            return false;
        }
    }

    fs::permissions(destination, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::add, ec);
    if (ec) {
        entry.error = "cannot make " + destination.string() + " writable: " + ec.message();
        return false;
    }
    return true;
}

bool VendoringRegistry::lookup(const std::string& basename, VendoredEntry& out) const {
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(table_mutex);
        auto it = slots.find(basename);
        if (it == slots.end()) {
            return false;
        }
        slot = it->second.get();
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    out = slot->entry;
    return true;
}

std::vector<VendoredEntry> VendoringRegistry::entries() const {
    std::vector<Slot*> ordered;
    {
        std::lock_guard<std::mutex> lock(table_mutex);
        for (const auto& kv : slots) {
            ordered.push_back(kv.second.get());
        }
    }
    std::vector<VendoredEntry> result;
    result.reserve(ordered.size());
    for (Slot* slot : ordered) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result.push_back(slot->entry);
    }
    return result;
}

} // namespace Relink
