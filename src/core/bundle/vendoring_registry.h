#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Relink {

enum class VendorState {
    Pending,
    Copied,
    Unresolved,
    CopyFailed
};

const char* vendor_state_name(VendorState state);

// One vendored dependency, keyed by basename
struct VendoredEntry {
    std::string basename;
    std::string resolved_source_path;
    std::string destination_path;
    bool copied = false;
    bool in_place = false;    // source already was the destination, nothing was written
    VendorState state = VendorState::Pending;
    std::vector<std::string> searched;   // candidates tried by the last resolution
    std::string error;
};

// Maps each dependency basename to its single copy in the shared library
// directory. Different basenames can be vendored concurrently; calls for the
// same basename are serialized.
class VendoringRegistry {
public:
    explicit VendoringRegistry(const std::string& lib_dir);

    // Resolve basename from the first existing candidate and copy it into the
    // library directory. An entry that is already Copied is returned as is.
    // newly_copied is set when this call performed the copy.
    VendoredEntry vendor(const std::string& basename, const std::vector<std::string>& candidates,
                         bool* newly_copied = nullptr);

    bool lookup(const std::string& basename, VendoredEntry& out) const;

    // Snapshot of every entry, ordered by basename
    std::vector<VendoredEntry> entries() const;

    std::string destination_for(const std::string& basename) const;
    const std::string& get_lib_dir() const { return lib_dir; }

private:
    struct Slot {
        std::mutex mutex;
        VendoredEntry entry;
    };

    std::string lib_dir;
    mutable std::mutex table_mutex;
    std::map<std::string, std::unique_ptr<Slot>> slots;

    Slot& slot_for(const std::string& basename);
    bool copy_into_place(VendoredEntry& entry);
};

} // namespace Relink
