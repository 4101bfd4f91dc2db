#pragma once
#include "macho_reader.h"
#include <string>
#include <vector>

namespace Relink {

// In-memory editor for the path-bearing load commands of one Mach-O file.
// Changes are applied to every slice of a fat file. A failed change restores
// the image to its state before that change, so earlier successful changes
// can still be saved.
class LoadCommandEditor {
public:
    LoadCommandEditor() = default;
    ~LoadCommandEditor() = default;

    // Read and parse path. Must succeed before any change.
    bool load(const std::string& path);

    // Point every dependency command naming old_name at new_name
    bool change_dependency(const std::string& old_name, const std::string& new_name);

    // Replace LC_ID_DYLIB in every slice
    bool change_identity(const std::string& new_identity);

    // Write the image back through a temporary file and a rename, keeping the
    // original permissions. Does nothing when no change was applied.
    bool save();

    bool is_modified() const { return modified; }
    const MachOFile& get_file() const { return file; }
    const std::vector<uint8_t>& get_data() const { return data; }
    const std::string& get_error() const { return error_message; }

private:
    std::string path;
    MachOFile file;
    std::vector<uint8_t> data;
    bool loaded = false;
    bool modified = false;
    std::string error_message;

    bool replace_string(MachOSlice& slice, size_t index, const std::string& value);
    bool fail(const std::string& message);
};

} // namespace Relink
