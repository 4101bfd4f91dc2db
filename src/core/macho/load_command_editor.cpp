#include "load_command_editor.h"
#include "macho_format.h"
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace Relink {

bool LoadCommandEditor::fail(const std::string& message) {
    error_message = message;
    return false;
}

bool LoadCommandEditor::load(const std::string& target_path) {
    path = target_path;
    loaded = false;
    modified = false;
    error_message.clear();

    MachOReader reader;
    if (!reader.read(path, file, &data)) {
        return fail(reader.get_error());
    }
    loaded = true;
    return true;
}

bool LoadCommandEditor::change_dependency(const std::string& old_name, const std::string& new_name) {
    if (!loaded) {
        return fail("no Mach-O file loaded");
    }
    if (old_name == new_name) {
        return true;
    }

    std::vector<uint8_t> data_backup = data;
    MachOFile file_backup = file;

    size_t matches = 0;
    for (auto& slice : file.slices) {
        for (size_t i = 0; i < slice.dylibs.size(); ++i) {
            if (!slice.dylibs[i].is_dependency() || slice.dylibs[i].value != old_name) {
                continue;
            }
            if (!replace_string(slice, i, new_name)) {
                data.swap(data_backup);
                file = std::move(file_backup);
                return false;
            }
            ++matches;
        }
    }

    if (matches == 0) {
        return fail("no load command references " + old_name);
    }
    modified = true;
    return true;
}

bool LoadCommandEditor::change_identity(const std::string& new_identity) {
    if (!loaded) {
        return fail("no Mach-O file loaded");
    }

    std::vector<uint8_t> data_backup = data;
    MachOFile file_backup = file;

    bool changed = false;
    for (auto& slice : file.slices) {
        size_t index = slice.dylibs.size();
        for (size_t i = 0; i < slice.dylibs.size(); ++i) {
            if (slice.dylibs[i].is_identity()) {
                index = i;
                break;
            }
        }
        if (index == slice.dylibs.size()) {
            data.swap(data_backup);
            file = std::move(file_backup);
            return fail("slice has no LC_ID_DYLIB");
        }
        if (slice.dylibs[index].value == new_identity) {
            continue;
        }
        if (!replace_string(slice, index, new_identity)) {
            data.swap(data_backup);
            file = std::move(file_backup);
            return false;
        }
        changed = true;
    }
    if (changed) {
        modified = true;
    }
    return true;
}

bool LoadCommandEditor::replace_string(MachOSlice& slice, size_t index, const std::string& value) {
    PathLoadCommand& target = slice.dylibs[index];
    uint8_t* base = data.data() + slice.file_offset;
    uint8_t* command = base + target.offset;

    const uint64_t needed = align_up(target.string_offset + value.size() + 1, slice.command_alignment());

    if (needed <= target.cmdsize) {
        // Fits in the existing allocation: keep cmdsize and zero the tail
        std::memset(command + target.string_offset, 0, target.cmdsize - target.string_offset);
        std::memcpy(command + target.string_offset, value.data(), value.size());
        target.value = value;
        return true;
    }

    const uint64_t delta = needed - target.cmdsize;
    const uint64_t old_end = slice.load_commands_end();
    if (old_end + delta > slice.load_command_limit) {
        return fail("not enough header padding to grow load command for " + value + ": need " +
                    std::to_string(old_end + delta) + " bytes before section data at " +
                    std::to_string(slice.load_command_limit));
    }

    // Shift the commands that follow into the padding, then write the enlarged command
    const uint64_t tail_start = target.offset + static_cast<uint64_t>(target.cmdsize);
    std::memmove(base + tail_start + delta, base + tail_start, old_end - tail_start);
    std::memset(command + target.string_offset, 0, needed - target.string_offset);
    std::memcpy(command + target.string_offset, value.data(), value.size());
    store_u32(command + offsetof(LoadCommand, cmdsize), static_cast<uint32_t>(needed), slice.swapped);

    slice.sizeofcmds += static_cast<uint32_t>(delta);
    store_u32(base + offsetof(MachHeader, sizeofcmds), slice.sizeofcmds, slice.swapped);

    for (auto& other : slice.dylibs) {
        if (other.offset > target.offset) other.offset += static_cast<uint32_t>(delta);
    }
    for (auto& other : slice.rpaths) {
        if (other.offset > target.offset) other.offset += static_cast<uint32_t>(delta);
    }
    target.cmdsize = static_cast<uint32_t>(needed);
    target.value = value;
    return true;
}

bool LoadCommandEditor::save() {
    if (!loaded) {
        return fail("no Mach-O file loaded");
    }
    if (!modified) {
        return true;
    }

    std::error_code ec;
    fs::perms original_perms = fs::status(path, ec).permissions();
    if (ec) {
        return fail("cannot stat " + path + ": " + ec.message());
    }

    const std::string temp_path = path + ".relink-tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail("cannot create " + temp_path);
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            fs::remove(temp_path, ec);
            return fail("cannot write " + temp_path);
        }
    }

    fs::permissions(temp_path, original_perms, ec);
    if (!ec) {
        fs::rename(temp_path, path, ec);
    }
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return fail("cannot replace " + path + ": " + ec.message());
    }

    modified = false;
    return true;
}

} // namespace Relink
