#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Relink {

// Role of a file in the bundle, as far as relinking is concerned
enum class BinaryRole {
    NotMachO,
    Executable,       // MH_EXECUTE
    SharedLibrary,    // MH_DYLIB
    ExtensionModule   // MH_BUNDLE (interpreter plugins)
};

const char* role_name(BinaryRole role);

// A load command that carries a path string: LC_ID_DYLIB, the LC_*_DYLIB
// dependency commands and LC_RPATH.
struct PathLoadCommand {
    uint32_t cmd = 0;
    uint32_t offset = 0;        // offset of the command from the start of its slice
    uint32_t cmdsize = 0;
    uint32_t string_offset = 0; // offset of the string from the start of the command
    std::string value;

    PathLoadCommand() = default;
    PathLoadCommand(uint32_t c, uint32_t off, uint32_t size, uint32_t str_off, const std::string& v)
        : cmd(c), offset(off), cmdsize(size), string_offset(str_off), value(v) {}

    bool is_identity() const;
    bool is_dependency() const;
};

// One architecture slice of a (possibly fat) Mach-O file
struct MachOSlice {
    uint64_t file_offset = 0;   // where the slice starts in the file
    uint64_t size = 0;
    bool is_64 = false;
    bool swapped = false;       // fields are stored in the opposite byte order of the host
    uint32_t cputype = 0;
    uint32_t filetype = 0;
    uint32_t ncmds = 0;
    uint32_t sizeofcmds = 0;
    uint32_t header_size = 0;

    // First slice-relative offset holding file content other than the header
    // and load commands. Load commands may grow up to this point.
    uint64_t load_command_limit = 0;

    std::vector<PathLoadCommand> dylibs;   // identity + dependencies, in file order
    std::vector<PathLoadCommand> rpaths;

    uint32_t command_alignment() const { return is_64 ? 8u : 4u; }
    uint64_t load_commands_end() const { return header_size + static_cast<uint64_t>(sizeofcmds); }
    const PathLoadCommand* identity() const;
};

// Parsed view of a Mach-O file on disk
class MachOFile {
public:
    std::string path;
    bool is_fat = false;
    std::vector<MachOSlice> slices;

    MachOFile() = default;
    MachOFile(const std::string& p) : path(p) {}

    BinaryRole role() const;
};

// Reads Mach-O headers and the path-bearing load commands. Handles 32/64-bit
// slices in either byte order and fat files with 32 or 64-bit arch tables.
class MachOReader {
public:
    MachOReader() = default;
    ~MachOReader() = default;

    // Role of the file at path. Never throws: unreadable files, non Mach-O
    // files and Mach-O files that are not loadable images are NotMachO.
    static BinaryRole classify(const std::string& path);
    static BinaryRole classify(const std::vector<uint8_t>& data);

    // Parse a complete file image. On failure get_error() describes the
    // malformation.
    bool parse(const std::vector<uint8_t>& data, MachOFile& file);

    // Read path from disk and parse it. The raw bytes are kept in contents
    // when requested so an editor can patch them without a second read.
    bool read(const std::string& path, MachOFile& file, std::vector<uint8_t>* contents = nullptr);

    const std::string& get_error() const { return error_message; }

    static bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out);

private:
    std::string error_message;

    bool parse_fat(const std::vector<uint8_t>& data, bool fat64, bool swapped, MachOFile& file);
    bool parse_slice(const uint8_t* base, uint64_t size, uint64_t file_offset, MachOSlice& slice);
    bool parse_load_commands(const uint8_t* base, MachOSlice& slice);
    bool read_path_command(const uint8_t* base, const MachOSlice& slice, uint32_t cmd_offset,
                           uint32_t cmd, uint32_t cmdsize, uint32_t index, PathLoadCommand& out);
    bool fail(const std::string& message);

    static BinaryRole role_for_filetype(uint32_t filetype);
    static BinaryRole classify_header(const uint8_t* data, size_t size);
};

} // namespace Relink
