#include "macho_reader.h"
#include "macho_format.h"
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <iterator>

namespace Relink {

namespace {

std::string format_message(const char* fmt, unsigned long long a = 0, unsigned long long b = 0,
                           unsigned long long c = 0) {
    char buffer[256];
    std::snprintf(buffer, sizeof(buffer), fmt, a, b, c);
    return buffer;
}

bool is_fat_magic(uint32_t magic) {
    return magic == FAT_MAGIC || magic == FAT_CIGAM || magic == FAT_MAGIC_64 || magic == FAT_CIGAM_64;
}

bool is_zerofill(uint32_t section_flags) {
    uint32_t type = section_flags & SECTION_TYPE;
    return type == S_ZEROFILL || type == S_GB_ZEROFILL || type == S_THREAD_LOCAL_ZEROFILL;
}

} // namespace

const char* role_name(BinaryRole role) {
    switch (role) {
        case BinaryRole::NotMachO:        return "not-macho";
        case BinaryRole::Executable:      return "executable";
        case BinaryRole::SharedLibrary:   return "shared-library";
        case BinaryRole::ExtensionModule: return "extension-module";
    }
    return "unknown";
}

bool PathLoadCommand::is_identity() const {
    return cmd == LC_ID_DYLIB;
}

bool PathLoadCommand::is_dependency() const {
    return cmd == LC_LOAD_DYLIB || cmd == LC_LOAD_WEAK_DYLIB || cmd == LC_REEXPORT_DYLIB ||
           cmd == LC_LAZY_LOAD_DYLIB || cmd == LC_LOAD_UPWARD_DYLIB;
}

const PathLoadCommand* MachOSlice::identity() const {
    for (const auto& command : dylibs) {
        if (command.is_identity()) {
            return &command;
        }
    }
    return nullptr;
}

BinaryRole MachOFile::role() const {
    if (slices.empty()) {
        return BinaryRole::NotMachO;
    }
    switch (slices.front().filetype) {
        case MH_EXECUTE: return BinaryRole::Executable;
        case MH_DYLIB:   return BinaryRole::SharedLibrary;
        case MH_BUNDLE:  return BinaryRole::ExtensionModule;
        default:         return BinaryRole::NotMachO;
    }
}

BinaryRole MachOReader::role_for_filetype(uint32_t filetype) {
    switch (filetype) {
        case MH_EXECUTE: return BinaryRole::Executable;
        case MH_DYLIB:   return BinaryRole::SharedLibrary;
        case MH_BUNDLE:  return BinaryRole::ExtensionModule;
        default:         return BinaryRole::NotMachO;
    }
}

BinaryRole MachOReader::classify_header(const uint8_t* data, size_t size) {
    if (size < sizeof(MachHeader)) {
        return BinaryRole::NotMachO;
    }

    uint32_t magic = load_u32(data, false);
    bool swapped = false;
    switch (magic) {
        case MH_MAGIC:    swapped = false; break;
        case MH_CIGAM:    swapped = true; break;
        case MH_MAGIC_64:
        case MH_CIGAM_64:
            if (size < sizeof(MachHeader64)) return BinaryRole::NotMachO;
            swapped = (magic == MH_CIGAM_64);
            break;
        default:
            return BinaryRole::NotMachO;
    }

    return role_for_filetype(load_u32(data + offsetof(MachHeader, filetype), swapped));
}

BinaryRole MachOReader::classify(const std::vector<uint8_t>& data) {
    if (data.size() < sizeof(FatHeader)) {
        return BinaryRole::NotMachO;
    }

    uint32_t magic = load_u32(data.data(), false);
    if (!is_fat_magic(magic)) {
        return classify_header(data.data(), data.size());
    }

    bool swapped = (magic == FAT_CIGAM || magic == FAT_CIGAM_64);
    bool fat64 = (magic == FAT_MAGIC_64 || magic == FAT_CIGAM_64);
    uint32_t nfat = load_u32(data.data() + offsetof(FatHeader, nfat_arch), swapped);
    size_t entry_size = fat64 ? sizeof(FatArch64) : sizeof(FatArch);
    if (nfat == 0 || nfat > FAT_MAX_ARCHS || sizeof(FatHeader) + entry_size > data.size()) {
        return BinaryRole::NotMachO;
    }

    const uint8_t* entry = data.data() + sizeof(FatHeader);
    uint64_t offset = fat64 ? load_u64(entry + offsetof(FatArch64, offset), swapped)
                            : load_u32(entry + offsetof(FatArch, offset), swapped);
    if (offset >= data.size()) {
        return BinaryRole::NotMachO;
    }
    return classify_header(data.data() + offset, data.size() - offset);
}

BinaryRole MachOReader::classify(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return BinaryRole::NotMachO;
    }

    uint8_t head[4096];
    file.read(reinterpret_cast<char*>(head), sizeof(head));
    size_t got = static_cast<size_t>(file.gcount());
    if (got < sizeof(FatHeader)) {
        return BinaryRole::NotMachO;
    }

    uint32_t magic = load_u32(head, false);
    if (!is_fat_magic(magic)) {
        return classify_header(head, got);
    }

    // Universal file: the role comes from the first slice, which usually
    // starts past the first 4K, so read its header separately.
    bool swapped = (magic == FAT_CIGAM || magic == FAT_CIGAM_64);
    bool fat64 = (magic == FAT_MAGIC_64 || magic == FAT_CIGAM_64);
    uint32_t nfat = load_u32(head + offsetof(FatHeader, nfat_arch), swapped);
    size_t entry_size = fat64 ? sizeof(FatArch64) : sizeof(FatArch);
    if (nfat == 0 || nfat > FAT_MAX_ARCHS || got < sizeof(FatHeader) + entry_size) {
        return BinaryRole::NotMachO;
    }

    const uint8_t* entry = head + sizeof(FatHeader);
    uint64_t offset = fat64 ? load_u64(entry + offsetof(FatArch64, offset), swapped)
                            : load_u32(entry + offsetof(FatArch, offset), swapped);

    file.clear();
    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        return BinaryRole::NotMachO;
    }
    uint8_t slice_header[sizeof(MachHeader64)];
    file.read(reinterpret_cast<char*>(slice_header), sizeof(slice_header));
    return classify_header(slice_header, static_cast<size_t>(file.gcount()));
}

bool MachOReader::read_file_bytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool MachOReader::read(const std::string& path, MachOFile& file, std::vector<uint8_t>* contents) {
    std::vector<uint8_t> local;
    std::vector<uint8_t>& data = contents ? *contents : local;
    if (!read_file_bytes(path, data)) {
        return fail("cannot read " + path);
    }
    file.path = path;
    return parse(data, file);
}

bool MachOReader::fail(const std::string& message) {
    error_message = message;
    return false;
}

bool MachOReader::parse(const std::vector<uint8_t>& data, MachOFile& file) {
    error_message.clear();
    file.slices.clear();
    file.is_fat = false;

    if (data.size() < sizeof(uint32_t)) {
        return fail("file too small for a Mach-O header");
    }

    uint32_t magic = load_u32(data.data(), false);
    switch (magic) {
        case FAT_MAGIC:    return parse_fat(data, false, false, file);
        case FAT_CIGAM:    return parse_fat(data, false, true, file);
        case FAT_MAGIC_64: return parse_fat(data, true, false, file);
        case FAT_CIGAM_64: return parse_fat(data, true, true, file);
        case MH_MAGIC:
        case MH_CIGAM:
        case MH_MAGIC_64:
        case MH_CIGAM_64: {
            MachOSlice slice;
            if (!parse_slice(data.data(), data.size(), 0, slice)) {
                return false;
            }
            file.slices.push_back(std::move(slice));
            return true;
        }
        default:
            return fail(format_message("file does not start with a Mach-O magic: 0x%08llX", magic));
    }
}

bool MachOReader::parse_fat(const std::vector<uint8_t>& data, bool fat64, bool swapped, MachOFile& file) {
    if (data.size() < sizeof(FatHeader)) {
        return fail("truncated fat header");
    }

    uint32_t nfat = load_u32(data.data() + offsetof(FatHeader, nfat_arch), swapped);
    if (nfat == 0 || nfat > FAT_MAX_ARCHS) {
        return fail(format_message("implausible fat architecture count (%llu)", nfat));
    }

    size_t entry_size = fat64 ? sizeof(FatArch64) : sizeof(FatArch);
    if (sizeof(FatHeader) + nfat * entry_size > data.size()) {
        return fail("fat architecture table extends beyond end of file");
    }

    file.is_fat = true;
    for (uint32_t i = 0; i < nfat; ++i) {
        const uint8_t* entry = data.data() + sizeof(FatHeader) + i * entry_size;
        uint64_t offset = fat64 ? load_u64(entry + offsetof(FatArch64, offset), swapped)
                                : load_u32(entry + offsetof(FatArch, offset), swapped);
        uint64_t size = fat64 ? load_u64(entry + offsetof(FatArch64, size), swapped)
                              : load_u32(entry + offsetof(FatArch, size), swapped);

        if (offset > data.size() || size > data.size() - offset) {
            return fail(format_message("fat slice %llu (offset %llu, size %llu) extends beyond end of file",
                                       i, offset, size));
        }

        MachOSlice slice;
        if (!parse_slice(data.data() + offset, size, offset, slice)) {
            return false;
        }
        file.slices.push_back(std::move(slice));
    }
    return true;
}

bool MachOReader::parse_slice(const uint8_t* base, uint64_t size, uint64_t file_offset, MachOSlice& slice) {
    if (size < sizeof(MachHeader)) {
        return fail(format_message("truncated mach header in slice at offset %llu", file_offset));
    }

    uint32_t magic = load_u32(base, false);
    switch (magic) {
        case MH_MAGIC:    slice.is_64 = false; slice.swapped = false; break;
        case MH_CIGAM:    slice.is_64 = false; slice.swapped = true;  break;
        case MH_MAGIC_64: slice.is_64 = true;  slice.swapped = false; break;
        case MH_CIGAM_64: slice.is_64 = true;  slice.swapped = true;  break;
        default:
            return fail(format_message("slice at offset %llu does not start with MH_MAGIC[_64]: 0x%08llX",
                                       file_offset, magic));
    }

    slice.file_offset = file_offset;
    slice.size = size;
    slice.header_size = slice.is_64 ? sizeof(MachHeader64) : sizeof(MachHeader);
    if (size < slice.header_size) {
        return fail(format_message("truncated mach header in slice at offset %llu", file_offset));
    }

    slice.cputype = load_u32(base + offsetof(MachHeader, cputype), slice.swapped);
    slice.filetype = load_u32(base + offsetof(MachHeader, filetype), slice.swapped);
    slice.ncmds = load_u32(base + offsetof(MachHeader, ncmds), slice.swapped);
    slice.sizeofcmds = load_u32(base + offsetof(MachHeader, sizeofcmds), slice.swapped);

    if (slice.load_commands_end() > size) {
        return fail(format_message("load commands length (%llu) exceeds length of file (%llu)",
                                   slice.load_commands_end(), size));
    }

    return parse_load_commands(base, slice);
}

bool MachOReader::parse_load_commands(const uint8_t* base, MachOSlice& slice) {
    const bool sw = slice.swapped;
    const uint64_t cmds_end = slice.load_commands_end();
    uint64_t limit = slice.size;
    uint64_t offset = slice.header_size;

    for (uint32_t i = 1; i <= slice.ncmds; ++i) {
        if (offset + sizeof(LoadCommand) > cmds_end) {
            return fail(format_message("malformed load command (%llu of %llu), off end of load commands",
                                       i, slice.ncmds));
        }

        const uint8_t* command = base + offset;
        uint32_t cmd = load_u32(command + offsetof(LoadCommand, cmd), sw);
        uint32_t cmdsize = load_u32(command + offsetof(LoadCommand, cmdsize), sw);
        if (cmdsize < sizeof(LoadCommand)) {
            return fail(format_message("malformed load command (%llu of %llu), size (0x%llX) too small",
                                       i, slice.ncmds, cmdsize));
        }
        if (offset + cmdsize > cmds_end) {
            return fail(format_message("malformed load command (%llu of %llu), size (0x%llX) is too large",
                                       i, slice.ncmds, cmdsize));
        }

        switch (cmd) {
            case LC_SEGMENT_64: {
                if (cmdsize < sizeof(SegmentCommand64)) {
                    return fail(format_message("load command #%llu LC_SEGMENT_64 size too small", i));
                }
                uint64_t fileoff = load_u64(command + offsetof(SegmentCommand64, fileoff), sw);
                uint64_t filesize = load_u64(command + offsetof(SegmentCommand64, filesize), sw);
                uint32_t nsects = load_u32(command + offsetof(SegmentCommand64, nsects), sw);
                if (sizeof(SegmentCommand64) + static_cast<uint64_t>(nsects) * sizeof(Section64) > cmdsize) {
                    return fail(format_message("load command #%llu LC_SEGMENT_64 sections overflow command", i));
                }
                if (nsects == 0 && filesize != 0 && fileoff != 0) {
                    limit = std::min(limit, fileoff);
                }
                for (uint32_t s = 0; s < nsects; ++s) {
                    const uint8_t* section = command + sizeof(SegmentCommand64) + s * sizeof(Section64);
                    uint64_t sect_size = load_u64(section + offsetof(Section64, size), sw);
                    uint32_t sect_offset = load_u32(section + offsetof(Section64, offset), sw);
                    uint32_t flags = load_u32(section + offsetof(Section64, flags), sw);
                    if (!is_zerofill(flags) && sect_offset != 0 && sect_size != 0) {
                        limit = std::min<uint64_t>(limit, sect_offset);
                    }
                }
                break;
            }
            case LC_SEGMENT: {
                if (cmdsize < sizeof(SegmentCommand)) {
                    return fail(format_message("load command #%llu LC_SEGMENT size too small", i));
                }
                uint32_t fileoff = load_u32(command + offsetof(SegmentCommand, fileoff), sw);
                uint32_t filesize = load_u32(command + offsetof(SegmentCommand, filesize), sw);
                uint32_t nsects = load_u32(command + offsetof(SegmentCommand, nsects), sw);
                if (sizeof(SegmentCommand) + static_cast<uint64_t>(nsects) * sizeof(Section32) > cmdsize) {
                    return fail(format_message("load command #%llu LC_SEGMENT sections overflow command", i));
                }
                if (nsects == 0 && filesize != 0 && fileoff != 0) {
                    limit = std::min<uint64_t>(limit, fileoff);
                }
                for (uint32_t s = 0; s < nsects; ++s) {
                    const uint8_t* section = command + sizeof(SegmentCommand) + s * sizeof(Section32);
                    uint32_t sect_size = load_u32(section + offsetof(Section32, size), sw);
                    uint32_t sect_offset = load_u32(section + offsetof(Section32, offset), sw);
                    uint32_t flags = load_u32(section + offsetof(Section32, flags), sw);
                    if (!is_zerofill(flags) && sect_offset != 0 && sect_size != 0) {
                        limit = std::min<uint64_t>(limit, sect_offset);
                    }
                }
                break;
            }
            case LC_ID_DYLIB:
            case LC_LOAD_DYLIB:
            case LC_LOAD_WEAK_DYLIB:
            case LC_REEXPORT_DYLIB:
            case LC_LAZY_LOAD_DYLIB:
            case LC_LOAD_UPWARD_DYLIB: {
                PathLoadCommand entry;
                if (!read_path_command(base, slice, static_cast<uint32_t>(offset), cmd, cmdsize, i, entry)) {
                    return false;
                }
                slice.dylibs.push_back(std::move(entry));
                break;
            }
            case LC_RPATH: {
                PathLoadCommand entry;
                if (!read_path_command(base, slice, static_cast<uint32_t>(offset), cmd, cmdsize, i, entry)) {
                    return false;
                }
                slice.rpaths.push_back(std::move(entry));
                break;
            }
            default:
                break;
        }

        offset += cmdsize;
    }

    if (limit < cmds_end) {
        return fail(format_message("section data at offset %llu overlaps load commands ending at %llu",
                                   limit, cmds_end));
    }
    slice.load_command_limit = limit;
    return true;
}

bool MachOReader::read_path_command(const uint8_t* base, const MachOSlice& slice, uint32_t cmd_offset,
                                    uint32_t cmd, uint32_t cmdsize, uint32_t index, PathLoadCommand& out) {
    const uint32_t fixed_size = (cmd == LC_RPATH) ? sizeof(RpathCommand) : sizeof(DylibCommand);
    if (cmdsize < fixed_size) {
        return fail(format_message("load command #%llu size (%llu) smaller than its fixed part", index, cmdsize));
    }

    const uint8_t* command = base + cmd_offset;
    // name_offset and path_offset share the same position
    uint32_t string_offset = load_u32(command + offsetof(DylibCommand, name_offset), slice.swapped);
    if (string_offset >= cmdsize) {
        return fail(format_message("load command #%llu string offset (%llu) outside its size (%llu)",
                                   index, string_offset, cmdsize));
    }
    if (string_offset < offsetof(DylibCommand, name_offset) + sizeof(uint32_t)) {
        return fail(format_message("load command #%llu string offset (%llu) overlaps its fixed part",
                                   index, string_offset));
    }

    const char* str = reinterpret_cast<const char*>(command + string_offset);
    const char* end = reinterpret_cast<const char*>(command + cmdsize);
    const char* terminator = std::find(str, end, '\0');
    if (terminator == end) {
        return fail(format_message("load command #%llu string extends beyond end of load command", index));
    }

    out = PathLoadCommand(cmd, cmd_offset, cmdsize, string_offset, std::string(str, terminator));
    return true;
}

} // namespace Relink
