#include "macho_builder.h"
#include "macho_format.h"
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace Relink {

static constexpr uint64_t FAT_SLICE_ALIGN = 0x1000;
static constexpr uint32_t FAT_SLICE_ALIGN_LOG2 = 12;

MachOImageBuilder::MachOImageBuilder(uint32_t type, MachOArch target_arch)
  : filetype(type), arch(target_arch),
    byte_order(target_arch == MachOArch::PPC ? ByteOrder::Big : ByteOrder::Little) {
  // nop; ret
  code = {0x1F, 0x20, 0x03, 0xD5, 0xC0, 0x03, 0x5F, 0xD6};
}

void MachOImageBuilder::add_dependency(const std::string& path, uint32_t cmd) {
  dependencies.push_back(DependencyEntry{path, cmd});
}

void MachOImageBuilder::add_dependency(const std::string& path) {
  add_dependency(path, LC_LOAD_DYLIB);
}

bool MachOImageBuilder::swapped() const {
  return (byte_order == ByteOrder::Big) == host_is_little_endian();
}

void MachOImageBuilder::cpu_type(uint32_t& type, uint32_t& subtype) const {
  switch (arch) {
    case MachOArch::X86_64: type = CPU_TYPE_X86_64; subtype = CPU_SUBTYPE_X86_64_ALL; break;
    case MachOArch::ARM64:  type = CPU_TYPE_ARM64;  subtype = CPU_SUBTYPE_ARM64_ALL;  break;
    case MachOArch::I386:   type = CPU_TYPE_X86;    subtype = CPU_SUBTYPE_X86_ALL;    break;
    case MachOArch::PPC:    type = CPU_TYPE_POWERPC; subtype = CPU_SUBTYPE_POWERPC_ALL; break;
  }
}

std::vector<uint8_t> MachOImageBuilder::build() const {
  const bool sw = swapped();
  const bool is64 = is_64bit();
  const uint32_t cmd_align = is64 ? 8u : 4u;
  const bool executable = (filetype == MH_EXECUTE);
  const uint64_t image_base = executable ? (is64 ? 0x100000000ull : 0x1000ull) : 0;

  std::vector<uint8_t> lc; lc.reserve(1024);
  uint32_t ncmds = 0;

  auto put32 = [&](uint32_t v) { uint8_t b[4]; store_u32(b, v, sw); lc.insert(lc.end(), b, b + 4); };
  auto put64 = [&](uint64_t v) { uint8_t b[8]; store_u64(b, v, sw); lc.insert(lc.end(), b, b + 8); };
  auto put_name16 = [&](const char* name) {
    char buf[16]; std::memset(buf, 0, sizeof(buf)); std::strncpy(buf, name, sizeof(buf));
    lc.insert(lc.end(), buf, buf + sizeof(buf));
  };
  auto put_string = [&](const std::string& value, size_t padded_size) {
    size_t start = lc.size();
    lc.insert(lc.end(), value.begin(), value.end());
    lc.resize(start + padded_size, 0);
  };
  auto put_dylib = [&](uint32_t cmd, const std::string& name) {
    uint32_t size = (uint32_t)align_up(sizeof(DylibCommand) + name.size() + 1, cmd_align);
    put32(cmd); put32(size); put32(sizeof(DylibCommand));
    put32(2); put32(0x10000); put32(0x10000); // timestamp, current, compatibility
    put_string(name, size - sizeof(DylibCommand));
    ++ncmds;
  };

  // 1) __PAGEZERO
  if (executable) {
    if (is64) {
      put32(LC_SEGMENT_64); put32(sizeof(SegmentCommand64)); put_name16("__PAGEZERO");
      put64(0); put64(0x100000000ull); put64(0); put64(0);
      put32(0); put32(0); put32(0); put32(0);
    } else {
      put32(LC_SEGMENT); put32(sizeof(SegmentCommand)); put_name16("__PAGEZERO");
      put32(0); put32(0x1000); put32(0); put32(0);
      put32(0); put32(0); put32(0); put32(0);
    }
    ++ncmds;
  }

  // 2) __TEXT with one __text section; sizes and offsets patched below
  const size_t segment_pos = lc.size();
  size_t section_pos = 0;
  const uint32_t text_flags = S_REGULAR | S_ATTR_SOME_INSTRUCTIONS | S_ATTR_PURE_INSTRUCTIONS;
  if (is64) {
    put32(LC_SEGMENT_64); put32(sizeof(SegmentCommand64) + sizeof(Section64)); put_name16("__TEXT");
    put64(image_base); put64(0); put64(0); put64(0);
    put32(VM_PROT_READ | VM_PROT_EXECUTE); put32(VM_PROT_READ | VM_PROT_EXECUTE); put32(1); put32(0);
    section_pos = lc.size();
    put_name16("__text"); put_name16("__TEXT");
    put64(0); put64(code.size()); put32(0); put32(2); put32(0); put32(0);
    put32(text_flags); put32(0); put32(0); put32(0);
  } else {
    put32(LC_SEGMENT); put32(sizeof(SegmentCommand) + sizeof(Section32)); put_name16("__TEXT");
    put32((uint32_t)image_base); put32(0); put32(0); put32(0);
    put32(VM_PROT_READ | VM_PROT_EXECUTE); put32(VM_PROT_READ | VM_PROT_EXECUTE); put32(1); put32(0);
    section_pos = lc.size();
    put_name16("__text"); put_name16("__TEXT");
    put32(0); put32((uint32_t)code.size()); put32(0); put32(2); put32(0); put32(0);
    put32(text_flags); put32(0); put32(0);
  }
  ++ncmds;

  // 3) identity, dynamic linker, dependencies, rpaths
  if (!identity.empty()) {
    put_dylib(LC_ID_DYLIB, identity);
  }
  if (executable) {
    const std::string dyld_path = "/usr/lib/dyld";
    uint32_t size = (uint32_t)align_up(sizeof(DylinkerCommand) + dyld_path.size() + 1, cmd_align);
    put32(LC_LOAD_DYLINKER); put32(size); put32(sizeof(DylinkerCommand));
    put_string(dyld_path, size - sizeof(DylinkerCommand));
    ++ncmds;
  }
  for (const auto& dep : dependencies) {
    put_dylib(dep.cmd, dep.path);
  }
  for (const auto& rpath : rpaths) {
    uint32_t size = (uint32_t)align_up(sizeof(RpathCommand) + rpath.size() + 1, cmd_align);
    put32(LC_RPATH); put32(size); put32(sizeof(RpathCommand));
    put_string(rpath, size - sizeof(RpathCommand));
    ++ncmds;
  }

  // 4) LC_MAIN entry point
  size_t entry_pos = 0;
  if (executable) {
    entry_pos = lc.size();
    put32(LC_MAIN); put32(sizeof(EntryPointCommand)); put64(0); put64(0);
    ++ncmds;
  }

  const uint32_t header_size = is64 ? (uint32_t)sizeof(MachHeader64) : (uint32_t)sizeof(MachHeader);
  const uint64_t code_offset = align_up(header_size + lc.size() + header_padding, 16);
  const uint64_t file_size = code_offset + code.size();

  // Patch section + segment + entry with proper offsets/addresses
  if (is64) {
    store_u64(lc.data() + segment_pos + offsetof(SegmentCommand64, vmsize), align_up(file_size, 0x1000), sw);
    store_u64(lc.data() + segment_pos + offsetof(SegmentCommand64, filesize), file_size, sw);
    store_u64(lc.data() + section_pos + offsetof(Section64, addr), image_base + code_offset, sw);
    store_u32(lc.data() + section_pos + offsetof(Section64, offset), (uint32_t)code_offset, sw);
  } else {
    store_u32(lc.data() + segment_pos + offsetof(SegmentCommand, vmsize), (uint32_t)align_up(file_size, 0x1000), sw);
    store_u32(lc.data() + segment_pos + offsetof(SegmentCommand, filesize), (uint32_t)file_size, sw);
    store_u32(lc.data() + section_pos + offsetof(Section32, addr), (uint32_t)(image_base + code_offset), sw);
    store_u32(lc.data() + section_pos + offsetof(Section32, offset), (uint32_t)code_offset, sw);
  }
  if (executable) {
    store_u64(lc.data() + entry_pos + offsetof(EntryPointCommand, entryoff), code_offset, sw);
  }

  uint32_t cputype = 0, cpusubtype = 0;
  cpu_type(cputype, cpusubtype);
  uint32_t flags = MH_NOUNDEFS | MH_DYLDLINK | MH_TWOLEVEL;
  if (executable) flags |= MH_PIE;

  std::vector<uint8_t> out(header_size, 0);
  store_u32(out.data() + offsetof(MachHeader, magic), is64 ? MH_MAGIC_64 : MH_MAGIC, sw);
  store_u32(out.data() + offsetof(MachHeader, cputype), cputype, sw);
  store_u32(out.data() + offsetof(MachHeader, cpusubtype), cpusubtype, sw);
  store_u32(out.data() + offsetof(MachHeader, filetype), filetype, sw);
  store_u32(out.data() + offsetof(MachHeader, ncmds), ncmds, sw);
  store_u32(out.data() + offsetof(MachHeader, sizeofcmds), (uint32_t)lc.size(), sw);
  store_u32(out.data() + offsetof(MachHeader, flags), flags, sw);

  out.insert(out.end(), lc.begin(), lc.end());
  out.resize(code_offset, 0);
  out.insert(out.end(), code.begin(), code.end());
  return out;
}

std::vector<uint8_t> MachOImageBuilder::build_fat(const std::vector<MachOImageBuilder>& slices, bool fat64) {
  // Fat headers are big-endian regardless of the slices
  const bool sw = host_is_little_endian();
  const size_t entry_size = fat64 ? sizeof(FatArch64) : sizeof(FatArch);

  std::vector<std::vector<uint8_t>> images;
  images.reserve(slices.size());
  for (const auto& slice : slices) {
    images.push_back(slice.build());
  }

  std::vector<uint8_t> out(sizeof(FatHeader) + slices.size() * entry_size, 0);
  store_u32(out.data() + offsetof(FatHeader, magic), fat64 ? FAT_MAGIC_64 : FAT_MAGIC, sw);
  store_u32(out.data() + offsetof(FatHeader, nfat_arch), (uint32_t)slices.size(), sw);

  uint64_t offset = align_up(out.size(), FAT_SLICE_ALIGN);
  std::vector<uint64_t> offsets;
  for (size_t i = 0; i < slices.size(); ++i) {
    uint32_t cputype = 0, cpusubtype = 0;
    slices[i].cpu_type(cputype, cpusubtype);
    uint8_t* entry = out.data() + sizeof(FatHeader) + i * entry_size;
    if (fat64) {
      store_u32(entry + offsetof(FatArch64, cputype), cputype, sw);
      store_u32(entry + offsetof(FatArch64, cpusubtype), cpusubtype, sw);
      store_u64(entry + offsetof(FatArch64, offset), offset, sw);
      store_u64(entry + offsetof(FatArch64, size), images[i].size(), sw);
      store_u32(entry + offsetof(FatArch64, align), FAT_SLICE_ALIGN_LOG2, sw);
    } else {
      store_u32(entry + offsetof(FatArch, cputype), cputype, sw);
      store_u32(entry + offsetof(FatArch, cpusubtype), cpusubtype, sw);
      store_u32(entry + offsetof(FatArch, offset), (uint32_t)offset, sw);
      store_u32(entry + offsetof(FatArch, size), (uint32_t)images[i].size(), sw);
      store_u32(entry + offsetof(FatArch, align), FAT_SLICE_ALIGN_LOG2, sw);
    }
    offsets.push_back(offset);
    offset = align_up(offset + images[i].size(), FAT_SLICE_ALIGN);
  }

  for (size_t i = 0; i < images.size(); ++i) {
    out.resize(offsets[i], 0);
    out.insert(out.end(), images[i].begin(), images[i].end());
  }
  return out;
}

bool MachOImageBuilder::write_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc); if (!f) return false;
  f.write((const char*)bytes.data(), (std::streamsize)bytes.size()); f.close();
  if (!f) return false;
  // Make executable
  std::error_code ec;
  std::filesystem::permissions(path, std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                               std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
                               std::filesystem::perms::others_exec, ec);
  return !ec;
}

bool MachOImageBuilder::write(const std::string& path) const {
  return write_bytes(path, build());
}

bool MachOImageBuilder::write_fat(const std::string& path, const std::vector<MachOImageBuilder>& slices, bool fat64) {
  if (slices.empty()) return false;
  return write_bytes(path, build_fat(slices, fat64));
}

} // namespace Relink
