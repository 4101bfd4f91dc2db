#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Relink {

// Architecture types for Mach-O images
enum class MachOArch {
  X86_64,
  ARM64,
  I386,
  PPC
};

enum class ByteOrder {
  Little,
  Big
};

// Minimal Mach-O image writer: header, __TEXT segment with one __text
// section, and the path-bearing load commands the relinker cares about
// (LC_ID_DYLIB, LC_*_DYLIB, LC_RPATH). Executables also get __PAGEZERO,
// LC_LOAD_DYLINKER and LC_MAIN. The __text section starts after the load
// commands plus header_padding bytes, which is the space install-name edits
// may grow into.
class MachOImageBuilder {
public:
  explicit MachOImageBuilder(uint32_t filetype, MachOArch arch = MachOArch::ARM64);

  void set_identity(const std::string& install_name) { identity = install_name; }
  void add_dependency(const std::string& path, uint32_t cmd);
  void add_dependency(const std::string& path);
  void add_rpath(const std::string& path) { rpaths.push_back(path); }
  void set_header_padding(uint32_t bytes) { header_padding = bytes; }
  void set_byte_order(ByteOrder order) { byte_order = order; }
  void set_code(const std::vector<uint8_t>& bytes) { code = bytes; }

  uint32_t get_filetype() const { return filetype; }
  MachOArch get_arch() const { return arch; }
  bool is_64bit() const { return arch == MachOArch::X86_64 || arch == MachOArch::ARM64; }

  // Serialized image
  std::vector<uint8_t> build() const;

  // Writes the image to path and makes it executable
  bool write(const std::string& path) const;

  // Universal file holding one slice per builder, 4K aligned
  static std::vector<uint8_t> build_fat(const std::vector<MachOImageBuilder>& slices, bool fat64 = false);
  static bool write_fat(const std::string& path, const std::vector<MachOImageBuilder>& slices, bool fat64 = false);

  static bool write_bytes(const std::string& path, const std::vector<uint8_t>& bytes);

private:
  struct DependencyEntry {
    std::string path;
    uint32_t cmd;
  };

  uint32_t filetype;
  MachOArch arch;
  ByteOrder byte_order;
  std::string identity;
  std::vector<DependencyEntry> dependencies;
  std::vector<std::string> rpaths;
  uint32_t header_padding = 256;
  std::vector<uint8_t> code;

  bool swapped() const;
  void cpu_type(uint32_t& type, uint32_t& subtype) const;
};

} // namespace Relink
