#pragma once
#include <cstdint>
#include <cstring>
#include <vector>

// Mach-O on-disk constants and structures used by the reader, the editor and
// the image builder. Field layouts follow <mach-o/loader.h> and <mach-o/fat.h>;
// they are declared here so the engine also builds on non-Apple hosts.

namespace Relink {

// Mach-O magic numbers
static constexpr uint32_t MH_MAGIC         = 0xFEEDFACE;      /* the mach magic number */
static constexpr uint32_t MH_CIGAM         = 0xCEFAEDFE;      /* NXSwapInt(MH_MAGIC) */
static constexpr uint32_t MH_MAGIC_64      = 0xFEEDFACF;      /* the 64-bit mach magic number */
static constexpr uint32_t MH_CIGAM_64      = 0xCFFAEDFE;      /* NXSwapInt(MH_MAGIC_64) */

// Universal (fat) headers are always stored big-endian
static constexpr uint32_t FAT_MAGIC        = 0xCAFEBABE;
static constexpr uint32_t FAT_CIGAM        = 0xBEBAFECA;
static constexpr uint32_t FAT_MAGIC_64     = 0xCAFEBABF;
static constexpr uint32_t FAT_CIGAM_64     = 0xBFBAFECA;

// Java class files share FAT_MAGIC; their "count" is a class-file version >= 45
static constexpr uint32_t FAT_MAX_ARCHS    = 30;

// Mach-O file types
static constexpr uint32_t MH_OBJECT        = 0x1;             /* relocatable object file */
static constexpr uint32_t MH_EXECUTE       = 0x2;             /* demand paged executable file */
static constexpr uint32_t MH_DYLIB         = 0x6;             /* dynamically bound shared library */
static constexpr uint32_t MH_BUNDLE        = 0x8;             /* dynamically bound bundle file */

// Mach-O header flags
static constexpr uint32_t MH_NOUNDEFS      = 0x1;
static constexpr uint32_t MH_DYLDLINK      = 0x4;
static constexpr uint32_t MH_TWOLEVEL      = 0x80;
static constexpr uint32_t MH_PIE           = 0x200000;

static constexpr uint32_t CPU_TYPE_X86     = 7;
static constexpr uint32_t CPU_ARCH_ABI64   = 0x01000000;
static constexpr uint32_t CPU_TYPE_X86_64  = CPU_TYPE_X86 | CPU_ARCH_ABI64; // 0x01000007
static constexpr uint32_t CPU_SUBTYPE_X86_ALL    = 3;
static constexpr uint32_t CPU_SUBTYPE_X86_64_ALL = 3;

static constexpr uint32_t CPU_TYPE_ARM     = 12;
static constexpr uint32_t CPU_TYPE_ARM64   = CPU_TYPE_ARM | CPU_ARCH_ABI64; // 0x0100000C
static constexpr uint32_t CPU_SUBTYPE_ARM64_ALL = 0;

static constexpr uint32_t CPU_TYPE_POWERPC = 18;
static constexpr uint32_t CPU_SUBTYPE_POWERPC_ALL = 0;

// Load commands
static constexpr uint32_t LC_REQ_DYLD            = 0x80000000;
static constexpr uint32_t LC_SEGMENT              = 0x1;        /* segment of this file to be mapped */
static constexpr uint32_t LC_SYMTAB               = 0x2;        /* link-edit stab symbol table info */
static constexpr uint32_t LC_LOAD_DYLIB           = 0xc;        /* load a dynamically linked shared library */
static constexpr uint32_t LC_ID_DYLIB             = 0xd;        /* dynamically linked shared lib ident */
static constexpr uint32_t LC_LOAD_DYLINKER        = 0xe;        /* load a dynamic linker */
static constexpr uint32_t LC_LOAD_WEAK_DYLIB      = (0x18 | LC_REQ_DYLD); /* load a dynamically linked shared library that is allowed to be missing */
static constexpr uint32_t LC_SEGMENT_64           = 0x19;       /* 64-bit segment of this file to be mapped */
static constexpr uint32_t LC_UUID                 = 0x1b;       /* the uuid */
static constexpr uint32_t LC_RPATH                = (0x1c | LC_REQ_DYLD); /* runpath additions */
static constexpr uint32_t LC_CODE_SIGNATURE       = 0x1d;       /* local of code signature */
static constexpr uint32_t LC_REEXPORT_DYLIB       = (0x1f | LC_REQ_DYLD); /* load and re-export dylib */
static constexpr uint32_t LC_LAZY_LOAD_DYLIB      = 0x20;       /* delay load of dylib until first use */
static constexpr uint32_t LC_LOAD_UPWARD_DYLIB    = (0x23 | LC_REQ_DYLD); /* load upward dylib */
static constexpr uint32_t LC_MAIN                 = (0x28 | LC_REQ_DYLD); /* replacement for LC_UNIXTHREAD */

static constexpr uint32_t VM_PROT_READ     = 0x01;
static constexpr uint32_t VM_PROT_WRITE    = 0x02;
static constexpr uint32_t VM_PROT_EXECUTE  = 0x04;

static constexpr uint32_t S_REGULAR                  = 0x0;
static constexpr uint32_t S_ZEROFILL                 = 0x1;
static constexpr uint32_t S_GB_ZEROFILL              = 0xc;
static constexpr uint32_t S_THREAD_LOCAL_ZEROFILL    = 0x12;
static constexpr uint32_t SECTION_TYPE               = 0x000000ff;
static constexpr uint32_t S_ATTR_SOME_INSTRUCTIONS   = 0x00000400;
static constexpr uint32_t S_ATTR_PURE_INSTRUCTIONS   = 0x80000000;

static inline uint64_t align_up(uint64_t value, uint64_t alignment) {
  return (value + alignment - 1) & ~(alignment - 1);
}

#pragma pack(push, 1)
struct MachHeader {
    uint32_t magic;           /* mach magic number identifier */
    int32_t  cputype;         /* cpu specifier */
    int32_t  cpusubtype;      /* machine specifier */
    uint32_t filetype;        /* type of file */
    uint32_t ncmds;           /* number of load commands */
    uint32_t sizeofcmds;      /* the size of all the load commands */
    uint32_t flags;           /* flags */
};

struct MachHeader64 {
    uint32_t magic;           /* mach magic number identifier */
    int32_t  cputype;         /* cpu specifier */
    int32_t  cpusubtype;      /* machine specifier */
    uint32_t filetype;        /* type of file */
    uint32_t ncmds;           /* number of load commands */
    uint32_t sizeofcmds;      /* the size of all the load commands */
    uint32_t flags;           /* flags */
    uint32_t reserved;        /* reserved, pad to 64bit */
};

struct LoadCommand {
    uint32_t cmd;
    uint32_t cmdsize;
};

struct SegmentCommand {
    uint32_t cmd;             /* LC_SEGMENT */
    uint32_t cmdsize;         /* includes sizeof section structs */
    char     segname[16];
    uint32_t vmaddr;
    uint32_t vmsize;
    uint32_t fileoff;
    uint32_t filesize;
    uint32_t maxprot;
    uint32_t initprot;
    uint32_t nsects;
    uint32_t flags;
};

struct SegmentCommand64 {
    uint32_t cmd;             /* LC_SEGMENT_64 */
    uint32_t cmdsize;         /* includes sizeof section_64 structs */
    char     segname[16];     /* segment name */
    uint64_t vmaddr;          /* memory address of this segment */
    uint64_t vmsize;          /* memory size of this segment */
    uint64_t fileoff;         /* file offset of this segment */
    uint64_t filesize;        /* amount to map from the file */
    uint32_t maxprot;         /* maximum VM protection */
    uint32_t initprot;        /* initial VM protection */
    uint32_t nsects;          /* number of sections in segment */
    uint32_t flags;           /* flags */
};

struct Section32 {
    char     sectname[16];
    char     segname[16];
    uint32_t addr;
    uint32_t size;
    uint32_t offset;
    uint32_t align;
    uint32_t reloff;
    uint32_t nreloc;
    uint32_t flags;
    uint32_t reserved1;
    uint32_t reserved2;
};

struct Section64 {
    char     sectname[16];    /* name of this section */
    char     segname[16];     /* segment this section goes in */
    uint64_t addr;            /* memory address of this section */
    uint64_t size;            /* size in bytes of this section */
    uint32_t offset;          /* file offset of this section */
    uint32_t align;           /* section alignment (power of 2) */
    uint32_t reloff;          /* file offset of relocation entries */
    uint32_t nreloc;          /* number of relocation entries */
    uint32_t flags;           /* flags (section type and attributes)*/
    uint32_t reserved1;       /* reserved (for offset or index) */
    uint32_t reserved2;       /* reserved (for count or sizeof) */
    uint32_t reserved3;       /* reserved */
};

// dylib_command: LC_ID_DYLIB, LC_LOAD_DYLIB and friends. The name string
// follows the fixed part at name_offset bytes from the start of the command.
struct DylibCommand {
    uint32_t cmd;
    uint32_t cmdsize;
    uint32_t name_offset;
    uint32_t timestamp;
    uint32_t current_version;
    uint32_t compatibility_version;
};

struct RpathCommand {
    uint32_t cmd;             /* LC_RPATH */
    uint32_t cmdsize;
    uint32_t path_offset;
};

struct DylinkerCommand { uint32_t cmd; uint32_t cmdsize; uint32_t name; /* char name[] */ };

struct EntryPointCommand {
    uint32_t cmd;             /* LC_MAIN only used in MH_EXECUTE filetypes */
    uint32_t cmdsize;         /* 24 */
    uint64_t entryoff;        /* file (__TEXT) offset of main() */
    uint64_t stacksize;       /* if not zero, initial stack size */
};

struct FatHeader {
    uint32_t magic;           /* FAT_MAGIC or FAT_MAGIC_64 */
    uint32_t nfat_arch;       /* number of structs that follow */
};

struct FatArch {
    int32_t  cputype;
    int32_t  cpusubtype;
    uint32_t offset;          /* file offset to this object file */
    uint32_t size;            /* size of this object file */
    uint32_t align;           /* alignment as a power of 2 */
};

struct FatArch64 {
    int32_t  cputype;
    int32_t  cpusubtype;
    uint64_t offset;
    uint64_t size;
    uint32_t align;
    uint32_t reserved;
};
#pragma pack(pop)

// Byte order helpers. Every multi-byte read and write goes through these so a
// slice stored in the opposite byte order is handled the same way.
static inline uint32_t swap32(uint32_t v) {
  return ((v & 0x000000FFu) << 24) | ((v & 0x0000FF00u) << 8) |
         ((v & 0x00FF0000u) >> 8)  | ((v & 0xFF000000u) >> 24);
}

static inline uint64_t swap64(uint64_t v) {
  return (static_cast<uint64_t>(swap32(static_cast<uint32_t>(v))) << 32) |
         swap32(static_cast<uint32_t>(v >> 32));
}

static inline uint32_t load_u32(const uint8_t* p, bool swapped) {
  uint32_t v; std::memcpy(&v, p, sizeof(v));
  return swapped ? swap32(v) : v;
}

static inline uint64_t load_u64(const uint8_t* p, bool swapped) {
  uint64_t v; std::memcpy(&v, p, sizeof(v));
  return swapped ? swap64(v) : v;
}

static inline void store_u32(uint8_t* p, uint32_t v, bool swapped) {
  if (swapped) v = swap32(v);
  std::memcpy(p, &v, sizeof(v));
}

static inline void store_u64(uint8_t* p, uint64_t v, bool swapped) {
  if (swapped) v = swap64(v);
  std::memcpy(p, &v, sizeof(v));
}

// True on hosts that store integers least significant byte first. Fat headers
// are big-endian on disk, so they need swapping exactly on these hosts.
static inline bool host_is_little_endian() {
  const uint16_t probe = 1;
  uint8_t first; std::memcpy(&first, &probe, 1);
  return first == 1;
}

} // namespace Relink
