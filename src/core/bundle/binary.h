#pragma once
#include "../macho/macho_reader.h"
#include <cstdint>
#include <string>

namespace Relink {

// A Mach-O file of the bundle taking part in the run
struct Binary {
    std::string path;
    BinaryRole role = BinaryRole::NotMachO;
    bool touched = false;

    Binary() = default;
    Binary(const std::string& p, BinaryRole r) : path(p), role(r) {}
};

// Which load command a dependency came from
enum class DependencyKind {
    Load,       // LC_LOAD_DYLIB
    Weak,       // LC_LOAD_WEAK_DYLIB
    Reexport,   // LC_REEXPORT_DYLIB
    Lazy,       // LC_LAZY_LOAD_DYLIB
    Upward      // LC_LOAD_UPWARD_DYLIB
};

DependencyKind dependency_kind_for(uint32_t cmd);
const char* dependency_kind_name(DependencyKind kind);

struct DependencyReference {
    std::string raw_path;
    std::string consumer;
    DependencyKind kind = DependencyKind::Load;

    DependencyReference() = default;
    DependencyReference(const std::string& raw, const std::string& owner, DependencyKind k)
        : raw_path(raw), consumer(owner), kind(k) {}
};

} // namespace Relink
