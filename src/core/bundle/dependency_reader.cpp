#include "dependency_reader.h"
#include "../macho/macho_format.h"
#include <algorithm>

namespace Relink {

DependencyKind dependency_kind_for(uint32_t cmd) {
    switch (cmd) {
        case LC_LOAD_WEAK_DYLIB:   return DependencyKind::Weak;
        case LC_REEXPORT_DYLIB:    return DependencyKind::Reexport;
        case LC_LAZY_LOAD_DYLIB:   return DependencyKind::Lazy;
        case LC_LOAD_UPWARD_DYLIB: return DependencyKind::Upward;
        default:                   return DependencyKind::Load;
    }
}

const char* dependency_kind_name(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::Load:     return "load";
        case DependencyKind::Weak:     return "weak";
        case DependencyKind::Reexport: return "reexport";
        case DependencyKind::Lazy:     return "lazy";
        case DependencyKind::Upward:   return "upward";
    }
    return "load";
}

bool DependencyReader::read_dependencies(const std::string& path, DependencyInfo& info) {
    info = DependencyInfo();
    error_message.clear();

    MachOReader reader;
    MachOFile file;
    if (!reader.read(path, file)) {
        error_message = reader.get_error();
        return false;
    }
    info.role = file.role();
    if (info.role == BinaryRole::NotMachO) {
        error_message = path + " is not a loadable Mach-O image";
        return false;
    }

    for (const auto& slice : file.slices) {
        for (const auto& command : slice.dylibs) {
            if (command.is_identity()) {
                if (info.identity.empty()) {
                    info.identity = command.value;
                }
                continue;
            }
            auto seen = std::find_if(info.references.begin(), info.references.end(),
                                     [&](const DependencyReference& ref) { return ref.raw_path == command.value; });
            if (seen == info.references.end()) {
                info.references.emplace_back(command.value, path, dependency_kind_for(command.cmd));
            }
        }
        for (const auto& rpath : slice.rpaths) {
            if (std::find(info.rpaths.begin(), info.rpaths.end(), rpath.value) == info.rpaths.end()) {
                info.rpaths.push_back(rpath.value);
            }
        }
    }
    return true;
}

} // namespace Relink
