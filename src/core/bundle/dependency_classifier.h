#pragma once
#include <string>

namespace Relink {

enum class DependencyClass {
    System,            // provided by the OS, never touched
    AlreadyRelative,   // already resolved relative to the loader
    Vendorable         // must be copied into the bundle
};

class DependencyClassifier {
public:
    // Pure function of the raw load-command path
    static DependencyClass classify_reference(const std::string& raw_path);

    // Last path component, used as the vendoring key
    static std::string basename_of(const std::string& raw_path);
};

} // namespace Relink
