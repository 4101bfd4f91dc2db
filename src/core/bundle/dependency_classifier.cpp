#include "dependency_classifier.h"

namespace Relink {

static const char* const SYSTEM_PREFIXES[] = {
    "/usr/lib/",
    "/System/Library/",
    "/System/Volumes/Preboot/Cryptexes/",
};

static const char* const RELATIVE_PREFIXES[] = {
    "@loader_path/",
    "@executable_path/",
};

static bool has_prefix(const std::string& value, const char* prefix) {
    return value.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

DependencyClass DependencyClassifier::classify_reference(const std::string& raw_path) {
    for (const char* prefix : SYSTEM_PREFIXES) {
        if (has_prefix(raw_path, prefix)) return DependencyClass::System;
    }
    for (const char* prefix : RELATIVE_PREFIXES) {
        if (has_prefix(raw_path, prefix)) return DependencyClass::AlreadyRelative;
    }
    return DependencyClass::Vendorable;
}

std::string DependencyClassifier::basename_of(const std::string& raw_path) {
    size_t slash = raw_path.find_last_of('/');
    if (slash == std::string::npos) {
        return raw_path;
    }
    return raw_path.substr(slash + 1);
}

} // namespace Relink
