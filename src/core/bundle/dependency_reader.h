#pragma once
#include "binary.h"
#include <string>
#include <vector>

namespace Relink {

// Load-command view of one binary, merged across the slices of a fat file
struct DependencyInfo {
    BinaryRole role = BinaryRole::NotMachO;
    std::vector<DependencyReference> references;   // first-seen order, no duplicates
    std::string identity;                          // empty when the binary has no LC_ID_DYLIB
    std::vector<std::string> rpaths;
};

class DependencyReader {
public:
    DependencyReader() = default;

    // Parse path and collect its references. Returns false for files that are
    // not Mach-O images or are malformed; get_error() says which.
    bool read_dependencies(const std::string& path, DependencyInfo& info);

    const std::string& get_error() const { return error_message; }

private:
    std::string error_message;
};

} // namespace Relink
