//============================================================================
// Name        : relink_demo.cpp
// Description : Builds a tiny synthetic application bundle and relinks it
//============================================================================

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>
#include "core/bundle/bundle_relinker.h"
#include "core/bundle/dependency_reader.h"
#include "core/macho/macho_builder.h"
#include "core/macho/macho_format.h"

using namespace std;
using namespace Relink;
namespace fs = std::filesystem;

static bool write_library(const string& path, const string& install_name, const vector<string>& deps) {
    MachOImageBuilder lib(MH_DYLIB);
    lib.set_identity(install_name);
    for (const auto& dep : deps) lib.add_dependency(dep);
    return lib.write(path);
}

static void list_dependencies(const string& path) {
    DependencyReader reader;
    DependencyInfo info;
    if (!reader.read_dependencies(path, info)) {
        cout << "  " << path << ": " << reader.get_error() << endl;
        return;
    }
    cout << "  " << fs::path(path).filename().string() << " [" << role_name(info.role) << "]";
    if (!info.identity.empty()) cout << " (id " << info.identity << ")";
    cout << endl;
    for (const auto& ref : info.references) {
        cout << "      -> " << ref.raw_path << " (" << dependency_kind_name(ref.kind) << ")" << endl;
    }
}

int main(int argc, char** argv) {
    string base;
    if (argc > 1) {
        base = argv[1];
        fs::create_directories(base);
    } else {
        char tmpl[] = "/tmp/relink_demo.XXXXXX";
        if (!mkdtemp(tmpl)) {
            cerr << "Failed to create a temporary directory" << endl;
            return 1;
        }
        base = tmpl;
    }

    const string build = base + "/build";            // libraries as installed on the build machine
    const string staging = base + "/Demo.app";
    fs::create_directories(build + "/lib");
    fs::create_directories(staging + "/Contents/MacOS");

    cout << "\n=== Building synthetic bundle in " << base << " ===" << endl;

    // libfoo -> libbaz, both outside the bundle
    const string libbaz = build + "/lib/libbaz.dylib";
    const string libfoo = build + "/lib/libfoo.dylib";
    if (!write_library(libbaz, libbaz, {"/usr/lib/libSystem.B.dylib"}) ||
        !write_library(libfoo, libfoo, {libbaz, "/usr/lib/libSystem.B.dylib"})) {
        cerr << "Failed to write demo libraries" << endl;
        return 1;
    }

    const string exe = staging + "/Contents/MacOS/demo";
    MachOImageBuilder app(MH_EXECUTE);
    app.add_dependency("/System/Library/Frameworks/CoreFoundation.framework/Versions/A/CoreFoundation");
    app.add_dependency(libfoo);
    app.add_dependency("/usr/lib/libSystem.B.dylib");
    if (!app.write(exe)) {
        cerr << "Failed to write demo executable" << endl;
        return 1;
    }

    cout << "Before:" << endl;
    list_dependencies(exe);

    BundleRelinker relinker;
    relinker.set_staging_root(staging);
    relinker.set_main_executable("Contents/MacOS/demo");
    relinker.set_signing(false);
    relinker.set_verbose(true);

    try {
        const BundleReport& report = relinker.run();
        cout << "\n=== Result ===" << endl;
        report.print(cout);
    } catch (const StagingError& e) {
        cerr << "Staging error: " << e.what() << endl;
        return 1;
    }

    cout << "\nAfter:" << endl;
    list_dependencies(exe);
    for (const auto& entry : fs::directory_iterator(staging + "/Contents/Frameworks")) {
        list_dependencies(entry.path().string());
    }
    return 0;
}
