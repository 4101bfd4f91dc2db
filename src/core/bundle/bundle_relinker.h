#pragma once
#include "bundle_report.h"
#include "signature_finalizer.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Relink {

// Raised only when the staging directory itself cannot be read or written
class StagingError : public std::runtime_error {
public:
    explicit StagingError(const std::string& message) : std::runtime_error(message) {}
};

// Relative paths are resolved against staging_root
struct BundleOptions {
    std::string staging_root;
    std::string lib_dir = "Contents/Frameworks";
    std::string main_executable;
    std::string interpreter_executable;
    std::vector<std::string> package_dirs;
    std::string venv_interpreter;

    size_t thread_count = 0;   // 0: hardware concurrency
    bool sign = true;
    std::string sign_identity = "-";
    std::string codesign_tool = "codesign";

    bool resolve_rpaths = false;
    std::vector<std::string> extra_search_paths;

    bool verbose = false;
    bool quiet = false;
};

// Makes a staged application self-contained: vendors every non-system
// library its binaries reach, rewrites them to @loader_path references and
// re-signs what changed.
class BundleRelinker {
public:
    BundleRelinker() = default;
    explicit BundleRelinker(const BundleOptions& opts) : options(opts) {}

    void set_staging_root(const std::string& path) { options.staging_root = path; }
    void set_lib_dir(const std::string& path) { options.lib_dir = path; }
    void set_main_executable(const std::string& path) { options.main_executable = path; }
    void set_interpreter_executable(const std::string& path) { options.interpreter_executable = path; }
    void add_package_dir(const std::string& path) { options.package_dirs.push_back(path); }
    void set_venv_interpreter(const std::string& path) { options.venv_interpreter = path; }
    void set_thread_count(size_t count) { options.thread_count = count; }
    void set_signing(bool enabled) { options.sign = enabled; }
    void set_sign_identity(const std::string& identity) { options.sign_identity = identity; }
    void set_codesign_tool(const std::string& tool) { options.codesign_tool = tool; }
    void set_resolve_rpaths(bool enabled) { options.resolve_rpaths = enabled; }
    void add_search_path(const std::string& dir) { options.extra_search_paths.push_back(dir); }
    void set_verbose(bool enabled) { options.verbose = enabled; }
    void set_quiet(bool enabled) { options.quiet = enabled; }

    // Use this signer instead of the codesign tool. Not owned.
    void set_signer(CodeSigner* custom) { signer = custom; }

    const BundleOptions& get_options() const { return options; }

    // Throws StagingError when the staging root is missing or the library
    // directory cannot be created or written.
    const BundleReport& run();

    // Roots in scan order: main executable, interpreter, then every Mach-O
    // file under the package directories sorted by path. With none of those
    // configured, every Mach-O file under the staging root.
    std::vector<std::string> discover_roots() const;

private:
    BundleOptions options;
    CodeSigner* signer = nullptr;
    std::unique_ptr<BundleReport> report;

    std::string root_path;   // canonical staging root of the current run
    std::string lib_path;

    std::string resolve(const std::string& path) const;
    void prepare_staging();
    bool fix_venv_interpreter(std::string& replaced);
    static void collect_images(const std::string& dir, std::vector<std::string>& out);
};

} // namespace Relink
