#include "bundle_relinker.h"
#include "closure_driver.h"
#include "vendoring_registry.h"
#include "../macho/macho_reader.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace Relink {

std::string BundleRelinker::resolve(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute()) {
        return p.lexically_normal().string();
    }
    const std::string& base = root_path.empty() ? options.staging_root : root_path;
    return (fs::path(base) / p).lexically_normal().string();
}

void BundleRelinker::prepare_staging() {
    std::error_code ec;
    if (options.staging_root.empty()) {
        throw StagingError("no staging directory given");
    }
    if (!fs::is_directory(options.staging_root, ec)) {
        throw StagingError("staging directory " + options.staging_root + " does not exist");
    }
    fs::path canonical = fs::canonical(options.staging_root, ec);
    if (ec) {
        throw StagingError("cannot resolve staging directory " + options.staging_root + ": " + ec.message());
    }
    root_path = canonical.string();
    lib_path = resolve(options.lib_dir);

    fs::create_directories(lib_path, ec);
    if (ec || !fs::is_directory(lib_path, ec)) {
        throw StagingError("cannot create library directory " + lib_path +
                           (ec ? ": " + ec.message() : std::string()));
    }

    // Probe write access before touching anything
    const fs::path probe = fs::path(lib_path) / ".relink-write-probe";
    {
        std::ofstream out(probe.string(), std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StagingError("library directory " + lib_path + " is not writable");
        }
    }
    fs::remove(probe, ec);
    if (ec) {
        throw StagingError("cannot clean up " + probe.string() + ": " + ec.message());
    }

    for (const std::string* exe : {&options.main_executable, &options.interpreter_executable}) {
        if (!exe->empty() && !fs::exists(resolve(*exe), ec)) {
            throw StagingError("staged executable " + resolve(*exe) + " does not exist");
        }
    }
}

void BundleRelinker::collect_images(const std::string& dir, std::vector<std::string>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw StagingError("cannot read " + dir + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw StagingError("cannot read " + dir + ": " + ec.message());
        }
        // Links are not followed; their targets are reached on their own
        std::error_code status_ec;
        if (it->is_symlink(status_ec) || !it->is_regular_file(status_ec)) {
            continue;
        }
        const std::string path = it->path().string();
        if (MachOReader::classify(path) != BinaryRole::NotMachO) {
            out.push_back(path);
        }
    }
    if (ec) {
        throw StagingError("cannot read " + dir + ": " + ec.message());
    }
}

std::vector<std::string> BundleRelinker::discover_roots() const {
    std::vector<std::string> roots;
    auto push = [&](const std::string& path) {
        if (std::find(roots.begin(), roots.end(), path) == roots.end()) {
            roots.push_back(path);
        }
    };

    if (!options.main_executable.empty()) {
        push(resolve(options.main_executable));
    }
    if (!options.interpreter_executable.empty()) {
        push(resolve(options.interpreter_executable));
    }

    std::vector<std::string> modules;
    for (const auto& dir : options.package_dirs) {
        const std::string path = resolve(dir);
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            if (!options.quiet) {
                std::cerr << "warning: package directory " << path << " does not exist" << std::endl;
            }
            continue;
        }
        collect_images(path, modules);
    }
    if (options.main_executable.empty() && options.interpreter_executable.empty() && options.package_dirs.empty()) {
        collect_images(root_path.empty() ? options.staging_root : root_path, modules);
    }

    std::sort(modules.begin(), modules.end());
    for (const auto& module : modules) {
        push(module);
    }
    return roots;
}

bool BundleRelinker::fix_venv_interpreter(std::string& replaced) {
    if (options.venv_interpreter.empty()) {
        return false;
    }
    const fs::path venv_python = resolve(options.venv_interpreter);
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(venv_python, ec))) {
        return false;
    }

    fs::path target = fs::read_symlink(venv_python, ec);
    if (ec) {
        throw StagingError("cannot read link " + venv_python.string() + ": " + ec.message());
    }
    if (target.is_relative()) {
        target = venv_python.parent_path() / target;
    }

    bool inside = false;
    if (fs::exists(target, ec)) {
        const fs::path resolved = fs::weakly_canonical(target, ec);
        if (!ec) {
            const std::string rel = resolved.lexically_relative(root_path).generic_string();
            inside = !rel.empty() && rel.compare(0, 2, "..") != 0;
        }
    }
    if (inside) {
        return false;
    }

    if (options.interpreter_executable.empty()) {
        if (!options.quiet) {
            std::cerr << "warning: " << venv_python.string() << " points outside the bundle and no interpreter is configured"
                      << std::endl;
        }
        return false;
    }

    const fs::path interpreter = resolve(options.interpreter_executable);
    fs::remove(venv_python, ec);
    if (!ec) {
        fs::copy_file(interpreter, venv_python, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        throw StagingError("cannot replace " + venv_python.string() + " with " + interpreter.string() + ": " +
                           ec.message());
    }
    fs::permissions(venv_python, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::add, ec);
    if (ec) {
        throw StagingError("cannot make " + venv_python.string() + " writable: " + ec.message());
    }

    if (options.verbose) {
        std::cout << "Replaced " << venv_python.string() << " (linked to " << target.string()
                  << ") with a copy of " << interpreter.string() << std::endl;
    }
    replaced = venv_python.string();
    return true;
}

const BundleReport& BundleRelinker::run() {
    report = std::make_unique<BundleReport>();
    report->set_quiet(options.quiet);
    root_path.clear();
    lib_path.clear();

    prepare_staging();

    if (options.verbose) {
        std::cout << "Relinking " << root_path << " into " << lib_path << std::endl;
    }

    VendoringRegistry registry(lib_path);
    ClosureDriver driver(registry, *report);
    driver.set_thread_count(options.thread_count);
    driver.set_resolve_rpaths(options.resolve_rpaths);
    driver.set_verbose(options.verbose);
    if (!options.main_executable.empty()) {
        driver.set_executable_path(resolve(options.main_executable));
    }
    for (const auto& dir : options.extra_search_paths) {
        driver.add_search_path(dir);
    }

    std::string replaced;
    const bool venv_fixed = fix_venv_interpreter(replaced);

    for (const auto& root : discover_roots()) {
        driver.add_root(root);
    }
    if (venv_fixed) {
        driver.add_root(replaced);
        driver.mark_touched(replaced);
    }

    driver.run();

    const std::vector<std::string> touched = driver.touched_binaries();
    report->set_vendored(registry.entries());
    report->set_touched(touched);
    report->set_pass_count(driver.pass_count());

    // Signing only after the driver is Done: any later edit would invalidate it
    std::unique_ptr<CodesignToolSigner> tool_signer;
    CodeSigner* active = signer;
    if (!active && options.sign) {
        tool_signer = std::make_unique<CodesignToolSigner>(options.codesign_tool, options.sign_identity);
        active = tool_signer.get();
    }
    if (active && options.sign) {
        SignatureFinalizer finalizer(active, *report);
        report->set_signed_count(finalizer.finalize(touched));
    }

    return *report;
}

} // namespace Relink
