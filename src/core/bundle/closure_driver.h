#pragma once
#include "binary.h"
#include "bundle_report.h"
#include "dependency_reader.h"
#include "reference_rewriter.h"
#include "vendoring_registry.h"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Relink {

class ThreadPool;

enum class DriverState {
    Idle,
    Scanning,
    Draining,
    Done
};

const char* driver_state_name(DriverState state);

// Worklist fixed point over the bundle: scan binaries, vendor what they
// reference, rewrite them, then scan whatever was newly vendored. Stops when
// a pass copies nothing new, then re-reads every touched binary to confirm no
// non-portable reference is left.
class ClosureDriver {
public:
    ClosureDriver(VendoringRegistry& registry, BundleReport& report);

    void set_thread_count(size_t count) { thread_count = count; }
    void set_resolve_rpaths(bool value) { resolve_rpaths = value; }
    void set_executable_path(const std::string& path) { executable_path = path; }
    void add_search_path(const std::string& dir) { extra_search_paths.push_back(dir); }
    void set_verbose(bool value) { verbose = value; }

    // Seed the worklist. Duplicates are ignored; order is kept.
    void add_root(const std::string& path);

    // Record a binary modified outside the driver
    void mark_touched(const std::string& path);

    // Run to Done. Per-binary problems end up in the report.
    void run();

    DriverState get_state() const { return state; }
    size_t pass_count() const { return passes; }

    // Sorted
    std::vector<std::string> touched_binaries() const;

    // Ordered list of places a reference may be found, for one consumer
    std::vector<std::string> candidate_sources(const DependencyReference& reference,
                                               const DependencyInfo& consumer_info) const;

private:
    struct ScanResult {
        std::string path;
        bool is_image = false;
        bool ok = false;
        DependencyInfo info;
        std::string error;
    };

    struct PlannedReference {
        std::string raw_path;
        std::string basename;
    };

    struct VendorPlan {
        std::string basename;
        std::vector<std::pair<std::string, std::vector<std::string>>> attempts;   // consumer, candidates
        std::vector<std::pair<std::string, std::string>> consumers;              // consumer, raw path
    };

    VendoringRegistry& registry;
    BundleReport& report;
    FileLockTable file_locks;

    DriverState state = DriverState::Idle;
    size_t passes = 0;
    size_t thread_count = 0;
    bool resolve_rpaths = false;
    bool verbose = false;
    std::string executable_path;
    std::vector<std::string> extra_search_paths;

    std::vector<std::string> roots;
    std::set<std::string> root_set;
    std::set<std::string> scanned;
    std::set<std::string> touched;
    std::set<std::pair<std::string, std::string>> diagnosed;   // consumer, raw path

    std::vector<ScanResult> scan(ThreadPool& pool, const std::vector<std::string>& worklist);
    std::vector<std::string> run_pass(ThreadPool& pool, const std::vector<std::string>& worklist);
    void drain();
    void enter(DriverState next);

    std::vector<std::string> expand_rpath(const std::string& raw_path, const std::string& consumer,
                                          const std::vector<std::string>& rpaths) const;
    std::string substitute_loader_tokens(const std::string& value, const std::string& consumer) const;
    size_t worker_count() const;
};

} // namespace Relink
