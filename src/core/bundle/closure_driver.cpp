#include "closure_driver.h"
#include "dependency_classifier.h"
#include "../tools/thread_pool.h"
#include <algorithm>
#include <filesystem>
#include <future>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace Relink {

static const char RPATH_PREFIX[] = "@rpath/";
static const char LOADER_PATH_PREFIX[] = "@loader_path/";

static bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

static std::string join_paths(const std::vector<std::string>& paths) {
    std::string joined;
    for (const auto& p : paths) {
        if (!joined.empty()) joined += ", ";
        joined += p;
    }
    return joined;
}

const char* driver_state_name(DriverState state) {
    switch (state) {
        case DriverState::Idle:     return "idle";
        case DriverState::Scanning: return "scanning";
        case DriverState::Draining: return "draining";
        case DriverState::Done:     return "done";
    }
    return "idle";
}

ClosureDriver::ClosureDriver(VendoringRegistry& reg, BundleReport& rep)
    : registry(reg), report(rep) {}

void ClosureDriver::add_root(const std::string& path) {
    if (root_set.insert(path).second) {
        roots.push_back(path);
    }
}

void ClosureDriver::mark_touched(const std::string& path) {
    touched.insert(path);
}

std::vector<std::string> ClosureDriver::touched_binaries() const {
    return std::vector<std::string>(touched.begin(), touched.end());
}

size_t ClosureDriver::worker_count() const {
    size_t n = thread_count != 0 ? thread_count : std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

void ClosureDriver::run() {
    if (state != DriverState::Idle) {
        return;
    }

    ThreadPool pool(worker_count());

    enter(DriverState::Scanning);
    std::vector<std::string> worklist = roots;
    while (!worklist.empty()) {
        ++passes;
        worklist = run_pass(pool, worklist);
    }

    enter(DriverState::Draining);
    drain();
    enter(DriverState::Done);

    if (verbose) {
        std::cout << "Closure complete after " << passes << " pass(es), "
                  << touched.size() << " binaries touched" << std::endl;
    }
}

void ClosureDriver::enter(DriverState next) {
    if (verbose) {
        std::cout << "Closure driver: " << driver_state_name(state) << " -> " << driver_state_name(next) << std::endl;
    }
    state = next;
}

std::vector<ClosureDriver::ScanResult> ClosureDriver::scan(ThreadPool& pool, const std::vector<std::string>& worklist) {
    std::vector<std::string> pending;
    for (const auto& path : worklist) {
        if (scanned.insert(path).second) {
            pending.push_back(path);
        }
    }

    std::vector<std::future<ScanResult>> futures;
    futures.reserve(pending.size());
    for (const auto& path : pending) {
        futures.push_back(pool.submit([path]() {
            ScanResult result;
            result.path = path;
            if (MachOReader::classify(path) == BinaryRole::NotMachO) {
                return result;
            }
            result.is_image = true;
            DependencyReader reader;
            result.ok = reader.read_dependencies(path, result.info);
            if (!result.ok) {
                result.error = reader.get_error();
            }
            return result;
        }));
    }

    std::vector<ScanResult> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

std::vector<std::string> ClosureDriver::run_pass(ThreadPool& pool, const std::vector<std::string>& worklist) {
    std::vector<ScanResult> results = scan(pool, worklist);
    if (verbose) {
        std::cout << "Pass " << passes << ": scanning " << results.size() << " file(s)" << std::endl;
    }

    // Plan in worklist order so the first consumer of a basename decides where it comes from
    std::vector<std::string> order;
    std::map<std::string, VendorPlan> plans;
    std::vector<std::pair<const ScanResult*, std::vector<PlannedReference>>> consumers;

    for (const auto& result : results) {
        if (!result.is_image) {
            continue;
        }
        if (!result.ok) {
            report.add(DiagnosticKind::CorruptBinary, result.path, std::string(), result.error);
            continue;
        }
        if (verbose) {
            std::cout << "  " << result.path << " [" << role_name(result.info.role) << "]" << std::endl;
        }

        std::vector<PlannedReference> planned;
        for (const auto& reference : result.info.references) {
            if (DependencyClassifier::classify_reference(reference.raw_path) != DependencyClass::Vendorable) {
                continue;
            }
            const std::string basename = DependencyClassifier::basename_of(reference.raw_path);
            if (basename.empty()) {
                report.add(DiagnosticKind::UnresolvedDependency, result.path, reference.raw_path,
                           "reference has no file name");
                diagnosed.insert(std::make_pair(result.path, reference.raw_path));
                continue;
            }

            auto it = plans.find(basename);
            if (it == plans.end()) {
                order.push_back(basename);
                VendorPlan plan;
                plan.basename = basename;
                it = plans.emplace(basename, plan).first;
            }
            VendorPlan& plan = it->second;
            std::vector<std::string> candidates = candidate_sources(reference, result.info);
            bool known = std::any_of(plan.attempts.begin(), plan.attempts.end(),
                                     [&](const std::pair<std::string, std::vector<std::string>>& attempt) {
                                         return attempt.second == candidates;
                                     });
            if (!known) {
                plan.attempts.emplace_back(result.path, candidates);
            }
            plan.consumers.emplace_back(result.path, reference.raw_path);
            planned.push_back(PlannedReference{reference.raw_path, basename});
        }
        consumers.emplace_back(&result, planned);
    }

    // Vendor: one task per basename; later consumers' candidates are fallbacks
    std::vector<std::future<std::pair<VendoredEntry, bool>>> vendor_futures;
    vendor_futures.reserve(order.size());
    for (const auto& basename : order) {
        const VendorPlan* plan = &plans.at(basename);
        vendor_futures.push_back(pool.submit([this, plan]() {
            VendoredEntry entry;
            bool newly_copied = false;
            for (const auto& attempt : plan->attempts) {
                entry = registry.vendor(plan->basename, attempt.second, &newly_copied);
                if (entry.state != VendorState::Unresolved) {
                    break;
                }
            }
            return std::make_pair(entry, newly_copied);
        }));
    }

    std::map<std::string, VendoredEntry> outcomes;
    std::vector<std::string> next;
    for (size_t i = 0; i < order.size(); ++i) {
        std::pair<VendoredEntry, bool> outcome = vendor_futures[i].get();
        const VendoredEntry& entry = outcome.first;
        const VendorPlan& plan = plans.at(order[i]);
        outcomes[order[i]] = entry;

        if (entry.state == VendorState::Copied) {
            if (!outcome.second) {
                continue;
            }
            if (verbose) {
                std::cout << "  vendored " << entry.basename << " from " << entry.resolved_source_path << std::endl;
            }
            // An overwritten file must be scanned again; an in-place one was already handled
            if (entry.in_place && scanned.count(entry.destination_path)) {
                continue;
            }
            scanned.erase(entry.destination_path);
            next.push_back(entry.destination_path);
            continue;
        }

        std::string detail;
        DiagnosticKind kind = DiagnosticKind::UnresolvedDependency;
        if (entry.state == VendorState::CopyFailed) {
            kind = DiagnosticKind::CopyFailed;
            detail = entry.error;
        } else {
            std::vector<std::string> searched;
            for (const auto& attempt : plan.attempts) {
                searched.insert(searched.end(), attempt.second.begin(), attempt.second.end());
            }
            detail = "searched: " + join_paths(searched);
        }
        for (const auto& consumer : plan.consumers) {
            if (diagnosed.insert(consumer).second) {
                report.add(kind, consumer.first, consumer.second, detail);
            }
        }
    }

    // Rewrite: one task per consumer, each holding that file's lock
    std::vector<std::future<RewriteOutcome>> rewrite_futures;
    std::vector<std::string> rewritten;
    for (const auto& consumer : consumers) {
        const ScanResult& result = *consumer.first;

        std::vector<ReferenceChange> changes;
        for (const auto& ref : consumer.second) {
            const VendoredEntry& entry = outcomes.at(ref.basename);
            if (entry.state != VendorState::Copied) {
                continue;
            }
            changes.push_back(ReferenceChange{
                ref.raw_path, ReferenceRewriter::loader_relative_path(result.path, entry.destination_path)});
        }

        std::string new_identity;
        if (result.info.role == BinaryRole::SharedLibrary && !result.info.identity.empty() &&
            DependencyClassifier::classify_reference(result.info.identity) != DependencyClass::AlreadyRelative) {
            new_identity = ReferenceRewriter::identity_for(result.path);
        }

        if (changes.empty() && new_identity.empty()) {
            continue;
        }
        const std::string path = result.path;
        rewritten.push_back(path);
        rewrite_futures.push_back(pool.submit([this, path, changes, new_identity]() {
            ReferenceRewriter rewriter(file_locks);
            return rewriter.apply(path, changes, new_identity);
        }));
    }

    for (size_t i = 0; i < rewrite_futures.size(); ++i) {
        RewriteOutcome outcome = rewrite_futures[i].get();
        const std::string& path = rewritten[i];
        if (outcome.modified) {
            touched.insert(path);
            if (verbose) {
                std::cout << "  rewrote " << path << std::endl;
            }
        }
        for (const auto& failure : outcome.failures) {
            if (failure.reference.empty()) {
                report.add(DiagnosticKind::RewriteFailed, path, std::string(), "identity: " + failure.detail);
                continue;
            }
            diagnosed.insert(std::make_pair(path, failure.reference));
            report.add(DiagnosticKind::RewriteFailed, path, failure.reference, failure.detail);
        }
    }

    std::sort(next.begin(), next.end());
    next.erase(std::unique(next.begin(), next.end()), next.end());
    return next;
}

void ClosureDriver::drain() {
    for (const auto& path : touched) {
        DependencyReader reader;
        DependencyInfo info;
        if (!reader.read_dependencies(path, info)) {
            report.add(DiagnosticKind::CorruptBinary, path, std::string(),
                       "unreadable after rewrite: " + reader.get_error());
            continue;
        }

        const fs::path consumer_dir = fs::path(path).parent_path();
        for (const auto& reference : info.references) {
            if (diagnosed.count(std::make_pair(path, reference.raw_path))) {
                continue;
            }
            DependencyClass cls = DependencyClassifier::classify_reference(reference.raw_path);
            if (cls == DependencyClass::Vendorable) {
                diagnosed.insert(std::make_pair(path, reference.raw_path));
                report.add(DiagnosticKind::LeftoverReference, path, reference.raw_path,
                           std::string("non-portable ") + dependency_kind_name(reference.kind) + " reference remains");
                continue;
            }
            if (cls == DependencyClass::AlreadyRelative && starts_with(reference.raw_path, LOADER_PATH_PREFIX)) {
                const fs::path target = consumer_dir / reference.raw_path.substr(sizeof(LOADER_PATH_PREFIX) - 1);
                std::error_code ec;
                if (!fs::exists(target, ec)) {
                    diagnosed.insert(std::make_pair(path, reference.raw_path));
                    report.add(DiagnosticKind::LeftoverReference, path, reference.raw_path,
                               std::string(dependency_kind_name(reference.kind)) + " reference target " +
                                   target.lexically_normal().string() + " does not exist");
                }
            }
        }
    }
}

std::vector<std::string> ClosureDriver::candidate_sources(const DependencyReference& reference,
                                                          const DependencyInfo& consumer_info) const {
    std::vector<std::string> candidates;
    auto push = [&](const std::string& candidate) {
        if (!candidate.empty() && std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
            candidates.push_back(candidate);
        }
    };

    const std::string& raw = reference.raw_path;
    const std::string basename = DependencyClassifier::basename_of(raw);
    const fs::path consumer_dir = fs::path(reference.consumer).parent_path();

    if (!raw.empty() && raw[0] == '/') {
        push(raw);
    }
    push((consumer_dir / ".private-libs" / basename).string());
    push((consumer_dir / ".." / ".private-libs" / basename).string());

    if (resolve_rpaths && starts_with(raw, RPATH_PREFIX)) {
        for (const auto& expanded : expand_rpath(raw, reference.consumer, consumer_info.rpaths)) {
            push(expanded);
        }
    }
    for (const auto& dir : extra_search_paths) {
        push((fs::path(dir) / basename).string());
    }
    return candidates;
}

std::vector<std::string> ClosureDriver::expand_rpath(const std::string& raw_path, const std::string& consumer,
                                                     const std::vector<std::string>& rpaths) const {
    std::vector<std::string> expanded;
    const std::string rest = raw_path.substr(sizeof(RPATH_PREFIX) - 1);
    for (const auto& rpath : rpaths) {
        std::string dir = substitute_loader_tokens(rpath, consumer);
        // Relative run paths depend on the launch directory; skip them
        if (dir.empty() || dir[0] != '/') {
            continue;
        }
        expanded.push_back((fs::path(dir) / rest).string());
    }
    return expanded;
}

std::string ClosureDriver::substitute_loader_tokens(const std::string& value, const std::string& consumer) const {
    static const std::string loader_token = "@loader_path";
    static const std::string executable_token = "@executable_path";

    if (starts_with(value, loader_token)) {
        return fs::path(consumer).parent_path().string() + value.substr(loader_token.size());
    }
    if (starts_with(value, executable_token)) {
        if (executable_path.empty()) {
            return std::string();
        }
        return fs::path(executable_path).parent_path().string() + value.substr(executable_token.size());
    }
    return value;
}

} // namespace Relink
