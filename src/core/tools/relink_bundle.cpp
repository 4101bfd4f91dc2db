#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include "core/bundle/bundle_relinker.h"

using namespace Relink;

static void print_usage(const char* prog) {
  std::printf("Usage: %s <staging-dir> [options]\n", prog);
  std::printf("\n");
  std::printf("Vendors every non-system dynamic library reachable from the staged binaries into\n");
  std::printf("the library directory and rewrites references to @loader_path.\n");
  std::printf("\n");
  std::printf("Options:\n");
  std::printf("  --lib-dir <path>           library directory (default Contents/Frameworks)\n");
  std::printf("  --executable <path>        main executable\n");
  std::printf("  --interpreter <path>       bundled interpreter executable\n");
  std::printf("  --package-dir <path>       directory scanned for extension modules (repeatable)\n");
  std::printf("  --venv-interpreter <path>  venv interpreter link to replace with the bundled one\n");
  std::printf("  --threads <n>              worker threads (default: hardware concurrency)\n");
  std::printf("  --no-sign                  do not re-sign touched binaries\n");
  std::printf("  --sign-identity <id>       signing identity (default '-', ad-hoc)\n");
  std::printf("  --codesign <tool>          signing tool (default codesign)\n");
  std::printf("  --resolve-rpaths           also resolve @rpath references through LC_RPATH\n");
  std::printf("  --search-path <dir>        extra directory to look for libraries in (repeatable)\n");
  std::printf("  -v, --verbose              print progress\n");
  std::printf("  -q, --quiet                suppress warnings\n");
  std::printf("  -h, --help                 show this help\n");
  std::printf("\n");
  std::printf("Paths are relative to <staging-dir> unless absolute. Exit status: 0 clean,\n");
  std::printf("1 finished with runtime risks, 2 usage error, 3 staging directory error.\n");
}

int main(int argc, char** argv) {
  BundleOptions options;
  bool have_root = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&](std::string& out) -> bool {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "error: %s requires a value\n", arg.c_str());
        return false;
      }
      out = argv[++i];
      return true;
    };
    std::string v;

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--lib-dir") {
      if (!value(options.lib_dir)) return 2;
    } else if (arg == "--executable") {
      if (!value(options.main_executable)) return 2;
    } else if (arg == "--interpreter") {
      if (!value(options.interpreter_executable)) return 2;
    } else if (arg == "--package-dir") {
      if (!value(v)) return 2;
      options.package_dirs.push_back(v);
    } else if (arg == "--venv-interpreter") {
      if (!value(options.venv_interpreter)) return 2;
    } else if (arg == "--threads") {
      if (!value(v)) return 2;
      char* end = nullptr;
      unsigned long n = std::strtoul(v.c_str(), &end, 10);
      if (v.empty() || *end != '\0') {
        std::fprintf(stderr, "error: invalid thread count '%s'\n", v.c_str());
        return 2;
      }
      options.thread_count = (size_t)n;
    } else if (arg == "--no-sign") {
      options.sign = false;
    } else if (arg == "--sign-identity") {
      if (!value(options.sign_identity)) return 2;
    } else if (arg == "--codesign") {
      if (!value(options.codesign_tool)) return 2;
    } else if (arg == "--resolve-rpaths") {
      options.resolve_rpaths = true;
    } else if (arg == "--search-path") {
      if (!value(v)) return 2;
      options.extra_search_paths.push_back(v);
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "-q" || arg == "--quiet") {
      options.quiet = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::fprintf(stderr, "error: unknown option %s\n", arg.c_str());
      print_usage(argv[0]);
      return 2;
    } else if (!have_root) {
      options.staging_root = arg;
      have_root = true;
    } else {
      std::fprintf(stderr, "error: unexpected argument %s\n", arg.c_str());
      return 2;
    }
  }

  if (!have_root) {
    print_usage(argv[0]);
    return 2;
  }

  BundleRelinker relinker(options);
  try {
    const BundleReport& report = relinker.run();
    if (options.verbose || report.has_runtime_risks()) {
      report.print(std::cout);
    }
    if (report.has_runtime_risks()) {
      std::fprintf(stderr, "Bundle may fail to load on other machines, see diagnostics above\n");
      return 1;
    }
  } catch (const StagingError& e) {
    std::fprintf(stderr, "error: %s\n", e.what());
    return 3;
  }
  return 0;
}
