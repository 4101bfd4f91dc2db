#include "test_fixtures.h"
#include "core/bundle/bundle_report.h"
#include "core/bundle/reference_rewriter.h"
#include "core/bundle/vendoring_registry.h"
#include "core/macho/load_command_editor.h"
#include "core/tools/thread_pool.h"
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstring>
#include <sstream>
#include <thread>

using namespace Relink;

// ==================== BINARY CLASSIFIER TESTS ====================

TEST(BinaryClassifier, RecognizesImageTypes) {
    TempDir dir;
    const std::string exe = dir.file("app");
    const std::string lib = dir.file("libfoo.dylib");
    const std::string module = dir.file("mod.so");
    ASSERT_TRUE(TestUtils::write_executable(exe, {}));
    ASSERT_TRUE(TestUtils::write_dylib(lib, "/opt/lib/libfoo.dylib", {}));
    ASSERT_TRUE(TestUtils::write_module(module, {}));

    EXPECT_EQ(MachOReader::classify(exe), BinaryRole::Executable);
    EXPECT_EQ(MachOReader::classify(lib), BinaryRole::SharedLibrary);
    EXPECT_EQ(MachOReader::classify(module), BinaryRole::ExtensionModule);
}

TEST(BinaryClassifier, NonMachOFilesAreSkipped) {
    TempDir dir;
    const std::string text = dir.file("README.txt");
    const std::string empty = dir.file("empty");
    const std::string tiny = dir.file("tiny");
    ASSERT_TRUE(TestUtils::write_text(text, "This is not a binary\n"));
    ASSERT_TRUE(TestUtils::write_text(empty, ""));
    ASSERT_TRUE(TestUtils::write_text(tiny, "\xCF\xFA\xED"));

    EXPECT_EQ(MachOReader::classify(text), BinaryRole::NotMachO);
    EXPECT_EQ(MachOReader::classify(empty), BinaryRole::NotMachO);
    EXPECT_EQ(MachOReader::classify(tiny), BinaryRole::NotMachO);
    EXPECT_EQ(MachOReader::classify(dir.path() + "/missing"), BinaryRole::NotMachO);
    EXPECT_EQ(MachOReader::classify(dir.path()), BinaryRole::NotMachO) << "directories are not binaries";
}

TEST(BinaryClassifier, ObjectFilesAreNotLoadable) {
    TempDir dir;
    const std::string obj = dir.file("main.o");
    MachOImageBuilder object(MH_OBJECT);
    ASSERT_TRUE(object.write(obj));
    EXPECT_EQ(MachOReader::classify(obj), BinaryRole::NotMachO);
}

TEST(BinaryClassifier, JavaClassFileIsNotFat) {
    // Same magic as a fat header; the "count" is the class file version
    std::vector<uint8_t> bytes = {0xCA, 0xFE, 0xBA, 0xBE, 0x00, 0x00, 0x00, 0x34};
    bytes.resize(128, 0);
    EXPECT_EQ(MachOReader::classify(bytes), BinaryRole::NotMachO);

    TempDir dir;
    const std::string path = dir.file("Main.class");
    ASSERT_TRUE(MachOImageBuilder::write_bytes(path, bytes));
    EXPECT_EQ(MachOReader::classify(path), BinaryRole::NotMachO);
}

TEST(BinaryClassifier, FatFileUsesFirstSlice) {
    TempDir dir;
    const std::string path = dir.file("fat.so");
    MachOImageBuilder first(MH_BUNDLE, MachOArch::ARM64);
    MachOImageBuilder second(MH_DYLIB, MachOArch::X86_64);
    second.set_identity("/opt/lib/fat.dylib");
    ASSERT_TRUE(MachOImageBuilder::write_fat(path, {first, second}));
    EXPECT_EQ(MachOReader::classify(path), BinaryRole::ExtensionModule);
}

TEST(BinaryClassifier, BigEndianSlice) {
    TempDir dir;
    const std::string path = dir.file("ppc_app");
    MachOImageBuilder exe(MH_EXECUTE, MachOArch::PPC);
    ASSERT_TRUE(exe.write(path));
    EXPECT_EQ(MachOReader::classify(path), BinaryRole::Executable);
}

// ==================== DEPENDENCY READER TESTS ====================

TEST(DependencyReader, ReadsIdentityDependenciesAndRpaths) {
    TempDir dir;
    const std::string path = dir.file("libfoo.1.dylib");
    MachOImageBuilder lib(MH_DYLIB);
    lib.set_identity("/opt/local/lib/libfoo.1.dylib");
    lib.add_dependency("/usr/lib/libSystem.B.dylib");
    lib.add_dependency("/opt/local/lib/libz.1.dylib", LC_LOAD_WEAK_DYLIB);
    lib.add_dependency("@rpath/libbar.dylib", LC_REEXPORT_DYLIB);
    lib.add_dependency("/opt/local/lib/liblazy.dylib", LC_LAZY_LOAD_DYLIB);
    lib.add_dependency("/opt/local/lib/libup.dylib", LC_LOAD_UPWARD_DYLIB);
    lib.add_rpath("@loader_path/../lib");
    ASSERT_TRUE(lib.write(path));

    DependencyReader reader;
    DependencyInfo info;
    ASSERT_TRUE(reader.read_dependencies(path, info)) << reader.get_error();

    EXPECT_EQ(info.role, BinaryRole::SharedLibrary);
    EXPECT_EQ(info.identity, "/opt/local/lib/libfoo.1.dylib");
    ASSERT_EQ(info.references.size(), 5u);
    EXPECT_EQ(info.references[0].raw_path, "/usr/lib/libSystem.B.dylib");
    EXPECT_EQ(info.references[0].kind, DependencyKind::Load);
    EXPECT_EQ(info.references[1].raw_path, "/opt/local/lib/libz.1.dylib");
    EXPECT_EQ(info.references[1].kind, DependencyKind::Weak);
    EXPECT_EQ(info.references[2].raw_path, "@rpath/libbar.dylib");
    EXPECT_EQ(info.references[2].kind, DependencyKind::Reexport);
    EXPECT_EQ(info.references[3].kind, DependencyKind::Lazy);
    EXPECT_EQ(info.references[4].kind, DependencyKind::Upward);
    EXPECT_EQ(info.references[0].consumer, path);
    ASSERT_EQ(info.rpaths.size(), 1u);
    EXPECT_EQ(info.rpaths[0], "@loader_path/../lib");
}

TEST(DependencyReader, ReadsBigEndian32BitSlices) {
    TempDir dir;
    const std::string path = dir.file("libppc.dylib");
    MachOImageBuilder lib(MH_DYLIB, MachOArch::PPC);
    lib.set_identity("/usr/local/lib/libppc.dylib");
    lib.add_dependency("/usr/local/lib/libdep.dylib");
    ASSERT_TRUE(lib.write(path));

    MachOReader reader;
    MachOFile file;
    ASSERT_TRUE(reader.read(path, file)) << reader.get_error();
    ASSERT_EQ(file.slices.size(), 1u);
    EXPECT_FALSE(file.slices[0].is_64);
    EXPECT_EQ(file.slices[0].swapped, host_is_little_endian());
    EXPECT_EQ(file.slices[0].cputype, CPU_TYPE_POWERPC);

    EXPECT_EQ(TestUtils::identity(path), "/usr/local/lib/libppc.dylib");
    EXPECT_EQ(TestUtils::dependencies(path), std::vector<std::string>{"/usr/local/lib/libdep.dylib"});
}

TEST(DependencyReader, ReadsLittleEndian32BitSlices) {
    TempDir dir;
    const std::string path = dir.file("app32");
    MachOImageBuilder exe(MH_EXECUTE, MachOArch::I386);
    exe.add_dependency("/opt/lib/libi386.dylib");
    ASSERT_TRUE(exe.write(path));

    MachOReader reader;
    MachOFile file;
    ASSERT_TRUE(reader.read(path, file)) << reader.get_error();
    EXPECT_FALSE(file.slices[0].is_64);
    EXPECT_EQ(file.role(), BinaryRole::Executable);
    EXPECT_EQ(TestUtils::dependencies(path), std::vector<std::string>{"/opt/lib/libi386.dylib"});
}

TEST(DependencyReader, MergesFatSlicesInFirstSeenOrder) {
    for (bool fat64 : {false, true}) {
        TempDir dir;
        const std::string path = dir.file("libfat.dylib");
        MachOImageBuilder arm(MH_DYLIB, MachOArch::ARM64);
        arm.set_identity("/opt/lib/libfat.dylib");
        arm.add_dependency("/opt/lib/libA.dylib");
        arm.add_dependency("/opt/lib/libB.dylib");
        MachOImageBuilder intel(MH_DYLIB, MachOArch::X86_64);
        intel.set_identity("/opt/lib/libfat.dylib");
        intel.add_dependency("/opt/lib/libB.dylib");
        intel.add_dependency("/opt/lib/libC.dylib");
        ASSERT_TRUE(MachOImageBuilder::write_fat(path, {arm, intel}, fat64));

        MachOReader reader;
        MachOFile file;
        ASSERT_TRUE(reader.read(path, file)) << reader.get_error();
        EXPECT_TRUE(file.is_fat);
        ASSERT_EQ(file.slices.size(), 2u);
        EXPECT_EQ(file.slices[1].file_offset % 0x1000, 0u);

        std::vector<std::string> expected = {"/opt/lib/libA.dylib", "/opt/lib/libB.dylib", "/opt/lib/libC.dylib"};
        EXPECT_EQ(TestUtils::dependencies(path), expected) << "fat64=" << fat64;
    }
}

TEST(DependencyReader, LoadCommandLimitIsFirstSectionOffset) {
    TempDir dir;
    const std::string path = dir.file("libpad.dylib");
    ASSERT_TRUE(TestUtils::write_dylib(path, "/opt/lib/libpad.dylib", {"/opt/lib/libq.dylib"}, 512));

    MachOReader reader;
    MachOFile file;
    ASSERT_TRUE(reader.read(path, file)) << reader.get_error();
    const MachOSlice& slice = file.slices[0];
    EXPECT_GE(slice.load_command_limit, slice.load_commands_end() + 512);
    EXPECT_EQ(slice.load_command_limit % 16, 0u);
    EXPECT_LT(slice.load_command_limit, slice.size);
}

TEST(DependencyReader, RejectsCorruptLoadCommands) {
    MachOImageBuilder lib(MH_DYLIB);
    lib.set_identity("/opt/lib/libbad.dylib");
    lib.add_dependency("/opt/lib/libdep.dylib");
    const std::vector<uint8_t> good = lib.build();

    MachOReader reader;
    MachOFile file;
    ASSERT_TRUE(reader.parse(good, file)) << reader.get_error();
    const MachOSlice slice = file.slices[0];
    const PathLoadCommand dep = slice.dylibs[1];
    const bool sw = slice.swapped;

    auto expect_corrupt = [&](std::vector<uint8_t> bytes, const char* what) {
        MachOReader r;
        MachOFile f;
        EXPECT_FALSE(r.parse(bytes, f)) << what;
        EXPECT_FALSE(r.get_error().empty()) << what;
    };

    {
        std::vector<uint8_t> bytes = good;
        store_u32(bytes.data() + offsetof(MachHeader, sizeofcmds), 0x00FFFFFF, sw);
        expect_corrupt(bytes, "sizeofcmds beyond file");
    }
    {
        std::vector<uint8_t> bytes = good;
        store_u32(bytes.data() + slice.header_size + offsetof(LoadCommand, cmdsize), 4, sw);
        expect_corrupt(bytes, "cmdsize too small");
    }
    {
        std::vector<uint8_t> bytes = good;
        store_u32(bytes.data() + dep.offset + offsetof(DylibCommand, name_offset), dep.cmdsize + 8, sw);
        expect_corrupt(bytes, "string offset outside command");
    }
    {
        std::vector<uint8_t> bytes = good;
        std::memset(bytes.data() + dep.offset + dep.string_offset, 'A', dep.cmdsize - dep.string_offset);
        expect_corrupt(bytes, "unterminated string");
    }
    {
        std::vector<uint8_t> bytes = good;
        bytes.resize(40);
        expect_corrupt(bytes, "truncated file");
    }
    {
        std::vector<uint8_t> bytes = good;
        bytes[0] = 0;
        expect_corrupt(bytes, "bad magic");
    }
}

TEST(DependencyReader, TruncatedBinaryStillClassifiesButFailsToRead) {
    TempDir dir;
    const std::string path = dir.file("libcut.dylib");
    MachOImageBuilder lib(MH_DYLIB);
    lib.set_identity("/opt/lib/libcut.dylib");
    std::vector<uint8_t> bytes = lib.build();
    bytes.resize(48);
    ASSERT_TRUE(MachOImageBuilder::write_bytes(path, bytes));

    EXPECT_EQ(MachOReader::classify(path), BinaryRole::SharedLibrary);
    DependencyReader reader;
    DependencyInfo info;
    EXPECT_FALSE(reader.read_dependencies(path, info));
    EXPECT_FALSE(reader.get_error().empty());
}

// ==================== DEPENDENCY CLASSIFIER TESTS ====================

TEST(DependencyClassifier, SystemPrefixes) {
    EXPECT_EQ(DependencyClassifier::classify_reference("/usr/lib/libSystem.B.dylib"), DependencyClass::System);
    EXPECT_EQ(DependencyClassifier::classify_reference("/usr/lib/swift/libswiftCore.dylib"), DependencyClass::System);
    EXPECT_EQ(DependencyClassifier::classify_reference(
                  "/System/Library/Frameworks/CoreFoundation.framework/Versions/A/CoreFoundation"),
              DependencyClass::System);
    EXPECT_EQ(DependencyClassifier::classify_reference(
                  "/System/Volumes/Preboot/Cryptexes/OS/usr/lib/libfoo.dylib"),
              DependencyClass::System);
}

TEST(DependencyClassifier, RelativePrefixes) {
    EXPECT_EQ(DependencyClassifier::classify_reference("@loader_path/libfoo.dylib"), DependencyClass::AlreadyRelative);
    EXPECT_EQ(DependencyClassifier::classify_reference("@loader_path/../Frameworks/libfoo.dylib"),
              DependencyClass::AlreadyRelative);
    EXPECT_EQ(DependencyClassifier::classify_reference("@executable_path/../Frameworks/libfoo.dylib"),
              DependencyClass::AlreadyRelative);
}

TEST(DependencyClassifier, EverythingElseIsVendorable) {
    const char* vendorable[] = {
        "@rpath/libfoo.dylib",
        "libz.dylib",
        "/opt/homebrew/lib/libz.1.dylib",
        "/usr/local/lib/libpng16.16.dylib",
        "/usr/lib",                  // no trailing slash
        "/System/Library",
        "@loader_pathx/libfoo.dylib",
        "",
    };
    for (const char* path : vendorable) {
        EXPECT_EQ(DependencyClassifier::classify_reference(path), DependencyClass::Vendorable) << path;
    }
}

TEST(DependencyClassifier, BasenameOf) {
    EXPECT_EQ(DependencyClassifier::basename_of("/opt/homebrew/lib/libz.1.dylib"), "libz.1.dylib");
    EXPECT_EQ(DependencyClassifier::basename_of("@rpath/libfoo.dylib"), "libfoo.dylib");
    EXPECT_EQ(DependencyClassifier::basename_of("libbare.dylib"), "libbare.dylib");
    EXPECT_EQ(DependencyClassifier::basename_of("/trailing/"), "");
}

// ==================== VENDORING REGISTRY TESTS ====================

TEST(VendoringRegistry, CopiesFirstExistingCandidate) {
    TempDir dir;
    const std::string first = dir.file("a/libfoo.dylib");
    const std::string second = dir.file("b/libfoo.dylib");
    ASSERT_TRUE(TestUtils::write_text(second, "second"));
    ASSERT_TRUE(TestUtils::write_text(dir.file("c/libfoo.dylib"), "third"));

    VendoringRegistry registry(dir.path() + "/Frameworks");
    bool newly = false;
    VendoredEntry entry = registry.vendor("libfoo.dylib", {first, second, dir.path() + "/c/libfoo.dylib"}, &newly);

    EXPECT_TRUE(newly);
    EXPECT_EQ(entry.state, VendorState::Copied);
    EXPECT_TRUE(entry.copied);
    EXPECT_EQ(entry.resolved_source_path, second);
    EXPECT_EQ(entry.destination_path, dir.path() + "/Frameworks/libfoo.dylib");
    EXPECT_EQ(TestUtils::read_bytes(entry.destination_path), TestUtils::read_bytes(second));
}

TEST(VendoringRegistry, UnresolvedWhenNothingExists) {
    TempDir dir;
    VendoringRegistry registry(dir.path() + "/Frameworks");
    bool newly = true;
    VendoredEntry entry = registry.vendor("libmissing.dylib", {dir.path() + "/nope/libmissing.dylib"}, &newly);
    EXPECT_FALSE(newly);
    EXPECT_EQ(entry.state, VendorState::Unresolved);
    EXPECT_FALSE(entry.copied);
    EXPECT_FALSE(fs::exists(entry.destination_path));
    ASSERT_EQ(entry.searched.size(), 1u);
}

TEST(VendoringRegistry, CopiedEntryShortCircuits) {
    TempDir dir;
    const std::string source = dir.file("x/libfoo.dylib");
    const std::string other = dir.file("y/libfoo.dylib");
    ASSERT_TRUE(TestUtils::write_text(source, "one"));
    ASSERT_TRUE(TestUtils::write_text(other, "two"));

    VendoringRegistry registry(dir.path() + "/lib");
    bool newly = false;
    registry.vendor("libfoo.dylib", {source}, &newly);
    ASSERT_TRUE(newly);

    VendoredEntry again = registry.vendor("libfoo.dylib", {other}, &newly);
    EXPECT_FALSE(newly);
    EXPECT_EQ(again.resolved_source_path, source);
    EXPECT_EQ(TestUtils::read_bytes(again.destination_path), TestUtils::read_bytes(source));
    EXPECT_EQ(registry.entries().size(), 1u);
}

TEST(VendoringRegistry, UnresolvedCanResolveLater) {
    TempDir dir;
    const std::string source = dir.file("late/libfoo.dylib");
    ASSERT_TRUE(TestUtils::write_text(source, "late"));

    VendoringRegistry registry(dir.path() + "/lib");
    EXPECT_EQ(registry.vendor("libfoo.dylib", {dir.path() + "/early/libfoo.dylib"}).state, VendorState::Unresolved);
    bool newly = false;
    EXPECT_EQ(registry.vendor("libfoo.dylib", {source}, &newly).state, VendorState::Copied);
    EXPECT_TRUE(newly);

    VendoredEntry entry;
    ASSERT_TRUE(registry.lookup("libfoo.dylib", entry));
    EXPECT_EQ(entry.state, VendorState::Copied);
    EXPECT_FALSE(registry.lookup("libother.dylib", entry));
}

TEST(VendoringRegistry, FollowsSymlinks) {
    TempDir dir;
    const std::string real = dir.file("opt/libfoo.1.2.3.dylib");
    ASSERT_TRUE(TestUtils::write_text(real, "payload"));
    const std::string link = dir.path() + "/opt/libfoo.1.dylib";
    fs::create_symlink("libfoo.1.2.3.dylib", link);

    VendoringRegistry registry(dir.path() + "/lib");
    VendoredEntry entry = registry.vendor("libfoo.1.dylib", {link});
    ASSERT_EQ(entry.state, VendorState::Copied);
    EXPECT_EQ(fs::path(entry.destination_path).filename().string(), "libfoo.1.dylib");
    EXPECT_FALSE(fs::is_symlink(fs::symlink_status(entry.destination_path)));
    EXPECT_EQ(TestUtils::read_bytes(entry.destination_path), TestUtils::read_bytes(real));
}

TEST(VendoringRegistry, MakesCopiesWritableAndReplacesStaleFiles) {
    TempDir dir;
    const std::string source = dir.file("src/libro.dylib");
    ASSERT_TRUE(TestUtils::write_text(source, "fresh"));
    fs::permissions(source, fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read);

    const std::string stale = dir.file("lib/libro.dylib");
    ASSERT_TRUE(TestUtils::write_text(stale, "stale content"));
    fs::permissions(stale, fs::perms::owner_read);

    VendoringRegistry registry(dir.path() + "/lib");
    VendoredEntry entry = registry.vendor("libro.dylib", {source});
    ASSERT_EQ(entry.state, VendorState::Copied) << entry.error;
    EXPECT_EQ(TestUtils::read_bytes(entry.destination_path), TestUtils::read_bytes(source));
    fs::perms perms = fs::status(entry.destination_path).permissions();
    EXPECT_NE(perms & fs::perms::owner_write, fs::perms::none);

    fs::permissions(source, fs::perms::owner_all);
}

TEST(VendoringRegistry, ConcurrentCallsCopyOnce) {
    TempDir dir;
    const std::string source = dir.file("src/libshared.dylib");
    ASSERT_TRUE(TestUtils::write_text(source, std::string(64 * 1024, 'x')));

    VendoringRegistry registry(dir.path() + "/lib");
    std::atomic<int> copies{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            bool newly = false;
            VendoredEntry entry = registry.vendor("libshared.dylib", {source}, &newly);
            if (newly) copies.fetch_add(1);
            EXPECT_EQ(entry.state, VendorState::Copied);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(copies.load(), 1);
    EXPECT_EQ(TestUtils::count_files(dir.path() + "/lib"), 1u);
}

// ==================== LOAD COMMAND EDITOR TESTS ====================

TEST(LoadCommandEditor, ShorterNameKeepsCommandSize) {
    TempDir dir;
    const std::string path = dir.file("app");
    const std::string old_name = "/Users/builder/very/long/prefix/that/will/not/exist/lib/libfoo.dylib";
    ASSERT_TRUE(TestUtils::write_executable(path, {old_name, "/usr/lib/libSystem.B.dylib"}));
    const size_t size_before = TestUtils::read_bytes(path).size();

    MachOReader reader;
    MachOFile before;
    ASSERT_TRUE(reader.read(path, before));

    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path)) << editor.get_error();
    ASSERT_TRUE(editor.change_dependency(old_name, "@loader_path/libfoo.dylib")) << editor.get_error();
    EXPECT_TRUE(editor.is_modified());
    ASSERT_TRUE(editor.save()) << editor.get_error();
    EXPECT_FALSE(editor.is_modified());

    MachOFile after;
    ASSERT_TRUE(reader.read(path, after)) << reader.get_error();
    EXPECT_EQ(after.slices[0].sizeofcmds, before.slices[0].sizeofcmds);
    EXPECT_EQ(after.slices[0].dylibs[0].cmdsize, before.slices[0].dylibs[0].cmdsize);
    EXPECT_EQ(after.slices[0].dylibs[0].value, "@loader_path/libfoo.dylib");
    EXPECT_EQ(after.slices[0].dylibs[1].value, "/usr/lib/libSystem.B.dylib");
    EXPECT_EQ(TestUtils::read_bytes(path).size(), size_before);
}

TEST(LoadCommandEditor, LongerNameShiftsFollowingCommands) {
    TempDir dir;
    const std::string path = dir.file("app");
    MachOImageBuilder exe(MH_EXECUTE);
    exe.add_dependency("libfoo.dylib");
    exe.add_dependency("/usr/lib/libSystem.B.dylib");
    exe.add_rpath("@executable_path/../Frameworks");
    ASSERT_TRUE(exe.write(path));

    const std::vector<uint8_t> original = TestUtils::read_bytes(path);
    MachOReader reader;
    MachOFile before;
    ASSERT_TRUE(reader.read(path, before));
    const uint64_t code_offset = before.slices[0].load_command_limit;

    const std::string new_name = "@loader_path/../Frameworks/subdir/libfoo.dylib";
    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    ASSERT_TRUE(editor.change_dependency("libfoo.dylib", new_name)) << editor.get_error();
    ASSERT_TRUE(editor.save()) << editor.get_error();

    MachOFile after;
    ASSERT_TRUE(reader.read(path, after)) << reader.get_error();
    const MachOSlice& slice = after.slices[0];
    EXPECT_GT(slice.sizeofcmds, before.slices[0].sizeofcmds);
    EXPECT_EQ(slice.ncmds, before.slices[0].ncmds);
    ASSERT_EQ(slice.dylibs.size(), 2u);
    EXPECT_EQ(slice.dylibs[0].value, new_name);
    EXPECT_EQ(slice.dylibs[0].cmdsize % 8, 0u);
    EXPECT_EQ(slice.dylibs[1].value, "/usr/lib/libSystem.B.dylib");
    ASSERT_EQ(slice.rpaths.size(), 1u);
    EXPECT_EQ(slice.rpaths[0].value, "@executable_path/../Frameworks");

    // Section data is untouched
    const std::vector<uint8_t> patched = TestUtils::read_bytes(path);
    ASSERT_EQ(patched.size(), original.size());
    EXPECT_TRUE(std::equal(original.begin() + code_offset, original.end(), patched.begin() + code_offset));
}

TEST(LoadCommandEditor, FailsWithoutHeaderPadding) {
    TempDir dir;
    const std::string path = dir.file("app");
    ASSERT_TRUE(TestUtils::write_executable(path, {"libfoo.dylib"}, 0));
    const std::vector<uint8_t> original = TestUtils::read_bytes(path);

    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    EXPECT_FALSE(editor.change_dependency("libfoo.dylib", "@loader_path/../Frameworks/a/much/longer/name/libfoo.dylib"));
    EXPECT_NE(editor.get_error().find("not enough header padding"), std::string::npos) << editor.get_error();
    EXPECT_FALSE(editor.is_modified());
    EXPECT_EQ(editor.get_data(), original);
    ASSERT_TRUE(editor.save());
    EXPECT_EQ(TestUtils::read_bytes(path), original);
}

TEST(LoadCommandEditor, ChangesIdentity) {
    TempDir dir;
    const std::string path = dir.file("libfoo.dylib");
    ASSERT_TRUE(TestUtils::write_dylib(path, "/opt/homebrew/opt/foo/lib/libfoo.dylib", {"/usr/lib/libSystem.B.dylib"}));

    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    ASSERT_TRUE(editor.change_identity("@loader_path/libfoo.dylib")) << editor.get_error();
    ASSERT_TRUE(editor.save());

    EXPECT_EQ(TestUtils::identity(path), "@loader_path/libfoo.dylib");
    EXPECT_EQ(TestUtils::dependencies(path), std::vector<std::string>{"/usr/lib/libSystem.B.dylib"});
}

TEST(LoadCommandEditor, IdentityRequiresIdCommand) {
    TempDir dir;
    const std::string path = dir.file("app");
    ASSERT_TRUE(TestUtils::write_executable(path, {}));
    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    EXPECT_FALSE(editor.change_identity("@loader_path/app"));
    EXPECT_FALSE(editor.is_modified());
}

TEST(LoadCommandEditor, MissingReferenceFails) {
    TempDir dir;
    const std::string path = dir.file("app");
    ASSERT_TRUE(TestUtils::write_executable(path, {"/opt/lib/libfoo.dylib"}));
    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    EXPECT_FALSE(editor.change_dependency("/opt/lib/libbar.dylib", "@loader_path/libbar.dylib"));
    EXPECT_NE(editor.get_error().find("/opt/lib/libbar.dylib"), std::string::npos);

    LoadCommandEditor unloaded;
    EXPECT_FALSE(unloaded.change_dependency("a", "b"));
    EXPECT_FALSE(unloaded.save());
}

TEST(LoadCommandEditor, PatchesEverySliceOfFatFile) {
    TempDir dir;
    const std::string path = dir.file("app");
    MachOImageBuilder arm(MH_EXECUTE, MachOArch::ARM64);
    arm.add_dependency("libfoo.dylib");
    MachOImageBuilder intel(MH_EXECUTE, MachOArch::X86_64);
    intel.add_dependency("/usr/lib/libSystem.B.dylib");
    intel.add_dependency("libfoo.dylib");
    ASSERT_TRUE(MachOImageBuilder::write_fat(path, {arm, intel}));

    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    ASSERT_TRUE(editor.change_dependency("libfoo.dylib", "@loader_path/../Frameworks/libfoo.dylib"));
    ASSERT_TRUE(editor.save());

    MachOReader reader;
    MachOFile file;
    ASSERT_TRUE(reader.read(path, file)) << reader.get_error();
    ASSERT_EQ(file.slices.size(), 2u);
    EXPECT_EQ(file.slices[0].dylibs[0].value, "@loader_path/../Frameworks/libfoo.dylib");
    EXPECT_EQ(file.slices[1].dylibs[0].value, "/usr/lib/libSystem.B.dylib");
    EXPECT_EQ(file.slices[1].dylibs[1].value, "@loader_path/../Frameworks/libfoo.dylib");
}

TEST(LoadCommandEditor, PatchesSwappedSlices) {
    TempDir dir;
    const std::string path = dir.file("libppc.dylib");
    MachOImageBuilder lib(MH_DYLIB, MachOArch::PPC);
    lib.set_identity("libppc.dylib");
    lib.add_dependency("libdep.dylib");
    lib.add_dependency("/usr/lib/libSystem.B.dylib");
    ASSERT_TRUE(lib.write(path));

    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    ASSERT_TRUE(editor.change_dependency("libdep.dylib", "@loader_path/../../Frameworks/libdep.dylib"));
    ASSERT_TRUE(editor.change_identity("@loader_path/libppc.dylib"));
    ASSERT_TRUE(editor.save());

    MachOReader reader;
    MachOFile file;
    ASSERT_TRUE(reader.read(path, file)) << reader.get_error();
    const MachOSlice& slice = file.slices[0];
    EXPECT_EQ(slice.dylibs[1].cmdsize % 4, 0u);
    EXPECT_EQ(TestUtils::identity(path), "@loader_path/libppc.dylib");
    std::vector<std::string> expected = {"@loader_path/../../Frameworks/libdep.dylib", "/usr/lib/libSystem.B.dylib"};
    EXPECT_EQ(TestUtils::dependencies(path), expected);
}

TEST(LoadCommandEditor, SavePreservesPermissions) {
    TempDir dir;
    const std::string path = dir.file("libperm.dylib");
    ASSERT_TRUE(TestUtils::write_dylib(path, "/opt/lib/libperm.dylib", {}));
    const fs::perms mode = fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                           fs::perms::group_read | fs::perms::group_exec;
    fs::permissions(path, mode);

    LoadCommandEditor editor;
    ASSERT_TRUE(editor.load(path));
    ASSERT_TRUE(editor.change_identity("@loader_path/libperm.dylib"));
    ASSERT_TRUE(editor.save());
    EXPECT_EQ(fs::status(path).permissions() & fs::perms::all, mode);
    EXPECT_FALSE(fs::exists(path + ".relink-tmp"));
}

// ==================== REFERENCE REWRITER TESTS ====================

TEST(ReferenceRewriter, LoaderRelativePath) {
    EXPECT_EQ(ReferenceRewriter::loader_relative_path("/b/Contents/MacOS/app", "/b/Contents/Frameworks/libz.dylib"),
              "@loader_path/../Frameworks/libz.dylib");
    EXPECT_EQ(ReferenceRewriter::loader_relative_path("/b/Contents/Frameworks/liba.dylib",
                                                      "/b/Contents/Frameworks/libz.dylib"),
              "@loader_path/libz.dylib");
    EXPECT_EQ(ReferenceRewriter::loader_relative_path(
                  "/b/Contents/Resources/lib/python3.11/site-packages/pkg/mod.so",
                  "/b/Contents/Frameworks/libz.dylib"),
              "@loader_path/../../../../../Frameworks/libz.dylib");
}

TEST(ReferenceRewriter, IdentityFor) {
    EXPECT_EQ(ReferenceRewriter::identity_for("/b/Contents/Frameworks/libz.1.dylib"), "@loader_path/libz.1.dylib");
}

TEST(ReferenceRewriter, RewritesToVendoredCopy) {
    TempDir dir;
    const std::string app = dir.file("Contents/MacOS/app");
    ASSERT_TRUE(TestUtils::write_executable(app, {"/opt/lib/libfoo.dylib"}));

    VendoredEntry entry;
    entry.basename = "libfoo.dylib";
    entry.destination_path = dir.path() + "/Contents/Frameworks/libfoo.dylib";
    entry.state = VendorState::Copied;

    FileLockTable locks;
    ReferenceRewriter rewriter(locks);
    std::string error;
    ASSERT_TRUE(rewriter.rewrite(app, "/opt/lib/libfoo.dylib", entry, error)) << error;
    EXPECT_EQ(TestUtils::dependencies(app), std::vector<std::string>{"@loader_path/../Frameworks/libfoo.dylib"});

    entry.state = VendorState::Unresolved;
    EXPECT_FALSE(rewriter.rewrite(app, "@loader_path/../Frameworks/libfoo.dylib", entry, error));
}

TEST(ReferenceRewriter, ApplyReportsPerReferenceFailures) {
    TempDir dir;
    const std::string app = dir.file("Contents/MacOS/app");
    const std::string long_name = "/Users/builder/somewhere/deep/in/the/build/tree/lib/libfoo.dylib";
    ASSERT_TRUE(TestUtils::write_executable(app, {long_name, "libbar.dylib"}, 0));

    FileLockTable locks;
    ReferenceRewriter rewriter(locks);
    std::vector<ReferenceChange> changes = {
        {long_name, "@loader_path/../Frameworks/libfoo.dylib"},
        {"libbar.dylib", "@loader_path/../Frameworks/libbar.dylib"},
    };
    RewriteOutcome outcome = rewriter.apply(app, changes);
    EXPECT_TRUE(outcome.modified);
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].reference, "libbar.dylib");

    std::vector<std::string> expected = {"@loader_path/../Frameworks/libfoo.dylib", "libbar.dylib"};
    EXPECT_EQ(TestUtils::dependencies(app), expected);
}

TEST(ReferenceRewriter, IdentityRewrite) {
    TempDir dir;
    const std::string lib = dir.file("Contents/Frameworks/libz.1.dylib");
    ASSERT_TRUE(TestUtils::write_dylib(lib, "/opt/homebrew/opt/zlib/lib/libz.1.dylib", {}));
    FileLockTable locks;
    ReferenceRewriter rewriter(locks);
    std::string error;
    ASSERT_TRUE(rewriter.rewrite_identity(lib, error)) << error;
    EXPECT_EQ(TestUtils::identity(lib), "@loader_path/libz.1.dylib");
}

TEST(FileLockTable, SameMutexPerPath) {
    FileLockTable locks;
    EXPECT_EQ(&locks.lock_for("/a"), &locks.lock_for("/a"));
    EXPECT_NE(&locks.lock_for("/a"), &locks.lock_for("/b"));
}

// ==================== THREAD POOL TESTS ====================

TEST(ThreadPool, RunsSubmittedTasks) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.get_thread_count(), 4u);

    std::atomic<int> counter{0};
    std::vector<std::future<int>> results;
    for (int i = 0; i < 100; ++i) {
        results.push_back(pool.submit([&counter](int v) { counter.fetch_add(1); return v * 2; }, i));
    }
    pool.wait_all();
    EXPECT_EQ(counter.load(), 100);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(results[i].get(), i * 2);
    }
    EXPECT_EQ(pool.get_completed_tasks(), 100u);
}

TEST(ThreadPool, PropagatesExceptionsThroughFutures) {
    ThreadPool pool(2);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPool, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
}

// ==================== SIGNATURE FINALIZER TESTS ====================

TEST(CodesignToolSigner, QuotesArguments) {
    EXPECT_EQ(CodesignToolSigner::shell_quote("plain"), "'plain'");
    EXPECT_EQ(CodesignToolSigner::shell_quote("it's here"), "'it'\\''s here'");

    CodesignToolSigner signer("codesign", "-");
    EXPECT_EQ(signer.command_for("/tmp/My App/bin"), "'codesign' --force --sign '-' '/tmp/My App/bin' 2>&1");
}

TEST(CodesignToolSigner, ReportsToolFailure) {
    std::string error;
    CodesignToolSigner failing("false");
    EXPECT_FALSE(failing.sign("/nonexistent", error));
    EXPECT_NE(error.find("false failed"), std::string::npos) << error;

    CodesignToolSigner succeeding("true");
    error.clear();
    EXPECT_TRUE(succeeding.sign("/nonexistent", error)) << error;
}

TEST(SignatureFinalizer, FailuresAreWarnings) {
    BundleReport report;
    report.set_quiet(true);
    RecordingSigner signer;
    signer.failing.insert("/b/two");

    SignatureFinalizer finalizer(&signer, report);
    EXPECT_EQ(finalizer.finalize({"/b/one", "/b/two"}), 1u);
    EXPECT_EQ(signer.signed_paths.size(), 2u);
    EXPECT_EQ(report.count(DiagnosticKind::SignatureWarning), 1u);
    EXPECT_FALSE(report.has_runtime_risks());
}

TEST(SignatureFinalizer, NullSignerDisablesSigning) {
    BundleReport report;
    SignatureFinalizer finalizer(nullptr, report);
    EXPECT_TRUE(finalizer.resign("/b/one"));
    EXPECT_EQ(finalizer.finalize({"/b/one"}), 0u);
    EXPECT_TRUE(report.get_diagnostics().empty());
}

// ==================== BUNDLE REPORT TESTS ====================

TEST(BundleReport, RuntimeRiskKinds) {
    BundleReport report;
    report.set_quiet(true);
    report.add(DiagnosticKind::CorruptBinary, "/b/x", "", "bad magic");
    report.add(DiagnosticKind::SignatureWarning, "/b/y", "", "no identity");
    EXPECT_FALSE(report.has_runtime_risks());

    report.add(DiagnosticKind::UnresolvedDependency, "/b/z", "/opt/lib/libq.dylib", "searched: /b/.private-libs");
    EXPECT_TRUE(report.has_runtime_risks());
    EXPECT_EQ(report.count(DiagnosticKind::UnresolvedDependency), 1u);
    EXPECT_EQ(report.get_diagnostics().size(), 3u);
}

TEST(BundleReport, PrintListsVendoredAndDiagnostics) {
    BundleReport report;
    report.set_quiet(true);
    VendoredEntry entry;
    entry.basename = "libfoo.dylib";
    entry.resolved_source_path = "/opt/lib/libfoo.dylib";
    entry.state = VendorState::Copied;
    report.set_vendored({entry});
    report.set_touched({"/b/Contents/MacOS/app"});
    report.set_pass_count(2);
    report.add(DiagnosticKind::LeftoverReference, "/b/Contents/MacOS/app", "/opt/lib/libq.dylib", "");

    std::ostringstream out;
    report.print(out);
    const std::string text = out.str();
    EXPECT_NE(text.find("Passes: 2"), std::string::npos);
    EXPECT_NE(text.find("libfoo.dylib [copied] from /opt/lib/libfoo.dylib"), std::string::npos);
    EXPECT_NE(text.find("/b/Contents/MacOS/app"), std::string::npos);
    EXPECT_NE(text.find("leftover-reference"), std::string::npos);
}
