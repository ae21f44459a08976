#include "test_common.hpp"
#include "kdeploy/config/ConfigParser.hpp"
#include "kdeploy/core/Errors.hpp"
#include "kdeploy/package/Packager.hpp"
#include "kdeploy/package/ZipWriter.hpp"

#include <algorithm>

using namespace kdeploy;
using kdeploy::test::TempDir;

namespace fs = std::filesystem;

static PackageManifest manifest() {
    PackageManifest m;
    m.name = "pilot_kneeboard";
    m.version = "1.0.0";
    m.files = {"kneeboard_gui.py", "kneeboard.service", "README.md", "assets/logo.png"};
    return m;
}

static void writeSources(const TempDir& dir) {
    dir.write("src/kneeboard_gui.py", "print('kneeboard')\n");
    dir.write("src/kneeboard.service", "[Service]\nExecStart=x\nWorkingDirectory=y\nUser=z\n");
    dir.write("src/README.md", "# Pilot Kneeboard\n");
    dir.write("src/assets/logo.png", std::string("\x89PNG\r\n\x1a\n", 8));
    dir.write("src/notes.txt", "not in the manifest\n");
    fs::create_directories(dir.path() / "out");
}

static bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

static int test_archive_naming() {
    PackageManifest m;
    m.name = "pilot_kneeboard";
    m.version = "2.3.1";
    EXPECT(m.rootDirectory() == "pilot_kneeboard_2.3.1", "root directory name");
    EXPECT(m.archiveName() == "pilot_kneeboard_2.3.1.zip", "archive name");
    return 0;
}

static int test_build_contents() {
    TempDir dir;
    writeSources(dir);

    Packager packager(dir.path() / "src", dir.path() / "out");
    PackageResult result = packager.build(manifest());

    EXPECT(result.archive == dir.path() / "out" / "pilot_kneeboard_1.0.0.zip", "archive path");
    EXPECT(fs::exists(result.archive), "archive written");

    std::vector<std::string> names = listZipEntries(readBinaryFile(result.archive));
    EXPECT(names.front() == "pilot_kneeboard_1.0.0/", "root directory first");
    EXPECT(contains(names, "pilot_kneeboard_1.0.0/kneeboard_gui.py"), "entry point");
    EXPECT(contains(names, "pilot_kneeboard_1.0.0/kneeboard.service"), "service template");
    EXPECT(contains(names, "pilot_kneeboard_1.0.0/assets/"), "intermediate directory");
    EXPECT(contains(names, "pilot_kneeboard_1.0.0/assets/logo.png"), "nested file");
    EXPECT(!contains(names, "pilot_kneeboard_1.0.0/notes.txt"), "unlisted file left out");
    EXPECT(names.size() == 6, "root, assets dir and four files");
    EXPECT(result.entry_count == names.size(), "entry count reported");

    for (const auto& name : names) {
        EXPECT(name.rfind("pilot_kneeboard_1.0.0/", 0) == 0, "everything under the root directory");
    }
    return 0;
}

static int test_missing_file_leaves_nothing() {
    TempDir dir;
    writeSources(dir);
    fs::remove(dir.path() / "src" / "README.md");

    Packager packager(dir.path() / "src", dir.path() / "out");
    bool threw = false;
    try {
        packager.build(manifest());
    } catch (const PreconditionError& e) {
        threw = std::string(e.what()).find("README.md") != std::string::npos;
    }
    EXPECT(threw, "missing file named in the error");
    EXPECT(fs::is_empty(dir.path() / "out"), "no archive or partial file in the output directory");
    return 0;
}

// Stock release file list from the built-in configuration
static PackageManifest releaseManifest() {
    ConfigParser parser;
    if (!parser.loadFromString(ConfigParser::getEmbeddedConfig())) {
        throw std::runtime_error("built-in configuration does not parse");
    }
    PackageManifest m;
    m.name = "pilot_kneeboard";
    m.version = "1.0.0";
    m.files = parser.getConfig().package.files;
    return m;
}

static int test_release_manifest_missing_file() {
    PackageManifest m = releaseManifest();
    EXPECT(m.files.size() == 9, "release ships nine files");
    EXPECT(std::find(m.files.begin(), m.files.end(), "install_windows.bat") != m.files.end(),
           "windows installer listed");

    TempDir dir;
    fs::create_directories(dir.path() / "out");
    for (const auto& file : m.files) {
        dir.write("src/" + file, file + "\n");
    }

    Packager packager(dir.path() / "src", dir.path() / "out");
    PackageResult complete = packager.build(m);
    EXPECT(listZipEntries(readBinaryFile(complete.archive)).size() == 10, "root directory and nine files");

    fs::remove(complete.archive);
    fs::remove(dir.path() / "src" / "install_windows.bat");
    bool threw = false;
    try {
        packager.build(m);
    } catch (const PreconditionError& e) {
        threw = std::string(e.what()).find("install_windows.bat") != std::string::npos;
    }
    EXPECT(threw, "last listed file missing is named");
    EXPECT(fs::is_empty(dir.path() / "out"), "nothing written for an incomplete release");
    return 0;
}

static int test_rebuild_replaces_archive() {
    TempDir dir;
    writeSources(dir);
    dir.write("out/pilot_kneeboard_1.0.0.zip", "stale");

    Packager packager(dir.path() / "src", dir.path() / "out");
    PackageResult first = packager.build(manifest());
    std::vector<uint8_t> first_bytes = readBinaryFile(first.archive);
    EXPECT(listZipEntries(first_bytes).size() == 6, "stale archive replaced");

    PackageResult second = packager.build(manifest());
    EXPECT(readBinaryFile(second.archive) == first_bytes, "same inputs give the same archive");
    EXPECT(!fs::exists(dir.path() / "out" / ".pilot_kneeboard_1.0.0.zip.tmp"), "no staging file left");
    return 0;
}

static int test_executable_mode_kept() {
    TempDir dir;
    writeSources(dir);
    fs::permissions(dir.path() / "src" / "kneeboard_gui.py", fs::perms::owner_exec, fs::perm_options::add);

    PackageResult result = Packager(dir.path() / "src", dir.path() / "out").build(manifest());
    std::vector<uint8_t> bytes = readBinaryFile(result.archive);

    // External attributes of the entry point in the central directory carry the mode
    std::string name = "pilot_kneeboard_1.0.0/kneeboard_gui.py";
    bool found = false;
    for (size_t i = 0; i + 46 + name.size() <= bytes.size(); ++i) {
        if (bytes[i] == 0x50 && bytes[i + 1] == 0x4b && bytes[i + 2] == 0x01 && bytes[i + 3] == 0x02 &&
            std::string(bytes.begin() + i + 46, bytes.begin() + i + 46 + name.size()) == name) {
            uint32_t attributes = bytes[i + 38] | (bytes[i + 39] << 8) | (bytes[i + 40] << 16) |
                                  (static_cast<uint32_t>(bytes[i + 41]) << 24);
            found = ((attributes >> 16) & 0100) != 0;
        }
    }
    EXPECT(found, "owner execute bit stored");
    return 0;
}

static int test_zip_writer_rejects_garbage() {
    bool threw = false;
    try {
        listZipEntries(std::vector<uint8_t>{'n', 'o', 't', ' ', 'a', ' ', 'z', 'i', 'p'});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT(threw, "non-zip data rejected");

    ZipWriter zip;
    zip.addDirectory("root");
    EXPECT(zip.addFile("root/empty.txt", {}), "empty file added");
    std::vector<std::string> names = listZipEntries(zip.finish());
    EXPECT(names.size() == 2 && names[0] == "root/", "trailing slash added to directory");
    return 0;
}

int main() {
    if (test_archive_naming() != 0) return 1;
    if (test_build_contents() != 0) return 1;
    if (test_missing_file_leaves_nothing() != 0) return 1;
    if (test_release_manifest_missing_file() != 0) return 1;
    if (test_rebuild_replaces_archive() != 0) return 1;
    if (test_executable_mode_kept() != 0) return 1;
    if (test_zip_writer_rejects_garbage() != 0) return 1;
    printf("packager tests passed\n");
    return 0;
}
