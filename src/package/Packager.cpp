#include "kdeploy/package/Packager.hpp"
#include "kdeploy/package/ZipWriter.hpp"
#include "kdeploy/core/Errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <system_error>

namespace kdeploy {

namespace fs = std::filesystem;

// ============================================================================
// ScratchDirectory
// ============================================================================

ScratchDirectory::ScratchDirectory(const std::string& prefix) {
    std::string pattern = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (!mkdtemp(buffer.data())) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
    }
    path_ = buffer.data();
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[Packager] Warning: could not remove " << path_.string()
                  << ": " << ec.message() << std::endl;
    }
}

// ============================================================================
// Packager
// ============================================================================

Packager::Packager(fs::path source_directory, fs::path output_directory)
    : source_directory_(std::move(source_directory)), output_directory_(std::move(output_directory)) {}

void Packager::checkManifest(const PackageManifest& manifest) const {
    if (manifest.files.empty()) {
        throw PreconditionError("Package manifest lists no files", "Add the release files to package.files");
    }

    std::vector<std::string> missing;
    for (const auto& file : manifest.files) {
        if (!fs::is_regular_file(source_directory_ / file)) {
            missing.push_back(file);
        }
    }

    if (!missing.empty()) {
        std::string list;
        for (const auto& file : missing) {
            if (!list.empty()) list += ", ";
            list += file;
        }
        throw PreconditionError("Missing files for " + manifest.archiveName() + ": " + list,
                                "cd <directory containing " + missing.front() + "> && kneeboard-package");
    }
}

void Packager::stage(const PackageManifest& manifest, const fs::path& staging_root) const {
    std::cout << "Creating package directory structure..." << std::endl;
    fs::create_directories(staging_root);

    std::cout << "Copying files..." << std::endl;
    for (const auto& file : manifest.files) {
        fs::path target = staging_root / file;
        fs::create_directories(target.parent_path());
        fs::copy_file(source_directory_ / file, target, fs::copy_options::overwrite_existing);
    }
}

std::vector<uint8_t> Packager::archive(const PackageManifest& manifest, const fs::path& staging_root) const {
    std::cout << "Creating zip archive..." << std::endl;

    ZipWriter zip;
    std::string root = manifest.rootDirectory() + "/";
    zip.addDirectory(root);

    std::set<std::string> directories;
    for (const auto& file : manifest.files) {
        fs::path relative = fs::path(file).lexically_normal();

        // Intermediate directories for nested manifest paths
        fs::path parent;
        for (auto it = relative.begin(); std::next(it) != relative.end(); ++it) {
            parent /= *it;
            std::string name = root + parent.generic_string() + "/";
            if (directories.insert(name).second) {
                zip.addDirectory(name);
            }
        }

        fs::path staged = staging_root / relative;
        auto perms = fs::status(staged).permissions();
        uint32_t mode = static_cast<uint32_t>(perms) & 0777;

        if (!zip.addFile(root + relative.generic_string(), readBinaryFile(staged), mode)) {
            throw DeployError("Compression failed for " + file, "Retry kneeboard-package");
        }
        std::cout << "  adding: " << root << relative.generic_string() << std::endl;
    }

    return zip.finish();
}

fs::path Packager::publish(const fs::path& built, const std::string& archive_name) const {
    fs::path target = output_directory_ / archive_name;
    fs::path staging = output_directory_ / ("." + archive_name + ".tmp");

    std::error_code ec;
    fs::copy_file(built, staging, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::rename(staging, target, ec);
    }

    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        throw DeployError("Cannot write " + target.string() + ": " + ec.message(),
                          "ls -ld " + output_directory_.string());
    }
    return target;
}

PackageResult Packager::build(const PackageManifest& manifest) {
    checkManifest(manifest);

    ScratchDirectory scratch("kneeboard-package-");
    fs::path staging_root = scratch.path() / manifest.rootDirectory();

    fs::path built = scratch.path() / manifest.archiveName();
    PackageResult result;

    try {
        stage(manifest, staging_root);
        std::vector<uint8_t> bytes = archive(manifest, staging_root);

        std::ofstream out(built, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out.flush()) {
            throw DeployError("Failed writing " + built.string(), "df -h " + scratch.path().string());
        }
        out.close();

        // Read back before publishing so a truncated archive never reaches the output directory
        result.entry_count = listZipEntries(readBinaryFile(built)).size();
    } catch (const DeployError&) {
        throw;
    } catch (const fs::filesystem_error& e) {
        throw DeployError(std::string("Staging failed: ") + e.what(), "df -h " + scratch.path().string());
    } catch (const std::runtime_error& e) {
        throw DeployError(std::string("Archive creation failed: ") + e.what(), "Retry kneeboard-package");
    }

    if (result.entry_count < manifest.files.size() + 1) {
        throw DeployError("Archive " + built.string() + " is incomplete", "Retry kneeboard-package");
    }

    result.archive = publish(built, manifest.archiveName());
    return result;
}

} // namespace kdeploy
