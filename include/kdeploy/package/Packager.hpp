#pragma once

/**
 * @file Packager.hpp
 * @brief Release archive assembly
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kdeploy {

struct PackageManifest {
    std::string name{"pilot_kneeboard"};
    std::string version{"1.0.0"};
    std::vector<std::string> files;     // relative to the source directory

    std::string rootDirectory() const { return name + "_" + version; }
    std::string archiveName() const { return rootDirectory() + ".zip"; }
};

struct PackageResult {
    std::filesystem::path archive;
    size_t entry_count{0};
};

// mkdtemp directory removed with everything in it on destruction
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& prefix);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Builds the {name}_{version}.zip release archive
 *
 * The archive holds exactly the manifest files under a single
 * {name}_{version}/ directory. Everything is staged in a scratch
 * directory; the output directory only ever sees a finished, verified
 * archive, which replaces any previous one with the same name.
 */
class Packager {
public:
    Packager(std::filesystem::path source_directory, std::filesystem::path output_directory);

    // Throws PreconditionError for a missing manifest file and DeployError
    // if the archive cannot be produced.
    PackageResult build(const PackageManifest& manifest);

private:
    std::filesystem::path source_directory_;
    std::filesystem::path output_directory_;

    void checkManifest(const PackageManifest& manifest) const;
    void stage(const PackageManifest& manifest, const std::filesystem::path& staging_root) const;
    std::vector<uint8_t> archive(const PackageManifest& manifest, const std::filesystem::path& staging_root) const;
    std::filesystem::path publish(const std::filesystem::path& built, const std::string& archive_name) const;
};

} // namespace kdeploy
