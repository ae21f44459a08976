#pragma once

/**
 * @file ZipWriter.hpp
 * @brief Reproducible zip archive writer
 *
 * Raw deflate through zlib with fixed timestamps, so the same inputs always
 * give the same bytes. A small central directory reader is included for
 * checking what was written.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kdeploy {

/**
 * @brief Minimal reproducible zip writer (deflate via zlib)
 *
 * Entries are written in insertion order with a fixed 1980-01-01 DOS
 * timestamp, so the same inputs always produce the same bytes. Unix
 * permission bits are stored in the external attributes so extracted
 * scripts stay executable. No zip64: entries and the archive must stay
 * under 4 GiB.
 */
class ZipWriter {
public:
    // Directory names get a trailing '/' if it is missing.
    void addDirectory(const std::string& name);

    // Returns false if compression failed; the entry is then not added.
    bool addFile(const std::string& name, const std::vector<uint8_t>& data, uint32_t mode = 0644);

    // Appends the central directory and returns the complete archive.
    std::vector<uint8_t> finish();

    size_t entryCount() const { return entries_.size(); }

private:
    struct CentralEntry {
        std::string name;
        uint16_t method{0};
        uint32_t crc{0};
        uint32_t compressed_size{0};
        uint32_t uncompressed_size{0};
        uint32_t external_attributes{0};
        uint32_t local_header_offset{0};
    };

    std::vector<uint8_t> buffer_;
    std::vector<CentralEntry> entries_;
    bool finished_{false};

    void writeLocalHeader(const CentralEntry& entry);
    void writeCentralHeader(const CentralEntry& entry);
};

// Entry names from the archive's central directory, in order.
// Throws std::runtime_error if the data is not a readable zip archive.
std::vector<std::string> listZipEntries(const std::vector<uint8_t>& archive);

std::vector<uint8_t> readBinaryFile(const std::filesystem::path& path);

} // namespace kdeploy
