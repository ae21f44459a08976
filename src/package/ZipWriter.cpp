#include "kdeploy/package/ZipWriter.hpp"

#include <zlib.h>

#include <cstddef>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace kdeploy {

namespace {

constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_DIRECTORY_SIGNATURE = 0x06054b50;

constexpr uint16_t VERSION_NEEDED = 20;                 // 2.0: deflate, directories
constexpr uint16_t VERSION_MADE_BY = (3 << 8) | 20;     // 3 = Unix
constexpr uint16_t METHOD_STORE = 0;
constexpr uint16_t METHOD_DEFLATE = 8;

// 1980-01-01 00:00:00, the earliest DOS timestamp
constexpr uint16_t DOS_TIME = 0;
constexpr uint16_t DOS_DATE = (0 << 9) | (1 << 5) | 1;

constexpr uint32_t S_IFREG_BITS = 0100000;
constexpr uint32_t S_IFDIR_BITS = 0040000;

void put16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(value & 0xff);
    out.push_back((value >> 8) & 0xff);
}

void put32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(value & 0xff);
    out.push_back((value >> 8) & 0xff);
    out.push_back((value >> 16) & 0xff);
    out.push_back((value >> 24) & 0xff);
}

uint16_t get16(const std::vector<uint8_t>& in, size_t offset) {
    return static_cast<uint16_t>(in[offset] | (in[offset + 1] << 8));
}

uint32_t get32(const std::vector<uint8_t>& in, size_t offset) {
    return static_cast<uint32_t>(in[offset]) |
           (static_cast<uint32_t>(in[offset + 1]) << 8) |
           (static_cast<uint32_t>(in[offset + 2]) << 16) |
           (static_cast<uint32_t>(in[offset + 3]) << 24);
}

// Raw deflate (no zlib/gzip wrapper), as zip stores it
bool deflateRaw(const std::vector<uint8_t>& data, std::vector<uint8_t>& compressed) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    compressed.resize(deflateBound(&strm, data.size()));

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return false;
    }

    compressed.resize(strm.total_out);
    return true;
}

} // namespace

void ZipWriter::writeLocalHeader(const CentralEntry& entry) {
    put32(buffer_, LOCAL_HEADER_SIGNATURE);
    put16(buffer_, VERSION_NEEDED);
    put16(buffer_, 0);                      // flags
    put16(buffer_, entry.method);
    put16(buffer_, DOS_TIME);
    put16(buffer_, DOS_DATE);
    put32(buffer_, entry.crc);
    put32(buffer_, entry.compressed_size);
    put32(buffer_, entry.uncompressed_size);
    put16(buffer_, static_cast<uint16_t>(entry.name.size()));
    put16(buffer_, 0);                      // extra field length
    buffer_.insert(buffer_.end(), entry.name.begin(), entry.name.end());
}

void ZipWriter::writeCentralHeader(const CentralEntry& entry) {
    put32(buffer_, CENTRAL_HEADER_SIGNATURE);
    put16(buffer_, VERSION_MADE_BY);
    put16(buffer_, VERSION_NEEDED);
    put16(buffer_, 0);
    put16(buffer_, entry.method);
    put16(buffer_, DOS_TIME);
    put16(buffer_, DOS_DATE);
    put32(buffer_, entry.crc);
    put32(buffer_, entry.compressed_size);
    put32(buffer_, entry.uncompressed_size);
    put16(buffer_, static_cast<uint16_t>(entry.name.size()));
    put16(buffer_, 0);                      // extra field length
    put16(buffer_, 0);                      // comment length
    put16(buffer_, 0);                      // disk number
    put16(buffer_, 0);                      // internal attributes
    put32(buffer_, entry.external_attributes);
    put32(buffer_, entry.local_header_offset);
    buffer_.insert(buffer_.end(), entry.name.begin(), entry.name.end());
}

void ZipWriter::addDirectory(const std::string& name) {
    if (finished_) {
        throw std::logic_error("ZipWriter: archive already finished");
    }

    CentralEntry entry;
    entry.name = name;
    if (entry.name.empty() || entry.name.back() != '/') {
        entry.name += '/';
    }
    entry.method = METHOD_STORE;
    entry.external_attributes = ((S_IFDIR_BITS | 0755) << 16) | 0x10;     // 0x10: MS-DOS directory bit
    entry.local_header_offset = static_cast<uint32_t>(buffer_.size());

    writeLocalHeader(entry);
    entries_.push_back(std::move(entry));
}

bool ZipWriter::addFile(const std::string& name, const std::vector<uint8_t>& data, uint32_t mode) {
    if (finished_) {
        throw std::logic_error("ZipWriter: archive already finished");
    }

    CentralEntry entry;
    entry.name = name;
    entry.crc = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    entry.uncompressed_size = static_cast<uint32_t>(data.size());
    entry.external_attributes = (S_IFREG_BITS | (mode & 0777)) << 16;
    entry.local_header_offset = static_cast<uint32_t>(buffer_.size());

    std::vector<uint8_t> compressed;
    if (!deflateRaw(data, compressed)) {
        return false;
    }

    // Deflate can grow incompressible data; store it instead
    const std::vector<uint8_t>* payload = &compressed;
    entry.method = METHOD_DEFLATE;
    if (compressed.size() >= data.size()) {
        payload = &data;
        entry.method = METHOD_STORE;
    }
    entry.compressed_size = static_cast<uint32_t>(payload->size());

    writeLocalHeader(entry);
    buffer_.insert(buffer_.end(), payload->begin(), payload->end());
    entries_.push_back(std::move(entry));
    return true;
}

std::vector<uint8_t> ZipWriter::finish() {
    if (finished_) {
        throw std::logic_error("ZipWriter: archive already finished");
    }
    finished_ = true;

    uint32_t central_offset = static_cast<uint32_t>(buffer_.size());
    for (const auto& entry : entries_) {
        writeCentralHeader(entry);
    }
    uint32_t central_size = static_cast<uint32_t>(buffer_.size()) - central_offset;

    put32(buffer_, END_OF_CENTRAL_DIRECTORY_SIGNATURE);
    put16(buffer_, 0);                      // this disk
    put16(buffer_, 0);                      // disk with central directory
    put16(buffer_, static_cast<uint16_t>(entries_.size()));
    put16(buffer_, static_cast<uint16_t>(entries_.size()));
    put32(buffer_, central_size);
    put32(buffer_, central_offset);
    put16(buffer_, 0);                      // comment length

    return std::move(buffer_);
}

std::vector<std::string> listZipEntries(const std::vector<uint8_t>& archive) {
    constexpr size_t EOCD_SIZE = 22;
    constexpr size_t CENTRAL_HEADER_SIZE = 46;

    if (archive.size() < EOCD_SIZE) {
        throw std::runtime_error("zip archive too small");
    }

    // No archive comment is written, but scan back in case one exists
    size_t eocd = archive.size() - EOCD_SIZE;
    while (get32(archive, eocd) != END_OF_CENTRAL_DIRECTORY_SIGNATURE) {
        if (eocd == 0 || archive.size() - eocd > EOCD_SIZE + 0xffff) {
            throw std::runtime_error("zip end of central directory not found");
        }
        --eocd;
    }

    uint16_t count = get16(archive, eocd + 10);
    size_t offset = get32(archive, eocd + 16);

    std::vector<std::string> names;
    names.reserve(count);

    for (uint16_t i = 0; i < count; ++i) {
        if (offset + CENTRAL_HEADER_SIZE > archive.size() ||
            get32(archive, offset) != CENTRAL_HEADER_SIGNATURE) {
            throw std::runtime_error("zip central directory is corrupt");
        }

        uint16_t name_length = get16(archive, offset + 28);
        uint16_t extra_length = get16(archive, offset + 30);
        uint16_t comment_length = get16(archive, offset + 32);

        if (offset + CENTRAL_HEADER_SIZE + name_length > archive.size()) {
            throw std::runtime_error("zip entry name runs past end of archive");
        }

        auto name_begin = archive.begin() + static_cast<std::ptrdiff_t>(offset + CENTRAL_HEADER_SIZE);
        names.emplace_back(name_begin, name_begin + name_length);

        offset += CENTRAL_HEADER_SIZE + name_length + extra_length + comment_length;
    }

    return names;
}

std::vector<uint8_t> readBinaryFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace kdeploy
