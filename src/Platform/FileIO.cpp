/**
 * @file FileIO.cpp
 * @brief File and byte buffer I/O implementation
 */

#include <PathoRoi/Platform/FileIO.h>
#include <PathoRoi/Core/Exception.h>

#include <fstream>
#include <string>

namespace Patho::Roi::Platform {

// ============================================================================
// Binary File I/O
// ============================================================================

bool ReadBinaryFile(const std::string& path, std::vector<uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);
    data.resize(static_cast<size_t>(size));

    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return false;
    }

    return true;
}

bool WriteBinaryFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    if (!data.empty()) {
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }

    return file.good();
}

// ============================================================================
// BinaryWriter
// ============================================================================

void BinaryWriter::WriteBytes(const void* data, size_t size) {
    if (size > 0) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        buffer_.insert(buffer_.end(), bytes, bytes + size);
    }
}

// ============================================================================
// BinaryReader
// ============================================================================

void BinaryReader::ReadBytes(void* data, size_t size) {
    if (size == 0) {
        return;
    }
    if (size > Remaining()) {
        ThrowTruncated(size);
    }
    std::memcpy(data, data_ + pos_, size);
    pos_ += size;
}

void BinaryReader::ThrowTruncated(size_t requested) const {
    throw IOException("unexpected end of data: need " + std::to_string(requested) +
                      " bytes at offset " + std::to_string(pos_) + ", " +
                      std::to_string(Remaining()) + " left");
}

} // namespace Patho::Roi::Platform
