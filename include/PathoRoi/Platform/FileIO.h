#pragma once

#include <PathoRoi/Core/Export.h>

/**
 * @file FileIO.h
 * @brief Binary file and byte buffer I/O
 *
 * Provides:
 * - Binary file read/write
 * - BinaryWriter/BinaryReader over in-memory byte buffers
 *
 * Values are stored in host byte order (little-endian on supported targets).
 * BinaryReader checks every read against the buffer end and throws
 * IOException on truncated input.
 */

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace Patho::Roi::Platform {

// ============================================================================
// Binary File I/O
// ============================================================================

/**
 * @brief Read entire file into byte vector
 * @param path File path
 * @param data Output vector (will be resized)
 * @return true on success
 */
PATHOROI_API bool ReadBinaryFile(const std::string& path, std::vector<uint8_t>& data);

/**
 * @brief Write byte vector to file
 * @param path File path
 * @param data Data to write
 * @return true on success
 */
PATHOROI_API bool WriteBinaryFile(const std::string& path, const std::vector<uint8_t>& data);

// ============================================================================
// Serialization Helpers
// ============================================================================

/**
 * @brief Binary writer appending to a byte buffer
 */
class PATHOROI_API BinaryWriter {
public:
    BinaryWriter() = default;

    /**
     * @brief Write primitive type
     */
    template<typename T>
    void Write(T value);

    /**
     * @brief Write raw bytes
     */
    void WriteBytes(const void* data, size_t size);

    std::vector<uint8_t> Release() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Binary reader over a byte buffer
 *
 * The buffer must outlive the reader.
 */
class PATHOROI_API BinaryReader {
public:
    explicit BinaryReader(const std::vector<uint8_t>& data)
        : data_(data.data()), size_(data.size()) {}

    /**
     * @brief Bytes left to read
     */
    size_t Remaining() const { return size_ - pos_; }

    /**
     * @brief Check if all bytes were consumed
     */
    bool IsEof() const { return pos_ >= size_; }

    /**
     * @brief Read primitive type
     * @throws IOException on truncated input
     */
    template<typename T>
    T Read();

    /**
     * @brief Read raw bytes
     * @throws IOException on truncated input
     */
    void ReadBytes(void* data, size_t size);

private:
    [[noreturn]] void ThrowTruncated(size_t requested) const;

    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
};

// ============================================================================
// Template Implementations
// ============================================================================

template<typename T>
void BinaryWriter::Write(T value) {
    WriteBytes(&value, sizeof(T));
}

template<typename T>
T BinaryReader::Read() {
    T value{};
    ReadBytes(&value, sizeof(T));
    return value;
}

} // namespace Patho::Roi::Platform
