#pragma once

#include <PathoRoi/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for PathoRoi
 *
 * Exceptions signal contract violations only (bad parameters, ROI kinds an
 * operation cannot accept, ROIs on different planes, corrupt serialized
 * data). Degenerate geometry is never reported through exceptions.
 */

#include <stdexcept>
#include <string>

namespace Patho::Roi {

/**
 * @brief Base exception class for PathoRoi
 */
class PATHOROI_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception (bad parameter, plane mismatch)
 */
class PATHOROI_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief ROI kind not accepted by an operation
 */
class PATHOROI_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

/**
 * @brief File or byte stream I/O exception
 */
class PATHOROI_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Version mismatch for serialization
 */
class PATHOROI_API VersionMismatchException : public Exception {
public:
    explicit VersionMismatchException(const std::string& message)
        : Exception("Version mismatch: " + message) {}
};

} // namespace Patho::Roi
