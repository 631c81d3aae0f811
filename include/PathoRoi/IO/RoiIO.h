#pragma once

/**
 * @file RoiIO.h
 * @brief Binary ROI serialization
 *
 * Layout (little-endian):
 *   uint32 magic "QROI", uint32 version, uint8 kind, int32 z, int32 t, int32 c
 *   Rectangle/Ellipse: double x, y, width, height
 *   Line:              double x1, y1, x2, y2
 *   Polygon/Polyline/Points: uint64 count, count x (double x, double y)
 *   Composite:         uint64 ring count, then each ring as count + pairs
 *
 * A serialize/deserialize cycle reproduces bounds, plane and every vertex
 * exactly. Ellipses are stored parametrically.
 */

#include <PathoRoi/Core/Export.h>
#include <PathoRoi/Core/QRoi.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Patho::Roi::IO {

/// "QROI" read as a little-endian uint32
constexpr uint32_t ROI_FORMAT_MAGIC = 0x494F5251;
constexpr uint32_t ROI_FORMAT_VERSION = 1;

/// Serialize a ROI to bytes
PATHOROI_API std::vector<uint8_t> SerializeRoi(const QRoi& roi);

/**
 * @brief Deserialize a ROI
 *
 * @throws IOException on bad magic, unknown kind, oversized arrays,
 *         truncated or trailing data
 * @throws VersionMismatchException on unsupported format version
 */
PATHOROI_API QRoi DeserializeRoi(const std::vector<uint8_t>& data);

/**
 * @brief Write a ROI file
 * @throws IOException if the file cannot be written
 */
PATHOROI_API void WriteRoi(const QRoi& roi, const std::string& filename);

/**
 * @brief Read a ROI file
 * @throws IOException if the file cannot be read or is malformed
 */
PATHOROI_API QRoi ReadRoi(const std::string& filename);

} // namespace Patho::Roi::IO
