#pragma once

/**
 * @file ConverterParams.h
 * @brief Conversion configuration and repair diagnostics
 *
 * ConverterParams is a value type: construct it once, pass it by reference
 * into every conversion or combination call. Changing a copy never affects
 * geometry produced earlier.
 */

#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/Export.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Patho::Roi {

// =============================================================================
// Converter Parameters
// =============================================================================

/**
 * @brief Parameters for ROI <-> geometry conversion
 */
struct PATHOROI_API ConverterParams {
    // Coordinate scaling (ROI -> geometry multiplies, geometry -> ROI divides)
    double pixelWidth = 1.0;                        ///< Scale factor for x
    double pixelHeight = 1.0;                       ///< Scale factor for y

    // Flattening
    double flatness = DEFAULT_FLATNESS;             ///< Max curve deviation (scaled units)

    // Precision model
    double precisionScale = 0.0;                    ///< 0 = floating, >0 = grid of 1/scale

    // Self-intersection repair
    double repairAreaTolerance = DEFAULT_REPAIR_AREA_TOLERANCE;  ///< Relative area change accepted as safe
    double snapPrecisionFactor = DEFAULT_SNAP_PRECISION_FACTOR;  ///< Snap tolerance / ring diameter

    // Builder pattern for fluent configuration
    ConverterParams& SetPixelSize(double w, double h) { pixelWidth = w; pixelHeight = h; return *this; }
    ConverterParams& SetFlatness(double f) { flatness = f; return *this; }
    ConverterParams& SetPrecisionScale(double s) { precisionScale = s; return *this; }
    ConverterParams& SetRepairAreaTolerance(double t) { repairAreaTolerance = t; return *this; }
    ConverterParams& SetSnapPrecisionFactor(double f) { snapPrecisionFactor = f; return *this; }

    /// True if a fixed precision grid is used
    bool IsFixedPrecision() const { return precisionScale > 0.0; }

    /**
     * @brief Check all values
     * @throws InvalidArgumentException on non-positive or non-finite values
     */
    void Validate() const;
};

/**
 * @brief Process-wide default parameters
 *
 * Constructed lazily on first use, never modified afterwards. Safe for
 * concurrent read access.
 */
PATHOROI_API const ConverterParams& DefaultConverterParams();

// =============================================================================
// Repair Diagnostics
// =============================================================================

/**
 * @brief Worst repair applied during one conversion
 */
enum class RepairQuality : uint8_t {
    None,           ///< No ring needed repair
    Safe,           ///< Repaired, area change within tolerance
    Approximate,    ///< Repaired, area changed beyond tolerance
    Failed          ///< Conversion rejected (batch processing only)
};

PATHOROI_API const char* RepairQualityName(RepairQuality quality);

/**
 * @brief Repair record for one invalid ring
 */
struct PATHOROI_API RingRepairInfo {
    size_t ringIndex = 0;           ///< Index in flattening order
    double areaBefore = 0.0;        ///< |signed area| of the original ring
    double areaAfter = 0.0;         ///< Area of the repaired geometry
    double snapTolerance = 0.0;     ///< Snap distance used
    std::string reason;             ///< Why the ring was invalid
    bool approximate = false;       ///< Area change exceeded tolerance

    /// |after - before| / max(before, after), 0 if both are 0
    double RelativeAreaChange() const;
};

/**
 * @brief Diagnostics returned together with a converted ROI
 */
struct PATHOROI_API ConversionReport {
    RepairQuality quality = RepairQuality::None;
    std::vector<RingRepairInfo> repairs;
    std::string message;            ///< Error text when quality is Failed

    bool IsRepaired() const { return !repairs.empty(); }
    bool IsApproximate() const { return quality == RepairQuality::Approximate; }
    bool IsFailed() const { return quality == RepairQuality::Failed; }

    /// Record a ring repair and raise quality accordingly
    void AddRepair(const RingRepairInfo& info);

    /// Merge another report (quality is the worse of both)
    void Merge(const ConversionReport& other);
};

} // namespace Patho::Roi
