#include <PathoRoi/Core/ConverterParams.h>
#include <PathoRoi/Core/Validate.h>

#include <algorithm>
#include <cmath>

namespace Patho::Roi {

// =============================================================================
// ConverterParams
// =============================================================================

void ConverterParams::Validate() const {
    Validate::RequireFinite(pixelWidth, "pixelWidth", "ConverterParams");
    Validate::RequireFinite(pixelHeight, "pixelHeight", "ConverterParams");
    Validate::RequirePositive(pixelWidth, "pixelWidth", "ConverterParams");
    Validate::RequirePositive(pixelHeight, "pixelHeight", "ConverterParams");
    Validate::RequireFinite(flatness, "flatness", "ConverterParams");
    Validate::RequirePositive(flatness, "flatness", "ConverterParams");
    Validate::RequireFinite(precisionScale, "precisionScale", "ConverterParams");
    Validate::RequireNonNegative(precisionScale, "precisionScale", "ConverterParams");
    Validate::RequireFinite(repairAreaTolerance, "repairAreaTolerance", "ConverterParams");
    Validate::RequireNonNegative(repairAreaTolerance, "repairAreaTolerance", "ConverterParams");
    Validate::RequireFinite(snapPrecisionFactor, "snapPrecisionFactor", "ConverterParams");
    Validate::RequirePositive(snapPrecisionFactor, "snapPrecisionFactor", "ConverterParams");
}

const ConverterParams& DefaultConverterParams() {
    static const ConverterParams params;
    return params;
}

// =============================================================================
// Repair Diagnostics
// =============================================================================

const char* RepairQualityName(RepairQuality quality) {
    switch (quality) {
        case RepairQuality::None:        return "None";
        case RepairQuality::Safe:        return "Safe";
        case RepairQuality::Approximate: return "Approximate";
        case RepairQuality::Failed:      return "Failed";
        default:                         return "Unknown";
    }
}

double RingRepairInfo::RelativeAreaChange() const {
    double denom = std::max(std::abs(areaBefore), std::abs(areaAfter));
    if (denom <= 0.0) {
        return 0.0;
    }
    return std::abs(std::abs(areaAfter) - std::abs(areaBefore)) / denom;
}

void ConversionReport::AddRepair(const RingRepairInfo& info) {
    repairs.push_back(info);
    RepairQuality q = info.approximate ? RepairQuality::Approximate : RepairQuality::Safe;
    quality = std::max(quality, q);
}

void ConversionReport::Merge(const ConversionReport& other) {
    repairs.insert(repairs.end(), other.repairs.begin(), other.repairs.end());
    quality = std::max(quality, other.quality);
    if (message.empty()) {
        message = other.message;
    }
}

} // namespace Patho::Roi
