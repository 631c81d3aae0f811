#pragma once

/**
 * @file PathoRoi.h
 * @brief Main header file for PathoRoi library
 *
 * PathoRoi is the region-of-interest geometry engine for digital pathology
 * annotations: shape model, curve flattening, validated polygon topology
 * and boolean combination of ROIs.
 */

// Configuration and export macros
#include <PathoRoi/PathoRoiConfig.h>
#include <PathoRoi/Core/Export.h>

// Core types and utilities
#include <PathoRoi/Core/Types.h>
#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Core/ConverterParams.h>

// Shape model
#include <PathoRoi/Core/QRoi.h>
#include <PathoRoi/Core/RoiComparator.h>

// Platform
#include <PathoRoi/Platform/Logging.h>

// Feature modules
#include <PathoRoi/IO/RoiIO.h>
#include <PathoRoi/Convert/RoiConvert.h>
#include <PathoRoi/Combine/RoiCombine.h>

namespace Patho::Roi {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PATHOROI_VERSION_STRING;
}

} // namespace Patho::Roi
