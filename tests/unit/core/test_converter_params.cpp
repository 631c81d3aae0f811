#include <gtest/gtest.h>
#include <PathoRoi/Core/ConverterParams.h>
#include <PathoRoi/Core/Exception.h>

#include <limits>

using namespace Patho::Roi;

// =============================================================================
// ConverterParams
// =============================================================================

TEST(ConverterParamsTest, Defaults) {
    const ConverterParams& params = DefaultConverterParams();
    EXPECT_DOUBLE_EQ(params.pixelWidth, 1.0);
    EXPECT_DOUBLE_EQ(params.pixelHeight, 1.0);
    EXPECT_DOUBLE_EQ(params.flatness, DEFAULT_FLATNESS);
    EXPECT_DOUBLE_EQ(params.repairAreaTolerance, DEFAULT_REPAIR_AREA_TOLERANCE);
    EXPECT_FALSE(params.IsFixedPrecision());
    EXPECT_NO_THROW(params.Validate());
}

TEST(ConverterParamsTest, FluentSetters) {
    ConverterParams params = ConverterParams()
        .SetPixelSize(0.25, 0.5)
        .SetFlatness(0.1)
        .SetPrecisionScale(1000.0);
    EXPECT_DOUBLE_EQ(params.pixelWidth, 0.25);
    EXPECT_DOUBLE_EQ(params.pixelHeight, 0.5);
    EXPECT_DOUBLE_EQ(params.flatness, 0.1);
    EXPECT_TRUE(params.IsFixedPrecision());
    EXPECT_NO_THROW(params.Validate());
}

TEST(ConverterParamsTest, ValidateRejectsBadValues) {
    EXPECT_THROW(ConverterParams().SetPixelSize(0.0, 1.0).Validate(), InvalidArgumentException);
    EXPECT_THROW(ConverterParams().SetPixelSize(1.0, -1.0).Validate(), InvalidArgumentException);
    EXPECT_THROW(ConverterParams().SetFlatness(0.0).Validate(), InvalidArgumentException);
    EXPECT_THROW(ConverterParams().SetPrecisionScale(-1.0).Validate(), InvalidArgumentException);
    EXPECT_THROW(ConverterParams().SetRepairAreaTolerance(-0.1).Validate(),
                 InvalidArgumentException);
    EXPECT_THROW(ConverterParams().SetSnapPrecisionFactor(0.0).Validate(),
                 InvalidArgumentException);
    EXPECT_THROW(ConverterParams()
                     .SetFlatness(std::numeric_limits<double>::infinity())
                     .Validate(),
                 InvalidArgumentException);
}

// =============================================================================
// ConversionReport
// =============================================================================

TEST(ConversionReportTest, EmptyReport) {
    ConversionReport report;
    EXPECT_EQ(report.quality, RepairQuality::None);
    EXPECT_FALSE(report.IsRepaired());
    EXPECT_FALSE(report.IsApproximate());
    EXPECT_FALSE(report.IsFailed());
}

TEST(ConversionReportTest, QualityTakesWorstRepair) {
    ConversionReport report;

    RingRepairInfo safe;
    safe.areaBefore = 100.0;
    safe.areaAfter = 100.0;
    report.AddRepair(safe);
    EXPECT_EQ(report.quality, RepairQuality::Safe);

    RingRepairInfo approx;
    approx.areaBefore = 100.0;
    approx.areaAfter = 50.0;
    approx.approximate = true;
    report.AddRepair(approx);
    EXPECT_EQ(report.quality, RepairQuality::Approximate);
    EXPECT_DOUBLE_EQ(approx.RelativeAreaChange(), 0.5);

    report.AddRepair(safe);
    EXPECT_EQ(report.quality, RepairQuality::Approximate);
    EXPECT_EQ(report.repairs.size(), 3u);
}

TEST(ConversionReportTest, Merge) {
    ConversionReport a;
    ConversionReport b;
    RingRepairInfo info;
    info.areaBefore = 4.0;
    info.areaAfter = 4.0;
    b.AddRepair(info);
    b.message = "ring 0 repaired";

    a.Merge(b);
    EXPECT_TRUE(a.IsRepaired());
    EXPECT_EQ(a.quality, RepairQuality::Safe);
    EXPECT_EQ(a.message, "ring 0 repaired");
}

TEST(ConversionReportTest, QualityNames) {
    EXPECT_STREQ(RepairQualityName(RepairQuality::None), "None");
    EXPECT_STREQ(RepairQualityName(RepairQuality::Approximate), "Approximate");
    EXPECT_STREQ(RepairQualityName(RepairQuality::Failed), "Failed");
}

TEST(RingRepairInfoTest, RelativeAreaChangeOfZeroRing) {
    RingRepairInfo info;
    EXPECT_DOUBLE_EQ(info.RelativeAreaChange(), 0.0);
}
