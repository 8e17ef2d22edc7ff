#pragma once

#include <utility/format_bytes.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    TEST(FormatBytesTests, SmallValuesArePrintedInBytes)
    {
        EXPECT_EQ(formatBytes(512), "512 B");
    }

    TEST(FormatBytesTests, MagnitudeSwitchesAtBinaryBoundaries)
    {
        EXPECT_EQ(determineOrderOfMagnitude(1023), OrderOfMagnitude::None);
        EXPECT_EQ(determineOrderOfMagnitude(1024), OrderOfMagnitude::Kilo);
        EXPECT_EQ(determineOrderOfMagnitude(2 * 1024 * 1024), OrderOfMagnitude::Mega);
        EXPECT_EQ(formatBytes(2 * 1024 * 1024), "2.00 MB");
    }

    TEST(FormatBytesTests, LimitsOfTheTransferValidationAreReadable)
    {
        EXPECT_EQ(formatBytes(5ULL * 1024 * 1024 * 1024), "5.00 GB");
        EXPECT_EQ(formatBytes(15ULL * 1024 * 1024 * 1024), "15.00 GB");
    }

    TEST(FormatBytesTests, TeraIsTheLargestUnit)
    {
        EXPECT_EQ(determineOrderOfMagnitude(2048ULL * 1024 * 1024 * 1024 * 1024), OrderOfMagnitude::Tera);
        EXPECT_EQ(formatBytes(2048ULL * 1024 * 1024 * 1024 * 1024), "2048.00 TB");
    }
}
