#pragma once

#include <utility/enum_string_convert.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

namespace Utility::Test
{
    BOOST_DEFINE_ENUM_CLASS(Fruit, Apple, Banana, BloodOrange)

    TEST(EnumStringConvertTests, EnumeratorsConvertByName)
    {
        EXPECT_EQ(enumToString(Fruit::BloodOrange), "BloodOrange");
        EXPECT_EQ(enumFromString<Fruit>("Banana"), Fruit::Banana);
    }

    TEST(EnumStringConvertTests, UnknownNameThrows)
    {
        EXPECT_THROW(enumFromString<Fruit>("Cherry"), std::invalid_argument);
        EXPECT_FALSE(tryEnumFromString<Fruit>("Cherry").has_value());
    }

    TEST(EnumStringConvertTests, CaseIsOnlyIgnoredOnRequest)
    {
        EXPECT_FALSE(tryEnumFromString<Fruit>("apple").has_value());
        EXPECT_EQ(tryEnumFromString<Fruit>("apple", true), Fruit::Apple);
        EXPECT_EQ(tryEnumFromString<Fruit>("BLOODORANGE", true), Fruit::BloodOrange);
        EXPECT_FALSE(tryEnumFromString<Fruit>("Blood", true).has_value());
    }

    TEST(EnumStringConvertTests, InvalidValueThrows)
    {
        EXPECT_THROW(enumToString(static_cast<Fruit>(42)), std::invalid_argument);
    }
}
