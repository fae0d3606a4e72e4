/// @file test_Format.cpp
/// @brief Tests for UI::Format functions
///
/// Tests cover:
/// - Listening port list formatting
/// - Snapshot age formatting

#include "UI/Format.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

// =============================================================================
// Port List Formatting Tests
// =============================================================================

TEST(FormatTest, NoPortsShowsDash)
{
    EXPECT_EQ(UI::Format::formatPorts({}), "-");
}

TEST(FormatTest, PortsAreCommaJoinedInOrder)
{
    const std::vector<std::string> ports = {"22", "80", "443"};
    EXPECT_EQ(UI::Format::formatPorts(ports), "22, 80, 443");
}

TEST(FormatTest, CountWithLabel)
{
    EXPECT_EQ(UI::Format::formatCountWithLabel(12, "records"), "12 records");
}

// =============================================================================
// Age Formatting Tests
// =============================================================================

TEST(FormatTest, SubSecondAgeInMilliseconds)
{
    EXPECT_EQ(UI::Format::formatAge(0ms), "0 ms");
    EXPECT_EQ(UI::Format::formatAge(850ms), "850 ms");
}

TEST(FormatTest, NegativeAgeClampsToZero)
{
    EXPECT_EQ(UI::Format::formatAge(-5ms), "0 ms");
}

TEST(FormatTest, SecondsWithOneDecimal)
{
    EXPECT_EQ(UI::Format::formatAge(1s), "1.0 s");
    EXPECT_EQ(UI::Format::formatAge(12'300ms), "12.3 s");
}

TEST(FormatTest, MinutesAndSeconds)
{
    EXPECT_EQ(UI::Format::formatAge(4min + 10s), "4m 10s");
}

TEST(FormatTest, HoursAndPaddedMinutes)
{
    EXPECT_EQ(UI::Format::formatAge(2h + 5min + 30s), "2h 05m");
}
