// test_csi_params.cpp - Unit tests for CSI parameter splitting

#include <gtest/gtest.h>
#include "input/CsiParams.h"

namespace VTInput::Input {
namespace Tests {

TEST(CsiParamsTest, ModifiedCursorKey) {
    CsiParams params("\x1b[1;5A");

    EXPECT_EQ(params.Marker(), 0);
    EXPECT_EQ(params.Final(), 'A');
    ASSERT_EQ(params.Count(), 2u);
    EXPECT_EQ(params.Get(0), 1);
    EXPECT_EQ(params.Get(1), 5);
}

TEST(CsiParamsTest, NoParameters) {
    CsiParams params("\x1b[A");

    EXPECT_EQ(params.Count(), 0u);
    EXPECT_FALSE(params.Has(0));
    EXPECT_EQ(params.Get(0, 1), 1);
}

TEST(CsiParamsTest, EightBitIntroducer) {
    CsiParams params("\x9b" "2;3H");

    EXPECT_EQ(params.Final(), 'H');
    EXPECT_EQ(params.Get(0), 2);
    EXPECT_EQ(params.Get(1), 3);
}

TEST(CsiParamsTest, PrivateMarker) {
    CsiParams params("\x1b[<0;10;20M");

    EXPECT_EQ(params.Marker(), '<');
    ASSERT_EQ(params.Count(), 3u);
    EXPECT_EQ(params.Get(2), 20);
}

TEST(CsiParamsTest, EmptyParameterIsAbsent) {
    CsiParams params("\x1b[;5A");

    ASSERT_EQ(params.Count(), 2u);
    EXPECT_FALSE(params.Has(0));
    EXPECT_EQ(params.Get(0, 1), 1);
    EXPECT_TRUE(params.Has(1));

    // Explicit zero is not the same as absent
    CsiParams zero("\x1b[0;5A");
    EXPECT_TRUE(zero.Has(0));
    EXPECT_EQ(zero.Get(0, 1), 0);
}

TEST(CsiParamsTest, SubParameters) {
    CsiParams params("\x1b[97:65;2:3u");

    ASSERT_EQ(params.Count(), 2u);
    EXPECT_EQ(params.SubCount(0), 2u);
    EXPECT_EQ(params.GetSub(0, 1), 65);
    EXPECT_EQ(params.GetSub(1, 1), 3);
    EXPECT_EQ(params.SubCount(5), 0u);
}

TEST(CsiParamsTest, EmptySubParameter) {
    CsiParams params("\x1b[97::98u");

    ASSERT_EQ(params.SubCount(0), 3u);
    EXPECT_EQ(params.GetSub(0, 1, 7), 7);
    EXPECT_EQ(params.GetSub(0, 2), 98);
}

TEST(CsiParamsTest, Intermediate) {
    CsiParams params("\x1b[2$");

    EXPECT_EQ(params.Intermediate(), '$');
    EXPECT_EQ(params.Final(), 0);
    EXPECT_EQ(params.Get(0), 2);
}

TEST(CsiParamsTest, HugeValuesSaturate) {
    CsiParams params("\x1b[99999999999999;1A");

    EXPECT_EQ(params.Get(0), 0x7FFFFFF);
    EXPECT_EQ(params.Get(1), 1);
}

} // namespace Tests
} // namespace VTInput::Input
