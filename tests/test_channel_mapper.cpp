#include "rfloc/channel_mapper.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using rfloc::ChannelImpactMapper;

TEST(ChannelMapper, Channel6CenterAffectsNeighbours) {
    const auto ch = ChannelImpactMapper(20.0).affected_channels(2437);
    ASSERT_FALSE(ch.empty());
    EXPECT_NE(std::find(ch.begin(), ch.end(), 6u), ch.end());
    for (auto c : ch) {
        EXPECT_GE(c, 1u);
        EXPECT_LE(c, 13u);
    }
    EXPECT_EQ(ch, (std::vector<uint32_t>{2, 3, 4, 5, 6, 7, 8, 9, 10}));
}

TEST(ChannelMapper, LowerEdgeOf24GHz) {
    EXPECT_EQ(ChannelImpactMapper().affected_channels(2412), (std::vector<uint32_t>{1, 2, 3, 4, 5}));
}

TEST(ChannelMapper, NarrowWindow) {
    EXPECT_EQ(ChannelImpactMapper(5.0).affected_channels(2437), (std::vector<uint32_t>{5, 6, 7}));
}

TEST(ChannelMapper, FiveGHzChannels) {
    EXPECT_EQ(ChannelImpactMapper().affected_channels(5180), (std::vector<uint32_t>{36, 40}));
    EXPECT_EQ(ChannelImpactMapper().affected_channels(5825), (std::vector<uint32_t>{161, 165}));
}

TEST(ChannelMapper, OutsideBandsIsEmpty) {
    EXPECT_TRUE(ChannelImpactMapper().affected_channels(900).empty());
    EXPECT_TRUE(ChannelImpactMapper().affected_channels(3000).empty());
    EXPECT_TRUE(ChannelImpactMapper().affected_channels(6100).empty());
}

TEST(ChannelMapper, CenterFrequencies) {
    EXPECT_EQ(rfloc::channel_center_mhz(1), 2412.0);
    EXPECT_EQ(rfloc::channel_center_mhz(6), 2437.0);
    EXPECT_EQ(rfloc::channel_center_mhz(13), 2472.0);
    EXPECT_EQ(rfloc::channel_center_mhz(36), 5180.0);
    EXPECT_EQ(rfloc::channel_center_mhz(165), 5825.0);
}
