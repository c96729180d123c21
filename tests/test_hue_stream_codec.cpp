// Repository: LumenSync
// Component: HueStream v2 encoder tests
// Copyright (c) 2026 LumenSync

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "lumensync/bridge/HueStreamCodec.hpp"

namespace lumensync::bridge {
namespace {

constexpr const char* kConfigId = "1a8d99cc-967b-44f2-9202-43f976c0fa6b";

TEST(HueStreamCodecTest, HeaderLayout) {
  HueStreamEncoder encoder(kConfigId);
  std::vector<uint8_t> packet = encoder.Encode({});

  ASSERT_EQ(packet.size(), HueStreamEncoder::kHeaderSize);
  EXPECT_EQ(std::string(packet.begin(), packet.begin() + 9), "HueStream");
  EXPECT_EQ(packet[9], 0x02);
  EXPECT_EQ(packet[10], 0x00);
  EXPECT_EQ(packet[11], 0x00);  // sequence
  EXPECT_EQ(packet[12], 0x00);
  EXPECT_EQ(packet[13], 0x00);
  EXPECT_EQ(packet[14], 0x00);  // RGB
  EXPECT_EQ(packet[15], 0x00);
  EXPECT_EQ(std::string(packet.begin() + 16, packet.begin() + 52), kConfigId);
}

TEST(HueStreamCodecTest, ChannelsAreBigEndianSixteenBit) {
  HueStreamEncoder encoder(kConfigId);
  std::vector<core::FixtureColor> colors = {
      {3, core::RgbF{170.0, 0.0, 255.0}},
      {9, core::RgbF{127.6, 1.0, 300.0}},
  };
  std::vector<uint8_t> packet = encoder.Encode(colors);
  ASSERT_EQ(packet.size(), HueStreamEncoder::kHeaderSize + 2 * HueStreamEncoder::kChannelSize);

  const uint8_t* ch = packet.data() + HueStreamEncoder::kHeaderSize;
  EXPECT_EQ(ch[0], 3);
  EXPECT_EQ(ch[1], 0xAA);
  EXPECT_EQ(ch[2], 0xAA);
  EXPECT_EQ(ch[3], 0x00);
  EXPECT_EQ(ch[4], 0x00);
  EXPECT_EQ(ch[5], 0xFF);
  EXPECT_EQ(ch[6], 0xFF);

  ch += HueStreamEncoder::kChannelSize;
  EXPECT_EQ(ch[0], 9);
  EXPECT_EQ(ch[1], 0x80);  // 128 * 257 = 0x8080
  EXPECT_EQ(ch[2], 0x80);
  EXPECT_EQ(ch[3], 0x01);  // 1 * 257 = 0x0101
  EXPECT_EQ(ch[4], 0x01);
  EXPECT_EQ(ch[5], 0xFF);  // clamped
  EXPECT_EQ(ch[6], 0xFF);
}

TEST(HueStreamCodecTest, SequenceAdvancesAndWraps) {
  HueStreamEncoder encoder(kConfigId);
  for (int i = 0; i < 255; ++i) encoder.Encode({});
  EXPECT_EQ(encoder.sequence(), 255);
  EXPECT_EQ(encoder.Encode({})[11], 255);
  EXPECT_EQ(encoder.Encode({})[11], 0);
}

TEST(HueStreamCodecTest, ScaleChannelClampsAndRounds) {
  EXPECT_EQ(HueStreamEncoder::ScaleChannel(-5.0), 0);
  EXPECT_EQ(HueStreamEncoder::ScaleChannel(0.4), 0);
  EXPECT_EQ(HueStreamEncoder::ScaleChannel(0.5), 257);
  EXPECT_EQ(HueStreamEncoder::ScaleChannel(254.6), 0xFFFF);
  EXPECT_EQ(HueStreamEncoder::ScaleChannel(1000.0), 0xFFFF);
}

TEST(HueStreamCodecTest, RejectsBadConfigIdAndTooManyChannels) {
  EXPECT_THROW(HueStreamEncoder("short"), std::invalid_argument);

  HueStreamEncoder encoder(kConfigId);
  std::vector<core::FixtureColor> colors(HueStreamEncoder::kMaxChannels + 1);
  EXPECT_THROW(encoder.Encode(colors), std::invalid_argument);
}

TEST(HueStreamCodecTest, DecodeHex) {
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(DecodeHex("00ffA510", bytes));
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x00, 0xFF, 0xA5, 0x10}));
  EXPECT_FALSE(DecodeHex("abc", bytes));
  EXPECT_FALSE(DecodeHex("zz", bytes));
}

}  // namespace
}  // namespace lumensync::bridge
