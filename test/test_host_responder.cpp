#include <gtest/gtest.h>
#include <string.h>
#include <string>

#include "AmixerMixer.hpp"
#include "Responder.hpp"
#include "FakeMixer.hpp"

namespace {

class ResponderTest : public ::testing::Test {
protected:
  std::string send(const std::string& line) {
    char out[HostLink::kFrameCap];
    size_t n = responder.handle(line.c_str(), line.size(), out, sizeof(out));
    return std::string(out, n);
  }

  FakeMixer mixer;
  Responder responder{mixer, "Master"};
};

}  // namespace

TEST_F(ResponderTest, GetReportsMixerVolume) {
  mixer.volume = 66;
  EXPECT_EQ(send("{\"id\":1,\"op\":\"get\",\"control\":\"Master\"}"),
            "{\"id\":1,\"ok\":true,\"volume\":66}");
}

TEST_F(ResponderTest, SetAndMuteReachTheMixer) {
  EXPECT_EQ(send("{\"id\":2,\"op\":\"set\",\"control\":\"Master\",\"volume\":70}"),
            "{\"id\":2,\"ok\":true,\"volume\":70}");
  EXPECT_EQ(send("{\"id\":3,\"op\":\"mute\",\"control\":\"Master\",\"on\":true}"),
            "{\"id\":3,\"ok\":true,\"muted\":true}");
  ASSERT_EQ(mixer.calls.size(), 2u);
  EXPECT_EQ(mixer.calls[0], "set:70");
  EXPECT_EQ(mixer.calls[1], "mute:on");
  EXPECT_EQ(responder.served(), 2u);
}

TEST_F(ResponderTest, OtherControlIsRefusedWithoutTouchingMixer) {
  EXPECT_EQ(send("{\"id\":4,\"op\":\"set\",\"control\":\"PCM\",\"volume\":10}"),
            "{\"id\":4,\"ok\":false,\"error\":\"unknown control\"}");
  EXPECT_TRUE(mixer.calls.empty());
  EXPECT_EQ(responder.refused(), 1u);
}

TEST_F(ResponderTest, MixerFailureBecomesErrorReply) {
  mixer.failNext = 1;
  EXPECT_EQ(send("{\"id\":5,\"op\":\"set\",\"volume\":50}"),
            "{\"id\":5,\"ok\":false,\"error\":\"failed\"}");
  EXPECT_EQ(send("{\"id\":6,\"op\":\"set\",\"volume\":150}"),
            "{\"id\":6,\"ok\":false,\"error\":\"volume out of range\"}");
}

TEST_F(ResponderTest, KnobLogLinesGetNoReply) {
  EXPECT_EQ(send("I (812) KNOB: Volume 61"), "");
  EXPECT_EQ(send("{\"op\":\"get\"}"), "");
  EXPECT_EQ(send("{\"id\":7,\"op\":\"spin\"}"), "{\"id\":7,\"ok\":false,\"error\":\"unknown op\"}");
  EXPECT_TRUE(mixer.calls.empty());
}

TEST(AmixerOutput, ReadsVolumeAndSwitchFromLastLine) {
  const std::string out =
    "Simple mixer control 'Master',0\n"
    "  Capabilities: pvolume pswitch\n"
    "  Front Left: Playback 41287 [63%] [-14.00dB] [on]\n"
    "  Front Right: Playback 41287 [64%] [-13.50dB] [off]\n";
  int pct = 0;
  bool muted = false;
  ASSERT_TRUE(AmixerMixer::parseLevel(out, pct, muted));
  EXPECT_EQ(pct, 64);
  EXPECT_TRUE(muted);
}

TEST(AmixerOutput, ControlWithoutSwitchIsNeverMuted) {
  int pct = 0;
  bool muted = true;
  ASSERT_TRUE(AmixerMixer::parseLevel("  Mono: Playback 200 [78%] [-6.00dB]\n", pct, muted));
  EXPECT_EQ(pct, 78);
  EXPECT_FALSE(muted);
}

TEST(AmixerOutput, RejectsOutputWithoutPercentage) {
  int pct = 0;
  bool muted = false;
  EXPECT_FALSE(AmixerMixer::parseLevel("", pct, muted));
  EXPECT_FALSE(AmixerMixer::parseLevel("  Mono: Playback [on]\n", pct, muted));
  EXPECT_FALSE(AmixerMixer::parseLevel("  Mono: [abc%] [on]\n", pct, muted));
}

TEST(AmixerMixer, RefusesOptionLikeControlName) {
  AmixerMixer mixer("-c1");
  int pct = 0;
  EXPECT_FALSE(mixer.getVolume(pct));
  EXPECT_STREQ(mixer.lastError(), "bad control name");
}
