#include <gtest/gtest.h>
#include <vector>

#include "input/QuadratureDecoder.hpp"

namespace {

// States are (A<<1)|B.
std::vector<Direction> feed(QuadratureDecoder& dec, const std::vector<uint8_t>& states) {
  std::vector<Direction> out;
  for (uint8_t s : states) {
    Direction d = dec.observe((s & 2) != 0, (s & 1) != 0);
    if (d != Direction::None) out.push_back(d);
  }
  return out;
}

const std::vector<uint8_t> kCwDetent  = {0b01, 0b11, 0b10, 0b00};
const std::vector<uint8_t> kCcwDetent = {0b10, 0b11, 0b01, 0b00};

int count(const std::vector<Direction>& v, Direction d) {
  int n = 0;
  for (Direction x : v) if (x == d) n++;
  return n;
}

}  // namespace

TEST(QuadratureDecoder, SingleClockwiseDetent) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  auto out = feed(dec, kCwDetent);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], Direction::Clockwise);
}

TEST(QuadratureDecoder, NoEventUntilCycleCompletes) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  EXPECT_EQ(dec.observe(false, true), Direction::None);
  EXPECT_EQ(dec.observe(true, true), Direction::None);
  EXPECT_EQ(dec.observe(true, false), Direction::None);
  EXPECT_EQ(dec.pending(), 3);
  EXPECT_EQ(dec.observe(false, false), Direction::Clockwise);
  EXPECT_EQ(dec.pending(), 0);
}

TEST(QuadratureDecoder, NClockwiseDetentsGiveNEvents) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  std::vector<uint8_t> seq;
  for (int i = 0; i < 25; ++i) seq.insert(seq.end(), kCwDetent.begin(), kCwDetent.end());
  auto out = feed(dec, seq);
  EXPECT_EQ(count(out, Direction::Clockwise), 25);
  EXPECT_EQ(count(out, Direction::CounterClockwise), 0);
}

TEST(QuadratureDecoder, CounterClockwiseDetents) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  std::vector<uint8_t> seq;
  for (int i = 0; i < 3; ++i) seq.insert(seq.end(), kCcwDetent.begin(), kCcwDetent.end());
  auto out = feed(dec, seq);
  EXPECT_EQ(count(out, Direction::CounterClockwise), 3);
  EXPECT_EQ(count(out, Direction::Clockwise), 0);
}

TEST(QuadratureDecoder, BounceMidDetentStillYieldsOneEvent) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  // 00 -> 01 -> (bounce back to 00) -> 01 -> 11 -> 10 -> 00
  std::vector<uint8_t> seq = {0b01, 0b00, 0b01, 0b11, 0b10, 0b00};
  auto out = feed(dec, seq);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], Direction::Clockwise);
}

TEST(QuadratureDecoder, BounceOnEveryContactDoesNotDoubleCount) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  std::vector<uint8_t> seq = {0b01, 0b00, 0b01, 0b11, 0b01, 0b11, 0b10, 0b11, 0b10, 0b00, 0b10, 0b00};
  auto out = feed(dec, seq);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], Direction::Clockwise);
}

TEST(QuadratureDecoder, TwoBitJumpIsNoiseAndResyncs) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  EXPECT_EQ(dec.observe(false, true), Direction::None);
  EXPECT_EQ(dec.observe(true, false), Direction::None);   // 01 -> 10: both bits
  EXPECT_EQ(dec.pending(), 0);
  EXPECT_EQ(dec.state(), 0b10);
  // Remainder of the broken cycle lands on the detent without a step
  EXPECT_EQ(dec.observe(false, false), Direction::None);
  EXPECT_EQ(dec.pending(), 0);
  // The next full detent fires exactly on its last sub-step
  EXPECT_EQ(dec.observe(false, true), Direction::None);
  EXPECT_EQ(dec.observe(true, true), Direction::None);
  EXPECT_EQ(dec.observe(true, false), Direction::None);
  EXPECT_EQ(dec.observe(false, false), Direction::Clockwise);
}

TEST(QuadratureDecoder, MixedDirectionsInOrder) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  std::vector<uint8_t> seq;
  seq.insert(seq.end(), kCwDetent.begin(), kCwDetent.end());
  seq.insert(seq.end(), kCcwDetent.begin(), kCcwDetent.end());
  seq.insert(seq.end(), kCwDetent.begin(), kCwDetent.end());
  auto out = feed(dec, seq);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0], Direction::Clockwise);
  EXPECT_EQ(out[1], Direction::CounterClockwise);
  EXPECT_EQ(out[2], Direction::Clockwise);
}

TEST(QuadratureDecoder, ReversalMidDetentCancels) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  std::vector<uint8_t> seq = {0b01, 0b11, 0b01, 0b00};
  EXPECT_TRUE(feed(dec, seq).empty());
  EXPECT_EQ(dec.pending(), 0);
}

TEST(QuadratureDecoder, RepeatedStateIsIgnored) {
  QuadratureDecoder dec;
  dec.begin(false, false);
  std::vector<uint8_t> seq = {0b01, 0b01, 0b11, 0b11, 0b10, 0b00};
  auto out = feed(dec, seq);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], Direction::Clockwise);
}

TEST(QuadratureDecoder, ReversedWiringSwapsDirection) {
  QuadratureDecoder dec;
  dec.begin(false, false, true);
  auto out = feed(dec, kCwDetent);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], Direction::CounterClockwise);
}

TEST(QuadratureDecoder, SeedsFromPinLevels) {
  // Pull-up encoders usually rest at 11
  QuadratureDecoder dec;
  dec.begin(true, true);
  EXPECT_EQ(dec.state(), 0b11);
  auto out = feed(dec, {0b10, 0b00, 0b01, 0b11});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], Direction::Clockwise);
}

TEST(QuadratureDecoder, SeedCaughtMidCycleLearnsDetentFromFirstRestState) {
  // Pins read 10 at startup, knob then settles on its 11 detent
  QuadratureDecoder dec;
  dec.begin(true, false);
  EXPECT_FALSE(dec.anchored());
  EXPECT_EQ(dec.observe(true, true), Direction::None);
  ASSERT_TRUE(dec.anchored());
  EXPECT_EQ(dec.restState(), 0b11);

  const std::vector<uint8_t> cw  = {0b10, 0b00, 0b01, 0b11};
  const std::vector<uint8_t> ccw = {0b01, 0b00, 0b10, 0b11};
  for (int i = 1; i <= 3; ++i) {
    auto out = feed(dec, cw);
    ASSERT_EQ(out.size(), 1u) << "clockwise detent " << i;
    EXPECT_EQ(out[0], Direction::Clockwise);
  }
  for (int i = 1; i <= 3; ++i) {
    auto out = feed(dec, ccw);
    ASSERT_EQ(out.size(), 1u) << "counter-clockwise detent " << i;
    EXPECT_EQ(out[0], Direction::CounterClockwise);
  }
}

TEST(QuadratureDecoder, ReanchorMovesDetentToRestingState) {
  // Seeded on 00 but the knob really detents on 11
  QuadratureDecoder dec;
  dec.begin(false, false);
  feed(dec, {0b01, 0b11});
  EXPECT_TRUE(dec.reanchor());
  EXPECT_EQ(dec.restState(), 0b11);
  EXPECT_EQ(dec.pending(), 0);
  EXPECT_FALSE(dec.reanchor());   // already there

  auto out = feed(dec, {0b10, 0b00, 0b01, 0b11, 0b01, 0b00, 0b10, 0b11});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], Direction::Clockwise);
  EXPECT_EQ(out[1], Direction::CounterClockwise);
}

TEST(QuadratureDecoder, ReanchorRefusesTransitionalState) {
  QuadratureDecoder dec;
  dec.begin(true, true);
  feed(dec, {0b10});
  EXPECT_FALSE(dec.reanchor());
  EXPECT_EQ(dec.restState(), 0b11);
}
