#include <gtest/gtest.h>
#include <string.h>
#include <string>

#include "audio/HostLink.hpp"

TEST(HostLink, EncodesSetRequest) {
  char buf[HostLink::kFrameCap];
  size_t n = HostLink::encodeRequest(7, HostLink::Op::Set, 42, "Master", buf, sizeof(buf));
  ASSERT_GT(n, 0u);
  EXPECT_EQ(std::string(buf, n), "{\"id\":7,\"op\":\"set\",\"control\":\"Master\",\"volume\":42}");
}

TEST(HostLink, EncodesMuteAndGet) {
  char buf[HostLink::kFrameCap];
  size_t n = HostLink::encodeRequest(8, HostLink::Op::Mute, 1, "PCM", buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "{\"id\":8,\"op\":\"mute\",\"control\":\"PCM\",\"on\":true}");
  n = HostLink::encodeRequest(9, HostLink::Op::Get, 0, nullptr, buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "{\"id\":9,\"op\":\"get\"}");
}

TEST(HostLink, RequestThatDoesNotFitIsRefused) {
  char buf[16];
  EXPECT_EQ(HostLink::encodeRequest(1, HostLink::Op::Set, 42, "Master", buf, sizeof(buf)), 0u);
}

TEST(HostLink, ParsesSuccessReply) {
  const char* line = "{\"id\":7,\"ok\":true,\"volume\":42,\"muted\":false}";
  HostLink::Reply r;
  ASSERT_TRUE(HostLink::parseReply(line, strlen(line), r));
  EXPECT_EQ(r.id, 7u);
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.hasVolume);
  EXPECT_EQ(r.volume, 42);
  EXPECT_TRUE(r.hasMuted);
  EXPECT_FALSE(r.muted);
}

TEST(HostLink, ParsesErrorReply) {
  const char* line = "{\"id\":3,\"ok\":false,\"error\":\"amixer exited 1\"}";
  HostLink::Reply r;
  ASSERT_TRUE(HostLink::parseReply(line, strlen(line), r));
  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.hasVolume);
  EXPECT_STREQ(r.error, "amixer exited 1");
}

TEST(HostLink, RejectsNoiseAndIncompleteFrames) {
  HostLink::Reply r;
  const char* log = "I (1234) KNOB: Volume 42";
  EXPECT_FALSE(HostLink::parseReply(log, strlen(log), r));
  const char* truncated = "{\"id\":7,\"ok\":tr";
  EXPECT_FALSE(HostLink::parseReply(truncated, strlen(truncated), r));
  const char* noId = "{\"ok\":true}";
  EXPECT_FALSE(HostLink::parseReply(noId, strlen(noId), r));
  const char* noOk = "{\"id\":1,\"volume\":3}";
  EXPECT_FALSE(HostLink::parseReply(noOk, strlen(noOk), r));
}

TEST(HostLink, ParsesRequestsTheKnobSends) {
  char buf[HostLink::kFrameCap];
  size_t n = HostLink::encodeRequest(12, HostLink::Op::Set, 64, "Master", buf, sizeof(buf));
  HostLink::Request req;
  const char* why = "unset";
  ASSERT_TRUE(HostLink::parseRequest(buf, n, req, &why));
  EXPECT_EQ(why, nullptr);
  EXPECT_EQ(req.id, 12u);
  EXPECT_EQ(req.op, HostLink::Op::Set);
  EXPECT_STREQ(req.control, "Master");
  EXPECT_EQ(req.volume, 64);

  const char* mute = "{\"id\":13,\"op\":\"mute\",\"on\":false}";
  ASSERT_TRUE(HostLink::parseRequest(mute, strlen(mute), req, nullptr));
  EXPECT_EQ(req.op, HostLink::Op::Mute);
  EXPECT_FALSE(req.on);
  EXPECT_STREQ(req.control, "");
}

TEST(HostLink, BadRequestKeepsIdForTheErrorReply) {
  HostLink::Request req;
  const char* why = nullptr;
  const char* unknownOp = "{\"id\":4,\"op\":\"louder\"}";
  EXPECT_FALSE(HostLink::parseRequest(unknownOp, strlen(unknownOp), req, &why));
  EXPECT_TRUE(req.hasId);
  EXPECT_EQ(req.id, 4u);
  EXPECT_STREQ(why, "unknown op");

  const char* setNoVolume = "{\"id\":5,\"op\":\"set\"}";
  EXPECT_FALSE(HostLink::parseRequest(setNoVolume, strlen(setNoVolume), req, &why));
  EXPECT_TRUE(req.hasId);
  EXPECT_STREQ(why, "set without volume");

  const char* banner = "[KNOB] volume knob 1.0.0";
  EXPECT_FALSE(HostLink::parseRequest(banner, strlen(banner), req, &why));
  EXPECT_FALSE(req.hasId);
}

TEST(HostLink, EncodedReplyParsesBackOnTheKnob) {
  HostLink::Reply out;
  out.id = 21;
  out.ok = true;
  out.hasMuted = true;
  out.muted = true;
  char buf[HostLink::kFrameCap];
  size_t n = HostLink::encodeReply(out, buf, sizeof(buf));
  EXPECT_EQ(std::string(buf, n), "{\"id\":21,\"ok\":true,\"muted\":true}");

  HostLink::Reply in;
  ASSERT_TRUE(HostLink::parseReply(buf, n, in));
  EXPECT_EQ(in.id, 21u);
  EXPECT_TRUE(in.hasMuted);
  EXPECT_TRUE(in.muted);
  EXPECT_FALSE(in.hasVolume);
}
