// File Overview: Newline-delimited JSON frames exchanged with the host that owns the
// audio mixer. The knob encodes requests and parses replies; the host responder
// (host/Responder) parses requests, applies them through amixer and encodes replies
// carrying the same id.
//
//   -> {"id":7,"op":"set","control":"Master","volume":42}
//   <- {"id":7,"ok":true,"volume":42}
//   -> {"id":8,"op":"mute","control":"Master","on":true}
//   <- {"id":8,"ok":true,"muted":true}
//   -> {"id":9,"op":"get","control":"PCM"}
//   <- {"id":9,"ok":false,"error":"unknown control"}
#pragma once
#include <stddef.h>
#include <stdint.h>

namespace HostLink {

enum class Op : uint8_t { Get, Set, Mute };

struct Reply {
  uint32_t id = 0;
  bool ok = false;
  bool hasVolume = false;
  int  volume = 0;
  bool hasMuted = false;
  bool muted = false;
  char error[48] = {0};
};

struct Request {
  uint32_t id = 0;
  bool hasId = false;     // set even when the rest of the frame is bad
  Op   op = Op::Get;
  char control[32] = {0};
  int  volume = 0;        // Set
  bool on = false;        // Mute
};

constexpr size_t kFrameCap = 128;   // longest request or reply line, without '\n'

// Writes one frame (no trailing newline) into buf. value is the volume for Set and
// 0/1 for Mute; ignored for Get. Returns the length, 0 if it didn't fit.
size_t encodeRequest(uint32_t id, Op op, int value, const char* control, char* buf, size_t cap);

// Parses one reply line. Returns false for anything that isn't a well-formed reply
// (log noise, truncated frames, missing id/ok).
bool parseReply(const char* line, size_t len, Reply& out);

// Host side. Returns false and points why at a static message for anything that
// isn't a complete request; out.hasId tells whether an error reply can be addressed.
bool parseRequest(const char* line, size_t len, Request& out, const char** why);

// Host side. Same contract as encodeRequest.
size_t encodeReply(const Reply& reply, char* buf, size_t cap);

inline bool looksLikeFrame(const char* line, size_t len) { return len > 0 && line[0] == '{'; }

const char* opName(Op op);
bool opFromName(const char* name, Op& out);

} // namespace HostLink
