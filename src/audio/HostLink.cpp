#include "HostLink.hpp"
#include <ArduinoJson.h>
#include <string.h>

namespace {
  constexpr size_t kDocCap = 192;   // ArduinoJson document capacity
}

namespace HostLink {

const char* opName(Op op) {
  switch (op) {
    case Op::Get:  return "get";
    case Op::Set:  return "set";
    case Op::Mute: return "mute";
  }
  return "?";
}

bool opFromName(const char* name, Op& out) {
  if (!name) return false;
  if (strcmp(name, "get") == 0)  { out = Op::Get;  return true; }
  if (strcmp(name, "set") == 0)  { out = Op::Set;  return true; }
  if (strcmp(name, "mute") == 0) { out = Op::Mute; return true; }
  return false;
}

size_t encodeRequest(uint32_t id, Op op, int value, const char* control, char* buf, size_t cap) {
  if (!buf || cap == 0) return 0;

  StaticJsonDocument<kDocCap> doc;
  doc["id"] = id;
  doc["op"] = opName(op);
  if (control && control[0]) doc["control"] = control;
  if (op == Op::Set)  doc["volume"] = value;
  if (op == Op::Mute) doc["on"] = (value != 0);

  size_t needed = measureJson(doc);
  if (needed >= cap) return 0;
  return serializeJson(doc, buf, cap);
}

bool parseReply(const char* line, size_t len, Reply& out) {
  if (!line || !looksLikeFrame(line, len)) return false;

  StaticJsonDocument<kDocCap> doc;
  DeserializationError err = deserializeJson(doc, line, len);
  if (err) return false;

  if (!doc["id"].is<uint32_t>() || !doc["ok"].is<bool>()) return false;

  out = Reply{};
  out.id = doc["id"].as<uint32_t>();
  out.ok = doc["ok"].as<bool>();

  if (doc["volume"].is<int>()) {
    out.hasVolume = true;
    out.volume = doc["volume"].as<int>();
  }
  if (doc["muted"].is<bool>()) {
    out.hasMuted = true;
    out.muted = doc["muted"].as<bool>();
  }
  const char* e = doc["error"].as<const char*>();
  if (e) {
    strncpy(out.error, e, sizeof(out.error) - 1);
    out.error[sizeof(out.error) - 1] = '\0';
  }
  return true;
}

static bool reject(const char** why, const char* msg) {
  if (why) *why = msg;
  return false;
}

bool parseRequest(const char* line, size_t len, Request& out, const char** why) {
  out = Request{};
  if (!line || !looksLikeFrame(line, len)) return reject(why, "not a frame");

  StaticJsonDocument<kDocCap> doc;
  DeserializationError err = deserializeJson(doc, line, len);
  if (err) return reject(why, "malformed frame");

  if (!doc["id"].is<uint32_t>()) return reject(why, "missing id");
  out.id = doc["id"].as<uint32_t>();
  out.hasId = true;

  if (!opFromName(doc["op"].as<const char*>(), out.op)) return reject(why, "unknown op");

  const char* control = doc["control"].as<const char*>();
  if (control) {
    if (strlen(control) >= sizeof(out.control)) return reject(why, "control name too long");
    strcpy(out.control, control);
  }

  if (out.op == Op::Set) {
    if (!doc["volume"].is<int>()) return reject(why, "set without volume");
    out.volume = doc["volume"].as<int>();
  }
  if (out.op == Op::Mute) {
    if (!doc["on"].is<bool>()) return reject(why, "mute without on");
    out.on = doc["on"].as<bool>();
  }
  if (why) *why = nullptr;
  return true;
}

size_t encodeReply(const Reply& reply, char* buf, size_t cap) {
  if (!buf || cap == 0) return 0;

  StaticJsonDocument<kDocCap> doc;
  doc["id"] = reply.id;
  doc["ok"] = reply.ok;
  if (reply.hasVolume) doc["volume"] = reply.volume;
  if (reply.hasMuted)  doc["muted"] = reply.muted;
  if (!reply.ok && reply.error[0]) doc["error"] = (const char*)reply.error;

  size_t needed = measureJson(doc);
  if (needed >= cap) return 0;
  return serializeJson(doc, buf, cap);
}

} // namespace HostLink
