#include "Responder.hpp"
#include <string.h>

Responder::Responder(Mixer& mixer, const char* control)
  : _mixer(mixer), _control(control ? control : "") {}

void Responder::refuse(HostLink::Reply& reply, const char* why) {
  reply.ok = false;
  strncpy(reply.error, why && why[0] ? why : "failed", sizeof(reply.error) - 1);
  reply.error[sizeof(reply.error) - 1] = '\0';
  _refused++;
}

void Responder::apply(const HostLink::Request& req, HostLink::Reply& reply) {
  if (req.control[0] && _control != req.control) {
    refuse(reply, "unknown control");
    return;
  }

  switch (req.op) {
    case HostLink::Op::Get: {
      int pct = 0;
      if (!_mixer.getVolume(pct)) { refuse(reply, _mixer.lastError()); return; }
      reply.hasVolume = true;
      reply.volume = pct;
      break;
    }
    case HostLink::Op::Set:
      if (req.volume < 0 || req.volume > 100) { refuse(reply, "volume out of range"); return; }
      if (!_mixer.setVolume(req.volume)) { refuse(reply, _mixer.lastError()); return; }
      reply.hasVolume = true;
      reply.volume = req.volume;
      break;
    case HostLink::Op::Mute:
      if (!_mixer.setMute(req.on)) { refuse(reply, _mixer.lastError()); return; }
      reply.hasMuted = true;
      reply.muted = req.on;
      break;
  }
  reply.ok = true;
  _served++;
}

size_t Responder::handle(const char* line, size_t len, char* out, size_t cap) {
  HostLink::Request req;
  HostLink::Reply reply;
  const char* why = nullptr;

  if (!HostLink::parseRequest(line, len, req, &why)) {
    if (!req.hasId) return 0;   // nothing to address an error to
    reply.id = req.id;
    refuse(reply, why);
  } else {
    reply.id = req.id;
    apply(req, reply);
  }
  return HostLink::encodeReply(reply, out, cap);
}
