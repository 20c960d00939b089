// File Overview: Host end of the knob link. Turns one request line into one reply line
// by applying it to a Mixer; anything that isn't a request (knob boot banner, log
// lines) gets no reply.
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "audio/HostLink.hpp"
#include "audio/Mixer.hpp"

class Responder {
public:
  // control is the only control this host serves; requests naming another are refused.
  Responder(Mixer& mixer, const char* control);

  // Returns the reply length written to out (no newline), 0 if the line gets no reply.
  size_t handle(const char* line, size_t len, char* out, size_t cap);

  uint32_t served() const { return _served; }
  uint32_t refused() const { return _refused; }

private:
  void apply(const HostLink::Request& req, HostLink::Reply& reply);
  void refuse(HostLink::Reply& reply, const char* why);

  Mixer& _mixer;
  std::string _control;
  uint32_t _served = 0;
  uint32_t _refused = 0;
};
