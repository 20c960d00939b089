// File Overview: volknob-host. Serves the knob's mixer requests on a Linux host: reads
// HostLink frames from the knob's serial port, applies them to an ALSA control with
// amixer and writes the replies back. Reopens the port when the knob is unplugged.
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <unistd.h>

#include "AmixerMixer.hpp"
#include "Responder.hpp"
#include "SerialPort.hpp"
#include "config/KnobConfig.hpp"

namespace {
  volatile sig_atomic_t g_stop = 0;
  constexpr int READ_TIMEOUT_MS = 500;
  constexpr unsigned REOPEN_DELAY_S = 1;

  void onSignal(int) { g_stop = 1; }

  void usage(const char* argv0) {
    fprintf(stderr,
            "usage: %s [-d device] [-b baud] [-c control] [-v]\n"
            "  -d  knob serial port (default /dev/ttyACM0)\n"
            "  -b  baud rate (default 115200)\n"
            "  -c  ALSA simple control (default Master)\n"
            "  -v  echo knob log lines and every request\n", argv0);
  }
}

int main(int argc, char** argv) {
  const char* device = "/dev/ttyACM0";
  const char* control = "Master";
  uint32_t baud = 115200;
  bool verbose = false;

  int opt;
  while ((opt = getopt(argc, argv, "d:b:c:vh")) != -1) {
    switch (opt) {
      case 'd': device = optarg; break;
      case 'b': baud = (uint32_t)strtoul(optarg, nullptr, 10); break;
      case 'c': control = optarg; break;
      case 'v': verbose = true; break;
      default:  usage(argv[0]); return opt == 'h' ? 0 : 2;
    }
  }
  if (!linkBaudSupported(baud)) {
    fprintf(stderr, "[HOST] unsupported baud rate %u\n", (unsigned)baud);
    return 2;
  }
  if (!control[0] || control[0] == '-') {
    fprintf(stderr, "[HOST] bad control name '%s'\n", control);
    return 2;
  }

  signal(SIGINT, onSignal);
  signal(SIGTERM, onSignal);

  AmixerMixer mixer(control);
  Responder responder(mixer, control);

  int pct = 0;
  if (mixer.getVolume(pct)) {
    fprintf(stderr, "[HOST] control '%s' at %d%%%s\n", control, pct, mixer.muted() ? " (muted)" : "");
  } else {
    fprintf(stderr, "[HOST] control '%s' not readable: %s\n", control, mixer.lastError());
  }

  SerialPort port;
  std::string line;
  char reply[HostLink::kFrameCap];
  bool warnedOpen = false;

  while (!g_stop) {
    if (!port.isOpen()) {
      std::string err;
      if (!port.open(device, baud, err)) {
        if (!warnedOpen) fprintf(stderr, "[HOST] waiting for knob: %s\n", err.c_str());
        warnedOpen = true;
        sleep(REOPEN_DELAY_S);
        continue;
      }
      warnedOpen = false;
      fprintf(stderr, "[HOST] serving %s at %u baud\n", device, (unsigned)baud);
    }

    switch (port.readLine(line, READ_TIMEOUT_MS, HostLink::kFrameCap)) {
      case SerialPort::Read::Timeout:
        break;
      case SerialPort::Read::Closed:
        fprintf(stderr, "[HOST] %s closed (served=%u refused=%u)\n", device,
                (unsigned)responder.served(), (unsigned)responder.refused());
        port.close();
        break;
      case SerialPort::Read::Line: {
        size_t n = responder.handle(line.c_str(), line.size(), reply, sizeof(reply));
        if (n == 0) {
          if (verbose) fprintf(stderr, "[KNOB] %s\n", line.c_str());
          break;
        }
        if (verbose) fprintf(stderr, "[HOST] %s -> %.*s\n", line.c_str(), (int)n, reply);
        if (!port.writeLine(reply, n)) {
          fprintf(stderr, "[HOST] write to %s failed\n", device);
          port.close();
        }
        break;
      }
    }
  }
  fprintf(stderr, "[HOST] stopping (served=%u refused=%u)\n",
          (unsigned)responder.served(), (unsigned)responder.refused());
  return 0;
}
