// File Overview: Host-side Mixer adapter that drives one ALSA simple control through
// the amixer command line tool, the way the knob's requests are finally applied.
#pragma once
#include <string>
#include <vector>

#include "audio/Mixer.hpp"

class AmixerMixer : public Mixer {
public:
  explicit AmixerMixer(const char* control);

  bool getVolume(int& pct) override;
  bool setVolume(int pct) override;
  bool setMute(bool on) override;
  const char* name() const override { return "amixer"; }
  const char* lastError() const override { return _lastError.c_str(); }

  const std::string& control() const { return _control; }
  bool muted() const { return _muted; }

  // Reads the last line of `amixer get/set` output, e.g.
  //   "  Front Right: Playback 42 [66%] [-12.00dB] [on]"
  // Volume is the first [NN%]; muted only when the last bracket is [off].
  static bool parseLevel(const std::string& output, int& pct, bool& muted);

private:
  bool run(const std::vector<std::string>& args, std::string& output);
  bool runAndParse(const std::vector<std::string>& args);

  std::string _control;
  std::string _lastError;
  int  _volume = 0;
  bool _muted = false;
};
