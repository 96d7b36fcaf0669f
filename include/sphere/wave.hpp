#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sphere/params.hpp"
#include "sphere/session.hpp"

namespace sphere {

// ─── Wave-Compatible View ────────────────────────────────────────────────────

// Presents a Session through the accessor names of conventional PCM wave
// readers/writers. Holds only a reference: parameters are recomputed from
// the session on every call, and the view must not outlive the session.
class WaveView {
  public:
    explicit WaveView(Session &session) : session_(session) {}

    int getnchannels() const { return getparams().nchannels; }
    int getsampwidth() const { return getparams().sampwidth; }
    int getframerate() const { return getparams().framerate; }
    int64_t getnframes() const { return getparams().nframes; }
    std::string getcomptype() const { return getparams().comptype; }
    std::string getcompname() const { return getparams().compname; }

    WaveParams getparams() const;
    SphereParams get_sphparams() const { return session_.getparams(); }

    // Write mode: channel/width/rate/frame count as SPHERE fields.
    void setparams(const WaveParams &params);

    std::vector<uint8_t> readframes(int64_t n) {
        return session_.readframes(n);
    }
    void writeframes(const std::vector<uint8_t> &data) {
        session_.writeframes(data);
    }

    int64_t tell() const { return session_.tell(); }
    void setpos(int64_t pos) { session_.setpos(pos); }
    void rewind() { session_.rewind(); }
    void close() { session_.close(); }

    Session &session() const { return session_; }

  private:
    Session &session_;
};

} // namespace sphere
