#pragma once

#include <string>

#include <axiom/axiom.hpp>

#include "sphere/session.hpp"
#include "sphere/stream.hpp"

namespace sphere {

struct AudioData {
    axiom::Tensor samples; // float32, (num_samples,), mono, [-1,1]
    int sample_rate;
    int num_channels; // original channel count before downmix
    int num_samples;  // = samples.shape()[0]
    float duration;   // seconds
};

// Read a SPHERE file as float32 samples in [-1, 1]. Integer samples are
// scaled by 1 / 2^(8 * sample_n_bytes - 1); multi-channel audio is
// downmixed to mono.
AudioData read_sphere_audio(const std::string &path,
                            const SessionOptions &options = {});
AudioData read_sphere_audio(Stream &stream,
                            const SessionOptions &options = {});

// Remaining frames of an open read session.
AudioData read_sphere_audio(Session &session);

} // namespace sphere
