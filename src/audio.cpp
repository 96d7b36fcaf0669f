#include "sphere/audio.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace sphere {

AudioData read_sphere_audio(Session &session) {
    auto params = session.getparams();
    int channels = params.channel_count;
    auto samples = session.readsamples(session.nframes() - session.tell());

    size_t frames = samples.size() / channels;
    const float scale =
        1.0f / static_cast<float>(int64_t{1} << (8 * params.sample_n_bytes - 1));
    const float inv_ch = 1.0f / static_cast<float>(channels);

    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += static_cast<float>(samples[i * channels + c]);
        }
        mono[i] = sum * inv_ch * scale;
    }

    float duration = params.sample_rate > 0
                         ? static_cast<float>(frames) /
                               static_cast<float>(params.sample_rate)
                         : 0.0f;

    auto tensor = axiom::Tensor::from_data(
        mono.data(), axiom::Shape{mono.size()}, true);

    return AudioData{
        std::move(tensor),
        params.sample_rate,
        channels,
        static_cast<int>(frames),
        duration,
    };
}

AudioData read_sphere_audio(const std::string &path,
                            const SessionOptions &options) {
    Session session(path, Mode::Read, options);
    auto audio = read_sphere_audio(session);
    session.close();
    return audio;
}

AudioData read_sphere_audio(Stream &stream, const SessionOptions &options) {
    Session session(stream, Mode::Read, options);
    auto audio = read_sphere_audio(session);
    session.close();
    return audio;
}

} // namespace sphere
