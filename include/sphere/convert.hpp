#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sphere/header.hpp"

namespace sphere {

enum class AudioFormat { Unknown, SPHERE, WAV, RAW };

// Suffix used for output files: "sph", "wav", "raw".
std::string format_suffix(AudioFormat fmt);
// Inverse of format_suffix ("sph"/"sphere", "wav"/"wave", "raw").
AudioFormat parse_format_name(const std::string &name);

AudioFormat detect_format_by_extension(const std::string &path);
AudioFormat detect_format_by_magic(const uint8_t *data, size_t len);

// Magic-byte detection on a file. TIMIT ships SPHERE data under .WAV names,
// so content wins over the extension.
AudioFormat detect_file_format(const std::string &path);

// ─── PCM Buffer ──────────────────────────────────────────────────────────────

// Decoded interleaved integer PCM plus the source SPHERE header, if any.
struct PcmBuffer {
    int channels = 1;
    int sample_rate = 16000;
    int sample_n_bytes = 2;
    std::vector<int32_t> samples; // interleaved, frame-major
    std::optional<Header> sphere_header;

    int64_t frames() const {
        return static_cast<int64_t>(samples.size()) / channels;
    }
};

PcmBuffer read_sphere_pcm(const std::string &path);
PcmBuffer read_wav_pcm(const std::string &path);

void write_sphere_pcm(const std::string &path, const PcmBuffer &pcm);
void write_wav_pcm(const std::string &path, const PcmBuffer &pcm);
// Headerless host-order samples.
void write_raw_pcm(const std::string &path, const PcmBuffer &pcm);

// ─── File Conversion ─────────────────────────────────────────────────────────

// Convert one SPHERE or WAV file to `out_format`. Returns the detected input
// format. Throws std::runtime_error for an unrecognised input.
AudioFormat convert_file(const std::string &input, const std::string &output,
                         AudioFormat out_format);

} // namespace sphere
