#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "sphere/header.hpp"

namespace sphere {

// ─── SPHERE Parameters ───────────────────────────────────────────────────────

// Typed view of the standard SPHERE fields. Optional members are absent from
// the header when nullopt.
struct SphereParams {
    std::optional<std::string> database_id;
    std::optional<std::string> database_version;
    std::optional<std::string> utterance_id;
    int channel_count = 1;
    int64_t sample_count = 0;
    int sample_rate = 16000;
    std::optional<int64_t> sample_min;
    std::optional<int64_t> sample_max;
    int sample_n_bytes = 2;
    std::optional<std::string> sample_byte_format;
    std::optional<int> sample_sig_bits;
    std::optional<std::string> sample_coding; // "pcm" when absent

    int64_t frame_size() const {
        return int64_t{channel_count} * sample_n_bytes;
    }

    bool operator==(const SphereParams &other) const = default;
};

// ─── Wave-style Parameters ───────────────────────────────────────────────────

struct WaveParams {
    int nchannels = 0;
    int sampwidth = 0;
    int framerate = 0;
    int64_t nframes = 0;
    std::string comptype = "NONE";
    std::string compname = "not compressed";

    bool operator==(const WaveParams &other) const = default;
};

// Standard field names.
namespace field {
inline constexpr const char *DATABASE_ID = "database_id";
inline constexpr const char *DATABASE_VERSION = "database_version";
inline constexpr const char *UTTERANCE_ID = "utterance_id";
inline constexpr const char *CHANNEL_COUNT = "channel_count";
inline constexpr const char *SAMPLE_COUNT = "sample_count";
inline constexpr const char *SAMPLE_RATE = "sample_rate";
inline constexpr const char *SAMPLE_MIN = "sample_min";
inline constexpr const char *SAMPLE_MAX = "sample_max";
inline constexpr const char *SAMPLE_N_BYTES = "sample_n_bytes";
inline constexpr const char *SAMPLE_BYTE_FORMAT = "sample_byte_format";
inline constexpr const char *SAMPLE_SIG_BITS = "sample_sig_bits";
inline constexpr const char *SAMPLE_CODING = "sample_coding";
} // namespace field

// Build a typed view from a parsed header. Throws MalformedHeaderError when a
// standard field has the wrong type or sample_n_bytes is missing. A missing
// channel_count defaults to 1, a missing sample_count or sample_rate to 0.
SphereParams params_from_header(const Header &header);

// Header fields for every set member, in canonical SPHERE order.
Header params_to_header(const SphereParams &params);

// Check the constraints between fields. Throws InvalidParameterError.
void validate_params(const SphereParams &params);

// Check types and constraints of the standard fields present in `header`.
// Fields that are absent are not required.
void validate_header_fields(const Header &header);

// Wave-style projection; computed, never stored.
WaveParams to_wave_params(const SphereParams &params);

// Header fields a SPHERE writer needs to reproduce a wave-style stream.
Header header_from_wave_params(const WaveParams &params);

} // namespace sphere
