#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sphere {

// ─── Byte Format ─────────────────────────────────────────────────────────────

// Parsed sample_byte_format. The header string lists, for each byte position
// in the file, the significance of that byte: "01" is little-endian, "10"
// big-endian, "1032" is a 32-bit value stored as two little-endian words in
// big-endian order.
struct ByteFormat {
    int n_bytes = 2;
    std::array<uint8_t, 4> significance{0, 1, 2, 3}; // per file byte

    // Header spelling of this format ("01", "3210", ...).
    std::string to_string() const;

    bool operator==(const ByteFormat &other) const = default;
};

// Parse a sample_byte_format for samples of n_bytes. An empty string means
// little-endian. Throws InvalidParameterError for a malformed format and
// UnsupportedWidthError for n_bytes outside {1, 2, 4}.
ByteFormat parse_byte_format(const std::string &format, int n_bytes);

// Byte format matching this machine's integer layout.
ByteFormat native_byte_format(int n_bytes);

// Throws UnsupportedWidthError unless n_bytes is 1, 2 or 4.
void check_sample_width(int n_bytes);

// Signed range of an n_bytes sample.
int64_t sample_min_value(int n_bytes);
int64_t sample_max_value(int n_bytes);

// ─── Sample Codec ────────────────────────────────────────────────────────────

// Decode frame_count frames of interleaved samples (frame-major: ch0, ch1,
// ..., ch0, ch1, ...). Bytes beyond the requested frames are ignored.
std::vector<int32_t> decode_samples(const uint8_t *data, size_t len,
                                    int n_bytes, const ByteFormat &format,
                                    int channel_count, size_t frame_count);

std::vector<int32_t> decode_samples(const std::vector<uint8_t> &data,
                                    int n_bytes, const std::string &format,
                                    int channel_count, size_t frame_count);

// Inverse of decode_samples. samples.size() must be a multiple of
// channel_count and every value must fit in n_bytes.
std::vector<uint8_t> encode_samples(const std::vector<int32_t> &samples,
                                    int n_bytes, const ByteFormat &format,
                                    int channel_count);

std::vector<uint8_t> encode_samples(const std::vector<int32_t> &samples,
                                    int n_bytes, const std::string &format,
                                    int channel_count);

// Reorder raw sample bytes in place from one byte format to another.
void convert_byte_format(uint8_t *data, size_t len, const ByteFormat &from,
                         const ByteFormat &to);

// Split interleaved samples into one vector per channel.
std::vector<std::vector<int32_t>>
deinterleave(const std::vector<int32_t> &samples, int channel_count);

} // namespace sphere
