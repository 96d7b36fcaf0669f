#include "sphere/sample.hpp"

#include "sphere/error.hpp"

#include <bit>

namespace sphere {

// ─── Byte Format ─────────────────────────────────────────────────────────────

void check_sample_width(int n_bytes) {
    if (n_bytes != 1 && n_bytes != 2 && n_bytes != 4) {
        throw UnsupportedWidthError("Unsupported sample width: " +
                                    std::to_string(n_bytes) + " bytes");
    }
}

int64_t sample_min_value(int n_bytes) {
    return -(int64_t{1} << (8 * n_bytes - 1));
}

int64_t sample_max_value(int n_bytes) {
    return (int64_t{1} << (8 * n_bytes - 1)) - 1;
}

std::string ByteFormat::to_string() const {
    if (n_bytes == 1)
        return "1";
    std::string s;
    for (int i = 0; i < n_bytes; ++i)
        s += static_cast<char>('0' + significance[i]);
    return s;
}

ByteFormat parse_byte_format(const std::string &format, int n_bytes) {
    check_sample_width(n_bytes);

    ByteFormat bf;
    bf.n_bytes = n_bytes;
    if (format.empty() || n_bytes == 1) {
        if (n_bytes == 1 && format.size() > 1) {
            throw InvalidParameterError("Invalid sample_byte_format '" +
                                        format + "' for 1-byte samples");
        }
        return bf;
    }

    if (static_cast<int>(format.size()) != n_bytes) {
        throw InvalidParameterError("sample_byte_format '" + format +
                                    "' does not match sample_n_bytes " +
                                    std::to_string(n_bytes));
    }
    unsigned seen = 0;
    for (int i = 0; i < n_bytes; ++i) {
        int sig = format[i] - '0';
        if (sig < 0 || sig >= n_bytes || (seen & (1u << sig))) {
            throw InvalidParameterError("Invalid sample_byte_format '" +
                                        format + "'");
        }
        seen |= 1u << sig;
        bf.significance[i] = static_cast<uint8_t>(sig);
    }
    return bf;
}

ByteFormat native_byte_format(int n_bytes) {
    check_sample_width(n_bytes);
    ByteFormat bf;
    bf.n_bytes = n_bytes;
    if constexpr (std::endian::native == std::endian::big) {
        for (int i = 0; i < n_bytes; ++i)
            bf.significance[i] = static_cast<uint8_t>(n_bytes - 1 - i);
    }
    return bf;
}

// ─── Sample Codec ────────────────────────────────────────────────────────────

namespace {

int32_t load_sample(const uint8_t *p, int n_bytes, const ByteFormat &bf) {
    uint32_t v = 0;
    for (int i = 0; i < n_bytes; ++i)
        v |= static_cast<uint32_t>(p[i]) << (8 * bf.significance[i]);
    if (n_bytes < 4) {
        uint32_t sign = 1u << (8 * n_bytes - 1);
        v = (v ^ sign) - sign; // sign-extend
    }
    return static_cast<int32_t>(v);
}

void store_sample(uint8_t *p, int32_t value, int n_bytes,
                  const ByteFormat &bf) {
    auto v = static_cast<uint32_t>(value);
    for (int i = 0; i < n_bytes; ++i)
        p[i] = static_cast<uint8_t>(v >> (8 * bf.significance[i]));
}

void check_channels(int channel_count) {
    if (channel_count < 1) {
        throw InvalidParameterError("channel_count must be >= 1, got " +
                                    std::to_string(channel_count));
    }
}

} // namespace

std::vector<int32_t> decode_samples(const uint8_t *data, size_t len,
                                    int n_bytes, const ByteFormat &format,
                                    int channel_count, size_t frame_count) {
    check_sample_width(n_bytes);
    check_channels(channel_count);
    if (format.n_bytes != n_bytes) {
        throw InvalidParameterError("Byte format width does not match sample "
                                    "width");
    }

    size_t total = frame_count * static_cast<size_t>(channel_count);
    size_t needed = total * static_cast<size_t>(n_bytes);
    if (len < needed) {
        throw TruncatedDataError("Need " + std::to_string(needed) +
                                 " sample bytes for " +
                                 std::to_string(frame_count) +
                                 " frames, got " + std::to_string(len));
    }

    std::vector<int32_t> samples(total);
    for (size_t i = 0; i < total; ++i)
        samples[i] = load_sample(data + i * n_bytes, n_bytes, format);
    return samples;
}

std::vector<int32_t> decode_samples(const std::vector<uint8_t> &data,
                                    int n_bytes, const std::string &format,
                                    int channel_count, size_t frame_count) {
    return decode_samples(data.data(), data.size(), n_bytes,
                          parse_byte_format(format, n_bytes), channel_count,
                          frame_count);
}

std::vector<uint8_t> encode_samples(const std::vector<int32_t> &samples,
                                    int n_bytes, const ByteFormat &format,
                                    int channel_count) {
    check_sample_width(n_bytes);
    check_channels(channel_count);
    if (format.n_bytes != n_bytes) {
        throw InvalidParameterError("Byte format width does not match sample "
                                    "width");
    }
    if (samples.size() % static_cast<size_t>(channel_count) != 0) {
        throw InvalidParameterError(
            std::to_string(samples.size()) +
            " samples is not a whole number of " +
            std::to_string(channel_count) + "-channel frames");
    }

    const int64_t lo = sample_min_value(n_bytes);
    const int64_t hi = sample_max_value(n_bytes);

    std::vector<uint8_t> out(samples.size() * n_bytes);
    for (size_t i = 0; i < samples.size(); ++i) {
        if (samples[i] < lo || samples[i] > hi) {
            throw InvalidParameterError(
                "Sample value " + std::to_string(samples[i]) +
                " does not fit in " + std::to_string(n_bytes) + " bytes");
        }
        store_sample(out.data() + i * n_bytes, samples[i], n_bytes, format);
    }
    return out;
}

std::vector<uint8_t> encode_samples(const std::vector<int32_t> &samples,
                                    int n_bytes, const std::string &format,
                                    int channel_count) {
    return encode_samples(samples, n_bytes, parse_byte_format(format, n_bytes),
                          channel_count);
}

void convert_byte_format(uint8_t *data, size_t len, const ByteFormat &from,
                         const ByteFormat &to) {
    if (from.n_bytes != to.n_bytes) {
        throw InvalidParameterError("Cannot convert between byte formats of "
                                    "different widths");
    }
    const int n = from.n_bytes;
    if (from == to || n == 1)
        return;
    if (len % static_cast<size_t>(n) != 0) {
        throw InvalidParameterError(std::to_string(len) +
                                    " bytes is not a whole number of " +
                                    std::to_string(n) + "-byte samples");
    }

    // position in `from` holding each significance
    std::array<uint8_t, 4> src_of{};
    for (int i = 0; i < n; ++i)
        src_of[from.significance[i]] = static_cast<uint8_t>(i);

    uint8_t tmp[4];
    for (size_t off = 0; off < len; off += n) {
        uint8_t *p = data + off;
        for (int i = 0; i < n; ++i)
            tmp[i] = p[src_of[to.significance[i]]];
        for (int i = 0; i < n; ++i)
            p[i] = tmp[i];
    }
}

std::vector<std::vector<int32_t>>
deinterleave(const std::vector<int32_t> &samples, int channel_count) {
    check_channels(channel_count);
    size_t frames = samples.size() / channel_count;
    std::vector<std::vector<int32_t>> channels(channel_count);
    for (auto &ch : channels)
        ch.reserve(frames);
    for (size_t i = 0; i < frames; ++i) {
        for (int c = 0; c < channel_count; ++c)
            channels[c].push_back(samples[i * channel_count + c]);
    }
    return channels;
}

} // namespace sphere
