#include "sphere/params.hpp"

#include "sphere/error.hpp"
#include "sphere/sample.hpp"

#include <limits>

namespace sphere {

namespace {

const char *type_name(FieldType t) {
    switch (t) {
    case FieldType::Integer:
        return "integer";
    case FieldType::Real:
        return "real";
    case FieldType::String:
        return "string";
    }
    return "?";
}

template <typename Error>
void expect_type(const Header &header, const char *name, FieldType want) {
    auto *f = header.find(name);
    if (f && f->type() != want) {
        throw Error(std::string("Header field '") + name + "' must be " +
                    type_name(want) + ", got " + type_name(f->type()));
    }
}

template <typename Error> void expect_standard_types(const Header &header) {
    for (auto name : {field::DATABASE_ID, field::DATABASE_VERSION,
                      field::UTTERANCE_ID, field::SAMPLE_BYTE_FORMAT,
                      field::SAMPLE_CODING}) {
        expect_type<Error>(header, name, FieldType::String);
    }
    for (auto name : {field::CHANNEL_COUNT, field::SAMPLE_COUNT,
                      field::SAMPLE_RATE, field::SAMPLE_MIN, field::SAMPLE_MAX,
                      field::SAMPLE_N_BYTES, field::SAMPLE_SIG_BITS}) {
        expect_type<Error>(header, name, FieldType::Integer);
    }
}

int to_int(int64_t v, const char *name) {
    if (v < std::numeric_limits<int>::min() ||
        v > std::numeric_limits<int>::max()) {
        throw MalformedHeaderError(std::string("Header field '") + name +
                                    "' out of range: " + std::to_string(v));
    }
    return static_cast<int>(v);
}

} // namespace

SphereParams params_from_header(const Header &header) {
    expect_standard_types<MalformedHeaderError>(header);

    auto n_bytes = header.get_int(field::SAMPLE_N_BYTES);
    if (!n_bytes) {
        throw MalformedHeaderError("Header is missing sample_n_bytes");
    }

    SphereParams p;
    p.database_id = header.get_string(field::DATABASE_ID);
    p.database_version = header.get_string(field::DATABASE_VERSION);
    p.utterance_id = header.get_string(field::UTTERANCE_ID);
    p.channel_count =
        to_int(header.get_int(field::CHANNEL_COUNT).value_or(1),
               field::CHANNEL_COUNT);
    p.sample_count = header.get_int(field::SAMPLE_COUNT).value_or(0);
    p.sample_rate =
        to_int(header.get_int(field::SAMPLE_RATE).value_or(0),
               field::SAMPLE_RATE);
    p.sample_min = header.get_int(field::SAMPLE_MIN);
    p.sample_max = header.get_int(field::SAMPLE_MAX);
    p.sample_n_bytes = to_int(*n_bytes, field::SAMPLE_N_BYTES);
    p.sample_byte_format = header.get_string(field::SAMPLE_BYTE_FORMAT);
    if (auto bits = header.get_int(field::SAMPLE_SIG_BITS))
        p.sample_sig_bits = to_int(*bits, field::SAMPLE_SIG_BITS);
    p.sample_coding = header.get_string(field::SAMPLE_CODING);
    return p;
}

Header params_to_header(const SphereParams &p) {
    Header h;
    if (p.database_id)
        h.set(field::DATABASE_ID, *p.database_id);
    if (p.database_version)
        h.set(field::DATABASE_VERSION, *p.database_version);
    if (p.utterance_id)
        h.set(field::UTTERANCE_ID, *p.utterance_id);
    h.set(field::CHANNEL_COUNT, int64_t{p.channel_count});
    h.set(field::SAMPLE_COUNT, p.sample_count);
    h.set(field::SAMPLE_RATE, int64_t{p.sample_rate});
    if (p.sample_min)
        h.set(field::SAMPLE_MIN, *p.sample_min);
    if (p.sample_max)
        h.set(field::SAMPLE_MAX, *p.sample_max);
    h.set(field::SAMPLE_N_BYTES, int64_t{p.sample_n_bytes});
    if (p.sample_byte_format)
        h.set(field::SAMPLE_BYTE_FORMAT, *p.sample_byte_format);
    if (p.sample_sig_bits)
        h.set(field::SAMPLE_SIG_BITS, int64_t{*p.sample_sig_bits});
    if (p.sample_coding)
        h.set(field::SAMPLE_CODING, *p.sample_coding);
    return h;
}

void validate_params(const SphereParams &p) {
    if (p.sample_n_bytes != 1 && p.sample_n_bytes != 2 &&
        p.sample_n_bytes != 4) {
        throw InvalidParameterError("sample_n_bytes must be 1, 2 or 4, got " +
                                    std::to_string(p.sample_n_bytes));
    }
    if (p.channel_count < 1 || p.channel_count > MAX_CHANNEL_COUNT) {
        throw InvalidParameterError(
            "channel_count must be in [1, " +
            std::to_string(MAX_CHANNEL_COUNT) + "], got " +
            std::to_string(p.channel_count));
    }
    if (p.sample_count < 0) {
        throw InvalidParameterError("sample_count must be >= 0, got " +
                                    std::to_string(p.sample_count));
    }
    // 0 stands for an absent sample_rate
    if (p.sample_rate < 0) {
        throw InvalidParameterError("sample_rate must not be negative, got " +
                                    std::to_string(p.sample_rate));
    }

    int width_bits = 8 * p.sample_n_bytes;
    if (p.sample_sig_bits &&
        (*p.sample_sig_bits < 1 || *p.sample_sig_bits > width_bits)) {
        throw InvalidParameterError(
            "sample_sig_bits must be in [1, " + std::to_string(width_bits) +
            "], got " + std::to_string(*p.sample_sig_bits));
    }

    int bits = p.sample_sig_bits.value_or(width_bits);
    int64_t lo = -(int64_t{1} << (bits - 1));
    int64_t hi = (int64_t{1} << (bits - 1)) - 1;
    if (p.sample_min && (*p.sample_min < lo || *p.sample_min > hi)) {
        throw InvalidParameterError("sample_min " +
                                    std::to_string(*p.sample_min) +
                                    " outside representable range");
    }
    if (p.sample_max && (*p.sample_max < lo || *p.sample_max > hi)) {
        throw InvalidParameterError("sample_max " +
                                    std::to_string(*p.sample_max) +
                                    " outside representable range");
    }
    if (p.sample_min && p.sample_max && *p.sample_min > *p.sample_max) {
        throw InvalidParameterError("sample_min exceeds sample_max");
    }

    if (p.sample_byte_format)
        parse_byte_format(*p.sample_byte_format, p.sample_n_bytes);
}

void validate_header_fields(const Header &header) {
    expect_standard_types<InvalidParameterError>(header);
    if (auto rate = header.get_int(field::SAMPLE_RATE); rate && *rate <= 0) {
        throw InvalidParameterError("sample_rate must be > 0, got " +
                                    std::to_string(*rate));
    }

    // Fill absent width so cross-field checks still run on partial headers.
    Header probe = header;
    if (!probe.contains(field::SAMPLE_N_BYTES))
        probe.set(field::SAMPLE_N_BYTES, int64_t{4});
    SphereParams p;
    try {
        p = params_from_header(probe);
    } catch (const MalformedHeaderError &e) {
        throw InvalidParameterError(e.what());
    }
    if (!header.contains(field::SAMPLE_N_BYTES)) {
        // Width unknown yet: only width-independent checks apply.
        p.sample_byte_format.reset();
    }
    validate_params(p);
}

WaveParams to_wave_params(const SphereParams &p) {
    WaveParams w;
    w.nchannels = p.channel_count;
    w.sampwidth = p.sample_n_bytes;
    w.framerate = p.sample_rate;
    w.nframes = p.sample_count;
    return w;
}

Header header_from_wave_params(const WaveParams &w) {
    Header h;
    h.set(field::CHANNEL_COUNT, int64_t{w.nchannels});
    h.set(field::SAMPLE_N_BYTES, int64_t{w.sampwidth});
    h.set(field::SAMPLE_COUNT, w.nframes);
    h.set(field::SAMPLE_RATE, int64_t{w.framerate});
    return h;
}

} // namespace sphere
