#pragma once

#include <cstddef>
#include <string>

namespace sphere {

// ─── Format Constants ────────────────────────────────────────────────────────

// 8-byte magic line that opens every SPHERE file.
inline constexpr const char *NIST_MAGIC = "NIST_1A\n";
inline constexpr size_t NIST_MAGIC_SIZE = 8;

// Magic line + right-aligned header length line ("   1024\n").
inline constexpr size_t PREAMBLE_SIZE = 16;

inline constexpr const char *END_HEAD = "end_head";

// Header block size used by practically every corpus (TIMIT, RM, WSJ, ...).
inline constexpr size_t DEFAULT_HEADER_SIZE = 1024;

// Upper bound on channel_count accepted from a header or setparams.
inline constexpr int MAX_CHANNEL_COUNT = 65535;

// ─── Read Options ────────────────────────────────────────────────────────────

// What to do when the header's sample_count promises more frames than the
// data region holds.
enum class SampleCountPolicy {
    Truncate, // proceed with the frames actually present
    Strict,   // raise TruncatedDataError
};

struct ReadOptions {
    SampleCountPolicy sample_count_policy = SampleCountPolicy::Truncate;
    bool warn = true; // report recoverable discrepancies on stderr
};

// ─── Write Options ───────────────────────────────────────────────────────────

struct WriteOptions {
    size_t header_size = DEFAULT_HEADER_SIZE;
};

struct SessionOptions {
    ReadOptions read;
    WriteOptions write;
};

// ─── Presets ─────────────────────────────────────────────────────────────────

inline ReadOptions make_strict_read_options() {
    ReadOptions opts;
    opts.sample_count_policy = SampleCountPolicy::Strict;
    return opts;
}

inline ReadOptions make_quiet_read_options() {
    ReadOptions opts;
    opts.warn = false;
    return opts;
}

} // namespace sphere
