#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sphere/config.hpp"
#include "sphere/header.hpp"
#include "sphere/params.hpp"
#include "sphere/sample.hpp"
#include "sphere/stream.hpp"

namespace sphere {

enum class Mode { Read, Write };

// "r"/"rb" -> Read, "w"/"wb" -> Write; anything else throws ModeError.
Mode parse_mode(const std::string &mode);

// ─── Session ─────────────────────────────────────────────────────────────────

/// One open SPHERE file, either being read or being written.
///
///   sphere::Session in("speech.sph", sphere::Mode::Read);
///   auto params = in.getparams();
///   auto pcm = in.readframes(params.sample_count);
///
/// Lifecycle is Unopened -> Open(read|write) -> Closed. A session cannot be
/// reopened; every operation after close() throws SessionClosedError.
///
/// Writing: set the parameters, then write frames. The header is rewritten
/// with the true sample_count on close(). On a seekable stream the header
/// block is reserved on the first write; otherwise frames are buffered in
/// memory until close().
class Session {
  public:
    enum class State { Unopened, OpenRead, OpenWrite, Closed };

    explicit Session(const SessionOptions &options = {});
    Session(const std::string &path, Mode mode,
            const SessionOptions &options = {});
    Session(Stream &stream, Mode mode, const SessionOptions &options = {});
    Session(std::unique_ptr<Stream> stream, Mode mode,
            const SessionOptions &options = {});

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;
    Session(Session &&other) noexcept;
    Session &operator=(Session &&other) noexcept;

    // Closes if still open; close-time failures are reported on stderr.
    ~Session();

    // Open a file by path; the session owns the handle.
    void open(const std::string &path, Mode mode);
    // Open on a caller-owned stream, left open by close().
    void open(Stream &stream, Mode mode);
    // Open on a stream the session takes ownership of.
    void open(std::unique_ptr<Stream> stream, Mode mode);

    void close();

    State state() const { return state_; }
    bool is_open() const {
        return state_ == State::OpenRead || state_ == State::OpenWrite;
    }
    Mode mode() const;

    // ── Parameters ──

    SphereParams getparams() const;
    const Header &header() const;

    // Merge fields into the pending header. Write mode only, before the
    // first frame is written.
    void setparams(const Header &updates);
    void setparams(const SphereParams &params);

    // Frames in the stream (read) or pending sample_count (write).
    int64_t nframes() const;

    // ── Reading ──

    // Up to n frames as host-order interleaved sample bytes. Returns fewer
    // (possibly zero) frames at end of stream.
    std::vector<uint8_t> readframes(int64_t n);
    std::vector<int32_t> readsamples(int64_t n);

    void setpos(int64_t pos);
    void rewind() { setpos(0); }

    // Frame cursor (read) or frames written so far (write).
    int64_t tell() const;

    // ── Writing ──

    // Host-order interleaved sample bytes; whole frames only.
    void writeframes(const uint8_t *data, size_t len);
    void writeframes(const std::vector<uint8_t> &data) {
        writeframes(data.data(), data.size());
    }
    void writesamples(const std::vector<int32_t> &samples);

    // Underlying stream while open.
    Stream *stream() const { return stream_; }

  private:
    void check_open(const char *op) const;
    void check_mode(Mode want, const char *op) const;
    void attach(Stream *stream, Mode mode);
    void open_read();
    void open_write();
    void require_write_params() const;
    void begin_data();
    void finalize_write();
    void release();

    SessionOptions options_;
    State state_ = State::Unopened;
    std::unique_ptr<Stream> owned_;
    Stream *stream_ = nullptr;
    std::string name_; // for diagnostics

    Header header_;       // parsed (read) or pending (write) fields
    SphereParams params_; // read mode: derived from header_
    ByteFormat file_format_;
    ByteFormat host_format_;

    // Read state
    int64_t data_offset_ = 0;
    int64_t nframes_ = 0;
    int64_t pos_ = 0;
    bool seek_needed_ = false;

    // Write state
    int64_t header_start_ = 0;
    int64_t frames_written_ = 0;
    bool data_started_ = false;
    std::vector<uint8_t> spool_;
};

// Convenience wrappers mirroring the classic open(file, mode) call. For the
// wave-style accessors (getnchannels, getsampwidth, ...), wrap the result in
// a WaveView from sphere/wave.hpp:
//
//   auto s = sphere::open("speech.sph");
//   sphere::WaveView wave(s);
Session open(const std::string &path, const std::string &mode = "r",
             const SessionOptions &options = {});
Session open(Stream &stream, const std::string &mode = "r",
             const SessionOptions &options = {});

} // namespace sphere
