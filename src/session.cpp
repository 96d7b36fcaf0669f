#include "sphere/session.hpp"

#include "sphere/error.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <utility>

namespace sphere {

Mode parse_mode(const std::string &mode) {
    if (mode == "r" || mode == "rb")
        return Mode::Read;
    if (mode == "w" || mode == "wb")
        return Mode::Write;
    throw ModeError("mode must be 'r', 'rb', 'w', or 'wb', got '" + mode +
                    "'");
}

// ─── Construction / Lifecycle ────────────────────────────────────────────────

Session::Session(const SessionOptions &options) : options_(options) {}

Session::Session(const std::string &path, Mode mode,
                 const SessionOptions &options)
    : options_(options) {
    open(path, mode);
}

Session::Session(Stream &stream, Mode mode, const SessionOptions &options)
    : options_(options) {
    open(stream, mode);
}

Session::Session(std::unique_ptr<Stream> stream, Mode mode,
                 const SessionOptions &options)
    : options_(options) {
    open(std::move(stream), mode);
}

Session::Session(Session &&other) noexcept { *this = std::move(other); }

Session &Session::operator=(Session &&other) noexcept {
    if (this == &other)
        return *this;
    if (is_open()) {
        try {
            close();
        } catch (const std::exception &e) {
            std::cerr << "Warning: error closing SPHERE session " << name_
                      << ": " << e.what() << std::endl;
        }
    }
    options_ = other.options_;
    state_ = other.state_;
    owned_ = std::move(other.owned_);
    stream_ = other.stream_;
    name_ = std::move(other.name_);
    header_ = std::move(other.header_);
    params_ = std::move(other.params_);
    file_format_ = other.file_format_;
    host_format_ = other.host_format_;
    data_offset_ = other.data_offset_;
    nframes_ = other.nframes_;
    pos_ = other.pos_;
    seek_needed_ = other.seek_needed_;
    header_start_ = other.header_start_;
    frames_written_ = other.frames_written_;
    data_started_ = other.data_started_;
    spool_ = std::move(other.spool_);

    // The moved-from session no longer refers to the stream.
    other.stream_ = nullptr;
    other.state_ = State::Closed;
    return *this;
}

Session::~Session() {
    if (!is_open())
        return;
    try {
        close();
    } catch (const std::exception &e) {
        std::cerr << "Warning: error closing SPHERE session " << name_ << ": "
                  << e.what() << std::endl;
    }
}

void Session::open(const std::string &path, Mode mode) {
    if (state_ != State::Unopened) {
        throw SessionClosedError("Session already used; cannot reopen " +
                                 path);
    }
    auto access = mode == Mode::Read ? FileStream::Access::Read
                                     : FileStream::Access::Write;
    name_ = path;
    try {
        owned_ = std::make_unique<FileStream>(path, access);
    } catch (...) {
        release();
        throw;
    }
    attach(owned_.get(), mode);
}

void Session::open(Stream &stream, Mode mode) {
    if (state_ != State::Unopened) {
        throw SessionClosedError("Session already used; cannot reopen");
    }
    name_ = "<stream>";
    attach(&stream, mode);
}

void Session::open(std::unique_ptr<Stream> stream, Mode mode) {
    if (state_ != State::Unopened) {
        throw SessionClosedError("Session already used; cannot reopen");
    }
    if (!stream) {
        throw InvalidParameterError("Cannot open a SPHERE session on a null "
                                    "stream");
    }
    owned_ = std::move(stream);
    name_ = "<stream>";
    attach(owned_.get(), mode);
}

void Session::attach(Stream *stream, Mode mode) {
    stream_ = stream;
    try {
        if (mode == Mode::Read) {
            open_read();
            state_ = State::OpenRead;
        } else {
            open_write();
            state_ = State::OpenWrite;
        }
    } catch (...) {
        release();
        throw;
    }
}

void Session::close() {
    if (state_ == State::Closed)
        return;
    if (state_ == State::OpenWrite) {
        try {
            finalize_write();
        } catch (...) {
            release();
            throw;
        }
    }
    release();
}

void Session::release() {
    if (owned_) {
        owned_->close();
        owned_.reset();
    }
    stream_ = nullptr;
    spool_.clear();
    state_ = State::Closed;
}

Mode Session::mode() const {
    check_open("mode");
    return state_ == State::OpenRead ? Mode::Read : Mode::Write;
}

void Session::check_open(const char *op) const {
    if (state_ == State::Closed) {
        throw SessionClosedError(std::string(op) + ": session is closed");
    }
    if (state_ == State::Unopened) {
        throw SessionClosedError(std::string(op) + ": session is not open");
    }
}

void Session::check_mode(Mode want, const char *op) const {
    check_open(op);
    bool reading = state_ == State::OpenRead;
    if (want == Mode::Read && !reading) {
        throw ModeError(std::string(op) + " requires a session opened for "
                                          "reading");
    }
    if (want == Mode::Write && reading) {
        throw ModeError(std::string(op) + " requires a session opened for "
                                          "writing");
    }
}

// ─── Reading ─────────────────────────────────────────────────────────────────

void Session::open_read() {
    int64_t header_start = stream_->seekable() ? stream_->tell() : 0;
    size_t header_size = 0;
    header_ = read_header(*stream_, &header_size);
    params_ = params_from_header(header_);

    check_sample_width(params_.sample_n_bytes);
    if (params_.channel_count < 1 ||
        params_.channel_count > MAX_CHANNEL_COUNT) {
        throw MalformedHeaderError("Invalid channel_count " +
                                   std::to_string(params_.channel_count));
    }
    try {
        file_format_ = parse_byte_format(
            params_.sample_byte_format.value_or(""), params_.sample_n_bytes);
    } catch (const InvalidParameterError &e) {
        throw MalformedHeaderError(e.what());
    }
    host_format_ = native_byte_format(params_.sample_n_bytes);

    data_offset_ = header_start + static_cast<int64_t>(header_size);
    const int64_t frame_size = params_.frame_size();

    int64_t available = -1;
    int64_t total = stream_->size();
    if (total >= 0)
        available = std::max<int64_t>(0, total - data_offset_) / frame_size;

    if (!header_.contains(field::SAMPLE_COUNT)) {
        if (available < 0) {
            throw MalformedHeaderError("Header has no sample_count and the "
                                       "stream size is unknown");
        }
        nframes_ = available;
    } else {
        nframes_ = params_.sample_count;
        if (nframes_ < 0) {
            throw MalformedHeaderError("Negative sample_count " +
                                       std::to_string(nframes_));
        }
        if (available >= 0 && nframes_ > available) {
            if (options_.read.sample_count_policy ==
                SampleCountPolicy::Strict) {
                throw TruncatedDataError(
                    name_ + ": header declares " + std::to_string(nframes_) +
                    " frames but data holds " + std::to_string(available));
            }
            if (options_.read.warn) {
                std::cerr << "Warning: " << name_ << ": header declares "
                          << nframes_ << " frames but data holds "
                          << available << "; reading " << available
                          << std::endl;
            }
            nframes_ = available;
        }
    }
    params_.sample_count = nframes_;
    pos_ = 0;
    seek_needed_ = false;
}

std::vector<uint8_t> Session::readframes(int64_t n) {
    check_mode(Mode::Read, "readframes");
    if (n < 0) {
        throw InvalidParameterError("readframes: negative frame count");
    }

    int64_t frames = std::min(n, nframes_ - pos_);
    if (frames <= 0)
        return {};

    const int64_t frame_size = params_.frame_size();
    if (seek_needed_) {
        stream_->seek(data_offset_ + pos_ * frame_size);
        seek_needed_ = false;
    }

    auto data = stream_->read_bytes(static_cast<size_t>(frames * frame_size));
    // A stream that ends early yields whole frames only.
    int64_t got = static_cast<int64_t>(data.size()) / frame_size;
    if (got * frame_size != static_cast<int64_t>(data.size())) {
        data.resize(static_cast<size_t>(got * frame_size));
        seek_needed_ = stream_->seekable();
    }
    convert_byte_format(data.data(), data.size(), file_format_, host_format_);
    pos_ += got;
    return data;
}

std::vector<int32_t> Session::readsamples(int64_t n) {
    auto data = readframes(n);
    size_t frames = data.size() / static_cast<size_t>(params_.frame_size());
    return decode_samples(data.data(), data.size(), params_.sample_n_bytes,
                          host_format_, params_.channel_count, frames);
}

void Session::setpos(int64_t pos) {
    check_mode(Mode::Read, "setpos");
    if (pos < 0 || pos > nframes_) {
        throw InvalidParameterError("Position " + std::to_string(pos) +
                                    " not in range [0, " +
                                    std::to_string(nframes_) + "]");
    }
    pos_ = pos;
    seek_needed_ = true;
}

int64_t Session::tell() const {
    check_open("tell");
    return state_ == State::OpenRead ? pos_ : frames_written_;
}

// ─── Parameters ──────────────────────────────────────────────────────────────

SphereParams Session::getparams() const {
    check_open("getparams");
    if (state_ == State::OpenRead)
        return params_;
    require_write_params();
    auto p = params_from_header(header_);
    p.sample_count = nframes();
    return p;
}

const Header &Session::header() const {
    check_open("header");
    return header_;
}

int64_t Session::nframes() const {
    check_open("nframes");
    if (state_ == State::OpenRead)
        return nframes_;
    return header_.get_int(field::SAMPLE_COUNT).value_or(0);
}

void Session::setparams(const Header &updates) {
    check_mode(Mode::Write, "setparams");
    if (data_started_) {
        throw InvalidParameterError(
            "Cannot change parameters after starting to write");
    }
    Header merged = header_;
    merged.merge(updates);
    validate_header_fields(merged);
    header_ = std::move(merged);
}

void Session::setparams(const SphereParams &params) {
    check_mode(Mode::Write, "setparams");
    validate_params(params);
    setparams(params_to_header(params));
}

// ─── Writing ─────────────────────────────────────────────────────────────────

void Session::open_write() {
    header_ = Header{};
    frames_written_ = 0;
    data_started_ = false;
    header_start_ = stream_->seekable() ? stream_->tell() : 0;
}

void Session::require_write_params() const {
    if (!header_.contains(field::CHANNEL_COUNT)) {
        throw InvalidParameterError("Not all parameters set: channel_count "
                                    "is required");
    }
    if (!header_.contains(field::SAMPLE_N_BYTES)) {
        throw InvalidParameterError("Not all parameters set: sample_n_bytes "
                                    "is required");
    }
    auto coding = header_.get_string(field::SAMPLE_CODING).value_or("pcm");
    if ((coding == "pcm" || coding == "ulaw") &&
        !header_.contains(field::SAMPLE_RATE)) {
        throw InvalidParameterError("Not all parameters set: sample_rate is "
                                    "required when sample_coding is '" +
                                    coding + "'");
    }
}

void Session::begin_data() {
    require_write_params();
    params_ = params_from_header(header_);
    file_format_ = parse_byte_format(params_.sample_byte_format.value_or(""),
                                     params_.sample_n_bytes);
    host_format_ = native_byte_format(params_.sample_n_bytes);

    // The final header differs only in its sample_count digits; check the
    // widest count now so close() cannot overflow after data is committed.
    Header widest = header_;
    widest.set(field::SAMPLE_COUNT, std::numeric_limits<int64_t>::max());
    serialize_header(widest, options_.write.header_size);

    header_.set(field::SAMPLE_COUNT, int64_t{0});
    if (stream_->seekable()) {
        // Reserve the block; a file cut short still reads as zero frames.
        auto block = serialize_header(header_, options_.write.header_size);
        stream_->write(block.data(), block.size());
    }
    data_started_ = true;
}

void Session::writeframes(const uint8_t *data, size_t len) {
    check_mode(Mode::Write, "writeframes");
    if (!data_started_)
        begin_data();

    const size_t frame_size = static_cast<size_t>(params_.frame_size());
    if (len % frame_size != 0) {
        throw InvalidParameterError(std::to_string(len) +
                                    " bytes is not a whole number of " +
                                    std::to_string(frame_size) +
                                    "-byte frames");
    }
    if (len == 0)
        return;

    std::vector<uint8_t> buf(data, data + len);
    convert_byte_format(buf.data(), buf.size(), host_format_, file_format_);
    if (stream_->seekable()) {
        stream_->write(buf.data(), buf.size());
    } else {
        spool_.insert(spool_.end(), buf.begin(), buf.end());
    }

    frames_written_ += static_cast<int64_t>(len / frame_size);
    header_.set(field::SAMPLE_COUNT, frames_written_);
}

void Session::writesamples(const std::vector<int32_t> &samples) {
    check_mode(Mode::Write, "writesamples");
    if (!data_started_)
        begin_data();
    auto bytes = encode_samples(samples, params_.sample_n_bytes, host_format_,
                                params_.channel_count);
    writeframes(bytes);
}

void Session::finalize_write() {
    if (!data_started_)
        begin_data();

    auto block = serialize_header(header_, options_.write.header_size);
    if (stream_->seekable()) {
        int64_t end = stream_->tell();
        stream_->seek(header_start_);
        stream_->write(block.data(), block.size());
        stream_->seek(end);
    } else {
        stream_->write(block.data(), block.size());
        if (!spool_.empty())
            stream_->write(spool_.data(), spool_.size());
    }
    stream_->flush();
}

// ─── Free Functions ──────────────────────────────────────────────────────────

Session open(const std::string &path, const std::string &mode,
             const SessionOptions &options) {
    return Session(path, parse_mode(mode), options);
}

Session open(Stream &stream, const std::string &mode,
             const SessionOptions &options) {
    return Session(stream, parse_mode(mode), options);
}

} // namespace sphere
