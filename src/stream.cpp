#include "sphere/stream.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace sphere {

std::vector<uint8_t> Stream::read_bytes(size_t n) {
    std::vector<uint8_t> buf(n);
    size_t got = n > 0 ? read(buf.data(), n) : 0;
    buf.resize(got);
    return buf;
}

// ─── File Stream ─────────────────────────────────────────────────────────────

FileStream::FileStream(const std::string &path, Access access)
    : path_(path), access_(access) {
    auto mode = std::ios::binary;
    if (access == Access::Read) {
        mode |= std::ios::in;
    } else {
        mode |= std::ios::in | std::ios::out | std::ios::trunc;
    }
    file_.open(path, mode);
    if (!file_) {
        throw std::runtime_error("Cannot open SPHERE file: " + path);
    }
}

size_t FileStream::read(void *dst, size_t n) {
    file_.read(static_cast<char *>(dst), static_cast<std::streamsize>(n));
    size_t got = static_cast<size_t>(file_.gcount());
    if (file_.eof()) {
        // Short read at end of file is not an error; clear so tell/seek work.
        file_.clear();
    } else if (!file_) {
        throw std::runtime_error("Read error on " + path_);
    }
    return got;
}

void FileStream::write(const void *src, size_t n) {
    if (access_ != Access::Write) {
        throw std::runtime_error("File opened read-only: " + path_);
    }
    file_.write(static_cast<const char *>(src),
                static_cast<std::streamsize>(n));
    if (!file_) {
        throw std::runtime_error("Write error on " + path_);
    }
}

void FileStream::seek(int64_t pos) {
    file_.seekg(static_cast<std::streamoff>(pos));
    file_.seekp(static_cast<std::streamoff>(pos));
    if (!file_) {
        throw std::runtime_error("Seek error on " + path_);
    }
}

int64_t FileStream::tell() {
    if (access_ == Access::Write) {
        return static_cast<int64_t>(file_.tellp());
    }
    return static_cast<int64_t>(file_.tellg());
}

int64_t FileStream::size() {
    auto here = file_.tellg();
    file_.seekg(0, std::ios::end);
    auto end = file_.tellg();
    file_.seekg(here);
    if (!file_) {
        return -1;
    }
    return static_cast<int64_t>(end);
}

void FileStream::flush() { file_.flush(); }

void FileStream::close() {
    if (file_.is_open()) {
        file_.close();
    }
}

// ─── Memory Stream ───────────────────────────────────────────────────────────

size_t MemoryStream::read(void *dst, size_t n) {
    size_t avail = pos_ < data_.size() ? data_.size() - pos_ : 0;
    size_t got = std::min(n, avail);
    if (got > 0) {
        std::memcpy(dst, data_.data() + pos_, got);
        pos_ += got;
    }
    return got;
}

void MemoryStream::write(const void *src, size_t n) {
    if (pos_ + n > data_.size()) {
        data_.resize(pos_ + n);
    }
    if (n > 0) {
        std::memcpy(data_.data() + pos_, src, n);
    }
    pos_ += n;
}

void MemoryStream::seek(int64_t pos) {
    if (!seekable_) {
        throw std::runtime_error("Stream is not seekable");
    }
    if (pos < 0) {
        throw std::runtime_error("Negative seek position");
    }
    pos_ = static_cast<size_t>(pos);
}

} // namespace sphere
