#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace sphere {

// ─── Byte Stream ─────────────────────────────────────────────────────────────

// Byte-addressable stream the reader/writer works against. Implementations
// report short reads through the return value and throw on hard I/O errors.
class Stream {
  public:
    virtual ~Stream() = default;

    virtual size_t read(void *dst, size_t n) = 0;
    virtual void write(const void *src, size_t n) = 0;

    // Absolute positioning. Only valid when seekable().
    virtual void seek(int64_t pos) = 0;
    virtual int64_t tell() = 0;

    // Total size in bytes, or -1 if unknown.
    virtual int64_t size() = 0;

    virtual bool seekable() const { return true; }
    virtual void flush() {}
    virtual void close() {}

    std::vector<uint8_t> read_bytes(size_t n);
};

// ─── File Stream ─────────────────────────────────────────────────────────────

class FileStream : public Stream {
  public:
    enum class Access { Read, Write };

    FileStream(const std::string &path, Access access);

    size_t read(void *dst, size_t n) override;
    void write(const void *src, size_t n) override;
    void seek(int64_t pos) override;
    int64_t tell() override;
    int64_t size() override;
    void flush() override;
    void close() override;

    const std::string &path() const { return path_; }

  private:
    std::fstream file_;
    std::string path_;
    Access access_;
};

// ─── Memory Stream ───────────────────────────────────────────────────────────

// Growable in-memory buffer. With seekable=false it behaves like a pipe for
// writers: seek() throws and size() is unknown.
class MemoryStream : public Stream {
  public:
    MemoryStream() = default;
    explicit MemoryStream(std::vector<uint8_t> data, bool seekable = true)
        : data_(std::move(data)), seekable_(seekable) {}

    size_t read(void *dst, size_t n) override;
    void write(const void *src, size_t n) override;
    void seek(int64_t pos) override;
    int64_t tell() override { return static_cast<int64_t>(pos_); }
    int64_t size() override {
        return seekable_ ? static_cast<int64_t>(data_.size()) : -1;
    }
    bool seekable() const override { return seekable_; }

    void set_seekable(bool seekable) { seekable_ = seekable; }

    const std::vector<uint8_t> &data() const { return data_; }

  private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
    bool seekable_ = true;
};

} // namespace sphere
