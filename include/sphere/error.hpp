#pragma once

#include <stdexcept>
#include <string>

namespace sphere {

// ─── Error Taxonomy ──────────────────────────────────────────────────────────

// Base for every error raised by the SPHERE reader/writer.
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Header block could not be parsed (bad magic, length, line or type tag).
class MalformedHeaderError : public Error {
  public:
    explicit MalformedHeaderError(const std::string &what) : Error(what) {}
};

// Serialized header does not fit in the header block.
class HeaderOverflowError : public Error {
  public:
    explicit HeaderOverflowError(const std::string &what) : Error(what) {}
};

// Fewer sample bytes than the request or header requires.
class TruncatedDataError : public Error {
  public:
    explicit TruncatedDataError(const std::string &what) : Error(what) {}
};

// Sample width outside {1, 2, 4} bytes.
class UnsupportedWidthError : public Error {
  public:
    explicit UnsupportedWidthError(const std::string &what) : Error(what) {}
};

class InvalidParameterError : public Error {
  public:
    explicit InvalidParameterError(const std::string &what) : Error(what) {}
};

class SessionClosedError : public Error {
  public:
    explicit SessionClosedError(const std::string &what) : Error(what) {}
};

// Read operation on a write session or vice versa.
class ModeError : public Error {
  public:
    explicit ModeError(const std::string &what) : Error(what) {}
};

} // namespace sphere
