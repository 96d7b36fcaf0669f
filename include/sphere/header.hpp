#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sphere/config.hpp"

namespace sphere {

class Stream;

// ─── Header Fields ───────────────────────────────────────────────────────────

enum class FieldType {
    Integer, // -i
    Real,    // -r
    String,  // -sN
};

using FieldValue = std::variant<int64_t, double, std::string>;

struct HeaderField {
    std::string name;
    FieldValue value;

    FieldType type() const {
        return static_cast<FieldType>(value.index());
    }

    // Type tag as written in the header: "-i", "-r", "-s<len>".
    std::string type_tag() const;

    bool operator==(const HeaderField &other) const = default;
};

// ─── Header (ordered field table) ────────────────────────────────────────────

// Field table in file order. Setting an existing name replaces its value in
// place; new names are appended.
class Header {
  public:
    Header() = default;
    Header(std::initializer_list<HeaderField> fields);

    void set(const std::string &name, FieldValue value);
    void set(const HeaderField &field) { set(field.name, field.value); }
    bool erase(const std::string &name);

    bool contains(const std::string &name) const {
        return find(name) != nullptr;
    }
    const HeaderField *find(const std::string &name) const;

    // Typed lookups; nullopt if absent or of another type.
    std::optional<int64_t> get_int(const std::string &name) const;
    std::optional<double> get_real(const std::string &name) const;
    std::optional<std::string> get_string(const std::string &name) const;

    // Merge every field of `updates` into this header.
    void merge(const Header &updates);

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    const std::vector<HeaderField> &fields() const { return fields_; }
    std::vector<HeaderField>::const_iterator begin() const {
        return fields_.begin();
    }
    std::vector<HeaderField>::const_iterator end() const {
        return fields_.end();
    }

    bool operator==(const Header &other) const = default;

  private:
    std::vector<HeaderField> fields_;
};

// ─── Header Codec ────────────────────────────────────────────────────────────

// Validate the 16-byte preamble ("NIST_1A\n" + "   1024\n") and return the
// declared header size.
size_t parse_preamble(const uint8_t *data, size_t len);

// Parse a complete header block (preamble included). `len` must cover at
// least the declared header size.
Header parse_header(const uint8_t *data, size_t len);
Header parse_header(const std::vector<uint8_t> &block);

// Serialize to a block of exactly `header_size` bytes, space padded.
std::vector<uint8_t> serialize_header(const Header &header,
                                      size_t header_size = DEFAULT_HEADER_SIZE);

// Bytes serialize_header would need before padding.
size_t serialized_header_length(const Header &header);

// Read and parse the header from the current position of `stream`. On
// return the stream sits at the first sample byte. `header_size` receives
// the declared block size.
Header read_header(Stream &stream, size_t *header_size = nullptr);

} // namespace sphere
