#include "sphere/header.hpp"

#include "sphere/error.hpp"
#include "sphere/stream.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <string_view>
#include <system_error>

namespace sphere {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r'; }

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

// Numeric payloads may carry a trailing ";comment".
std::string_view strip_comment(std::string_view s) {
    auto semi = s.find(';');
    if (semi != std::string_view::npos)
        s = s.substr(0, semi);
    return trim(s);
}

template <typename T> bool parse_number(std::string_view s, T &out) {
    if (s.empty())
        return false;
    // from_chars rejects a leading '+', which some writers emit.
    if (s.front() == '+')
        s.remove_prefix(1);
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

std::string format_real(double v) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) {
        throw InvalidParameterError("Cannot format real value");
    }
    return std::string(buf, ptr);
}

std::string format_value(const FieldValue &value) {
    if (auto *i = std::get_if<int64_t>(&value))
        return std::to_string(*i);
    if (auto *r = std::get_if<double>(&value))
        return format_real(*r);
    return std::get<std::string>(value);
}

HeaderField parse_field_line(std::string_view line) {
    const std::string context = " in header line: " + std::string(line);

    auto name_end = line.find_first_of(" \t");
    if (name_end == std::string_view::npos || name_end == 0) {
        throw MalformedHeaderError("Expected 'name type value'" + context);
    }
    std::string name(line.substr(0, name_end));
    if (name.find(';') != std::string::npos) {
        throw MalformedHeaderError("Invalid field name '" + name + "'" +
                                   context);
    }

    auto tag_start = line.find_first_not_of(" \t", name_end);
    if (tag_start == std::string_view::npos) {
        throw MalformedHeaderError("Missing type flag" + context);
    }
    auto tag_end = line.find_first_of(" \t", tag_start);
    std::string_view tag = line.substr(tag_start, tag_end - tag_start);
    // Exactly one separator before the payload: string values may start
    // with blanks. Only an empty string may omit it.
    std::string_view payload;
    if (tag_end != std::string_view::npos) {
        payload = line.substr(tag_end + 1);
    } else if (tag != "-s0") {
        throw MalformedHeaderError("Missing field value" + context);
    }

    if (tag == "-i") {
        int64_t v = 0;
        if (!parse_number(strip_comment(payload), v)) {
            throw MalformedHeaderError("Invalid integer value" + context);
        }
        return {std::move(name), v};
    }
    if (tag == "-r") {
        double v = 0.0;
        if (!parse_number(strip_comment(payload), v)) {
            throw MalformedHeaderError("Invalid real value" + context);
        }
        return {std::move(name), v};
    }
    if (tag.size() > 2 && tag.substr(0, 2) == "-s") {
        size_t n = 0;
        if (!parse_number(tag.substr(2), n)) {
            throw MalformedHeaderError("Invalid string length" + context);
        }
        if (payload.size() < n) {
            throw MalformedHeaderError("String shorter than declared length " +
                                       std::to_string(n) + context);
        }
        auto rest = trim(payload.substr(n));
        if (!rest.empty() && rest.front() != ';') {
            throw MalformedHeaderError("String longer than declared length " +
                                       std::to_string(n) + context);
        }
        return {std::move(name), std::string(payload.substr(0, n))};
    }
    throw MalformedHeaderError("Invalid type flag '" + std::string(tag) + "'" +
                               context);
}

void check_field_name(const std::string &name) {
    if (name.empty() || name == END_HEAD ||
        name.find_first_of(" \t\r\n;") != std::string::npos) {
        throw InvalidParameterError("Invalid header field name: '" + name +
                                    "'");
    }
}

} // namespace

// ─── HeaderField ─────────────────────────────────────────────────────────────

std::string HeaderField::type_tag() const {
    switch (type()) {
    case FieldType::Integer:
        return "-i";
    case FieldType::Real:
        return "-r";
    case FieldType::String:
        return "-s" + std::to_string(std::get<std::string>(value).size());
    }
    return "";
}

// ─── Header ──────────────────────────────────────────────────────────────────

Header::Header(std::initializer_list<HeaderField> fields) {
    for (const auto &f : fields)
        set(f);
}

void Header::set(const std::string &name, FieldValue value) {
    for (auto &f : fields_) {
        if (f.name == name) {
            f.value = std::move(value);
            return;
        }
    }
    fields_.push_back({name, std::move(value)});
}

bool Header::erase(const std::string &name) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const HeaderField &f) { return f.name == name; });
    if (it == fields_.end())
        return false;
    fields_.erase(it);
    return true;
}

const HeaderField *Header::find(const std::string &name) const {
    for (const auto &f : fields_) {
        if (f.name == name)
            return &f;
    }
    return nullptr;
}

std::optional<int64_t> Header::get_int(const std::string &name) const {
    auto *f = find(name);
    if (f && f->type() == FieldType::Integer)
        return std::get<int64_t>(f->value);
    return std::nullopt;
}

std::optional<double> Header::get_real(const std::string &name) const {
    auto *f = find(name);
    if (f && f->type() == FieldType::Real)
        return std::get<double>(f->value);
    return std::nullopt;
}

std::optional<std::string> Header::get_string(const std::string &name) const {
    auto *f = find(name);
    if (f && f->type() == FieldType::String)
        return std::get<std::string>(f->value);
    return std::nullopt;
}

void Header::merge(const Header &updates) {
    for (const auto &f : updates)
        set(f);
}

// ─── Parse ───────────────────────────────────────────────────────────────────

size_t parse_preamble(const uint8_t *data, size_t len) {
    if (len < PREAMBLE_SIZE ||
        std::memcmp(data, NIST_MAGIC, NIST_MAGIC_SIZE) != 0) {
        throw MalformedHeaderError("File does not start with NIST_1A id");
    }
    std::string_view size_line(reinterpret_cast<const char *>(data) +
                                   NIST_MAGIC_SIZE,
                               PREAMBLE_SIZE - NIST_MAGIC_SIZE);
    size_line = trim(size_line);
    if (!size_line.empty() && size_line.back() == '\n')
        size_line = trim(size_line.substr(0, size_line.size() - 1));

    size_t header_size = 0;
    if (!parse_number(size_line, header_size) || header_size < PREAMBLE_SIZE) {
        throw MalformedHeaderError("Invalid header length: '" +
                                   std::string(size_line) + "'");
    }
    return header_size;
}

Header parse_header(const uint8_t *data, size_t len) {
    size_t header_size = parse_preamble(data, len);
    if (len < header_size) {
        throw MalformedHeaderError("Header truncated: declared " +
                                   std::to_string(header_size) +
                                   " bytes, got " + std::to_string(len));
    }

    std::string_view body(reinterpret_cast<const char *>(data) + PREAMBLE_SIZE,
                          header_size - PREAMBLE_SIZE);

    Header header;
    size_t pos = 0;
    while (pos < body.size()) {
        auto eol = body.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = body.size();
        std::string_view line = body.substr(pos, eol - pos);
        pos = eol + 1;

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        auto trimmed = trim(line);
        if (trimmed == END_HEAD)
            return header;
        if (trimmed.empty())
            continue;

        auto field = parse_field_line(line);
        header.set(field.name, std::move(field.value));
    }
    throw MalformedHeaderError("Header chunk missing end_head");
}

Header parse_header(const std::vector<uint8_t> &block) {
    return parse_header(block.data(), block.size());
}

Header read_header(Stream &stream, size_t *header_size) {
    auto block = stream.read_bytes(PREAMBLE_SIZE);
    size_t size = parse_preamble(block.data(), block.size());

    auto rest = stream.read_bytes(size - PREAMBLE_SIZE);
    if (rest.size() != size - PREAMBLE_SIZE) {
        throw MalformedHeaderError("Header truncated: declared " +
                                   std::to_string(size) + " bytes");
    }
    block.insert(block.end(), rest.begin(), rest.end());

    if (header_size)
        *header_size = size;
    return parse_header(block);
}

// ─── Serialize ───────────────────────────────────────────────────────────────

namespace {

std::string serialize_text(const Header &header, size_t header_size) {
    std::string size_str = std::to_string(header_size);
    if (size_str.size() > 7) {
        throw HeaderOverflowError("Header size too large: " + size_str);
    }

    std::string out = NIST_MAGIC;
    out += std::string(7 - size_str.size(), ' ') + size_str + "\n";

    for (const auto &f : header) {
        check_field_name(f.name);
        std::string value = format_value(f.value);
        if (value.find('\n') != std::string::npos) {
            throw InvalidParameterError("Header value of '" + f.name +
                                        "' contains a newline");
        }
        out += f.name + " " + f.type_tag() + " " + value + "\n";
    }
    out += END_HEAD;
    out += "\n\n\n\n\n";
    return out;
}

} // namespace

size_t serialized_header_length(const Header &header) {
    return serialize_text(header, DEFAULT_HEADER_SIZE).size();
}

std::vector<uint8_t> serialize_header(const Header &header,
                                      size_t header_size) {
    auto text = serialize_text(header, header_size);
    if (text.size() > header_size) {
        throw HeaderOverflowError("Header needs " +
                                  std::to_string(text.size()) +
                                  " bytes, block is " +
                                  std::to_string(header_size));
    }
    std::vector<uint8_t> block(header_size, ' ');
    std::memcpy(block.data(), text.data(), text.size());
    return block;
}

} // namespace sphere
