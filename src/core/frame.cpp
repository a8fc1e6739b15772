#include "minikv/frame.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ostream>
#include <type_traits>
#include <utility>

namespace minikv {

namespace {

constexpr std::string_view CRLF{"\r\n"};

bool has_line_break(std::string_view text) {
    return text.find_first_of("\r\n") != std::string_view::npos;
}

void append_decimal(std::string& out, std::int64_t n) {
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    out.append(tmp, static_cast<size_t>(end - tmp));
}

void append_escaped(std::string& out, std::string_view data) {
    constexpr size_t max_shown = 64;
    for (size_t i = 0; i < data.size() && i < max_shown; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c >= 0x20 && c < 0x7f) {
            out += static_cast<char>(c);
        } else {
            char hex[5];
            std::snprintf(hex, sizeof(hex), "\\x%02x", c);
            out += hex;
        }
    }
    if (data.size() > max_shown)
        out += "...";
}

} // namespace

// Frame

Frame Frame::simple(std::string text) {
    if (has_line_break(text))
        throw std::invalid_argument("simple frame text must not contain CR or LF");
    return Frame{Simple{std::move(text)}};
}

Frame Frame::error(std::string text) {
    if (has_line_break(text))
        throw std::invalid_argument("error frame text must not contain CR or LF");
    return Frame{Error{std::move(text)}};
}

Frame Frame::integer(std::int64_t value) {
    return Frame{Integer{value}};
}

Frame Frame::bulk(std::string data) {
    return Frame{Bulk{std::move(data)}};
}

Frame Frame::null() {
    return Frame{Null{}};
}

Frame Frame::array(std::vector<Frame> items) {
    return Frame{Array{std::move(items)}};
}

const std::string* Frame::as_text() const noexcept {
    if (auto* bulk = std::get_if<Bulk>(&value_))
        return &bulk->data;
    if (auto* simple = std::get_if<Simple>(&value_))
        return &simple->text;
    return nullptr;
}

void Frame::encode_into(std::string& out) const {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, Simple>) {
            out += '+';
            out += v.text;
            out += CRLF;
        } else if constexpr (std::is_same_v<T, Error>) {
            out += '-';
            out += v.text;
            out += CRLF;
        } else if constexpr (std::is_same_v<T, Integer>) {
            out += ':';
            append_decimal(out, v.value);
            out += CRLF;
        } else if constexpr (std::is_same_v<T, Bulk>) {
            out += '$';
            append_decimal(out, static_cast<std::int64_t>(v.data.size()));
            out += CRLF;
            out += v.data;
            out += CRLF;
        } else if constexpr (std::is_same_v<T, Null>) {
            out += "$-1\r\n";
        } else if constexpr (std::is_same_v<T, Array>) {
            out += '*';
            append_decimal(out, static_cast<std::int64_t>(v.items.size()));
            out += CRLF;
            for (const auto& item : v.items)
                item.encode_into(out);
        }
    }, value_);
}

std::string Frame::encode() const {
    std::string out;
    encode_into(out);
    return out;
}

std::string Frame::to_string() const {
    std::string out;
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, Simple>) {
            out += "simple(\"";
            append_escaped(out, v.text);
            out += "\")";
        } else if constexpr (std::is_same_v<T, Error>) {
            out += "error(\"";
            append_escaped(out, v.text);
            out += "\")";
        } else if constexpr (std::is_same_v<T, Integer>) {
            out += "integer(";
            append_decimal(out, v.value);
            out += ')';
        } else if constexpr (std::is_same_v<T, Bulk>) {
            out += "bulk(\"";
            append_escaped(out, v.data);
            out += "\")";
        } else if constexpr (std::is_same_v<T, Null>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, Array>) {
            out += "array[";
            for (size_t i = 0; i < v.items.size(); ++i) {
                if (i > 0)
                    out += ", ";
                out += v.items[i].to_string();
            }
            out += ']';
        }
    }, value_);
    return out;
}

bool operator==(const Frame& lhs, const Frame& rhs) {
    if (lhs.value_.index() != rhs.value_.index())
        return false;

    return std::visit([&](const auto& l) -> bool {
        using T = std::decay_t<decltype(l)>;
        const T& r = std::get<T>(rhs.value_);

        if constexpr (std::is_same_v<T, Frame::Simple> || std::is_same_v<T, Frame::Error>) {
            return l.text == r.text;
        } else if constexpr (std::is_same_v<T, Frame::Integer>) {
            return l.value == r.value;
        } else if constexpr (std::is_same_v<T, Frame::Bulk>) {
            return l.data == r.data;
        } else if constexpr (std::is_same_v<T, Frame::Null>) {
            return true;
        } else {
            return std::equal(l.items.begin(), l.items.end(), r.items.begin(), r.items.end());
        }
    }, lhs.value_);
}

std::ostream& operator<<(std::ostream& os, const Frame& frame) {
    return os << frame.to_string();
}


// FrameDecoder

struct FrameDecoder::Cursor {
    std::string_view buffer;
    size_t pos{0};
    std::string error;

    DecodeStatus fail(std::string reason) {
        error = std::move(reason);
        return DecodeStatus::Malformed;
    }
};

DecodeResult FrameDecoder::decode(std::string_view buffer) const {
    DecodeResult result;
    Cursor cursor{buffer};

    result.status = decode_at(cursor, result.frame, 0);
    if (result.status == DecodeStatus::Ready) {
        result.consumed = cursor.pos;
    } else {
        // Nothing is consumed unless a whole frame is present
        result.frame = Frame{};
        result.error = std::move(cursor.error);
    }
    return result;
}

DecodeStatus FrameDecoder::read_line(Cursor& cursor, std::string_view& line) const {
    std::string_view rest = cursor.buffer.substr(cursor.pos);
    size_t end = rest.find(CRLF);

    if (end == std::string_view::npos) {
        // A trailing '\r' may still be the first half of the terminator
        if (rest.size() > limits_.max_line_length + 1)
            return cursor.fail("line exceeds " + std::to_string(limits_.max_line_length) + " bytes");
        return DecodeStatus::Incomplete;
    }
    if (end > limits_.max_line_length)
        return cursor.fail("line exceeds " + std::to_string(limits_.max_line_length) + " bytes");

    line = rest.substr(0, end);
    cursor.pos += end + CRLF.size();
    return DecodeStatus::Ready;
}

namespace {

// Digits with an optional leading '-' and no leading zeros
bool canonical_prefix(std::string_view text) {
    if (!text.empty() && text.front() == '-')
        text.remove_prefix(1);
    if (!std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return false;
    return text.size() < 2 || text.front() != '0';
}

bool parse_decimal(std::string_view text, std::int64_t& value) {
    if (!canonical_prefix(text) || text == "-0")
        return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// An unterminated number that can no longer become valid
bool dead_partial_decimal(std::string_view partial) {
    if (!partial.empty() && partial.back() == '\r')
        partial.remove_suffix(1);
    return !canonical_prefix(partial) || partial == "-0";
}

} // namespace

DecodeStatus FrameDecoder::read_decimal(Cursor& cursor, std::int64_t& value, std::string_view what) const {
    std::string_view line;
    DecodeStatus status = read_line(cursor, line);
    if (status == DecodeStatus::Incomplete) {
        std::string_view partial = cursor.buffer.substr(cursor.pos);
        if (dead_partial_decimal(partial))
            return cursor.fail("invalid " + std::string{what} + " '" + std::string{partial.substr(0, 32)} + "'");
        return status;
    }
    if (status != DecodeStatus::Ready)
        return status;

    if (!parse_decimal(line, value))
        return cursor.fail("invalid " + std::string{what} + " '" + std::string{line} + "'");
    return DecodeStatus::Ready;
}

DecodeStatus FrameDecoder::decode_at(Cursor& cursor, Frame& out, size_t depth) const {
    if (cursor.pos >= cursor.buffer.size())
        return DecodeStatus::Incomplete;
    if (depth > limits_.max_depth)
        return cursor.fail("frames nested deeper than " + std::to_string(limits_.max_depth));

    char marker = cursor.buffer[cursor.pos++];
    switch (marker) {
    case '+':
    case '-': {
        std::string_view line;
        DecodeStatus status = read_line(cursor, line);
        if (status != DecodeStatus::Ready)
            return status;
        if (has_line_break(line))
            return cursor.fail("stray line break in status line");

        out = marker == '+' ? Frame::simple(std::string{line}) : Frame::error(std::string{line});
        return DecodeStatus::Ready;
    }

    case ':': {
        std::int64_t value = 0;
        DecodeStatus status = read_decimal(cursor, value, "integer");
        if (status != DecodeStatus::Ready)
            return status;
        out = Frame::integer(value);
        return DecodeStatus::Ready;
    }

    case '$': {
        std::int64_t length = 0;
        DecodeStatus status = read_decimal(cursor, length, "length");
        if (status != DecodeStatus::Ready)
            return status;

        if (length == -1) {
            out = Frame::null();
            return DecodeStatus::Ready;
        }
        if (length < 0)
            return cursor.fail("negative bulk length");
        if (length > limits_.max_bulk_length)
            return cursor.fail("bulk length " + std::to_string(length) + " exceeds limit");

        size_t size = static_cast<size_t>(length);
        if (cursor.buffer.size() - cursor.pos < size + CRLF.size())
            return DecodeStatus::Incomplete;
        if (cursor.buffer.substr(cursor.pos + size, CRLF.size()) != CRLF)
            return cursor.fail("bulk payload not terminated by CRLF");

        out = Frame::bulk(std::string{cursor.buffer.substr(cursor.pos, size)});
        cursor.pos += size + CRLF.size();
        return DecodeStatus::Ready;
    }

    case '*': {
        std::int64_t count = 0;
        DecodeStatus status = read_decimal(cursor, count, "length");
        if (status != DecodeStatus::Ready)
            return status;

        if (count < 0)
            return cursor.fail("negative array length");
        if (count > limits_.max_array_length)
            return cursor.fail("array length " + std::to_string(count) + " exceeds limit");

        std::vector<Frame> items;
        items.reserve(static_cast<size_t>(std::min<std::int64_t>(count, 1024)));
        for (std::int64_t i = 0; i < count; ++i) {
            Frame item;
            status = decode_at(cursor, item, depth + 1);
            if (status != DecodeStatus::Ready)
                return status;
            items.push_back(std::move(item));
        }
        out = Frame::array(std::move(items));
        return DecodeStatus::Ready;
    }

    default: {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned char>(marker));
        return cursor.fail(std::string{"invalid frame type byte "} + hex);
    }
    }
}

} // namespace minikv
