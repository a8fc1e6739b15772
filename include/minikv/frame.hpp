#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace minikv {

// Raised by the connection layer when the decoder reports a malformed frame
class FrameError : public std::runtime_error {
public:
    explicit FrameError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * One self-delimited unit of the wire protocol.
 *
 *   +OK\r\n              Simple
 *   -ERR msg\r\n         Error
 *   :42\r\n              Integer
 *   $5\r\nhello\r\n      Bulk
 *   $-1\r\n              Null
 *   *2\r\n<frame><frame> Array
 */
class Frame {
public:
    struct Simple {
        std::string text;
    };

    struct Error {
        std::string text;
    };

    struct Integer {
        std::int64_t value;
    };

    struct Bulk {
        std::string data;
    };

    struct Null {};

    struct Array {
        std::vector<Frame> items;
    };

    using Value = std::variant<Simple, Error, Integer, Bulk, Null, Array>;

    // Null frame
    Frame() : value_(Null{}) {}

    // Simple and Error text is checked for line terminators.
    // Throws std::invalid_argument.
    static Frame simple(std::string text);
    static Frame error(std::string text);

    static Frame integer(std::int64_t value);
    static Frame bulk(std::string data);
    static Frame null();
    static Frame array(std::vector<Frame> items);

    const Value& value() const noexcept { return value_; }

    template <typename T>
    const T* get_if() const noexcept {
        return std::get_if<T>(&value_);
    }

    template <typename T>
    bool is() const noexcept {
        return std::holds_alternative<T>(value_);
    }

    // Text of a Simple or Bulk frame, nullptr for every other kind
    const std::string* as_text() const noexcept;

    // Appends the wire encoding to out
    void encode_into(std::string& out) const;
    std::string encode() const;

    // Readable one-line form, used by logs and test failure output
    std::string to_string() const;

    friend bool operator==(const Frame& lhs, const Frame& rhs);
    friend bool operator!=(const Frame& lhs, const Frame& rhs) { return !(lhs == rhs); }

private:
    explicit Frame(Value value) : value_(std::move(value)) {}

    Value value_;
};

std::ostream& operator<<(std::ostream& os, const Frame& frame);

enum class DecodeStatus {
    Ready,      // frame holds a value, consumed > 0
    Incomplete, // more bytes are needed, nothing consumed
    Malformed   // error holds the reason, nothing consumed
};

struct DecodeResult {
    DecodeStatus status{DecodeStatus::Incomplete};
    Frame frame;
    std::size_t consumed{0};
    std::string error;
};

struct DecoderLimits {
    std::size_t max_line_length = 64 * 1024;
    std::int64_t max_bulk_length = 512LL * 1024 * 1024;
    std::int64_t max_array_length = 1024 * 1024;
    std::size_t max_depth = 32;
};

/*
 * Incremental frame parser.
 *
 * decode() is pure: it only inspects the buffer it is given. The caller
 * removes `consumed` bytes after a Ready result and calls again with a
 * longer buffer after Incomplete.
 */
class FrameDecoder {
public:
    FrameDecoder() = default;
    explicit FrameDecoder(DecoderLimits limits) : limits_(limits) {}

    DecodeResult decode(std::string_view buffer) const;

    const DecoderLimits& limits() const noexcept { return limits_; }

private:
    struct Cursor;

    DecodeStatus decode_at(Cursor& cursor, Frame& out, std::size_t depth) const;
    DecodeStatus read_line(Cursor& cursor, std::string_view& line) const;
    DecodeStatus read_decimal(Cursor& cursor, std::int64_t& value, std::string_view what) const;

    DecoderLimits limits_;
};

} // namespace minikv
