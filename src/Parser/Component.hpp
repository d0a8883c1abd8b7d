// Primitives shared by the version parsers.
//
// Syntax:
//   version   ::= component "." component ("." component)?
//   component ::= "0" | [1-9][0-9]*
//
// Each component is an unsigned 64-bit integer.
#pragma once

#include "../Rustify/Result.hpp"
#include "Error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vernum {

constexpr bool
isDigit(const char c) noexcept {
  return c >= '0' && c <= '9';
}

// A byte offset into the input.  It only moves forward.
struct Cursor {
  std::string_view s;
  std::size_t pos{ 0 };

  constexpr explicit Cursor(const std::string_view str) noexcept : s(str) {}

  constexpr bool isEof() const noexcept {
    return pos >= s.size();
  }
  constexpr std::optional<char> peek() const noexcept {
    if (isEof()) {
      return std::nullopt;
    }
    return s[pos];
  }
  constexpr void step() noexcept {
    ++pos;
  }
  constexpr std::string_view remaining() const noexcept {
    return isEof() ? std::string_view() : s.substr(pos);
  }

  ParseError error(ParseErrorReason reason) const noexcept;
  ParseError errorAt(std::size_t at, ParseErrorReason reason) const noexcept;
};

enum class NumberError : uint8_t {
  LeadingZero,
  Overflow,
};

// Accumulates the digits of a single component.
class NumberComponent {
  std::optional<uint64_t> value;

public:
  constexpr NumberComponent() noexcept = default;

  // `digit` must satisfy isDigit().
  Result<void, NumberError> insertDigit(char digit) noexcept;

  constexpr std::optional<uint64_t> get() const noexcept {
    return value;
  }
};

// Consumes the maximal run of digits at the cursor.
Result<uint64_t, ParseError> parseComponent(Cursor& cursor) noexcept;

// Consumes exactly one `.`; the cursor does not move on failure.
Result<void, ParseError> parseDot(Cursor& cursor) noexcept;

// Whether the next byte is `.`; never consumes.
constexpr bool
peekIsDot(const Cursor& cursor) noexcept {
  return cursor.peek() == '.';
}

// Succeeds iff no bytes remain.
Result<void, ParseError> expectEnd(const Cursor& cursor) noexcept;

}  // namespace vernum
