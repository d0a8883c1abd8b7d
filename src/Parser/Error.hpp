#pragma once

#include <cstddef>
#include <cstdint>
#include <fmt/ostream.h>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace vernum {

// Why an input could not be parsed to a version number.  The set of kinds is
// closed; the human-readable text is only a rendering of it.
struct ParseErrorReason {
  enum class Kind : uint8_t {
    ExpectedNumericToken,   // a digit was expected
    LeadingZeroNotAllowed,  // e.g., `01`
    Overflow,               // component > UINT64_MAX
    ExpectedSeparator,      // a `.` was expected
    ExpectedEndOfInput,     // trailing bytes after the last component
  };
  using enum Kind;

  Kind kind;
  // The byte found instead of a digit or a separator; std::nullopt if the
  // input was exhausted.
  std::optional<char> got;
  // Unconsumed bytes for ExpectedEndOfInput.
  std::string extra;

  static ParseErrorReason
  expectedNumericToken(const std::optional<char> got) noexcept {
    return { ExpectedNumericToken, got, "" };
  }
  static ParseErrorReason leadingZeroNotAllowed() noexcept {
    return { LeadingZeroNotAllowed, std::nullopt, "" };
  }
  static ParseErrorReason overflow() noexcept {
    return { Overflow, std::nullopt, "" };
  }
  static ParseErrorReason
  expectedSeparator(const std::optional<char> got) noexcept {
    return { ExpectedSeparator, got, "" };
  }
  static ParseErrorReason expectedEndOfInput(std::string extra) noexcept {
    const std::optional<char> first =
        extra.empty() ? std::nullopt : std::optional<char>(extra.front());
    return { ExpectedEndOfInput, first, std::move(extra) };
  }

  std::string toString() const noexcept;
};
bool operator==(const ParseErrorReason& lhs, const ParseErrorReason& rhs) noexcept;
std::ostream& operator<<(std::ostream& os, const ParseErrorReason& reason);

std::string_view toString(ParseErrorReason::Kind kind) noexcept;
std::ostream& operator<<(std::ostream& os, ParseErrorReason::Kind kind);

// Renders a marker line for `input`: `offset` spaces, a `^` under the byte at
// `offset`, and a `~` under every remaining byte.  An offset past the end is
// clamped to `input.size()`, which yields a lone `^` just after the input.
std::string renderUnderline(std::string_view input, std::size_t offset) noexcept;

class ParseError {
  std::string input;
  std::optional<std::size_t> cursor;
  ParseErrorReason why;

public:
  ParseError(
      std::string_view input, std::optional<std::size_t> cursor,
      ParseErrorReason reason
  ) noexcept;

  const ParseErrorReason& reason() const noexcept {
    return why;
  }
  ParseErrorReason::Kind kind() const noexcept {
    return why.kind;
  }
  const std::string& getInput() const noexcept {
    return input;
  }
  std::optional<std::size_t> getCursor() const noexcept {
    return cursor;
  }

  // Unable to parse '<input>' to a version number: <reason>
  std::string message() const noexcept;
  // The input and its underline on two lines; empty without a cursor.
  std::string annotation() const noexcept;
  // message() followed by annotation() when available.
  std::string toString() const noexcept;
  std::string what() const noexcept {
    return toString();
  }
};
bool operator==(const ParseError& lhs, const ParseError& rhs) noexcept;
std::ostream& operator<<(std::ostream& os, const ParseError& err);

}  // namespace vernum

template <>
struct fmt::formatter<vernum::ParseErrorReason> : ostream_formatter {};

template <>
struct fmt::formatter<vernum::ParseErrorReason::Kind> : ostream_formatter {};

template <>
struct fmt::formatter<vernum::ParseError> : ostream_formatter {};
