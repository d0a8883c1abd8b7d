#include "Error.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace vernum {

// Non-printable and non-ASCII bytes are escaped as \xHH.
static void
appendByte(std::string& out, const char c) {
  const auto byte = static_cast<unsigned char>(c);
  if (byte >= 0x20 && byte < 0x7f) {
    out += c;
  } else {
    out += fmt::format("\\x{:02X}", byte);
  }
}

static std::string
displayToken(const std::optional<char> got) {
  if (!got.has_value()) {
    return "EOI";
  }
  std::string str;
  appendByte(str, got.value());
  return str;
}

static std::string
displayBytes(const std::string_view bytes) {
  std::string str;
  for (const char c : bytes) {
    appendByte(str, c);
  }
  return str;
}

std::string
ParseErrorReason::toString() const noexcept {
  switch (kind) {
    case ExpectedNumericToken:
      return fmt::format(
          "Expected numeric token (0-9), but got '{}'", displayToken(got)
      );
    case LeadingZeroNotAllowed:
      return "Number may not start with a leading zero, unless the complete "
             "component is '0'";
    case Overflow:
      return fmt::format(
          "Overflow: Found number component which would be larger than the "
          "maximum supported number (max={})",
          std::numeric_limits<uint64_t>::max()
      );
    case ExpectedSeparator:
      return fmt::format(
          "Expected dot token '.', but got '{}'", displayToken(got)
      );
    case ExpectedEndOfInput:
      return fmt::format(
          "Expected end of input after parsing the last version number "
          "component, but got: '{}'",
          displayBytes(extra)
      );
  }
  return "";
}

bool
operator==(const ParseErrorReason& lhs, const ParseErrorReason& rhs) noexcept {
  return lhs.kind == rhs.kind && lhs.got == rhs.got && lhs.extra == rhs.extra;
}

std::ostream&
operator<<(std::ostream& os, const ParseErrorReason& reason) {
  return os << reason.toString();
}

std::string_view
toString(const ParseErrorReason::Kind kind) noexcept {
  switch (kind) {
    case ParseErrorReason::ExpectedNumericToken:
      return "ExpectedNumericToken";
    case ParseErrorReason::LeadingZeroNotAllowed:
      return "LeadingZeroNotAllowed";
    case ParseErrorReason::Overflow:
      return "Overflow";
    case ParseErrorReason::ExpectedSeparator:
      return "ExpectedSeparator";
    case ParseErrorReason::ExpectedEndOfInput:
      return "ExpectedEndOfInput";
  }
  return "Unknown";
}

std::ostream&
operator<<(std::ostream& os, const ParseErrorReason::Kind kind) {
  return os << toString(kind);
}

std::string
renderUnderline(const std::string_view input, std::size_t offset) noexcept {
  offset = std::min(offset, input.size());
  const std::size_t squiggles =
      offset < input.size() ? input.size() - offset - 1 : 0;

  std::string line(offset, ' ');
  line += '^';
  line += std::string(squiggles, '~');
  return line;
}

ParseError::ParseError(
    const std::string_view input, const std::optional<std::size_t> cursor,
    ParseErrorReason reason
) noexcept
    : input(input), cursor(cursor), why(std::move(reason)) {
  if (this->cursor.has_value() && this->cursor.value() > this->input.size()) {
    this->cursor = this->input.size();
  }
}

std::string
ParseError::message() const noexcept {
  return fmt::format(
      "Unable to parse '{}' to a version number: {}", input, why.toString()
  );
}

std::string
ParseError::annotation() const noexcept {
  if (!cursor.has_value()) {
    return "";
  }
  return fmt::format("{}\n{}", input, renderUnderline(input, cursor.value()));
}

std::string
ParseError::toString() const noexcept {
  if (!cursor.has_value()) {
    return message();
  }
  return fmt::format("{}\n{}", message(), annotation());
}

bool
operator==(const ParseError& lhs, const ParseError& rhs) noexcept {
  return lhs.getInput() == rhs.getInput()
         && lhs.getCursor() == rhs.getCursor() && lhs.reason() == rhs.reason();
}

std::ostream&
operator<<(std::ostream& os, const ParseError& err) {
  return os << err.toString();
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "../Rustify/Tests.hpp"

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testRenderUnderline() {
  assertEq(renderUnderline("1.2.3", 0), "^~~~~");
  assertEq(renderUnderline("1.2.3", 2), "  ^~~");
  assertEq(renderUnderline("1.2.3", 4), "    ^");
  // End-of-input errors point just past the last byte.
  assertEq(renderUnderline("1.2.", 4), "    ^");
  assertEq(renderUnderline("", 0), "^");
  assertEq(renderUnderline("1.2", 42), "   ^");

  pass();
}

static void
testReasonMessages() {
  assertEq(
      ParseErrorReason::expectedNumericToken('a').toString(),
      "Expected numeric token (0-9), but got 'a'"
  );
  assertEq(
      ParseErrorReason::expectedNumericToken(std::nullopt).toString(),
      "Expected numeric token (0-9), but got 'EOI'"
  );
  assertEq(
      ParseErrorReason::leadingZeroNotAllowed().toString(),
      "Number may not start with a leading zero, unless the complete "
      "component is '0'"
  );
  assertEq(
      ParseErrorReason::overflow().toString(),
      "Overflow: Found number component which would be larger than the "
      "maximum supported number (max=18446744073709551615)"
  );
  assertEq(
      ParseErrorReason::expectedSeparator(',').toString(),
      "Expected dot token '.', but got ','"
  );
  assertEq(
      ParseErrorReason::expectedSeparator(std::nullopt).toString(),
      "Expected dot token '.', but got 'EOI'"
  );
  assertEq(
      ParseErrorReason::expectedEndOfInput("-alpha").toString(),
      "Expected end of input after parsing the last version number "
      "component, but got: '-alpha'"
  );

  pass();
}

static void
testNonPrintableBytesAreEscaped() {
  assertEq(
      ParseErrorReason::expectedSeparator('\n').toString(),
      "Expected dot token '.', but got '\\x0A'"
  );
  assertEq(
      ParseErrorReason::expectedNumericToken('\xC3').toString(),
      "Expected numeric token (0-9), but got '\\xC3'"
  );
  assertEq(
      ParseErrorReason::expectedEndOfInput("\xC3\xA9").toString(),
      "Expected end of input after parsing the last version number "
      "component, but got: '\\xC3\\xA9'"
  );

  pass();
}

static void
testEndOfInputReasonRemembersFirstByte() {
  const ParseErrorReason reason = ParseErrorReason::expectedEndOfInput(".4");
  assertEq(reason.kind, ParseErrorReason::ExpectedEndOfInput);
  assertTrue(reason.got == '.');
  assertEq(reason.extra, ".4");

  pass();
}

static void
testDiagnosticWithCursor() {
  const ParseError err(
      "1.0.0-alpha", 5, ParseErrorReason::expectedEndOfInput("-alpha")
  );
  assertEq(
      err.message(),
      "Unable to parse '1.0.0-alpha' to a version number: Expected end of "
      "input after parsing the last version number component, but got: "
      "'-alpha'"
  );
  assertEq(
      err.annotation(),
      "1.0.0-alpha\n"
      "     ^~~~~~"
  );
  assertEq(err.what(), err.message() + "\n" + err.annotation());

  pass();
}

static void
testDiagnosticWithoutCursor() {
  const ParseError err("99.0", std::nullopt, ParseErrorReason::overflow());
  assertEq(err.annotation(), "");
  assertEq(err.toString(), err.message());

  pass();
}

static void
testCursorIsClampedToInput() {
  const ParseError err("1", 7, ParseErrorReason::expectedSeparator(std::nullopt));
  assertTrue(err.getCursor() == std::optional<std::size_t>(1));
  assertEq(err.annotation(), "1\n ^");

  pass();
}

static void
testKindNames() {
  assertEq(toString(ParseErrorReason::Overflow), "Overflow");
  assertEq(
      fmt::format("{}", ParseErrorReason::LeadingZeroNotAllowed),
      "LeadingZeroNotAllowed"
  );

  pass();
}

}  // namespace tests

int
main() {
  tests::testRenderUnderline();
  tests::testReasonMessages();
  tests::testNonPrintableBytesAreEscaped();
  tests::testEndOfInputReasonRemembersFirstByte();
  tests::testDiagnosticWithCursor();
  tests::testDiagnosticWithoutCursor();
  tests::testCursorIsClampedToInput();
  tests::testKindNames();
}

#endif
