#include "Component.hpp"

#include "../Rustify/Result.hpp"
#include "Error.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace vernum {

ParseError
Cursor::error(ParseErrorReason reason) const noexcept {
  return errorAt(pos, std::move(reason));
}

ParseError
Cursor::errorAt(const std::size_t at, ParseErrorReason reason) const noexcept {
  return { s, at, std::move(reason) };
}

Result<void, NumberError>
NumberComponent::insertDigit(const char digit) noexcept {
  const uint64_t next = static_cast<uint64_t>(digit - '0');
  if (!value.has_value()) {
    value = next;
    return Ok();
  }

  const uint64_t current = value.value();
  if (current == 0) {
    return Err(NumberError::LeadingZero);
  }

  constexpr uint64_t base = 10;
  if (current > (std::numeric_limits<uint64_t>::max() - next) / base) {
    return Err(NumberError::Overflow);
  }

  value = current * base + next;
  return Ok();
}

static ParseErrorReason
toReason(const NumberError err) noexcept {
  switch (err) {
    case NumberError::LeadingZero:
      return ParseErrorReason::leadingZeroNotAllowed();
    case NumberError::Overflow:
      return ParseErrorReason::overflow();
  }
  return ParseErrorReason::overflow();
}

Result<uint64_t, ParseError>
parseComponent(Cursor& cursor) noexcept {
  // Number errors point at the first byte of the component.
  const std::size_t start = cursor.pos;

  NumberComponent component;
  while (!cursor.isEof() && isDigit(cursor.s[cursor.pos])) {
    Try(component.insertDigit(cursor.s[cursor.pos])
            .map_err([&](const NumberError err) {
              return cursor.errorAt(start, toReason(err));
            }));
    cursor.step();
  }

  if (const std::optional<uint64_t> value = component.get()) {
    return Ok(value.value());
  }
  return Err(
      cursor.error(ParseErrorReason::expectedNumericToken(cursor.peek()))
  );
}

Result<void, ParseError>
parseDot(Cursor& cursor) noexcept {
  if (!peekIsDot(cursor)) {
    return Err(cursor.error(ParseErrorReason::expectedSeparator(cursor.peek()))
    );
  }
  cursor.step();
  return Ok();
}

Result<void, ParseError>
expectEnd(const Cursor& cursor) noexcept {
  if (!cursor.isEof()) {
    return Err(cursor.error(
        ParseErrorReason::expectedEndOfInput(std::string(cursor.remaining()))
    ));
  }
  return Ok();
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "../Rustify/Tests.hpp"

#  include <cstdint>
#  include <limits>
#  include <string_view>

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testNumberComponent() {
  NumberComponent component;
  assertFalse(component.get().has_value());

  assertIsOk(component.insertDigit('4'));
  assertIsOk(component.insertDigit('2'));
  assertTrue(component.get() == std::optional<uint64_t>(42));

  NumberComponent zero;
  assertIsOk(zero.insertDigit('0'));
  assertTrue(zero.get() == std::optional<uint64_t>(0));
  assertTrue(zero.insertDigit('0').unwrap_err() == NumberError::LeadingZero);
  assertTrue(zero.insertDigit('7').unwrap_err() == NumberError::LeadingZero);

  // A rejected digit leaves the accumulator untouched.
  assertTrue(zero.get() == std::optional<uint64_t>(0));

  pass();
}

static void
testNumberComponentOverflow() {
  constexpr std::string_view max = "18446744073709551615";

  NumberComponent component;
  for (const char c : max) {
    assertIsOk(component.insertDigit(c));
  }
  assertTrue(
      component.get()
      == std::optional<uint64_t>(std::numeric_limits<uint64_t>::max())
  );
  assertTrue(component.insertDigit('0').unwrap_err() == NumberError::Overflow);

  NumberComponent almost;
  for (const char c : std::string_view("1844674407370955161")) {
    assertIsOk(almost.insertDigit(c));
  }
  assertTrue(almost.insertDigit('6').unwrap_err() == NumberError::Overflow);
  assertIsOk(almost.insertDigit('5'));

  pass();
}

static void
testParseComponent() {
  {
    Cursor cursor("123.4");
    assertEq(parseComponent(cursor).unwrap(), 123UL);
    assertEq(cursor.pos, 3UL);
  }
  {
    Cursor cursor("0");
    assertEq(parseComponent(cursor).unwrap(), 0UL);
    assertTrue(cursor.isEof());
  }
  {
    Cursor cursor("0.1");
    assertEq(parseComponent(cursor).unwrap(), 0UL);
    assertEq(cursor.pos, 1UL);
  }

  pass();
}

static void
testParseComponentRejects() {
  {
    Cursor cursor("");
    const ParseError err = parseComponent(cursor).unwrap_err();
    assertEq(err.reason(), ParseErrorReason::expectedNumericToken(std::nullopt));
    assertTrue(err.getCursor() == std::optional<std::size_t>(0));
  }
  {
    Cursor cursor("x1");
    const ParseError err = parseComponent(cursor).unwrap_err();
    assertEq(err.reason(), ParseErrorReason::expectedNumericToken('x'));
  }
  {
    Cursor cursor("1.01");
    cursor.pos = 2;
    const ParseError err = parseComponent(cursor).unwrap_err();
    assertEq(err.kind(), ParseErrorReason::LeadingZeroNotAllowed);
    assertTrue(err.getCursor() == std::optional<std::size_t>(2));
  }
  {
    Cursor cursor("0.18446744073709551616");
    cursor.pos = 2;
    const ParseError err = parseComponent(cursor).unwrap_err();
    assertEq(err.kind(), ParseErrorReason::Overflow);
    assertTrue(err.getCursor() == std::optional<std::size_t>(2));
  }
  {
    // The leading zero is found before the overflow.
    Cursor cursor("000000000000000000000000000");
    assertEq(
        parseComponent(cursor).unwrap_err().kind(),
        ParseErrorReason::LeadingZeroNotAllowed
    );
  }

  pass();
}

static void
testParseDot() {
  {
    Cursor cursor(".1");
    assertIsOk(parseDot(cursor));
    assertEq(cursor.pos, 1UL);
  }
  {
    Cursor cursor(",1");
    const ParseError err = parseDot(cursor).unwrap_err();
    assertEq(err.reason(), ParseErrorReason::expectedSeparator(','));
    assertEq(cursor.pos, 0UL);
  }
  {
    Cursor cursor("1");
    cursor.step();
    const ParseError err = parseDot(cursor).unwrap_err();
    assertEq(err.reason(), ParseErrorReason::expectedSeparator(std::nullopt));
    assertTrue(err.getCursor() == std::optional<std::size_t>(1));
  }

  pass();
}

static void
testPeekIsDot() {
  Cursor cursor("1.");
  assertFalse(peekIsDot(cursor));
  cursor.step();
  assertTrue(peekIsDot(cursor));
  assertEq(cursor.pos, 1UL);
  cursor.step();
  assertFalse(peekIsDot(cursor));

  static_assert(peekIsDot(Cursor(".")));
  static_assert(!peekIsDot(Cursor("")));

  pass();
}

static void
testExpectEnd() {
  Cursor cursor("1.2-rc");
  assertIsOk(expectEnd(Cursor("")));

  cursor.pos = 3;
  const ParseError err = expectEnd(cursor).unwrap_err();
  assertEq(err.reason(), ParseErrorReason::expectedEndOfInput("-rc"));
  assertTrue(err.reason().got == '-');
  assertTrue(err.getCursor() == std::optional<std::size_t>(3));
  assertEq(cursor.pos, 3UL);

  pass();
}

}  // namespace tests

int
main() {
  tests::testNumberComponent();
  tests::testNumberComponentOverflow();
  tests::testParseComponent();
  tests::testParseComponentRejects();
  tests::testParseDot();
  tests::testPeekIsDot();
  tests::testExpectEnd();
}

#endif
