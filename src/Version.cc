#include "Version.hpp"

#include "Parser/Error.hpp"
#include "Parser/Modular.hpp"
#include "Rustify/Result.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>

namespace vernum {

Result<BaseVersion, ParseError>
BaseVersion::parse(const std::string_view str) noexcept {
  return Try(ModularParser(str).parseBase()).finishBaseVersion();
}

FullVersion
BaseVersion::toFullVersionLossy() const noexcept {
  return { major, minor, 0 };
}

std::string
BaseVersion::toString() const noexcept {
  return std::to_string(major) + '.' + std::to_string(minor);
}

std::ostream&
operator<<(std::ostream& os, const BaseVersion& ver) {
  os << ver.toString();
  return os;
}

bool
operator==(const BaseVersion& lhs, const BaseVersion& rhs) noexcept {
  return std::tie(lhs.major, lhs.minor) == std::tie(rhs.major, rhs.minor);
}
bool
operator!=(const BaseVersion& lhs, const BaseVersion& rhs) noexcept {
  return !(lhs == rhs);
}
bool
operator<(const BaseVersion& lhs, const BaseVersion& rhs) noexcept {
  return std::tie(lhs.major, lhs.minor) < std::tie(rhs.major, rhs.minor);
}
bool
operator>(const BaseVersion& lhs, const BaseVersion& rhs) noexcept {
  return rhs < lhs;
}
bool
operator<=(const BaseVersion& lhs, const BaseVersion& rhs) noexcept {
  return !(rhs < lhs);
}
bool
operator>=(const BaseVersion& lhs, const BaseVersion& rhs) noexcept {
  return !(lhs < rhs);
}

Result<FullVersion, ParseError>
FullVersion::parse(const std::string_view str) noexcept {
  return Try(ModularParser(str).parseFull()).finishFullVersion();
}

BaseVersion
FullVersion::toBaseVersionLossy() const noexcept {
  return { major, minor };
}

std::string
FullVersion::toString() const noexcept {
  return std::to_string(major) + '.' + std::to_string(minor) + '.'
         + std::to_string(patch);
}

std::ostream&
operator<<(std::ostream& os, const FullVersion& ver) {
  os << ver.toString();
  return os;
}

bool
operator==(const FullVersion& lhs, const FullVersion& rhs) noexcept {
  return std::tie(lhs.major, lhs.minor, lhs.patch)
         == std::tie(rhs.major, rhs.minor, rhs.patch);
}
bool
operator!=(const FullVersion& lhs, const FullVersion& rhs) noexcept {
  return !(lhs == rhs);
}
bool
operator<(const FullVersion& lhs, const FullVersion& rhs) noexcept {
  return std::tie(lhs.major, lhs.minor, lhs.patch)
         < std::tie(rhs.major, rhs.minor, rhs.patch);
}
bool
operator>(const FullVersion& lhs, const FullVersion& rhs) noexcept {
  return rhs < lhs;
}
bool
operator<=(const FullVersion& lhs, const FullVersion& rhs) noexcept {
  return !(rhs < lhs);
}
bool
operator>=(const FullVersion& lhs, const FullVersion& rhs) noexcept {
  return !(lhs < rhs);
}

std::string_view
toString(const Variant variant) noexcept {
  switch (variant) {
    case Variant::Base:
      return "base";
    case Variant::Full:
      return "full";
  }
  return "unknown";
}

Result<Version, ParseError>
Version::parse(const std::string_view str) noexcept {
  return ModularParser(str).parse();
}

uint64_t
Version::getMajor() const noexcept {
  return std::visit([](const auto& ver) { return ver.major; }, inner);
}

uint64_t
Version::getMinor() const noexcept {
  return std::visit([](const auto& ver) { return ver.minor; }, inner);
}

std::optional<uint64_t>
Version::getPatch() const noexcept {
  if (const FullVersion* full = asFull()) {
    return full->patch;
  }
  return std::nullopt;
}

std::string
Version::toString() const noexcept {
  return std::visit([](const auto& ver) { return ver.toString(); }, inner);
}

std::ostream&
operator<<(std::ostream& os, const Version& ver) {
  os << ver.toString();
  return os;
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "Rustify/Tests.hpp"

#  include <cstdint>
#  include <fmt/format.h>
#  include <functional>
#  include <limits>
#  include <string>
#  include <string_view>
#  include <unordered_set>

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testParseAndDisplay() {
  for (const std::string_view input :
       { "0.0", "1.0", "0.1", "1.2", "10.20", "1.2.3", "0.0.0", "1.0.0",
         "100.200.300" }) {
    assertEq(Version::parse(input).unwrap().toString(), input);
  }

  constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
  const std::string maxFull = fmt::format("{0}.{0}.{0}", max);
  assertEq(Version::parse(maxFull).unwrap().toString(), maxFull);
  assertEq(
      FullVersion::parse(maxFull).unwrap(), (FullVersion{ max, max, max })
  );

  pass();
}

static void
testDisambiguation() {
  assertTrue(Version::parse("1.2").unwrap().is(Variant::Base));
  assertTrue(Version::parse("1.2.0").unwrap().is(Variant::Full));

  // 1.2 and 1.2.0 are different values.
  assertNe(Version::parse("1.2").unwrap(), Version::parse("1.2.0").unwrap());

  pass();
}

static void
testParseRejected() {
  assertEq(
      Version::parse("").unwrap_err().reason(),
      ParseErrorReason::expectedNumericToken(std::nullopt)
  );
  assertEq(
      Version::parse("1").unwrap_err().reason(),
      ParseErrorReason::expectedSeparator(std::nullopt)
  );
  assertEq(
      Version::parse("1,1").unwrap_err().reason(),
      ParseErrorReason::expectedSeparator(',')
  );
  assertEq(
      Version::parse("a.1").unwrap_err().reason(),
      ParseErrorReason::expectedNumericToken('a')
  );
  assertEq(
      Version::parse(" 1.2").unwrap_err().reason(),
      ParseErrorReason::expectedNumericToken(' ')
  );
  assertEq(
      Version::parse("1.0.0-alpha").unwrap_err().reason(),
      ParseErrorReason::expectedEndOfInput("-alpha")
  );
  assertEq(
      Version::parse("1.0.0 ").unwrap_err().reason(),
      ParseErrorReason::expectedEndOfInput(" ")
  );

  for (const std::string_view input :
       { "01.0", "1.01", "1.0.01", "00.0", "0.00", "0.0.00" }) {
    assertEq(
        Version::parse(input).unwrap_err().kind(),
        ParseErrorReason::LeadingZeroNotAllowed
    );
  }

  pass();
}

static void
testOverflowBoundary() {
  constexpr uint64_t max = std::numeric_limits<uint64_t>::max();

  assertEq(
      Version::parse("18446744073709551615.0").unwrap(),
      Version::newBaseVersion(max, 0)
  );
  assertEq(
      Version::parse("18446744073709551616.0").unwrap_err().kind(),
      ParseErrorReason::Overflow
  );
  assertEq(
      Version::parse("0.0.18446744073709551616").unwrap_err().kind(),
      ParseErrorReason::Overflow
  );

  pass();
}

static void
testShapeSpecificParse() {
  assertEq(BaseVersion::parse("1.2").unwrap(), (BaseVersion{ 1, 2 }));
  assertEq(
      BaseVersion::parse("1.2.3").unwrap_err().reason(),
      ParseErrorReason::expectedEndOfInput(".3")
  );

  assertEq(FullVersion::parse("1.2.3").unwrap(), (FullVersion{ 1, 2, 3 }));
  assertEq(
      FullVersion::parse("1.2").unwrap_err().reason(),
      ParseErrorReason::expectedSeparator(std::nullopt)
  );

  pass();
}

static void
testOrdering() {
  assertLt((BaseVersion{ 1, 2 }), (BaseVersion{ 1, 10 }));
  assertLt((BaseVersion{ 1, 99 }), (BaseVersion{ 2, 0 }));
  assertTrue(BaseVersion{ 1, 2 } <= BaseVersion{ 1, 2 });
  assertTrue(BaseVersion{ 3, 0 } > BaseVersion{ 2, 9 });

  assertLt((FullVersion{ 1, 2, 3 }), (FullVersion{ 1, 2, 4 }));
  assertLt((FullVersion{ 1, 2, 9 }), (FullVersion{ 1, 3, 0 }));
  assertTrue(FullVersion{ 1, 2, 3 } >= FullVersion{ 1, 2, 3 });
  assertFalse(FullVersion{ 0, 0, 1 } > FullVersion{ 0, 1, 0 });

  pass();
}

static void
testLossyConversions() {
  assertEq((BaseVersion{ 1, 2 }).toFullVersionLossy(), (FullVersion{ 1, 2, 0 }));
  assertEq((FullVersion{ 1, 2, 3 }).toBaseVersionLossy(), (BaseVersion{ 1, 2 }));

  pass();
}

static void
testFromTuple() {
  assertEq(BaseVersion::from({ 1, 2 }), (BaseVersion{ 1, 2 }));
  assertEq(FullVersion::from({ 1, 2, 3 }), (FullVersion{ 1, 2, 3 }));
  assertEq(
      Version::from(std::tuple<uint64_t, uint64_t>{ 4, 5 }),
      Version::newBaseVersion(4, 5)
  );
  assertEq(
      Version::from(std::tuple<uint64_t, uint64_t, uint64_t>{ 4, 5, 6 }),
      Version::newFullVersion(4, 5, 6)
  );

  pass();
}

static void
testAccessors() {
  const Version base = Version::newBaseVersion(1, 2);
  assertEq(base.getMajor(), 1UL);
  assertEq(base.getMinor(), 2UL);
  assertFalse(base.getPatch().has_value());
  assertTrue(base.asBase() != nullptr);
  assertTrue(base.asFull() == nullptr);
  assertEq(toString(base.variant()), "base");

  const Version full = Version::newFullVersion(1, 2, 3);
  assertEq(full.getMajor(), 1UL);
  assertTrue(full.getPatch() == std::optional<uint64_t>(3));
  assertTrue(full.asFull() != nullptr);
  assertEq(toString(full.variant()), "full");

  assertEq(full.map([](const Version& ver) { return ver.getMinor() * 10; }), 20UL);

  pass();
}

static void
testFormat() {
  assertEq(fmt::format("{}", BaseVersion{ 3, 4 }), "3.4");
  assertEq(fmt::format("{}", FullVersion{ 3, 4, 5 }), "3.4.5");
  assertEq(fmt::format("{}", Version::newFullVersion(0, 0, 0)), "0.0.0");

  pass();
}

static void
testHash() {
  std::unordered_set<Version> set;
  set.insert(Version::newBaseVersion(1, 2));
  set.insert(Version::newFullVersion(1, 2, 0));
  set.insert(Version::parse("1.2").unwrap());
  assertEq(set.size(), 2UL);

  assertEq(
      std::hash<BaseVersion>{}(BaseVersion{ 7, 8 }),
      std::hash<BaseVersion>{}(BaseVersion::parse("7.8").unwrap())
  );

  pass();
}

}  // namespace tests

int
main() {
  tests::testParseAndDisplay();
  tests::testDisambiguation();
  tests::testParseRejected();
  tests::testOverflowBoundary();
  tests::testShapeSpecificParse();
  tests::testOrdering();
  tests::testLossyConversions();
  tests::testFromTuple();
  tests::testAccessors();
  tests::testFormat();
  tests::testHash();
}

#endif
