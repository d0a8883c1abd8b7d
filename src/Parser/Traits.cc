#include "Traits.hpp"

#include "../Rustify/Result.hpp"
#include "../Version.hpp"
#include "Error.hpp"
#include "Modular.hpp"
#include "OneShot.hpp"

#include <string_view>

namespace vernum {

static_assert(VersionParser<OneShot> && BaseVersionParser<OneShot>
              && FullVersionParser<OneShot>);
static_assert(VersionParser<Modular> && BaseVersionParser<Modular>
              && FullVersionParser<Modular>);

Result<Version, ParseError>
OneShot::parseVersion(const std::string_view input) const noexcept {
  return OneShotParser(input).parse();
}

Result<BaseVersion, ParseError>
OneShot::parseBase(const std::string_view input) const noexcept {
  return OneShotParser(input).parseBase();
}

Result<FullVersion, ParseError>
OneShot::parseFull(const std::string_view input) const noexcept {
  return OneShotParser(input).parseFull();
}

Result<Version, ParseError>
Modular::parseVersion(const std::string_view input) const noexcept {
  return ModularParser(input).parse();
}

Result<BaseVersion, ParseError>
Modular::parseBase(const std::string_view input) const noexcept {
  return Try(ModularParser(input).parseBase()).finishBaseVersion();
}

Result<FullVersion, ParseError>
Modular::parseFull(const std::string_view input) const noexcept {
  return Try(ModularParser(input).parseFull()).finishFullVersion();
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "../Rustify/Tests.hpp"

#  include <string>
#  include <vector>

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

template <VersionParser P>
static std::vector<std::string>
describeAll(const P& parser, const std::vector<std::string_view>& inputs) {
  std::vector<std::string> out;
  for (const std::string_view input : inputs) {
    const Result<Version, ParseError> res = parser.parseVersion(input);
    if (res.is_ok()) {
      out.push_back(res.unwrap().toString());
    } else {
      out.push_back(res.unwrap_err().message());
    }
  }
  return out;
}

template <typename P>
  requires BaseVersionParser<P> && FullVersionParser<P>
static void
checkShapeSpecific(const P& parser) {
  assertEq(parser.parseBase("1.2").unwrap(), (BaseVersion{ 1, 2 }));
  assertEq(
      parser.parseBase("1.2.3").unwrap_err().kind(),
      ParseErrorReason::ExpectedEndOfInput
  );
  assertEq(parser.parseFull("1.2.3").unwrap(), (FullVersion{ 1, 2, 3 }));
  assertEq(
      parser.parseFull("1.2").unwrap_err().kind(),
      ParseErrorReason::ExpectedSeparator
  );
}

static void
testOneShot() {
  const OneShot parser;
  assertEq(parser.parseVersion("1.2").unwrap(), Version::newBaseVersion(1, 2));
  checkShapeSpecific(parser);

  pass();
}

static void
testModular() {
  const Modular parser;
  assertEq(
      parser.parseVersion("1.2.3").unwrap(), Version::newFullVersion(1, 2, 3)
  );
  checkShapeSpecific(parser);

  pass();
}

static void
testBackendsInterchangeable() {
  const std::vector<std::string_view> inputs = {
    "1.2", "1.2.3", "1", "01.2", "1.2.3.4", "1.2.3-rc", "18446744073709551616.0",
  };
  assertTrue(describeAll(OneShot{}, inputs) == describeAll(Modular{}, inputs));

  pass();
}

}  // namespace tests

int
main() {
  tests::testOneShot();
  tests::testModular();
  tests::testBackendsInterchangeable();
}

#endif
