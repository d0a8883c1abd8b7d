#pragma once

#include "Cli.hpp"
#include "Parser/Error.hpp"
#include "Rustify/Result.hpp"
#include "Version.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vernum {

enum class Backend : uint8_t {
  Modular,  // default
  OneShot,
};
std::string_view toString(Backend backend) noexcept;
Result<Backend> parseBackend(std::string_view name) noexcept;

// Which shape an input must have.
enum class Expect : uint8_t {
  Any,  // default
  Base,
  Full,
};
std::string_view toString(Expect expect) noexcept;
Result<Expect> parseExpect(std::string_view name) noexcept;

struct Config {
  Backend backend = Backend::Modular;
  Expect expect = Expect::Any;
  bool keepGoing = false;
  std::vector<std::string> inputs;
};

const Cli& getCli() noexcept;

// std::nullopt when the arguments were fully handled, e.g., by --help.
Result<std::optional<Config>> parseArgs(CliArgsView args) noexcept;

Result<Version, ParseError>
parseInput(std::string_view input, Backend backend, Expect expect) noexcept;

// Prints one line per parsed input to stdout and a diagnostic per failure to
// stderr.
Result<void> run(const Config& config) noexcept;

// NOLINTNEXTLINE(*-avoid-c-arrays)
Result<void, void> vernumMain(int argc, char* argv[]) noexcept;

}  // namespace vernum
