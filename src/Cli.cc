#include "Cli.hpp"

#include "Rustify/Result.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/core.h>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vernum {

static constinit const std::string_view PADDING = "  ";

static std::string
formatLeft(const std::size_t offset, const std::string_view left) noexcept {
  return fmt::format("{}{:<{}}", PADDING, left, offset + PADDING.size());
}

static std::string
formatHeader(const std::string_view header) noexcept {
  return fmt::format("{}\n", Bold(Green(header)).toStr());
}

std::string
Opt::format(const std::size_t maxShortSize, std::size_t maxOffset)
    const noexcept {
  std::string option;
  if (hasShort()) {
    option += Bold(Cyan(shortName)).toStr();
    option += ", ";
    if (maxShortSize > shortName.size()) {
      option += std::string(maxShortSize - shortName.size(), ' ');
    }
  } else {
    // This coloring is for the alignment with std::setw later.
    option += Bold(Cyan(std::string(maxShortSize, ' '))).toStr();
    option += "  ";  // ", "
  }
  option += Bold(Cyan(name)).toStr();
  option += ' ';
  option += Cyan(placeholder).toStr();

  if (shouldColorStdout()) {
    // Color escape sequences are not visible but affect std::setw.
    constexpr std::size_t colorEscapeSeqLen = 31;
    maxOffset += colorEscapeSeqLen;
  }
  std::string str = formatLeft(maxOffset, option);
  str += desc;
  if (!defaultVal.empty()) {
    str += fmt::format(" [default: {}]", defaultVal);
  }
  str += '\n';
  return str;
}

std::string
Arg::getLeft() const noexcept {
  if (name.empty()) {
    return "";
  }

  std::string left;
  left += required ? '<' : '[';
  left += name;
  left += required ? '>' : ']';
  if (variadic) {
    left += "...";
  }
  return Cyan(std::move(left)).toStr();
}

std::string
Arg::format(std::size_t maxOffset) const noexcept {
  const std::string left = getLeft();
  if (shouldColorStdout()) {
    // Color escape sequences are not visible but affect std::setw.
    constexpr std::size_t colorEscapeSeqLen = 9;
    maxOffset += colorEscapeSeqLen;
  }
  std::string str = formatLeft(maxOffset, left);
  str += desc;
  str += '\n';
  return str;
}

Cli&
Cli::addOpt(const Opt& opt) noexcept {
  opts.push_back(opt);
  return *this;
}

Cli&
Cli::setArg(const Arg& arg) noexcept {
  this->arg = arg;
  return *this;
}

const Opt*
Cli::findOpt(const std::string_view name) const noexcept {
  const auto itr = std::ranges::find_if(opts, [name](const Opt& opt) {
    return opt.is(name);
  });
  if (itr == opts.end()) {
    return nullptr;
  }
  return &*itr;
}

[[nodiscard]] AnyhowErr
Cli::noSuchArg(const std::string_view arg) const {
  return anyhow::anyhow(
      "unexpected argument '{}' found\n\n"
      "{}\n"
      "For more information, try '{}'",
      Bold(Yellow(arg)).toErrStr(), formatUsage(),
      Bold(Cyan("--help")).toErrStr()
  );
}

[[nodiscard]] AnyhowErr
Cli::missingOptArgumentFor(const std::string_view arg) noexcept {
  return anyhow::anyhow("Missing argument for `{}`", arg);
}

Result<std::vector<std::string>>
Cli::expandOpts(const std::span<const char* const> args) const noexcept {
  std::vector<std::string> expanded;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view arg = args[i];

    // "--" ends the options; the rest may even start with '-'.
    if (arg == "--") {
      expanded.insert(expanded.end(), args.begin() + i, args.end());
      break;
    }

    // Long option case
    //
    // "--verbose" => ["--verbose"]
    // "--parser oneshot" => ["--parser", "oneshot"]
    // "--parser=oneshot" => ["--parser", "oneshot"]
    if (arg.starts_with("--")) {
      const std::size_t eqPos = arg.find_first_of('=');
      const std::string_view optName = arg.substr(0, eqPos);
      const Opt* opt = findOpt(optName);
      if (opt == nullptr || !opt->takesArg()) {
        // Unknown options are rejected later, where the context is known.
        expanded.emplace_back(arg);
        continue;
      }

      if (eqPos != std::string_view::npos) {
        if (eqPos + 1 == arg.size()) {
          // Handle "--color=" case.
          return missingOptArgumentFor(optName);
        }
        expanded.emplace_back(optName);
        expanded.emplace_back(arg.substr(eqPos + 1));
      } else if (i + 1 < args.size()) {
        // Validity of the value is checked later.
        expanded.emplace_back(arg);
        expanded.emplace_back(args[++i]);
      } else {
        return missingOptArgumentFor(arg);
      }
      continue;
    }

    // Short option case
    //
    // "-vv" => ["-vv"]
    // "-vq" => ["-v", "-q"]
    // "-pmodular" => ["-p", "modular"]
    if (arg.starts_with('-') && arg.size() > 1) {
      if (const Opt* opt = findOpt(arg)) {
        expanded.emplace_back(arg);
        if (opt->takesArg()) {
          if (i + 1 == args.size()) {
            return missingOptArgumentFor(arg);
          }
          expanded.emplace_back(args[++i]);
        }
        continue;
      }

      std::vector<std::string> cluster;
      bool consumedNext = false;
      bool known = true;
      for (std::size_t pos = 1; pos < arg.size(); ++pos) {
        const std::string optName = fmt::format("-{}", arg[pos]);
        const Opt* opt = findOpt(optName);
        if (opt == nullptr) {
          known = false;
          break;
        }
        cluster.push_back(optName);
        if (!opt->takesArg()) {
          continue;
        }

        if (pos + 1 < arg.size()) {
          cluster.emplace_back(arg.substr(pos + 1));
        } else if (i + 1 < args.size()) {
          cluster.emplace_back(args[i + 1]);
          consumedNext = true;
        } else {
          return missingOptArgumentFor(optName);
        }
        break;
      }

      if (known) {
        expanded.insert(expanded.end(), cluster.begin(), cluster.end());
        if (consumedNext) {
          ++i;
        }
        continue;
      }
    }

    // Positional arguments and unknown options are added as is.
    expanded.emplace_back(arg);
  }
  return Ok(expanded);
}

std::string
Cli::formatUsage() const noexcept {
  std::string str = Bold(Green("Usage: ")).toStr();
  str += Bold(Cyan(name)).toStr();
  str += ' ';
  str += Cyan("[OPTIONS]").toStr();
  if (!arg.name.empty()) {
    str += ' ';
    str += arg.getLeft();
  }
  str += '\n';
  return str;
}

std::size_t
Cli::calcMaxShortSize() const noexcept {
  std::size_t maxShortSize = 0;
  for (const Opt& opt : opts) {
    if (opt.isHidden) {
      // Hidden option should not affect maxShortSize.
      continue;
    }
    maxShortSize = std::max(maxShortSize, opt.shortName.size());
  }
  return maxShortSize;
}

std::size_t
Cli::calcMaxOffset(const std::size_t maxShortSize) const noexcept {
  std::size_t maxOffset = 0;
  for (const Opt& opt : opts) {
    if (opt.isHidden) {
      continue;
    }
    maxOffset = std::max(maxOffset, opt.leftSize(maxShortSize));
  }
  if (!arg.desc.empty()) {
    maxOffset = std::max(maxOffset, arg.leftSize());
  }
  return maxOffset;
}

std::string
Cli::formatHelp() const noexcept {
  const std::size_t maxShortSize = calcMaxShortSize();
  const std::size_t maxOffset = calcMaxOffset(maxShortSize);

  std::string str = std::string(desc);
  str += "\n\n";
  str += formatUsage();
  str += '\n';
  str += formatHeader("Options:");
  for (const Opt& opt : opts) {
    if (opt.isHidden) {
      continue;
    }
    str += opt.format(maxShortSize, maxOffset);
  }

  if (!arg.name.empty()) {
    str += '\n';
    str += formatHeader("Arguments:");
    str += arg.format(maxOffset);
  }
  return str;
}

void
Cli::printHelp() const noexcept {
  fmt::print("{}", formatHelp());
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

static const Cli&
getTestCli() noexcept {
  static const Cli cli =  //
      Cli{ "test" }
          .setDesc("A test command")
          .addOpt(Opt{ "--verbose" }.setShort("-v").setDesc("Be verbose"))
          .addOpt(Opt{ "-vv" }.setShort("-vv").setHidden(true))
          .addOpt(Opt{ "--quiet" }.setShort("-q").setDesc("Be quiet"))
          .addOpt(Opt{ "--parser" }
                      .setShort("-p")
                      .setDesc("Backend")
                      .setPlaceholder("<NAME>")
                      .setDefault("modular"))
          .addOpt(Opt{ "--keep-going" }.setDesc("Do not stop"))
          .setArg(Arg{ "VERSION" }.setDesc("Inputs").setVariadic(true));
  return cli;
}

static void
testFindOpt() {
  assertEq(getTestCli().findOpt("-v")->getName(), "--verbose");
  assertEq(getTestCli().findOpt("--parser")->getName(), "--parser");
  assertTrue(getTestCli().findOpt("--missing") == nullptr);
  assertTrue(getTestCli().findOpt("") == nullptr);

  pass();
}

static void
testCliExpandOpts() {
  {
    const std::vector<const char*> args{ "-vq", "1.2" };
    const std::vector<std::string> expected{ "-v", "-q", "1.2" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "-vv" };
    const std::vector<std::string> expected{ "-vv" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "-vponeshot" };
    const std::vector<std::string> expected{ "-v", "-p", "oneshot" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "-qp", "oneshot", "1.2" };
    const std::vector<std::string> expected{ "-q", "-p", "oneshot", "1.2" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "--parser=oneshot", "1.2" };
    const std::vector<std::string> expected{ "--parser", "oneshot", "1.2" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "--parser", "oneshot" };
    const std::vector<std::string> expected{ "--parser", "oneshot" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "--parser=" };
    assertEq(
        getTestCli().expandOpts(args).unwrap_err()->what(),
        "Missing argument for `--parser`"
    );
  }
  {
    const std::vector<const char*> args{ "1.2", "--parser" };
    assertEq(
        getTestCli().expandOpts(args).unwrap_err()->what(),
        "Missing argument for `--parser`"
    );
  }
  {
    const std::vector<const char*> args{ "-vp" };
    assertEq(
        getTestCli().expandOpts(args).unwrap_err()->what(),
        "Missing argument for `-p`"
    );
  }
  {
    // Unknown options are left for the caller to report.
    const std::vector<const char*> args{ "-x", "--unknown", "-vx" };
    const std::vector<std::string> expected{ "-x", "--unknown", "-vx" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }
  {
    const std::vector<const char*> args{ "-v", "--", "-1.2", "--quiet" };
    const std::vector<std::string> expected{ "-v", "--", "-1.2", "--quiet" };
    assertEq(getTestCli().expandOpts(args).unwrap(), expected);
  }

  pass();
}

static void
testNoSuchArg() {
  const Result<void> res = getTestCli().noSuchArg("--bogus");
  assertEq(
      res.unwrap_err()->what(),
      "unexpected argument '--bogus' found\n\n"
      "Usage: test [OPTIONS] <VERSION>...\n\n"
      "For more information, try '--help'"
  );

  pass();
}

static void
testFormatHelp() {
  assertEq(
      getTestCli().formatHelp(),
      "A test command\n"
      "\n"
      "Usage: test [OPTIONS] <VERSION>...\n"
      "\n"
      "Options:\n"
      "  -v, --verbose        Be verbose\n"
      "  -q, --quiet          Be quiet\n"
      "  -p, --parser <NAME>  Backend [default: modular]\n"
      "      --keep-going     Do not stop\n"
      "\n"
      "Arguments:\n"
      "  <VERSION>...         Inputs\n"
  );

  pass();
}

}  // namespace tests

int
main() {
  vernum::setColorMode("never");

  tests::testFindOpt();
  tests::testCliExpandOpts();
  tests::testNoSuchArg();
  tests::testFormatHelp();
}

#endif
