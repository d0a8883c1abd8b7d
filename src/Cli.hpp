#pragma once

#include "Rustify/Result.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vernum {

class Opt;
class Arg;
class Cli;

using CliArgsView = std::span<const std::string>;
using Opts = std::vector<Opt>;

template <typename Derived>
class CliBase {
protected:
  // NOLINTBEGIN(*-non-private-member-variables-in-classes)
  std::string_view name;
  std::string_view desc;
  // NOLINTEND(*-non-private-member-variables-in-classes)

public:
  constexpr CliBase() noexcept = default;
  constexpr explicit CliBase(const std::string_view name) noexcept
      : name(name) {}

  constexpr Derived& setDesc(const std::string_view desc) noexcept {
    this->desc = desc;
    return static_cast<Derived&>(*this);
  }
  constexpr std::string_view getName() const noexcept {
    return name;
  }
};

class Opt : public CliBase<Opt> {
  friend class Cli;

  std::string_view shortName;
  std::string_view placeholder;
  std::string_view defaultVal;
  bool isHidden = false;

public:
  using CliBase::CliBase;

  constexpr Opt& setShort(const std::string_view shortName) noexcept {
    this->shortName = shortName;
    return *this;
  }
  constexpr Opt& setPlaceholder(const std::string_view placeholder) noexcept {
    this->placeholder = placeholder;
    return *this;
  }
  constexpr Opt& setDefault(const std::string_view defaultVal) noexcept {
    this->defaultVal = defaultVal;
    return *this;
  }
  constexpr Opt& setHidden(const bool isHidden) noexcept {
    this->isHidden = isHidden;
    return *this;
  }

  constexpr bool hasShort() const noexcept {
    return !shortName.empty();
  }
  constexpr bool takesArg() const noexcept {
    return !placeholder.empty();
  }
  constexpr bool is(const std::string_view arg) const noexcept {
    return arg == name || (hasShort() && arg == shortName);
  }

private:
  /// Size of `-c, --color <WHEN>` without color.
  constexpr std::size_t leftSize(std::size_t maxShortSize) const noexcept {
    // maxShortSize + `, `.size() + name.size() + ` `.size() + placeholder
    return 3 + maxShortSize + name.size() + placeholder.size();
  }

  std::string
  format(std::size_t maxShortSize, std::size_t maxOffset) const noexcept;
};

class Arg : public CliBase<Arg> {
  friend class Cli;

  bool required = true;
  bool variadic = false;

public:
  using CliBase::CliBase;

  constexpr Arg& setRequired(const bool required) noexcept {
    this->required = required;
    return *this;
  }
  constexpr Arg& setVariadic(const bool variadic) noexcept {
    this->variadic = variadic;
    return *this;
  }

private:
  constexpr std::size_t leftSize() const noexcept {
    // `<` + name + `>` + `...`
    return name.size() + 2 + (variadic ? 3 : 0);
  }

  std::string getLeft() const noexcept;
  std::string format(std::size_t maxOffset) const noexcept;
};

// A single-command argument parser: options, then positional arguments.
class Cli : public CliBase<Cli> {
  Opts opts;
  Arg arg;

public:
  using CliBase::CliBase;

  Cli& addOpt(const Opt& opt) noexcept;
  Cli& setArg(const Arg& arg) noexcept;

  // Looks up an option by its long or short name.
  const Opt* findOpt(std::string_view name) const noexcept;

  [[nodiscard]] AnyhowErr noSuchArg(std::string_view arg) const;
  [[nodiscard]] static AnyhowErr
  missingOptArgumentFor(std::string_view arg) noexcept;

  // Splits option values and short-option clusters:
  //
  //   "--color=always" => ["--color", "always"]
  //   "-vq"            => ["-v", "-q"]
  //
  // Everything after "--" is passed through untouched.
  Result<std::vector<std::string>>
  expandOpts(std::span<const char* const> args) const noexcept;

  std::string formatHelp() const noexcept;
  void printHelp() const noexcept;

private:
  std::string formatUsage() const noexcept;
  std::size_t calcMaxShortSize() const noexcept;
  std::size_t calcMaxOffset(std::size_t maxShortSize) const noexcept;
};

}  // namespace vernum
