/** LICENSE TEMPLATE */
#pragma once

// dgate
#include <common.h>
#include <common/formatter.h>
#include <common/typedefs.h>
// std
#include <charconv>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>
// dependency
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace dgate::cfg {

#define FOR_CLI_EACH_PARSE_ERROR(MAKE_ERR)                                                                         \
  MAKE_ERR(None, "Error not set.")                                                                                 \
  MAKE_ERR(ArgNotFound, "Argument not found.")                                                                     \
  MAKE_ERR(MissingArgValue, "Command line option is missing it's value.")                                          \
  MAKE_ERR(InvalidFormat, "Invalid format of argument.")                                                           \
  MAKE_ERR(OutOfRange, "Value is out of range.")                                                                   \
  MAKE_ERR(UnrecognizedArgument, "Argument is not a recognized option.")                                           \
  MAKE_ERR(DirectoryDoesNotExist, "Directory does not exist")                                                      \
  MAKE_ERR(InvalidPattern, "Not a valid regular expression.")

#define PARSE_ERROR_ENUM(Value, ...) Value,

enum class ParseErrorType : u8
{
  FOR_CLI_EACH_PARSE_ERROR(PARSE_ERROR_ENUM)
};

#undef PARSE_ERROR_ENUM

struct ParseOk
{
};

struct ParserError
{
  ParseErrorType mError;
  std::vector<std::string> mInputs;
};

template <typename T> using ParseResult = std::expected<T, ParserError>;

/// A help text that can be wrapped to a column width.
struct HelpMessage
{
  std::string_view mInfo{};

  constexpr HelpMessage() noexcept = default;
  constexpr HelpMessage(std::string_view message) noexcept : mInfo(message) {}
  constexpr HelpMessage(const char *message) noexcept : mInfo(message) {}

  /// Splits on newlines and on the last word boundary before `width`.
  std::vector<std::string_view> CreateLinesOfWidth(size_t width) const noexcept;
};

class ArgIterator
{
public:
  constexpr ArgIterator(int argc, const char **argv) : mArgCount(argc), mArgs(argv) {}

  bool
  HasNext() const noexcept
  {
    return mIndex < mArgCount;
  }

  // Called as the very first thing in each iteration of CommandLineRegistry::Parse. A parse pass may consume 0 or N
  // arguments. Check HasNext() before calling.
  std::string_view
  BeginNext() noexcept
  {
    RememberPosition();
    return *GetNext();
  }

  std::optional<std::string_view>
  GetNext() noexcept
  {
    if (mInsideInlineArgument) {
      std::string_view value = mArgs[mIndex];
      value.remove_prefix(mInsideInlineArgument.value());
      mInsideInlineArgument = {};
      ++mIndex;
      return value;
    }

    if (!HasNext()) {
      return std::nullopt;
    }
    std::string_view value = mArgs[mIndex];
    auto inlineValuePos = value.find_first_of('=');
    if (value.starts_with('-') && inlineValuePos != value.npos) {
      mInsideInlineArgument = inlineValuePos + 1;
      return value.substr(0, inlineValuePos);
    }
    ++mIndex;
    return value;
  }

  /// Everything that has not been consumed yet, verbatim.
  std::vector<std::string>
  TakeRemaining() noexcept
  {
    std::vector<std::string> result;
    for (; mIndex < mArgCount; ++mIndex) {
      result.emplace_back(mArgs[mIndex]);
    }
    return result;
  }

  std::unexpected<ParserError>
  Error(ParseErrorType type) noexcept
  {
    return std::unexpected(ParserError{ type, GetArgsCurrentlyBeingParsed() });
  }

private:
  std::vector<std::string>
  GetArgsCurrentlyBeingParsed() const noexcept
  {
    // Always include the current one too, which may only have been partially parsed (inline values via foo=bar)
    const auto end = std::min(mArgCount, mIndex + (mInsideInlineArgument ? 1 : 0));
    std::vector<std::string> result;
    for (auto i = mRememberedIndex; i < end; ++i) {
      result.emplace_back(mArgs[i]);
    }
    return result;
  }

  void
  RememberPosition() noexcept
  {
    mRememberedIndex = mIndex;
  }

  int mArgCount;
  const char **mArgs;
  int mIndex{ 1 };
  std::optional<size_t> mInsideInlineArgument{};
  int mRememberedIndex{ 0 };
};

#ifndef TryExpected
#define TryExpected(iterator)                                                                                      \
  ({                                                                                                               \
    auto ___MAYBE_VALUE___ = iterator.GetNext();                                                                   \
    if (!___MAYBE_VALUE___) {                                                                                      \
      return iterator.Error(ParseErrorType::MissingArgValue);                                                      \
    }                                                                                                              \
    *___MAYBE_VALUE___;                                                                                            \
  })
#endif

struct OptionMetadata
{
  std::string mShortName;
  std::string mLongName;
  HelpMessage mInfo;
  bool mIsFlag;
};

template <typename ParseInput> struct IOption : OptionMetadata
{
  using Input = ParseInput;
  virtual std::expected<ParseOk, ParserError> Parse(ParseInput it) noexcept = 0;
  virtual void ApplyDefault() noexcept = 0;
  virtual ~IOption() noexcept = default;
};

template <typename T, typename ParseInput> class DirectOption : public IOption<ParseInput>
{
  using Data = OptionMetadata;
  using IBase = IOption<ParseInput>;

public:
  using ParserFn = ParseResult<T> (*)(typename IBase::Input);

  DirectOption(std::string_view shortName, std::string_view longName, HelpMessage helpMessage, T &reference,
               ParserFn parser, T defaultValue)
      : mReference(&reference), mParseFn(parser), mDefault(std::move(defaultValue))
  {
    Data::mShortName = shortName;
    Data::mLongName = longName;
    Data::mInfo = helpMessage;
    Data::mIsFlag = std::is_same_v<T, bool>;
  }

  std::expected<ParseOk, ParserError>
  Parse(ParseInput it) noexcept override
  {
    auto result = mParseFn(it);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }
    *mReference = std::move(result.value());
    return ParseOk{};
  }

  void
  ApplyDefault() noexcept override
  {
    *mReference = mDefault;
  }

private:
  T *mReference;
  ParserFn mParseFn;
  T mDefault;
};

struct CommandLineResult
{
  std::vector<ParserError> mErrors;
};

class CommandLineRegistry
{
  static constexpr auto UNIFORM_LINE_INDENT = 2;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<ArgIterator &>>> mOptions;
  // Registration order, for help output.
  std::vector<std::shared_ptr<IOption<ArgIterator &>>> mOptionsInOrder;
  std::vector<std::pair<std::string_view, std::shared_ptr<IOption<std::string_view>>>> mEnvironmentVariables;
  std::vector<std::string> *mTrailingArguments{ nullptr };
  HelpMessage mTrailingArgumentsHelp{};
  std::string_view mProgramName{ "dgate" };
  // Width of the largest left column in the help output ("-c, --com <value>"), so that help text lines up when the
  // terminal size is not known.
  size_t mLeftColumnDisplayWidth{ 0 };
  bool mParseCompleted{ false };

  void AssertUnique(std::string_view shortName, std::string_view longName) const noexcept;
  void UpdateLeftColumnWidth(bool isFlag, std::string_view shortName, std::string_view longName) noexcept;

public:
  static constexpr auto kValuePlaceHolder = " <value> "sv;
  static constexpr auto kTrailingSeparator = "--"sv;

  explicit CommandLineRegistry(std::string_view programName = "dgate") noexcept : mProgramName(programName) {}

  template <typename T, typename ConvertibleToT>
  void
  AddOption(std::string_view shortName, std::string_view longName, HelpMessage message, T &variable,
            typename DirectOption<T, ArgIterator &>::ParserFn parser, ConvertibleToT defaultVal) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    AssertUnique(shortName, longName);
    UpdateLeftColumnWidth(std::is_same_v<T, bool>, shortName, longName);

    auto opt = std::make_shared<DirectOption<T, ArgIterator &>>(shortName, longName, message, variable, parser,
                                                                T{ std::move(defaultVal) });
    if (!shortName.empty()) {
      mOptions.emplace(shortName, opt);
    }
    if (!longName.empty()) {
      mOptions.emplace(longName, opt);
    }
    mOptionsInOrder.push_back(std::move(opt));
  }

  template <typename T, typename ConvertibleToT = T>
  void
  AddEnvironmentVariable(std::string_view name, HelpMessage message, T &variable,
                         typename DirectOption<T, std::string_view>::ParserFn parser,
                         ConvertibleToT defaultVal = T{}) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    for (const auto &[existing, _] : mEnvironmentVariables) {
      VERIFY(existing != name, "Environment variable option {} already configured.", name);
    }
    UpdateLeftColumnWidth(/* isFlag */ false, "", name);
    auto opt = std::make_shared<DirectOption<T, std::string_view>>("", name, message, variable, parser,
                                                                   T{ std::move(defaultVal) });
    mEnvironmentVariables.emplace_back(name, std::move(opt));
  }

  /// Arguments after a lone "--" are collected verbatim into `target`.
  void AddTrailingArguments(std::vector<std::string> &target, HelpMessage message) noexcept;

  CommandLineResult Parse(int argc, const char **argv) noexcept;
  void ParseEnvironmentVariableOptions() noexcept;

  std::string HelpText(u16 leftColumn, u16 rightColumn) const noexcept;
  void PrintHelp() const noexcept;
  std::pair<u16, u16> GetTerminalSize() const noexcept;
};

template <typename ResultType> struct FromTraits;

#define NumberTrait(NumberType)                                                                                    \
  template <> struct FromTraits<NumberType>                                                                        \
  {                                                                                                                \
    static ParseResult<NumberType>                                                                                 \
    From(ArgIterator &it) noexcept                                                                                 \
    {                                                                                                              \
      auto arg = TryExpected(it);                                                                                  \
                                                                                                                   \
      NumberType number;                                                                                           \
      auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), number);                               \
      if (ec == std::errc() && ptr == arg.data() + arg.size()) {                                                   \
        return number;                                                                                             \
      }                                                                                                            \
      return it.Error(ParseErrorType::InvalidFormat);                                                              \
    }                                                                                                              \
                                                                                                                   \
    static ParseResult<NumberType>                                                                                 \
    From(std::string_view arg) noexcept                                                                            \
    {                                                                                                              \
      if (arg.empty())                                                                                             \
        return std::unexpected(ParserError{ ParseErrorType::MissingArgValue, {} });                                \
      NumberType number;                                                                                           \
      auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), number);                               \
      if (ec == std::errc() && ptr == arg.data() + arg.size()) {                                                   \
        return number;                                                                                             \
      }                                                                                                            \
      return std::unexpected(ParserError{ ParseErrorType::InvalidFormat, { std::string{ arg } } });                \
    }                                                                                                              \
  };

#define FOR_EACH_PRIMITIVE(PRIM)                                                                                   \
  PRIM(i32)                                                                                                        \
  PRIM(i64)                                                                                                        \
  PRIM(u32)                                                                                                        \
  PRIM(u64)

FOR_EACH_PRIMITIVE(NumberTrait);

template <> struct FromTraits<bool>
{
  /// Flags take no value; being present means true.
  static ParseResult<bool>
  From(ArgIterator &) noexcept
  {
    return true;
  }
};

template <> struct FromTraits<std::string>
{
  static ParseResult<std::string>
  From(ArgIterator &it) noexcept
  {
    auto arg = TryExpected(it);
    return std::string{ arg };
  }
};

} // namespace dgate::cfg

template <> struct fmt::formatter<dgate::cfg::ParseErrorType> : public Default<dgate::cfg::ParseErrorType>
{
  template <typename FormatContext>
  auto
  format(const dgate::cfg::ParseErrorType &option, FormatContext &context) const
  {
#define PARSE_ERROR_MSG(EnumValue, Message, ...)                                                                   \
  case dgate::cfg::ParseErrorType::EnumValue:                                                                      \
    return fmt::format_to(context.out(), Message);

    switch (option) {
      FOR_CLI_EACH_PARSE_ERROR(PARSE_ERROR_MSG)
    }
#undef PARSE_ERROR_MSG
    return context.out();
  }
};

template <> struct fmt::formatter<dgate::cfg::ParserError> : public Default<dgate::cfg::ParserError>
{
  template <typename FormatContext>
  auto
  format(const dgate::cfg::ParserError &error, FormatContext &ctx) const
  {
    if (error.mInputs.empty()) {
      return fmt::format_to(ctx.out(), "Parse error: {}", error.mError);
    }
    auto it = fmt::format_to(ctx.out(), "Parse error: {} Input:", error.mError);
    for (const auto &input : error.mInputs) {
      it = fmt::format_to(it, " {}", input);
    }
    return it;
  }
};

#undef FOR_CLI_EACH_PARSE_ERROR
