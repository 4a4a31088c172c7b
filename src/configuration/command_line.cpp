/** LICENSE TEMPLATE */
#include "command_line.h"

// dgate
#include <common.h>
#include <utils/logger.h>

// std
#include <algorithm>
#include <cctype>
#include <cstdlib>

// system
#include <sys/ioctl.h>
#include <unistd.h>

namespace dgate::cfg {

std::vector<std::string_view>
HelpMessage::CreateLinesOfWidth(size_t width) const noexcept
{
  std::vector<std::string_view> lines;
  auto text = mInfo;
  width = std::max<size_t>(width, 1);
  while (!text.empty()) {
    const auto newline = text.find('\n');
    auto candidate = text.substr(0, newline);
    if (candidate.size() > width) {
      const auto boundary = candidate.substr(0, width).find_last_of(' ');
      const auto cut = (boundary == std::string_view::npos || boundary == 0) ? width : boundary;
      lines.push_back(candidate.substr(0, cut));
      text.remove_prefix(cut);
      // Don't start the continuation line with the space we broke on.
      if (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
      }
      continue;
    }
    lines.push_back(candidate);
    text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
  }
  return lines;
}

void
CommandLineRegistry::AssertUnique(std::string_view shortName, std::string_view longName) const noexcept
{
  VERIFY(!shortName.empty() || !longName.empty(), "You've not given this option a name!");
  if (!longName.empty()) {
    VERIFY(mOptions.count(longName) == 0, "Already added option {}", longName);
  }
  if (!shortName.empty()) {
    VERIFY(mOptions.count(shortName) == 0, "Already added option {}", shortName);
  }
}

void
CommandLineRegistry::UpdateLeftColumnWidth(bool isFlag, std::string_view shortName, std::string_view longName) noexcept
{
  const auto leftColumnWidth =
    shortName.size() + longName.size() + (isFlag ? 0 : kValuePlaceHolder.size()) + UNIFORM_LINE_INDENT + 2;

  mLeftColumnDisplayWidth = std::max(mLeftColumnDisplayWidth, leftColumnWidth);
}

void
CommandLineRegistry::AddTrailingArguments(std::vector<std::string> &target, HelpMessage message) noexcept
{
  VERIFY(mTrailingArguments == nullptr, "Trailing arguments already configured");
  mTrailingArguments = &target;
  mTrailingArgumentsHelp = message;
}

CommandLineResult
CommandLineRegistry::Parse(int argc, const char **argv) noexcept
{
  CommandLineResult result{};

  for (auto &opt : mOptionsInOrder) {
    opt->ApplyDefault();
  }
  if (mTrailingArguments) {
    mTrailingArguments->clear();
  }

  ArgIterator it(argc, argv);
  while (it.HasNext()) {
    auto current = it.BeginNext();

    if (current == kTrailingSeparator && mTrailingArguments) {
      *mTrailingArguments = it.TakeRemaining();
      break;
    }

    if (auto optionIter = mOptions.find(current); optionIter != std::end(mOptions)) {
      auto res = optionIter->second->Parse(it);
      if (!res) {
        result.mErrors.push_back(std::move(res.error()));
      }
    } else {
      result.mErrors.push_back(it.Error(ParseErrorType::UnrecognizedArgument).error());
    }
  }

  // Environment variables fail silently, they're not intended to be "hard options".
  ParseEnvironmentVariableOptions();
  mParseCompleted = true;
  return result;
}

void
CommandLineRegistry::ParseEnvironmentVariableOptions() noexcept
{
  for (const auto &[name, option] : mEnvironmentVariables) {
    option->ApplyDefault();
    const std::string key{ name };
    if (const auto value = std::getenv(key.c_str()); value) {
      if (auto res = option->Parse(std::string_view{ value }); !res) {
        DBGLOG(warning, "ignoring environment variable {}={}: {}", name, value, res.error());
      }
    }
  }
}

std::pair<u16, u16>
CommandLineRegistry::GetTerminalSize() const noexcept
{
  struct winsize terminalSize;
  const auto leftMinimum = static_cast<u16>(mLeftColumnDisplayWidth + 1);

  if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &terminalSize) == 0 && terminalSize.ws_col > 0) {
    auto leftColumnWidth = static_cast<u16>(terminalSize.ws_col * 0.25);
    if (leftColumnWidth <= mLeftColumnDisplayWidth) {
      leftColumnWidth = leftMinimum;
    } else {
      // Don't waste space, give the left column at most 4 characters of trailing white space after it.
      leftColumnWidth = std::min<u16>(leftColumnWidth, static_cast<u16>(mLeftColumnDisplayWidth + 4));
    }
    const auto rightColumnWidth =
      static_cast<u16>(std::max<int>(terminalSize.ws_col - leftColumnWidth, 20));
    return std::pair<u16, u16>{ leftColumnWidth, rightColumnWidth };
  }
  return std::pair<u16, u16>{ leftMinimum, 80 };
}

static void
AppendHelpEntry(std::string &out, const OptionMetadata &option, u16 leftColumn, u16 rightColumn) noexcept
{
  std::string left{ "  " };
  if (!option.mShortName.empty()) {
    left += option.mShortName;
    if (!option.mLongName.empty()) {
      left += ", ";
    }
  }
  left += option.mLongName;
  if (!option.mIsFlag) {
    left += " <value>";
  }

  const auto lines = option.mInfo.CreateLinesOfWidth(rightColumn);
  if (lines.empty()) {
    out += fmt::format("{}\n", left);
    return;
  }
  out += fmt::format("{:<{}}{}\n", left, leftColumn, lines.front());
  for (auto i = 1u; i < lines.size(); ++i) {
    out += fmt::format("{:<{}}{}\n", "", leftColumn, lines[i]);
  }
}

std::string
CommandLineRegistry::HelpText(u16 leftColumn, u16 rightColumn) const noexcept
{
  std::string out;
  out += fmt::format("Usage:\n\n  {} [options]{}\n\n", mProgramName,
                     mTrailingArguments != nullptr ? " -- <command> [arguments...]" : "");
  out += "Options:\n\n";
  for (const auto &option : mOptionsInOrder) {
    AppendHelpEntry(out, *option, leftColumn, rightColumn);
  }

  if (mTrailingArguments != nullptr) {
    out += "\nArguments after --:\n\n";
    for (const auto line : mTrailingArgumentsHelp.CreateLinesOfWidth(leftColumn + rightColumn - 2)) {
      out += fmt::format("  {}\n", line);
    }
  }

  if (!mEnvironmentVariables.empty()) {
    out += "\nEnvironment variables:\n\n";
    for (const auto &[name, envVar] : mEnvironmentVariables) {
      AppendHelpEntry(out, *envVar, leftColumn, rightColumn);
    }
  }
  return out;
}

void
CommandLineRegistry::PrintHelp() const noexcept
{
  const auto [leftColumn, rightColumn] = GetTerminalSize();
  fmt::print("{}", HelpText(leftColumn, rightColumn));
}

} // namespace dgate::cfg
