#include <array>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>

#include <configuration/command_line.h>
#include <configuration/config.h>
#include <session/debuggee_logger.h>
#include <utils/thread_pool.h>

using dgate::cfg::CommandLineRegistry;
using dgate::cfg::CommandLineResult;
using dgate::cfg::InitializationConfiguration;
using dgate::cfg::ParseErrorType;
using dgate::cfg::ParseLogChannels;

struct ParsedConfig
{
  std::unique_ptr<InitializationConfiguration> mConfig;
  CommandLineResult mResult;
};

template <size_t N>
static ParsedConfig
Parse(std::array<const char *, N> args)
{
  CommandLineRegistry parser{ "dgate" };
  auto config = InitializationConfiguration::ConfigureWithParser(parser);
  auto result = parser.Parse(static_cast<int>(args.size()), args.data());
  return ParsedConfig{ std::move(config), std::move(result) };
}

static std::vector<ParseErrorType>
ErrorTypes(const CommandLineResult &result)
{
  std::vector<ParseErrorType> types;
  for (const auto &error : result.mErrors) {
    types.push_back(error.mError);
  }
  return types;
}

TEST(CommandLine, Defaults)
{
  const auto [config, result] = Parse(std::array{ "dgate" });
  EXPECT_TRUE(result.mErrors.empty());
  EXPECT_EQ(config->mPort, 0);
  EXPECT_EQ(config->mThreadPoolSize, dgate::ThreadPool::DefaultPoolSize());
  EXPECT_EQ(config->mLogDirectory, std::filesystem::current_path());
  EXPECT_EQ(config->mWaitForConnectionTimeout, 5000);
  EXPECT_EQ(config->ConnectionTimeout(), std::chrono::milliseconds{ 5000 });
  EXPECT_EQ(config->mAddressPattern, dgate::session::DefaultAddressPattern);
  EXPECT_FALSE(config->mPrintHelp);
  EXPECT_TRUE(config->mDebuggeeCommand.empty());
}

TEST(CommandLine, OptionsAndDebuggeeCommand)
{
  const auto [config, result] = Parse(std::array{ "dgate", "-p", "4711", "--threads=3", "-w", "250", "-l", "/tmp",
                                                  "--", "java", "-jar", "app.jar", "--port=1" });
  ASSERT_TRUE(result.mErrors.empty()) << fmt::format("{}", result.mErrors.front());
  EXPECT_EQ(config->mPort, 4711);
  EXPECT_EQ(config->mThreadPoolSize, 3u);
  EXPECT_EQ(config->mWaitForConnectionTimeout, 250);
  EXPECT_EQ(config->mLogDirectory, std::filesystem::path{ "/tmp" });
  EXPECT_EQ(config->mDebuggeeCommand, (std::vector<std::string>{ "java", "-jar", "app.jar", "--port=1" }));
}

TEST(CommandLine, AddressPattern)
{
  const auto [config, result] = Parse(std::array{ "dgate", "--address-pattern", R"(agent at (\S+):(\d+))" });
  EXPECT_TRUE(result.mErrors.empty());
  EXPECT_EQ(config->mAddressPattern, R"(agent at (\S+):(\d+))");
}

TEST(CommandLine, HelpFlag)
{
  const auto [config, result] = Parse(std::array{ "dgate", "--help" });
  EXPECT_TRUE(result.mErrors.empty());
  EXPECT_TRUE(config->mPrintHelp);
}

TEST(CommandLine, ReportsBadValues)
{
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-p", "70000" }).mResult),
            std::vector{ ParseErrorType::OutOfRange });
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-p", "eighty" }).mResult),
            std::vector{ ParseErrorType::InvalidFormat });
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-t", "0" }).mResult), std::vector{ ParseErrorType::OutOfRange });
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-w", "-5" }).mResult), std::vector{ ParseErrorType::OutOfRange });
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-w" }).mResult), std::vector{ ParseErrorType::MissingArgValue });
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-l", "/this/directory/does/not/exist" }).mResult),
            std::vector{ ParseErrorType::DirectoryDoesNotExist });
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "--bogus" }).mResult),
            std::vector{ ParseErrorType::UnrecognizedArgument });
}

TEST(CommandLine, AddressPatternNeedsHostAndPortGroups)
{
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-a", "port (\\d+)" }).mResult),
            std::vector{ ParseErrorType::InvalidPattern });
  EXPECT_EQ(ErrorTypes(Parse(std::array{ "dgate", "-a", "(unclosed" }).mResult),
            std::vector{ ParseErrorType::InvalidPattern });
}

TEST(CommandLine, LogEnvironmentVariable)
{
  setenv("LOG", "dap, session,nonsense", 1);
  const auto [config, result] = Parse(std::array{ "dgate" });
  unsetenv("LOG");
  EXPECT_TRUE(result.mErrors.empty());
  EXPECT_EQ(config->mLogChannels, (std::vector<Channel>{ Channel::dap, Channel::session }));
}

TEST(CommandLine, HelpTextListsOptions)
{
  CommandLineRegistry parser{ "dgate" };
  auto config = InitializationConfiguration::ConfigureWithParser(parser);
  const auto help = parser.HelpText(30, 80);
  for (const auto expected : { "--port", "--threads", "--log", "--timeout", "--address-pattern", "--help", "LOG" }) {
    EXPECT_NE(help.find(expected), std::string::npos) << "missing " << expected;
  }
}

TEST(LogChannels, ParsesCommaSeparatedNames)
{
  EXPECT_TRUE(ParseLogChannels("").empty());
  EXPECT_EQ(ParseLogChannels("core"), std::vector{ Channel::core });
  EXPECT_EQ(ParseLogChannels("core,core, warning"), (std::vector{ Channel::core, Channel::warning }));
  EXPECT_EQ(ParseLogChannels("debuggee,,unknown"), std::vector{ Channel::debuggee });
}

TEST(LogChannels, AllOpensEveryChannel)
{
  const auto channels = ParseLogChannels("dap,all");
  EXPECT_EQ(channels.size(), Enum<Channel>::Count());
}
