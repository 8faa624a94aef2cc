#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using schedctl::core::logging::Logger;
using schedctl::core::logging::LogLevel;
using schedctl::core::logging::ParseLogLevel;

TEST_CASE("Log level parsing is case-insensitive and rejects unknown names",
          "[core][logging]") {
  LogLevel level = LogLevel::kWarn;
  std::string error;

  REQUIRE(ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);

  REQUIRE_FALSE(ParseLogLevel("verbose", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
  REQUIRE_FALSE(ParseLogLevel("", level, error));
}

TEST_CASE("Records below the minimum level are dropped", "[core][logging]") {
  std::ostringstream out;
  Logger quiet(LogLevel::kWarn, out);
  quiet.Debug("hidden");
  quiet.Info("hidden");
  REQUIRE(out.str().empty());

  Logger info(LogLevel::kInfo, out);
  info.Debug("hidden");
  REQUIRE(out.str().empty());
  info.Info("shown");
  REQUIRE(out.str().find("level=INFO") != std::string::npos);
  REQUIRE(out.str().find("hidden") == std::string::npos);
}

TEST_CASE("Records carry request id, command and quoted fields", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, out);
  logger.SetRequestId("req-1700000000000");
  logger.SetCommand("progress");

  logger.Info("remote call completed", {{"operation", "progress"}, {"detail", "a \"b\"\nc"}});

  const std::string line = out.str();
  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  REQUIRE(line.find(" level=INFO request_id=\"req-1700000000000\" cmd=progress ") !=
          std::string::npos);
  REQUIRE(line.find("msg=\"remote call completed\"") != std::string::npos);
  REQUIRE(line.find("operation=\"progress\"") != std::string::npos);
  REQUIRE(line.find("detail=\"a \\\"b\\\"\\nc\"") != std::string::npos);
  REQUIRE(line.back() == '\n');
  REQUIRE(line.find('\n') == line.size() - 1);
}
