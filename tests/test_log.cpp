#include "ewsc/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <iostream>
#include <sstream>
#include <string>

using ewsc::Logger;

namespace {

// Redirects std::cerr for the lifetime of the object.
class CerrCapture {
 public:
  CerrCapture() : old_(std::cerr.rdbuf(out_.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(old_); }

  std::string text() const { return out_.str(); }

 private:
  std::ostringstream out_;
  std::streambuf* old_;
};

// Restores the process-wide threshold after a test changes it.
class LevelRestore {
 public:
  LevelRestore() : saved_(Logger::level()) {}
  ~LevelRestore() { Logger::set_level(saved_); }

 private:
  Logger::Level saved_;
};

}  // namespace

TEST_CASE("Logger - threshold filters lower levels", "[log]") {
  LevelRestore restore;
  Logger::set_level(Logger::Level::kWarn);
  REQUIRE(!Logger::enabled(Logger::Level::kInfo));
  REQUIRE(Logger::enabled(Logger::Level::kWarn));

  CerrCapture capture;
  EWSC_LOG_INFO("dropped");
  EWSC_LOG_ERROR("handshake failed");
  REQUIRE(capture.text() == "[EWSC][ERROR] handshake failed\n");
}

TEST_CASE("Logger - kOff is never written", "[log]") {
  LevelRestore restore;
  CerrCapture capture;

  SECTION("at the lowest threshold") {
    Logger::set_level(Logger::Level::kDebug);
    REQUIRE(!Logger::enabled(Logger::Level::kOff));
    Logger::log(Logger::Level::kOff, "nothing");
  }

  SECTION("with logging switched off") {
    Logger::set_level(Logger::Level::kOff);
    REQUIRE(!Logger::enabled(Logger::Level::kError));
    Logger::log(Logger::Level::kOff, "nothing");
    EWSC_LOG_ERROR("nothing");
  }

  REQUIRE(capture.text().empty());
}
