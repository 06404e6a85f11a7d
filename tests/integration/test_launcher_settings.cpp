/**
 * @file test_launcher_settings.cpp
 * @brief LauncherSettings JSON load/save
 */

#include <catch2/catch_test_macros.hpp>

#include "BuildDeck/editor/launcher_settings.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

using namespace BuildDeck;
using namespace BuildDeck::editor;

namespace {

struct QtAppFixture {
  QtAppFixture() {
    if (!QCoreApplication::instance()) {
      static int argc = 1;
      static char *argv[] = {const_cast<char *>("test")};
      static QCoreApplication app(argc, argv);
    }
  }
};

QString writeFile(const QTemporaryDir &dir, const QByteArray &content) {
  QString path = dir.filePath("launcher_settings.json");
  QFile file(path);
  REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
  file.write(content);
  file.close();
  return path;
}

} // namespace

TEST_CASE("LauncherSettings missing file gives defaults", "[launcher_settings]") {
  QtAppFixture fixture;
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  auto result = LauncherSettings::load(dir.filePath("does_not_exist.json"));
  REQUIRE(result.isOk());
  CHECK(result.value() == LauncherSettings{});
  CHECK(result.value().cancelGracePeriodMs == 5000);
  CHECK(result.value().pollIntervalMs == 100);
  CHECK_FALSE(result.value().mergeStderr);
}

TEST_CASE("LauncherSettings reads every key", "[launcher_settings]") {
  QtAppFixture fixture;
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  QString path = writeFile(dir, R"({
    "logLevel": "debug",
    "logFile": "logs/out.log",
    "mergeStderr": true,
    "cancelGracePeriodMs": 250,
    "pollIntervalMs": 40,
    "hostPlatform": "mac"
  })");

  auto result = LauncherSettings::load(path);
  REQUIRE(result.isOk());
  const LauncherSettings &settings = result.value();

  CHECK(settings.logLevel == core::LogLevel::Debug);
  CHECK(settings.logFile == "logs/out.log");
  CHECK(settings.mergeStderr);
  CHECK(settings.cancelGracePeriodMs == 250);
  CHECK(settings.pollIntervalMs == 40);
  REQUIRE(settings.hostPlatform.has_value());
  CHECK(*settings.hostPlatform == runner::HostPlatform::Mac);

  SECTION("Mapped onto runner options") {
    auto options = settings.toRunnerOptions();
    CHECK(options.host == runner::HostPlatform::Mac);
    CHECK(options.mergeStderr);
    CHECK(options.cancelGracePeriod == std::chrono::milliseconds(250));
    CHECK(options.pollInterval == std::chrono::milliseconds(40));
  }
}

TEST_CASE("LauncherSettings rejects bad values", "[launcher_settings]") {
  QtAppFixture fixture;
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  auto expectError = [&dir](const QByteArray &json, const std::string &key) {
    auto result = LauncherSettings::load(writeFile(dir, json));
    REQUIRE(result.isError());
    INFO(result.error());
    CHECK(result.error().find(key) != std::string::npos);
  };

  SECTION("Malformed JSON") {
    auto result = LauncherSettings::load(writeFile(dir, "{ \"logLevel\": "));
    CHECK(result.isError());
  }

  SECTION("Root is not an object") {
    auto result = LauncherSettings::load(writeFile(dir, "[1, 2]"));
    CHECK(result.isError());
  }

  SECTION("Unknown log level") { expectError(R"({"logLevel": "loud"})", "logLevel"); }
  SECTION("Wrong type") { expectError(R"({"mergeStderr": "yes"})", "mergeStderr"); }
  SECTION("Negative grace period") {
    expectError(R"({"cancelGracePeriodMs": -1})", "cancelGracePeriodMs");
  }
  SECTION("Zero poll interval") { expectError(R"({"pollIntervalMs": 0})", "pollIntervalMs"); }
  SECTION("Fractional poll interval") {
    expectError(R"({"pollIntervalMs": 12.5})", "pollIntervalMs");
  }
  SECTION("Unknown host") { expectError(R"({"hostPlatform": "Amiga"})", "hostPlatform"); }
}

TEST_CASE("LauncherSettings save and reload", "[launcher_settings]") {
  QtAppFixture fixture;
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  LauncherSettings settings;
  settings.logLevel = core::LogLevel::Warning;
  settings.mergeStderr = true;
  settings.cancelGracePeriodMs = 0;
  settings.hostPlatform = runner::HostPlatform::Windows;

  QString path = dir.filePath("nested/config/launcher_settings.json");
  REQUIRE(settings.save(path).isOk());
  REQUIRE(QFile::exists(path));

  auto loaded = LauncherSettings::load(path);
  REQUIRE(loaded.isOk());
  CHECK(loaded.value() == settings);

  QFile file(path);
  REQUIRE(file.open(QIODevice::ReadOnly));
  QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
  CHECK(doc.object().value("hostPlatform").toString() == "Windows");
  CHECK(doc.object().value("logLevel").toString() == "warning");
}
