#include <catch2/catch_test_macros.hpp>
#include "BuildDeck/runner/build_request.hpp"

using namespace BuildDeck;
using namespace BuildDeck::runner;

TEST_CASE("Enum names parse back case-insensitively", "[build_request]") {
  SECTION("Target platforms") {
    for (auto platform : kAllTargetPlatforms) {
      auto parsed = parseTargetPlatform(targetPlatformName(platform));
      REQUIRE(parsed.has_value());
      CHECK(*parsed == platform);
    }
    CHECK(parseTargetPlatform("win64") == TargetPlatform::Win64);
    CHECK(parseTargetPlatform("XBOXSERIES") == TargetPlatform::XBoxSeries);
    CHECK_FALSE(parseTargetPlatform("Win32").has_value());
    CHECK_FALSE(parseTargetPlatform("").has_value());
  }

  SECTION("Configurations") {
    CHECK(parseConfiguration("debug") == BuildConfiguration::Debug);
    CHECK(parseConfiguration("Development") == BuildConfiguration::Development);
    CHECK(parseConfiguration("SHIPPING") == BuildConfiguration::Shipping);
    CHECK_FALSE(parseConfiguration("Test").has_value());
  }

  SECTION("Operations and hosts") {
    CHECK(parseOperationKind("build") == OperationKind::Build);
    CHECK(parseOperationKind("Package") == OperationKind::Package);
    CHECK_FALSE(parseOperationKind("cook").has_value());
    CHECK(parseHostPlatform("linux") == HostPlatform::Linux);
    CHECK(parseHostPlatform("Mac") == HostPlatform::Mac);
    CHECK_FALSE(parseHostPlatform("BeOS").has_value());
  }
}

TEST_CASE("Unreal spellings of configurations and platforms", "[build_request]") {
  CHECK(std::string(configurationName(BuildConfiguration::Development)) == "Development");
  CHECK(std::string(targetPlatformName(TargetPlatform::Win64)) == "Win64");
  CHECK(std::string(targetPlatformName(TargetPlatform::iOS)) == "iOS");
  CHECK(std::string(targetPlatformName(TargetPlatform::XBoxOne)) == "XBoxOne");
  CHECK(kAllTargetPlatforms.size() == 10);
}

TEST_CASE("BuildRequest validation", "[build_request]") {
  BuildRequest request;
  request.projectPath = "/work/Shooter/Shooter.uproject";
  request.engineRoot = "/opt/UnrealEngine";

  SECTION("Complete request is valid") {
    CHECK(request.validate().isOk());
    CHECK(request.projectName() == "Shooter");
  }

  SECTION("Missing project path") {
    request.projectPath.clear();
    auto result = request.validate();
    REQUIRE(result.isError());
    CHECK(result.error().find("Project path") != std::string::npos);
  }

  SECTION("Missing engine root") {
    request.engineRoot.clear();
    auto result = request.validate();
    REQUIRE(result.isError());
    CHECK(result.error().find("Engine root") != std::string::npos);
  }

  SECTION("Project path without a file name") {
    request.projectPath = "/work/Shooter/";
    CHECK(request.validate().isError());
  }

  SECTION("Non-existent paths are not checked here") {
    request.projectPath = "/definitely/not/here/Game.uproject";
    CHECK(request.validate().isOk());
  }
}

TEST_CASE("BuildRequest defaults", "[build_request]") {
  BuildRequest request;
  CHECK(request.operation == OperationKind::Build);
  CHECK(request.configuration == BuildConfiguration::Development);
  CHECK(request.workingDirectory.empty());
}
