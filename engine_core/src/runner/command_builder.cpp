/**
 * @file command_builder.cpp
 * @brief Unreal Build / RunUAT command line construction
 */

#include "BuildDeck/runner/command_builder.hpp"
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace BuildDeck::runner {

CommandBuilder::CommandBuilder(HostPlatform host) : m_host(host) {}

Result<CommandLine> CommandBuilder::build(const BuildRequest& request) const {
  auto valid = request.validate();
  if (valid.isError()) {
    return Result<CommandLine>::error(valid.error());
  }

  std::vector<std::string> arguments = request.operation == OperationKind::Build
                                           ? buildArguments(request)
                                           : packageArguments(request);

  CommandLine command =
      wrapForHost(scriptPath(request.operation, request.engineRoot), std::move(arguments));

  if (!request.workingDirectory.empty()) {
    command.workingDirectory = request.workingDirectory;
  } else {
    command.workingDirectory = fs::path(request.projectPath).parent_path().string();
  }

  return Result<CommandLine>::ok(std::move(command));
}

std::string CommandBuilder::scriptPath(OperationKind operation,
                                       const std::string& engineRoot) const {
  fs::path batchFiles = fs::path(engineRoot) / "Engine" / "Build" / "BatchFiles";

  if (operation == OperationKind::Package) {
    return (batchFiles / (m_host == HostPlatform::Windows ? "RunUAT.bat" : "RunUAT.sh")).string();
  }

  switch (m_host) {
  case HostPlatform::Windows:
    return (batchFiles / "Build.bat").string();
  case HostPlatform::Linux:
    return (batchFiles / "Linux" / "Build.sh").string();
  case HostPlatform::Mac:
    return (batchFiles / "Mac" / "Build.sh").string();
  }
  return (batchFiles / "Build.sh").string();
}

std::vector<std::string> CommandBuilder::buildArguments(const BuildRequest& request) const {
  return {request.projectName(), targetPlatformName(request.platform),
          configurationName(request.configuration), request.projectPath, "-waitmutex"};
}

std::vector<std::string> CommandBuilder::packageArguments(const BuildRequest& request) const {
  const std::string config = configurationName(request.configuration);
  const std::string stagingDirectory =
      (fs::path(request.projectPath).parent_path() / "Builds").string();

  return {"BuildCookRun",
          "-project=" + request.projectPath,
          "-noP4",
          std::string("-platform=") + targetPlatformName(request.platform),
          "-clientconfig=" + config,
          "-serverconfig=" + config,
          "-nocompileeditor",
          "-cook",
          "-allmaps",
          "-build",
          "-CookCultures=en",
          "-unversionedcookedcontent",
          "-stage",
          "-package",
          "-stagingdirectory=" + stagingDirectory};
}

CommandLine CommandBuilder::wrapForHost(const std::string& script,
                                        std::vector<std::string> arguments) const {
  CommandLine command;
  if (m_host == HostPlatform::Windows) {
    // Batch files cannot be started directly by CreateProcess
    command.executable = "cmd.exe";
    command.cmdShell = true;
    command.arguments.reserve(arguments.size() + 3);
    command.arguments.push_back("/S");
    command.arguments.push_back("/C");
    command.arguments.push_back(script);
    for (auto& arg : arguments) {
      command.arguments.push_back(std::move(arg));
    }
  } else {
    command.executable = script;
    command.arguments = std::move(arguments);
  }
  return command;
}

std::string CommandBuilder::describe(const CommandLine& command) {
  auto quote = [](const std::string& s) {
    if (!s.empty() && s.find_first_of(" \t\"'") == std::string::npos) {
      return s;
    }
    std::string quoted = "\"";
    for (char c : s) {
      if (c == '"' || c == '\\') {
        quoted += '\\';
      }
      quoted += c;
    }
    quoted += '"';
    return quoted;
  };

  std::ostringstream oss;
  oss << quote(command.executable);
  for (const auto& arg : command.arguments) {
    oss << ' ' << quote(arg);
  }
  return oss.str();
}

std::string CommandBuilder::quoteWindowsArgument(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
    return arg;
  }

  std::string quoted = "\"";
  for (auto it = arg.begin();; ++it) {
    usize backslashes = 0;
    while (it != arg.end() && *it == '\\') {
      ++it;
      ++backslashes;
    }

    if (it == arg.end()) {
      quoted.append(backslashes * 2, '\\');
      break;
    }
    if (*it == '"') {
      quoted.append(backslashes * 2 + 1, '\\');
      quoted.push_back('"');
    } else {
      quoted.append(backslashes, '\\');
      quoted.push_back(*it);
    }
  }
  quoted.push_back('"');
  return quoted;
}

std::string CommandBuilder::windowsCommandLine(const CommandLine& command) {
  usize payloadStart = command.arguments.size();
  if (command.cmdShell) {
    for (usize i = 0; i < command.arguments.size(); ++i) {
      if (command.arguments[i] == "/C" || command.arguments[i] == "/c") {
        payloadStart = i + 1;
        break;
      }
    }
  }

  std::string line = quoteWindowsArgument(command.executable);
  for (usize i = 0; i < command.arguments.size(); ++i) {
    line += i == payloadStart ? " \"" : " ";
    line += quoteWindowsArgument(command.arguments[i]);
  }
  if (payloadStart < command.arguments.size()) {
    line += '"';
  }
  return line;
}

} // namespace BuildDeck::runner
