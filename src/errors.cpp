#include <bundler/errors.h>

#include <bundler/escaping.h>

#include <utility>

namespace bundler {

ToolchainMissing::ToolchainMissing(std::string program,
                                   std::string install_hint)
    : BuildError("Missing required command: " + program +
                 (install_hint.empty() ? std::string{}
                                       : " (install via: " + install_hint +
                                             ")")),
      program_(std::move(program)), install_hint_(std::move(install_hint)) {}

ExecutableNotFound::ExecutableNotFound(std::string program)
    : BuildError("Executable not found: " + program),
      program_(std::move(program)) {}

CommandFailed::CommandFailed(std::string program,
                             std::vector<std::string> args, ExitStatus status)
    : BuildError("Command failed (" + status.Describe() +
                 "): " + JoinCommandLine(program, args)),
      program_(std::move(program)), args_(std::move(args)), status_(status) {}

TaskFailed::TaskFailed(std::string name, ExitStatus status)
    : BuildError("Task failed (" + name + "): " + status.Describe()),
      name_(std::move(name)), status_(status) {}

MissingArtifact::MissingArtifact(std::string stage, std::filesystem::path path)
    : BuildError("Missing " + stage + " artifact at " + path.string() +
                 " (did the " + stage + " stage run?)"),
      stage_(std::move(stage)), path_(std::move(path)) {}

FilesystemError::FilesystemError(std::string action,
                                 std::filesystem::path path)
    : BuildError("Failed to " + action + ": " + path.string()),
      path_(std::move(path)) {}

} // namespace bundler
