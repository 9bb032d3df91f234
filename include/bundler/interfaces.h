#pragma once

#include <bundler/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace bundler {

class RunningProcess {
public:
  virtual ~RunningProcess() = default;
  // Blocks until the process exits. Must be called at most once.
  virtual ExitStatus Wait() = 0;
  virtual int Pid() const = 0;
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual std::optional<std::filesystem::path>
  FindProgram(const std::string &name) const = 0;
  // Throws ExecutableNotFound when the program cannot be launched.
  virtual ExitStatus Run(const Command &command) = 0;
  virtual std::unique_ptr<RunningProcess> Spawn(const Command &command) = 0;
};

class IconGenerator {
public:
  virtual ~IconGenerator() = default;
  // Returns true when the compiled icon exists inside the bundle.
  virtual bool Generate(const std::filesystem::path &icon_output) = 0;
};

} // namespace bundler
