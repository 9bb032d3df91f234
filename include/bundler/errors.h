#pragma once

#include <bundler/models.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace bundler {

class BuildError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ToolchainMissing : public BuildError {
public:
  ToolchainMissing(std::string program, std::string install_hint);
  const std::string &Program() const { return program_; }
  const std::string &InstallHint() const { return install_hint_; }

private:
  std::string program_;
  std::string install_hint_;
};

class ExecutableNotFound : public BuildError {
public:
  explicit ExecutableNotFound(std::string program);
  const std::string &Program() const { return program_; }

private:
  std::string program_;
};

class CommandFailed : public BuildError {
public:
  CommandFailed(std::string program, std::vector<std::string> args,
                ExitStatus status);
  const std::string &Program() const { return program_; }
  const std::vector<std::string> &Args() const { return args_; }
  const ExitStatus &Status() const { return status_; }

private:
  std::string program_;
  std::vector<std::string> args_;
  ExitStatus status_;
};

class TaskFailed : public BuildError {
public:
  TaskFailed(std::string name, ExitStatus status);
  const std::string &Name() const { return name_; }
  const ExitStatus &Status() const { return status_; }

private:
  std::string name_;
  ExitStatus status_;
};

class MissingArtifact : public BuildError {
public:
  MissingArtifact(std::string stage, std::filesystem::path path);
  const std::string &Stage() const { return stage_; }
  const std::filesystem::path &Path() const { return path_; }

private:
  std::string stage_;
  std::filesystem::path path_;
};

class FilesystemError : public BuildError {
public:
  FilesystemError(std::string action, std::filesystem::path path);
  const std::filesystem::path &Path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace bundler
