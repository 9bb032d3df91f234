#pragma once

#include <bundler/interfaces.h>
#include <bundler/logging.h>

#include <memory>
#include <string>

#include <sys/types.h>

namespace bundler {

class PosixProcess : public RunningProcess {
public:
  explicit PosixProcess(pid_t pid);
  PosixProcess(const PosixProcess &) = delete;
  PosixProcess &operator=(const PosixProcess &) = delete;

  ExitStatus Wait() override;
  int Pid() const override { return static_cast<int>(pid_); }

private:
  pid_t pid_;
  bool waited_ = false;
};

// Launches children with fork/exec. Standard streams are inherited unless the
// command is quiet. The search path is captured once at construction.
class PosixCommandRunner : public CommandRunner {
public:
  explicit PosixCommandRunner(std::string search_path,
                              std::shared_ptr<Logger> logger = nullptr);

  std::optional<std::filesystem::path>
  FindProgram(const std::string &name) const override;
  ExitStatus Run(const Command &command) override;
  std::unique_ptr<RunningProcess> Spawn(const Command &command) override;

private:
  pid_t Launch(const Command &command);

  std::string search_path_;
  std::shared_ptr<Logger> logger_;
};

} // namespace bundler
