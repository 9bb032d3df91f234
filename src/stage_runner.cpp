#include <bundler/stage_runner.h>

#include <bundler/errors.h>
#include <bundler/escaping.h>

#include <stdexcept>
#include <utility>

namespace bundler {

std::string DescribeCommand(const Command &command) {
  std::string description;
  if (command.cwd) {
    description = "(cd " + ShellQuote(command.cwd->string()) + ") ";
  }
  return description + JoinCommandLine(command.program, command.args);
}

StageRunner::StageRunner(CommandRunner &runner, DryRunPlanner &planner,
                         std::shared_ptr<Logger> logger)
    : runner_(&runner), planner_(&planner),
      logger_(EnsureLogger(std::move(logger))) {}

void StageRunner::LogEnvironment(const Command &command) const {
  for (const auto &[name, value] : command.env) {
    logger_->Log(LogLevel::kDebug, "env " + name + "=" + value);
  }
}

void StageRunner::RunSync(const Command &command) {
  if (planner_->Active()) {
    planner_->Announce(DescribeCommand(command));
    LogEnvironment(command);
    return;
  }

  logger_->Log(LogLevel::kDebug, "Running: " + DescribeCommand(command));
  LogEnvironment(command);
  const auto status = runner_->Run(command);
  if (!status.Success()) {
    throw CommandFailed(command.program, command.args, status);
  }
}

std::unique_ptr<RunningProcess>
StageRunner::SpawnAsync(const Command &command) {
  if (planner_->Active()) {
    throw std::logic_error("SpawnAsync called in planning mode: " +
                           DescribeCommand(command));
  }

  logger_->Log(LogLevel::kDebug, "Spawning: " + DescribeCommand(command));
  LogEnvironment(command);
  return runner_->Spawn(command);
}

} // namespace bundler
