#pragma once

#include <bundler/dry_run_planner.h>
#include <bundler/interfaces.h>
#include <bundler/logging.h>
#include <bundler/models.h>

#include <memory>

namespace bundler {

class StageRunner {
public:
  StageRunner(CommandRunner &runner, DryRunPlanner &planner,
              std::shared_ptr<Logger> logger = nullptr);

  // Blocks until the command exits. Throws CommandFailed on a non-zero exit
  // and ExecutableNotFound when the program cannot be launched. In planning
  // mode the command is only announced.
  void RunSync(const Command &command);

  // Starts the command and returns immediately. Must not be called in
  // planning mode.
  std::unique_ptr<RunningProcess> SpawnAsync(const Command &command);

  bool Planning() const { return planner_->Active(); }

private:
  void LogEnvironment(const Command &command) const;

  CommandRunner *runner_;
  DryRunPlanner *planner_;
  std::shared_ptr<Logger> logger_;
};

std::string DescribeCommand(const Command &command);

} // namespace bundler
