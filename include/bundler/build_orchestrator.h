#pragma once

#include <bundler/build_layout.h>
#include <bundler/bundle_assembler.h>
#include <bundler/dry_run_planner.h>
#include <bundler/interfaces.h>
#include <bundler/logging.h>
#include <bundler/models.h>
#include <bundler/stage_runner.h>
#include <bundler/staleness_oracle.h>
#include <bundler/task_coordinator.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace bundler {

struct BuildSummary {
  std::filesystem::path app_bundle;
  std::chrono::milliseconds elapsed{0};
  // Stage names in launch order.
  std::vector<std::string> rebuilt;
  std::vector<std::string> reused;
  std::vector<std::string> skipped;
  bool planned = false;
  AssemblyReport assembly;
};

std::string FormatElapsed(std::chrono::milliseconds elapsed);

// Drives one run: toolchain check, clean, stages in fixed order, wait,
// assembly. Owns every per-run component.
class BuildOrchestrator {
public:
  // Uses an IconsetIconGenerator when icon_generator is null.
  BuildOrchestrator(const BuildConfig &config, const BuildLayout &layout,
                    CommandRunner &runner,
                    std::shared_ptr<Logger> logger = nullptr,
                    IconGenerator *icon_generator = nullptr);

  BuildSummary Run();

  // Throws ToolchainMissing for the first required program not on the
  // search path.
  void CheckToolchain() const;

  const DryRunPlanner &Planner() const { return planner_; }
  const TaskCoordinator &Coordinator() const { return coordinator_; }

private:
  void PrepareDirectories();
  void RunDependencyStage(const StageSpec &stage, const Command &command,
                          const std::string &action, BuildSummary &summary);
  void LaunchBuildStage(const StageSpec &stage, const Command &command,
                        const std::string &action,
                        const std::string &unchanged_message,
                        BuildSummary &summary);
  void BuildFrontend(BuildSummary &summary);
  void BuildBackend(BuildSummary &summary);
  void BuildWrapper(BuildSummary &summary);

  const BuildConfig *config_;
  const BuildLayout *layout_;
  CommandRunner *runner_;
  std::shared_ptr<Logger> logger_;
  DryRunPlanner planner_;
  FilesystemActions actions_;
  StageRunner stage_runner_;
  StalenessOracle oracle_;
  TaskCoordinator coordinator_;
  std::unique_ptr<IconGenerator> default_icon_generator_;
  IconGenerator *icon_generator_;
};

} // namespace bundler
