#include <bundler/build_orchestrator.h>

#include <bundler/errors.h>
#include <bundler/iconset_icon_generator.h>
#include <bundler/stage_catalog.h>

#include <cstdio>
#include <utility>

namespace bundler {

std::string FormatElapsed(std::chrono::milliseconds elapsed) {
  const auto total = elapsed.count();
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%lld.%01llds",
                static_cast<long long>(total / 1000),
                static_cast<long long>((total % 1000) / 100));
  return buffer;
}

BuildOrchestrator::BuildOrchestrator(const BuildConfig &config,
                                     const BuildLayout &layout,
                                     CommandRunner &runner,
                                     std::shared_ptr<Logger> logger,
                                     IconGenerator *icon_generator)
    : config_(&config), layout_(&layout), runner_(&runner),
      logger_(EnsureLogger(std::move(logger))),
      planner_(config.dry_run, logger_), actions_(planner_, logger_),
      stage_runner_(runner, planner_, logger_), oracle_(logger_),
      coordinator_(actions_, logger_), icon_generator_(icon_generator) {
  if (icon_generator_ == nullptr) {
    default_icon_generator_ = std::make_unique<IconsetIconGenerator>(
        layout, runner, stage_runner_, actions_, logger_);
    icon_generator_ = default_icon_generator_.get();
  }
}

void BuildOrchestrator::CheckToolchain() const {
  for (const auto &tool : RequiredTools(*config_)) {
    if (!runner_->FindProgram(tool.program)) {
      throw ToolchainMissing(tool.program, tool.install_hint);
    }
  }
  for (const auto &program : OptionalTools()) {
    if (!runner_->FindProgram(program)) {
      logger_->Log(LogLevel::kDebug,
                   "Optional tool not found; app icon will be skipped",
                   {{"program", program}});
    }
  }
}

void BuildOrchestrator::PrepareDirectories() {
  if (config_->clean) {
    logger_->Log(LogLevel::kInfo, "Cleaning previous build outputs");
    actions_.RemoveAll(layout_->work_dir);
    actions_.RemoveAll(layout_->app_bundle);
  }
  actions_.CreateDirectories(layout_->out_dir);
  actions_.CreateDirectories(layout_->stamps_dir);
  if (!config_->skip_swift) {
    actions_.CreateDirectories(layout_->swift_home);
  }
}

void BuildOrchestrator::RunDependencyStage(const StageSpec &stage,
                                           const Command &command,
                                           const std::string &action,
                                           BuildSummary &summary) {
  const auto verdict = oracle_.Evaluate(stage);
  if (!verdict.stale) {
    logger_->Log(LogLevel::kDebug, stage.name + " up to date");
    summary.reused.push_back(stage.name);
    return;
  }
  logger_->Log(LogLevel::kInfo, action, {{"reason", verdict.reason}});
  stage_runner_.RunSync(command);
  actions_.WriteStamp(stage.stamp);
  summary.rebuilt.push_back(stage.name);
}

void BuildOrchestrator::LaunchBuildStage(const StageSpec &stage,
                                         const Command &command,
                                         const std::string &action,
                                         const std::string &unchanged_message,
                                         BuildSummary &summary) {
  const auto verdict = oracle_.Evaluate(stage);
  if (!verdict.stale) {
    logger_->Log(LogLevel::kInfo, unchanged_message);
    summary.reused.push_back(stage.name);
    return;
  }

  logger_->Log(LogLevel::kInfo, action, {{"reason", verdict.reason}});
  summary.rebuilt.push_back(stage.name);
  if (stage_runner_.Planning()) {
    stage_runner_.RunSync(command);
    ApplyFinalization(FinalizationFor(stage), actions_);
    return;
  }

  Task task(stage.name, stage.kind, FinalizationFor(stage));
  task.Start(stage_runner_.SpawnAsync(command));
  coordinator_.Register(std::move(task));
}

void BuildOrchestrator::BuildFrontend(BuildSummary &summary) {
  if (config_->skip_frontend) {
    logger_->Log(LogLevel::kInfo, "Skipping frontend");
    summary.skipped.push_back("frontend");
    return;
  }
  RunDependencyStage(FrontendDepsStage(*layout_, *config_),
                     FrontendDepsCommand(*layout_),
                     "Installing frontend dependencies (npm)", summary);
  LaunchBuildStage(FrontendBuildStage(*layout_, *config_),
                   FrontendBuildCommand(*layout_), "Building frontend (vite)",
                   "Frontend unchanged; skipping vite build", summary);
}

void BuildOrchestrator::BuildBackend(BuildSummary &summary) {
  if (config_->skip_backend) {
    logger_->Log(LogLevel::kInfo, "Skipping backend");
    summary.skipped.push_back("backend");
    return;
  }
  RunDependencyStage(BackendDepsStage(*layout_, *config_),
                     BackendDepsCommand(*layout_),
                     "Syncing backend dependencies (uv)", summary);
  LaunchBuildStage(BackendBuildStage(*layout_, *config_),
                   BackendBuildCommand(*layout_),
                   "Building backend (PyInstaller)",
                   "Backend unchanged; skipping PyInstaller build", summary);
}

void BuildOrchestrator::BuildWrapper(BuildSummary &summary) {
  if (config_->skip_swift) {
    logger_->Log(LogLevel::kInfo, "Skipping Swift build");
    summary.skipped.push_back("swift");
    return;
  }
  LaunchBuildStage(WrapperBuildStage(*layout_, *config_),
                   WrapperBuildCommand(*layout_), "Building Swift wrapper",
                   "Swift wrapper unchanged; skipping swift build", summary);
}

BuildSummary BuildOrchestrator::Run() {
  const auto started = std::chrono::steady_clock::now();
  BuildSummary summary;
  summary.app_bundle = layout_->app_bundle;
  summary.planned = planner_.Active();

  if (config_->dev_mode) {
    logger_->Log(LogLevel::kInfo,
                 "Development mode: fast frontend-only updates");
  }
  logger_->Log(LogLevel::kDebug, "Resolved project root",
               {{"root", layout_->root.string()}});

  CheckToolchain();
  PrepareDirectories();

  BuildFrontend(summary);
  BuildBackend(summary);
  BuildWrapper(summary);

  if (!planner_.Active()) {
    coordinator_.WaitAll();
  }

  BundleAssembler assembler(*config_, *layout_, actions_, stage_runner_,
                            icon_generator_, logger_);
  summary.assembly = assembler.Assemble();

  summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (planner_.Active()) {
    logger_->Log(LogLevel::kWarn, "DRY_RUN: plan complete (no commands "
                                  "executed)");
    return summary;
  }
  logger_->Log(LogLevel::kInfo, "Built " + layout_->app_bundle.string(),
               {{"elapsed", FormatElapsed(summary.elapsed)}});
  return summary;
}

} // namespace bundler
