#pragma once

#include <bundler/build_layout.h>
#include <bundler/models.h>
#include <bundler/task_coordinator.h>

#include <string>
#include <vector>

namespace bundler {

// Build parameters recorded next to the frontend build stamp.
extern const char *const kFrontendBuildParameters;

StageSpec FrontendDepsStage(const BuildLayout &layout,
                            const BuildConfig &config);
StageSpec FrontendBuildStage(const BuildLayout &layout,
                             const BuildConfig &config);
StageSpec BackendDepsStage(const BuildLayout &layout,
                           const BuildConfig &config);
StageSpec BackendBuildStage(const BuildLayout &layout,
                            const BuildConfig &config);
StageSpec WrapperBuildStage(const BuildLayout &layout,
                            const BuildConfig &config);

Command FrontendDepsCommand(const BuildLayout &layout);
Command FrontendBuildCommand(const BuildLayout &layout);
Command BackendDepsCommand(const BuildLayout &layout);
Command BackendBuildCommand(const BuildLayout &layout);
Command WrapperBuildCommand(const BuildLayout &layout);

// Snapshot then stamp for parameterized stages, stamp only otherwise.
Finalization FinalizationFor(const StageSpec &stage);

struct RequiredTool {
  std::string program;
  std::string install_hint;
};

std::vector<RequiredTool> RequiredTools(const BuildConfig &config);
std::vector<std::string> OptionalTools();

} // namespace bundler
