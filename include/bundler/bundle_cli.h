#pragma once

#include <bundler/build_options.h>

#include <filesystem>
#include <string>
#include <vector>

namespace bundler {

void PrintUsage();

// Resolves configuration, locates the project root from working_directory
// and runs one build. Returns the process exit code.
int RunBuild(const std::vector<std::string> &arguments,
             const EnvironmentLookup &lookup,
             const std::filesystem::path &working_directory);

// flatten-icon <input.png> <output.png>
int RunFlattenIcon(const std::vector<std::string> &arguments);

} // namespace bundler
