#pragma once

#include <bundler/logging.h>
#include <bundler/models.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bundler {

// One configuration source. Unset fields leave lower layers untouched.
struct BuildOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config_file;

  std::optional<std::string> app_name;
  std::optional<std::string> bundle_id;
  std::optional<std::string> app_version;
  std::optional<std::string> build_number;
  std::optional<std::string> codesign_identity;

  std::optional<bool> clean;
  std::optional<bool> force_frontend;
  std::optional<bool> force_backend;
  std::optional<bool> force_swift;
  std::optional<bool> skip_frontend;
  std::optional<bool> skip_backend;
  std::optional<bool> skip_swift;
  std::optional<bool> dev_mode;
  std::optional<bool> verbose;
  std::optional<bool> dry_run;

  std::optional<LogFormat> log_format;
  bool show_help = false;
};

using EnvironmentLookup =
    std::function<std::optional<std::string>(const std::string &)>;

// Reads the process environment through getenv.
EnvironmentLookup ProcessEnvironment();

// 1, true, yes and on (any case) are true; anything else is false.
bool ParseBool(const std::string &value);
LogFormat ParseLogFormat(const std::string &value);

BuildOptions ParseBuildArguments(const std::vector<std::string> &arguments);
BuildOptions OptionsFromEnvironment(const EnvironmentLookup &lookup);
BuildOptions ParseConfigFile(const std::filesystem::path &path);

// Fields set in overlay win.
BuildOptions MergeOptions(const BuildOptions &base,
                          const BuildOptions &overlay);

// Defaults < config file < environment < command line.
BuildOptions LayerOptions(const BuildOptions &cli_options,
                          const EnvironmentLookup &lookup);

BuildConfig ResolveBuildConfig(const BuildOptions &options);
LoggingConfig BuildLoggingConfig(const BuildOptions &options, bool color);

const std::vector<std::string> &SupportedConfigKeys();

} // namespace bundler
