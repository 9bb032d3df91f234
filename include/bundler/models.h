#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bundler {

// Immutable settings resolved once at startup.
struct BuildConfig {
  std::string app_name = "Budget";
  std::string bundle_id = "com.budget.app";
  std::string app_version = "0.1.0";
  std::string build_number = "1";
  std::string codesign_identity;

  bool clean = false;
  bool force_frontend = false;
  bool force_backend = false;
  bool force_swift = false;

  bool skip_frontend = false;
  bool skip_backend = false;
  bool skip_swift = false;

  bool dev_mode = false;
  bool verbose = false;
  bool dry_run = false;
};

enum class StageKind {
  kFrontendDeps,
  kFrontendBuild,
  kBackendDeps,
  kBackendBuild,
  kWrapperBuild,
};

// Parameters a stage was last built with, compared byte for byte.
struct ParameterSnapshot {
  std::filesystem::path file;
  std::string content;
};

struct StageSpec {
  std::string name;
  StageKind kind = StageKind::kFrontendBuild;
  std::vector<std::filesystem::path> watched_files;
  std::vector<std::filesystem::path> watched_trees;
  std::filesystem::path output;
  std::filesystem::path stamp;
  std::optional<ParameterSnapshot> parameters;
  bool forced = false;
  bool skipped = false;
};

struct Command {
  std::string program;
  std::vector<std::string> args;
  std::optional<std::filesystem::path> cwd;
  std::vector<std::pair<std::string, std::string>> env;
  bool quiet = false;
};

struct ExitStatus {
  bool exited = false;
  int code = 0;
  int signal = 0;

  bool Success() const { return exited && code == 0; }
  std::string Describe() const;

  static ExitStatus Exited(int code) { return ExitStatus{true, code, 0}; }
  static ExitStatus Signaled(int signal) {
    return ExitStatus{false, 0, signal};
  }
};

std::string StageKindName(StageKind kind);

} // namespace bundler
