#include <bundler/staleness_oracle.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace bundler {
namespace {

bool IsRegularFile(const std::filesystem::path &path) {
  std::error_code error;
  return std::filesystem::is_regular_file(path, error);
}

bool IsDirectory(const std::filesystem::path &path) {
  std::error_code error;
  return std::filesystem::is_directory(path, error);
}

std::optional<std::string> ReadSnapshot(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  std::string content((std::istreambuf_iterator<char>(stream)),
                      std::istreambuf_iterator<char>());
  if (stream.bad()) {
    return std::nullopt;
  }
  return content;
}

StalenessVerdict Stale(std::string reason) {
  return StalenessVerdict{true, std::move(reason)};
}

} // namespace

bool FileNewerThan(const std::filesystem::path &file,
                   const std::filesystem::path &stamp) {
  if (!IsRegularFile(file)) {
    return false;
  }
  if (!IsRegularFile(stamp)) {
    return true;
  }
  return std::filesystem::last_write_time(file) >
         std::filesystem::last_write_time(stamp);
}

bool TreeHasNewerThan(const std::filesystem::path &directory,
                      const std::filesystem::path &stamp) {
  if (!IsDirectory(directory)) {
    return false;
  }
  if (!IsRegularFile(stamp)) {
    return true;
  }
  const auto stamp_time = std::filesystem::last_write_time(stamp);

  std::vector<std::filesystem::path> pending{directory};
  while (!pending.empty()) {
    const auto current = std::move(pending.back());
    pending.pop_back();
    for (const auto &entry : std::filesystem::directory_iterator(current)) {
      const auto type = entry.symlink_status().type();
      if (type == std::filesystem::file_type::directory) {
        pending.push_back(entry.path());
      } else if (type == std::filesystem::file_type::regular &&
                 entry.last_write_time() > stamp_time) {
        return true;
      }
    }
  }
  return false;
}

StalenessOracle::StalenessOracle(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

StalenessVerdict StalenessOracle::Evaluate(const StageSpec &stage) const {
  const auto verdict = [&]() -> StalenessVerdict {
    if (stage.skipped) {
      return StalenessVerdict{false, "skipped"};
    }
    if (stage.forced) {
      return Stale("forced");
    }
    if (!std::filesystem::exists(stage.output)) {
      return Stale("output missing: " + stage.output.string());
    }
    if (!IsRegularFile(stage.stamp)) {
      return Stale("stamp missing: " + stage.stamp.string());
    }
    if (stage.parameters) {
      const auto recorded = ReadSnapshot(stage.parameters->file);
      if (!recorded) {
        return Stale("parameter snapshot missing: " +
                     stage.parameters->file.string());
      }
      if (*recorded != stage.parameters->content) {
        return Stale("build parameters changed");
      }
    }
    for (const auto &file : stage.watched_files) {
      if (FileNewerThan(file, stage.stamp)) {
        return Stale("changed: " + file.string());
      }
    }
    for (const auto &tree : stage.watched_trees) {
      if (TreeHasNewerThan(tree, stage.stamp)) {
        return Stale("changed under: " + tree.string());
      }
    }
    return StalenessVerdict{false, "up to date"};
  }();

  logger_->Log(LogLevel::kDebug, "Staleness decision",
               {{"stage", stage.name},
                {"stale", verdict.stale ? "true" : "false"},
                {"reason", verdict.reason}});
  return verdict;
}

} // namespace bundler
