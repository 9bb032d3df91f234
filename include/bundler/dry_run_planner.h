#pragma once

#include <bundler/logging.h>
#include <bundler/tree_mirror.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace bundler {

// In planning mode every mutating action is announced instead of performed.
class DryRunPlanner {
public:
  DryRunPlanner(bool active, std::shared_ptr<Logger> logger);

  bool Active() const { return active_; }
  void Announce(const std::string &action);
  const std::vector<std::string> &Announcements() const {
    return announcements_;
  }

private:
  bool active_;
  std::shared_ptr<Logger> logger_;
  std::vector<std::string> announcements_;
};

// Every filesystem mutation of a run goes through this class.
class FilesystemActions {
public:
  FilesystemActions(DryRunPlanner &planner, std::shared_ptr<Logger> logger);

  bool Planning() const { return planner_->Active(); }

  void CreateDirectories(const std::filesystem::path &path);
  void RemoveAll(const std::filesystem::path &path);
  void WriteFile(const std::filesystem::path &path,
                 const std::string &content);
  void WriteStamp(const std::filesystem::path &path);
  void CopyExecutable(const std::filesystem::path &source,
                      const std::filesystem::path &destination);
  MirrorStats Mirror(const std::filesystem::path &source,
                     const std::filesystem::path &destination,
                     const std::vector<std::filesystem::path> &preserved = {});
  void Touch(const std::filesystem::path &path);
  // Writes an opaque copy of the PNG at source.
  void FlattenIcon(const std::filesystem::path &source,
                   const std::filesystem::path &destination);

private:
  DryRunPlanner *planner_;
  std::shared_ptr<Logger> logger_;
};

} // namespace bundler
