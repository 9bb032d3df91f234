#include <bundler/dry_run_planner.h>

#include <bundler/errors.h>
#include <bundler/icon_flattener.h>

#include <chrono>
#include <fstream>
#include <utility>

namespace bundler {

DryRunPlanner::DryRunPlanner(bool active, std::shared_ptr<Logger> logger)
    : active_(active), logger_(EnsureLogger(std::move(logger))) {}

void DryRunPlanner::Announce(const std::string &action) {
  announcements_.push_back(action);
  logger_->Log(LogLevel::kInfo, "[DRY RUN] " + action);
}

FilesystemActions::FilesystemActions(DryRunPlanner &planner,
                                     std::shared_ptr<Logger> logger)
    : planner_(&planner), logger_(EnsureLogger(std::move(logger))) {}

void FilesystemActions::CreateDirectories(const std::filesystem::path &path) {
  if (Planning()) {
    planner_->Announce("mkdir -p " + path.string());
    return;
  }
  std::filesystem::create_directories(path);
}

void FilesystemActions::RemoveAll(const std::filesystem::path &path) {
  if (Planning()) {
    planner_->Announce("rm -rf " + path.string());
    return;
  }
  const auto removed = std::filesystem::remove_all(path);
  logger_->Log(LogLevel::kDebug, "Removed path",
               {{"path", path.string()}, {"entries", std::to_string(removed)}});
}

void FilesystemActions::WriteFile(const std::filesystem::path &path,
                                  const std::string &content) {
  if (Planning()) {
    planner_->Announce("write " + path.string());
    return;
  }
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream stream(path, std::ios::binary | std::ios::trunc);
  if (!stream) {
    throw FilesystemError("open for writing", path);
  }
  stream << content;
  stream.close();
  if (!stream) {
    throw FilesystemError("write", path);
  }
}

void FilesystemActions::WriteStamp(const std::filesystem::path &path) {
  if (Planning()) {
    planner_->Announce("stamp " + path.string());
    return;
  }
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  WriteFile(path, std::to_string(seconds) + "\n");
  logger_->Log(LogLevel::kDebug, "Wrote stamp", {{"path", path.string()}});
}

void FilesystemActions::CopyExecutable(
    const std::filesystem::path &source,
    const std::filesystem::path &destination) {
  if (Planning()) {
    planner_->Announce("install -m 755 " + source.string() + " " +
                       destination.string());
    return;
  }
  if (destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path());
  }
  std::filesystem::copy_file(
      source, destination, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::permissions(destination,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_read |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::replace);
}

MirrorStats
FilesystemActions::Mirror(const std::filesystem::path &source,
                          const std::filesystem::path &destination,
                          const std::vector<std::filesystem::path> &preserved) {
  if (Planning()) {
    planner_->Announce("mirror " + source.string() + "/ -> " +
                       destination.string() + "/");
    return MirrorStats{};
  }
  const auto stats = MirrorTree(source, destination, preserved);
  logger_->Log(LogLevel::kDebug, "Mirrored tree",
               {{"source", source.string()},
                {"destination", destination.string()},
                {"copied", std::to_string(stats.copied)},
                {"removed", std::to_string(stats.removed)},
                {"unchanged", std::to_string(stats.unchanged)}});
  return stats;
}

void FilesystemActions::Touch(const std::filesystem::path &path) {
  if (Planning()) {
    planner_->Announce("touch " + path.string());
    return;
  }
  std::filesystem::last_write_time(path,
                                   std::filesystem::file_time_type::clock::now());
}

void FilesystemActions::FlattenIcon(const std::filesystem::path &source,
                                    const std::filesystem::path &destination) {
  if (Planning()) {
    planner_->Announce("flatten " + source.string() + " -> " +
                       destination.string());
    return;
  }
  FlattenIconFile(source, destination);
}

} // namespace bundler
