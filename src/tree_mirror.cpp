#include <bundler/tree_mirror.h>

#include <bundler/errors.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace bundler {
namespace {

std::filesystem::file_type
TypeOf(const std::filesystem::path &path) {
  std::error_code error;
  const auto status = std::filesystem::symlink_status(path, error);
  if (error) {
    return std::filesystem::file_type::not_found;
  }
  return status.type();
}

bool IsPreserved(const std::filesystem::path &relative,
                 const std::vector<std::filesystem::path> &preserved) {
  return std::find(preserved.begin(), preserved.end(), relative) !=
         preserved.end();
}

// Owner write access on every destination directory, so read-only copies
// from an earlier pass can be pruned and refilled. Source permissions are
// restored once the pass completes.
void MakeDirectoriesWritable(
    const std::filesystem::path &destination,
    const std::vector<std::filesystem::path> &preserved) {
  std::filesystem::permissions(destination,
                               std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::add);
  for (std::filesystem::recursive_directory_iterator it(destination), end;
       it != end; ++it) {
    if (it.depth() == 0 &&
        IsPreserved(it->path().lexically_relative(destination), preserved)) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->symlink_status().type() == std::filesystem::file_type::directory) {
      std::filesystem::permissions(it->path(),
                                   std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::add);
    }
  }
}

std::size_t
PruneDestination(const std::filesystem::path &source,
                 const std::filesystem::path &destination,
                 const std::vector<std::filesystem::path> &preserved) {
  std::vector<std::filesystem::path> doomed;
  for (std::filesystem::recursive_directory_iterator it(destination), end;
       it != end; ++it) {
    const auto &entry = *it;
    const auto relative = entry.path().lexically_relative(destination);
    if (it.depth() == 0 && IsPreserved(relative, preserved)) {
      it.disable_recursion_pending();
      continue;
    }
    const auto destination_type = entry.symlink_status().type();
    if (TypeOf(source / relative) == destination_type) {
      continue;
    }
    if (destination_type == std::filesystem::file_type::directory) {
      it.disable_recursion_pending();
    }
    doomed.push_back(entry.path());
  }

  std::size_t removed = 0;
  for (const auto &path : doomed) {
    removed += static_cast<std::size_t>(std::filesystem::remove_all(path));
  }
  return removed;
}

bool SameRegularFile(const std::filesystem::path &source,
                     const std::filesystem::path &target) {
  if (TypeOf(target) != std::filesystem::file_type::regular) {
    return false;
  }
  return std::filesystem::file_size(source) ==
             std::filesystem::file_size(target) &&
         std::filesystem::last_write_time(source) ==
             std::filesystem::last_write_time(target);
}

void CopyRegularFile(const std::filesystem::path &source,
                     const std::filesystem::path &target) {
  // The previous copy may carry read-only permissions.
  std::filesystem::remove(target);
  std::filesystem::copy_file(
      source, target, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::last_write_time(target,
                                   std::filesystem::last_write_time(source));
  std::filesystem::permissions(target,
                               std::filesystem::status(source).permissions(),
                               std::filesystem::perm_options::replace);
}

bool SyncSymlink(const std::filesystem::path &source,
                 const std::filesystem::path &target) {
  const auto link_target = std::filesystem::read_symlink(source);
  if (TypeOf(target) == std::filesystem::file_type::symlink &&
      std::filesystem::read_symlink(target) == link_target) {
    return false;
  }
  std::filesystem::remove(target);
  std::filesystem::create_symlink(link_target, target);
  return true;
}

} // namespace

MirrorStats MirrorTree(const std::filesystem::path &source,
                       const std::filesystem::path &destination,
                       const std::vector<std::filesystem::path> &preserved) {
  if (TypeOf(source) != std::filesystem::file_type::directory) {
    throw FilesystemError("mirror missing source directory", source);
  }

  MirrorStats stats;
  const auto destination_type = TypeOf(destination);
  if (destination_type != std::filesystem::file_type::not_found &&
      destination_type != std::filesystem::file_type::directory) {
    stats.removed +=
        static_cast<std::size_t>(std::filesystem::remove_all(destination));
  }
  std::filesystem::create_directories(destination);
  MakeDirectoriesWritable(destination, preserved);

  stats.removed += PruneDestination(source, destination, preserved);

  // Parents are visited before their children, so directory permissions are
  // applied after the walk, deepest first.
  std::vector<std::pair<std::filesystem::path, std::filesystem::perms>>
      directories;
  for (std::filesystem::recursive_directory_iterator it(source), end;
       it != end; ++it) {
    const auto &entry = *it;
    const auto target =
        destination / entry.path().lexically_relative(source);
    switch (entry.symlink_status().type()) {
    case std::filesystem::file_type::directory:
      std::filesystem::create_directory(target);
      directories.emplace_back(target, entry.status().permissions());
      break;
    case std::filesystem::file_type::symlink:
      if (SyncSymlink(entry.path(), target)) {
        ++stats.copied;
      } else {
        ++stats.unchanged;
      }
      break;
    case std::filesystem::file_type::regular:
      if (SameRegularFile(entry.path(), target)) {
        ++stats.unchanged;
      } else {
        CopyRegularFile(entry.path(), target);
        ++stats.copied;
      }
      break;
    default:
      break;
    }
  }

  for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
    std::filesystem::permissions(it->first, it->second,
                                 std::filesystem::perm_options::replace);
  }
  return stats;
}

} // namespace bundler
