#pragma once

#include <bundler/models.h>

#include <filesystem>
#include <optional>

namespace bundler {

struct BuildLayout {
  std::filesystem::path root;

  std::filesystem::path out_dir;
  std::filesystem::path work_dir;
  std::filesystem::path stamps_dir;
  std::filesystem::path backend_out;
  std::filesystem::path backend_product;
  std::filesystem::path swift_home;

  std::filesystem::path webapp_dir;
  std::filesystem::path webapp_dist;
  std::filesystem::path backend_dir;
  std::filesystem::path wrapper_dir;
  std::filesystem::path wrapper_binary;

  std::filesystem::path app_bundle;
  std::filesystem::path contents_dir;
  std::filesystem::path executable_path;
  std::filesystem::path resources_dir;
  std::filesystem::path backend_resources;
  std::filesystem::path frontend_resources;
  std::filesystem::path icon_path;
  std::filesystem::path info_plist;
  std::filesystem::path pkg_info;
};

BuildLayout MakeBuildLayout(const std::filesystem::path &root,
                            const BuildConfig &config);

bool LooksLikeProjectRoot(const std::filesystem::path &directory);

// Uses the override when given, otherwise searches start and its ancestors.
std::filesystem::path
ResolveProjectRoot(const std::optional<std::filesystem::path> &root_override,
                   const std::filesystem::path &start);

} // namespace bundler
