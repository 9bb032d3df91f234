#include <bundler/build_layout.h>

#include <stdexcept>

namespace bundler {

BuildLayout MakeBuildLayout(const std::filesystem::path &root,
                            const BuildConfig &config) {
  BuildLayout layout;
  layout.root = root;

  layout.out_dir = root / "dist";
  layout.work_dir = root / ".mac_build";
  layout.stamps_dir = layout.work_dir / "stamps";
  layout.backend_out = layout.work_dir / "backend_dist";
  layout.backend_product = layout.backend_out / "backend_server";
  layout.swift_home = layout.work_dir / "swift_home";

  layout.webapp_dir = root / "webapp";
  layout.webapp_dist = layout.webapp_dir / "dist";
  layout.backend_dir = root / "backend";
  layout.wrapper_dir = root / "macos-app";
  layout.wrapper_binary =
      layout.wrapper_dir / ".build" / "release" / "MacWrapper";

  layout.app_bundle = layout.out_dir / (config.app_name + ".app");
  layout.contents_dir = layout.app_bundle / "Contents";
  layout.executable_path = layout.contents_dir / "MacOS" / config.app_name;
  layout.resources_dir = layout.contents_dir / "Resources";
  layout.backend_resources = layout.resources_dir / "backend_server";
  layout.frontend_resources = layout.backend_resources / "webapp_dist";
  layout.icon_path = layout.resources_dir / "appicon.icns";
  layout.info_plist = layout.contents_dir / "Info.plist";
  layout.pkg_info = layout.contents_dir / "PkgInfo";
  return layout;
}

bool LooksLikeProjectRoot(const std::filesystem::path &directory) {
  std::error_code error;
  return std::filesystem::is_directory(directory / "webapp", error) &&
         std::filesystem::is_directory(directory / "backend", error) &&
         std::filesystem::is_directory(directory / "macos-app", error);
}

std::filesystem::path
ResolveProjectRoot(const std::optional<std::filesystem::path> &root_override,
                   const std::filesystem::path &start) {
  if (root_override) {
    const auto root = std::filesystem::weakly_canonical(*root_override);
    if (!LooksLikeProjectRoot(root)) {
      throw std::runtime_error(
          "Not a project root (expected webapp/, backend/ and macos-app/): " +
          root.string());
    }
    return root;
  }

  for (auto directory = std::filesystem::weakly_canonical(start);
       !directory.empty(); directory = directory.parent_path()) {
    if (LooksLikeProjectRoot(directory)) {
      return directory;
    }
    if (directory == directory.root_path()) {
      break;
    }
  }
  throw std::runtime_error("Could not locate project root. Run from the "
                           "project root or pass --root <path>.");
}

} // namespace bundler
