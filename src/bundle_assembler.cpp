#include <bundler/bundle_assembler.h>

#include <bundler/bundle_metadata.h>
#include <bundler/errors.h>

#include <exception>
#include <string>
#include <utility>

namespace bundler {

BundleAssembler::BundleAssembler(const BuildConfig &config,
                                 const BuildLayout &layout,
                                 FilesystemActions &actions,
                                 StageRunner &stage_runner,
                                 IconGenerator *icon_generator,
                                 std::shared_ptr<Logger> logger)
    : config_(&config), layout_(&layout), actions_(&actions),
      stage_runner_(&stage_runner), icon_generator_(icon_generator),
      logger_(EnsureLogger(std::move(logger))) {}

void BundleAssembler::RequireArtifacts() const {
  const struct {
    const char *stage;
    const std::filesystem::path *path;
    bool directory;
  } artifacts[] = {
      {"wrapper", &layout_->wrapper_binary, false},
      {"backend", &layout_->backend_product, true},
      {"frontend", &layout_->webapp_dist, true},
  };

  for (const auto &artifact : artifacts) {
    std::error_code error;
    const bool present =
        artifact.directory
            ? std::filesystem::is_directory(*artifact.path, error)
            : std::filesystem::is_regular_file(*artifact.path, error);
    if (present) {
      continue;
    }
    if (actions_->Planning()) {
      logger_->Log(LogLevel::kWarn, "Artifact not present yet",
                   {{"stage", artifact.stage},
                    {"path", artifact.path->string()}});
      continue;
    }
    throw MissingArtifact(artifact.stage, *artifact.path);
  }
}

bool BundleAssembler::BuildIcon() {
  if (icon_generator_ == nullptr) {
    return false;
  }
  try {
    return icon_generator_->Generate(layout_->icon_path);
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, "App icon generation failed; continuing "
                                  "without an icon",
                 {{"error", error.what()}});
    return false;
  }
}

bool BundleAssembler::Sign() {
  if (config_->codesign_identity.empty()) {
    logger_->Log(LogLevel::kInfo,
                 "Skipping codesign (set CODESIGN_IDENTITY to enable)");
    return false;
  }
  logger_->Log(LogLevel::kInfo, "Codesigning",
               {{"identity", config_->codesign_identity}});
  stage_runner_->RunSync(Command{"codesign",
                                 {"--force", "--deep", "--options", "runtime",
                                  "--sign", config_->codesign_identity,
                                  layout_->app_bundle.string()}});
  return !actions_->Planning();
}

AssemblyReport BundleAssembler::Assemble() {
  RequireArtifacts();

  logger_->Log(LogLevel::kInfo, "Assembling app bundle",
               {{"bundle", layout_->app_bundle.string()}});
  actions_->CreateDirectories(layout_->executable_path.parent_path());
  actions_->CreateDirectories(layout_->resources_dir);

  AssemblyReport report;
  actions_->CopyExecutable(layout_->wrapper_binary, layout_->executable_path);
  report.backend =
      actions_->Mirror(layout_->backend_product, layout_->backend_resources,
                       {layout_->frontend_resources.filename()});
  report.frontend =
      actions_->Mirror(layout_->webapp_dist, layout_->frontend_resources);

  report.has_icon = BuildIcon();
  actions_->WriteFile(layout_->info_plist,
                      RenderInfoPlist(*config_, report.has_icon));
  actions_->WriteFile(layout_->pkg_info, kPackageTypeMarker);
  // Finder and the Dock only pick up a changed icon when the bundle changes.
  actions_->Touch(layout_->app_bundle);

  report.signed_bundle = Sign();
  return report;
}

} // namespace bundler
