#include <bundler/iconset_icon_generator.h>


#include <string>
#include <utility>

namespace bundler {
namespace {

struct IconSize {
  int pixels;
  const char *file_name;
};

constexpr IconSize kIconsetSizes[] = {
    {16, "icon_16x16.png"},      {32, "icon_16x16@2x.png"},
    {32, "icon_32x32.png"},      {64, "icon_32x32@2x.png"},
    {128, "icon_128x128.png"},   {256, "icon_128x128@2x.png"},
    {256, "icon_256x256.png"},   {512, "icon_256x256@2x.png"},
    {512, "icon_512x512.png"},   {1024, "icon_512x512@2x.png"},
};

} // namespace

IconsetIconGenerator::IconsetIconGenerator(const BuildLayout &layout,
                                           CommandRunner &runner,
                                           StageRunner &stage_runner,
                                           FilesystemActions &actions,
                                           std::shared_ptr<Logger> logger)
    : layout_(&layout), runner_(&runner), stage_runner_(&stage_runner),
      actions_(&actions), logger_(EnsureLogger(std::move(logger))) {}

std::optional<std::filesystem::path>
IconsetIconGenerator::FindSourceImage() const {
  const auto source_dir = layout_->webapp_dir / "public" / "favicon";
  for (const auto *name :
       {"favicon-512.png", "apple-touch-icon.png", "favicon-256.png"}) {
    const auto candidate = source_dir / name;
    std::error_code error;
    if (std::filesystem::is_regular_file(candidate, error)) {
      return candidate;
    }
  }
  return std::nullopt;
}

bool IconsetIconGenerator::IconReady(
    const std::filesystem::path &icon_output) const {
  std::error_code error;
  return std::filesystem::is_regular_file(icon_output, error) &&
         std::filesystem::file_size(icon_output, error) > 0;
}

bool IconsetIconGenerator::Generate(const std::filesystem::path &icon_output) {
  const auto source_dir = layout_->webapp_dir / "public" / "favicon";
  std::error_code error;
  if (!std::filesystem::is_directory(source_dir, error)) {
    logger_->Log(LogLevel::kWarn, "Icon source directory not found",
                 {{"path", source_dir.string()}});
    return false;
  }

  const auto source = FindSourceImage();
  if (!source) {
    logger_->Log(LogLevel::kWarn, "No suitable icon source file found",
                 {{"path", source_dir.string()}});
    return false;
  }

  logger_->Log(LogLevel::kInfo, "Creating app icon...",
               {{"source", source->filename().string()}});

  const auto flattened = layout_->work_dir / "appicon_source_macos.png";
  actions_->FlattenIcon(*source, flattened);

  const auto iconset = layout_->work_dir / "appicon.iconset";
  actions_->RemoveAll(iconset);
  actions_->CreateDirectories(iconset);

  for (const auto &size : kIconsetSizes) {
    const auto pixels = std::to_string(size.pixels);
    stage_runner_->RunSync(Command{"sips",
                                   {"-z", pixels, pixels, flattened.string(),
                                    "--out",
                                    (iconset / size.file_name).string()}});
  }

  actions_->RemoveAll(icon_output);

  const auto run_best_effort = [&](Command command) {
    command.quiet = true;
    if (actions_->Planning()) {
      stage_runner_->RunSync(command);
      return;
    }
    const auto status = runner_->Run(command);
    logger_->Log(LogLevel::kDebug, "Icon compiler finished",
                 {{"program", command.program},
                  {"status", status.Describe()}});
  };

  if (runner_->FindProgram("iconutil")) {
    run_best_effort(Command{"iconutil",
                            {"-c", "icns", iconset.string(), "-o",
                             icon_output.string()}});
  }
  if (!actions_->Planning() && !IconReady(icon_output)) {
    logger_->Log(LogLevel::kDebug, "Converting to .icns with sips fallback");
    run_best_effort(Command{"sips",
                            {"-s", "format", "icns", flattened.string(),
                             "--out", icon_output.string()}});
  }

  if (actions_->Planning()) {
    return false;
  }
  if (!IconReady(icon_output)) {
    logger_->Log(LogLevel::kWarn, "Failed to generate app icon",
                 {{"path", icon_output.string()}});
    return false;
  }
  logger_->Log(LogLevel::kInfo, "Icon ready", {{"path", icon_output.string()}});
  return true;
}

} // namespace bundler
