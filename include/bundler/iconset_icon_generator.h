#pragma once

#include <bundler/build_layout.h>
#include <bundler/dry_run_planner.h>
#include <bundler/interfaces.h>
#include <bundler/logging.h>
#include <bundler/stage_runner.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace bundler {

// Builds appicon.icns from the web app's favicon: flatten, resize into an
// iconset with sips, compile with iconutil (sips as fallback).
class IconsetIconGenerator : public IconGenerator {
public:
  IconsetIconGenerator(const BuildLayout &layout, CommandRunner &runner,
                       StageRunner &stage_runner, FilesystemActions &actions,
                       std::shared_ptr<Logger> logger = nullptr);

  bool Generate(const std::filesystem::path &icon_output) override;

  std::optional<std::filesystem::path> FindSourceImage() const;

private:
  bool IconReady(const std::filesystem::path &icon_output) const;

  const BuildLayout *layout_;
  CommandRunner *runner_;
  StageRunner *stage_runner_;
  FilesystemActions *actions_;
  std::shared_ptr<Logger> logger_;
};

} // namespace bundler
