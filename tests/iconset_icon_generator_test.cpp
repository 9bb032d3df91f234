#include <bundler/build_layout.h>
#include <bundler/dry_run_planner.h>
#include <bundler/icon_flattener.h>
#include <bundler/iconset_icon_generator.h>
#include <bundler/stage_runner.h>

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/recording_command_runner.h"
#include "test_support/temporary_project.h"

namespace bundler {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

class IconsetIconGeneratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    layout_ = MakeBuildLayout(project_.root(), BuildConfig{});
    icon_output_ = layout_.icon_path;
  }

  void AddFavicon(const std::string &name) {
    RgbaImage image;
    image.width = 1;
    image.height = 2;
    image.pixels = {10, 20, 30, 255, 0, 0, 0, 0};
    const auto path = project_.root() / "webapp/public/favicon" / name;
    std::filesystem::create_directories(path.parent_path());
    SavePng(path, image);
  }

  // Makes the named program write the .icns file named by its last argument.
  void ProduceIconWith(const std::string &program) {
    runner_.on_run = [program](const Command &command) {
      if (command.program == program && command.args.size() >= 2) {
        const std::filesystem::path output = command.args.back();
        if (output.extension() == ".icns") {
          std::filesystem::create_directories(output.parent_path());
          std::ofstream stream(output);
          stream << "icns";
        }
      }
      return ExitStatus::Exited(0);
    };
  }

  bool Generate(bool planning = false) {
    planner_ = std::make_unique<DryRunPlanner>(planning, nullptr);
    actions_ = std::make_unique<FilesystemActions>(*planner_, nullptr);
    stage_runner_ = std::make_unique<StageRunner>(runner_, *planner_);
    IconsetIconGenerator generator(layout_, runner_, *stage_runner_, *actions_);
    return generator.Generate(icon_output_);
  }

  std::vector<Command> RunsOf(const std::string &program) const {
    std::vector<Command> matching;
    for (const auto &command : runner_.runs) {
      if (command.program == program) {
        matching.push_back(command);
      }
    }
    return matching;
  }

  test::TemporaryProject project_;
  test::RecordingCommandRunner runner_;
  BuildLayout layout_;
  std::filesystem::path icon_output_;
  std::unique_ptr<DryRunPlanner> planner_;
  std::unique_ptr<FilesystemActions> actions_;
  std::unique_ptr<StageRunner> stage_runner_;
};

TEST_F(IconsetIconGeneratorTest, MissingFaviconDirectoryYieldsNoIcon) {
  EXPECT_FALSE(Generate());
  EXPECT_EQ(0u, runner_.Invocations());
}

TEST_F(IconsetIconGeneratorTest, PrefersLargestFavicon) {
  AddFavicon("favicon-256.png");
  AddFavicon("apple-touch-icon.png");
  DryRunPlanner planner(false, nullptr);
  FilesystemActions actions(planner, nullptr);
  StageRunner stage_runner(runner_, planner);
  IconsetIconGenerator generator(layout_, runner_, stage_runner, actions);

  const auto source = generator.FindSourceImage();

  ASSERT_TRUE(source.has_value());
  EXPECT_EQ("apple-touch-icon.png", source->filename().string());
}

TEST_F(IconsetIconGeneratorTest, ResizesThenCompilesWithIconutil) {
  AddFavicon("favicon-512.png");
  ProduceIconWith("iconutil");

  EXPECT_TRUE(Generate());

  const auto flattened = layout_.work_dir / "appicon_source_macos.png";
  EXPECT_TRUE(std::filesystem::is_regular_file(flattened));
  const auto resizes = RunsOf("sips");
  ASSERT_EQ(10u, resizes.size());
  EXPECT_THAT(resizes[0].args,
              ElementsAre("-z", "16", "16", flattened.string(), "--out",
                          (layout_.work_dir / "appicon.iconset/icon_16x16.png")
                              .string()));
  EXPECT_EQ("1024", resizes[9].args[1]);
  ASSERT_EQ(1u, RunsOf("iconutil").size());
  EXPECT_TRUE(RunsOf("iconutil")[0].quiet);
  EXPECT_EQ("icns", test::TemporaryProject::ReadFile(icon_output_));
}

TEST_F(IconsetIconGeneratorTest, FallsBackToSipsWithoutIconutil) {
  AddFavicon("favicon-512.png");
  runner_.missing_programs = {"iconutil"};
  ProduceIconWith("sips");

  EXPECT_TRUE(Generate());

  EXPECT_TRUE(RunsOf("iconutil").empty());
  const auto sips = RunsOf("sips");
  ASSERT_EQ(11u, sips.size());
  EXPECT_EQ("-s", sips.back().args[0]);
}

TEST_F(IconsetIconGeneratorTest, EmptyResultIsReportedAsNoIcon) {
  AddFavicon("favicon-512.png");

  EXPECT_FALSE(Generate());
  EXPECT_FALSE(std::filesystem::exists(icon_output_));
}

TEST_F(IconsetIconGeneratorTest, PlanningAnnouncesEveryStep) {
  AddFavicon("favicon-512.png");

  EXPECT_FALSE(Generate(true));

  EXPECT_EQ(0u, runner_.Invocations());
  EXPECT_FALSE(std::filesystem::exists(layout_.work_dir));
  const auto &announcements = planner_->Announcements();
  ASSERT_FALSE(announcements.empty());
  EXPECT_EQ("flatten " +
                (project_.root() / "webapp/public/favicon/favicon-512.png")
                    .string() +
                " -> " +
                (layout_.work_dir / "appicon_source_macos.png").string(),
            announcements.front());
  EXPECT_THAT(announcements, Not(Contains(HasSubstr("flatten-icon"))));
}

} // namespace
} // namespace bundler
