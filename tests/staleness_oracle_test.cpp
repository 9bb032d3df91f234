#include <bundler/models.h>
#include <bundler/staleness_oracle.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace bundler {
namespace {

using ::testing::HasSubstr;

class StalenessOracleTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.AddDirectory("webapp/dist");
    package_json_ = project_.AddFile("webapp/package.json", "{}");
    source_file_ = project_.AddFile("webapp/src/main.ts", "export {};\n");
    project_.SetModified(package_json_, 10);
    project_.SetModified(source_file_, 10);

    stage_.name = "frontend build";
    stage_.kind = StageKind::kFrontendBuild;
    stage_.output = project_.root() / "webapp/dist";
    stage_.stamp = project_.root() / "stamps/webapp_build.stamp";
    stage_.watched_files = {package_json_,
                            project_.root() / "webapp/package-lock.json"};
    stage_.watched_trees = {project_.root() / "webapp/src",
                            project_.root() / "webapp/public"};
  }

  void WriteStamp(int seconds) {
    project_.AddFile("stamps/webapp_build.stamp", "0\n");
    project_.SetModified(stage_.stamp, seconds);
  }

  test::TemporaryProject project_;
  std::filesystem::path package_json_;
  std::filesystem::path source_file_;
  StageSpec stage_;
  StalenessOracle oracle_;
};

TEST_F(StalenessOracleTest, ColdStartWithoutStampIsStale) {
  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_TRUE(verdict.stale);
  EXPECT_THAT(verdict.reason, HasSubstr("stamp missing"));
}

TEST_F(StalenessOracleTest, MissingOutputIsStale) {
  WriteStamp(20);
  std::filesystem::remove_all(stage_.output);

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_TRUE(verdict.stale);
  EXPECT_THAT(verdict.reason, HasSubstr("output missing"));
}

TEST_F(StalenessOracleTest, StampNewerThanEveryInputIsFresh) {
  WriteStamp(20);

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_FALSE(verdict.stale);
  EXPECT_EQ("up to date", verdict.reason);
  EXPECT_FALSE(oracle_.IsStale(stage_));
}

TEST_F(StalenessOracleTest, EqualTimestampsAreNotStale) {
  WriteStamp(10);

  EXPECT_FALSE(oracle_.IsStale(stage_));
}

TEST_F(StalenessOracleTest, NewerWatchedFileIsStale) {
  WriteStamp(20);
  project_.SetModified(package_json_, 21);

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_TRUE(verdict.stale);
  EXPECT_THAT(verdict.reason, HasSubstr("package.json"));
}

TEST_F(StalenessOracleTest, NewerFileDeepInWatchedTreeIsStale) {
  WriteStamp(20);
  const auto nested =
      project_.AddFile("webapp/src/components/ui/button.tsx", "x");
  project_.SetModified(nested, 30);

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_TRUE(verdict.stale);
  EXPECT_THAT(verdict.reason, HasSubstr("changed under"));
}

TEST_F(StalenessOracleTest, ForcedStageIsStaleEvenWhenFresh) {
  WriteStamp(20);
  stage_.forced = true;

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_TRUE(verdict.stale);
  EXPECT_EQ("forced", verdict.reason);
}

TEST_F(StalenessOracleTest, SkippedStageIsNeverStale) {
  stage_.skipped = true;
  stage_.forced = true;
  std::filesystem::remove_all(stage_.output);

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_FALSE(verdict.stale);
  EXPECT_EQ("skipped", verdict.reason);
}

TEST_F(StalenessOracleTest, MatchingParameterSnapshotIsFresh) {
  WriteStamp(20);
  const auto snapshot =
      project_.AddFile("stamps/webapp_build.env", "VITE_API_MODE=real\n");
  stage_.parameters = ParameterSnapshot{snapshot, "VITE_API_MODE=real\n"};

  EXPECT_FALSE(oracle_.IsStale(stage_));
}

TEST_F(StalenessOracleTest, ChangedParametersAreStale) {
  WriteStamp(20);
  const auto snapshot =
      project_.AddFile("stamps/webapp_build.env", "VITE_API_MODE=mock\n");
  stage_.parameters = ParameterSnapshot{snapshot, "VITE_API_MODE=real\n"};

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_TRUE(verdict.stale);
  EXPECT_EQ("build parameters changed", verdict.reason);
}

TEST_F(StalenessOracleTest, MissingParameterSnapshotIsStale) {
  WriteStamp(20);
  stage_.parameters = ParameterSnapshot{
      project_.root() / "stamps/webapp_build.env", "VITE_API_MODE=real\n"};

  const auto verdict = oracle_.Evaluate(stage_);

  EXPECT_TRUE(verdict.stale);
  EXPECT_THAT(verdict.reason, HasSubstr("parameter snapshot missing"));
}

TEST(FileNewerThanTest, MissingFileIsNeverNewer) {
  test::TemporaryProject project;
  const auto stamp = project.AddFile("build.stamp");

  EXPECT_FALSE(FileNewerThan(project.root() / "absent.lock", stamp));
}

TEST(FileNewerThanTest, MissingStampMakesExistingFilesNewer) {
  test::TemporaryProject project;
  const auto file = project.AddFile("package.json");

  EXPECT_TRUE(FileNewerThan(file, project.root() / "absent.stamp"));
  EXPECT_TRUE(TreeHasNewerThan(project.root(), project.root() / "absent.stamp"));
}

TEST(FileNewerThanTest, EmptyTreeHasNothingNewer) {
  test::TemporaryProject project;
  const auto stamp = project.AddFile("build.stamp");
  project.AddDirectory("src/empty/nested");

  EXPECT_FALSE(TreeHasNewerThan(project.root() / "src", stamp));
}

} // namespace
} // namespace bundler
