#include <bundler/build_options.h>

#include <map>
#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace bundler {
namespace {

using ::testing::HasSubstr;

EnvironmentLookup FakeEnvironment(std::map<std::string, std::string> values) {
  return [values = std::move(values)](
             const std::string &name) -> std::optional<std::string> {
    const auto found = values.find(name);
    if (found == values.end()) {
      return std::nullopt;
    }
    return found->second;
  };
}

TEST(ParseBuildArgumentsTest, ParsesFlags) {
  const auto options = ParseBuildArguments(
      {"--root", "/work/budget", "--config", "bundle.yaml", "--clean",
       "--dry-run", "--verbose", "--dev", "--force-frontend",
       "--force-backend", "--force-swift", "--skip-frontend",
       "--skip-backend", "--skip-swift"});

  ASSERT_TRUE(options.root.has_value());
  EXPECT_EQ(std::filesystem::path("/work/budget"), *options.root);
  ASSERT_TRUE(options.config_file.has_value());
  EXPECT_EQ(std::filesystem::path("bundle.yaml"), *options.config_file);
  EXPECT_EQ(std::optional<bool>(true), options.clean);
  EXPECT_EQ(std::optional<bool>(true), options.dry_run);
  EXPECT_EQ(std::optional<bool>(true), options.verbose);
  EXPECT_EQ(std::optional<bool>(true), options.dev_mode);
  EXPECT_EQ(std::optional<bool>(true), options.force_frontend);
  EXPECT_EQ(std::optional<bool>(true), options.force_backend);
  EXPECT_EQ(std::optional<bool>(true), options.force_swift);
  EXPECT_EQ(std::optional<bool>(true), options.skip_frontend);
  EXPECT_EQ(std::optional<bool>(true), options.skip_backend);
  EXPECT_EQ(std::optional<bool>(true), options.skip_swift);
  EXPECT_FALSE(options.show_help);
}

TEST(ParseBuildArgumentsTest, RejectsMissingValuesAndUnknownFlags) {
  EXPECT_THROW(ParseBuildArguments({"--root"}), std::invalid_argument);
  EXPECT_THROW(ParseBuildArguments({"--config"}), std::invalid_argument);
  EXPECT_THROW(ParseBuildArguments({"--frobnicate"}), std::invalid_argument);
}

TEST(ParseBuildArgumentsTest, HelpStopsParsing) {
  const auto options = ParseBuildArguments({"--help", "--frobnicate"});

  EXPECT_TRUE(options.show_help);
}

TEST(OptionsFromEnvironmentTest, ReadsStringsAndBooleans) {
  const auto options = OptionsFromEnvironment(
      FakeEnvironment({{"APP_NAME", "Widget"},
                       {"BUNDLE_ID", "com.x.widget"},
                       {"APP_VERSION", "2.3.0"},
                       {"BUILD_NUMBER", "7"},
                       {"CLEAN", "1"},
                       {"FORCE_BACKEND", "TRUE"},
                       {"SKIP_SWIFT", "yes"},
                       {"DRY_RUN", "On"},
                       {"VERBOSE", "0"},
                       {"DEV_MODE", "nope"}}));

  EXPECT_EQ(std::optional<std::string>("Widget"), options.app_name);
  EXPECT_EQ(std::optional<std::string>("com.x.widget"), options.bundle_id);
  EXPECT_EQ(std::optional<std::string>("2.3.0"), options.app_version);
  EXPECT_EQ(std::optional<std::string>("7"), options.build_number);
  EXPECT_EQ(std::optional<bool>(true), options.clean);
  EXPECT_EQ(std::optional<bool>(true), options.force_backend);
  EXPECT_EQ(std::optional<bool>(true), options.skip_swift);
  EXPECT_EQ(std::optional<bool>(true), options.dry_run);
  EXPECT_EQ(std::optional<bool>(false), options.verbose);
  EXPECT_EQ(std::optional<bool>(false), options.dev_mode);
  EXPECT_FALSE(options.force_frontend.has_value());
  EXPECT_FALSE(options.codesign_identity.has_value());
}

TEST(ResolveBuildConfigTest, AppliesDefaults) {
  const auto config = ResolveBuildConfig(BuildOptions{});

  EXPECT_EQ("Budget", config.app_name);
  EXPECT_EQ("com.budget.app", config.bundle_id);
  EXPECT_EQ("0.1.0", config.app_version);
  EXPECT_EQ("1", config.build_number);
  EXPECT_TRUE(config.codesign_identity.empty());
  EXPECT_FALSE(config.clean);
  EXPECT_FALSE(config.dry_run);
  EXPECT_FALSE(config.skip_backend);
}

TEST(ResolveBuildConfigTest, DevModeSkipsBackendWrapperAndSigning) {
  BuildOptions options;
  options.dev_mode = true;
  options.codesign_identity = "Developer ID Application: Example";

  const auto config = ResolveBuildConfig(options);

  EXPECT_TRUE(config.dev_mode);
  EXPECT_TRUE(config.skip_backend);
  EXPECT_TRUE(config.skip_swift);
  EXPECT_FALSE(config.skip_frontend);
  EXPECT_TRUE(config.codesign_identity.empty());
}

TEST(ResolveBuildConfigTest, TrimsSigningIdentity) {
  BuildOptions options;
  options.codesign_identity = "  Team ID  ";
  EXPECT_EQ("Team ID", ResolveBuildConfig(options).codesign_identity);

  options.codesign_identity = "   ";
  EXPECT_TRUE(ResolveBuildConfig(options).codesign_identity.empty());
}

TEST(ResolveBuildConfigTest, RejectsAppNamesThatAreNotPathComponents) {
  BuildOptions options;
  options.app_name = "";
  EXPECT_THROW(ResolveBuildConfig(options), std::invalid_argument);

  options.app_name = "a/b";
  EXPECT_THROW(ResolveBuildConfig(options), std::invalid_argument);
}

TEST(ParseConfigFileTest, ReadsYamlKeys) {
  test::TemporaryProject project;
  const auto path = project.AddFile("bundle.yaml", "app_name: Widget\n"
                                                   "bundle-id: com.x.widget\n"
                                                   "root: /work/budget\n"
                                                   "clean: yes\n"
                                                   "skip_swift: false\n"
                                                   "log_format: structured\n");

  const auto options = ParseConfigFile(path);

  EXPECT_EQ(std::optional<std::string>("Widget"), options.app_name);
  EXPECT_EQ(std::optional<std::string>("com.x.widget"), options.bundle_id);
  ASSERT_TRUE(options.root.has_value());
  EXPECT_EQ(std::filesystem::path("/work/budget"), *options.root);
  EXPECT_EQ(std::optional<bool>(true), options.clean);
  EXPECT_EQ(std::optional<bool>(false), options.skip_swift);
  ASSERT_TRUE(options.log_format.has_value());
  EXPECT_EQ(LogFormat::kStructured, *options.log_format);
}

TEST(ParseConfigFileTest, RejectsUnknownKeys) {
  test::TemporaryProject project;
  const auto path = project.AddFile("bundle.yaml", "app_nmae: Widget\n");

  try {
    ParseConfigFile(path);
    FAIL() << "Expected invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown config key: app_nmae"));
    EXPECT_THAT(error.what(), HasSubstr("Supported keys: root, log_format"));
  }
}

TEST(ParseConfigFileTest, RejectsMissingAndNonYamlFiles) {
  test::TemporaryProject project;
  const auto json = project.AddFile("bundle.json", "{}");

  EXPECT_THROW(ParseConfigFile(project.root() / "absent.yaml"),
               std::runtime_error);
  EXPECT_THROW(ParseConfigFile(json), std::invalid_argument);
}

TEST(LayerOptionsTest, FlagsBeatEnvironmentWhichBeatsConfigFile) {
  test::TemporaryProject project;
  const auto path = project.AddFile("bundle.yaml", "app_name: FromYaml\n"
                                                   "app_version: 9.9.9\n"
                                                   "clean: true\n"
                                                   "dry_run: false\n"
                                                   "verbose: false\n");
  const auto cli_options =
      ParseBuildArguments({"--config", path.string(), "--verbose"});

  const auto layered = LayerOptions(
      cli_options, FakeEnvironment({{"APP_NAME", "FromEnv"},
                                    {"DRY_RUN", "1"},
                                    {"VERBOSE", "0"}}));
  const auto config = ResolveBuildConfig(layered);

  EXPECT_EQ("FromEnv", config.app_name);
  EXPECT_EQ("9.9.9", config.app_version);
  EXPECT_TRUE(config.clean);
  EXPECT_TRUE(config.dry_run);
  EXPECT_TRUE(config.verbose);
}

TEST(BuildLoggingConfigTest, VerboseSelectsDebugAndColorNeedsConsole) {
  BuildOptions options;
  options.verbose = true;

  const auto console = BuildLoggingConfig(options, true);
  EXPECT_EQ(LogLevel::kDebug, console.level);
  EXPECT_TRUE(console.color);

  options.verbose = false;
  options.log_format = LogFormat::kStructured;
  const auto structured = BuildLoggingConfig(options, true);
  EXPECT_EQ(LogLevel::kInfo, structured.level);
  EXPECT_FALSE(structured.color);
}

TEST(ParseBoolTest, AcceptsCommonSpellings) {
  for (const auto *value : {"1", "true", "TRUE", "yes", "Yes", "on", " on "}) {
    EXPECT_TRUE(ParseBool(value)) << value;
  }
  for (const auto *value : {"0", "false", "no", "off", "", "2"}) {
    EXPECT_FALSE(ParseBool(value)) << value;
  }
}

} // namespace
} // namespace bundler
