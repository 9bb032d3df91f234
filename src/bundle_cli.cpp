#include <bundler/bundle_cli.h>

#include <bundler/build_layout.h>
#include <bundler/build_orchestrator.h>
#include <bundler/icon_flattener.h>
#include <bundler/logging.h>
#include <bundler/posix_command_runner.h>

#include <iostream>
#include <stdexcept>

namespace bundler {
namespace {

constexpr const char *kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";

} // namespace

void PrintUsage() {
  std::cout
      << "Usage: bundle-app [options]\n"
      << "       bundle-app flatten-icon <input.png> <output.png>\n\n"
      << "Builds dist/<App>.app from webapp/, backend/ and macos-app/,\n"
      << "rebuilding only the stages whose inputs changed.\n\n"
      << "Options:\n"
      << "  --root <path>      Project root (default: search upwards from\n"
      << "                     the working directory)\n"
      << "  --config <file>    Optional YAML config file\n"
      << "  --clean            Remove .mac_build and the bundle first\n"
      << "  --dry-run          Print the plan without executing anything\n"
      << "  --verbose          Debug logging\n"
      << "  --dev              Frontend-only update (skips backend, Swift\n"
      << "                     and codesign)\n"
      << "  --force-frontend   Rebuild the frontend\n"
      << "  --force-backend    Rebuild the backend\n"
      << "  --force-swift      Rebuild the Swift wrapper\n"
      << "  --skip-frontend    Skip frontend stages\n"
      << "  --skip-backend     Skip backend stages\n"
      << "  --skip-swift       Skip the Swift wrapper build\n"
      << "  --help             Show this message\n\n"
      << "Environment:\n"
      << "  APP_NAME, BUNDLE_ID, APP_VERSION, BUILD_NUMBER, CODESIGN_IDENTITY\n"
      << "  CLEAN, FORCE_FRONTEND, FORCE_BACKEND, FORCE_SWIFT, SKIP_FRONTEND,\n"
      << "  SKIP_BACKEND, SKIP_SWIFT, DEV_MODE, VERBOSE, DRY_RUN (1/true/yes/"
         "on)\n";
}

int RunBuild(const std::vector<std::string> &arguments,
             const EnvironmentLookup &lookup,
             const std::filesystem::path &working_directory) {
  const auto cli_options = ParseBuildArguments(arguments);
  if (cli_options.show_help) {
    PrintUsage();
    return 0;
  }

  const auto options = LayerOptions(cli_options, lookup);
  const auto config = ResolveBuildConfig(options);
  auto logger =
      MakeLogger(BuildLoggingConfig(options, IsTerminal(std::cout)), std::cout);

  const auto root = ResolveProjectRoot(options.root, working_directory);
  const auto layout = MakeBuildLayout(root, config);
  PosixCommandRunner runner(lookup("PATH").value_or(kDefaultSearchPath),
                            logger);

  BuildOrchestrator orchestrator(config, layout, runner, logger);
  orchestrator.Run();
  return 0;
}

int RunFlattenIcon(const std::vector<std::string> &arguments) {
  if (arguments.size() != 2) {
    throw std::invalid_argument(
        "Usage: bundle-app flatten-icon <input.png> <output.png>");
  }
  FlattenIconFile(arguments[0], arguments[1]);
  return 0;
}

} // namespace bundler
