#include <bundler/stage_catalog.h>

namespace bundler {
namespace {

bool HasFile(const std::filesystem::path &path) {
  std::error_code error;
  return std::filesystem::is_regular_file(path, error);
}

} // namespace

const char *const kFrontendBuildParameters =
    "VITE_API_MODE=real\nVITE_API_BASE_URL=\n";

StageSpec FrontendDepsStage(const BuildLayout &layout,
                            const BuildConfig &config) {
  StageSpec stage;
  stage.name = "frontend deps";
  stage.kind = StageKind::kFrontendDeps;
  stage.output = layout.webapp_dir / "node_modules";
  stage.stamp = layout.stamps_dir / "webapp_deps.stamp";
  stage.watched_files = {layout.webapp_dir / "package.json",
                         layout.webapp_dir / "package-lock.json"};
  stage.forced = config.force_frontend;
  stage.skipped = config.skip_frontend;
  return stage;
}

StageSpec FrontendBuildStage(const BuildLayout &layout,
                             const BuildConfig &config) {
  StageSpec stage;
  stage.name = "frontend build";
  stage.kind = StageKind::kFrontendBuild;
  stage.output = layout.webapp_dist;
  stage.stamp = layout.stamps_dir / "webapp_build.stamp";
  stage.parameters = ParameterSnapshot{layout.stamps_dir / "webapp_build.env",
                                       kFrontendBuildParameters};
  stage.watched_files = {layout.webapp_dir / "package.json",
                         layout.webapp_dir / "package-lock.json",
                         layout.webapp_dir / "index.html",
                         layout.webapp_dir / "vite.config.ts",
                         layout.webapp_dir / "vite.config.js",
                         layout.webapp_dir / "vite.config.mts",
                         layout.webapp_dir / "vite.config.mjs"};
  stage.watched_trees = {layout.webapp_dir / "src",
                         layout.webapp_dir / "public"};
  stage.forced = config.force_frontend;
  stage.skipped = config.skip_frontend;
  return stage;
}

StageSpec BackendDepsStage(const BuildLayout &layout,
                           const BuildConfig &config) {
  StageSpec stage;
  stage.name = "backend deps";
  stage.kind = StageKind::kBackendDeps;
  stage.output = layout.backend_dir / ".venv";
  stage.stamp = layout.stamps_dir / "backend_deps.stamp";
  stage.watched_files = {layout.backend_dir / "pyproject.toml",
                         layout.backend_dir / "uv.lock"};
  stage.forced = config.force_backend;
  stage.skipped = config.skip_backend;
  return stage;
}

StageSpec BackendBuildStage(const BuildLayout &layout,
                            const BuildConfig &config) {
  StageSpec stage;
  stage.name = "backend build";
  stage.kind = StageKind::kBackendBuild;
  stage.output = layout.backend_product;
  stage.stamp = layout.stamps_dir / "backend_build.stamp";
  // A dependency sync newer than the last build invalidates it.
  stage.watched_files = {layout.stamps_dir / "backend_deps.stamp",
                         layout.backend_dir / "macapp_entry.py"};
  stage.watched_trees = {layout.backend_dir / "app"};
  stage.forced = config.force_backend;
  stage.skipped = config.skip_backend;
  return stage;
}

StageSpec WrapperBuildStage(const BuildLayout &layout,
                            const BuildConfig &config) {
  StageSpec stage;
  stage.name = "swift build";
  stage.kind = StageKind::kWrapperBuild;
  stage.output = layout.wrapper_binary;
  stage.stamp = layout.stamps_dir / "wrapper_build.stamp";
  stage.watched_files = {layout.wrapper_dir / "Package.swift",
                         layout.wrapper_dir / "Package.resolved"};
  stage.watched_trees = {layout.wrapper_dir / "Sources"};
  stage.forced = config.force_swift;
  stage.skipped = config.skip_swift;
  return stage;
}

Command FrontendDepsCommand(const BuildLayout &layout) {
  Command command;
  command.program = "npm";
  command.cwd = layout.webapp_dir;
  const auto verb =
      HasFile(layout.webapp_dir / "package-lock.json") ? "ci" : "install";
  command.args = {verb, "--no-audit", "--fund=false"};
  return command;
}

Command FrontendBuildCommand(const BuildLayout &layout) {
  Command command;
  command.program = "npm";
  command.cwd = layout.webapp_dir;
  command.args = {"run", "build"};
  command.env = {{"VITE_API_MODE", "real"}, {"VITE_API_BASE_URL", ""}};
  return command;
}

Command BackendDepsCommand(const BuildLayout &layout) {
  Command command;
  command.program = "uv";
  command.cwd = layout.backend_dir;
  command.args = {"sync"};
  if (HasFile(layout.backend_dir / "uv.lock")) {
    command.args.push_back("--frozen");
  }
  return command;
}

Command BackendBuildCommand(const BuildLayout &layout) {
  Command command;
  command.program = "uv";
  command.cwd = layout.backend_dir;
  // The analysis cache is kept between runs (no --clean).
  command.args = {"run",
                  "--with",
                  "pyinstaller",
                  "--",
                  "pyinstaller",
                  "--noconfirm",
                  "--noupx",
                  "--log-level",
                  "ERROR",
                  "--name",
                  "backend_server",
                  "--distpath",
                  layout.backend_out.string(),
                  "--workpath",
                  (layout.work_dir / "backend_work").string(),
                  "--specpath",
                  (layout.work_dir / "backend_spec").string()};
  for (const auto *package : {"uvicorn", "fastapi", "starlette"}) {
    command.args.push_back("--collect-all");
    command.args.push_back(package);
  }
  for (const auto *module :
       {"tkinter", "matplotlib", "PyQt5", "PyQt6", "PySide2", "PySide6",
        "numpy.distutils", "setuptools", "distutils", "test", "unittest",
        "pytest"}) {
    command.args.push_back("--exclude-module");
    command.args.push_back(module);
  }
  command.args.push_back("macapp_entry.py");
  return command;
}

Command WrapperBuildCommand(const BuildLayout &layout) {
  Command command;
  command.program = "swift";
  command.cwd = layout.wrapper_dir;
  command.args = {"build", "-c", "release", "--disable-sandbox"};
  command.env = {{"HOME", layout.swift_home.string()}};
  return command;
}

Finalization FinalizationFor(const StageSpec &stage) {
  if (stage.parameters) {
    return SnapshotAndStamp{*stage.parameters, stage.stamp};
  }
  return StampOnly{stage.stamp};
}

std::vector<RequiredTool> RequiredTools(const BuildConfig &config) {
  std::vector<RequiredTool> tools;
  if (!config.skip_frontend) {
    tools.push_back({"npm", "brew install node"});
    tools.push_back({"node", "brew install node"});
  }
  if (!config.skip_backend) {
    tools.push_back({"uv", "brew install uv"});
  }
  if (!config.skip_swift) {
    tools.push_back({"swift", "Xcode command line tools"});
  }
  if (!config.codesign_identity.empty()) {
    tools.push_back({"codesign", "Xcode command line tools"});
  }
  return tools;
}

std::vector<std::string> OptionalTools() { return {"sips", "iconutil"}; }

} // namespace bundler
