#include <bundler/models.h>

namespace bundler {

std::string ExitStatus::Describe() const {
  if (exited) {
    return "exit status " + std::to_string(code);
  }
  return "terminated by signal " + std::to_string(signal);
}

std::string StageKindName(StageKind kind) {
  switch (kind) {
  case StageKind::kFrontendDeps:
    return "frontend deps";
  case StageKind::kFrontendBuild:
    return "frontend build";
  case StageKind::kBackendDeps:
    return "backend deps";
  case StageKind::kBackendBuild:
    return "backend build";
  case StageKind::kWrapperBuild:
    return "swift build";
  }
  return "unknown";
}

} // namespace bundler
