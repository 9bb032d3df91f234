#pragma once

#include <bundler/build_layout.h>
#include <bundler/dry_run_planner.h>
#include <bundler/interfaces.h>
#include <bundler/logging.h>
#include <bundler/models.h>
#include <bundler/stage_runner.h>
#include <bundler/tree_mirror.h>

#include <memory>

namespace bundler {

struct AssemblyReport {
  bool has_icon = false;
  bool signed_bundle = false;
  MirrorStats backend;
  MirrorStats frontend;
};

// Copies the resolved stage outputs into the bundle layout. Not
// transactional: a failure leaves whatever was already written.
class BundleAssembler {
public:
  BundleAssembler(const BuildConfig &config, const BuildLayout &layout,
                  FilesystemActions &actions, StageRunner &stage_runner,
                  IconGenerator *icon_generator,
                  std::shared_ptr<Logger> logger = nullptr);

  AssemblyReport Assemble();

  // Throws MissingArtifact for the first absent stage output. In planning
  // mode absent outputs are only reported.
  void RequireArtifacts() const;

private:
  bool BuildIcon();
  bool Sign();

  const BuildConfig *config_;
  const BuildLayout *layout_;
  FilesystemActions *actions_;
  StageRunner *stage_runner_;
  IconGenerator *icon_generator_;
  std::shared_ptr<Logger> logger_;
};

} // namespace bundler
