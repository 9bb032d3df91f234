#pragma once

#include <bundler/logging.h>
#include <bundler/models.h>

#include <filesystem>
#include <memory>
#include <string>

namespace bundler {

struct StalenessVerdict {
  bool stale = false;
  std::string reason;
};

// True when file exists and was modified strictly after the stamp. A missing
// file is never newer; a missing stamp makes every existing file newer.
bool FileNewerThan(const std::filesystem::path &file,
                   const std::filesystem::path &stamp);

// Same rule for any regular file below directory, scanned with an explicit
// stack and stopping at the first match.
bool TreeHasNewerThan(const std::filesystem::path &directory,
                      const std::filesystem::path &stamp);

class StalenessOracle {
public:
  explicit StalenessOracle(std::shared_ptr<Logger> logger = nullptr);

  StalenessVerdict Evaluate(const StageSpec &stage) const;
  bool IsStale(const StageSpec &stage) const {
    return Evaluate(stage).stale;
  }

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace bundler
