#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

namespace bundler {

struct MirrorStats {
  std::size_t copied = 0;
  std::size_t removed = 0;
  std::size_t unchanged = 0;
};

// Makes destination an exact copy of source. Destination entries that are
// absent from source, or of a different type, are deleted. Regular files are
// copied when size or modification time differ; symbolic links are recreated
// rather than followed. Top-level destination entries named in preserved are
// left alone, so a nested mirror can live inside another one.
MirrorStats MirrorTree(const std::filesystem::path &source,
                       const std::filesystem::path &destination,
                       const std::vector<std::filesystem::path> &preserved = {});

} // namespace bundler
