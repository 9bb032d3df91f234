#pragma once

#include <bundler/models.h>

#include <string>

namespace bundler {

// Contents of Contents/PkgInfo.
extern const char *const kPackageTypeMarker;

// Info.plist with the fixed bundle keys. CFBundleIconFile is present only
// when has_icon is true.
std::string RenderInfoPlist(const BuildConfig &config, bool has_icon);

} // namespace bundler
