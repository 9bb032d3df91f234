#include <bundler/bundle_metadata.h>

#include <bundler/escaping.h>

#include <sstream>

namespace bundler {

const char *const kPackageTypeMarker = "APPL";

std::string RenderInfoPlist(const BuildConfig &config, bool has_icon) {
  const auto name = XmlEscape(config.app_name);
  std::ostringstream plist;
  plist << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
        << "<plist version=\"1.0\">\n"
        << "<dict>\n"
        << "  <key>CFBundleName</key>\n"
        << "  <string>" << name << "</string>\n"
        << "  <key>CFBundleDisplayName</key>\n"
        << "  <string>" << name << "</string>\n"
        << "  <key>CFBundleIdentifier</key>\n"
        << "  <string>" << XmlEscape(config.bundle_id) << "</string>\n"
        << "  <key>CFBundleExecutable</key>\n"
        << "  <string>" << name << "</string>\n"
        << "  <key>CFBundlePackageType</key>\n"
        << "  <string>" << kPackageTypeMarker << "</string>\n"
        << "  <key>CFBundleShortVersionString</key>\n"
        << "  <string>" << XmlEscape(config.app_version) << "</string>\n"
        << "  <key>CFBundleVersion</key>\n"
        << "  <string>" << XmlEscape(config.build_number) << "</string>\n";
  if (has_icon) {
    plist << "  <key>CFBundleIconFile</key>\n"
          << "  <string>appicon</string>\n";
  }
  plist << "  <key>NSPrincipalClass</key>\n"
        << "  <string>NSApplication</string>\n"
        << "  <key>NSHighResolutionCapable</key>\n"
        << "  <true/>\n"
        << "  <key>NSAppTransportSecurity</key>\n"
        << "  <dict>\n"
        << "    <key>NSAllowsLocalNetworking</key>\n"
        << "    <true/>\n"
        << "  </dict>\n"
        << "</dict>\n"
        << "</plist>\n";
  return plist.str();
}

} // namespace bundler
