#include <bundler/build_options.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace bundler {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

struct StringField {
  const char *key;
  const char *variable;
  std::optional<std::string> BuildOptions::*member;
};

struct BoolField {
  const char *key;
  const char *variable;
  const char *flag;
  std::optional<bool> BuildOptions::*member;
};

const StringField kStringFields[] = {
    {"app_name", "APP_NAME", &BuildOptions::app_name},
    {"bundle_id", "BUNDLE_ID", &BuildOptions::bundle_id},
    {"app_version", "APP_VERSION", &BuildOptions::app_version},
    {"build_number", "BUILD_NUMBER", &BuildOptions::build_number},
    {"codesign_identity", "CODESIGN_IDENTITY",
     &BuildOptions::codesign_identity},
};

const BoolField kBoolFields[] = {
    {"clean", "CLEAN", "--clean", &BuildOptions::clean},
    {"force_frontend", "FORCE_FRONTEND", "--force-frontend",
     &BuildOptions::force_frontend},
    {"force_backend", "FORCE_BACKEND", "--force-backend",
     &BuildOptions::force_backend},
    {"force_swift", "FORCE_SWIFT", "--force-swift",
     &BuildOptions::force_swift},
    {"skip_frontend", "SKIP_FRONTEND", "--skip-frontend",
     &BuildOptions::skip_frontend},
    {"skip_backend", "SKIP_BACKEND", "--skip-backend",
     &BuildOptions::skip_backend},
    {"skip_swift", "SKIP_SWIFT", "--skip-swift", &BuildOptions::skip_swift},
    {"dev_mode", "DEV_MODE", "--dev", &BuildOptions::dev_mode},
    {"verbose", "VERBOSE", "--verbose", &BuildOptions::verbose},
    {"dry_run", "DRY_RUN", "--dry-run", &BuildOptions::dry_run},
};

using ConfigValue = std::variant<std::string, bool>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"name", "app_name"},
      {"version", "app_version"},
      {"identity", "codesign_identity"},
      {"dev", "dev_mode"},
      {"project_root", "root"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (node.IsNull()) {
    return "";
  }
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

bool IsBoolKey(const std::string &key) {
  return std::any_of(std::begin(kBoolFields), std::end(kBoolFields),
                     [&](const BoolField &field) { return key == field.key; });
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (IsBoolKey(key)) {
    return ConfigValue{ExtractBool(node, key)};
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, BuildOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "root") {
      options.root = std::get<std::string>(value);
      continue;
    }
    if (key == "log_format") {
      options.log_format = ParseLogFormat(std::get<std::string>(value));
      continue;
    }
    const auto string_field =
        std::find_if(std::begin(kStringFields), std::end(kStringFields),
                     [&](const StringField &field) { return key == field.key; });
    if (string_field != std::end(kStringFields)) {
      options.*(string_field->member) = std::get<std::string>(value);
      continue;
    }
    const auto bool_field =
        std::find_if(std::begin(kBoolFields), std::end(kBoolFields),
                     [&](const BoolField &field) { return key == field.key; });
    if (bool_field != std::end(kBoolFields)) {
      options.*(bool_field->member) = std::get<bool>(value);
      continue;
    }
    ThrowUnknownKey(key);
  }
}

} // namespace

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = [] {
    std::vector<std::string> supported = {"root", "log_format"};
    for (const auto &field : kStringFields) {
      supported.emplace_back(field.key);
    }
    for (const auto &field : kBoolFields) {
      supported.emplace_back(field.key);
    }
    return supported;
  }();
  return keys;
}

EnvironmentLookup ProcessEnvironment() {
  return [](const std::string &name) -> std::optional<std::string> {
    if (const char *value = std::getenv(name.c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  };
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

LogFormat ParseLogFormat(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "console" || normalized == "text") {
    return LogFormat::kConsole;
  }
  if (normalized == "structured") {
    return LogFormat::kStructured;
  }
  throw std::invalid_argument("Unknown log format: " + value);
}

BuildOptions ParseBuildArguments(const std::vector<std::string> &arguments) {
  BuildOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--root") {
      options.root = RequireValue(arguments, i, "--root");
      continue;
    }
    if (argument == "--config") {
      options.config_file = RequireValue(arguments, i, "--config");
      continue;
    }
    const auto bool_field =
        std::find_if(std::begin(kBoolFields), std::end(kBoolFields),
                     [&](const BoolField &field) {
                       return argument == field.flag;
                     });
    if (bool_field != std::end(kBoolFields)) {
      options.*(bool_field->member) = true;
      continue;
    }
    throw std::invalid_argument("Unknown argument: " + argument);
  }
  return options;
}

BuildOptions OptionsFromEnvironment(const EnvironmentLookup &lookup) {
  BuildOptions options;
  for (const auto &field : kStringFields) {
    if (auto value = lookup(field.variable)) {
      options.*(field.member) = std::move(*value);
    }
  }
  for (const auto &field : kBoolFields) {
    if (const auto value = lookup(field.variable)) {
      options.*(field.member) = ParseBool(*value);
    }
  }
  return options;
}

BuildOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  BuildOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

BuildOptions MergeOptions(const BuildOptions &base,
                          const BuildOptions &overlay) {
  BuildOptions merged = base;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, overlay.root);
  override_value(merged.config_file, overlay.config_file);
  override_value(merged.log_format, overlay.log_format);
  for (const auto &field : kStringFields) {
    override_value(merged.*(field.member), overlay.*(field.member));
  }
  for (const auto &field : kBoolFields) {
    override_value(merged.*(field.member), overlay.*(field.member));
  }
  merged.show_help = base.show_help || overlay.show_help;
  return merged;
}

BuildOptions LayerOptions(const BuildOptions &cli_options,
                          const EnvironmentLookup &lookup) {
  BuildOptions file_options;
  if (cli_options.config_file) {
    file_options = ParseConfigFile(*cli_options.config_file);
  }
  const auto with_environment =
      MergeOptions(file_options, OptionsFromEnvironment(lookup));
  return MergeOptions(with_environment, cli_options);
}

BuildConfig ResolveBuildConfig(const BuildOptions &options) {
  BuildConfig config;
  config.app_name = options.app_name.value_or(config.app_name);
  config.bundle_id = options.bundle_id.value_or(config.bundle_id);
  config.app_version = options.app_version.value_or(config.app_version);
  config.build_number = options.build_number.value_or(config.build_number);
  config.codesign_identity = Trim(options.codesign_identity.value_or(""));

  config.clean = options.clean.value_or(false);
  config.force_frontend = options.force_frontend.value_or(false);
  config.force_backend = options.force_backend.value_or(false);
  config.force_swift = options.force_swift.value_or(false);
  config.skip_frontend = options.skip_frontend.value_or(false);
  config.skip_backend = options.skip_backend.value_or(false);
  config.skip_swift = options.skip_swift.value_or(false);
  config.dev_mode = options.dev_mode.value_or(false);
  config.verbose = options.verbose.value_or(false);
  config.dry_run = options.dry_run.value_or(false);

  if (config.dev_mode) {
    config.skip_backend = true;
    config.skip_swift = true;
    config.codesign_identity.clear();
  }

  if (config.app_name.empty() ||
      config.app_name.find('/') != std::string::npos) {
    throw std::invalid_argument("Invalid app name: '" + config.app_name + "'");
  }
  return config;
}

LoggingConfig BuildLoggingConfig(const BuildOptions &options, bool color) {
  LoggingConfig logging;
  logging.level = options.verbose.value_or(false) ? LogLevel::kDebug
                                                  : LogLevel::kInfo;
  logging.format = options.log_format.value_or(LogFormat::kConsole);
  logging.color = color && logging.format == LogFormat::kConsole;
  return logging;
}

} // namespace bundler
