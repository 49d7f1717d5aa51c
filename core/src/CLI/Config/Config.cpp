#include "Config.hpp"

#include <glaze/toml.hpp>
#include <magic_enum/magic_enum.hpp>
#include <system_error> // std::error_code

#include <Lingo++/Services/Locale.hpp>

#include <Lingo++/Utils/Env.hpp>

namespace fs = std::filesystem;

using namespace lingo::utils::types;
using enum lingo::utils::error::LingoErrorCode;
using lingo::utils::env::GetEnv;
using lingo::utils::env::GetNonEmptyEnv;
using lingo::utils::logging::LogLevel;

// glaze's TOML reader has no std::optional support, so empty strings mean "not provided".
namespace {
  struct TomlGeneral {
    String language;
    String fallbackLanguage;
    String messagesDir;
    String logLevel;
  };

  struct TomlConfig {
    TomlGeneral general;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlGeneral> {
  using T                     = TomlGeneral;
  static constexpr auto value = object(
    "language",
    &T::language,
    "fallback_language",
    &T::fallbackLanguage,
    "messages_dir",
    &T::messagesDir,
    "log_level",
    &T::logLevel
  );
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("general", &T::general);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace lingo::config {
  auto General::getLanguage() const -> String {
    return language ? *language : services::locale::GetSystemLanguage();
  }

  auto Config::getCandidatePaths() -> Vec<fs::path> {
    Vec<fs::path> possiblePaths;

#ifdef _WIN32
    if (Result<String> result = GetEnv("LOCALAPPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "lingo" / "lingo.toml");

    if (Result<String> result = GetEnv("USERPROFILE"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "lingo" / "lingo.toml");
#else
    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "lingo" / "lingo.toml");

    if (Result<String> result = GetEnv("HOME")) {
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "lingo" / "lingo.toml");
      possiblePaths.emplace_back(fs::path(*result) / ".lingo" / "lingo.toml");
    }
#endif

    possiblePaths.emplace_back(fs::path(".") / "lingo.toml");

    return possiblePaths;
  }

  auto Config::getConfigPath() -> Option<fs::path> {
    for (const fs::path& path : getCandidatePaths())
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return None;
  }

  auto Config::fromToml(const StringView toml) -> Result<Config> {
    TomlConfig tomlCfg;
    String     buffer(toml);

    if (buffer.find_first_not_of(" \t\r\n") == String::npos)
      return Config {};

    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer))
      ERR_FMT(ParseError, "Failed to parse config: {}", glz::format_error(readError, buffer));

    Config cfg;

    if (!tomlCfg.general.language.empty())
      cfg.general.language = tomlCfg.general.language;

    if (!tomlCfg.general.fallbackLanguage.empty())
      cfg.general.fallbackLanguage = tomlCfg.general.fallbackLanguage;

    if (!tomlCfg.general.messagesDir.empty())
      cfg.general.messagesDir = tomlCfg.general.messagesDir;

    if (!tomlCfg.general.logLevel.empty()) {
      const Option<LogLevel> level = magic_enum::enum_cast<LogLevel>(tomlCfg.general.logLevel, magic_enum::case_insensitive);

      if (!level)
        ERR_FMT(ConfigurationError, "Unknown log level '{}'", tomlCfg.general.logLevel);

      cfg.general.logLevel = level;
    }

    return cfg;
  }

  auto Config::applyEnvironment() -> Unit {
    if (Option<String> language = GetNonEmptyEnv("LINGO_LANG")) {
      debug_log("Language overridden by LINGO_LANG: {}", *language);
      general.language = std::move(language);
    }
  }

  auto Config::getInstance() -> Config {
    Config cfg;

    if (const Option<fs::path> configPath = getConfigPath()) {
      String buffer;

      if (const auto fileError = glz::file_to_buffer(buffer, configPath->string()); bool(fileError))
        error_log("Failed to read config file: {}", configPath->string());
      else if (Result<Config> parsed = fromToml(buffer)) {
        cfg            = std::move(*parsed);
        cfg.sourcePath = configPath;
        debug_log("Config loaded from {}", configPath->string());
      } else
        error_at(parsed.error());
    } else
      debug_log("No lingo.toml found, using defaults");

    cfg.applyEnvironment();

    return cfg;
  }
} // namespace lingo::config
