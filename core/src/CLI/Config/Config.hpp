#pragma once

#include <filesystem> // std::filesystem::path

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Logging.hpp>
#include <Lingo++/Utils/Types.hpp>

namespace lingo::config {
  /**
   * @struct General
   * @brief The `[general]` table of lingo.toml.
   */
  struct General {
    utils::types::Option<utils::types::String>      language;                 ///< Current language; detected from the environment when unset.
    utils::types::String                            fallbackLanguage = "en";  ///< Language consulted when the current one has no translation.
    utils::types::String                            messagesDir = "messages"; ///< Root of the `<language>/<file>.json` tree.
    utils::types::Option<utils::logging::LogLevel> logLevel;                  ///< Runtime log level; unchanged when unset.

    /**
     * @brief The configured language, or the system language when none is set.
     */
    [[nodiscard]] auto getLanguage() const -> utils::types::String;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General                                           general;
    utils::types::Option<std::filesystem::path>       sourcePath; ///< File the settings were read from, if any.

    /**
     * @brief Paths searched for lingo.toml, most preferred first.
     */
    static auto getCandidatePaths() -> utils::types::Vec<std::filesystem::path>;

    /**
     * @brief The first candidate path that exists, or None.
     */
    static auto getConfigPath() -> utils::types::Option<std::filesystem::path>;

    /**
     * @brief Parses lingo.toml contents. Unknown tables and keys are ignored.
     * @return ParseError for malformed TOML; ConfigurationError for an unknown log level.
     */
    static auto fromToml(utils::types::StringView toml) -> utils::types::Result<Config>;

    /**
     * @brief Loads the configuration from disk and applies LINGO_LANG.
     *
     * A missing file yields the defaults. A file that fails to parse is logged
     * and also yields the defaults.
     */
    static auto getInstance() -> Config;

    /**
     * @brief Applies environment overrides (LINGO_LANG).
     */
    auto applyEnvironment() -> utils::types::Unit;
  };
} // namespace lingo::config
