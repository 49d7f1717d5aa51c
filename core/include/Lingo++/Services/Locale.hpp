/**
 * @file Locale.hpp
 * @brief Locale string helpers and system language detection.
 */

#pragma once

#include <Lingo++/Utils/Types.hpp>

namespace lingo::services::locale {
  using namespace utils::types;

  /**
   * @brief Extracts the language subtag from a POSIX locale string.
   *
   * Strips the codeset and modifier, then the region: "en_US.UTF-8" -> "en",
   * "pt-BR" -> "pt", "de" -> "de".
   *
   * @param locale The locale string.
   * @return The language code. Empty if `locale` is empty.
   */
  auto ExtractLanguageCode(StringView locale) -> String;

  /**
   * @brief Detects the user's language from the environment.
   *
   * Checks LC_ALL, LC_MESSAGES and LANG in that order, skipping unset and empty
   * variables as well as the "C" and "POSIX" locales.
   *
   * @return The detected language code, or "en".
   */
  auto GetSystemLanguage() -> String;

  /**
   * @brief Checks the shape of a language folder name.
   *
   * Accepts a 2-3 letter lowercase language subtag, optionally followed by `-`
   * or `_` and either a 2-letter uppercase region, a 3-digit region or a
   * 4-letter script ("en", "pt_BR", "es-419", "zh-Hant").
   */
  auto IsWellFormedLocaleTag(StringView tag) -> bool;
} // namespace lingo::services::locale
