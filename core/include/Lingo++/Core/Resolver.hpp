/**
 * @file Resolver.hpp
 * @brief Turns (catalogs, key, mode, arguments) into a display string.
 *
 * Resolution tries the primary catalog first and, on any failure, retries the
 * whole lookup against the fallback catalog. Variants are never mixed across
 * catalogs: if the primary has the key but not the requested plural category
 * or gender, the fallback's entry is used as a whole. When both fail, the
 * result is MISSING_TEXT with the missing flag set. Nothing here throws or logs.
 */

#pragma once

#include <variant> // std::variant

#include <Lingo++/Core/Catalog.hpp>
#include <Lingo++/Core/Entry.hpp>
#include <Lingo++/Core/Placeholder.hpp>

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Types.hpp>

namespace lingo::core {
  /**
   * @brief Text rendered in place of a translation that could not be resolved.
   */
  inline constexpr StringView MISSING_TEXT = "Error missing text";

  /**
   * @brief Selects a plain entry.
   */
  struct PlainSelector {};

  /**
   * @brief Selects a plural entry's bucket. The count is also injected as the
   * first positional argument.
   */
  struct PluralSelector {
    i64 count;
  };

  /**
   * @brief Selects a gendered entry's variant by exact, case-sensitive tag.
   */
  struct GenderSelector {
    String gender;
  };

  using Selector = std::variant<PlainSelector, PluralSelector, GenderSelector>;

  /**
   * @brief The entry shape a selector requires.
   */
  auto ExpectedShape(const Selector& selector) -> EntryShape;

  /**
   * @struct Query
   * @brief One lookup request.
   */
  struct Query {
    String            key;      ///< Translation key.
    Selector          selector; ///< Which shape and variant to select.
    Option<Arguments> args;     ///< Placeholder values; None skips substitution (plural still injects its count).
  };

  /**
   * @brief Where a resolved string came from.
   */
  enum class ResolutionSource : u8 {
    Primary,
    Fallback,
    Missing,
  };

  /**
   * @struct Resolution
   * @brief Result of resolving a query against a primary and fallback catalog.
   */
  struct Resolution {
    String                            text;         ///< The rendered string, or MISSING_TEXT.
    bool                              missing;      ///< True when neither catalog could resolve the query.
    ResolutionSource                  source;       ///< Which catalog produced the text.
    Option<utils::error::LingoError>  primaryError; ///< Why the primary catalog failed, if it did.
  };

  /**
   * @brief Selects the variant of an entry required by a selector.
   *
   * Does not substitute placeholders.
   *
   * @return The selected template, ShapeMismatch if the entry has the wrong
   * shape, or MissingVariant if the category or gender is absent.
   */
  auto SelectVariant(const Entry& entry, const Selector& selector) -> Result<StringView>;

  /**
   * @brief Resolves a query against a single catalog.
   * @param catalog The catalog, or nullptr when none is loaded (CatalogAbsent).
   * @param query The request.
   * @return The rendered string, or the lookup failure (CatalogAbsent, KeyAbsent,
   * ShapeMismatch, MissingVariant).
   */
  auto Lookup(const Catalog* catalog, const Query& query) -> Result<String>;

  /**
   * @brief Resolves a query with fallback.
   *
   * The fallback is consulted only when the primary fails and is a different
   * catalog. A fallback success is not reported as missing.
   *
   * @param primary Current-language catalog, or nullptr.
   * @param fallback Fallback-language catalog, or nullptr.
   * @param query The request.
   */
  auto Resolve(const Catalog* primary, const Catalog* fallback, const Query& query) -> Resolution;
} // namespace lingo::core
