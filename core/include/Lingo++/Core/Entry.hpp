/**
 * @file Entry.hpp
 * @brief The value stored under one translation key.
 *
 * An entry is exactly one of three shapes: a plain string, a map of gender
 * tags to strings, or a map of plural categories to strings. The shape is
 * decided once, when the catalog is built from its source document.
 */

#pragma once

#include <variant> // std::variant

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Types.hpp>

namespace lingo::core {
  using namespace utils::types;

  /**
   * @brief Plural bucket selected from a count.
   *
   * This is an ordinal bucket, not a grammatical plural rule: exactly 0 is
   * None, exactly 1 is One, and everything else (negative counts included) is Many.
   */
  enum class PluralCategory : u8 {
    None,
    One,
    Many,
  };

  inline constexpr usize PLURAL_CATEGORY_COUNT = 3;

  /**
   * @brief Document key for each plural category, indexed by PluralCategory.
   */
  inline constexpr Array<StringView, PLURAL_CATEGORY_COUNT> PLURAL_CATEGORY_KEYS = { "none", "one", "many" };

  /**
   * @brief Selects the plural bucket for a count.
   */
  auto CategoryFor(i64 count) -> PluralCategory;

  /**
   * @brief Returns the document key ("none", "one", "many") of a category.
   */
  constexpr auto CategoryKey(const PluralCategory category) -> StringView {
    return PLURAL_CATEGORY_KEYS.at(static_cast<usize>(category));
  }

  /**
   * @brief Parses a document key into a plural category.
   * @return The category, or None if the key is not one of "none", "one", "many".
   */
  auto ParsePluralCategory(StringView key) -> Option<PluralCategory>;

  /**
   * @brief A single, unconditional string.
   */
  struct PlainText {
    String text;
  };

  /**
   * @brief Strings keyed by an open set of gender tags ("male", "female", ...).
   *
   * Tags are matched exactly and case-sensitively.
   */
  struct GenderedText {
    StringMap<String> variants;
  };

  /**
   * @brief Strings keyed by plural category. Absent categories stay empty.
   */
  struct PluralText {
    Array<Option<String>, PLURAL_CATEGORY_COUNT> variants;

    [[nodiscard]] auto get(const PluralCategory category) const -> const Option<String>& {
      return variants.at(static_cast<usize>(category));
    }
  };

  using Entry = std::variant<PlainText, GenderedText, PluralText>;

  enum class EntryShape : u8 {
    Plain,
    Gendered,
    Plural,
  };

  auto ShapeOf(const Entry& entry) -> EntryShape;

  /**
   * @brief Number of selectable strings in an entry (1 for plain text).
   */
  auto VariantCount(const Entry& entry) -> usize;

  /**
   * @brief Source value of an entry, as produced by a document parser.
   *
   * A bare string becomes PlainText. An object becomes PluralText when its keys
   * are a non-empty subset of {"none", "one", "many"}, and GenderedText otherwise.
   */
  using DocumentValue = std::variant<String, Map<String, String>>;

  /**
   * @brief Builds an entry from its document value.
   * @param key The translation key, used in error messages.
   * @param value The parsed document value.
   * @return The entry, or an InvalidEntry error for an object with no variants.
   */
  auto MakeEntry(StringView key, const DocumentValue& value) -> Result<Entry>;
} // namespace lingo::core
