#include <algorithm>   // std::ranges::all_of
#include <matchit.hpp> // matchit::{match, is, _}, matchit::impl::Overload

#include <Lingo++/Core/Entry.hpp>

#include <Lingo++/Utils/Error.hpp>

using enum lingo::utils::error::LingoErrorCode;

namespace lingo::core {
  auto CategoryFor(const i64 count) -> PluralCategory {
    using matchit::match, matchit::is, matchit::_;

    return match(count)(
      is | 0 = PluralCategory::None,
      is | 1 = PluralCategory::One,
      is | _ = PluralCategory::Many
    );
  }

  auto ParsePluralCategory(const StringView key) -> Option<PluralCategory> {
    for (usize i = 0; i < PLURAL_CATEGORY_COUNT; ++i)
      if (PLURAL_CATEGORY_KEYS.at(i) == key)
        return static_cast<PluralCategory>(i);

    return None;
  }

  auto ShapeOf(const Entry& entry) -> EntryShape {
    using matchit::impl::Overload;

    return std::visit(
      Overload {
        [](const PlainText&) { return EntryShape::Plain; },
        [](const GenderedText&) { return EntryShape::Gendered; },
        [](const PluralText&) { return EntryShape::Plural; },
      },
      entry
    );
  }

  auto VariantCount(const Entry& entry) -> usize {
    using matchit::impl::Overload;

    return std::visit(
      Overload {
        [](const PlainText&) -> usize { return 1; },
        [](const GenderedText& gendered) -> usize { return gendered.variants.size(); },
        [](const PluralText& plural) -> usize {
          return static_cast<usize>(std::ranges::count_if(plural.variants, [](const Option<String>& variant) { return variant.has_value(); }));
        },
      },
      entry
    );
  }

  auto MakeEntry(const StringView key, const DocumentValue& value) -> Result<Entry> {
    if (const String* text = std::get_if<String>(&value))
      return PlainText { .text = *text };

    const auto& object = std::get<Map<String, String>>(value);

    if (object.empty())
      ERR_FMT(InvalidEntry, "Entry '{}' has no variants", key);

    const bool isPlural = std::ranges::all_of(object, [](const auto& variant) {
      return ParsePluralCategory(variant.first).has_value();
    });

    if (isPlural) {
      PluralText plural;

      for (const auto& [categoryKey, text] : object)
        plural.variants.at(static_cast<usize>(*ParsePluralCategory(categoryKey))) = text;

      return plural;
    }

    GenderedText gendered;
    gendered.variants.reserve(object.size());

    for (const auto& [gender, text] : object)
      gendered.variants.emplace(gender, text);

    return gendered;
  }
} // namespace lingo::core
