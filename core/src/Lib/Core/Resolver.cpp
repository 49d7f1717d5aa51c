#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::impl::Overload

#include <Lingo++/Core/Resolver.hpp>

#include <Lingo++/Utils/Error.hpp>

using enum lingo::utils::error::LingoErrorCode;

namespace lingo::core {
  auto ExpectedShape(const Selector& selector) -> EntryShape {
    using matchit::impl::Overload;

    return std::visit(
      Overload {
        [](const PlainSelector&) { return EntryShape::Plain; },
        [](const PluralSelector&) { return EntryShape::Plural; },
        [](const GenderSelector&) { return EntryShape::Gendered; },
      },
      selector
    );
  }

  auto SelectVariant(const Entry& entry, const Selector& selector) -> Result<StringView> {
    using matchit::impl::Overload;

    return std::visit(
      Overload {
        [](const PlainText& plain, const PlainSelector&) -> Result<StringView> {
          return plain.text;
        },
        [](const PluralText& plural, const PluralSelector& wanted) -> Result<StringView> {
          const PluralCategory category = CategoryFor(wanted.count);

          if (const Option<String>& variant = plural.get(category))
            return *variant;

          ERR_FMT(MissingVariant, "No '{}' plural variant (count {})", CategoryKey(category), wanted.count);
        },
        [](const GenderedText& gendered, const GenderSelector& wanted) -> Result<StringView> {
          if (const auto iter = gendered.variants.find(wanted.gender); iter != gendered.variants.end())
            return iter->second;

          ERR_FMT(MissingVariant, "No '{}' gender variant", wanted.gender);
        },
        [&](const auto&, const auto&) -> Result<StringView> {
          ERR_FMT(
            ShapeMismatch,
            "Entry is {}, but a {} lookup was requested",
            magic_enum::enum_name(ShapeOf(entry)),
            magic_enum::enum_name(ExpectedShape(selector))
          );
        },
      },
      entry,
      selector
    );
  }

  auto Lookup(const Catalog* catalog, const Query& query) -> Result<String> {
    if (!catalog)
      ERR_FMT(CatalogAbsent, "No catalog loaded for key '{}'", query.key);

    const Entry* entry = catalog->find(query.key);

    if (!entry)
      ERR_FMT(KeyAbsent, "Key '{}' not found", query.key);

    Result<StringView> selected = SelectVariant(*entry, query.selector);

    if (!selected)
      ERR_FMT(selected.error().code, "Key '{}': {}", query.key, selected.error().message);

    if (const auto* plural = std::get_if<PluralSelector>(&query.selector)) {
      Arguments args = query.args.value_or(Arguments {});
      args.positional.insert(args.positional.begin(), ToArgument(plural->count));
      return Substitute(*selected, args);
    }

    if (query.args)
      return Substitute(*selected, *query.args);

    return String(*selected);
  }

  auto Resolve(const Catalog* primary, const Catalog* fallback, const Query& query) -> Resolution {
    Result<String> fromPrimary = Lookup(primary, query);

    if (fromPrimary)
      return { .text = std::move(*fromPrimary), .missing = false, .source = ResolutionSource::Primary, .primaryError = None };

    if (fallback && fallback != primary)
      if (Result<String> fromFallback = Lookup(fallback, query))
        return { .text = std::move(*fromFallback), .missing = false, .source = ResolutionSource::Fallback, .primaryError = fromPrimary.error() };

    return { .text = String(MISSING_TEXT), .missing = true, .source = ResolutionSource::Missing, .primaryError = fromPrimary.error() };
  }
} // namespace lingo::core
