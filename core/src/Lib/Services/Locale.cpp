#include <algorithm> // std::ranges::all_of

#include <Lingo++/Services/Locale.hpp>

#include <Lingo++/Utils/Env.hpp>

namespace lingo::services::locale {
  namespace {
    constexpr auto IsLower(const CStr chr) -> bool {
      return chr >= 'a' && chr <= 'z';
    }

    constexpr auto IsUpper(const CStr chr) -> bool {
      return chr >= 'A' && chr <= 'Z';
    }

    constexpr auto IsDigit(const CStr chr) -> bool {
      return chr >= '0' && chr <= '9';
    }

    constexpr auto IsAlpha(const CStr chr) -> bool {
      return IsLower(chr) || IsUpper(chr);
    }

    constexpr Array<PCStr, 3> LOCALE_VARIABLES = { "LC_ALL", "LC_MESSAGES", "LANG" };
  } // namespace

  auto ExtractLanguageCode(const StringView locale) -> String {
    const StringView withoutCodeset = locale.substr(0, locale.find_first_of(".@"));

    return String(withoutCodeset.substr(0, withoutCodeset.find_first_of("_-")));
  }

  auto GetSystemLanguage() -> String {
    for (const PCStr variable : LOCALE_VARIABLES) {
      const Option<String> value = utils::env::GetNonEmptyEnv(variable);

      if (!value || *value == "C" || *value == "POSIX")
        continue;

      if (String code = ExtractLanguageCode(*value); !code.empty() && code != "C")
        return code;
    }

    return "en";
  }

  auto IsWellFormedLocaleTag(const StringView tag) -> bool {
    const usize separator = tag.find_first_of("_-");
    const StringView language = tag.substr(0, separator);

    if (language.size() < 2 || language.size() > 3 || !std::ranges::all_of(language, IsLower))
      return false;

    if (separator == StringView::npos)
      return true;

    const StringView subtag = tag.substr(separator + 1);

    switch (subtag.size()) {
      case 2:  return std::ranges::all_of(subtag, IsUpper);
      case 3:  return std::ranges::all_of(subtag, IsDigit);
      case 4:  return IsUpper(subtag.front()) && std::ranges::all_of(subtag.substr(1), IsAlpha);
      default: return false;
    }
  }
} // namespace lingo::services::locale
