#include <algorithm> // std::ranges::find
#include <iterator>  // std::prev, std::distance

#include <Lingo++/Core/Placeholder.hpp>

namespace lingo::core {
  namespace {
    constexpr StringView OPEN  = "{{";
    constexpr StringView CLOSE = "}}";

    constexpr auto IsIdentifierChar(const CStr chr) -> bool {
      return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || (chr >= '0' && chr <= '9') || chr == '_';
    }

    /**
     * @brief Matches a placeholder starting at `pos`.
     * @return The identifier, or None if `text[pos..]` is not a placeholder.
     */
    auto MatchPlaceholder(const StringView text, const usize pos) -> Option<StringView> {
      if (text.substr(pos, OPEN.size()) != OPEN)
        return None;

      const usize nameStart = pos + OPEN.size();
      usize       nameEnd   = nameStart;

      while (nameEnd < text.size() && IsIdentifierChar(text[nameEnd]))
        ++nameEnd;

      if (nameEnd == nameStart || text.substr(nameEnd, CLOSE.size()) != CLOSE)
        return None;

      return text.substr(nameStart, nameEnd - nameStart);
    }

    /**
     * @brief Walks a template, calling `onText` for literal runs and `onPlaceholder` for each placeholder.
     */
    template <typename TextFn, typename PlaceholderFn>
    auto Scan(const StringView text, TextFn&& onText, PlaceholderFn&& onPlaceholder) -> void {
      usize literalStart = 0;
      usize pos          = text.find(OPEN);

      while (pos != StringView::npos) {
        if (const Option<StringView> name = MatchPlaceholder(text, pos)) {
          onText(text.substr(literalStart, pos - literalStart));
          onPlaceholder(*name, text.substr(pos, OPEN.size() + name->size() + CLOSE.size()));

          literalStart = pos + OPEN.size() + name->size() + CLOSE.size();
          pos          = text.find(OPEN, literalStart);
        } else
          pos = text.find(OPEN, pos + 1);
      }

      onText(text.substr(literalStart));
    }
  } // namespace

  auto Substitute(const StringView text, const Arguments& args) -> String {
    if (args.empty())
      return String(text);

    String result;
    result.reserve(text.size());

    Vec<StringView> slots; // placeholder names in the order they claimed a positional value

    Scan(
      text,
      [&](const StringView literal) { result += literal; },
      [&](const StringView name, const StringView raw) {
        if (const auto named = args.named.find(name); named != args.named.end()) {
          result += named->second;
          return;
        }

        auto slot = std::ranges::find(slots, name);

        if (slot == slots.end()) {
          slots.push_back(name);
          slot = std::prev(slots.end());
        }

        const auto index = static_cast<usize>(std::distance(slots.begin(), slot));

        if (index < args.positional.size())
          result += args.positional[index];
        else
          result += raw;
      }
    );

    return result;
  }

  auto ListPlaceholders(const StringView text) -> Vec<String> {
    Vec<String> names;

    Scan(
      text,
      [](StringView) {},
      [&](const StringView name, StringView) {
        if (std::ranges::find(names, name) == names.end())
          names.emplace_back(name);
      }
    );

    return names;
  }
} // namespace lingo::core
