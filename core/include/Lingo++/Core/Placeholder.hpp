/**
 * @file Placeholder.hpp
 * @brief `{{name}}` placeholder substitution.
 *
 * A placeholder is two opening braces, an identifier made of ASCII letters,
 * digits and underscores, and two closing braces. There is no escaping and no
 * whitespace trimming: `{{ name }}` is literal text.
 */

#pragma once

#include <format>      // std::format
#include <type_traits> // std::is_convertible_v

#include <Lingo++/Utils/Types.hpp>

namespace lingo::core {
  using namespace utils::types;

  /**
   * @brief Values bound to placeholders.
   *
   * Named values bind by identifier. Every other placeholder takes the next
   * positional value, assigned per distinct name in order of first appearance,
   * so a repeated `{{name}}` reuses the value its first occurrence received.
   * Extra positional values are ignored.
   */
  struct Arguments {
    Vec<String>         positional;
    Map<String, String> named;

    [[nodiscard]] auto empty() const -> bool {
      return positional.empty() && named.empty();
    }
  };

  /**
   * @brief Renders one argument value as text.
   */
  template <typename T>
  auto ToArgument(const T& value) -> String {
    if constexpr (std::is_convertible_v<const T&, StringView>)
      return String(StringView(value));
    else
      return std::format("{}", value);
  }

  /**
   * @brief Builds a positional argument list from heterogeneous values.
   */
  template <typename... Args>
  auto MakePositional(const Args&... args) -> Vec<String> {
    Vec<String> result;
    result.reserve(sizeof...(Args));
    (result.push_back(ToArgument(args)), ...);
    return result;
  }

  /**
   * @brief Replaces placeholders in a template.
   *
   * Placeholders without a bound value are left verbatim.
   *
   * @param text The template.
   * @param args The values to bind.
   * @return The rendered string.
   */
  auto Substitute(StringView text, const Arguments& args) -> String;

  /**
   * @brief Distinct placeholder names in order of first appearance.
   */
  auto ListPlaceholders(StringView text) -> Vec<String>;
} // namespace lingo::core
