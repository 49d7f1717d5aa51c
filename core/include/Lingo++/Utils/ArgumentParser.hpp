/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser.
 *
 * Supports flags, valued options, integer conversion, enum-style choices and
 * repeatable options. Parsed values can be bound straight into struct members:
 *
 * @code
 * struct Options { bool verbose; String file; Vec<String> args; };
 * Options opts;
 *
 * ArgumentParser parser("lingo", "0.1.0");
 * parser.addArguments("-V", "--verbose").flag().bindTo(opts.verbose);
 * parser.addArguments("--file").bindTo(opts.file);
 * parser.addArguments("--arg").repeatable().bindTo(opts.args);
 *
 * TRY_VOID(parser.parseInto(Span(argv, argc)));
 * @endcode
 *
 * `-h/--help` and `-v/--version` are registered automatically. The parser only
 * records them; callers check isUsed() and act.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::convertible_to, std::same_as
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, enum_name, enum_values}
#include <utility>                   // std::forward
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace lingo::utils::argparse {
  namespace error   = ::lingo::utils::error;
  namespace logging = ::lingo::utils::logging;
  namespace types   = ::lingo::utils::types;

  class Argument;

  using ArgValue   = std::variant<bool, types::i64, types::String>;
  using ArgBinding = types::Fn<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  inline auto ToLower(types::StringView text) -> types::String {
    types::String lower(text);
    std::ranges::transform(lower, lower.begin(), [](const types::u8 chr) { return static_cast<types::CStr>(std::tolower(chr)); });
    return lower;
  }

  /**
   * @brief Enum <-> string conversion for choice arguments, via magic_enum.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static auto getChoices() -> const ArgChoices& {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      static const ArgChoices CACHED_CHOICES = [] {
        ArgChoices vec;
        for (const auto value : magic_enum::enum_values<EnumType>())
          vec.emplace_back(magic_enum::enum_name(value));
        return vec;
      }();

      return CACHED_CHOICES;
    }

    static auto stringToEnum(const types::StringView str) -> EnumType {
      if (const auto result = magic_enum::enum_cast<EnumType>(str, magic_enum::case_insensitive))
        return *result;

      return magic_enum::enum_values<EnumType>()[0];
    }
  };

  /**
   * @brief One command-line option with its aliases, metadata and parsed value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names) : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    /**
     * @brief Sets the default. An i64 default also makes the option parse its value as an integer.
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i64> || std::same_as<T, types::String>
    auto defaultValue(T value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = types::String(magic_enum::enum_name(value));
      return choices(EnumTraits<EnumType>::getChoices());
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    /**
     * @brief Parse the value as an integer even without an integer default.
     */
    auto integer() -> Argument& {
      m_isInteger = true;
      return *this;
    }

    /**
     * @brief Allows the option to appear several times. Every value is kept.
     */
    auto repeatable() -> Argument& {
      m_isRepeatable = true;
      return *this;
    }

    /**
     * @brief Restricts the value to a set of strings, compared case-insensitively.
     */
    auto choices(const ArgChoices& choices) -> Argument& {
      m_choices = choices;
      return *this;
    }

    template <typename T>
    [[nodiscard]] auto get() const -> T {
      if (m_value)
        return std::get<T>(*m_value);

      if (m_defaultValue)
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>());
    }

    /**
     * @brief Every value given to a repeatable option, in command-line order.
     */
    [[nodiscard]] auto getAll() const -> const types::Vec<types::String>& {
      return m_values;
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto isRepeatable() const -> bool {
      return m_isRepeatable;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.front();
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getChoices() const -> ArgChoices {
      return m_choices.value_or(ArgChoices {});
    }

    [[nodiscard]] auto getDefaultAsString() const -> types::String {
      if (!m_defaultValue)
        return {};

      return std::visit(
        []<typename V>(const V& value) -> types::String {
          if constexpr (std::is_same_v<V, bool>)
            return value ? "true" : "false";
          else if constexpr (std::is_same_v<V, types::String>)
            return ToLower(value);
          else
            return std::format("{}", value);
        },
        *m_defaultValue
      );
    }

    /**
     * @brief Validates and stores a value from the command line.
     * @return InvalidArgument for a value outside the choices or a malformed integer.
     */
    auto setValue(const types::StringView raw) -> types::Result<> {
      if (m_choices && std::ranges::none_of(*m_choices, [lower = ToLower(raw)](const types::String& choice) { return ToLower(choice) == lower; })) {
        types::String allowed;

        for (const types::String& choice : *m_choices)
          allowed += std::format("{}{}", allowed.empty() ? "" : ", ", ToLower(choice));

        ERR_FMT(error::LingoErrorCode::InvalidArgument, "Invalid value '{}' for argument '{}'. Allowed values: {}", raw, getPrimaryName(), allowed);
      }

      m_isUsed = true;

      if (m_isRepeatable) {
        m_values.emplace_back(raw);
        return {};
      }

      if (m_isInteger || (m_defaultValue && std::holds_alternative<types::i64>(*m_defaultValue))) {
        types::i64 number = 0;

        const auto [ptr, errc] = std::from_chars(raw.data(), raw.data() + raw.size(), number);

        if (errc != std::errc {} || ptr != raw.data() + raw.size())
          ERR_FMT(error::LingoErrorCode::InvalidArgument, "Failed to parse '{}' as integer for argument '{}'", raw, getPrimaryName());

        m_value = number;
        return {};
      }

      m_value = types::String(raw);
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Copies the parsed value (or default) into `member` when bindings are applied.
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i64> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.get<T>(); };
      return *this;
    }

    /**
     * @brief Binds only when the option was given; `member` is left as None otherwise.
     */
    template <typename T>
      requires std::same_as<T, types::i64> || std::same_as<T, types::String>
    auto bindTo(types::Option<T>& member) -> Argument& {
      m_binding = [&member](const Argument& arg) {
        if (arg.isUsed())
          member = arg.get<T>();
      };
      return *this;
    }

    /**
     * @brief Binds every value of a repeatable option.
     */
    auto bindTo(types::Vec<types::String>& member) -> Argument& {
      m_isRepeatable = true;
      m_binding      = [&member](const Argument& arg) { member = arg.getAll(); };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String> m_names;
    types::String             m_helpText;
    types::Option<ArgValue>   m_value;
    types::Option<ArgValue>   m_defaultValue;
    types::Option<ArgChoices> m_choices;
    types::Vec<types::String> m_values; ///< Values of a repeatable option.
    ArgBinding                m_binding;
    bool                      m_isFlag {};
    bool                      m_isInteger {};
    bool                      m_isRepeatable {};
    bool                      m_isUsed {};
  };

  class ArgumentParser {
   public:
    explicit ArgumentParser(types::String programName, types::String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parses argv. The first element is the program name and is skipped.
     * @return InvalidArgument for an unknown option, a missing value or a rejected value.
     */
    auto parseArgs(const types::Span<const char* const> args) -> types::Result<> {
      types::Vec<types::StringView> views(args.begin(), args.end());
      return parseViews(views);
    }

    auto parseArgs(const types::Vec<types::String>& args) -> types::Result<> {
      types::Vec<types::StringView> views(args.begin(), args.end());
      return parseViews(views);
    }

    auto applyBindings() const -> types::Unit {
      for (const auto& arg : m_arguments)
        arg->applyBinding();
    }

    auto parseInto(const types::Span<const char* const> args) -> types::Result<> {
      TRY_VOID(parseArgs(args));
      applyBindings();
      return {};
    }

    auto parseInto(const types::Vec<types::String>& args) -> types::Result<> {
      TRY_VOID(parseArgs(args));
      applyBindings();
      return {};
    }

    template <typename T = types::String>
    [[nodiscard]] auto get(const types::StringView name) const -> T {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    [[nodiscard]] auto getAll(const types::StringView name) const -> types::Vec<types::String> {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->getAll();

      return {};
    }

    [[nodiscard]] auto isUsed(const types::StringView name) const -> bool {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto getVersion() const -> const types::String& {
      return m_version;
    }

    [[nodiscard]] auto helpText() const -> types::String {
      types::String text = std::format("Usage: {}", m_programName);

      for (const auto& arg : m_arguments)
        text += std::format(" [{}{}]{}", arg->getPrimaryName(), arg->isFlag() ? "" : " VALUE", arg->isRepeatable() ? "..." : "");

      text += "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        types::String names;

        for (const types::String& name : arg->getNames())
          names += std::format("{}{}", names.empty() ? "" : ", ", name);

        text += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          text += std::format("    {}\n", arg->getHelpText());

        if (const ArgChoices choices = arg->getChoices(); !choices.empty()) {
          types::String allowed;

          for (const types::String& choice : choices)
            allowed += std::format("{}{}", allowed.empty() ? "" : ", ", ToLower(choice));

          text += std::format("    Available values: {}\n    Default: {}\n", allowed, arg->getDefaultAsString());
        }
      }

      return text;
    }

    auto printHelp() const -> types::Unit {
      logging::Print(helpText());
    }

   private:
    auto parseViews(const types::Vec<types::StringView>& args) -> types::Result<> {
      for (types::usize i = 1; i < args.size(); ++i) {
        const types::StringView arg = args[i];

        const auto iter = m_argumentMap.find(arg);

        if (iter == m_argumentMap.end())
          ERR_FMT(error::LingoErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(error::LingoErrorCode::InvalidArgument, "Argument {} requires a value", arg);

        TRY_VOID(argument->setValue(args[++i]));
      }

      return {};
    }

    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace lingo::utils::argparse
