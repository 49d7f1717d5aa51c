#pragma once

#include <algorithm>       // std::copy_n
#include <chrono>          // std::chrono::system_clock
#include <ctime>           // localtime_r/s, strftime, time_t, tm
#include <filesystem>      // std::filesystem::path
#include <format>          // std::format
#include <source_location> // std::source_location
#include <utility>         // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace lingo::utils::logging {
  namespace types = ::lingo::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes raw text to stdout or stderr.
   */
  inline auto WriteToConsole(const types::StringView text, bool useStderr = false) -> void {
#ifdef __cpp_lib_print
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
#else
    if (useStderr)
      std::cerr << text;
    else
      std::cout << text;
#endif
  }

  enum class LogColor : types::u8 {
    Black   = 0,
    Red     = 1,
    Green   = 2,
    Yellow  = 3,
    Blue    = 4,
    Magenta = 5,
    Cyan    = 6,
    White   = 7,
    Gray    = 8,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 9> COLOR_CODE_LITERALS = {
      "\033[38;5;0m", "\033[38;5;1m", "\033[38;5;2m", "\033[38;5;3m", "\033[38;5;4m",
      "\033[38;5;5m", "\033[38;5;6m", "\033[38;5;7m", "\033[38;5;8m",
    };
    // clang-format on

    static constexpr types::PCStr RESET_CODE   = "\033[0m";
    static constexpr types::PCStr BOLD_START   = "\033[1m";
    static constexpr types::PCStr ITALIC_START = "\033[3m";
    static constexpr types::PCStr DIM_START    = "\033[2m";

    // TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Log severities, most verbose first.
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    if (!style.bold && !style.italic && !style.dim && style.color == LogColor::White)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 24);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  constexpr auto ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // User-facing output (stdout)
  // ─────────────────────────────────────────────────────────────────────────────

  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String line(text);
    line += '\n';
    WriteToConsole(line);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  /**
   * @brief Returns an ISO8601-like timestamp string (YYYY-MM-DDTHH:MM:SS).
   *
   * The formatted value is cached per thread and only recomputed when the
   * second changes.
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (
#ifdef _WIN32
        localtime_s(&localTm, &timeT) == 0
#else
        localtime_r(&timeT, &localTm) != nullptr
#endif
      ) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  /**
   * @struct Field
   * @brief A key-value pair attached to a log event.
   */
  struct Field {
    types::StringView key;
    types::String     value;

    template <typename T>
    static auto create(types::StringView k, const T& v) -> Field {
      if constexpr (std::is_convertible_v<const T&, types::StringView>)
        return Field { k, types::String(types::StringView(v)) };
      else if constexpr (std::is_same_v<std::decay_t<T>, bool>)
        return Field { k, v ? "true" : "false" };
      else
        return Field { k, std::format("{}", v) };
    }
  };

  inline auto FormatFields(const types::Vec<Field>& fields) -> types::String {
    types::String result;

    for (types::usize i = 0; i < fields.size(); ++i) {
      if (i > 0)
        result += ", ";
      result += Stylize(fields[i].key, { .bold = true });
      result += "=";
      result += fields[i].value;
    }

    return result;
  }

  /**
   * @brief Turns a function name into a module-like target.
   * @details "auto lingo::services::loader::LoadDirectory(...)" becomes "lingo::services::loader"
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    types::StringView func(funcName);

    auto parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    auto lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    auto         spacePos = func.rfind(' ', lastColonPos);
    types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  /**
   * @brief Emits one log event: `timestamp LEVEL [file:line] target: message, fields`.
   *
   * The file:line column is only printed in debug builds.
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    const types::Vec<Field>&    fields,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using std::chrono::system_clock;

    if (level < GetRuntimeLogLevel())
      return;

    const types::StringView timestamp = GetCachedTimestamp(system_clock::to_time_t(system_clock::now()));
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);

    types::String line;
    line.reserve(message.size() + 96);

    line += Stylize(timestamp, { .color = LogColor::Gray, .dim = true });
    line += ' ';
    line += GetLevelInfo().at(static_cast<types::usize>(level));
    line += ' ';
#ifndef NDEBUG
    line += Stylize(
      std::format("{}:{}", std::filesystem::path(loc.file_name()).filename().string(), loc.line()),
      { .color = LogColor::Gray, .italic = true }
    );
    line += ' ';
#else
    (void)loc;
#endif
    line += Stylize(target, { .bold = true });
    line += ": ";
    line += message;

    if (!fields.empty()) {
      line += ", ";
      line += FormatFields(fields);
    }

    line += '\n';

    const types::LockGuard lock(GetLogMutex());
    WriteToConsole(line, ShouldUseStderr(level));
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    LogImpl(level, loc, target, types::Vec<Field> {}, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Logs an error object, using its own source location when it has one.
   */
  template <typename ErrorType>
  auto LogError(const LogLevel level, const types::StringView target, const ErrorType& errorObj) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<DecayedErrorType, error::LingoError>)
      LogImpl(level, errorObj.location, target, "{}", errorObj.message);
    else if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
      LogImpl(level, std::source_location::current(), target, "{}", errorObj.what());
    else
      LogImpl(level, std::source_location::current(), target, "{}", "Unknown error type logged");
  }
} // namespace lingo::utils::logging

#define LINGO_LOG_TARGET ::lingo::utils::logging::ExtractTarget(__FUNCTION__)

#define field(name, value) ::lingo::utils::logging::Field::create(#name, value)

#define debug_log(fmt, ...) \
  ::lingo::utils::logging::LogImpl(::lingo::utils::logging::LogLevel::Debug, std::source_location::current(), LINGO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...) \
  ::lingo::utils::logging::LogImpl(::lingo::utils::logging::LogLevel::Info, std::source_location::current(), LINGO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...) \
  ::lingo::utils::logging::LogImpl(::lingo::utils::logging::LogLevel::Warn, std::source_location::current(), LINGO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) \
  ::lingo::utils::logging::LogImpl(::lingo::utils::logging::LogLevel::Error, std::source_location::current(), LINGO_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define warn_log_fields(fields_vec, fmt, ...) \
  ::lingo::utils::logging::LogImpl(::lingo::utils::logging::LogLevel::Warn, std::source_location::current(), LINGO_LOG_TARGET, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define error_at(error_obj) ::lingo::utils::logging::LogError(::lingo::utils::logging::LogLevel::Error, LINGO_LOG_TARGET, error_obj)
