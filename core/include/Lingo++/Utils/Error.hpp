#pragma once

#include <format>          // std::format
#include <source_location> // std::source_location
#include <utility>         // std::move

#include "Types.hpp"

namespace lingo::utils::error {
  /**
   * @enum LingoErrorCode
   * @brief Error codes for catalog lookups, catalog building and loading.
   *
   * The first four codes are lookup failures. The resolver recovers from all
   * of them by falling back or rendering the missing-text marker, so they never
   * reach a caller of the translation handle.
   */
  enum class LingoErrorCode : types::u8 {
    CatalogAbsent,      ///< No catalog is loaded for the requested (language, file).
    KeyAbsent,          ///< The key is not present in an otherwise valid catalog.
    ShapeMismatch,      ///< The requested mode does not match the entry's shape (plain/plural/gendered).
    MissingVariant,     ///< The entry has the right shape but lacks the requested category or gender.
    ConfigurationError, ///< Configuration or environment issue.
    InternalError,      ///< An error occurred within lingo's own logic.
    InvalidArgument,    ///< An invalid argument was passed to a function or method.
    InvalidEntry,       ///< A document value cannot be turned into an entry (e.g. no variants).
    IoError,            ///< General I/O error (filesystem, unreadable file, etc.).
    NotFound,           ///< A required resource (directory, file) was not found.
    ParseError,         ///< Failed to parse a translation document or config file.
  };

  /**
   * @struct LingoError
   * @brief Holds structured information about a lingo error.
   *
   * Used as the error type in Result throughout the library.
   */
  struct LingoError {
    types::String        message;  ///< A descriptive error message.
    std::source_location location; ///< The source location where the error occurred (file, line, function).
    LingoErrorCode       code;     ///< The general category of the error.

    LingoError(const LingoErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}
  };
} // namespace lingo::utils::error

#define ERR(errc, msg)          return ::lingo::utils::types::Err(::lingo::utils::error::LingoError(errc, msg))
#define ERR_FMT(errc, fmt, ...) return ::lingo::utils::types::Err(::lingo::utils::error::LingoError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Macro for Rust-style error propagation.
 *
 * Evaluates the given expression (which must return a Result<T, E>).
 * If the result contains an error, it immediately returns from the enclosing
 * function with that error wrapped in Err(). Otherwise, it yields the
 * success value.
 *
 * @note On GCC/Clang, this macro uses GNU statement expressions.
 *       On MSVC, it throws the error and must be caught by the caller.
 *
 * @example
 * @code
 * auto loadOne(const fs::path& file) -> Result<Catalog> {
 *   String   text = TRY(ReadFile(file));
 *   Document doc  = TRY(ParseDocument(text));
 *   return Catalog::FromDocument(doc);
 * }
 * @endcode
 */
#ifdef _MSC_VER
  #define TRY(expr)            \
    [&]() {                    \
      auto _tmp = (expr);      \
      if (!_tmp)               \
        throw _tmp.error();    \
      return *std::move(_tmp); \
    }()
#else
  #define TRY(expr)                                                                             \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _lingo_try_result = (expr);                                                      \
        if (!_lingo_try_result)                                                                 \
          return ::lingo::utils::types::Err(_lingo_try_result.error());                         \
        std::move(*_lingo_try_result);                                                          \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif

/**
 * @brief Like TRY, for Result<void>. Returns early on error, otherwise continues.
 */
#ifdef _MSC_VER
  #define TRY_VOID(expr)                                            \
    do {                                                            \
      auto&& _lingo_try_result = (expr);                            \
      if (!_lingo_try_result)                                       \
        return ::lingo::utils::types::Err(_lingo_try_result.error()); \
    } while (0)
#else
  #define TRY_VOID(expr)                                                                        \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _lingo_try_result = (expr);                                                      \
        if (!_lingo_try_result)                                                                 \
          return ::lingo::utils::types::Err(_lingo_try_result.error());                         \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif
