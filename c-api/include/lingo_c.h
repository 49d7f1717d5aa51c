#ifndef LINGO_C_H
#define LINGO_C_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(LINGO_C_SHARED)
    #if defined(LINGO_C_BUILD)
      #define LINGO_C_API __declspec(dllexport)
    #else
      #define LINGO_C_API __declspec(dllimport)
    #endif
  #else
    #define LINGO_C_API
  #endif
#else
  #if defined(LINGO_C_SHARED)
    #define LINGO_C_API __attribute__((visibility("default")))
  #else
    #define LINGO_C_API
  #endif
#endif

#ifdef __cplusplus
extern "C" {
#endif
  // Opaque handle owning loaded catalogs and the language selection
  typedef struct LingoRegistry LingoRegistry;

  // Error codes matching lingo::utils::error::LingoErrorCode
  typedef enum LingoErrorCode {
    LINGO_ERROR_CATALOG_ABSENT      = 0,
    LINGO_ERROR_KEY_ABSENT          = 1,
    LINGO_ERROR_SHAPE_MISMATCH      = 2,
    LINGO_ERROR_MISSING_VARIANT     = 3,
    LINGO_ERROR_CONFIGURATION_ERROR = 4,
    LINGO_ERROR_INTERNAL_ERROR      = 5,
    LINGO_ERROR_INVALID_ARGUMENT    = 6,
    LINGO_ERROR_INVALID_ENTRY       = 7,
    LINGO_ERROR_IO_ERROR            = 8,
    LINGO_ERROR_NOT_FOUND           = 9,
    LINGO_ERROR_PARSE_ERROR         = 10,
    LINGO_SUCCESS                   = 255 // Not an error - operation succeeded
  } LingoErrorCode;

  /**
   * Creates an empty registry.
   * NULL language or fallback means "en".
   * Must be destroyed with LingoDestroyRegistry.
   */
  LINGO_C_API LingoRegistry* LingoCreateRegistry(const char* language, const char* fallback);

  /**
   * Destroys a registry. Strings returned by the library stay valid.
   */
  LINGO_C_API void LingoDestroyRegistry(LingoRegistry* registry);

  /**
   * Frees a string allocated by the library.
   */
  LINGO_C_API void LingoFreeString(char* str);

  /**
   * Loads <root>/<language>/<file>.json into the registry.
   * Problems with individual files are counted in out_diagnostics (may be NULL)
   * and do not fail the call.
   */
  LINGO_C_API LingoErrorCode LingoLoadDirectory(LingoRegistry* registry, const char* root, size_t* out_diagnostics);

  /**
   * Loads a bundle document ({ "<language>": { "<file>": { ... } } }) into the registry.
   */
  LINGO_C_API LingoErrorCode LingoLoadBundle(LingoRegistry* registry, const char* json, size_t* out_diagnostics);

  LINGO_C_API LingoErrorCode LingoSetLanguage(LingoRegistry* registry, const char* language);

  LINGO_C_API LingoErrorCode LingoSetFallbackLanguage(LingoRegistry* registry, const char* language);

  /**
   * Returns the current language. Free with LingoFreeString.
   */
  LINGO_C_API char* LingoGetLanguage(const LingoRegistry* registry);

  /**
   * Returns the fallback language. Free with LingoFreeString.
   */
  LINGO_C_API char* LingoGetFallbackLanguage(const LingoRegistry* registry);

  /**
   * Translation functions.
   *
   * Each returns a newly allocated string to be freed with LingoFreeString, or
   * NULL if registry, file or key is NULL. When no translation exists in either
   * the current or the fallback language, the returned string is
   * "Error missing text" and *out_missing (if given) is set to true.
   */
  LINGO_C_API char* LingoTranslate(const LingoRegistry* registry, const char* file, const char* key, bool* out_missing);

  LINGO_C_API char* LingoTranslatePlural(const LingoRegistry* registry, const char* file, const char* key, int64_t count, bool* out_missing);

  LINGO_C_API char* LingoTranslateGender(const LingoRegistry* registry, const char* file, const char* key, const char* gender, bool* out_missing);

  /**
   * args holds arg_count positional placeholder values. NULL entries are treated as "".
   */
  LINGO_C_API char* LingoTranslateWithArgs(
    const LingoRegistry* registry,
    const char*          file,
    const char*          key,
    const char* const*   args,
    size_t               arg_count,
    bool*                out_missing
  );
#ifdef __cplusplus
}
#endif

#endif // LINGO_C_H
