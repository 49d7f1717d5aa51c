/**
 * @file Registry.hpp
 * @brief Owns loaded catalogs and the current/fallback language selection.
 *
 * Call sites ask the registry for a TranslationHandle scoped to one logical
 * file, then call one of the handle's lookup operations:
 *
 * @code
 * Registry registry("en", "en");
 * TRY_VOID(registry.insert("en", "ui", TRY(Catalog::FromDocument(doc))));
 *
 * TranslationHandle ui = registry.translation("ui");
 * ui.t("greeting");                 // "Hello"
 * ui.tWithPlural("apples", 5);      // "5 apples"
 * ui.tWithGender("welcome", "female");
 * @endcode
 */

#pragma once

#include <Lingo++/Core/Catalog.hpp>
#include <Lingo++/Core/Placeholder.hpp>
#include <Lingo++/Core/Resolver.hpp>

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Types.hpp>

namespace lingo::core {
  /**
   * @brief Called whenever a handle renders MISSING_TEXT.
   *
   * Receives the logical file name, the query and its resolution. Purely
   * diagnostic: the rendered string is not affected.
   */
  using MissingTextHandler = Fn<void(StringView file, const Query& query, const Resolution& resolution)>;

  /**
   * @struct LanguageState
   * @brief The language pair every lookup is resolved against.
   */
  struct LanguageState {
    String current;  ///< Language tried first.
    String fallback; ///< Language tried when the current one fails. May equal `current`.
  };

  /**
   * @brief Lookup operations for one logical file.
   *
   * A handle borrows the registry's catalogs. It is meant to be requested per
   * use and dropped right away: it reflects the language selection and the
   * missing-text handler at the time it was created and must not outlive its
   * registry.
   */
  class TranslationHandle {
   public:
    TranslationHandle(String file, const Catalog* primary, const Catalog* fallback, MissingTextHandler onMissing)
      : m_file(std::move(file)), m_primary(primary), m_fallback(fallback), m_onMissing(std::move(onMissing)) {}

    /**
     * @brief Plain lookup.
     */
    [[nodiscard]] auto t(StringView key) const -> String;

    /**
     * @brief Plain lookup with positional placeholder arguments.
     */
    template <typename... Args>
    [[nodiscard]] auto tWithArgs(const StringView key, const Args&... args) const -> String {
      return render({ .key = String(key), .selector = PlainSelector {}, .args = Arguments { .positional = MakePositional(args...), .named = {} } });
    }

    /**
     * @brief Plain lookup with named placeholder arguments.
     */
    [[nodiscard]] auto tWithNamedArgs(StringView key, Map<String, String> named) const -> String;

    /**
     * @brief Plural lookup. `count` selects the bucket and fills the first placeholder.
     */
    [[nodiscard]] auto tWithPlural(StringView key, i64 count) const -> String;

    /**
     * @brief Plural lookup with further positional arguments after the count.
     */
    template <typename... Args>
    [[nodiscard]] auto tWithPluralAndArgs(const StringView key, const i64 count, const Args&... args) const -> String {
      return render({ .key = String(key), .selector = PluralSelector { count }, .args = Arguments { .positional = MakePositional(args...), .named = {} } });
    }

    /**
     * @brief Gendered lookup. `gender` is matched exactly and case-sensitively.
     */
    [[nodiscard]] auto tWithGender(StringView key, StringView gender) const -> String;

    /**
     * @brief Gendered lookup with positional placeholder arguments.
     */
    template <typename... Args>
    [[nodiscard]] auto tWithGenderAndArgs(const StringView key, const StringView gender, const Args&... args) const -> String {
      return render({ .key = String(key), .selector = GenderSelector { String(gender) }, .args = Arguments { .positional = MakePositional(args...), .named = {} } });
    }

    /**
     * @brief Resolves an arbitrary query and reports whether it was missing.
     */
    [[nodiscard]] auto resolve(const Query& query) const -> Resolution;

    [[nodiscard]] auto file() const -> StringView {
      return m_file;
    }

    [[nodiscard]] auto primary() const -> const Catalog* {
      return m_primary;
    }

    /**
     * @brief The fallback catalog, or nullptr when none is loaded.
     */
    [[nodiscard]] auto fallback() const -> const Catalog* {
      return m_fallback;
    }

   private:
    auto render(const Query& query) const -> String;

    String                    m_file;
    const Catalog*            m_primary;
    const Catalog*            m_fallback;
    MissingTextHandler        m_onMissing; ///< Copied from the registry when the handle is created.
  };

  /**
   * @brief Owns every loaded catalog, keyed by (language, file).
   *
   * The language pair is guarded by a mutex, so setLanguage() may race with
   * translation() from other threads. Catalogs are inserted before the
   * registry is shared and are never replaced or modified afterwards.
   */
  class Registry {
   public:
    /**
     * @brief Creates a registry with both languages set to "en".
     */
    Registry();

    Registry(String current, String fallback);

    Registry(const Registry&)                    = delete;
    Registry(Registry&&)                         = delete;
    auto operator=(const Registry&) -> Registry& = delete;
    auto operator=(Registry&&) -> Registry&      = delete;

    ~Registry() = default;

    /**
     * @brief Takes ownership of a catalog.
     * @return InvalidArgument if a catalog is already registered for (language, file).
     */
    auto insert(StringView language, StringView file, Catalog catalog) -> Result<>;

    /**
     * @brief Sets the current language. No check is made that catalogs exist for it.
     */
    auto setLanguage(StringView code) -> Unit;

    /**
     * @brief Sets the fallback language. No check is made that catalogs exist for it.
     */
    auto setFallbackLanguage(StringView code) -> Unit;

    [[nodiscard]] auto getLanguage() const -> String;

    [[nodiscard]] auto getFallbackLanguage() const -> String;

    /**
     * @brief Snapshot of both languages, read under one lock.
     */
    [[nodiscard]] auto getLanguageState() const -> LanguageState;

    /**
     * @brief Returns a handle for `file` in the current language, backed by the fallback language.
     *
     * Either catalog may be absent; lookups then degrade per the resolver's rules.
     */
    [[nodiscard]] auto translation(StringView file) const -> TranslationHandle;

    /**
     * @brief Looks up one catalog.
     * @return The catalog, or nullptr if none is registered.
     */
    [[nodiscard]] auto catalog(StringView language, StringView file) const -> const Catalog*;

    [[nodiscard]] auto hasLanguage(StringView language) const -> bool;

    /**
     * @brief Languages with at least one catalog, sorted.
     */
    [[nodiscard]] auto languages() const -> Vec<String>;

    /**
     * @brief Files registered for a language, sorted.
     */
    [[nodiscard]] auto files(StringView language) const -> Vec<String>;

    /**
     * @brief Installs the handler invoked when a handle renders MISSING_TEXT.
     *
     * Handles created earlier keep the handler they were created with. Pass an
     * empty function to remove it.
     */
    auto setMissingTextHandler(MissingTextHandler handler) -> Unit;

   private:
    auto findLocked(StringView language, StringView file) const -> const Catalog*;

    StringMap<StringMap<UniquePointer<const Catalog>>> m_catalogs; // language -> file -> catalog
    LanguageState                                      m_state;
    MissingTextHandler                                 m_onMissing;
    mutable Mutex                                      m_mutex;
  };
} // namespace lingo::core
