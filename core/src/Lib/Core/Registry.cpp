#include <algorithm> // std::ranges::sort

#include <Lingo++/Core/Registry.hpp>

#include <Lingo++/Utils/Error.hpp>

using enum lingo::utils::error::LingoErrorCode;

namespace lingo::core {
  auto TranslationHandle::t(const StringView key) const -> String {
    return render({ .key = String(key), .selector = PlainSelector {}, .args = None });
  }

  auto TranslationHandle::tWithNamedArgs(const StringView key, Map<String, String> named) const -> String {
    return render({ .key = String(key), .selector = PlainSelector {}, .args = Arguments { .positional = {}, .named = std::move(named) } });
  }

  auto TranslationHandle::tWithPlural(const StringView key, const i64 count) const -> String {
    return render({ .key = String(key), .selector = PluralSelector { count }, .args = None });
  }

  auto TranslationHandle::tWithGender(const StringView key, const StringView gender) const -> String {
    return render({ .key = String(key), .selector = GenderSelector { String(gender) }, .args = None });
  }

  auto TranslationHandle::resolve(const Query& query) const -> Resolution {
    Resolution resolution = Resolve(m_primary, m_fallback, query);

    if (resolution.missing && m_onMissing)
      m_onMissing(m_file, query, resolution);

    return resolution;
  }

  auto TranslationHandle::render(const Query& query) const -> String {
    return resolve(query).text;
  }

  Registry::Registry() : m_state { .current = "en", .fallback = "en" } {}

  Registry::Registry(String current, String fallback)
    : m_state { .current = std::move(current), .fallback = std::move(fallback) } {}

  auto Registry::insert(const StringView language, const StringView file, Catalog catalog) -> Result<> {
    const LockGuard lock(m_mutex);

    auto& files = m_catalogs[String(language)];

    if (files.contains(file))
      ERR_FMT(InvalidArgument, "A catalog for '{}/{}' is already registered", language, file);

    files.emplace(String(file), std::make_unique<const Catalog>(std::move(catalog)));

    return {};
  }

  auto Registry::setLanguage(const StringView code) -> Unit {
    const LockGuard lock(m_mutex);
    m_state.current = code;
  }

  auto Registry::setFallbackLanguage(const StringView code) -> Unit {
    const LockGuard lock(m_mutex);
    m_state.fallback = code;
  }

  auto Registry::getLanguage() const -> String {
    const LockGuard lock(m_mutex);
    return m_state.current;
  }

  auto Registry::getFallbackLanguage() const -> String {
    const LockGuard lock(m_mutex);
    return m_state.fallback;
  }

  auto Registry::getLanguageState() const -> LanguageState {
    const LockGuard lock(m_mutex);
    return m_state;
  }

  auto Registry::translation(const StringView file) const -> TranslationHandle {
    const LockGuard lock(m_mutex);

    return {
      String(file),
      findLocked(m_state.current, file),
      findLocked(m_state.fallback, file),
      m_onMissing,
    };
  }

  auto Registry::catalog(const StringView language, const StringView file) const -> const Catalog* {
    const LockGuard lock(m_mutex);
    return findLocked(language, file);
  }

  auto Registry::hasLanguage(const StringView language) const -> bool {
    const LockGuard lock(m_mutex);

    const auto iter = m_catalogs.find(language);
    return iter != m_catalogs.end() && !iter->second.empty();
  }

  auto Registry::languages() const -> Vec<String> {
    const LockGuard lock(m_mutex);

    Vec<String> result;
    result.reserve(m_catalogs.size());

    for (const auto& [language, files] : m_catalogs)
      if (!files.empty())
        result.push_back(language);

    std::ranges::sort(result);

    return result;
  }

  auto Registry::files(const StringView language) const -> Vec<String> {
    const LockGuard lock(m_mutex);

    Vec<String> result;

    if (const auto iter = m_catalogs.find(language); iter != m_catalogs.end()) {
      result.reserve(iter->second.size());

      for (const auto& [file, catalog] : iter->second)
        result.push_back(file);
    }

    std::ranges::sort(result);

    return result;
  }

  auto Registry::setMissingTextHandler(MissingTextHandler handler) -> Unit {
    const LockGuard lock(m_mutex);
    m_onMissing = std::move(handler);
  }

  auto Registry::findLocked(const StringView language, const StringView file) const -> const Catalog* {
    const auto language_iter = m_catalogs.find(language);

    if (language_iter == m_catalogs.end())
      return nullptr;

    const auto file_iter = language_iter->second.find(file);

    return file_iter == language_iter->second.end() ? nullptr : file_iter->second.get();
  }
} // namespace lingo::core
