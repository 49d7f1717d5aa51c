#include <algorithm> // std::ranges::sort

#include <Lingo++/Core/Catalog.hpp>

#include <Lingo++/Utils/Error.hpp>

namespace lingo::core {
  auto Catalog::FromDocument(const Document& document) -> Result<Catalog> {
    Catalog catalog;
    catalog.m_entries.reserve(document.size());

    for (const auto& [key, value] : document) {
      Entry entry = TRY(MakeEntry(key, value));
      catalog.m_entries.emplace(key, std::move(entry));
    }

    return catalog;
  }

  auto Catalog::find(const StringView key) const -> const Entry* {
    if (const auto iter = m_entries.find(key); iter != m_entries.end())
      return &iter->second;

    return nullptr;
  }

  auto Catalog::contains(const StringView key) const -> bool {
    return m_entries.contains(key);
  }

  auto Catalog::size() const -> usize {
    return m_entries.size();
  }

  auto Catalog::empty() const -> bool {
    return m_entries.empty();
  }

  auto Catalog::keys() const -> Vec<String> {
    Vec<String> result;
    result.reserve(m_entries.size());

    for (const auto& [key, entry] : m_entries)
      result.push_back(key);

    std::ranges::sort(result);

    return result;
  }
} // namespace lingo::core
