/**
 * @file Catalog.hpp
 * @brief One language's translations for one logical file.
 */

#pragma once

#include <Lingo++/Core/Entry.hpp>

#include <Lingo++/Utils/Types.hpp>

namespace lingo::core {
  /**
   * @brief Parsed form of one translation file: a flat object of key to value.
   *
   * This is the contract between a document parser (see services::loader) and
   * the core. The core never reads files or JSON itself.
   */
  using Document = Map<String, DocumentValue>;

  /**
   * @brief Immutable key to Entry mapping for one (language, file) pair.
   *
   * A catalog is built once from a Document and never modified afterwards, so
   * a const Catalog may be read from any number of threads.
   */
  class Catalog {
   public:
    Catalog() = default;

    /**
     * @brief Builds a catalog from a parsed document.
     * @param document The document; every value becomes one entry.
     * @return The catalog, or the first InvalidEntry error encountered.
     */
    static auto FromDocument(const Document& document) -> Result<Catalog>;

    /**
     * @brief Looks up the entry stored under a key.
     * @return The entry, or nullptr if the key is absent.
     */
    [[nodiscard]] auto find(StringView key) const -> const Entry*;

    [[nodiscard]] auto contains(StringView key) const -> bool;

    [[nodiscard]] auto size() const -> usize;

    [[nodiscard]] auto empty() const -> bool;

    /**
     * @brief All keys, sorted.
     */
    [[nodiscard]] auto keys() const -> Vec<String>;

   private:
    StringMap<Entry> m_entries;
  };
} // namespace lingo::core
