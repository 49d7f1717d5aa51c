/**
 * @file Loader.hpp
 * @brief Builds catalogs from JSON translation files.
 *
 * Two layouts are understood:
 *
 * - A messages directory, `<root>/<language>/<file>.json`, where every JSON
 *   file holds one document.
 * - A bundle, a single JSON document shaped
 *   `{ "<language>": { "<file>": { ...document... } } }`.
 *
 * A document is a JSON object. Each string value is a plain entry. Each object
 * value is a plural entry (keys "none", "one", "many") or a gendered entry
 * (any other keys) whose string fields are the variants.
 *
 * Problems with individual files never abort a load. They are reported to a
 * DiagnosticSink and the offending file or value is skipped.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include <Lingo++/Core/Catalog.hpp>
#include <Lingo++/Core/Registry.hpp>

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Types.hpp>

namespace lingo::services::loader {
  using namespace utils::types;

  enum class DiagnosticKind : u8 {
    ParseFailure,     ///< A file could not be read, parsed or turned into a catalog. It was skipped.
    SkippedValue,     ///< A value inside a document had the wrong type or was not a valid entry. It was skipped.
    MissingFile,      ///< A file present in another language is absent from this one.
    SuspiciousLocale, ///< A language name does not look like a locale tag.
  };

  /**
   * @struct Diagnostic
   * @brief One non-fatal problem found while loading.
   */
  struct Diagnostic {
    DiagnosticKind kind;
    String         language;
    String         file; ///< Logical file name. Empty for language-level diagnostics.
    String         key;  ///< Entry key. Empty unless the problem is inside one entry.
    String         message;
  };

  using DiagnosticSink = Fn<void(const Diagnostic&)>;

  /**
   * @brief Renders a diagnostic on one line, e.g. `[MissingFile] fr/ui: ...`.
   */
  auto FormatDiagnostic(const Diagnostic& diagnostic) -> String;

  /**
   * @brief The default sink. Logs each diagnostic at warn level.
   */
  auto LogDiagnostic(const Diagnostic& diagnostic) -> Unit;

  /**
   * @struct LoadedCatalog
   */
  struct LoadedCatalog {
    String        language;
    String        file;
    core::Catalog catalog;
  };

  /**
   * @struct LoadReport
   * @brief Catalogs built by a load, ordered by language then file.
   */
  struct LoadReport {
    Vec<LoadedCatalog> catalogs;
    usize              filesSeen   = 0; ///< Documents found, including skipped ones.
    usize              filesLoaded = 0; ///< Documents turned into catalogs.
    usize              diagnostics = 0; ///< Diagnostics emitted.

    /**
     * @brief Moves every catalog into a registry, leaving `catalogs` empty.
     *
     * All pairs are checked before anything is inserted, so on error the
     * registry and `catalogs` are both left untouched.
     *
     * @return InvalidArgument if a (language, file) pair is already registered.
     */
    auto into(core::Registry& registry) -> Result<>;
  };

  /**
   * @brief Converts one parsed document into a catalog.
   *
   * Exposed for callers that already hold the JSON text of a single file.
   *
   * @param language Language the document belongs to. Used in diagnostics only.
   * @param file Logical file name. Used in diagnostics only.
   * @param json The document's JSON text.
   * @param sink Receives SkippedValue diagnostics, including one per entry left with no usable variants.
   * @return The catalog; ParseError for malformed JSON or a non-object root.
   */
  auto ParseCatalog(StringView language, StringView file, StringView json, const DiagnosticSink& sink = LogDiagnostic)
    -> Result<core::Catalog>;

  /**
   * @brief Loads every `<language>/<file>.json` under `root`.
   * @return The report; NotFound if `root` does not exist; IoError if it cannot be listed.
   */
  auto LoadDirectory(const std::filesystem::path& root, const DiagnosticSink& sink = LogDiagnostic) -> Result<LoadReport>;

  /**
   * @brief Loads a bundle document.
   * @return The report; ParseError if `json` is not a JSON object.
   */
  auto LoadBundle(StringView json, const DiagnosticSink& sink = LogDiagnostic) -> Result<LoadReport>;

  /**
   * @brief Reads a messages directory and renders it as a bundle document.
   *
   * Only files that load cleanly into a catalog are included.
   *
   * @param root The messages directory.
   * @param sink Receives diagnostics for skipped files and values.
   * @param pretty Indent the output.
   */
  auto WriteBundle(const std::filesystem::path& root, const DiagnosticSink& sink = LogDiagnostic, bool pretty = true)
    -> Result<String>;

  /**
   * @brief Convenience wrapper: LoadDirectory() followed by LoadReport::into().
   */
  auto LoadInto(core::Registry& registry, const std::filesystem::path& root, const DiagnosticSink& sink = LogDiagnostic)
    -> Result<LoadReport>;
} // namespace lingo::services::loader
