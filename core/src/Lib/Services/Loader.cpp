#include <algorithm>                 // std::ranges::{find, sort, unique}
#include <fstream>                   // std::ifstream
#include <glaze/core/reflect.hpp>    // glz::format_error
#include <glaze/json/generic.hpp>    // glz::generic
#include <glaze/json/read.hpp>       // glz::read_json
#include <glaze/json/write.hpp>      // glz::write, glz::write_json
#include <iterator>                  // std::istreambuf_iterator
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Lingo++/Services/Loader.hpp>
#include <Lingo++/Services/Locale.hpp>

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Logging.hpp>

using enum lingo::utils::error::LingoErrorCode;

namespace lingo::services::loader {
  namespace {
    namespace fs = std::filesystem;

    using core::Catalog;
    using core::Document;
    using core::DocumentValue;
    using core::Entry;
    using core::MakeEntry;
    using utils::logging::Field;

    using JsonObject = glz::generic::object_t;

    constexpr StringView JSON_EXTENSION = ".json";

    struct SourceDocument {
      String       language;
      String       file;
      glz::generic json;
    };

    struct DirectoryScan {
      Map<String, Vec<String>> filesByLanguage;
      Vec<SourceDocument>      documents;
      usize                    filesSeen = 0;
    };

    auto Emit(const DiagnosticSink& sink, const DiagnosticKind kind, const StringView language, const StringView file, const StringView key, String message) -> Unit {
      if (sink)
        sink(Diagnostic { .kind = kind, .language = String(language), .file = String(file), .key = String(key), .message = std::move(message) });
    }

    auto DescribeJson(const glz::generic& value) -> StringView {
      if (value.is_null())
        return "null";
      if (value.is_boolean())
        return "a boolean";
      if (value.is_number())
        return "a number";
      if (value.is_array())
        return "an array";
      if (value.is_object())
        return "an object";

      return "a string";
    }

    auto ParseJson(const StringView text) -> Result<glz::generic> {
      glz::generic json;

      if (const glz::error_ctx errc = glz::read_json(json, text))
        ERR_FMT(ParseError, "Invalid JSON: {}", glz::format_error(errc, text));

      return json;
    }

    auto ReadFile(const fs::path& path) -> Result<String> {
      std::ifstream file(path, std::ios::binary);

      if (!file)
        ERR_FMT(IoError, "Could not open {}", path.string());

      String buffer((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

      if (file.bad())
        ERR_FMT(IoError, "Failed to read {}", path.string());

      return buffer;
    }

    auto ListDirectory(const fs::path& dir) -> Result<Vec<fs::directory_entry>> {
      std::error_code        errc;
      fs::directory_iterator iter(dir, errc);

      if (errc)
        ERR_FMT(IoError, "Could not list {}: {}", dir.string(), errc.message());

      Vec<fs::directory_entry> entries;

      while (iter != fs::directory_iterator()) {
        entries.push_back(*iter);
        iter.increment(errc);

        if (errc)
          ERR_FMT(IoError, "Could not list {}: {}", dir.string(), errc.message());
      }

      std::ranges::sort(entries, {}, [](const fs::directory_entry& entry) { return entry.path().filename(); });

      return entries;
    }

    /**
     * @brief Turns a JSON object into a Document, skipping values of the wrong type.
     *
     * An object value with no string variants left is not a valid entry. Only
     * that key is dropped.
     */
    auto ToDocument(const StringView language, const StringView file, const glz::generic& json, const DiagnosticSink& sink) -> Result<Document> {
      if (!json.is_object())
        ERR_FMT(ParseError, "Top-level value is {}, expected an object", DescribeJson(json));

      Document document;

      for (const auto& [key, value] : json.get<JsonObject>()) {
        if (value.is_string()) {
          document.emplace(key, DocumentValue(value.get<String>()));
          continue;
        }

        if (!value.is_object()) {
          Emit(sink, DiagnosticKind::SkippedValue, language, file, key, std::format("Value is {}, expected a string or an object", DescribeJson(value)));
          continue;
        }

        Map<String, String> variants;

        for (const auto& [variant, text] : value.get<JsonObject>())
          if (text.is_string())
            variants.emplace(variant, text.get<String>());
          else
            Emit(sink, DiagnosticKind::SkippedValue, language, file, key, std::format("Variant '{}' is {}, expected a string", variant, DescribeJson(text)));

        DocumentValue entryValue(std::move(variants));

        if (const Result<Entry> entry = MakeEntry(key, entryValue); !entry) {
          Emit(sink, DiagnosticKind::SkippedValue, language, file, key, entry.error().message);
          continue;
        }

        document.emplace(key, std::move(entryValue));
      }

      return document;
    }

    auto BuildCatalog(const StringView language, const StringView file, const glz::generic& json, const DiagnosticSink& sink) -> Result<Catalog> {
      const Document document = TRY(ToDocument(language, file, json, sink));

      return Catalog::FromDocument(document);
    }

    /**
     * @brief Reports every (language, file) pair where the file exists in another language.
     */
    auto CheckCompleteness(const Map<String, Vec<String>>& filesByLanguage, const DiagnosticSink& sink) -> Unit {
      Vec<String> allFiles;

      for (const auto& [language, files] : filesByLanguage)
        allFiles.insert(allFiles.end(), files.begin(), files.end());

      std::ranges::sort(allFiles);
      const auto duplicates = std::ranges::unique(allFiles);
      allFiles.erase(duplicates.begin(), duplicates.end());

      for (const auto& [language, files] : filesByLanguage)
        for (const String& file : allFiles) {
          if (std::ranges::find(files, file) != files.end())
            continue;

          const auto owner = std::ranges::find_if(filesByLanguage, [&](const auto& pair) {
            return std::ranges::find(pair.second, file) != pair.second.end();
          });

          Emit(sink, DiagnosticKind::MissingFile, language, file, {}, std::format("'{}.json' exists in '{}' but not in '{}'", file, owner->first, language));
        }
    }

    auto CheckLocale(const StringView language, const DiagnosticSink& sink) -> Unit {
      if (!locale::IsWellFormedLocaleTag(language))
        Emit(sink, DiagnosticKind::SuspiciousLocale, language, {}, {}, std::format("'{}' does not look like a locale tag", language));
    }

    auto ScanDirectory(const fs::path& root, const DiagnosticSink& sink) -> Result<DirectoryScan> {
      std::error_code errc;

      if (!fs::exists(root, errc))
        ERR_FMT(NotFound, "Messages directory {} does not exist", root.string());

      if (!fs::is_directory(root, errc))
        ERR_FMT(IoError, "{} is not a directory", root.string());

      const Vec<fs::directory_entry> languageDirs = TRY(ListDirectory(root));

      DirectoryScan scan;

      for (const fs::directory_entry& languageDir : languageDirs) {
        if (!languageDir.is_directory(errc))
          continue;

        const String language = languageDir.path().filename().string();
        CheckLocale(language, sink);

        Vec<String>& files = scan.filesByLanguage[language];

        Result<Vec<fs::directory_entry>> children = ListDirectory(languageDir.path());

        if (!children) {
          Emit(sink, DiagnosticKind::ParseFailure, language, {}, {}, children.error().message);
          continue;
        }

        for (const fs::directory_entry& child : *children) {
          if (!child.is_regular_file(errc) || child.path().extension() != JSON_EXTENSION)
            continue;

          String file = child.path().stem().string();
          files.push_back(file);
          ++scan.filesSeen;

          Result<String> text = ReadFile(child.path());

          if (!text) {
            Emit(sink, DiagnosticKind::ParseFailure, language, file, {}, text.error().message);
            continue;
          }

          Result<glz::generic> json = ParseJson(*text);

          if (!json) {
            Emit(sink, DiagnosticKind::ParseFailure, language, file, {}, json.error().message);
            continue;
          }

          scan.documents.push_back({ .language = language, .file = std::move(file), .json = std::move(*json) });
        }
      }

      CheckCompleteness(scan.filesByLanguage, sink);

      return scan;
    }

    /**
     * @brief Wraps a sink so every diagnostic passing through it is counted.
     */
    auto Counting(const DiagnosticSink& sink, usize& counter) -> DiagnosticSink {
      return [&sink, &counter](const Diagnostic& diagnostic) {
        ++counter;

        if (sink)
          sink(diagnostic);
      };
    }
  } // namespace

  auto FormatDiagnostic(const Diagnostic& diagnostic) -> String {
    String location = diagnostic.language;

    if (!diagnostic.file.empty())
      location += std::format("/{}", diagnostic.file);

    if (!diagnostic.key.empty())
      location += std::format(":{}", diagnostic.key);

    return std::format("[{}] {}: {}", magic_enum::enum_name(diagnostic.kind), location, diagnostic.message);
  }

  auto LogDiagnostic(const Diagnostic& diagnostic) -> Unit {
    Vec<Field> fields { field(kind, magic_enum::enum_name(diagnostic.kind)), field(language, diagnostic.language) };

    if (!diagnostic.file.empty())
      fields.push_back(field(file, diagnostic.file));

    if (!diagnostic.key.empty())
      fields.push_back(field(key, diagnostic.key));

    warn_log_fields(fields, "{}", diagnostic.message);
  }

  auto LoadReport::into(core::Registry& registry) -> Result<> {
    for (const LoadedCatalog& loaded : catalogs)
      if (registry.catalog(loaded.language, loaded.file) != nullptr)
        ERR_FMT(InvalidArgument, "A catalog for '{}/{}' is already registered", loaded.language, loaded.file);

    for (LoadedCatalog& loaded : catalogs)
      TRY_VOID(registry.insert(loaded.language, loaded.file, std::move(loaded.catalog)));

    catalogs.clear();

    return {};
  }

  auto ParseCatalog(const StringView language, const StringView file, const StringView json, const DiagnosticSink& sink) -> Result<Catalog> {
    const glz::generic parsed = TRY(ParseJson(json));

    return BuildCatalog(language, file, parsed, sink);
  }

  auto LoadDirectory(const fs::path& root, const DiagnosticSink& sink) -> Result<LoadReport> {
    LoadReport           report;
    const DiagnosticSink counting = Counting(sink, report.diagnostics);

    DirectoryScan scan = TRY(ScanDirectory(root, counting));
    report.filesSeen   = scan.filesSeen;

    for (SourceDocument& document : scan.documents) {
      Result<Catalog> catalog = BuildCatalog(document.language, document.file, document.json, counting);

      if (!catalog) {
        Emit(counting, DiagnosticKind::ParseFailure, document.language, document.file, {}, catalog.error().message);
        continue;
      }

      report.catalogs.push_back({ .language = std::move(document.language), .file = std::move(document.file), .catalog = std::move(*catalog) });
    }

    report.filesLoaded = report.catalogs.size();

    debug_log("Loaded {}/{} translation files from {}", report.filesLoaded, report.filesSeen, root.string());

    return report;
  }

  auto LoadBundle(const StringView json, const DiagnosticSink& sink) -> Result<LoadReport> {
    const glz::generic bundle = TRY(ParseJson(json));

    if (!bundle.is_object())
      ERR_FMT(ParseError, "Bundle root is {}, expected an object", DescribeJson(bundle));

    LoadReport           report;
    const DiagnosticSink counting = Counting(sink, report.diagnostics);

    Map<String, Vec<String>> filesByLanguage;

    for (const auto& [language, files] : bundle.get<JsonObject>()) {
      CheckLocale(language, counting);

      Vec<String>& names = filesByLanguage[language];

      if (!files.is_object()) {
        Emit(counting, DiagnosticKind::ParseFailure, language, {}, {}, std::format("Language value is {}, expected an object", DescribeJson(files)));
        continue;
      }

      for (const auto& [file, document] : files.get<JsonObject>()) {
        names.push_back(file);
        ++report.filesSeen;

        Result<Catalog> catalog = BuildCatalog(language, file, document, counting);

        if (!catalog) {
          Emit(counting, DiagnosticKind::ParseFailure, language, file, {}, catalog.error().message);
          continue;
        }

        report.catalogs.push_back({ .language = language, .file = file, .catalog = std::move(*catalog) });
      }
    }

    CheckCompleteness(filesByLanguage, counting);

    report.filesLoaded = report.catalogs.size();

    debug_log("Loaded {}/{} translation files from bundle", report.filesLoaded, report.filesSeen);

    return report;
  }

  auto WriteBundle(const fs::path& root, const DiagnosticSink& sink, const bool pretty) -> Result<String> {
    DirectoryScan scan = TRY(ScanDirectory(root, sink));

    JsonObject bundle;

    for (SourceDocument& document : scan.documents) {
      if (Result<Catalog> catalog = BuildCatalog(document.language, document.file, document.json, sink); !catalog) {
        Emit(sink, DiagnosticKind::ParseFailure, document.language, document.file, {}, catalog.error().message);
        continue;
      }

      glz::generic& languageNode = bundle[document.language];

      if (!languageNode.is_object())
        languageNode = JsonObject {};

      languageNode.get<JsonObject>()[document.file] = std::move(document.json);
    }

    String buffer;

    const glz::error_ctx errc =
      pretty
      ? glz::write<glz::opts { .prettify = true }>(bundle, buffer)
      : glz::write_json(bundle, buffer);

    if (errc)
      ERR_FMT(InternalError, "Failed to write bundle: {}", glz::format_error(errc, buffer));

    return buffer;
  }

  auto LoadInto(core::Registry& registry, const fs::path& root, const DiagnosticSink& sink) -> Result<LoadReport> {
    LoadReport report = TRY(LoadDirectory(root, sink));

    TRY_VOID(report.into(registry));

    return report;
  }
} // namespace lingo::services::loader
