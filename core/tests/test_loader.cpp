#include <boost/ut.hpp>
#include <algorithm>  // std::ranges::count
#include <filesystem> // std::filesystem::{temp_directory_path, create_directories, remove_all}
#include <format>     // std::format
#include <fstream>    // std::ofstream

#include <Lingo++/Core/Registry.hpp>
#include <Lingo++/Services/Loader.hpp>

#include <Lingo++/Utils/Error.hpp>

namespace fs = std::filesystem;

using namespace lingo::services::loader;
using namespace lingo::utils::types;
using lingo::core::Registry;
using lingo::utils::error::LingoErrorCode;

namespace {
  /**
   * @brief A messages tree in a fresh temporary directory, removed on destruction.
   */
  class MessagesDir {
   public:
    explicit MessagesDir(const StringView name) : m_root(fs::temp_directory_path() / std::format("lingo-test-{}", name)) {
      fs::remove_all(m_root);
      fs::create_directories(m_root);
    }

    MessagesDir(const MessagesDir&)                    = delete;
    auto operator=(const MessagesDir&) -> MessagesDir& = delete;

    ~MessagesDir() {
      std::error_code errc;
      fs::remove_all(m_root, errc);
    }

    auto write(const StringView language, const StringView file, const StringView json) const -> void {
      fs::create_directories(m_root / language);
      std::ofstream(m_root / language / std::format("{}.json", file)) << json;
    }

    [[nodiscard]] auto path() const -> const fs::path& {
      return m_root;
    }

   private:
    fs::path m_root;
  };

  struct Collector {
    Vec<Diagnostic> diagnostics;

    [[nodiscard]] auto sink() -> DiagnosticSink {
      return [this](const Diagnostic& diagnostic) { diagnostics.push_back(diagnostic); };
    }

    [[nodiscard]] auto count(const DiagnosticKind kind) const -> usize {
      return static_cast<usize>(std::ranges::count(diagnostics, kind, &Diagnostic::kind));
    }
  };
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "LoadDirectory builds one catalog per language and file"_test = [] -> void {
    const MessagesDir dir("basic");
    dir.write("en", "ui", R"({"greeting": "Hello", "apples": {"one": "One apple", "many": "{{count}} apples"}})");
    dir.write("fr", "ui", R"({"greeting": "Bonjour"})");

    Collector          collector;
    Result<LoadReport> report = LoadDirectory(dir.path(), collector.sink());

    expect(report.has_value());
    expect(report->filesSeen == 2_ul);
    expect(report->filesLoaded == 2_ul);
    expect(report->diagnostics == 0_ul);
    expect(collector.diagnostics.empty());
    expect(report->catalogs.at(0).language == String("en"));
    expect(report->catalogs.at(1).language == String("fr"));

    Registry registry("fr", "en");
    expect(report->into(registry).has_value());
    expect(report->catalogs.empty());

    const lingo::core::TranslationHandle ui = registry.translation("ui");

    expect(ui.t("greeting") == String("Bonjour"));
    expect(ui.tWithPlural("apples", 3) == String("3 apples"));
  };

  "A file missing from one language is reported once"_test = [] -> void {
    const MessagesDir dir("missing");
    dir.write("en", "ui", R"({"a": "b"})");
    dir.write("en", "menu", R"({"a": "b"})");
    dir.write("fr", "ui", R"({"a": "b"})");

    Collector          collector;
    Result<LoadReport> report = LoadDirectory(dir.path(), collector.sink());

    expect(report.has_value());
    expect(report->diagnostics == 1_ul);
    expect(collector.count(DiagnosticKind::MissingFile) == 1_ul);
    expect(collector.diagnostics.at(0).language == String("fr"));
    expect(collector.diagnostics.at(0).file == String("menu"));
  };

  "Unparsable files are skipped and the rest stay usable"_test = [] -> void {
    const MessagesDir dir("parse");
    dir.write("en", "ui", R"({"ok": "fine"})");
    dir.write("en", "broken", R"({"oops": )");
    dir.write("en", "array", R"(["not", "an", "object"])");

    Collector          collector;
    Result<LoadReport> report = LoadDirectory(dir.path(), collector.sink());

    expect(report.has_value());
    expect(report->filesSeen == 3_ul);
    expect(report->filesLoaded == 1_ul);
    expect(collector.count(DiagnosticKind::ParseFailure) == 2_ul);
  };

  "An invalid entry drops only its own key"_test = [] -> void {
    const MessagesDir dir("invalid-entry");
    dir.write("en", "ui", R"({"ok": "fine", "e": {}})");

    Collector          collector;
    Result<LoadReport> report = LoadDirectory(dir.path(), collector.sink());

    expect(report.has_value());
    expect(report->filesLoaded == 1_ul);
    expect(collector.diagnostics.size() == 1_ul);
    expect(collector.count(DiagnosticKind::SkippedValue) == 1_ul);
    expect(collector.diagnostics.at(0).key == String("e"));

    Registry registry("en", "en");
    expect(report->into(registry).has_value());

    const lingo::core::TranslationHandle ui = registry.translation("ui");

    expect(ui.t("ok") == String("fine"));
    expect(ui.t("e") == String(lingo::core::MISSING_TEXT));
  };

  "An object with no string variants is skipped, not the file"_test = [] -> void {
    Collector                    collector;
    Result<lingo::core::Catalog> catalog = ParseCatalog("en", "ui", R"({"greeting": "Hello", "g": {"female": 1, "male": false}})", collector.sink());

    expect(catalog.has_value());
    expect(catalog->size() == 1_ul);
    expect(catalog->contains("greeting"));
    expect(!catalog->contains("g"));
    expect(collector.count(DiagnosticKind::SkippedValue) == 3_ul);
  };

  "into leaves the registry untouched when a pair is already registered"_test = [] -> void {
    Result<LoadReport> first  = LoadBundle(R"({"en": {"ui": {"greeting": "Hello"}}})", DiagnosticSink {});
    Result<LoadReport> second = LoadBundle(R"({"de": {"ui": {"greeting": "Hallo"}}, "en": {"ui": {"greeting": "Hi"}}})", DiagnosticSink {});

    expect(first.has_value() && second.has_value());

    Registry registry("de", "en");
    expect(first->into(registry).has_value());

    Result<> clash = second->into(registry);

    expect(!clash.has_value());
    expect(clash.error().code == LingoErrorCode::InvalidArgument);
    expect(!registry.hasLanguage("de"));
    expect(second->catalogs.size() == 2_ul);
    expect(registry.translation("ui").t("greeting") == String("Hello"));
  };

  "Values of the wrong type are skipped with a diagnostic"_test = [] -> void {
    const MessagesDir dir("skip");
    dir.write("en", "ui", R"({"n": 5, "ok": "fine", "g": {"female": "Elle", "male": 1}})");

    Collector          collector;
    Result<LoadReport> report = LoadDirectory(dir.path(), collector.sink());

    expect(report.has_value());
    expect(report->filesLoaded == 1_ul);
    expect(collector.count(DiagnosticKind::SkippedValue) == 2_ul);

    const lingo::core::Catalog& catalog = report->catalogs.at(0).catalog;

    expect(catalog.contains("ok"));
    expect(!catalog.contains("n"));
    expect(lingo::core::VariantCount(*catalog.find("g")) == 1_ul);
  };

  "Odd language folder names are flagged"_test = [] -> void {
    const MessagesDir dir("locale");
    dir.write("en", "ui", R"({"a": "b"})");
    dir.write("English", "ui", R"({"a": "b"})");

    Collector          collector;
    Result<LoadReport> report = LoadDirectory(dir.path(), collector.sink());

    expect(report.has_value());
    expect(report->filesLoaded == 2_ul);
    expect(collector.count(DiagnosticKind::SuspiciousLocale) == 1_ul);
  };

  "Non-JSON files are ignored"_test = [] -> void {
    const MessagesDir dir("ignore");
    dir.write("en", "ui", R"({"a": "b"})");
    std::ofstream(dir.path() / "en" / "notes.txt") << "not a catalog";

    Result<LoadReport> report = LoadDirectory(dir.path(), DiagnosticSink {});

    expect(report.has_value());
    expect(report->filesSeen == 1_ul);
  };

  "A missing root is NotFound"_test = [] -> void {
    Result<LoadReport> report = LoadDirectory(fs::temp_directory_path() / "lingo-test-does-not-exist", DiagnosticSink {});

    expect(!report.has_value());
    expect(report.error().code == LingoErrorCode::NotFound);
  };

  "LoadBundle reads the single-document form"_test = [] -> void {
    Collector          collector;
    Result<LoadReport> report = LoadBundle(
      R"({"en": {"ui": {"greeting": "Hello"}, "menu": {"open": "Open"}}, "fr": {"ui": {"greeting": "Bonjour"}}})",
      collector.sink()
    );

    expect(report.has_value());
    expect(report->filesLoaded == 3_ul);
    expect(collector.count(DiagnosticKind::MissingFile) == 1_ul);
  };

  "LoadBundle rejects a non-object document"_test = [] -> void {
    Result<LoadReport> report = LoadBundle("[1, 2]", DiagnosticSink {});

    expect(!report.has_value());
    expect(report.error().code == LingoErrorCode::ParseError);
  };

  "WriteBundle output loads back into the same catalogs"_test = [] -> void {
    const MessagesDir dir("bundle");
    dir.write("en", "ui", R"({"greeting": "Hello", "apples": {"one": "One apple", "many": "{{count}} apples"}})");
    dir.write("fr", "ui", R"({"greeting": "Bonjour"})");
    dir.write("fr", "broken", R"({)");

    Result<String> bundle = WriteBundle(dir.path(), DiagnosticSink {}, false);

    expect(bundle.has_value());

    Result<LoadReport> report = LoadBundle(*bundle, DiagnosticSink {});

    expect(report.has_value());
    expect(report->filesLoaded == 2_ul);

    Registry registry("en", "en");
    expect(report->into(registry).has_value());
    expect(registry.translation("ui").tWithPlural("apples", 4) == String("4 apples"));
  };

  "ParseCatalog converts one document"_test = [] -> void {
    Result<lingo::core::Catalog> catalog = ParseCatalog("en", "ui", R"({"a": "b"})", DiagnosticSink {});
    Result<lingo::core::Catalog> invalid = ParseCatalog("en", "ui", R"("just a string")", DiagnosticSink {});

    expect(catalog.has_value() && catalog->size() == 1_ul);
    expect(!invalid.has_value());
    expect(invalid.error().code == LingoErrorCode::ParseError);
  };

  "FormatDiagnostic names the kind and location"_test = [] -> void {
    const Diagnostic diagnostic { .kind = DiagnosticKind::SkippedValue, .language = "fr", .file = "ui", .key = "n", .message = "Value is a number" };

    expect(FormatDiagnostic(diagnostic) == String("[SkippedValue] fr/ui:n: Value is a number"));
  };

  return 0;
}
