#include <boost/ut.hpp>
#include <atomic> // std::atomic
#include <thread> // std::jthread

#include <Lingo++/Core/Registry.hpp>

#include <Lingo++/Utils/Error.hpp>

using namespace lingo::core;
using lingo::utils::error::LingoErrorCode;

namespace {
  auto Build(const Document& document) -> Catalog {
    Result<Catalog> catalog = Catalog::FromDocument(document);
    return catalog ? std::move(*catalog) : Catalog {};
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "End-to-end lookup through a handle"_test = [] -> void {
    Registry registry("en", "fr");

    expect(registry
             .insert(
               "en",
               "ui",
               Build({
                 { "greeting", "Hello" },
                 {   "apples", Map<String, String> { { "none", "No apples" }, { "one", "One apple" }, { "many", "{{count}} apples" } } },
               })
             )
             .has_value());

    const TranslationHandle ui = registry.translation("ui");

    expect(ui.t("greeting") == String("Hello"));
    expect(ui.tWithPlural("apples", 5) == String("5 apples"));
    expect(ui.tWithPlural("apples", 0) == String("No apples"));
    expect(ui.fallback() == nullptr);

    const Resolution missing = ui.resolve({ .key = "missing_key", .selector = PlainSelector {}, .args = None });

    expect(missing.text == String("Error missing text"));
    expect(missing.missing);
  };

  "Defaults to English for both languages"_test = [] -> void {
    const Registry registry;

    expect(registry.getLanguage() == String("en"));
    expect(registry.getFallbackLanguage() == String("en"));
  };

  "Language setters are unconditional"_test = [] -> void {
    Registry registry;

    registry.setLanguage("xx");
    registry.setFallbackLanguage("yy");

    const LanguageState state = registry.getLanguageState();

    expect(state.current == String("xx"));
    expect(state.fallback == String("yy"));
    expect(registry.translation("ui").t("greeting") == String(MISSING_TEXT));
  };

  "Handles reflect the language at the time they are requested"_test = [] -> void {
    Registry registry("en", "en");

    expect(registry.insert("en", "ui", Build({ { "greeting", "Hello" } })).has_value());
    expect(registry.insert("fr", "ui", Build({ { "greeting", "Bonjour" } })).has_value());

    const TranslationHandle before = registry.translation("ui");
    registry.setLanguage("fr");

    expect(before.t("greeting") == String("Hello"));
    expect(registry.translation("ui").t("greeting") == String("Bonjour"));
  };

  "Handle helpers cover every lookup mode"_test = [] -> void {
    Registry registry("fr", "en");

    expect(registry
             .insert(
               "fr",
               "ui",
               Build({
                 {  "welcome", Map<String, String> { { "female", "Bienvenue {{name}}" }, { "male", "Bienvenu {{name}}" } } },
                 {    "items",          Map<String, String> { { "many", "{{count}} objets dans {{place}}" } } },
                 {  "message",                                                   "{{user}} a écrit {{n}} fois" },
               })
             )
             .has_value());

    expect(registry.insert("en", "ui", Build({ { "only_en", "{{a}} and {{b}}" } })).has_value());

    const TranslationHandle ui = registry.translation("ui");

    expect(ui.tWithGender("welcome", "female") == String("Bienvenue {{name}}"));
    expect(ui.tWithGenderAndArgs("welcome", "male", "Jean") == String("Bienvenu Jean"));
    expect(ui.tWithPluralAndArgs("items", 3, "la boîte") == String("3 objets dans la boîte"));
    expect(ui.tWithArgs("only_en", 1, 2.5) == String("1 and 2.5"));
    expect(ui.tWithNamedArgs("message", { { "user", "Léa" }, { "n", "2" } }) == String("Léa a écrit 2 fois"));
  };

  "Inserting the same catalog twice is rejected"_test = [] -> void {
    Registry registry;

    expect(registry.insert("en", "ui", Build({ { "a", "b" } })).has_value());

    Result<> second = registry.insert("en", "ui", Build({ { "a", "c" } }));

    expect(!second.has_value());
    expect(second.error().code == LingoErrorCode::InvalidArgument);
    expect(registry.translation("ui").t("a") == String("b"));
  };

  "Languages and files are listed sorted"_test = [] -> void {
    Registry registry;

    expect(registry.insert("fr", "menu", Catalog {}).has_value());
    expect(registry.insert("en", "ui", Catalog {}).has_value());
    expect(registry.insert("en", "menu", Catalog {}).has_value());

    expect(registry.languages() == Vec<String> { "en", "fr" });
    expect(registry.files("en") == Vec<String> { "menu", "ui" });
    expect(registry.files("de").empty());
    expect(registry.hasLanguage("fr"));
    expect(!registry.hasLanguage("de"));
    expect(registry.catalog("fr", "menu") != nullptr);
    expect(registry.catalog("fr", "ui") == nullptr);
  };

  "The missing-text handler sees every miss"_test = [] -> void {
    Registry    registry;
    Vec<String> misses;

    registry.setMissingTextHandler([&misses](const StringView file, const Query& query, const Resolution& resolution) {
      if (resolution.missing)
        misses.push_back(std::format("{}:{}", file, query.key));
    });

    expect(registry.insert("en", "ui", Build({ { "a", "b" } })).has_value());

    const TranslationHandle ui = registry.translation("ui");

    expect(ui.t("a") == String("b"));
    expect(ui.t("z") == String(MISSING_TEXT));
    expect(registry.translation("menu").tWithPlural("x", 2) == String(MISSING_TEXT));

    expect(misses == Vec<String> { "ui:z", "menu:x" });
  };

  "Language changes may race with lookups"_test = [] -> void {
    Registry registry;

    expect(registry.insert("en", "ui", Build({ { "greeting", "Hello" } })).has_value());
    expect(registry.insert("fr", "ui", Build({ { "greeting", "Bonjour" } })).has_value());

    bool allResolved = true;

    {
      std::jthread writer([&registry] -> void {
        for (i32 i = 0; i < 1000; ++i)
          registry.setLanguage(i % 2 == 0 ? "fr" : "en");
      });

      for (i32 i = 0; i < 1000; ++i) {
        const String text = registry.translation("ui").t("greeting");
        allResolved       = allResolved && (text == "Hello" || text == "Bonjour");
      }
    }

    expect(allResolved);
  };

  "Handles keep the missing-text handler they were created with"_test = [] -> void {
    Registry registry;
    i32      firstCalls  = 0;
    i32      secondCalls = 0;

    registry.setMissingTextHandler([&firstCalls](StringView, const Query&, const Resolution&) { ++firstCalls; });

    const TranslationHandle before = registry.translation("ui");

    registry.setMissingTextHandler([&secondCalls](StringView, const Query&, const Resolution&) { ++secondCalls; });

    expect(before.t("z") == String(MISSING_TEXT));
    expect(registry.translation("ui").t("z") == String(MISSING_TEXT));
    expect(firstCalls == 1_i);
    expect(secondCalls == 1_i);

    registry.setMissingTextHandler({});
    expect(registry.translation("ui").t("z") == String(MISSING_TEXT));
    expect(secondCalls == 1_i);
  };

  "Replacing the handler may race with lookups"_test = [] -> void {
    Registry         registry;
    std::atomic<i32> misses = 0;

    {
      std::jthread writer([&registry, &misses] -> void {
        for (i32 i = 0; i < 500; ++i)
          registry.setMissingTextHandler([&misses](StringView, const Query&, const Resolution&) { misses.fetch_add(1); });
      });

      for (i32 i = 0; i < 500; ++i)
        expect(registry.translation("ui").t("z") == String(MISSING_TEXT));
    }

    expect(misses.load() <= 500_i);
  };

  return 0;
}
