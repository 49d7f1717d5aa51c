#include <boost/ut.hpp>
#include <variant> // std::holds_alternative, std::get

#include <Lingo++/Core/Resolver.hpp>

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Types.hpp>

#include "CLI/CLI.hpp"

using namespace lingo::utils::types;
using namespace lingo::cli;
using lingo::core::GenderSelector;
using lingo::core::PlainSelector;
using lingo::core::PluralSelector;
using lingo::core::Query;
using lingo::utils::error::LingoErrorCode;

auto main() -> int {
  using namespace boost::ut;

  "ParseNamedArgs splits on the first equals sign"_test = [] -> void {
    Result<Map<String, String>> named = ParseNamedArgs({ "name=Ada", "expr=a=b", "empty=" });

    expect(named.has_value());
    expect(named->at("name") == String("Ada"));
    expect(named->at("expr") == String("a=b"));
    expect(named->at("empty").empty());
  };

  "ParseNamedArgs rejects pairs without a name"_test = [] -> void {
    Result<Map<String, String>> noEquals = ParseNamedArgs({ "name" });
    Result<Map<String, String>> noName   = ParseNamedArgs({ "=value" });

    expect(!noEquals.has_value());
    expect(noEquals.error().code == LingoErrorCode::InvalidArgument);
    expect(!noName.has_value());
  };

  "BuildQuery picks the selector from the request"_test = [] -> void {
    ResolveRequest plain { .file = "ui", .key = "greeting", .count = None, .gender = None, .args = {}, .named = {} };
    ResolveRequest plural { .file = "ui", .key = "apples", .count = 3, .gender = None, .args = {}, .named = {} };
    ResolveRequest gendered { .file = "ui", .key = "welcome", .count = None, .gender = "female", .args = {}, .named = {} };

    Result<Query> plainQuery    = BuildQuery(plain);
    Result<Query> pluralQuery   = BuildQuery(plural);
    Result<Query> genderedQuery = BuildQuery(gendered);

    expect(plainQuery.has_value() && std::holds_alternative<PlainSelector>(plainQuery->selector));
    expect(!plainQuery->args.has_value());

    expect(pluralQuery.has_value() && std::holds_alternative<PluralSelector>(pluralQuery->selector));
    expect(std::get<PluralSelector>(pluralQuery->selector).count == 3_ll);

    expect(genderedQuery.has_value() && std::holds_alternative<GenderSelector>(genderedQuery->selector));
    expect(std::get<GenderSelector>(genderedQuery->selector).gender == String("female"));
  };

  "BuildQuery carries positional and named arguments"_test = [] -> void {
    ResolveRequest request { .file = "ui", .key = "k", .count = None, .gender = None, .args = { "x", "y" }, .named = { "who=Ada" } };

    Result<Query> query = BuildQuery(request);

    expect(query.has_value());
    expect(query->args.has_value());
    expect(query->args->positional.size() == 2_ul);
    expect(query->args->named.at("who") == String("Ada"));
  };

  "BuildQuery rejects incomplete or conflicting requests"_test = [] -> void {
    ResolveRequest noKey { .file = "ui", .key = "", .count = None, .gender = None, .args = {}, .named = {} };
    ResolveRequest both { .file = "ui", .key = "k", .count = 1, .gender = "male", .args = {}, .named = {} };
    ResolveRequest badNamed { .file = "ui", .key = "k", .count = None, .gender = None, .args = {}, .named = { "oops" } };

    for (const ResolveRequest& request : { noKey, both, badNamed }) {
      Result<Query> query = BuildQuery(request);

      expect(!query.has_value());
      expect(query.error().code == LingoErrorCode::InvalidArgument);
    }
  };

  return 0;
}
