#include <boost/ut.hpp>

#include <Lingo++/Utils/Error.hpp>

using namespace boost::ut;
using namespace lingo::utils::error;
using namespace lingo::utils::types;

namespace {
  auto ParseCount(const StringView text) -> Result<i32> {
    if (text.empty())
      ERR(LingoErrorCode::InvalidArgument, "empty count");

    if (text == "many")
      ERR_FMT(LingoErrorCode::ParseError, "'{}' is not a number", text);

    return static_cast<i32>(text.size());
  }

  auto Doubled(const StringView text) -> Result<i32> {
    const i32 count = TRY(ParseCount(text));

    return count * 2;
  }

  auto Validate(const StringView text) -> Result<> {
    TRY_VOID(ParseCount(text));

    return {};
  }
} // namespace

auto main() -> int {
  "LingoError records code, message and location"_test = [] -> void {
    LingoError err(LingoErrorCode::CatalogAbsent, "no catalog for fr/ui");

    expect(err.code == LingoErrorCode::CatalogAbsent);
    expect(err.message == String("no catalog for fr/ui"));
    expect(err.location.line() > 0);
  };

  "ERR_FMT formats the message"_test = [] -> void {
    Result<i32> res = ParseCount("many");

    expect(!res.has_value());
    expect(res.error().code == LingoErrorCode::ParseError);
    expect(res.error().message == String("'many' is not a number"));
  };

  "TRY yields the value on success"_test = [] -> void {
    Result<i32> res = Doubled("abc");

    expect(res.has_value());
    expect(*res == 6);
  };

  "TRY propagates the error"_test = [] -> void {
#ifdef _MSC_VER
    try {
      [[maybe_unused]] Result<i32> res = Doubled("");
      expect(false);
    } catch (const LingoError& e) {
      expect(e.code == LingoErrorCode::InvalidArgument);
    }
#else
    Result<i32> res = Doubled("");

    expect(!res.has_value());
    expect(res.error().code == LingoErrorCode::InvalidArgument);
    expect(res.error().message == String("empty count"));
#endif
  };

  "TRY_VOID discards the value"_test = [] -> void {
    expect(Validate("ok").has_value());
    expect(!Validate("many").has_value());
  };

  return 0;
}
