#include <boost/ut.hpp>

#include <Lingo++/Utils/ArgumentParser.hpp>
#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Logging.hpp>
#include <Lingo++/Utils/Types.hpp>

using namespace lingo::utils::types;
using lingo::utils::argparse::ArgumentParser;
using lingo::utils::error::LingoErrorCode;
using lingo::utils::logging::LogLevel;

auto main() -> int {
  using namespace boost::ut;

  "flags default to false and turn on when given"_test = [] -> void {
    ArgumentParser parser("lingo", "1.0.0");
    parser.addArguments("-V", "--verbose").flag();
    parser.addArguments("--check").flag();

    expect(parser.parseArgs(Vec<String> { "lingo", "--verbose" }).has_value());
    expect(parser.get<bool>("-V"));
    expect(parser.isUsed("--verbose"));
    expect(!parser.get<bool>("--check"));
    expect(!parser.isUsed("--check"));
  };

  "string and integer values are parsed"_test = [] -> void {
    ArgumentParser parser("lingo", "1.0.0");
    parser.addArguments("-k", "--key");
    parser.addArguments("-c", "--count").integer();
    parser.addArguments("--messages").defaultValue(String("messages"));

    expect(parser.parseArgs(Vec<String> { "lingo", "-k", "apples", "--count", "-3" }).has_value());
    expect(parser.get("--key") == String("apples"));
    expect(parser.get<i64>("-c") == -3_ll);
    expect(parser.get("--messages") == String("messages"));
    expect(!parser.isUsed("--messages"));
  };

  "a malformed integer is rejected"_test = [] -> void {
    ArgumentParser parser("lingo", "1.0.0");
    parser.addArguments("--count").integer();

    Result<> result = parser.parseArgs(Vec<String> { "lingo", "--count", "12abc" });

    expect(!result.has_value());
    expect(result.error().code == LingoErrorCode::InvalidArgument);
  };

  "unknown options and missing values are errors"_test = [] -> void {
    ArgumentParser parser("lingo", "1.0.0");
    parser.addArguments("--key");

    Result<> unknown = parser.parseArgs(Vec<String> { "lingo", "--nope" });
    Result<> missing = parser.parseArgs(Vec<String> { "lingo", "--key" });

    expect(!unknown.has_value());
    expect(unknown.error().code == LingoErrorCode::InvalidArgument);
    expect(!missing.has_value());
    expect(missing.error().code == LingoErrorCode::InvalidArgument);
  };

  "repeatable options keep every value in order"_test = [] -> void {
    ArgumentParser parser("lingo", "1.0.0");
    parser.addArguments("-a", "--arg").repeatable();

    expect(parser.parseArgs(Vec<String> { "lingo", "-a", "first", "--arg", "second", "-a", "third" }).has_value());

    const Vec<String> values = parser.getAll("--arg");

    expect(values.size() == 3_ul);
    expect(values.at(0) == String("first"));
    expect(values.at(2) == String("third"));
  };

  "enum options accept their names case-insensitively"_test = [] -> void {
    ArgumentParser parser("lingo", "1.0.0");
    LogLevel       level = LogLevel::Error;

    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Info).bindToEnum(level);

    expect(parser.parseInto(Vec<String> { "lingo", "--log-level", "DEBUG" }).has_value());
    expect(level == LogLevel::Debug);

    Result<> rejected = parser.parseArgs(Vec<String> { "lingo", "-l", "loud" });

    expect(!rejected.has_value());
    expect(rejected.error().code == LingoErrorCode::InvalidArgument);
  };

  "bindings fill plain, optional and list members"_test = [] -> void {
    struct Options {
      bool           list = false;
      String         messages;
      Option<i64>    count;
      Option<String> gender;
      Vec<String>    args;
    } options;

    ArgumentParser parser("lingo", "1.0.0");
    parser.addArguments("--list").flag().bindTo(options.list);
    parser.addArguments("--messages").defaultValue(String("messages")).bindTo(options.messages);
    parser.addArguments("--count").integer().bindTo(options.count);
    parser.addArguments("--gender").bindTo(options.gender);
    parser.addArguments("--arg").bindTo(options.args);

    expect(parser.parseInto(Vec<String> { "lingo", "--list", "--count", "5", "--arg", "x", "--arg", "y" }).has_value());

    expect(options.list);
    expect(options.messages == String("messages"));
    expect(options.count.has_value() && *options.count == 5_ll);
    expect(!options.gender.has_value());
    expect(options.args.size() == 2_ul);
  };

  "help and version are recorded, not acted on"_test = [] -> void {
    ArgumentParser parser("lingo", "2.1.0");

    expect(parser.parseArgs(Vec<String> { "lingo", "--help", "-v" }).has_value());
    expect(parser.isUsed("-h"));
    expect(parser.isUsed("--version"));
    expect(parser.getVersion() == String("2.1.0"));
  };

  "help text lists every option with its default"_test = [] -> void {
    ArgumentParser parser("lingo", "1.0.0");
    parser.addArguments("--messages").help("Messages directory").defaultValue(String("messages"));

    const String help = parser.helpText();

    expect(help.contains("--messages"));
    expect(help.contains("Messages directory"));
    expect(help.contains("--help"));
  };

  return 0;
}
