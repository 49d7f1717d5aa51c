#include <cstdlib> // EXIT_FAILURE, EXIT_SUCCESS

#include <Lingo++/Core/Registry.hpp>
#include <Lingo++/Services/Loader.hpp>

#include <Lingo++/Utils/ArgumentParser.hpp>
#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Logging.hpp>
#include <Lingo++/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"

#ifndef LINGO_VERSION
  #define LINGO_VERSION "0.0.0"
#endif

using namespace lingo::utils::types;
using namespace lingo::utils::logging;
using namespace lingo::config;
using namespace lingo::cli;

struct CliOptions {
  // Modes
  bool   check = false;
  bool   list  = false;
  String bundleOutput;

  // Sources
  String messagesDir;
  String language;
  String fallbackLanguage;

  // Resolve
  ResolveRequest request;

  // Misc
  bool showConfigPath = false;
};

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  using lingo::utils::argparse::ArgumentParser;

  CliOptions     opts;
  ArgumentParser parser("lingo", std::format("lingo {}", LINGO_VERSION));

  parser
    .addArguments("-V", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag();

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level.")
    .defaultValue(LogLevel::Info);

  parser
    .addArguments("--messages")
    .help("Messages directory containing <language>/<file>.json. Overrides messages_dir from lingo.toml.")
    .bindTo(opts.messagesDir);

  parser
    .addArguments("--lang")
    .help("Current language (e.g. 'en', 'fr'). Overrides LINGO_LANG and lingo.toml.")
    .bindTo(opts.language);

  parser
    .addArguments("--fallback")
    .help("Fallback language. Overrides fallback_language from lingo.toml.")
    .bindTo(opts.fallbackLanguage);

  parser
    .addArguments("-f", "--file")
    .help("Logical file to resolve the key in.")
    .bindTo(opts.request.file);

  parser
    .addArguments("-k", "--key")
    .help("Translation key to resolve.")
    .bindTo(opts.request.key);

  parser
    .addArguments("-c", "--count")
    .help("Select a plural variant. The count also fills the first placeholder.")
    .integer()
    .bindTo(opts.request.count);

  parser
    .addArguments("-g", "--gender")
    .help("Select a gendered variant.")
    .bindTo(opts.request.gender);

  parser
    .addArguments("-a", "--arg")
    .help("Positional placeholder value. May be repeated.")
    .bindTo(opts.request.args);

  parser
    .addArguments("-n", "--named")
    .help("Named placeholder value as name=value. May be repeated.")
    .bindTo(opts.request.named);

  parser
    .addArguments("--check")
    .help("Report missing files, unparsable files and suspicious language names, then exit.")
    .flag()
    .bindTo(opts.check);

  parser
    .addArguments("--list")
    .help("List loaded languages, files and key counts, then exit.")
    .flag()
    .bindTo(opts.list);

  parser
    .addArguments("--bundle")
    .help("Write all translations as a single JSON document to the given path ('-' for stdout).")
    .bindTo(opts.bundleOutput);

  parser
    .addArguments("--show-config-path")
    .help("Display the active configuration file location.")
    .flag()
    .bindTo(opts.showConfigPath);

  if (Result<> result = parser.parseInto({ argv, static_cast<usize>(argc) }); !result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  if (parser.isUsed("--help")) {
    parser.printHelp();
    return EXIT_SUCCESS;
  }

  if (parser.isUsed("--version")) {
    Println(parser.getVersion());
    return EXIT_SUCCESS;
  }

  const bool verbose = parser.get<bool>("--verbose");

  if (verbose)
    SetRuntimeLogLevel(LogLevel::Debug);
  else if (parser.isUsed("--log-level"))
    SetRuntimeLogLevel(lingo::utils::argparse::EnumTraits<LogLevel>::stringToEnum(parser.get("--log-level")));

  if (opts.showConfigPath) {
    if (const Option<std::filesystem::path> path = Config::getConfigPath())
      Println(path->string());
    else {
      Println("No lingo.toml found. Searched:");

      for (const std::filesystem::path& candidate : Config::getCandidatePaths())
        Println("  {}", candidate.string());
    }

    return EXIT_SUCCESS;
  }

  const Config config = Config::getInstance();

  if (!verbose && !parser.isUsed("--log-level") && config.general.logLevel)
    SetRuntimeLogLevel(*config.general.logLevel);

  const std::filesystem::path messagesDir = opts.messagesDir.empty() ? config.general.messagesDir : opts.messagesDir;

  if (opts.check)
    return RunCheck(messagesDir);

  if (!opts.bundleOutput.empty())
    return RunBundle(messagesDir, opts.bundleOutput);

  lingo::core::Registry registry(
    opts.language.empty() ? config.general.getLanguage() : opts.language,
    opts.fallbackLanguage.empty() ? config.general.fallbackLanguage : opts.fallbackLanguage
  );

  if (Result<lingo::services::loader::LoadReport> report = lingo::services::loader::LoadInto(registry, messagesDir); !report) {
    error_at(report.error());
    return EXIT_FAILURE;
  }

  debug_log("Current language '{}', fallback '{}'", registry.getLanguage(), registry.getFallbackLanguage());

  if (opts.list) {
    RunList(registry);
    return EXIT_SUCCESS;
  }

  if (opts.request.file.empty() || opts.request.key.empty()) {
    parser.printHelp();
    return EXIT_FAILURE;
  }

  return RunResolve(registry, opts.request);
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
