#include "CLI.hpp"

#include <cstdlib>                   // EXIT_FAILURE, EXIT_SUCCESS
#include <fstream>                   // std::ofstream
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Lingo++/Services/Loader.hpp>

#include <Lingo++/Utils/Logging.hpp>

using namespace lingo::utils::types;
using namespace lingo::utils::logging;
using enum lingo::utils::error::LingoErrorCode;

namespace lingo::cli {
  namespace fs = std::filesystem;

  using core::Query;
  using core::Resolution;
  using services::loader::Diagnostic;

  auto ParseNamedArgs(const Vec<String>& pairs) -> Result<Map<String, String>> {
    Map<String, String> named;

    for (const String& pair : pairs) {
      const usize separator = pair.find('=');

      if (separator == String::npos || separator == 0)
        ERR_FMT(InvalidArgument, "Expected name=value, got '{}'", pair);

      named.insert_or_assign(pair.substr(0, separator), pair.substr(separator + 1));
    }

    return named;
  }

  auto BuildQuery(const ResolveRequest& request) -> Result<Query> {
    if (request.file.empty() || request.key.empty())
      ERR(InvalidArgument, "Both --file and --key are required");

    if (request.count && request.gender)
      ERR(InvalidArgument, "--count and --gender cannot be combined");

    Query query { .key = request.key, .selector = core::PlainSelector {}, .args = None };

    if (request.count)
      query.selector = core::PluralSelector { *request.count };
    else if (request.gender)
      query.selector = core::GenderSelector { *request.gender };

    if (!request.args.empty() || !request.named.empty()) {
      Map<String, String> named = TRY(ParseNamedArgs(request.named));
      query.args                = core::Arguments { .positional = request.args, .named = std::move(named) };
    }

    return query;
  }

  auto RunResolve(const core::Registry& registry, const ResolveRequest& request) -> i32 {
    Result<Query> query = BuildQuery(request);

    if (!query) {
      error_at(query.error());
      return EXIT_FAILURE;
    }

    const Resolution resolution = registry.translation(request.file).resolve(*query);

    if (resolution.primaryError)
      debug_log("{} lookup failed: {}", registry.getLanguage(), resolution.primaryError->message);

    Println(resolution.text);

    return resolution.missing ? EXIT_FAILURE : EXIT_SUCCESS;
  }

  auto RunCheck(const fs::path& messagesDir) -> i32 {
    const Result<services::loader::LoadReport> report = services::loader::LoadDirectory(
      messagesDir,
      [](const Diagnostic& diagnostic) { Println(services::loader::FormatDiagnostic(diagnostic)); }
    );

    if (!report) {
      error_at(report.error());
      return EXIT_FAILURE;
    }

    Println(
      "{}: {}/{} files loaded, {} diagnostic{}",
      messagesDir.string(),
      report->filesLoaded,
      report->filesSeen,
      report->diagnostics,
      report->diagnostics == 1 ? "" : "s"
    );

    return report->diagnostics == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  auto RunList(const core::Registry& registry) -> Unit {
    const String current  = registry.getLanguage();
    const String fallback = registry.getFallbackLanguage();

    for (const String& language : registry.languages()) {
      StringView marker;

      if (language == current)
        marker = " (current)";
      else if (language == fallback)
        marker = " (fallback)";

      Println("{}{}", Stylize(language, { .color = LogColor::Cyan, .bold = true }), marker);

      for (const String& file : registry.files(language))
        if (const core::Catalog* catalog = registry.catalog(language, file))
          Println("  {:<24} {} keys", file, catalog->size());
    }
  }

  auto RunBundle(const fs::path& messagesDir, const StringView output) -> i32 {
    const Result<String> bundle = services::loader::WriteBundle(messagesDir);

    if (!bundle) {
      error_at(bundle.error());
      return EXIT_FAILURE;
    }

    if (output == "-") {
      Println(*bundle);
      return EXIT_SUCCESS;
    }

    std::ofstream file { fs::path(output), std::ios::binary | std::ios::trunc };

    if (!file) {
      error_log("Could not open {} for writing", output);
      return EXIT_FAILURE;
    }

    file << *bundle;

    if (!file) {
      error_log("Failed to write {}", output);
      return EXIT_FAILURE;
    }

    info_log("Bundle written to {}", output);

    return EXIT_SUCCESS;
  }
} // namespace lingo::cli
