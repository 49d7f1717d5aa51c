#include "../include/lingo_c.h"

#include <cstring>

#include <Lingo++/Core/Registry.hpp>
#include <Lingo++/Services/Loader.hpp>

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Types.hpp>

using namespace lingo::core;
using namespace lingo::utils::types;

namespace loader = lingo::services::loader;

// Convert C++ LingoErrorCode to C LingoErrorCode enum value
#define TO_C_ERROR(err) static_cast<::LingoErrorCode>(static_cast<u8>((err).code))

namespace {
  auto DupString(const StringView str) -> CStr* {
    CStr* result = new CStr[str.size() + 1];
    std::memcpy(result, str.data(), str.size());
    result[str.size()] = '\0';
    return result;
  }

  auto Finish(const Resolution& resolution, bool* out_missing) -> CStr* {
    if (out_missing)
      *out_missing = resolution.missing;

    return DupString(resolution.text);
  }

  auto Apply(Result<loader::LoadReport> report, Registry& registry, size_t* out_diagnostics) -> LingoErrorCode {
    if (!report)
      return TO_C_ERROR(report.error());

    if (out_diagnostics)
      *out_diagnostics = report->diagnostics;

    if (Result<> inserted = report->into(registry); !inserted)
      return TO_C_ERROR(inserted.error());

    return LINGO_SUCCESS;
  }
} // namespace

struct LingoRegistry {
  Registry inner;

  LingoRegistry(String language, String fallback) : inner(std::move(language), std::move(fallback)) {}
};

extern "C" {
  auto LingoCreateRegistry(PCStr language, PCStr fallback) -> LingoRegistry* {
    return new LingoRegistry(language ? language : "en", fallback ? fallback : "en");
  }

  auto LingoDestroyRegistry(LingoRegistry* registry) -> void {
    delete registry;
  }

  auto LingoFreeString(CStr* str) -> void {
    delete[] str;
  }

  auto LingoLoadDirectory(LingoRegistry* registry, PCStr root, size_t* out_diagnostics) -> LingoErrorCode {
    if (!registry || !root)
      return LINGO_ERROR_INVALID_ARGUMENT;

    return Apply(loader::LoadDirectory(root, loader::DiagnosticSink {}), registry->inner, out_diagnostics);
  }

  auto LingoLoadBundle(LingoRegistry* registry, PCStr json, size_t* out_diagnostics) -> LingoErrorCode {
    if (!registry || !json)
      return LINGO_ERROR_INVALID_ARGUMENT;

    return Apply(loader::LoadBundle(json, loader::DiagnosticSink {}), registry->inner, out_diagnostics);
  }

  auto LingoSetLanguage(LingoRegistry* registry, PCStr language) -> LingoErrorCode {
    if (!registry || !language)
      return LINGO_ERROR_INVALID_ARGUMENT;

    registry->inner.setLanguage(language);
    return LINGO_SUCCESS;
  }

  auto LingoSetFallbackLanguage(LingoRegistry* registry, PCStr language) -> LingoErrorCode {
    if (!registry || !language)
      return LINGO_ERROR_INVALID_ARGUMENT;

    registry->inner.setFallbackLanguage(language);
    return LINGO_SUCCESS;
  }

  auto LingoGetLanguage(const LingoRegistry* registry) -> CStr* {
    return registry ? DupString(registry->inner.getLanguage()) : nullptr;
  }

  auto LingoGetFallbackLanguage(const LingoRegistry* registry) -> CStr* {
    return registry ? DupString(registry->inner.getFallbackLanguage()) : nullptr;
  }

  auto LingoTranslate(const LingoRegistry* registry, PCStr file, PCStr key, bool* out_missing) -> CStr* {
    if (!registry || !file || !key)
      return nullptr;

    return Finish(registry->inner.translation(file).resolve({ .key = key, .selector = PlainSelector {}, .args = None }), out_missing);
  }

  auto LingoTranslatePlural(const LingoRegistry* registry, PCStr file, PCStr key, const int64_t count, bool* out_missing) -> CStr* {
    if (!registry || !file || !key)
      return nullptr;

    return Finish(registry->inner.translation(file).resolve({ .key = key, .selector = PluralSelector { count }, .args = None }), out_missing);
  }

  auto LingoTranslateGender(const LingoRegistry* registry, PCStr file, PCStr key, PCStr gender, bool* out_missing) -> CStr* {
    if (!registry || !file || !key)
      return nullptr;

    return Finish(
      registry->inner.translation(file).resolve({ .key = key, .selector = GenderSelector { gender ? gender : "" }, .args = None }),
      out_missing
    );
  }

  auto LingoTranslateWithArgs(
    const LingoRegistry* registry,
    PCStr                file,
    PCStr                key,
    const PCStr*         args,
    const size_t         arg_count,
    bool*                out_missing
  ) -> CStr* {
    if (!registry || !file || !key || (!args && arg_count > 0))
      return nullptr;

    Arguments arguments;
    arguments.positional.reserve(arg_count);

    for (const PCStr arg : Span<const PCStr>(args, arg_count))
      arguments.positional.emplace_back(arg ? arg : "");

    return Finish(
      registry->inner.translation(file).resolve({ .key = key, .selector = PlainSelector {}, .args = std::move(arguments) }),
      out_missing
    );
  }
}
