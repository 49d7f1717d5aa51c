/**
 * @file CLI.hpp
 * @brief Command implementations for the lingo executable.
 *
 * - resolve: prints one translated string
 * - check: reports problems in a messages directory
 * - list: shows loaded languages, files and key counts
 * - bundle: writes the single-document bundle form
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include <Lingo++/Core/Registry.hpp>
#include <Lingo++/Core/Resolver.hpp>

#include <Lingo++/Utils/Error.hpp>
#include <Lingo++/Utils/Types.hpp>

namespace lingo::cli {
  /**
   * @brief Options of a single resolve command.
   */
  struct ResolveRequest {
    utils::types::String                      file;
    utils::types::String                      key;
    utils::types::Option<utils::types::i64>   count;
    utils::types::Option<utils::types::String> gender;
    utils::types::Vec<utils::types::String>   args;  ///< Positional values, in order.
    utils::types::Vec<utils::types::String>   named; ///< `name=value` pairs.
  };

  /**
   * @brief Splits `name=value` pairs. The value may contain further '=' characters.
   * @return InvalidArgument for a pair without '=' or with an empty name.
   */
  auto ParseNamedArgs(const utils::types::Vec<utils::types::String>& pairs)
    -> utils::types::Result<utils::types::Map<utils::types::String, utils::types::String>>;

  /**
   * @brief Builds the resolver query for a request.
   * @return InvalidArgument if the key or file is empty, or if both a count and a gender are given.
   */
  auto BuildQuery(const ResolveRequest& request) -> utils::types::Result<core::Query>;

  /**
   * @brief Prints the resolved string.
   * @return Process exit code: 1 when the text is missing, 0 otherwise.
   */
  auto RunResolve(const core::Registry& registry, const ResolveRequest& request) -> utils::types::i32;

  /**
   * @brief Loads a messages directory, printing every diagnostic and a summary.
   * @return Process exit code: 1 when anything was reported or the directory is unusable.
   */
  auto RunCheck(const std::filesystem::path& messagesDir) -> utils::types::i32;

  /**
   * @brief Prints languages, files and key counts.
   */
  auto RunList(const core::Registry& registry) -> utils::types::Unit;

  /**
   * @brief Writes the bundle document for a messages directory to `output`, or stdout for "-".
   * @return Process exit code.
   */
  auto RunBundle(const std::filesystem::path& messagesDir, utils::types::StringView output) -> utils::types::i32;
} // namespace lingo::cli
