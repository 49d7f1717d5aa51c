#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv, _dupenv_s, _putenv_s, free

#include "Error.hpp"
#include "Types.hpp"

namespace lingo::utils::env {
  namespace types = ::lingo::utils::types;
  namespace error = ::lingo::utils::error;

  /**
   * @brief Reads an environment variable.
   * @param name The name of the environment variable.
   * @return The value, or a NotFound error when the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
#ifdef _WIN32
    types::CStr* rawPtr     = nullptr;
    types::usize bufferSize = 0;

    const types::i32 err = _dupenv_s(&rawPtr, &bufferSize, name);

    const types::UniquePointer<types::CStr, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      ERR_FMT(error::LingoErrorCode::ConfigurationError, "Failed to read environment variable {}", name);

    if (!ptrManager)
      ERR_FMT(error::LingoErrorCode::NotFound, "Environment variable {} is not set", name);

    return types::String(ptrManager.get());
#else
    const types::PCStr value = std::getenv(name);

    if (!value)
      ERR_FMT(error::LingoErrorCode::NotFound, "Environment variable {} is not set", name);

    return types::String(value);
#endif
  }

  /**
   * @brief Reads an environment variable, treating an empty value as unset.
   */
  [[nodiscard]] inline auto GetNonEmptyEnv(const types::PCStr name) -> types::Option<types::String> {
    if (types::Result<types::String> value = GetEnv(name); value && !value->empty())
      return *value;

    return types::None;
  }

  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Unit {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
  }

  inline auto UnsetEnv(const types::PCStr name) -> types::Unit {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
  }
} // namespace lingo::utils::env
