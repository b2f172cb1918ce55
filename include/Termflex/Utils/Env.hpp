#pragma once

#ifdef _WIN32
  #include <stdlib.h> // NOLINT(*-deprecated-headers)
#endif

#include <charconv> // std::from_chars
#include <cstdlib>  // std::getenv, setenv, unsetenv

#include "Error.hpp"
#include "Types.hpp"

namespace termflex::utils::env {
  namespace types = ::termflex::utils::types;
  namespace error = ::termflex::utils::error;

  using enum error::TermflexErrorCode;

  /**
   * @brief Reads an environment variable.
   * @param name Variable name.
   * @return The value, or NotFound when the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
#ifdef _WIN32
    char*        rawPtr     = nullptr;
    types::usize bufferSize = 0;

    const types::i32 err = _dupenv_s(&rawPtr, &bufferSize, name);

    const types::UniquePointer<char, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      ERR_FMT(ApiUnavailable, "Failed to read environment variable '{}'", name);

    if (!ptrManager)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(ptrManager.get());
#else
    const char* value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
#endif
  }

  /**
   * @brief Reads an environment variable holding a positive cell count
   *        (COLUMNS, LINES).
   */
  [[nodiscard]] inline auto GetEnvCells(const types::PCStr name) -> types::Result<types::i32> {
    const types::String value = TRY(GetEnv(name));

    types::i32 result = 0;

    const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), result);

    if (errc != std::errc() || ptr != value.data() + value.size())
      ERR_FMT(ParseError, "Environment variable '{}' is not an integer: '{}'", name, value);

    if (result <= 0)
      ERR_FMT(InvalidArgument, "Environment variable '{}' must be positive, got {}", name, result);

    return result;
  }

  /**
   * @brief Sets (overwrites) an environment variable.
   */
  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Result<> {
#ifdef _WIN32
    if (_putenv_s(name, value) != 0)
#else
    if (setenv(name, value, 1) != 0)
#endif
      ERR_FMT(InvalidArgument, "Failed to set environment variable '{}'", name);

    return {};
  }

  /**
   * @brief Removes an environment variable.
   */
  inline auto UnsetEnv(const types::PCStr name) -> types::Result<> {
#ifdef _WIN32
    if (_putenv_s(name, "") != 0)
#else
    if (unsetenv(name) != 0)
#endif
      ERR_FMT(InvalidArgument, "Failed to unset environment variable '{}'", name);

    return {};
  }
} // namespace termflex::utils::env
