#pragma once

#include <format>          // std::format (ERR_FMT)
#include <source_location> // std::source_location

#include "Types.hpp"

namespace termflex::utils::error {
  /**
   * @enum TermflexErrorCode
   * @brief Categories of failures reported by the code around the layout engine.
   *
   * The layout engine never fails; these codes cover configuration loading,
   * command-line parsing and terminal queries.
   */
  enum class TermflexErrorCode : types::u8 {
    ApiUnavailable,     ///< A terminal or OS query is unavailable (not a TTY, ioctl failed).
    ConfigurationError, ///< Configuration file present but unusable.
    InternalError,      ///< A logic error inside termflex.
    InvalidArgument,    ///< A caller or command-line argument was invalid.
    IoError,            ///< Reading or writing a file failed.
    NotFound,           ///< A file or environment variable does not exist.
    NotSupported,       ///< The request is not supported in this build or on this platform.
    Other,              ///< Anything not covered above.
    ParseError,         ///< Text could not be parsed (TOML, numbers, enum names).
  };

  /**
   * @struct TermflexError
   * @brief Error payload carried by Result.
   */
  struct TermflexError {
    types::String        message;  ///< Human readable description.
    std::source_location location; ///< Where the error was raised.
    TermflexErrorCode    code;     ///< Error category.

    TermflexError(const TermflexErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}
  };
} // namespace termflex::utils::error

#define ERR(errc, msg)          return ::termflex::utils::types::Err(::termflex::utils::error::TermflexError(errc, msg))
#define ERR_FROM(err)           return ::termflex::utils::types::Err(::termflex::utils::error::TermflexError(err))
#define ERR_FMT(errc, fmt, ...) return ::termflex::utils::types::Err(::termflex::utils::error::TermflexError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Unwraps a Result or returns its error from the enclosing function.
 *
 * @code
 * auto loadLayout() -> Result<LayoutOptions> {
 *   String text = TRY(readFile(path));
 *   return parseLayout(text);
 * }
 * @endcode
 *
 * @note GCC/Clang statement expression; MSVC falls back to a throwing lambda.
 */
#ifdef _MSC_VER
  #define TERMFLEX_CONCAT_IMPL(a, b) a##b
  #define TERMFLEX_CONCAT(a, b)      TERMFLEX_CONCAT_IMPL(a, b)

  #define TRY(expr)            \
    [&]() {                    \
      auto _tmp = (expr);      \
      if (!_tmp)               \
        throw _tmp.error();    \
      return *std::move(_tmp); \
    }()
#else
  #define TRY(expr)                                                       \
    ({                                                                    \
      auto&& _termflex_try_result = (expr);                               \
      if (!_termflex_try_result)                                          \
        return ::termflex::utils::types::Err(_termflex_try_result.error()); \
      std::move(*_termflex_try_result);                                   \
    })
#endif

/**
 * @brief Same as TRY for Result<void>: returns the error, otherwise continues.
 */
#define TRY_VOID(expr)                                                    \
  do {                                                                    \
    auto&& _termflex_try_result = (expr);                                 \
    if (!_termflex_try_result)                                            \
      return ::termflex::utils::types::Err(_termflex_try_result.error()); \
  } while (0)
