#pragma once

#include <chrono>     // std::chrono::system_clock
#include <ctime>      // localtime_r/s, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <stack>      // std::stack (span tracking)
#include <utility>    // std::forward

#ifdef _WIN32
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <windows.h>
#endif

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace termflex::utils::logging {
  namespace types = ::termflex::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes raw text to stdout or stderr.
   * @param text The text to write
   * @param useStderr Write to stderr instead of stdout
   */
  inline auto WriteToConsole(const types::StringView text, bool useStderr = false) -> void {
#ifdef _WIN32
    HANDLE hOutput = GetStdHandle(useStderr ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
    if (hOutput != INVALID_HANDLE_VALUE) {
      DWORD consoleMode = 0;
      if (GetConsoleMode(hOutput, &consoleMode))
        WriteConsoleA(hOutput, text.data(), static_cast<DWORD>(text.size()), nullptr, nullptr);
      else
        WriteFile(hOutput, text.data(), static_cast<DWORD>(text.size()), nullptr, nullptr);
      return;
    }
#endif

#ifdef __cpp_lib_print
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
#else
    if (useStderr)
      std::cerr << text;
    else
      std::cout << text;
#endif
  }

  /**
   * @brief The 16 base terminal colours (256-colour palette indices 0-15).
   *
   * Also used by the layout theme for titles and borders.
   */
  enum class LogColor : types::u8 {
    Black         = 0,
    Red           = 1,
    Green         = 2,
    Yellow        = 3,
    Blue          = 4,
    Magenta       = 5,
    Cyan          = 6,
    White         = 7,
    Gray          = 8,
    BrightRed     = 9,
    BrightGreen   = 10,
    BrightYellow  = 11,
    BrightBlue    = 12,
    BrightMagenta = 13,
    BrightCyan    = 14,
    BrightWhite   = 15,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr const char* RESET_CODE   = "\033[0m";
    static constexpr const char* BOLD_START   = "\033[1m";
    static constexpr const char* ITALIC_START = "\033[3m";
    static constexpr const char* DIM_START    = "\033[2m";

    // BOLD + COLOR + TEXT + RESET
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";

    static constexpr types::PCStr AT_PREFIX = "    at ";
    static constexpr types::PCStr IN_PREFIX = "    in ";
  };

  /**
   * @enum LogLevel
   * @brief Log severities, most verbose first.
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  /**
   * @brief Current minimum level. Layout code logs clamps at Debug, so the
   *        default keeps render output clean.
   */
  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @struct Style
   * @brief ANSI styling options for Stylize().
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  /**
   * @brief Wraps text in the ANSI sequences described by style.
   *
   * White with no attributes is treated as "no style" and returns the text
   * unchanged, so unstyled layouts stay free of escape bytes.
   */
  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle || text.empty())
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 32);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  // Diagnostics go to stderr so rendered layouts on stdout stay intact.
  constexpr auto ShouldUseStderr(const LogLevel level) -> bool {
    return level != LogLevel::Info;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers
  // ─────────────────────────────────────────────────────────────────────────────

  template <typename... Args>
  inline auto Print(const LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...), ShouldUseStderr(level));
  }

  inline auto Print(const LogLevel level, const types::StringView text) {
    WriteToConsole(text, ShouldUseStderr(level));
  }

  inline auto Println(const LogLevel level) {
    WriteToConsole("\n", ShouldUseStderr(level));
  }

  // User-facing output (stdout)
  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String textWithNewline(text);
    textWithNewline += '\n';
    WriteToConsole(textWithNewline);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Timestamp
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief YYYY-MM-DDTHH:MM:SS for the given time, cached per thread per second.
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (
#ifdef _WIN32
        localtime_s(&localTm, &timeT) == 0
#else
        localtime_r(&timeT, &localTm) != nullptr
#endif
      ) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Structured fields
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @struct Field
   * @brief key=value pair appended to a log line.
   */
  struct Field {
    types::StringView key;
    types::String     value;

    template <typename T>
    static auto create(types::StringView k, const T& v) -> Field {
      if constexpr (std::is_same_v<std::decay_t<T>, types::String> || std::is_same_v<std::decay_t<T>, types::StringView> ||
                    std::is_same_v<std::decay_t<T>, const char*> || std::is_same_v<std::decay_t<T>, char*>)
        return Field { k, types::String(v) };
      else if constexpr (std::is_same_v<std::decay_t<T>, bool>)
        return Field { k, v ? "true" : "false" };
      else
        return Field { k, std::format("{}", v) };
    }
  };

  inline auto FormatFields(const types::Vec<Field>& fields) -> types::String {
    if (fields.empty())
      return "";

    types::String result;
    result.reserve(fields.size() * 20);

    for (types::usize i = 0; i < fields.size(); ++i) {
      if (i > 0)
        result += ", ";
      result += Stylize(fields[i].key, { .bold = true });
      result += "=";
      result += fields[i].value;
    }

    return result;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Spans
  // ─────────────────────────────────────────────────────────────────────────────

  struct SpanInfo {
    types::String     name;
    types::Vec<Field> fields;
    types::String     target;
  };

  inline auto GetSpanStack() -> std::stack<SpanInfo>& {
    thread_local std::stack<SpanInfo> SpanStackInstance;
    return SpanStackInstance;
  }

  /**
   * @class SpanGuard
   * @brief Pushes a span for its lifetime; pretty-format log lines list the
   *        active spans under each event.
   */
  class SpanGuard {
   public:
    SpanGuard(types::String name, types::String target, types::Vec<Field> fields = {})
      : m_active(true) {
      GetSpanStack().push(SpanInfo { std::move(name), std::move(fields), std::move(target) });
    }

    ~SpanGuard() {
      if (m_active && !GetSpanStack().empty())
        GetSpanStack().pop();
    }

    SpanGuard(const SpanGuard&)                    = delete;
    auto operator=(const SpanGuard&) -> SpanGuard& = delete;

    SpanGuard(SpanGuard&& other) noexcept : m_active(other.m_active) {
      other.m_active = false;
    }

    auto operator=(SpanGuard&& other) noexcept -> SpanGuard& {
      if (this != &other) {
        if (m_active && !GetSpanStack().empty())
          GetSpanStack().pop();
        m_active       = other.m_active;
        other.m_active = false;
      }
      return *this;
    }

   private:
    bool m_active;
  };

  /**
   * @brief Turns a pretty function name into a module-like target.
   * @details "auto termflex::layout::FlexContainer::render() const" becomes
   *          "termflex::layout::FlexContainer".
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    types::StringView func(funcName);

    auto parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    auto lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    auto         spacePos = func.rfind(' ', lastColonPos);
    types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Core
  // ─────────────────────────────────────────────────────────────────────────────

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    const types::Vec<Field>&    fields,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);
    const types::String     fileLine  = std::format("{}:{}", path(loc.file_name()).filename().string(), loc.line());
    const types::String     fieldsStr = FormatFields(fields);

    const types::LockGuard lock(GetLogMutex());

#ifdef TERMFLEX_PRETTY_LOG
    Print(level, "  ");
    Print(level, Stylize(timestamp, { .color = LogColor::Gray, .dim = true }));
    Print(level, " ");
    Print(level, GetLevelInfo().at(static_cast<types::usize>(level)));
    Print(level, " ");
    Print(level, Stylize(target, { .bold = true }));
    Print(level, ": ");
    Print(level, message);
    if (!fieldsStr.empty()) {
      Print(level, ", ");
      Print(level, fieldsStr);
    }
    Println(level);

    Print(level, Stylize(LogLevelConst::AT_PREFIX, { .color = LogColor::Gray, .italic = true }));
    Print(level, Stylize(fileLine, { .color = LogColor::Gray, .italic = true }));
    Println(level);

    // Outermost span first
    std::stack<SpanInfo>  tempStack = GetSpanStack();
    types::Vec<SpanInfo> spans;
    while (!tempStack.empty()) {
      spans.push_back(tempStack.top());
      tempStack.pop();
    }

    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
      Print(level, Stylize(LogLevelConst::IN_PREFIX, { .color = LogColor::Gray, .italic = true }));
      Print(level, Stylize(it->target + "::", { .color = LogColor::Gray, .italic = true }));
      Print(level, Stylize(it->name, { .color = LogColor::Gray, .bold = true }));
      if (!it->fields.empty()) {
        Print(level, Stylize(" with ", { .color = LogColor::Gray, .italic = true }));
        Print(level, FormatFields(it->fields));
      }
      Println(level);
    }

    Println(level);
#else
    Print(level, Stylize(timestamp, { .color = LogColor::Gray, .dim = true }));
    Print(level, " ");
    Print(level, GetLevelInfo().at(static_cast<types::usize>(level)));
    Print(level, " ");
  #ifndef NDEBUG
    Print(level, Stylize(fileLine, { .color = LogColor::Gray, .italic = true }));
    Print(level, " ");
  #endif
    Print(level, Stylize(target, { .bold = true }));
    Print(level, ": ");
    Print(level, message);
    if (!fieldsStr.empty()) {
      Print(level, ", ");
      Print(level, fieldsStr);
    }
    Println(level);
#endif
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    LogImpl(level, loc, target, types::Vec<Field> {}, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Logs a TermflexError (at its own source location) or an exception.
   */
  template <typename ErrorType>
  auto LogError(
    const LogLevel          level,
    const types::StringView target,
    const ErrorType&        error_obj
  ) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    std::source_location logLocation;
    types::String        errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::TermflexError>) {
      logLocation      = error_obj.location;
      errorMessagePart = error_obj.message;
    } else {
      logLocation = std::source_location::current();
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = error_obj.what();
      else if constexpr (requires { error_obj.message; })
        errorMessagePart = error_obj.message;
      else
        errorMessagePart = "Unknown error type logged";
    }

    LogImpl(level, logLocation, target, "{}", errorMessagePart);
  }
} // namespace termflex::utils::logging

// ─────────────────────────────────────────────────────────────────────────────
// Macros
// ─────────────────────────────────────────────────────────────────────────────

#define TERMFLEX_LOG_TARGET ::termflex::utils::logging::ExtractTarget(__PRETTY_FUNCTION__)

#define log_field(name, value) ::termflex::utils::logging::Field::create(#name, value)

#define span_enter(name, ...)                                                             \
  auto _termflex_span_guard_##__LINE__ = ::termflex::utils::logging::SpanGuard(           \
    #name,                                                                                \
    TERMFLEX_LOG_TARGET,                                                                  \
    ::termflex::utils::types::Vec<::termflex::utils::logging::Field> { __VA_ARGS__ }      \
  )

#define TERMFLEX_LOG_AT(lvl, fmt, ...) \
  ::termflex::utils::logging::LogImpl( \
    ::termflex::utils::logging::LogLevel::lvl, \
    std::source_location::current(), \
    TERMFLEX_LOG_TARGET, \
    fmt __VA_OPT__(, ) __VA_ARGS__)

#define TERMFLEX_LOG_FIELDS_AT(lvl, fields_vec, fmt, ...) \
  ::termflex::utils::logging::LogImpl( \
    ::termflex::utils::logging::LogLevel::lvl, \
    std::source_location::current(), \
    TERMFLEX_LOG_TARGET, \
    fields_vec, \
    fmt __VA_OPT__(, ) __VA_ARGS__)

#define trace_log(fmt, ...) TERMFLEX_LOG_AT(Trace, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log(fmt, ...) TERMFLEX_LOG_AT(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  TERMFLEX_LOG_AT(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  TERMFLEX_LOG_AT(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) TERMFLEX_LOG_AT(Error, fmt __VA_OPT__(, ) __VA_ARGS__)

#define trace_log_fields(fields_vec, fmt, ...) TERMFLEX_LOG_FIELDS_AT(Trace, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log_fields(fields_vec, fmt, ...) TERMFLEX_LOG_FIELDS_AT(Debug, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log_fields(fields_vec, fmt, ...)  TERMFLEX_LOG_FIELDS_AT(Info, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) \
  ::termflex::utils::logging::LogError(::termflex::utils::logging::LogLevel::Debug, TERMFLEX_LOG_TARGET, error_obj)

#define warn_at(error_obj) \
  ::termflex::utils::logging::LogError(::termflex::utils::logging::LogLevel::Warn, TERMFLEX_LOG_TARGET, error_obj)

#define error_at(error_obj) \
  ::termflex::utils::logging::LogError(::termflex::utils::logging::LogLevel::Error, TERMFLEX_LOG_TARGET, error_obj)
