/**
 * @file ArgumentParser.hpp
 * @brief Small command-line parser used by the termflex demo.
 *
 * Supports flags, typed values with defaults (bool, i32, String), enum
 * choices derived with magic_enum, `--name value` and `--name=value` forms,
 * and binding parsed values straight into an options struct.
 *
 * Enum choices are matched loosely: case, '-' and '_' are ignored, so the
 * enumerator `SpaceBetween` accepts `space-between`, `space_between` and
 * `SPACEBETWEEN`. Help output lists choices in kebab-case.
 */

#pragma once

#include <algorithm>                 // std::ranges::transform, std::ranges::find
#include <cctype>                    // std::tolower, std::isupper
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::convertible_to, std::same_as
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_values, magic_enum::enum_name
#include <utility>                   // std::forward
#include <variant>                   // std::variant, std::visit

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace termflex::utils::argparse {
  namespace error   = ::termflex::utils::error;
  namespace logging = ::termflex::utils::logging;
  namespace types   = ::termflex::utils::types;

  using enum error::TermflexErrorCode;

  class Argument;

  using ArgValue   = std::variant<bool, types::i32, types::String>;
  using ArgBinding = types::Fn<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  /**
   * @brief Lower-cases and strips '-' and '_' so choice spellings compare equal.
   */
  inline auto NormalizeChoice(const types::StringView text) -> types::String {
    types::String result;
    result.reserve(text.size());

    for (const char chr : text)
      if (chr != '-' && chr != '_')
        result += static_cast<char>(std::tolower(static_cast<types::u8>(chr)));

    return result;
  }

  /**
   * @brief "SpaceBetween" -> "space-between".
   */
  inline auto ToKebabCase(const types::StringView text) -> types::String {
    types::String result;
    result.reserve(text.size() + 4);

    for (types::usize i = 0; i < text.size(); ++i) {
      const auto chr = static_cast<types::u8>(text[i]);

      if (std::isupper(chr) && i > 0)
        result += '-';

      result += static_cast<char>(std::tolower(chr));
    }

    return result;
  }

  template <typename EnumType>
  concept ChoiceEnum = magic_enum::is_scoped_enum_v<EnumType>;

  /**
   * @brief magic_enum-backed conversions between an enum and its CLI spelling.
   */
  template <ChoiceEnum EnumType>
  struct EnumTraits {
    static auto choices() -> const ArgChoices& {
      static const ArgChoices Cached = [] -> ArgChoices {
        ArgChoices vec;

        for (const EnumType value : magic_enum::enum_values<EnumType>())
          vec.emplace_back(ToKebabCase(magic_enum::enum_name(value)));

        return vec;
      }();

      return Cached;
    }

    static auto fromString(const types::StringView str) -> types::Option<EnumType> {
      const types::String wanted = NormalizeChoice(str);

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        if (NormalizeChoice(magic_enum::enum_name(value)) == wanted)
          return value;

      return types::None;
    }

    static auto toString(const EnumType value) -> types::String {
      return ToKebabCase(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief One option: its aliases, help text, default, parsed value and binding.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String text) -> Argument& {
      m_helpText = std::move(text);
      return *this;
    }

    /**
     * @brief Marks the argument as a boolean switch that takes no value.
     */
    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    /**
     * @brief Sets the default, which also fixes the value type used for parsing.
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i32> || std::same_as<T, types::String>
    auto defaultValue(T value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    auto defaultValue(const char* value) -> Argument& {
      return defaultValue(types::String(value));
    }

    /**
     * @brief Enum default: stores its spelling and restricts input to the
     *        enum's enumerators.
     */
    template <ChoiceEnum EnumType>
    auto defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::toString(value);
      return choices(EnumTraits<EnumType>::choices());
    }

    auto choices(ArgChoices allowed) -> Argument& {
      m_choices = std::move(allowed);
      return *this;
    }

    /**
     * @brief Accept only values within [min, max] (integers only).
     */
    auto range(const types::i32 min, const types::i32 max) -> Argument& {
      m_range = types::Pair<types::i32, types::i32> { min, max };
      return *this;
    }

    template <typename T>
    [[nodiscard]] auto get() const -> T {
      if (m_value)
        if (const T* value = std::get_if<T>(&*m_value))
          return *value;

      if (m_defaultValue)
        if (const T* value = std::get_if<T>(&*m_defaultValue))
          return *value;

      return T {};
    }

    template <ChoiceEnum EnumType>
    [[nodiscard]] auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::fromString(get<types::String>())
        .value_or(magic_enum::enum_values<EnumType>().front());
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto names() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto primaryName() const -> const types::String& {
      return m_names.back();
    }

    [[nodiscard]] auto helpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto allowedChoices() const -> const types::Option<ArgChoices>& {
      return m_choices;
    }

    [[nodiscard]] auto defaultAsString() const -> types::String {
      if (!m_defaultValue)
        return {};

      return std::visit(
        [](const auto& value) -> types::String {
          using V = std::decay_t<decltype(value)>;

          if constexpr (std::is_same_v<V, bool>)
            return value ? "true" : "false";
          else if constexpr (std::is_same_v<V, types::String>)
            return value;
          else
            return std::format("{}", value);
        },
        *m_defaultValue
      );
    }

    /**
     * @brief Converts raw command-line text to the argument's type and stores it.
     */
    auto setValue(const types::StringView raw) -> types::Result<> {
      if (m_choices) {
        const types::String wanted = NormalizeChoice(raw);

        const auto match = std::ranges::find_if(*m_choices, [&](const types::String& choice) -> bool {
          return NormalizeChoice(choice) == wanted;
        });

        if (match == m_choices->end()) {
          types::String allowed;

          for (const types::String& choice : *m_choices) {
            if (!allowed.empty())
              allowed += ", ";
            allowed += choice;
          }

          ERR_FMT(InvalidArgument, "Invalid value '{}' for {}. Allowed values: {}", raw, primaryName(), allowed);
        }

        m_value  = *match;
        m_isUsed = true;
        return {};
      }

      if (m_defaultValue && std::holds_alternative<types::i32>(*m_defaultValue)) {
        types::i32 parsed = 0;

        const auto [ptr, errc] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);

        if (errc != std::errc() || ptr != raw.data() + raw.size())
          ERR_FMT(ParseError, "Expected an integer for {}, got '{}'", primaryName(), raw);

        if (m_range && (parsed < m_range->first || parsed > m_range->second))
          ERR_FMT(InvalidArgument, "{} must be between {} and {}, got {}", primaryName(), m_range->first, m_range->second, parsed);

        m_value = parsed;
      } else
        m_value = types::String(raw);

      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Copies the parsed value (or default) into member on applyBindings().
     *
     * @code
     *   parser.addArguments("-W", "--width").defaultValue(0).bindTo(opts.width);
     * @endcode
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i32> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) -> void { member = arg.get<T>(); };
      return *this;
    }

    template <ChoiceEnum EnumType>
    auto bindTo(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) -> void { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    /**
     * @brief Binds through a conversion, e.g. a log level string to a LogLevel.
     */
    template <typename T, typename Func>
      requires std::invocable<Func, const Argument&> && std::convertible_to<std::invoke_result_t<Func, const Argument&>, T>
    auto bindTo(T& member, Func&& transform) -> Argument& {
      m_binding = [&member, transform = std::forward<Func>(transform)](const Argument& arg) -> void {
        member = transform(arg);
      };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String>                          m_names;
    types::String                                      m_helpText;
    types::Option<ArgValue>                            m_value;
    types::Option<ArgValue>                            m_defaultValue;
    types::Option<ArgChoices>                          m_choices;
    types::Option<types::Pair<types::i32, types::i32>> m_range;
    ArgBinding                                         m_binding;
    bool                                               m_isFlag {};
    bool                                               m_isUsed {};
  };

  /**
   * @brief Collection of arguments plus the parse loop.
   *
   * `-h/--help` and `-v/--version` are registered automatically. Parsing stops
   * at either of them and reports it through helpRequested() and
   * versionRequested(); the caller decides whether to print and exit.
   */
  class ArgumentParser {
   public:
    ArgumentParser(types::String programName, types::String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      Argument& arg = *m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));

      for (const types::String& name : arg.names())
        m_lookup[name] = &arg;

      return arg;
    }

    /**
     * @brief Parses argv-style input. args[0] is the program name and skipped.
     */
    auto parseArgs(const types::Span<const types::StringView> args) -> types::Result<> {
      for (types::usize i = 1; i < args.size(); ++i) {
        types::StringView            token = args[i];
        types::Option<types::String> inlineValue;

        if (token.starts_with("--"))
          if (const types::usize eq = token.find('='); eq != types::StringView::npos) {
            inlineValue = types::String(token.substr(eq + 1));
            token       = token.substr(0, eq);
          }

        const auto iter = m_lookup.find(token);

        if (iter == m_lookup.end())
          ERR_FMT(InvalidArgument, "Unknown argument: {}", token);

        Argument& argument = *iter->second;

        if (argument.isFlag()) {
          if (inlineValue)
            ERR_FMT(InvalidArgument, "Flag {} does not take a value", token);

          argument.markUsed();

          if (token == "-h" || token == "--help") {
            m_helpRequested = true;
            return {};
          }

          if (token == "-v" || token == "--version") {
            m_versionRequested = true;
            return {};
          }

          continue;
        }

        if (inlineValue) {
          TRY_VOID(argument.setValue(*inlineValue));
          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(InvalidArgument, "Argument {} requires a value", token);

        TRY_VOID(argument.setValue(args[++i]));
      }

      return {};
    }

    auto parseArgs(const types::Span<const char* const> argv) -> types::Result<> {
      const types::Vec<types::StringView> views(argv.begin(), argv.end());
      return parseArgs(types::Span<const types::StringView>(views));
    }

    auto parseArgs(const types::Vec<types::String>& args) -> types::Result<> {
      const types::Vec<types::StringView> views(args.begin(), args.end());
      return parseArgs(types::Span<const types::StringView>(views));
    }

    /**
     * @brief parseArgs() followed by applyBindings().
     */
    template <typename Args>
    auto parseInto(const Args& args) -> types::Result<> {
      TRY_VOID(parseArgs(args));
      applyBindings();
      return {};
    }

    auto applyBindings() const -> types::Unit {
      for (const auto& arg : m_arguments)
        arg->applyBinding();
    }

    template <typename T = types::String>
    [[nodiscard]] auto get(const types::StringView name) const -> T {
      const auto iter = m_lookup.find(name);
      return iter != m_lookup.end() ? iter->second->get<T>() : T {};
    }

    template <ChoiceEnum EnumType>
    [[nodiscard]] auto getEnum(const types::StringView name) const -> EnumType {
      const auto iter = m_lookup.find(name);
      return iter != m_lookup.end() ? iter->second->getEnum<EnumType>() : magic_enum::enum_values<EnumType>().front();
    }

    [[nodiscard]] auto isUsed(const types::StringView name) const -> bool {
      const auto iter = m_lookup.find(name);
      return iter != m_lookup.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto helpRequested() const -> bool {
      return m_helpRequested;
    }

    [[nodiscard]] auto versionRequested() const -> bool {
      return m_versionRequested;
    }

    [[nodiscard]] auto version() const -> const types::String& {
      return m_version;
    }

    /**
     * @brief Usage line plus one block per argument.
     */
    [[nodiscard]] auto helpText() const -> types::String {
      types::String out = std::format("Usage: {}", m_programName);

      for (const auto& arg : m_arguments)
        out += arg->isFlag() ? std::format(" [{}]", arg->primaryName())
                             : std::format(" [{} VALUE]", arg->primaryName());

      out += "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        types::String names;

        for (const types::String& name : arg->names()) {
          if (!names.empty())
            names += ", ";
          names += name;
        }

        out += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->helpText().empty())
          out += std::format("    {}\n", arg->helpText());

        if (const auto& allowed = arg->allowedChoices()) {
          types::String list;

          for (const types::String& choice : *allowed) {
            if (!list.empty())
              list += ", ";
            list += choice;
          }

          out += std::format("    Available values: {}\n", list);
        }

        if (!arg->isFlag() && !arg->defaultAsString().empty())
          out += std::format("    Default: {}\n", arg->defaultAsString());
      }

      return out;
    }

    auto printHelp() const -> types::Unit {
      logging::Print(helpText());
    }

   private:
    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_lookup;
    bool                                       m_helpRequested {};
    bool                                       m_versionRequested {};
  };
} // namespace termflex::utils::argparse
