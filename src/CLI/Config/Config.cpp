#include "Config.hpp"

#include <filesystem>                // std::filesystem::{path, exists, create_directories}
#include <glaze/toml.hpp>            // glz::read, glz::write_file_toml, glz::file_to_buffer
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_entries, enum_name}
#include <system_error>              // std::error_code

#include <Termflex/Utils/ArgumentParser.hpp>
#include <Termflex/Utils/Env.hpp>
#include <Termflex/Utils/Logging.hpp>

using namespace termflex::utils::types;
using termflex::utils::env::GetEnv;
using termflex::utils::logging::LogColor;

namespace fs = std::filesystem;

using enum termflex::utils::error::TermflexErrorCode;

// glaze's TOML reader has no std::optional support: integers start at their
// defaults so absent keys keep them, and colour names use "" for "not set".
namespace {
  struct TomlLayout {
    i32 breakpointSmall  = termflex::layout::Breakpoints {}.small;
    i32 breakpointMedium = termflex::layout::Breakpoints {}.medium;
    i32 gap              = 1;
    i32 minPanelWidth    = 0;
    i32 sidebarWidth     = 0;
    i32 minHeaderHeight  = termflex::layout::DashboardOptions {}.minHeaderHeight;
    i32 maxHeaderHeight  = termflex::layout::DashboardOptions {}.maxHeaderHeight;
    i32 minFooterHeight  = termflex::layout::DashboardOptions {}.minFooterHeight;
    i32 maxFooterHeight  = termflex::layout::DashboardOptions {}.maxFooterHeight;
    i32 minMainHeight    = termflex::layout::DashboardOptions {}.minMainHeight;
  };

  struct TomlTheme {
    String primary;
    String muted;
    String title;
    String accent;
    bool   color = true;
  };

  struct TomlConfig {
    TomlLayout layout;
    TomlTheme  theme;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlLayout> {
  using T = TomlLayout;

  // clang-format off
  static constexpr auto value = object(
    "breakpoint_small",  &T::breakpointSmall,
    "breakpoint_medium", &T::breakpointMedium,
    "gap",               &T::gap,
    "min_panel_width",   &T::minPanelWidth,
    "sidebar_width",     &T::sidebarWidth,
    "min_header_height", &T::minHeaderHeight,
    "max_header_height", &T::maxHeaderHeight,
    "min_footer_height", &T::minFooterHeight,
    "max_footer_height", &T::maxFooterHeight,
    "min_main_height",   &T::minMainHeight
  );
  // clang-format on
};

template <>
struct glz::meta<TomlTheme> {
  using T = TomlTheme;

  static constexpr auto value = object("primary", &T::primary, "muted", &T::muted, "title", &T::title, "accent", &T::accent, "color", &T::color);
};

template <>
struct glz::meta<TomlConfig> {
  using T = TomlConfig;

  static constexpr auto value = object("layout", &T::layout, "theme", &T::theme);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace {
  /**
   * @brief Colour names keyed by their lowercase spelling without '-' or '_'.
   */
  auto ColorsByName() -> const UnorderedMap<String, LogColor>& {
    static const UnorderedMap<String, LogColor> Colors = [] -> UnorderedMap<String, LogColor> {
      UnorderedMap<String, LogColor> map;

      for (const auto& [value, name] : magic_enum::enum_entries<LogColor>())
        map.emplace(termflex::utils::argparse::NormalizeChoice(name), value);

      return map;
    }();

    return Colors;
  }

  /**
   * @brief Resolves a colour name ("BrightBlue", "bright_blue", "cyan") onto target.
   */
  auto ApplyColor(const String& name, const StringView key, LogColor& target) -> Result<> {
    if (name.empty())
      return {};

    const auto& colors = ColorsByName();

    if (const auto iter = colors.find(termflex::utils::argparse::NormalizeChoice(name)); iter != colors.end()) {
      target = iter->second;
      return {};
    }

    ERR_FMT(ConfigurationError, "Unknown colour '{}' for theme.{}", name, key);
  }

  auto ToToml(const termflex::config::Config& cfg) -> TomlConfig {
    return {
      .layout = {
        .breakpointSmall  = cfg.breakpoints.small,
        .breakpointMedium = cfg.breakpoints.medium,
        .gap              = cfg.gap,
        .minPanelWidth    = cfg.minPanelWidth,
        .sidebarWidth     = cfg.sidebarWidth,
        .minHeaderHeight  = cfg.dashboard.minHeaderHeight,
        .maxHeaderHeight  = cfg.dashboard.maxHeaderHeight,
        .minFooterHeight  = cfg.dashboard.minFooterHeight,
        .maxFooterHeight  = cfg.dashboard.maxFooterHeight,
        .minMainHeight    = cfg.dashboard.minMainHeight,
      },
      .theme = {
        .primary = String(magic_enum::enum_name(cfg.theme.primary)),
        .muted   = String(magic_enum::enum_name(cfg.theme.muted)),
        .title   = String(magic_enum::enum_name(cfg.theme.title)),
        .accent  = String(magic_enum::enum_name(cfg.theme.accent)),
        .color   = cfg.theme.color,
      },
    };
  }
} // namespace

namespace termflex::config {
  auto Config::responsiveOptions() const -> layout::ResponsiveOptions {
    return { .breakpoints = breakpoints, .gap = gap, .minPanelWidth = minPanelWidth };
  }

  auto Config::fromToml(const StringView text) -> Result<Config> {
    TomlConfig toml;
    String     buffer(text);

    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(toml, buffer); readError)
      ERR_FMT(ParseError, "Failed to parse config: {}", glz::format_error(readError, buffer));

    const TomlLayout& lay = toml.layout;

    if (lay.breakpointSmall <= 0 || lay.breakpointMedium <= lay.breakpointSmall)
      ERR_FMT(
        ConfigurationError,
        "Breakpoints must satisfy 0 < breakpoint_small < breakpoint_medium (got {} and {})",
        lay.breakpointSmall,
        lay.breakpointMedium
      );

    if (lay.gap < 0 || lay.minPanelWidth < 0 || lay.sidebarWidth < 0)
      ERR(ConfigurationError, "gap, min_panel_width and sidebar_width must not be negative");

    if (lay.minHeaderHeight > lay.maxHeaderHeight || lay.minFooterHeight > lay.maxFooterHeight)
      ERR(ConfigurationError, "Header and footer minimum heights must not exceed their maximums");

    Config cfg;

    cfg.breakpoints   = { .small = lay.breakpointSmall, .medium = lay.breakpointMedium };
    cfg.gap           = lay.gap;
    cfg.minPanelWidth = lay.minPanelWidth;
    cfg.sidebarWidth  = lay.sidebarWidth;
    cfg.dashboard     = {
          .minHeaderHeight = lay.minHeaderHeight,
          .maxHeaderHeight = lay.maxHeaderHeight,
          .minFooterHeight = lay.minFooterHeight,
          .maxFooterHeight = lay.maxFooterHeight,
          .minMainHeight   = lay.minMainHeight,
    };

    TRY_VOID(ApplyColor(toml.theme.primary, "primary", cfg.theme.primary));
    TRY_VOID(ApplyColor(toml.theme.muted, "muted", cfg.theme.muted));
    TRY_VOID(ApplyColor(toml.theme.title, "title", cfg.theme.title));
    TRY_VOID(ApplyColor(toml.theme.accent, "accent", cfg.theme.accent));

    cfg.theme.color = toml.theme.color;

    return cfg;
  }

  auto Config::load(const fs::path& path) -> Result<Config> {
    String buffer;

    if (const auto fileError = glz::file_to_buffer(buffer, path.string()); bool(fileError))
      ERR_FMT(IoError, "Failed to read config file: {}", path.string());

    Result<Config> cfg = fromToml(buffer);

    if (cfg)
      debug_log("Config loaded from {}", path.string());

    return cfg;
  }

  auto Config::writeDefault(const fs::path& path) -> Result<> {
    std::error_code errc;

    if (path.has_parent_path())
      fs::create_directories(path.parent_path(), errc);

    if (errc)
      ERR_FMT(IoError, "Failed to create config directory: {}", errc.message());

    String buffer;

    if (const auto writeError = glz::write_file_toml(ToToml(Config {}), path.string(), buffer); writeError)
      ERR_FMT(IoError, "Failed to write default config: {}", glz::format_error(writeError, buffer));

    info_log("Created default config file at {}", path.string());
    return {};
  }

  auto Config::getConfigPath() -> fs::path {
    Vec<fs::path> possiblePaths;

#ifdef _WIN32
    if (Result<String> result = GetEnv("APPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "termflex" / "config.toml");
#else
    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "termflex" / "config.toml");
#endif

    if (Result<String> result = GetEnv("HOME")) {
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "termflex" / "config.toml");
      possiblePaths.emplace_back(fs::path(*result) / ".termflex" / "config.toml");
    }

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  auto Config::getInstance() -> Config {
    try {
      const fs::path configPath = getConfigPath();

      if (std::error_code errc; !fs::exists(configPath, errc)) {
        info_log("Config file not found at {}, creating defaults.", configPath.string());

        if (Result<> written = writeDefault(configPath); !written)
          warn_at(written.error());

        return {};
      }

      Result<Config> cfg = load(configPath);

      if (!cfg) {
        warn_at(cfg.error());
        return {};
      }

      return *cfg;
    } catch (const fs::filesystem_error& fsErr) {
      warn_log("Filesystem error while loading config: {}", fsErr.what());
      return {};
    }
  }
} // namespace termflex::config
