#pragma once

#include <filesystem> // std::filesystem::path

#include <Termflex/Layout/Responsive.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Error.hpp>
#include <Termflex/Utils/Types.hpp>

namespace termflex::config {
  namespace types = ::termflex::utils::types;

  /**
   * @struct Config
   * @brief Settings read from config.toml.
   *
   * Every field has a usable default, so a missing file, section or key never
   * prevents rendering.
   */
  struct Config {
    layout::Breakpoints      breakpoints;      ///< [layout] breakpoint_small, breakpoint_medium
    layout::DashboardOptions dashboard;        ///< [layout] min/max header and footer heights, min_main_height
    types::i32               gap           = 1; ///< [layout] gap
    types::i32               minPanelWidth = 0; ///< [layout] min_panel_width
    types::i32               sidebarWidth  = 0; ///< [layout] sidebar_width; 0 = one third
    style::Theme             theme;            ///< [theme]

    /**
     * @brief Options for ResponsiveLayout derived from this config.
     */
    [[nodiscard]] auto responsiveOptions() const -> layout::ResponsiveOptions;

    /**
     * @brief Parses TOML text. Unknown sections and keys are ignored.
     * @return ParseError for malformed TOML, ConfigurationError for values
     *         that parse but make no sense (unknown colour, inverted breakpoints).
     */
    static auto fromToml(types::StringView text) -> types::Result<Config>;

    /**
     * @brief Reads and parses a config file.
     */
    static auto load(const std::filesystem::path& path) -> types::Result<Config>;

    /**
     * @brief Writes a config file holding the default values.
     */
    static auto writeDefault(const std::filesystem::path& path) -> types::Result<>;

    /**
     * @brief First existing config file among the search locations, otherwise
     *        the preferred location.
     *
     * Search order: $XDG_CONFIG_HOME/termflex/config.toml,
     * $HOME/.config/termflex/config.toml, $HOME/.termflex/config.toml,
     * ./config.toml.
     */
    static auto getConfigPath() -> std::filesystem::path;

    /**
     * @brief Loads the user's config, creating a default file on first run.
     *        Falls back to built-in defaults (with a warning) on any failure.
     */
    static auto getInstance() -> Config;
  };
} // namespace termflex::config
