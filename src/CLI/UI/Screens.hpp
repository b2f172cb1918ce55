#pragma once

#include <Termflex/Layout/Flex.hpp>
#include <Termflex/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace termflex::ui {
  namespace types  = ::termflex::utils::types;
  namespace config = ::termflex::config;

  enum class Screen : types::u8 {
    Dashboard,
    Responsive,
    Sidebar,
    Grid,
    Cards,
    Flex,
  };

  struct TerminalSize {
    types::i32 width  = 80;
    types::i32 height = 24;
  };

  /**
   * @struct ScreenOptions
   * @brief Size of the render target and the knobs of the flex playground.
   */
  struct ScreenOptions {
    TerminalSize          size;
    layout::JustifyContent justify   = layout::JustifyContent::SpaceBetween;
    layout::AlignItems     align     = layout::AlignItems::Center;
    layout::FlexDirection  direction = layout::FlexDirection::Row;
  };

  /**
   * @brief Queries the size of the terminal attached to stdout.
   * @return ApiUnavailable when stdout is not a terminal or the query fails.
   */
  auto GetTerminalSize() -> types::Result<TerminalSize>;

  /**
   * @brief Render size for the CLI.
   *
   * Positive overrides win. Otherwise the terminal is queried, then the
   * COLUMNS and LINES variables are read, then 80x24 is used.
   */
  auto ResolveTerminalSize(types::i32 widthOverride, types::i32 heightOverride) -> TerminalSize;

  /**
   * @brief The container behind the flex screen, exposed for --json.
   */
  auto BuildFlexPlayground(const ScreenOptions& options, const config::Config& config) -> layout::FlexContainer;

  auto RenderScreen(Screen screen, const ScreenOptions& options, const config::Config& config) -> types::String;
} // namespace termflex::ui
