/**
 * @file Responsive.hpp
 * @brief Breakpoint helpers and ready-made screen recipes built on FlexContainer.
 *
 * Every recipe takes its tunables as an explicit options struct; there is no
 * global layout state.
 */

#pragma once

#include <Termflex/Utils/Types.hpp>

namespace termflex::layout {
  namespace types = ::termflex::utils::types;

  enum class Breakpoint : types::u8 {
    Small,  ///< width < Breakpoints::small
    Medium, ///< Breakpoints::small <= width < Breakpoints::medium
    Large,  ///< width >= Breakpoints::medium
  };

  struct Breakpoints {
    types::i32 small  = 80;
    types::i32 medium = 120;
  };

  /**
   * @struct ResponsiveOptions
   * @brief Tunables for ResponsiveLayout.
   */
  struct ResponsiveOptions {
    Breakpoints breakpoints;
    types::i32  gap           = 1; ///< Cells between columns and lines between stacked sections.
    types::i32  minPanelWidth = 0;
  };

  /**
   * @struct DashboardOptions
   * @brief Height bounds for the header/main/footer recipe.
   */
  struct DashboardOptions {
    types::i32 minHeaderHeight = 1;
    types::i32 maxHeaderHeight = 5;
    types::i32 minFooterHeight = 1;
    types::i32 maxFooterHeight = 3;
    types::i32 minMainHeight   = 3;
  };

  [[nodiscard]] auto GetBreakpoint(types::i32 width, const Breakpoints& breakpoints = {}) -> Breakpoint;

  /**
   * @brief Usable width for a terminal width: 4, 8 or 12 cells narrower
   *        depending on the breakpoint.
   */
  [[nodiscard]] auto GetResponsiveWidth(types::i32 width, const Breakpoints& breakpoints = {}) -> types::Pair<types::i32, Breakpoint>;

  /**
   * @brief Usable height: 2, 4 or 6 lines shorter for terminals under 24,
   *        under 40, and from 40 lines.
   */
  [[nodiscard]] auto GetResponsiveHeight(types::i32 height) -> types::i32;

  /// (horizontal, vertical) padding: (1,0), (2,1) or (3,1).
  [[nodiscard]] auto ResponsivePadding(types::i32 width, const Breakpoints& breakpoints = {}) -> types::Pair<types::i32, types::i32>;

  /// (horizontal, vertical) margin: (0,0), (1,0) or (2,1).
  [[nodiscard]] auto ResponsiveMargin(types::i32 width, const Breakpoints& breakpoints = {}) -> types::Pair<types::i32, types::i32>;

  /**
   * @brief Cuts text to maxLen cells, ending in "..." when maxLen > 3.
   */
  [[nodiscard]] auto TruncateText(types::StringView text, types::i32 maxLen) -> types::String;

  /**
   * @brief Splits total proportionally to weights.
   *
   * Negative weights count as 0; if every weight is 0 they all count as 1.
   * Cells lost to integer division go one each to the earliest entries, so
   * the parts always sum to total.
   */
  [[nodiscard]] auto SplitByWeights(types::i32 total, types::Span<const types::i32> weights) -> types::Vec<types::i32>;

  /**
   * @brief Arranges sections by breakpoint.
   *
   * Small: one column with every section. Medium: the first section beside a
   * sidebar holding the rest, 2:1. Large: up to three equal columns; sections
   * past the third are stacked in the last column.
   *
   * @return "" when sections is empty.
   */
  [[nodiscard]] auto ResponsiveLayout(
    types::i32                       width,
    types::i32                       height,
    const types::Vec<types::String>& sections,
    const ResponsiveOptions&         options = {}
  ) -> types::String;

  /**
   * @brief Main content on the left, sidebar on the right.
   * @param sidebarWidth Sidebar width in cells; <= 0 gives the sidebar one third.
   */
  [[nodiscard]] auto SidebarLayout(
    types::i32        width,
    types::i32        height,
    types::StringView main,
    types::StringView sidebar,
    types::i32        sidebarWidth = 0,
    types::i32        gap          = 1
  ) -> types::String;

  /**
   * @brief Header, main and footer stacked to fill width x height.
   *
   * Header and footer take their line counts, clamped to the option bounds;
   * main takes the rest. When the three do not fit, the header gives up lines
   * first, then the footer. Empty header or footer text is omitted. A height
   * of 0 keeps every region at its natural height.
   */
  [[nodiscard]] auto DashboardLayout(
    types::i32              width,
    types::i32              height,
    types::StringView       header,
    types::StringView       main,
    types::StringView       footer,
    const DashboardOptions& options = {}
  ) -> types::String;

  /**
   * @brief Region heights DashboardLayout would use: {header, main, footer}.
   */
  [[nodiscard]] auto DashboardHeights(
    types::i32              height,
    types::StringView       header,
    types::StringView       main,
    types::StringView       footer,
    const DashboardOptions& options = {}
  ) -> types::Array<types::i32, 3>;
} // namespace termflex::layout
