#pragma once

#include <Termflex/Layout/LayoutConfig.hpp>
#include <Termflex/Utils/Types.hpp>

namespace termflex::layout {
  namespace types = ::termflex::utils::types;

  /**
   * @struct GridLayout
   * @brief Resolved track sizes of a grid.
   */
  struct GridLayout {
    types::Vec<types::i32> columnWidths;
    types::Vec<types::i32> rowHeights;
    ClampFlags             clamps;
  };

  /**
   * @class GridContainer
   * @brief Fixed rows x columns matrix of pre-rendered cells.
   *
   * Tracks share the configured width and height evenly; when the space does
   * not divide evenly the first columns (rows) get one extra cell. A width or
   * height of 0 sizes every column (row) to the widest (tallest) cell.
   */
  class GridContainer {
   public:
    GridContainer(LayoutConfig config, types::usize rows, types::usize columns);

    /**
     * @brief Replaces one cell. Out-of-range coordinates are ignored and
     *        reported by the next computeLayout() as CellIndexIgnored.
     */
    auto setCell(types::usize row, types::usize column, types::String content) -> GridContainer&;

    auto setGap(types::i32 gap) -> GridContainer&;
    auto setPadding(types::i32 padding) -> GridContainer&;
    auto setMargin(types::i32 margin) -> GridContainer&;

    [[nodiscard]] auto cell(types::usize row, types::usize column) const -> types::Option<types::StringView>;

    [[nodiscard]] auto rows() const -> types::usize {
      return m_rows;
    }

    [[nodiscard]] auto columns() const -> types::usize {
      return m_columns;
    }

    [[nodiscard]] auto config() const -> const LayoutConfig& {
      return m_config;
    }

    [[nodiscard]] auto computeLayout() const -> GridLayout;

    /**
     * @brief Renders the grid; "" when it has no rows or no columns.
     */
    [[nodiscard]] auto render() const -> types::String;

   private:
    LayoutConfig                          m_config;
    types::usize                          m_rows;
    types::usize                          m_columns;
    types::Vec<types::Vec<types::String>> m_cells;
    ClampFlags                            m_writeClamps;
  };
} // namespace termflex::layout
