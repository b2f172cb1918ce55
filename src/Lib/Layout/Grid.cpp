#include <Termflex/Layout/Grid.hpp>

#include <algorithm> // std::max

#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Logging.hpp>

using namespace termflex::utils::types;
using namespace termflex::utils::logging;

namespace termflex::layout {
  namespace {
    /**
     * @brief Splits a configured extent into count equal tracks.
     *
     * configured == 0 gives every track the natural extent.
     */
    auto ResolveTracks(
      const i32   configured,
      const i32   inset,
      const i32   gap,
      const usize count,
      const i32   natural,
      ClampFlags& clamps
    ) -> Vec<i32> {
      if (configured <= 0)
        return Vec<i32>(count, natural);

      const auto n         = static_cast<i32>(count);
      i32        available = configured - 2 * inset - gap * (n - 1);

      if (available < 0) {
        available = 0;
        clamps.set(ClampFlag::NegativeSpace);
      }

      Vec<i32> tracks(count, available / n);

      for (i32 i = 0; i < available % n; ++i)
        ++tracks[static_cast<usize>(i)];

      return tracks;
    }
  } // namespace

  GridContainer::GridContainer(LayoutConfig config, const usize rows, const usize columns)
    : m_config(config.sanitized()), m_rows(rows), m_columns(columns), m_cells(rows, Vec<String>(columns)) {}

  auto GridContainer::setCell(const usize row, const usize column, String content) -> GridContainer& {
    if (row >= m_rows || column >= m_columns) {
      m_writeClamps.set(ClampFlag::CellIndexIgnored);
      debug_log("ignoring write to cell ({}, {}) of a {}x{} grid", row, column, m_rows, m_columns);
      return *this;
    }

    m_cells[row][column] = std::move(content);
    return *this;
  }

  auto GridContainer::setGap(const i32 gap) -> GridContainer& {
    m_config.gap = std::max(gap, 0);
    return *this;
  }

  auto GridContainer::setPadding(const i32 padding) -> GridContainer& {
    m_config.padding = std::max(padding, 0);
    return *this;
  }

  auto GridContainer::setMargin(const i32 margin) -> GridContainer& {
    m_config.margin = std::max(margin, 0);
    return *this;
  }

  auto GridContainer::cell(const usize row, const usize column) const -> Option<StringView> {
    if (row >= m_rows || column >= m_columns)
      return None;

    return StringView(m_cells[row][column]);
  }

  auto GridContainer::computeLayout() const -> GridLayout {
    GridLayout layout { .clamps = m_writeClamps };

    if (m_rows == 0 || m_columns == 0)
      return layout;

    i32 naturalWidth  = 0;
    i32 naturalHeight = 0;

    for (const Vec<String>& row : m_cells)
      for (const String& content : row) {
        naturalWidth  = std::max(naturalWidth, static_cast<i32>(style::BlockWidth(content)));
        naturalHeight = std::max(naturalHeight, static_cast<i32>(style::CountLines(content)));
      }

    layout.columnWidths = ResolveTracks(m_config.width, m_config.inset(), m_config.gap, m_columns, naturalWidth, layout.clamps);
    layout.rowHeights   = ResolveTracks(m_config.height, m_config.inset(), m_config.gap, m_rows, naturalHeight, layout.clamps);

    return layout;
  }

  auto GridContainer::render() const -> String {
    if (m_rows == 0 || m_columns == 0)
      return {};

    const GridLayout layout = computeLayout();

    if (layout.clamps.any())
      debug_log("grid layout clamped: {}", layout.clamps.describe());

    const auto gap = static_cast<usize>(m_config.gap);

    Vec<String> renderedRows;
    renderedRows.reserve(m_rows * 2);

    usize rowWidth = 0;

    for (usize row = 0; row < m_rows; ++row) {
      const auto height = static_cast<usize>(layout.rowHeights[row]);

      Vec<String> pieces;
      pieces.reserve(m_columns * 2);

      rowWidth = 0;

      for (usize col = 0; col < m_columns; ++col) {
        const auto width = static_cast<usize>(layout.columnWidths[col]);

        if (col > 0 && gap > 0) {
          pieces.push_back(style::Blank(gap, height));
          rowWidth += gap;
        }

        pieces.push_back(style::ApplyBox(m_cells[row][col], width, height));
        rowWidth += width;
      }

      if (row > 0 && gap > 0)
        renderedRows.push_back(style::Blank(rowWidth, gap));

      renderedRows.push_back(style::JoinHorizontal(pieces));
    }

    const String grid   = style::JoinVertical(renderedRows);
    const String padded = style::PadBlock(grid, static_cast<usize>(m_config.padding));

    return style::PadBlock(padded, static_cast<usize>(m_config.margin));
  }
} // namespace termflex::layout
