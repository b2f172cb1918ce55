#include <Termflex/Layout/Flex.hpp>

#include <algorithm>   // std::ranges::stable_sort, std::max, std::min
#include <matchit.hpp> // matchit::{match, is, _}
#include <numeric>     // std::iota

#include <Termflex/Utils/Logging.hpp>

using namespace termflex::utils::types;
using namespace termflex::utils::logging;

namespace termflex::layout {
  using style::ApplyBox;
  using style::BlockWidth;
  using style::BoxStyle;
  using style::CountLines;

  namespace {
    constexpr i32 MIN_ROW_WIDTH     = 10;
    constexpr i32 MIN_COLUMN_HEIGHT = 3;

    auto ToBoxStyle(const FlexDirection direction, const AlignItems align) -> BoxStyle {
      using matchit::match, matchit::is, matchit::_;
      using enum AlignItems;

      if (direction == FlexDirection::Row)
        return {
          .horizontal = style::HAlign::Left,
          .vertical   = match(align)(
            is | Center = style::VAlign::Middle,
            is | End    = style::VAlign::Bottom,
            is | _      = style::VAlign::Top
          ),
        };

      return {
        .horizontal = match(align)(
          is | Center = style::HAlign::Center,
          is | End    = style::HAlign::Right,
          is | _      = style::HAlign::Left
        ),
        .vertical = style::VAlign::Top,
      };
    }

    auto ToCells(const i32 value) -> usize {
      return static_cast<usize>(std::max(value, 0));
    }
  } // namespace

  auto DistributeFreeSpace(const JustifyContent justify, const i32 freeSpace, const usize count) -> Vec<i32> {
    using matchit::match, matchit::is, matchit::_;
    using enum JustifyContent;

    Vec<i32> slots(count + 1, 0);

    if (count == 0 || freeSpace <= 0)
      return slots;

    const auto n    = static_cast<i32>(count);
    const i32  free = freeSpace;

    const auto atStart = [&] -> void { slots[count] = free; };

    match(justify)(
      is | Start = atStart,
      is | End   = [&] -> void { slots[0] = free; },
      is | Center = [&] -> void {
        slots[0]     = free / 2;
        slots[count] = free - free / 2;
      },
      is | SpaceBetween = [&] -> void {
        if (n == 1) {
          atStart();
          return;
        }

        const i32 per       = free / (n - 1);
        const i32 remainder = free % (n - 1);

        for (i32 i = 1; i < n; ++i)
          slots[i] = per + (i - 1 < remainder ? 1 : 0);
      },
      is | SpaceAround = [&] -> void {
        const i32 per    = free / n;
        const i32 before = per / 2;
        const i32 after  = per - before;

        slots[0] = before;

        for (usize i = 1; i < count; ++i)
          slots[i] = after + before;

        slots[count] = after + free % n;
      },
      is | SpaceEvenly = [&] -> void {
        const i32 per       = free / (n + 1);
        const i32 remainder = free % (n + 1);

        for (i32 i = 0; i <= n; ++i)
          slots[i] = per + (i < remainder ? 1 : 0);
      }
    );

    return slots;
  }

  FlexContainer::FlexContainer(LayoutConfig config, const FlexDirection direction)
    : m_config(config.sanitized()), m_direction(direction) {}

  auto FlexContainer::addItem(FlexItem item) -> FlexContainer& {
    item.flexGrow   = std::max(item.flexGrow, 0);
    item.flexShrink = std::max(item.flexShrink, 0);
    m_items.push_back(std::move(item));
    return *this;
  }

  auto FlexContainer::setJustifyContent(const JustifyContent justify) -> FlexContainer& {
    m_justify = justify;
    return *this;
  }

  auto FlexContainer::setAlignItems(const AlignItems align) -> FlexContainer& {
    m_align = align;
    return *this;
  }

  auto FlexContainer::setFlexWrap(const FlexWrap wrap) -> FlexContainer& {
    m_wrap = wrap;
    return *this;
  }

  auto FlexContainer::setGap(const i32 gap) -> FlexContainer& {
    m_config.gap = std::max(gap, 0);
    return *this;
  }

  auto FlexContainer::setPadding(const i32 padding) -> FlexContainer& {
    m_config.padding = std::max(padding, 0);
    return *this;
  }

  auto FlexContainer::setMargin(const i32 margin) -> FlexContainer& {
    m_config.margin = std::max(margin, 0);
    return *this;
  }

  auto FlexContainer::setMinPanelWidth(const i32 width) -> FlexContainer& {
    m_config.minPanelWidth = std::max(width, 0);
    return *this;
  }

  auto FlexContainer::setTheme(style::Theme theme) -> FlexContainer& {
    m_theme = theme;
    return *this;
  }

  auto FlexContainer::naturalCross(const FlexItem& item) const -> i32 {
    const usize extent = m_direction == FlexDirection::Row ? CountLines(item.content) : BlockWidth(item.content);
    return static_cast<i32>(extent);
  }

  auto FlexContainer::computeLayout() const -> FlexLayout {
    FlexLayout layout;

    if (m_items.empty())
      return layout;

    const bool  isRow = m_direction == FlexDirection::Row;
    const usize count = m_items.size();
    const auto  n     = static_cast<i32>(count);
    const i32   inset = m_config.inset();

    // Main extent of the container
    i32 main = isRow ? m_config.width : m_config.height;

    if (const i32 minimum = isRow ? MIN_ROW_WIDTH : MIN_COLUMN_HEIGHT; main < minimum) {
      main = minimum;
      layout.clamps.set(ClampFlag::ContainerMinimum);
    }

    layout.containerMain = main;

    i32 available = main - 2 * inset - m_config.gap * (n - 1);

    if (available < 0) {
      available = 0;
      layout.clamps.set(ClampFlag::NegativeSpace);
    }

    layout.availableMain = available;

    layout.order.resize(count);
    std::iota(layout.order.begin(), layout.order.end(), usize { 0 });
    std::ranges::stable_sort(layout.order, {}, [this](const usize index) -> i32 { return m_items[index].order; });

    // Basis: explicit when > 0, otherwise an equal share with the remainder
    // handed to the earliest auto items.
    const i32 share     = available / n;
    i32       remainder = available % n;

    layout.sizes.reserve(count);

    i64 basisTotal  = 0;
    i64 growTotal   = 0;
    i64 shrinkTotal = 0;

    for (const usize index : layout.order) {
      const FlexItem& item = m_items[index];

      i32 basis = item.flexBasis;

      if (basis <= 0) {
        basis = share;

        if (remainder > 0) {
          ++basis;
          --remainder;
        }
      }

      layout.sizes.push_back(basis);
      basisTotal += basis;
      growTotal += item.flexGrow;
      shrinkTotal += item.flexShrink > 0 ? item.flexShrink : 1;
    }

    const i64 remaining = static_cast<i64>(available) - basisTotal;

    if (remaining > 0 && growTotal > 0) {
      for (usize i = 0; i < count; ++i)
        layout.sizes[i] += static_cast<i32>(remaining * m_items[layout.order[i]].flexGrow / growTotal);
    } else if (remaining < 0 && shrinkTotal > 0) {
      for (usize i = 0; i < count; ++i) {
        const i32 weight = std::max(m_items[layout.order[i]].flexShrink, 1);
        const i64 shrunk = layout.sizes[i] - (-remaining * weight / shrinkTotal);

        if (shrunk < 0)
          layout.clamps.set(ClampFlag::ShrinkFloor);

        layout.sizes[i] = static_cast<i32>(std::max<i64>(shrunk, 0));
      }
    }

    if (isRow && m_config.minPanelWidth > 0)
      for (i32& size : layout.sizes)
        if (size < m_config.minPanelWidth) {
          size = m_config.minPanelWidth;
          layout.clamps.set(ClampFlag::MinPanelWidth);
        }

    i64 sizeTotal = 0;

    for (const i32 size : layout.sizes)
      sizeTotal += size;

    layout.leftover = static_cast<i32>(available - sizeTotal);

    if (layout.leftover < 0)
      layout.clamps.set(ClampFlag::Overflow);

    // Cross extent: configured size net of insets, otherwise the tallest/widest item
    if (const i32 cross = isRow ? m_config.height : m_config.width; cross > 0)
      layout.crossSize = std::max(cross - 2 * inset, 0);
    else
      for (const FlexItem& item : m_items)
        layout.crossSize = std::max(layout.crossSize, naturalCross(item));

    layout.spacing = DistributeFreeSpace(m_justify, std::max(layout.leftover, 0), count);

    return layout;
  }

  auto FlexContainer::renderItem(const FlexItem& item, const i32 mainSize, const i32 crossSize) const -> String {
    const BoxStyle placement = ToBoxStyle(m_direction, item.alignSelf.value_or(m_align));

    if (m_direction == FlexDirection::Row)
      return ApplyBox(item.content, ToCells(mainSize), ToCells(crossSize), placement);

    return ApplyBox(item.content, ToCells(crossSize), ToCells(mainSize), placement);
  }

  auto FlexContainer::spacer(const i32 mainCells, const i32 crossSize) const -> String {
    if (m_direction == FlexDirection::Row)
      return style::Blank(ToCells(mainCells), ToCells(crossSize));

    return style::Blank(ToCells(crossSize), ToCells(mainCells));
  }

  auto FlexContainer::render() const -> String {
    if (m_items.empty())
      return {};

    const FlexLayout layout = computeLayout();

    if (layout.clamps.any())
      debug_log_fields(
        Vec<Field>({ log_field(available, layout.availableMain), log_field(leftover, layout.leftover) }),
        "flex layout clamped: {}",
        layout.clamps.describe()
      );

    if (m_wrap != FlexWrap::NoWrap)
      debug_log("flex wrap requested; laying out on a single line");

    Vec<String> pieces;
    pieces.reserve(layout.order.size() * 3 + 1);

    const auto pushSpace = [&](const i32 cells) -> void {
      if (cells > 0)
        pieces.push_back(spacer(cells, layout.crossSize));
    };

    pushSpace(layout.spacing.front());

    for (usize i = 0; i < layout.order.size(); ++i) {
      if (i > 0)
        pushSpace(m_config.gap + layout.spacing[i]);

      pieces.push_back(renderItem(m_items[layout.order[i]], layout.sizes[i], layout.crossSize));
    }

    pushSpace(layout.spacing.back());

    const String joined = m_direction == FlexDirection::Row ? style::JoinHorizontal(pieces) : style::JoinVertical(pieces);

    const String padded = style::PadBlock(joined, ToCells(m_config.padding));

    return style::PadBlock(padded, ToCells(m_config.margin));
  }
} // namespace termflex::layout
