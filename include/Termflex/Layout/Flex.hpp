/**
 * @file Flex.hpp
 * @brief One-dimensional flexbox-style container for pre-rendered text blocks.
 */

#pragma once

#include <Termflex/Layout/LayoutConfig.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Types.hpp>

namespace termflex::layout {
  namespace types = ::termflex::utils::types;

  enum class FlexDirection : types::u8 {
    Row,    ///< Items placed left to right; main axis is width.
    Column, ///< Items stacked top to bottom; main axis is height.
  };

  enum class JustifyContent : types::u8 {
    Start,
    End,
    Center,
    SpaceBetween,
    SpaceAround,
    SpaceEvenly,
  };

  enum class AlignItems : types::u8 {
    Start,
    Center,
    End,
    Stretch,
  };

  /**
   * @note Wrap and WrapReverse are stored but laid out as NoWrap.
   */
  enum class FlexWrap : types::u8 {
    NoWrap,
    Wrap,
    WrapReverse,
  };

  /// flexBasis value meaning "size from the container" (any value <= 0 does too).
  inline constexpr types::i32 AUTO_BASIS = -1;

  /**
   * @struct FlexItem
   * @brief A content block plus its sizing hints.
   */
  struct FlexItem {
    types::String                 content;                 ///< Rendered, possibly multi-line, text.
    types::i32                    flexGrow   = 0;          ///< Share of positive free space.
    types::i32                    flexShrink = 1;          ///< Share of overflow to give back; 0 counts as 1.
    types::i32                    flexBasis  = AUTO_BASIS; ///< Starting main size when > 0.
    types::Option<AlignItems>     alignSelf;               ///< Overrides the container's alignItems.
    types::i32                    order      = 0;          ///< Stable ascending render order.
  };

  /**
   * @struct FlexLayout
   * @brief Geometry computed for one render pass.
   *
   * `order` and `sizes` are in render order. `spacing` has one entry more
   * than there are items: spacing[0] is placed before the first item,
   * spacing[i] between items i-1 and i (on top of the gap) and the last entry
   * after the final item.
   */
  struct FlexLayout {
    types::Vec<types::usize> order;
    types::Vec<types::i32>   sizes;
    types::Vec<types::i32>   spacing;
    types::i32               containerMain = 0;
    types::i32               availableMain = 0;
    types::i32               crossSize     = 0;
    types::i32               leftover      = 0; ///< availableMain minus the sum of sizes; negative on overflow.
    ClampFlags               clamps;
  };

  /**
   * @brief Splits non-negative free space into the n + 1 slots around n items.
   *
   * Integer division throughout; remainders go to the earliest slots except
   * for SpaceAround, which leaves its remainder after the last item.
   */
  auto DistributeFreeSpace(JustifyContent justify, types::i32 freeSpace, types::usize count) -> types::Vec<types::i32>;

  /**
   * @class FlexContainer
   * @brief Lays out FlexItems along one axis and renders them as a single block.
   *
   * @code
   *   FlexContainer row({ .width = 80, .gap = 1 }, FlexDirection::Row);
   *   row.setJustifyContent(JustifyContent::SpaceEvenly)
   *     .addItem({ .content = left, .flexGrow = 1 })
   *     .addItem({ .content = right, .flexGrow = 1 });
   *   String block = row.render();
   * @endcode
   */
  class FlexContainer {
   public:
    FlexContainer(LayoutConfig config, FlexDirection direction);

    auto addItem(FlexItem item) -> FlexContainer&;

    auto setJustifyContent(JustifyContent justify) -> FlexContainer&;
    auto setAlignItems(AlignItems align) -> FlexContainer&;
    auto setFlexWrap(FlexWrap wrap) -> FlexContainer&;
    auto setGap(types::i32 gap) -> FlexContainer&;
    auto setPadding(types::i32 padding) -> FlexContainer&;
    auto setMargin(types::i32 margin) -> FlexContainer&;
    auto setMinPanelWidth(types::i32 width) -> FlexContainer&;
    auto setTheme(style::Theme theme) -> FlexContainer&;

    [[nodiscard]] auto direction() const -> FlexDirection {
      return m_direction;
    }

    [[nodiscard]] auto justifyContent() const -> JustifyContent {
      return m_justify;
    }

    [[nodiscard]] auto alignItems() const -> AlignItems {
      return m_align;
    }

    [[nodiscard]] auto flexWrap() const -> FlexWrap {
      return m_wrap;
    }

    [[nodiscard]] auto config() const -> const LayoutConfig& {
      return m_config;
    }

    [[nodiscard]] auto theme() const -> const style::Theme& {
      return m_theme;
    }

    [[nodiscard]] auto items() const -> const types::Vec<FlexItem>& {
      return m_items;
    }

    [[nodiscard]] auto size() const -> types::usize {
      return m_items.size();
    }

    [[nodiscard]] auto empty() const -> bool {
      return m_items.empty();
    }

    /**
     * @brief Resolves every item's main size and the cross size.
     * @return An empty FlexLayout when there are no items.
     */
    [[nodiscard]] auto computeLayout() const -> FlexLayout;

    /**
     * @brief Renders all items into one block; "" when there are no items.
     */
    [[nodiscard]] auto render() const -> types::String;

   private:
    [[nodiscard]] auto naturalCross(const FlexItem& item) const -> types::i32;
    [[nodiscard]] auto renderItem(const FlexItem& item, types::i32 mainSize, types::i32 crossSize) const -> types::String;
    [[nodiscard]] auto spacer(types::i32 mainCells, types::i32 crossSize) const -> types::String;

    LayoutConfig         m_config;
    FlexDirection        m_direction;
    JustifyContent       m_justify = JustifyContent::Start;
    AlignItems           m_align   = AlignItems::Stretch;
    FlexWrap             m_wrap    = FlexWrap::NoWrap;
    style::Theme         m_theme;
    types::Vec<FlexItem> m_items;
  };
} // namespace termflex::layout
