#pragma once

#include <Termflex/Utils/Types.hpp>

namespace termflex::layout {
  namespace types = ::termflex::utils::types;

  /**
   * @struct LayoutConfig
   * @brief Box constraints shared by every container, in terminal cells.
   *
   * A width or height of 0 means "natural": the extent is taken from the
   * content. minPanelWidth is only honoured by row flex containers.
   */
  struct LayoutConfig {
    types::i32 width         = 0;
    types::i32 height        = 0;
    types::i32 padding       = 0;
    types::i32 margin        = 0;
    types::i32 gap           = 0;
    types::i32 minPanelWidth = 0;

    /**
     * @brief Copy with every negative field raised to 0.
     */
    [[nodiscard]] auto sanitized() const -> LayoutConfig;

    /**
     * @brief Cells consumed on one side by padding plus margin.
     */
    [[nodiscard]] auto inset() const -> types::i32 {
      return padding + margin;
    }
  };

  /**
   * @enum ClampFlag
   * @brief A silent degradation applied while computing a layout.
   */
  enum class ClampFlag : types::u8 {
    ContainerMinimum = 1 << 0, ///< Container main size raised to its minimum.
    NegativeSpace    = 1 << 1, ///< Padding, margin and gaps exceeded the size; available space set to 0.
    ShrinkFloor      = 1 << 2, ///< An item would have shrunk below 0 cells.
    MinPanelWidth    = 1 << 3, ///< An item was widened to minPanelWidth.
    Overflow         = 1 << 4, ///< Resolved sizes exceed the available space.
    CellIndexIgnored = 1 << 5, ///< A grid write fell outside the grid.
  };

  /**
   * @brief Set of ClampFlag values.
   */
  class ClampFlags {
   public:
    constexpr ClampFlags() = default;

    constexpr auto set(const ClampFlag flag) -> ClampFlags& {
      m_bits |= static_cast<types::u8>(flag);
      return *this;
    }

    [[nodiscard]] constexpr auto has(const ClampFlag flag) const -> bool {
      return (m_bits & static_cast<types::u8>(flag)) != 0;
    }

    [[nodiscard]] constexpr auto any() const -> bool {
      return m_bits != 0;
    }

    [[nodiscard]] constexpr auto bits() const -> types::u8 {
      return m_bits;
    }

    constexpr auto operator|=(const ClampFlags other) -> ClampFlags& {
      m_bits |= other.m_bits;
      return *this;
    }

    constexpr auto operator==(const ClampFlags&) const -> bool = default;

    /**
     * @brief Names of the set flags, e.g. "NegativeSpace|Overflow"; "" when none.
     */
    [[nodiscard]] auto describe() const -> types::String;

    /**
     * @brief Names of the set flags as a list.
     */
    [[nodiscard]] auto names() const -> types::Vec<types::String>;

   private:
    types::u8 m_bits = 0;
  };
} // namespace termflex::layout
