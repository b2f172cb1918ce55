#pragma once

#include <Termflex/Layout/LayoutConfig.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Types.hpp>

namespace termflex::layout {
  namespace types   = ::termflex::utils::types;
  namespace logging = ::termflex::utils::logging;

  struct CardConfig {
    types::i32    width     = 0; ///< Outer width including the border; 0 = natural.
    types::i32    minHeight = 0; ///< Minimum number of body lines.
    types::String title;
    types::String icon;
    bool          border  = true;
    bool          compact = false;
  };

  /**
   * @class Card
   * @brief A metric card: icon and title header, then a value and its label.
   *
   * Compact cards put "value label" on one line and colour the title with the
   * accent; full cards centre the value and the label on separate lines.
   */
  class Card {
   public:
    Card(CardConfig config, types::String value, types::String label, logging::LogColor accent);

    auto setValue(types::String value) -> Card&;
    auto setAccent(logging::LogColor accent) -> Card&;
    auto setTheme(style::Theme theme) -> Card&;

    [[nodiscard]] auto config() const -> const CardConfig& {
      return m_config;
    }

    [[nodiscard]] auto value() const -> const types::String& {
      return m_value;
    }

    [[nodiscard]] auto label() const -> const types::String& {
      return m_label;
    }

    [[nodiscard]] auto render() const -> types::String;

   private:
    [[nodiscard]] auto header() const -> types::String;
    [[nodiscard]] auto contentWidth() const -> types::usize;

    CardConfig        m_config;
    types::String     m_value;
    types::String     m_label;
    logging::LogColor m_accent;
    style::Theme      m_theme;
  };

  /**
   * @brief Width of each of count cards laid side by side with spacing cells
   *        between them; never less than 10.
   */
  auto CardWidth(types::i32 totalWidth, types::i32 count, types::i32 spacing = 2) -> types::i32;
} // namespace termflex::layout
