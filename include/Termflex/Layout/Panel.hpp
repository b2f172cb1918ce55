#pragma once

#include <Termflex/Layout/LayoutConfig.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Types.hpp>

namespace termflex::layout {
  namespace types   = ::termflex::utils::types;
  namespace logging = ::termflex::utils::logging;

  /**
   * @class Panel
   * @brief A titled, optionally bordered box around one content block.
   *
   * Drawn inside out: title line, content, padding, border, margin. The
   * configured width and height are outer sizes that include padding and
   * border (but not margin), so a panel rendered at a flex item's size
   * fills the slot exactly.
   */
  class Panel {
   public:
    Panel(LayoutConfig config, types::String title, types::String content, bool border = true);

    auto setFocused(bool focused) -> Panel&;
    auto setContent(types::String content) -> Panel&;
    auto setTitle(types::String title) -> Panel&;
    auto setBorder(bool border) -> Panel&;
    auto setTheme(style::Theme theme) -> Panel&;

    /**
     * @brief Overrides the border colour; focus still takes precedence.
     */
    auto setBorderColor(logging::LogColor color) -> Panel&;

    [[nodiscard]] auto title() const -> const types::String& {
      return m_title;
    }

    [[nodiscard]] auto content() const -> const types::String& {
      return m_content;
    }

    [[nodiscard]] auto border() const -> bool {
      return m_border;
    }

    [[nodiscard]] auto focused() const -> bool {
      return m_focused;
    }

    [[nodiscard]] auto config() const -> const LayoutConfig& {
      return m_config;
    }

    [[nodiscard]] auto theme() const -> const style::Theme& {
      return m_theme;
    }

    [[nodiscard]] auto render() const -> types::String;

   private:
    LayoutConfig                     m_config;
    types::String                    m_title;
    types::String                    m_content;
    style::Theme                     m_theme;
    types::Option<logging::LogColor> m_borderColor;
    bool                             m_border;
    bool                             m_focused = false;
  };
} // namespace termflex::layout
