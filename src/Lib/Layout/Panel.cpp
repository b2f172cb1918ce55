#include <Termflex/Layout/Panel.hpp>

#include <algorithm> // std::max

using namespace termflex::utils::types;
using namespace termflex::utils::logging;

namespace termflex::layout {
  Panel::Panel(LayoutConfig config, String title, String content, const bool border)
    : m_config(config.sanitized()), m_title(std::move(title)), m_content(std::move(content)), m_border(border) {}

  auto Panel::setFocused(const bool focused) -> Panel& {
    m_focused = focused;
    return *this;
  }

  auto Panel::setContent(String content) -> Panel& {
    m_content = std::move(content);
    return *this;
  }

  auto Panel::setTitle(String title) -> Panel& {
    m_title = std::move(title);
    return *this;
  }

  auto Panel::setBorder(const bool border) -> Panel& {
    m_border = border;
    return *this;
  }

  auto Panel::setTheme(style::Theme theme) -> Panel& {
    m_theme = theme;
    return *this;
  }

  auto Panel::setBorderColor(const LogColor color) -> Panel& {
    m_borderColor = color;
    return *this;
  }

  auto Panel::render() const -> String {
    String body;

    if (!m_title.empty()) {
      body = style::Paint(m_title, m_focused ? m_theme.primary : m_theme.title, m_theme, true);
      body += '\n';
    }

    body += m_content;

    // Everything between the content and the outer edge, per side
    const i32 chrome = m_config.padding + (m_border ? 1 : 0);

    const usize innerWidth = m_config.width > 0
      ? static_cast<usize>(std::max(m_config.width - 2 * chrome, 0))
      : style::BlockWidth(body);

    const usize innerHeight = m_config.height > 0
      ? static_cast<usize>(std::max(m_config.height - 2 * chrome, 0))
      : style::CountLines(body);

    String block = style::ApplyBox(body, innerWidth, innerHeight);
    block        = style::PadBlock(block, static_cast<usize>(m_config.padding));

    if (m_border) {
      const LogColor borderColor = m_focused ? m_theme.primary : m_borderColor.value_or(m_theme.muted);
      block                      = style::RenderBorder(block, borderColor, m_theme);
    }

    return style::PadBlock(block, static_cast<usize>(m_config.margin));
  }
} // namespace termflex::layout
