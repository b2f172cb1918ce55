#include <Termflex/Layout/Card.hpp>

#include <algorithm> // std::max

#include <Termflex/Layout/Panel.hpp>

using namespace termflex::utils::types;
using namespace termflex::utils::logging;

namespace termflex::layout {
  namespace {
    constexpr i32 MIN_CARD_WIDTH = 10;
  } // namespace

  Card::Card(CardConfig config, String value, String label, const LogColor accent)
    : m_config(std::move(config)), m_value(std::move(value)), m_label(std::move(label)), m_accent(accent) {}

  auto Card::setValue(String value) -> Card& {
    m_value = std::move(value);
    return *this;
  }

  auto Card::setAccent(const LogColor accent) -> Card& {
    m_accent = accent;
    return *this;
  }

  auto Card::setTheme(style::Theme theme) -> Card& {
    m_theme = theme;
    return *this;
  }

  auto Card::header() const -> String {
    String out;

    if (!m_config.icon.empty()) {
      out += m_config.icon;
      out += ' ';
    }

    if (!m_config.title.empty()) {
      out += style::Paint(m_config.title, m_config.compact ? m_accent : m_theme.title, m_theme, true);
      out += '\n';
    }

    return out;
  }

  auto Card::contentWidth() const -> usize {
    if (m_config.width > 0)
      return static_cast<usize>(std::max(m_config.width - (m_config.border ? 2 : 0), 1));

    return std::max({ style::GetVisualWidth(m_value), style::GetVisualWidth(m_label), style::BlockWidth(header()) });
  }

  auto Card::render() const -> String {
    const String value = style::Paint(m_value, m_accent, m_theme, true);

    String body = header();

    if (m_config.compact) {
      body += value;
      body += ' ';
      body += m_label;
    } else {
      const usize width = contentWidth();

      body += style::PadToWidth(value, width, style::HAlign::Center);
      body += '\n';
      body += style::PadToWidth(m_label, width, style::HAlign::Center);
    }

    const i32 lines  = static_cast<i32>(style::CountLines(body));
    const i32 chrome = m_config.border ? 2 : 0;

    LayoutConfig box { .width = m_config.width };

    if (m_config.minHeight > lines)
      box.height = m_config.minHeight + chrome;

    Panel panel(box, "", std::move(body), m_config.border);
    panel.setTheme(m_theme).setBorderColor(m_accent);

    return panel.render();
  }

  auto CardWidth(const i32 totalWidth, const i32 count, const i32 spacing) -> i32 {
    if (count <= 0)
      return MIN_CARD_WIDTH;

    return std::max((totalWidth - (count - 1) * spacing) / count, MIN_CARD_WIDTH);
  }
} // namespace termflex::layout
