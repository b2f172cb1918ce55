#include <Termflex/Style/Cell.hpp>

#include <algorithm> // std::ranges::max, std::ranges::count

using namespace termflex::utils::types;
using namespace termflex::utils::logging;

namespace termflex::style {
  namespace {
    constexpr StringView RESET = "\033[0m";

    /**
     * @brief Length in bytes of the escape sequence starting at pos.
     *
     * CSI sequences end at their final byte (0x40-0x7E); OSC sequences end at
     * BEL or ST. Anything else is a two-byte escape.
     */
    auto EscapeLength(const StringView str, const usize pos) -> usize {
      usize end = pos + 1;

      if (end >= str.size())
        return end - pos;

      if (str[end] == '[') {
        for (++end; end < str.size(); ++end)
          if (const auto byte = static_cast<u8>(str[end]); byte >= 0x40 && byte <= 0x7E)
            return end + 1 - pos;

        return str.size() - pos;
      }

      if (str[end] == ']') {
        for (++end; end < str.size(); ++end) {
          if (str[end] == '\a')
            return end + 1 - pos;
          if (str[end] == '\033' && end + 1 < str.size() && str[end + 1] == '\\')
            return end + 2 - pos;
        }

        return str.size() - pos;
      }

      return 2;
    }
  } // namespace

  auto Paint(const StringView text, const LogColor color, const Theme& theme, const bool bold) -> String {
    if (!theme.color)
      return String(text);

    return Stylize(text, { .color = color, .bold = bold });
  }

  auto IsWideCharacter(const char32_t codepoint) -> bool {
    return (codepoint >= 0x1100 && codepoint <= 0x115F) || // Hangul Jamo
      (codepoint >= 0x2329 && codepoint <= 0x232A) ||      // Angle brackets
      (codepoint >= 0x2E80 && codepoint <= 0x303E) ||      // CJK radicals, Kangxi, symbols and punctuation
      (codepoint >= 0x3041 && codepoint <= 0x33FF) ||      // Kana, Bopomofo, Hangul compatibility, CJK compatibility
      (codepoint >= 0x3400 && codepoint <= 0x4DBF) ||      // CJK Extension A
      (codepoint >= 0x4E00 && codepoint <= 0x9FFF) ||      // CJK Unified Ideographs
      (codepoint >= 0xA000 && codepoint <= 0xA4CF) ||      // Yi
      (codepoint >= 0xAC00 && codepoint <= 0xD7A3) ||      // Hangul Syllables
      (codepoint >= 0xF900 && codepoint <= 0xFAFF) ||      // CJK Compatibility Ideographs
      (codepoint >= 0xFE10 && codepoint <= 0xFE19) ||      // Vertical Forms
      (codepoint >= 0xFE30 && codepoint <= 0xFE6F) ||      // CJK Compatibility Forms
      (codepoint >= 0xFF00 && codepoint <= 0xFF60) ||      // Fullwidth Forms
      (codepoint >= 0xFFE0 && codepoint <= 0xFFE6) ||      // Fullwidth signs
      (codepoint >= 0x1F300 && codepoint <= 0x1F64F) ||    // Pictographs and emoticons
      (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) ||    // Supplemental pictographs
      (codepoint >= 0x20000 && codepoint <= 0x3FFFD);      // CJK Extensions B-F
  }

  auto DecodeUTF8(const StringView str, usize& pos) -> char32_t {
    if (pos >= str.size())
      return 0;

    const auto byteAt = [&](const usize index) -> u8 { return static_cast<u8>(str[index]); };

    const u8 first = byteAt(pos++);

    if ((first & 0x80) == 0)
      return first;

    usize    trailing = 0;
    char32_t value    = 0;

    if ((first & 0xE0) == 0xC0) {
      trailing = 1;
      value    = first & 0x1F;
    } else if ((first & 0xF0) == 0xE0) {
      trailing = 2;
      value    = first & 0x0F;
    } else if ((first & 0xF8) == 0xF0) {
      trailing = 3;
      value    = first & 0x07;
    } else
      return 0;

    if (pos + trailing > str.size()) {
      pos = str.size();
      return 0;
    }

    for (usize i = 0; i < trailing; ++i)
      value = (value << 6) | (byteAt(pos++) & 0x3F);

    return value;
  }

  auto GetVisualWidth(const StringView str) -> usize {
    usize width = 0;
    usize pos   = 0;

    while (pos < str.size()) {
      if (str[pos] == '\033') {
        pos += EscapeLength(str, pos);
        continue;
      }

      if (const char32_t codepoint = DecodeUTF8(str, pos); codepoint != 0)
        width += IsWideCharacter(codepoint) ? 2 : 1;
    }

    return width;
  }

  auto SplitLines(const StringView block) -> Vec<String> {
    Vec<String> lines;

    if (block.empty())
      return lines;

    usize start = 0;

    while (true) {
      const usize newline = block.find('\n', start);

      if (newline == StringView::npos) {
        lines.emplace_back(block.substr(start));
        break;
      }

      lines.emplace_back(block.substr(start, newline - start));
      start = newline + 1;
    }

    return lines;
  }

  auto JoinLines(const Vec<String>& lines) -> String {
    String out;

    for (usize i = 0; i < lines.size(); ++i) {
      if (i > 0)
        out += '\n';
      out += lines[i];
    }

    return out;
  }

  auto CountLines(const StringView block) -> usize {
    if (block.empty())
      return 0;

    return static_cast<usize>(std::ranges::count(block, '\n')) + 1;
  }

  auto BlockWidth(const StringView block) -> usize {
    usize widest = 0;
    usize start  = 0;

    while (start <= block.size()) {
      usize end = block.find('\n', start);

      if (end == StringView::npos)
        end = block.size();

      widest = std::max(widest, GetVisualWidth(block.substr(start, end - start)));
      start  = end + 1;
    }

    return widest;
  }

  auto TruncateToWidth(const StringView line, const usize width) -> String {
    String out;
    out.reserve(line.size());

    usize used      = 0;
    usize pos       = 0;
    bool  sawEscape = false;

    while (pos < line.size()) {
      if (line[pos] == '\033') {
        const usize len = EscapeLength(line, pos);
        out.append(line.substr(pos, len));
        pos += len;
        sawEscape = true;
        continue;
      }

      const usize    glyphStart = pos;
      const char32_t codepoint  = DecodeUTF8(line, pos);

      if (codepoint == 0)
        continue;

      const usize cells = IsWideCharacter(codepoint) ? 2 : 1;

      if (used + cells > width) {
        if (sawEscape)
          out += RESET;

        return out;
      }

      out.append(line.substr(glyphStart, pos - glyphStart));
      used += cells;
    }

    return out;
  }

  auto PadToWidth(const StringView line, const usize width, const HAlign align) -> String {
    String      text    = TruncateToWidth(line, width);
    const usize visible = GetVisualWidth(text);
    const usize slack   = width - visible;

    usize before = 0;

    if (align == HAlign::Right)
      before = slack;
    else if (align == HAlign::Center)
      before = slack / 2;

    String out(before, ' ');
    out += text;
    out.append(slack - before, ' ');

    return out;
  }

  auto Blank(const usize width, const usize height) -> String {
    if (height == 0)
      return {};

    const String row(width, ' ');

    String out;
    out.reserve((width + 1) * height);

    for (usize i = 0; i < height; ++i) {
      if (i > 0)
        out += '\n';
      out += row;
    }

    return out;
  }

  auto ApplyBox(const StringView content, const usize width, const usize height, const BoxStyle style) -> String {
    if (height == 0)
      return {};

    Vec<String> lines = SplitLines(content);

    if (lines.size() > height)
      lines.resize(height);

    const usize slack = height - lines.size();

    usize above = 0;

    if (style.vertical == VAlign::Bottom)
      above = slack;
    else if (style.vertical == VAlign::Middle)
      above = slack / 2;

    Vec<String> boxed;
    boxed.reserve(height);

    const String emptyRow(width, ' ');

    for (usize i = 0; i < above; ++i)
      boxed.push_back(emptyRow);

    for (const String& line : lines)
      boxed.push_back(PadToWidth(line, width, style.horizontal));

    while (boxed.size() < height)
      boxed.push_back(emptyRow);

    return JoinLines(boxed);
  }

  auto JoinHorizontal(const Vec<String>& blocks) -> String {
    Vec<Vec<String>> split;
    Vec<usize>       widths;
    usize            height = 0;

    split.reserve(blocks.size());
    widths.reserve(blocks.size());

    for (const String& block : blocks) {
      split.push_back(SplitLines(block));
      widths.push_back(BlockWidth(block));
      height = std::max(height, split.back().size());
    }

    Vec<String> rows(height);

    for (usize b = 0; b < split.size(); ++b)
      for (usize row = 0; row < height; ++row)
        rows[row] += row < split[b].size() ? PadToWidth(split[b][row], widths[b]) : String(widths[b], ' ');

    return JoinLines(rows);
  }

  auto JoinVertical(const Vec<String>& blocks) -> String {
    String out;

    for (const String& block : blocks) {
      if (block.empty())
        continue;

      if (!out.empty())
        out += '\n';

      out += block;
    }

    return out;
  }

  auto PadBlock(
    const StringView content,
    const usize      top,
    const usize      right,
    const usize      bottom,
    const usize      left
  ) -> String {
    if (top == 0 && right == 0 && bottom == 0 && left == 0)
      return String(content);

    const usize       inner = BlockWidth(content);
    const usize       total = left + inner + right;
    const Vec<String> lines = SplitLines(content);

    Vec<String> out;
    out.reserve(top + lines.size() + bottom);

    for (usize i = 0; i < top; ++i)
      out.emplace_back(total, ' ');

    for (const String& line : lines)
      out.push_back(String(left, ' ') + PadToWidth(line, inner) + String(right, ' '));

    for (usize i = 0; i < bottom; ++i)
      out.emplace_back(total, ' ');

    return JoinLines(out);
  }

  auto RenderBorder(const StringView content, const LogColor color, const Theme& theme) -> String {
    const usize inner = BlockWidth(content);

    String horizontal;
    horizontal.reserve(inner * 3);

    for (usize i = 0; i < inner; ++i)
      horizontal += "─";

    const String side = Paint("│", color, theme);

    Vec<String> out;
    out.reserve(CountLines(content) + 2);

    out.push_back(Paint("╭" + horizontal + "╮", color, theme));

    for (const String& line : SplitLines(content))
      out.push_back(side + PadToWidth(line, inner) + side);

    out.push_back(Paint("╰" + horizontal + "╯", color, theme));

    return JoinLines(out);
  }
} // namespace termflex::style
