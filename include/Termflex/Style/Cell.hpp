/**
 * @file Cell.hpp
 * @brief Text-block primitives measured in terminal cells.
 *
 * A "block" is a string of '\n'-separated lines. The empty string is a block
 * with zero lines. ANSI escape sequences occupy no cells; East Asian wide
 * code points occupy two. Every function here is pure.
 */

#pragma once

#include <Termflex/Utils/Logging.hpp>
#include <Termflex/Utils/Types.hpp>

namespace termflex::style {
  namespace types   = ::termflex::utils::types;
  namespace logging = ::termflex::utils::logging;

  enum class HAlign : types::u8 {
    Left,
    Center,
    Right,
  };

  enum class VAlign : types::u8 {
    Top,
    Middle,
    Bottom,
  };

  /**
   * @brief Placement of content inside a box that is larger than the content.
   */
  struct BoxStyle {
    HAlign horizontal = HAlign::Left;
    VAlign vertical   = VAlign::Top;
  };

  /**
   * @struct Theme
   * @brief Colours consumed by panels and cards.
   *
   * When `color` is false every Paint() call returns its text untouched.
   */
  struct Theme {
    logging::LogColor primary = logging::LogColor::BrightBlue;
    logging::LogColor muted   = logging::LogColor::Gray;
    logging::LogColor title   = logging::LogColor::BrightWhite;
    logging::LogColor accent  = logging::LogColor::Cyan;
    bool              color   = true;
  };

  /**
   * @brief Stylize() gated on the theme's colour switch.
   */
  auto Paint(types::StringView text, logging::LogColor color, const Theme& theme, bool bold = false) -> types::String;

  /**
   * @brief True for code points that occupy two terminal cells.
   */
  auto IsWideCharacter(char32_t codepoint) -> bool;

  /**
   * @brief Decodes one UTF-8 code point starting at pos and advances pos.
   * @return The code point, or 0 for a truncated or invalid sequence.
   */
  auto DecodeUTF8(types::StringView str, types::usize& pos) -> char32_t;

  /**
   * @brief Number of terminal cells str occupies on a single line.
   */
  auto GetVisualWidth(types::StringView str) -> types::usize;

  /**
   * @brief Splits a block into lines. "" yields no lines; "a\n" yields {"a", ""}.
   */
  auto SplitLines(types::StringView block) -> types::Vec<types::String>;

  auto JoinLines(const types::Vec<types::String>& lines) -> types::String;

  /**
   * @brief Number of lines in a block: 0 for "", otherwise count('\n') + 1.
   */
  auto CountLines(types::StringView block) -> types::usize;

  /**
   * @brief Widest line of a block, in cells.
   */
  auto BlockWidth(types::StringView block) -> types::usize;

  /**
   * @brief Cuts a single line to at most width cells.
   *
   * Escape sequences are kept intact. A wide glyph that would straddle the
   * limit is dropped. When styled text is cut, a reset sequence is appended so
   * colour does not bleed into neighbouring blocks.
   */
  auto TruncateToWidth(types::StringView line, types::usize width) -> types::String;

  /**
   * @brief Truncates or pads a single line to exactly width cells.
   */
  auto PadToWidth(types::StringView line, types::usize width, HAlign align = HAlign::Left) -> types::String;

  /**
   * @brief height lines of width spaces.
   */
  auto Blank(types::usize width, types::usize height) -> types::String;

  /**
   * @brief Forces a block to exactly width x height cells.
   *
   * Extra lines are dropped from the bottom and long lines are truncated.
   * Short content is placed according to style.
   */
  auto ApplyBox(types::StringView content, types::usize width, types::usize height, BoxStyle style = {}) -> types::String;

  /**
   * @brief Places blocks side by side, top-aligned.
   *
   * Each block is padded to its own widest line and to the tallest block.
   */
  auto JoinHorizontal(const types::Vec<types::String>& blocks) -> types::String;

  /**
   * @brief Stacks blocks. Blocks with no lines contribute nothing.
   */
  auto JoinVertical(const types::Vec<types::String>& blocks) -> types::String;

  /**
   * @brief Surrounds a block with blank cells, normalising its width first.
   */
  auto PadBlock(
    types::StringView content,
    types::usize      top,
    types::usize      right,
    types::usize      bottom,
    types::usize      left
  ) -> types::String;

  /**
   * @brief Same padding on all four sides.
   */
  inline auto PadBlock(const types::StringView content, const types::usize all) -> types::String {
    return PadBlock(content, all, all, all, all);
  }

  /**
   * @brief Draws a rounded border (╭─╮ │ ╰─╯) around a block.
   * @param color Border colour, applied through Paint().
   */
  auto RenderBorder(types::StringView content, logging::LogColor color, const Theme& theme) -> types::String;
} // namespace termflex::style
