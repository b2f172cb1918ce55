#include <Termflex/Layout/Responsive.hpp>

#include <algorithm>                 // std::max, std::min, std::clamp
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, _}

#include <Termflex/Layout/Flex.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Logging.hpp>

using namespace termflex::utils::types;
using namespace termflex::utils::logging;

namespace termflex::layout {
  namespace {
    /**
     * @brief Joins sections top to bottom with gap empty lines between them.
     */
    auto StackSections(const Span<const String> sections, const i32 gap) -> String {
      String out;

      for (usize i = 0; i < sections.size(); ++i) {
        if (i > 0)
          out.append(static_cast<usize>(std::max(gap, 0)) + 1, '\n');

        out += sections[i];
      }

      return out;
    }

    /**
     * @brief Places each column's content at exactly the given widths.
     */
    auto RenderColumns(
      const i32             width,
      const i32             height,
      const i32             gap,
      const i32             minPanelWidth,
      const Vec<String>&    columns,
      const Span<const i32> weights
    ) -> String {
      const auto count     = static_cast<i32>(columns.size());
      const i32  available = std::max(width - gap * (count - 1), count);
      const auto widths    = SplitByWeights(available, weights);

      FlexContainer row({ .width = width, .height = height, .gap = gap, .minPanelWidth = minPanelWidth }, FlexDirection::Row);
      row.setAlignItems(AlignItems::Stretch);

      for (usize i = 0; i < columns.size(); ++i)
        row.addItem({ .content = columns[i], .flexBasis = std::max(widths[i], 1) });

      return row.render();
    }
  } // namespace

  auto GetBreakpoint(const i32 width, const Breakpoints& breakpoints) -> Breakpoint {
    if (width < breakpoints.small)
      return Breakpoint::Small;

    if (width < breakpoints.medium)
      return Breakpoint::Medium;

    return Breakpoint::Large;
  }

  auto GetResponsiveWidth(const i32 width, const Breakpoints& breakpoints) -> Pair<i32, Breakpoint> {
    using matchit::match, matchit::is;
    using enum Breakpoint;

    const Breakpoint size = GetBreakpoint(width, breakpoints);

    const i32 inset = match(size)(
      is | Small  = 4,
      is | Medium = 8,
      is | Large  = 12
    );

    return { width - inset, size };
  }

  auto GetResponsiveHeight(const i32 height) -> i32 {
    using matchit::match, matchit::is, matchit::_;

    return height - match(height)(
      is | (_ < 24) = 2,
      is | (_ < 40) = 4,
      is | _        = 6
    );
  }

  auto ResponsivePadding(const i32 width, const Breakpoints& breakpoints) -> Pair<i32, i32> {
    using matchit::match, matchit::is;
    using enum Breakpoint;

    return match(GetBreakpoint(width, breakpoints))(
      is | Small  = Pair<i32, i32> { 1, 0 },
      is | Medium = Pair<i32, i32> { 2, 1 },
      is | Large  = Pair<i32, i32> { 3, 1 }
    );
  }

  auto ResponsiveMargin(const i32 width, const Breakpoints& breakpoints) -> Pair<i32, i32> {
    using matchit::match, matchit::is;
    using enum Breakpoint;

    return match(GetBreakpoint(width, breakpoints))(
      is | Small  = Pair<i32, i32> { 0, 0 },
      is | Medium = Pair<i32, i32> { 1, 0 },
      is | Large  = Pair<i32, i32> { 2, 1 }
    );
  }

  auto TruncateText(const StringView text, const i32 maxLen) -> String {
    if (maxLen <= 0)
      return {};

    const auto limit = static_cast<usize>(maxLen);

    if (style::GetVisualWidth(text) <= limit)
      return String(text);

    if (maxLen <= 3)
      return style::TruncateToWidth(text, limit);

    return style::TruncateToWidth(text, limit - 3) + "...";
  }

  auto SplitByWeights(const i32 total, const Span<const i32> weights) -> Vec<i32> {
    Vec<i32> parts(weights.size(), 0);

    if (weights.empty() || total <= 0)
      return parts;

    i64 weightSum = 0;

    for (const i32 weight : weights)
      weightSum += std::max(weight, 0);

    const bool uniform = weightSum == 0;

    if (uniform)
      weightSum = static_cast<i64>(weights.size());

    const auto weightOf = [&](const usize index) -> i64 {
      return uniform ? 1 : std::max(weights[index], 0);
    };

    i32 assigned = 0;

    for (usize i = 0; i < weights.size(); ++i) {
      parts[i] = static_cast<i32>(static_cast<i64>(total) * weightOf(i) / weightSum);
      assigned += parts[i];
    }

    for (usize i = 0; assigned < total; i = (i + 1) % parts.size()) {
      ++parts[i];
      ++assigned;
    }

    return parts;
  }

  auto ResponsiveLayout(const i32 width, const i32 height, const Vec<String>& sections, const ResponsiveOptions& options) -> String {
    using enum Breakpoint;

    if (sections.empty())
      return {};

    const Breakpoint         size = GetBreakpoint(width, options.breakpoints);
    const Span<const String> all(sections);

    debug_log("responsive layout at width {} uses the {} arrangement", width, magic_enum::enum_name(size));

    if (size == Small || sections.size() == 1) {
      const Array<i32, 1> weights = { 1 };
      return RenderColumns(width, height, options.gap, options.minPanelWidth, { StackSections(all, options.gap) }, weights);
    }

    if (size == Medium) {
      const Array<i32, 2> weights = { 2, 1 };
      return RenderColumns(
        width,
        height,
        options.gap,
        options.minPanelWidth,
        { sections.front(), StackSections(all.subspan(1), options.gap) },
        weights
      );
    }

    const usize columnCount = std::min<usize>(sections.size(), 3);

    Vec<String> columns;
    columns.reserve(columnCount);

    for (usize i = 0; i + 1 < columnCount; ++i)
      columns.push_back(sections[i]);

    columns.push_back(StackSections(all.subspan(columnCount - 1), options.gap));

    const Vec<i32> weights(columnCount, 1);

    return RenderColumns(width, height, options.gap, options.minPanelWidth, columns, weights);
  }

  auto SidebarLayout(
    const i32        width,
    const i32        height,
    const StringView main,
    const StringView sidebar,
    const i32        sidebarWidth,
    const i32        gap
  ) -> String {
    const Vec<String> columns = { String(main), String(sidebar) };

    if (sidebarWidth <= 0) {
      const Array<i32, 2> weights = { 2, 1 };
      return RenderColumns(width, height, std::max(gap, 0), 0, columns, weights);
    }

    const i32 available = std::max(width - std::max(gap, 0), 2);
    const i32 side      = std::clamp(sidebarWidth, 1, available - 1);

    const Array<i32, 2> widths = { available - side, side };

    return RenderColumns(width, height, std::max(gap, 0), 0, columns, widths);
  }

  auto DashboardHeights(
    const i32               height,
    const StringView        header,
    const StringView        main,
    const StringView        footer,
    const DashboardOptions& options
  ) -> Array<i32, 3> {
    const auto regionHeight = [](const StringView text, const i32 minimum, const i32 maximum) -> i32 {
      const auto lines = static_cast<i32>(style::CountLines(text));
      return lines == 0 ? 0 : std::clamp(lines, std::max(minimum, 0), std::max({ minimum, maximum, 0 }));
    };

    i32 headerHeight = regionHeight(header, options.minHeaderHeight, options.maxHeaderHeight);
    i32 footerHeight = regionHeight(footer, options.minFooterHeight, options.maxFooterHeight);

    if (height <= 0)
      return { headerHeight, static_cast<i32>(style::CountLines(main)), footerHeight };

    // Reclaim lines for main: header first, then footer, never below their minimums
    i32 excess = headerHeight + footerHeight + std::max(options.minMainHeight, 0) - height;

    const auto reclaim = [&excess](i32& region, const i32 minimum) -> void {
      if (excess <= 0 || region == 0)
        return;

      const i32 floor = std::min(std::max(minimum, 0), region);
      const i32 taken = std::min(excess, region - floor);

      region -= taken;
      excess -= taken;
    };

    reclaim(headerHeight, options.minHeaderHeight);
    reclaim(footerHeight, options.minFooterHeight);

    if (excess > 0)
      debug_log("dashboard of height {} cannot honour the minimum main height {}", height, options.minMainHeight);

    return { headerHeight, std::max(height - headerHeight - footerHeight, 0), footerHeight };
  }

  auto DashboardLayout(
    const i32               width,
    const i32               height,
    const StringView        header,
    const StringView        main,
    const StringView        footer,
    const DashboardOptions& options
  ) -> String {
    const auto [headerHeight, mainHeight, footerHeight] = DashboardHeights(height, header, main, footer, options);

    const i32 total = headerHeight + mainHeight + footerHeight;

    FlexContainer column({ .width = width, .height = height > 0 ? height : total }, FlexDirection::Column);
    column.setAlignItems(AlignItems::Stretch);

    const auto addRegion = [&column](const StringView content, const i32 lines) -> void {
      if (lines > 0)
        column.addItem({ .content = String(content), .flexBasis = lines });
    };

    addRegion(header, headerHeight);
    addRegion(main, mainHeight);
    addRegion(footer, footerHeight);

    return column.render();
  }
} // namespace termflex::layout
