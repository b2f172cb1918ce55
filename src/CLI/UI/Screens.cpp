#include "Screens.hpp"

#ifndef _WIN32
  #include <sys/ioctl.h> // TIOCGWINSZ
  #include <unistd.h>    // STDOUT_FILENO, isatty
#endif

#include <algorithm>                 // std::max
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is}

#include <Termflex/Layout/Card.hpp>
#include <Termflex/Layout/Grid.hpp>
#include <Termflex/Layout/Panel.hpp>
#include <Termflex/Layout/Responsive.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Env.hpp>
#include <Termflex/Utils/Error.hpp>

using namespace termflex::utils::types;
using namespace termflex::utils::logging;
using namespace termflex::layout;

using enum termflex::utils::error::TermflexErrorCode;

namespace termflex::ui {
  namespace {
    struct SampleSession {
      StringView name;
      i32        windows;
      bool       attached;
      StringView lastActive;
    };

    // clang-format off
    constexpr Array<SampleSession, 5> SAMPLE_SESSIONS = {{
      { .name = "api",      .windows = 4, .attached = true,  .lastActive = "2m"  },
      { .name = "frontend", .windows = 3, .attached = true,  .lastActive = "now" },
      { .name = "infra",    .windows = 6, .attached = false, .lastActive = "1h"  },
      { .name = "notes",    .windows = 1, .attached = false, .lastActive = "3d"  },
      { .name = "scratch",  .windows = 2, .attached = false, .lastActive = "12m" },
    }};
    // clang-format on

    struct Metric {
      StringView icon;
      StringView title;
      String     value;
      StringView label;
      LogColor   accent;
    };

    auto SampleMetrics() -> Vec<Metric> {
      i32 windows  = 0;
      i32 attached = 0;

      for (const SampleSession& session : SAMPLE_SESSIONS) {
        windows += session.windows;
        attached += session.attached ? 1 : 0;
      }

      const auto total = static_cast<i32>(SAMPLE_SESSIONS.size());

      return {
        { .icon = "◆", .title = "Sessions", .value = std::to_string(total), .label = "total", .accent = LogColor::Cyan },
        { .icon = "▣", .title = "Windows", .value = std::to_string(windows), .label = "open", .accent = LogColor::BrightBlue },
        { .icon = "▶", .title = "Attached", .value = std::to_string(attached), .label = "clients", .accent = LogColor::Green },
        { .icon = "◌", .title = "Idle", .value = std::to_string(total - attached), .label = "detached", .accent = LogColor::Yellow },
      };
    }

    auto SessionTable(const style::Theme& theme) -> String {
      Vec<String> lines;
      lines.reserve(SAMPLE_SESSIONS.size() + 1);

      lines.push_back(style::Paint(std::format("{:<10} {:>7}  {:<8}  {:>6}", "NAME", "WINDOWS", "STATE", "ACTIVE"), theme.muted, theme, true));

      for (const SampleSession& session : SAMPLE_SESSIONS) {
        const String state = session.attached
          ? style::Paint("attached", LogColor::Green, theme)
          : style::Paint("detached", theme.muted, theme);

        lines.push_back(std::format("{:<10} {:>7}  {}  {:>6}", session.name, session.windows, style::PadToWidth(state, 8), session.lastActive));
      }

      return style::JoinLines(lines);
    }

    auto SummaryCards(const i32 width, const i32 gap, const style::Theme& theme, const bool compact) -> String {
      const Vec<Metric> metrics   = SampleMetrics();
      const auto        count     = static_cast<i32>(metrics.size());
      const i32         cardWidth = CardWidth(width, count, gap);

      FlexContainer row({ .width = width }, FlexDirection::Row);
      row.setJustifyContent(JustifyContent::SpaceEvenly).setAlignItems(AlignItems::Start);

      for (const Metric& metric : metrics) {
        Card card(
          { .width = cardWidth, .title = String(metric.title), .icon = String(metric.icon), .compact = compact },
          metric.value,
          String(metric.label),
          metric.accent
        );
        card.setTheme(theme);

        row.addItem({ .content = card.render(), .flexBasis = cardWidth });
      }

      return row.render();
    }

    auto Header(const ScreenOptions& options, const config::Config& cfg) -> String {
      const Breakpoint size = GetBreakpoint(options.size.width, cfg.breakpoints);

      const String detail = std::format(
        "{} sessions · {}x{} · {}",
        SAMPLE_SESSIONS.size(),
        options.size.width,
        options.size.height,
        magic_enum::enum_name(size)
      );

      const String line = style::Paint("termflex", cfg.theme.title, cfg.theme, true) + "  " + style::Paint(detail, cfg.theme.muted, cfg.theme);

      return TruncateText(line, options.size.width);
    }

    auto Footer(const i32 width, const style::Theme& theme) -> String {
      return TruncateText(style::Paint("enter attach · n new · d detach · q quit", theme.muted, theme), width);
    }

    auto LayoutDetails(const ScreenOptions& options, const config::Config& cfg) -> String {
      const auto [usable, size]     = GetResponsiveWidth(options.size.width, cfg.breakpoints);
      const auto [padX, padY]       = ResponsivePadding(options.size.width, cfg.breakpoints);
      const auto [marginX, marginY] = ResponsiveMargin(options.size.width, cfg.breakpoints);

      return style::JoinLines({
        std::format("breakpoint  {}", magic_enum::enum_name(size)),
        std::format("usable      {}x{}", usable, GetResponsiveHeight(options.size.height)),
        std::format("padding     {},{}", padX, padY),
        std::format("margin      {},{}", marginX, marginY),
      });
    }

    auto MakePanel(const config::Config& cfg, const StringView title, String content, const i32 width = 0) -> String {
      Panel panel({ .width = width }, String(title), std::move(content));
      panel.setTheme(cfg.theme);
      return panel.render();
    }

    auto RenderDashboard(const ScreenOptions& options, const config::Config& cfg) -> String {
      const i32 width = options.size.width;

      Panel sessions({ .width = width }, "Sessions", SessionTable(cfg.theme));
      sessions.setTheme(cfg.theme).setFocused(true);

      const String main = style::JoinVertical({ SummaryCards(width, cfg.gap, cfg.theme, false), sessions.render() });

      return DashboardLayout(width, options.size.height, Header(options, cfg), main, Footer(width, cfg.theme), cfg.dashboard);
    }

    auto RenderResponsive(const ScreenOptions& options, const config::Config& cfg) -> String {
      const Vec<String> sections = {
        MakePanel(cfg, "Sessions", SessionTable(cfg.theme)),
        MakePanel(cfg, "Layout", LayoutDetails(options, cfg)),
        MakePanel(cfg, "Activity", "api       build finished\nfrontend  3 panes resized\ninfra     detached"),
        MakePanel(cfg, "Notes", "Resize the terminal to\nmove between breakpoints."),
      };

      return ResponsiveLayout(options.size.width, options.size.height, sections, cfg.responsiveOptions());
    }

    auto RenderSidebar(const ScreenOptions& options, const config::Config& cfg) -> String {
      const SampleSession& selected = SAMPLE_SESSIONS.front();

      const String details = style::JoinLines({
        std::format("name     {}", selected.name),
        std::format("windows  {}", selected.windows),
        std::format("state    {}", selected.attached ? "attached" : "detached"),
        std::format("active   {}", selected.lastActive),
      });

      return SidebarLayout(
        options.size.width,
        options.size.height,
        MakePanel(cfg, "Sessions", SessionTable(cfg.theme)),
        MakePanel(cfg, "Details", details),
        cfg.sidebarWidth,
        cfg.gap
      );
    }

    auto RenderGrid(const ScreenOptions& options, const config::Config& cfg) -> String {
      constexpr usize rows    = 2;
      constexpr usize columns = 3;

      GridContainer grid({ .width = options.size.width, .height = options.size.height }, rows, columns);
      grid.setGap(cfg.gap);

      const i32 cardWidth = CardWidth(options.size.width, static_cast<i32>(columns), cfg.gap);

      for (usize i = 0; i < SAMPLE_SESSIONS.size(); ++i) {
        const SampleSession& session = SAMPLE_SESSIONS[i];

        Card card(
          { .width = cardWidth, .title = String(session.name), .icon = session.attached ? "▶" : "◌" },
          std::to_string(session.windows),
          "windows",
          session.attached ? LogColor::Green : cfg.theme.muted
        );
        card.setTheme(cfg.theme);

        grid.setCell(i / columns, i % columns, card.render());
      }

      grid.setCell(rows - 1, columns - 1, MakePanel(cfg, "Layout", LayoutDetails(options, cfg), cardWidth));

      return grid.render();
    }

    auto RenderCards(const ScreenOptions& options, const config::Config& cfg) -> String {
      return style::JoinVertical({
        SummaryCards(options.size.width, cfg.gap, cfg.theme, false),
        SummaryCards(options.size.width, cfg.gap, cfg.theme, true),
      });
    }
  } // namespace

  auto GetTerminalSize() -> Result<TerminalSize> {
#ifdef _WIN32
    ERR(NotSupported, "Terminal size queries are not implemented on Windows");
#else
    if (isatty(STDOUT_FILENO) == 0)
      ERR(ApiUnavailable, "stdout is not a terminal");

    winsize ws {};

    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0)
      ERR(ApiUnavailable, "TIOCGWINSZ failed");

    if (ws.ws_col == 0 || ws.ws_row == 0)
      ERR(ApiUnavailable, "Terminal reported a size of zero");

    return TerminalSize { .width = ws.ws_col, .height = ws.ws_row };
#endif
  }

  auto ResolveTerminalSize(const i32 widthOverride, const i32 heightOverride) -> TerminalSize {
    using utils::env::GetEnvCells;

    TerminalSize size;

    if (Result<TerminalSize> detected = GetTerminalSize())
      size = *detected;
    else {
      debug_at(detected.error());

      if (Result<i32> columns = GetEnvCells("COLUMNS"))
        size.width = *columns;

      if (Result<i32> lines = GetEnvCells("LINES"))
        size.height = *lines;
    }

    if (widthOverride > 0)
      size.width = widthOverride;

    if (heightOverride > 0)
      size.height = heightOverride;

    return size;
  }

  auto BuildFlexPlayground(const ScreenOptions& options, const config::Config& cfg) -> FlexContainer {
    const bool row = options.direction == FlexDirection::Row;

    FlexContainer container(
      { .width = options.size.width, .height = options.size.height, .gap = cfg.gap, .minPanelWidth = cfg.minPanelWidth },
      options.direction
    );
    container.setJustifyContent(options.justify).setAlignItems(options.align).setTheme(cfg.theme);

    // Bases follow the content so justify has free space to distribute
    const auto addBox = [&](const StringView title, const StringView body, const Option<AlignItems> alignSelf) -> void {
      String    content = MakePanel(cfg, title, String(body));
      const i32 basis   = static_cast<i32>(row ? style::BlockWidth(content) : style::CountLines(content));

      container.addItem({ .content = std::move(content), .flexBasis = std::max(basis, 1), .alignSelf = alignSelf });
    };

    addBox("alpha", "sized to content", None);
    addBox("beta", std::format("justify {}", magic_enum::enum_name(options.justify)), None);
    addBox("gamma", "align-self end", AlignItems::End);

    return container;
  }

  auto RenderScreen(const Screen screen, const ScreenOptions& options, const config::Config& cfg) -> String {
    using matchit::match, matchit::is;
    using enum Screen;

    span_enter(render_screen, log_field(screen, magic_enum::enum_name(screen)), log_field(width, options.size.width), log_field(height, options.size.height));

    return match(screen)(
      is | Dashboard  = [&] -> String { return RenderDashboard(options, cfg); },
      is | Responsive = [&] -> String { return RenderResponsive(options, cfg); },
      is | Sidebar    = [&] -> String { return RenderSidebar(options, cfg); },
      is | Grid       = [&] -> String { return RenderGrid(options, cfg); },
      is | Cards      = [&] -> String { return RenderCards(options, cfg); },
      is | Flex       = [&] -> String { return BuildFlexPlayground(options, cfg).render(); }
    );
  }
} // namespace termflex::ui
