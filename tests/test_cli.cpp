#include <boost/ut.hpp>

#include <Termflex/Layout/Flex.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"
#include "UI/Screens.hpp"

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::utils::types;
  using namespace termflex::layout;
  using termflex::config::Config;
  using termflex::style::BlockWidth;
  using termflex::style::CountLines;

  namespace cli = termflex::cli;
  namespace ui  = termflex::ui;

  const Config plain = [] -> Config {
    Config cfg;
    cfg.theme.color = false;
    return cfg;
  }();

  const ui::ScreenOptions options { .size = { .width = 100, .height = 30 } };

  "DescribeFlexLayout reports the computed geometry"_test = [] -> void {
    FlexContainer row({ .width = 30 }, FlexDirection::Row);

    for (i32 i = 0; i < 3; ++i)
      row.addItem({ .content = "x", .flexGrow = 1 });

    const cli::FlexLayoutJson json = cli::DescribeFlexLayout(row);

    expect(json.sizes == Vec<i32> { 10, 10, 10 });
    expect(json.direction == String("Row"));
    expect(json.justifyContent == String("Start"));
    expect(json.containerMain == 30);
    expect(json.clamps.empty());

    const Result<String> compact = cli::FormatFlexJson(row, false);

    expect(compact.has_value());
    expect(compact->find("\"sizes\":[10,10,10]") != String::npos);

    const Result<String> pretty = cli::FormatFlexJson(row, true);

    expect(pretty.has_value());
    expect(pretty->find('\n') != String::npos);
  };

  "every screen renders"_test = [&] -> void {
    for (const ui::Screen screen : { ui::Screen::Dashboard, ui::Screen::Responsive, ui::Screen::Sidebar, ui::Screen::Grid, ui::Screen::Cards, ui::Screen::Flex })
      expect(!ui::RenderScreen(screen, options, plain).empty());
  };

  "dashboard fills the terminal"_test = [&] -> void {
    const String block = ui::RenderScreen(ui::Screen::Dashboard, options, plain);

    expect(CountLines(block) == 30_ul);
    expect(BlockWidth(block) == 100_ul);
  };

  "flex playground has three boxes"_test = [&] -> void {
    const FlexContainer container = ui::BuildFlexPlayground(options, plain);
    const FlexLayout    layout    = container.computeLayout();

    expect(layout.sizes.size() == 3_ul);
    expect(layout.leftover >= 0);
    expect(container.justifyContent() == JustifyContent::SpaceBetween);
    expect(BlockWidth(container.render()) == 100_ul);
  };

  "overrides win over the detected size"_test = [] -> void {
    const ui::TerminalSize size = ui::ResolveTerminalSize(120, 40);

    expect(size.width == 120);
    expect(size.height == 40);
  };

  "benchmark covers every screen"_test = [&] -> void {
    const Vec<cli::BenchmarkResult> results = cli::RunBenchmark(options, plain, 1);

    expect(results.size() == 6_ul);

    for (const cli::BenchmarkResult& result : results) {
      expect(result.success);
      expect(result.durationMs >= 0.0);
    }
  };

  return 0;
}
