#include <boost/ut.hpp>

#include <Termflex/Layout/Panel.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::layout;
  using namespace termflex::utils::types;
  using termflex::style::BlockWidth;
  using termflex::style::CountLines;
  using termflex::style::Theme;

  const Theme plain { .color = false };

  "outer size includes the border"_test = [&plain] -> void {
    Panel panel({ .width = 20, .height = 6 }, "Title", "body");
    panel.setTheme(plain);

    const String block = panel.render();

    expect(BlockWidth(block) == 20_ul);
    expect(CountLines(block) == 6_ul);
  };

  "natural size wraps the content"_test = [&plain] -> void {
    Panel panel({}, "", "abc");
    panel.setTheme(plain);

    expect(panel.render() == String("╭───╮\n│abc│\n╰───╯"));

    panel.setTitle("T");

    expect(panel.render() == String("╭───╮\n│T  │\n│abc│\n╰───╯"));
  };

  "padding sits inside the border"_test = [&plain] -> void {
    Panel panel({ .padding = 1 }, "", "x");
    panel.setTheme(plain);

    const String block = panel.render();

    expect(BlockWidth(block) == 5_ul);
    expect(CountLines(block) == 5_ul);
  };

  "margin sits outside the configured width"_test = [&plain] -> void {
    Panel panel({ .width = 10, .margin = 1 }, "", "x");
    panel.setTheme(plain);

    expect(BlockWidth(panel.render()) == 12_ul);
  };

  "borderless panels use the whole box"_test = [&plain] -> void {
    Panel panel({ .width = 10, .height = 2 }, "", "x", false);
    panel.setTheme(plain);

    const String block = panel.render();

    expect(BlockWidth(block) == 10_ul);
    expect(CountLines(block) == 2_ul);
    expect(block.starts_with("x"));
  };

  "focus changes the border colour"_test = [] -> void {
    Panel panel({ .width = 12 }, "Title", "body");

    const String idle = panel.render();

    panel.setFocused(true);

    expect(panel.focused());
    expect(panel.render() != idle);
    expect(BlockWidth(panel.render()) == 12_ul);
  };

  "accessors reflect the setters"_test = [] -> void {
    Panel panel({ .width = -4, .padding = 2 }, "a", "b");
    panel.setTitle("title").setContent("content").setBorder(false);

    expect(panel.title() == String("title"));
    expect(panel.content() == String("content"));
    expect(!panel.border());
    expect(!panel.focused());
    expect(panel.config().width == 0);
    expect(panel.config().padding == 2);
  };

  return 0;
}
