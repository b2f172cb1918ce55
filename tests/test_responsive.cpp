#include <boost/ut.hpp>

#include <Termflex/Layout/Responsive.hpp>
#include <Termflex/Style/Cell.hpp>
#include <Termflex/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::layout;
  using namespace termflex::utils::types;
  using termflex::style::BlockWidth;
  using termflex::style::CountLines;
  using termflex::style::SplitLines;

  "breakpoint boundaries"_test = [] -> void {
    expect(GetBreakpoint(79) == Breakpoint::Small);
    expect(GetBreakpoint(80) == Breakpoint::Medium);
    expect(GetBreakpoint(119) == Breakpoint::Medium);
    expect(GetBreakpoint(120) == Breakpoint::Large);
  };

  "custom breakpoints"_test = [] -> void {
    const Breakpoints narrow { .small = 40, .medium = 60 };

    expect(GetBreakpoint(39, narrow) == Breakpoint::Small);
    expect(GetBreakpoint(50, narrow) == Breakpoint::Medium);
    expect(GetBreakpoint(79, narrow) == Breakpoint::Large);
  };

  "responsive width and height"_test = [] -> void {
    expect(GetResponsiveWidth(100) == Pair<i32, Breakpoint> { 92, Breakpoint::Medium });
    expect(GetResponsiveWidth(70) == Pair<i32, Breakpoint> { 66, Breakpoint::Small });
    expect(GetResponsiveWidth(150) == Pair<i32, Breakpoint> { 138, Breakpoint::Large });

    expect(GetResponsiveHeight(20) == 18);
    expect(GetResponsiveHeight(30) == 26);
    expect(GetResponsiveHeight(50) == 44);
  };

  "padding and margin by breakpoint"_test = [] -> void {
    expect(ResponsivePadding(70) == Pair<i32, i32> { 1, 0 });
    expect(ResponsivePadding(100) == Pair<i32, i32> { 2, 1 });
    expect(ResponsivePadding(150) == Pair<i32, i32> { 3, 1 });

    expect(ResponsiveMargin(70) == Pair<i32, i32> { 0, 0 });
    expect(ResponsiveMargin(100) == Pair<i32, i32> { 1, 0 });
    expect(ResponsiveMargin(150) == Pair<i32, i32> { 2, 1 });
  };

  "TruncateText"_test = [] -> void {
    expect(TruncateText("hello world", 8) == String("hello..."));
    expect(TruncateText("hello", 3) == String("hel"));
    expect(TruncateText("hello", 5) == String("hello"));
    expect(TruncateText("hello", 0).empty());
  };

  "SplitByWeights sums to the total"_test = [] -> void {
    const Array<i32, 3> even = { 1, 1, 1 };
    const Array<i32, 2> twoToOne = { 2, 1 };
    const Array<i32, 3> zeros = { 0, 0, 0 };

    expect(SplitByWeights(10, even) == Vec<i32> { 4, 3, 3 });
    expect(SplitByWeights(10, twoToOne) == Vec<i32> { 7, 3 });
    expect(SplitByWeights(9, zeros) == Vec<i32> { 3, 3, 3 });
    expect(SplitByWeights(-3, even) == Vec<i32> { 0, 0, 0 });
  };

  "dashboard heights clamp header and footer"_test = [] -> void {
    expect(DashboardHeights(20, "1\n2\n3\n4\n5\n6", "main", "foot") == Array<i32, 3> { 5, 14, 1 });
    expect(DashboardHeights(10, "", "main", "foot") == Array<i32, 3> { 0, 9, 1 });
  };

  "dashboard reclaims header lines first"_test = [] -> void {
    expect(DashboardHeights(6, "1\n2\n3", "main", "a\nb") == Array<i32, 3> { 1, 3, 2 });
    expect(DashboardHeights(4, "head", "main", "foot") == Array<i32, 3> { 1, 2, 1 });
  };

  "dashboard fills the terminal"_test = [] -> void {
    const String block = DashboardLayout(20, 10, "head", "main", "foot");

    expect(CountLines(block) == 10_ul);
    expect(BlockWidth(block) == 20_ul);

    const Vec<String> lines = SplitLines(block);

    expect(lines.front().starts_with("head"));
    expect(lines.back().starts_with("foot"));
  };

  "small terminals stack every section"_test = [] -> void {
    const String block = ResponsiveLayout(60, 0, { "a", "b" });

    expect(CountLines(block) == 3_ul);
    expect(BlockWidth(block) == 60_ul);
  };

  "medium and large terminals use columns"_test = [] -> void {
    const String medium = ResponsiveLayout(100, 0, { "main", "side" });

    expect(BlockWidth(medium) == 100_ul);
    expect(CountLines(medium) == 1_ul);

    const String large = ResponsiveLayout(150, 0, { "a", "b", "c", "d" });

    expect(BlockWidth(large) == 150_ul);
    expect(CountLines(large) == 3_ul);
  };

  "no sections render nothing"_test = [] -> void {
    expect(ResponsiveLayout(100, 20, {}).empty());
  };

  "sidebar sits on the right"_test = [] -> void {
    const Vec<String> fixed = SplitLines(SidebarLayout(60, 0, "main", "side", 20, 1));

    expect(fixed.front().starts_with("main"));
    expect(fixed.front().substr(40, 4) == String("side"));

    const Vec<String> third = SplitLines(SidebarLayout(60, 0, "main", "side"));

    expect(third.front().substr(41, 4) == String("side"));
  };

  return 0;
}
