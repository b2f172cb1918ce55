#include <boost/ut.hpp>

#include <Termflex/Utils/Error.hpp>
#include <Termflex/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::utils::types;

  "Type sizes"_test = [] -> void {
    expect(sizeof(u8) == 1_ul);
    expect(sizeof(u16) == 2_ul);
    expect(sizeof(u32) == 4_ul);
    expect(sizeof(u64) == 8_ul);
    expect(sizeof(i8) == 1_ul);
    expect(sizeof(i16) == 2_ul);
    expect(sizeof(i32) == 4_ul);
    expect(sizeof(i64) == 8_ul);
    expect(sizeof(f32) == 4_ul);
    expect(sizeof(f64) == 8_ul);
  };

  "Option helper Some"_test = [] -> void {
    Option<i32> opt = Some(42);

    expect(opt.has_value());
    expect(*opt == 42);

    Option<String> none = None;

    expect(!none.has_value());
  };

  "Result success"_test = [] -> void {
    Result<i32> res = 10;

    expect(res.has_value());
    expect(*res == 10);
  };

  "Result error"_test = [] -> void {
    using namespace termflex::utils::error;

    Result<i32> res = Err(TermflexError(TermflexErrorCode::NotFound, "test error"));

    expect(!res.has_value());
    expect(res.error().code == TermflexErrorCode::NotFound);
    expect(res.error().message == String("test error"));
  };

  "UnorderedMap insert and lookup"_test = [] -> void {
    UnorderedMap<String, i32> widths;

    widths.emplace("sidebar", 24);
    widths["main"] = 56;

    expect(widths.size() == 2_ul);
    expect(widths.at("sidebar") == 24);
    expect(widths.contains("main"));
    expect(!widths.contains("footer"));
  };

  "Map heterogeneous lookup"_test = [] -> void {
    Map<String, i32> map = { { "gap", 1 } };

    const StringView key = "gap";

    expect(map.find(key) != map.end());
  };

  return 0;
}
