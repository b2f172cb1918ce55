#include <boost/ut.hpp>

#include <Termflex/Utils/Error.hpp>

using namespace boost::ut;
using namespace termflex::utils::error;
using namespace termflex::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(TermflexErrorCode::InvalidArgument, "fail");
  }

  auto succeed_helper() -> Result<i32> {
    return 42;
  }

  auto try_test_helper_fail() -> Result<i32> {
    i32 val = TRY(fail_helper());

    return val + 1;
  }

  auto try_test_helper_success() -> Result<i32> {
    i32 val = TRY(succeed_helper());

    return val + 1;
  }

  auto check_width(const i32 width) -> Result<> {
    if (width <= 0)
      ERR_FMT(TermflexErrorCode::InvalidArgument, "width must be positive, got {}", width);

    return {};
  }

  auto try_void_helper(const i32 width) -> Result<i32> {
    TRY_VOID(check_width(width));

    return width * 2;
  }
} // namespace

auto main() -> int {
  "TermflexError construction"_test = [] -> void {
    TermflexError err(TermflexErrorCode::NotFound, "Item not found");

    expect(err.code == TermflexErrorCode::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
#ifdef _MSC_VER
    try {
      [[maybe_unused]] Result<i32> res = try_test_helper_fail();
      expect(false);
    } catch (const TermflexError& e) {
      expect(e.code == TermflexErrorCode::InvalidArgument);
      expect(e.message == String("fail"));
    }
#else
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().code == TermflexErrorCode::InvalidArgument);
    expect(res.error().message == String("fail"));
#endif
  };

  "ERR macro"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR(TermflexErrorCode::InternalError, "internal error");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().code == TermflexErrorCode::InternalError);
  };

  "ERR_FMT formats the message"_test = [] -> void {
    Result<> res = check_width(-3);

    expect(!res.has_value());
    expect(res.error().message == String("width must be positive, got -3"));
  };

  "TRY_VOID propagates and continues"_test = [] -> void {
    Result<i32> ok = try_void_helper(4);

    expect(ok.has_value());
    expect(*ok == 8);

    Result<i32> failed = try_void_helper(0);

    expect(!failed.has_value());
    expect(failed.error().code == TermflexErrorCode::InvalidArgument);
  };

  return 0;
}
