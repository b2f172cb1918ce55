#include <boost/ut.hpp>

#include <Termflex/Utils/Env.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::utils::env;
  using namespace termflex::utils::error;
  using namespace termflex::utils::types;

  "GetEnv returns NotFound for missing variable"_test = [] -> void {
    Result<String> result = GetEnv("TERMFLEX_TEST_NONEXISTENT_VAR_12345");

    expect(!result.has_value());
    expect(result.error().code == TermflexErrorCode::NotFound);
  };

  "SetEnv and GetEnv round-trip"_test = [] -> void {
    expect(SetEnv("TERMFLEX_TEST_VAR", "test_value").has_value());

    Result<String> result = GetEnv("TERMFLEX_TEST_VAR");

    expect(result.has_value());
    expect(*result == String("test_value"));

    expect(UnsetEnv("TERMFLEX_TEST_VAR").has_value());
  };

  "UnsetEnv removes variable"_test = [] -> void {
    expect(SetEnv("TERMFLEX_TEST_VAR2", "value").has_value());
    expect(UnsetEnv("TERMFLEX_TEST_VAR2").has_value());

    Result<String> result = GetEnv("TERMFLEX_TEST_VAR2");

    expect(!result.has_value());
  };

  "GetEnvCells parses a positive count"_test = [] -> void {
    expect(SetEnv("TERMFLEX_TEST_COLUMNS", "132").has_value());

    Result<i32> cells = GetEnvCells("TERMFLEX_TEST_COLUMNS");

    expect(cells.has_value());
    expect(*cells == 132);

    expect(UnsetEnv("TERMFLEX_TEST_COLUMNS").has_value());
  };

  "GetEnvCells rejects non-numeric values"_test = [] -> void {
    expect(SetEnv("TERMFLEX_TEST_COLUMNS", "wide").has_value());

    Result<i32> cells = GetEnvCells("TERMFLEX_TEST_COLUMNS");

    expect(!cells.has_value());
    expect(cells.error().code == TermflexErrorCode::ParseError);

    expect(SetEnv("TERMFLEX_TEST_COLUMNS", "80x").has_value());
    expect(!GetEnvCells("TERMFLEX_TEST_COLUMNS").has_value());

    expect(UnsetEnv("TERMFLEX_TEST_COLUMNS").has_value());
  };

  "GetEnvCells rejects zero and negatives"_test = [] -> void {
    expect(SetEnv("TERMFLEX_TEST_LINES", "0").has_value());

    Result<i32> cells = GetEnvCells("TERMFLEX_TEST_LINES");

    expect(!cells.has_value());
    expect(cells.error().code == TermflexErrorCode::InvalidArgument);

    expect(UnsetEnv("TERMFLEX_TEST_LINES").has_value());
  };

  "GetEnvCells forwards NotFound"_test = [] -> void {
    Result<i32> cells = GetEnvCells("TERMFLEX_TEST_NONEXISTENT_LINES");

    expect(!cells.has_value());
    expect(cells.error().code == TermflexErrorCode::NotFound);
  };

  return 0;
}
