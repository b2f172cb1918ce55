#include <boost/ut.hpp>

#include <Termflex/Layout/Flex.hpp>
#include <Termflex/Utils/ArgumentParser.hpp>
#include <Termflex/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::utils::argparse;
  using namespace termflex::utils::error;
  using namespace termflex::utils::types;
  using termflex::layout::JustifyContent;

  "ArgumentParser flag"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    bool           verbose = false;
    parser.addArguments("-V", "--verbose").flag().bindTo(verbose);

    Vec<String> args   = { "testprog", "--verbose" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(verbose);
    expect(parser.isUsed("-V"));
  };

  "ArgumentParser value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    String         output;
    parser.addArguments("-c", "--config").defaultValue("").bindTo(output);

    Vec<String> args   = { "testprog", "-c", "layout.toml" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(output == String("layout.toml"));
  };

  "ArgumentParser inline value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    i32            width = 0;
    parser.addArguments("-W", "--width").defaultValue(i32(0)).bindTo(width);

    Vec<String> args   = { "testprog", "--width=120" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(width == 120);
  };

  "ArgumentParser integer conversion"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    i32            count = 0;
    parser.addArguments("-n", "--iterations").defaultValue(i32(1)).bindTo(count);

    Vec<String> args   = { "testprog", "--iterations", "42" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(count == 42);
  };

  "ArgumentParser rejects non-integers"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("-W", "--width").defaultValue(i32(0));

    Vec<String> args   = { "testprog", "-W", "wide" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
    expect(result.error().code == TermflexErrorCode::ParseError);
  };

  "ArgumentParser range check"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("-H", "--height").defaultValue(i32(0)).range(0, 500);

    Vec<String> args   = { "testprog", "-H", "501" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
    expect(result.error().code == TermflexErrorCode::InvalidArgument);
  };

  "ArgumentParser default value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    i32            count = 0;
    parser.addArguments("-n", "--iterations").defaultValue(i32(10)).bindTo(count);

    Vec<String> args   = { "testprog" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(count == 10);
    expect(!parser.isUsed("--iterations"));
  };

  "ArgumentParser enum choices"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    JustifyContent justify = JustifyContent::Start;
    parser.addArguments("--justify").defaultValue(JustifyContent::Start).bindTo(justify);

    Vec<String> args   = { "testprog", "--justify", "space-evenly" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(justify == JustifyContent::SpaceEvenly);
    expect(parser.getEnum<JustifyContent>("--justify") == JustifyContent::SpaceEvenly);
  };

  "ArgumentParser enum choices ignore case and separators"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    JustifyContent justify = JustifyContent::Start;
    parser.addArguments("--justify").defaultValue(JustifyContent::Start).bindTo(justify);

    Vec<String> args = { "testprog", "--justify", "Space_Between" };

    expect(parser.parseInto(args).has_value());
    expect(justify == JustifyContent::SpaceBetween);
  };

  "ArgumentParser rejects unknown choice"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("--justify").defaultValue(JustifyContent::Start);

    Vec<String> args   = { "testprog", "--justify", "sideways" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
    expect(result.error().code == TermflexErrorCode::InvalidArgument);
  };

  "ArgumentParser missing value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("-c").defaultValue("");

    Vec<String> args   = { "testprog", "-c" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser unknown argument"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    Vec<String>    args   = { "testprog", "--unknown" };
    Result<>       result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser flag with inline value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("--json").flag();

    Vec<String> args = { "testprog", "--json=yes" };

    expect(!parser.parseArgs(args).has_value());
  };

  "ArgumentParser help and version stop parsing"_test = [] -> void {
    ArgumentParser help("testprog", "0.1.0");
    Vec<String>    helpArgs = { "testprog", "--help", "--unknown" };

    expect(help.parseArgs(helpArgs).has_value());
    expect(help.helpRequested());
    expect(!help.versionRequested());

    ArgumentParser version("testprog", "0.1.0");
    Vec<String>    versionArgs = { "testprog", "-v" };

    expect(version.parseArgs(versionArgs).has_value());
    expect(version.versionRequested());
    expect(version.version() == String("0.1.0"));
  };

  "ArgumentParser help text"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("--justify").help("Main-axis distribution.").defaultValue(JustifyContent::Center);

    const String text = parser.helpText();

    expect(text.starts_with("Usage: testprog"));
    expect(text.find("Main-axis distribution.") != String::npos);
    expect(text.find("space-between") != String::npos);
    expect(text.find("Default: center") != String::npos);
  };

  "ToKebabCase and NormalizeChoice"_test = [] -> void {
    expect(ToKebabCase("SpaceBetween") == String("space-between"));
    expect(ToKebabCase("Row") == String("row"));
    expect(NormalizeChoice("Space-Between") == NormalizeChoice("space_between"));
  };

  return 0;
}
