#include <boost/ut.hpp>

#include <Termflex/Utils/Logging.hpp>
#include <Termflex/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::utils::logging;
  using namespace termflex::utils::types;

  "Stylize leaves plain white text alone"_test = [] -> void {
    expect(Stylize("plain", {}) == String("plain"));
    expect(Stylize("", { .color = LogColor::Red, .bold = true }).empty());
  };

  "Stylize wraps colour and attributes"_test = [] -> void {
    const String styled = Stylize("warn", { .color = LogColor::Yellow, .bold = true });

    expect(styled.starts_with(LogLevelConst::BOLD_START));
    expect(styled.find("warn") != String::npos);
    expect(styled.ends_with(LogLevelConst::RESET_CODE));
    expect(styled.find(LogLevelConst::COLOR_CODE_LITERALS[static_cast<usize>(LogColor::Yellow)]) != String::npos);
  };

  "Runtime log level"_test = [] -> void {
    const LogLevel previous = GetRuntimeLogLevel();

    SetRuntimeLogLevel(LogLevel::Debug);
    expect(GetRuntimeLogLevel() == LogLevel::Debug);

    SetRuntimeLogLevel(previous);
    expect(GetRuntimeLogLevel() == previous);
  };

  "Only info goes to stdout"_test = [] -> void {
    expect(!ShouldUseStderr(LogLevel::Info));
    expect(ShouldUseStderr(LogLevel::Debug));
    expect(ShouldUseStderr(LogLevel::Warn));
    expect(ShouldUseStderr(LogLevel::Error));
  };

  "ExtractTarget strips return type and function name"_test = [] -> void {
    expect(ExtractTarget("auto termflex::layout::FlexContainer::render() const") == String("termflex::layout::FlexContainer"));
    expect(ExtractTarget("int main()") == String("int main"));
  };

  "Field formatting"_test = [] -> void {
    expect(Field::create("wrap", true).value == String("true"));
    expect(Field::create("width", 80).value == String("80"));
    expect(Field::create("screen", StringView("dashboard")).value == String("dashboard"));

    expect(FormatFields({}).empty());

    const String formatted = FormatFields({ Field::create("width", 80), Field::create("height", 24) });

    expect(formatted.find("=80") != String::npos);
    expect(formatted.find(", ") != String::npos);
  };

  "Timestamp has a fixed width"_test = [] -> void {
    expect(GetCachedTimestamp(0).size() == 19_ul);
  };

  return 0;
}
