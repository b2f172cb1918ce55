#include <cstdlib> // EXIT_SUCCESS, EXIT_FAILURE
#include <format>  // std::format

#include <Termflex/Layout/Flex.hpp>
#include <Termflex/Utils/ArgumentParser.hpp>
#include <Termflex/Utils/Env.hpp>
#include <Termflex/Utils/Error.hpp>
#include <Termflex/Utils/Logging.hpp>
#include <Termflex/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"
#include "UI/Screens.hpp"

#ifndef TERMFLEX_VERSION
  #define TERMFLEX_VERSION "0.0.0"
#endif

using namespace termflex::utils::types;
using namespace termflex::utils::logging;
using namespace termflex::config;
using namespace termflex::ui;
using namespace termflex::cli;

namespace layout = termflex::layout;

struct CliOptions {
  // What to draw
  Screen                 screen    = Screen::Dashboard;
  i32                    width     = 0;
  i32                    height    = 0;
  layout::JustifyContent justify   = layout::JustifyContent::SpaceBetween;
  layout::AlignItems     align     = layout::AlignItems::Center;
  layout::FlexDirection  direction = layout::FlexDirection::Row;

  // Output options
  bool jsonOutput = false;
  bool prettyJson = false;
  bool noColor    = false;

  // Modes
  bool benchmarkMode = false;
  i32  iterations    = 100;

  // Misc
  String configPath;
  bool   showConfigPath = false;
};

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  CliOptions opts;

  {
    using termflex::utils::argparse::ArgumentParser;

#ifdef TERMFLEX_BUILD_DATE
    String versionString = std::format("termflex {} ({})", TERMFLEX_VERSION, TERMFLEX_BUILD_DATE);
#else
    String versionString = std::format("termflex {}", TERMFLEX_VERSION);
#endif

    ArgumentParser parser("termflex", versionString);

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Info);

    parser
      .addArguments("-s", "--screen")
      .help("Screen to render.")
      .defaultValue(Screen::Dashboard)
      .bindTo(opts.screen);

    parser
      .addArguments("-W", "--width")
      .help("Render width in cells. 0 uses the terminal width.")
      .defaultValue(i32(0))
      .range(0, 10000)
      .bindTo(opts.width);

    parser
      .addArguments("-H", "--height")
      .help("Render height in lines. 0 uses the terminal height.")
      .defaultValue(i32(0))
      .range(0, 10000)
      .bindTo(opts.height);

    parser
      .addArguments("--justify")
      .help("Main-axis distribution of the flex screen.")
      .defaultValue(layout::JustifyContent::SpaceBetween)
      .bindTo(opts.justify);

    parser
      .addArguments("--align")
      .help("Cross-axis alignment of the flex screen.")
      .defaultValue(layout::AlignItems::Center)
      .bindTo(opts.align);

    parser
      .addArguments("--direction")
      .help("Main axis of the flex screen.")
      .defaultValue(layout::FlexDirection::Row)
      .bindTo(opts.direction);

    parser
      .addArguments("--json")
      .help("Print the computed geometry of the flex screen as JSON instead of drawing it.")
      .flag()
      .bindTo(opts.jsonOutput);

    parser
      .addArguments("--pretty")
      .help("Pretty-print JSON output. Only valid when --json is used.")
      .flag()
      .bindTo(opts.prettyJson);

    parser
      .addArguments("--no-color")
      .help("Disable colours. Also enabled by the NO_COLOR environment variable.")
      .flag()
      .bindTo(opts.noColor);

    parser
      .addArguments("--benchmark")
      .help("Print timing information for every screen.")
      .flag()
      .bindTo(opts.benchmarkMode);

    parser
      .addArguments("--iterations")
      .help("Render passes per screen in --benchmark mode.")
      .defaultValue(i32(100))
      .range(1, 1000000)
      .bindTo(opts.iterations);

    parser
      .addArguments("-c", "--config")
      .help("Read this config file instead of searching the default locations.")
      .defaultValue(String(""))
      .bindTo(opts.configPath);

    parser
      .addArguments("--show-config-path")
      .help("Display the active configuration file location.")
      .flag()
      .bindTo(opts.showConfigPath);

    const Vec<String> args(argv, argv + argc);

    if (Result<> result = parser.parseInto(args); !result) {
      error_at(result.error());
      return EXIT_FAILURE;
    }

    if (parser.helpRequested()) {
      parser.printHelp();
      return EXIT_SUCCESS;
    }

    if (parser.versionRequested()) {
      Println("{}", parser.version());
      return EXIT_SUCCESS;
    }

    SetRuntimeLogLevel(
      parser.get<bool>("--verbose")
        ? LogLevel::Debug
        : parser.getEnum<LogLevel>("--log-level")
    );
  }

  // Handle --show-config-path (early exit)
  if (opts.showConfigPath) {
    Println("{}", opts.configPath.empty() ? Config::getConfigPath().string() : opts.configPath);
    return EXIT_SUCCESS;
  }

  Config config;

  if (opts.configPath.empty())
    config = Config::getInstance();
  else if (Result<Config> loaded = Config::load(opts.configPath))
    config = *loaded;
  else {
    error_at(loaded.error());
    return EXIT_FAILURE;
  }

  if (opts.noColor || termflex::utils::env::GetEnv("NO_COLOR"))
    config.theme.color = false;

  const ScreenOptions screenOptions {
    .size      = ResolveTerminalSize(opts.width, opts.height),
    .justify   = opts.justify,
    .align     = opts.align,
    .direction = opts.direction,
  };

  debug_log("rendering at {}x{}", screenOptions.size.width, screenOptions.size.height);

  if (opts.benchmarkMode) {
    PrintBenchmarkReport(RunBenchmark(screenOptions, config, opts.iterations));
    return EXIT_SUCCESS;
  }

  if (opts.jsonOutput) {
    if (opts.screen != Screen::Flex)
      warn_log("--json describes the flex screen; ignoring --screen");

    Result<String> json = FormatFlexJson(BuildFlexPlayground(screenOptions, config), opts.prettyJson);

    if (!json) {
      error_at(json.error());
      return EXIT_FAILURE;
    }

    Println("{}", *json);
    return EXIT_SUCCESS;
  }

  Println("{}", RenderScreen(opts.screen, screenOptions, config));

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
