#include <boost/ut.hpp>

#include <filesystem>

#include <Termflex/Utils/Env.hpp>
#include <Termflex/Utils/Error.hpp>
#include <Termflex/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace fs = std::filesystem;

auto main() -> int {
  using namespace boost::ut;
  using namespace termflex::utils::types;
  using termflex::config::Config;
  using termflex::utils::error::TermflexErrorCode;
  using termflex::utils::logging::LogColor;

  "partial files keep the other defaults"_test = [] -> void {
    const Result<Config> cfg = Config::fromToml("[layout]\ngap = 3\n");

    expect(cfg.has_value());
    expect(cfg->gap == 3);
    expect(cfg->breakpoints.small == 80);
    expect(cfg->breakpoints.medium == 120);
    expect(cfg->dashboard.maxHeaderHeight == 5);
    expect(cfg->theme.primary == LogColor::BrightBlue);
    expect(cfg->theme.color);
  };

  "every key is read"_test = [] -> void {
    const Result<Config> cfg = Config::fromToml(R"([layout]
breakpoint_small = 60
breakpoint_medium = 100
gap = 2
min_panel_width = 12
sidebar_width = 30
min_header_height = 2
max_header_height = 4
min_footer_height = 0
max_footer_height = 2
min_main_height = 5

[theme]
primary = "bright_magenta"
muted = "bright-cyan"
title = "white"
accent = "green"
color = false
)");

    expect(cfg.has_value());
    expect(cfg->breakpoints.small == 60);
    expect(cfg->breakpoints.medium == 100);
    expect(cfg->gap == 2);
    expect(cfg->minPanelWidth == 12);
    expect(cfg->sidebarWidth == 30);
    expect(cfg->dashboard.minHeaderHeight == 2);
    expect(cfg->dashboard.maxHeaderHeight == 4);
    expect(cfg->dashboard.minFooterHeight == 0);
    expect(cfg->dashboard.maxFooterHeight == 2);
    expect(cfg->dashboard.minMainHeight == 5);
    expect(cfg->theme.primary == LogColor::BrightMagenta);
    expect(cfg->theme.muted == LogColor::BrightCyan);
    expect(cfg->theme.title == LogColor::White);
    expect(cfg->theme.accent == LogColor::Green);
    expect(!cfg->theme.color);
  };

  "unknown keys and sections are ignored"_test = [] -> void {
    const Result<Config> cfg = Config::fromToml("[layout]\ngap = 4\nshiny = true\n\n[plugins]\nenabled = true\n");

    expect(cfg.has_value());
    expect(cfg->gap == 4);
  };

  "an empty file is the default config"_test = [] -> void {
    const Result<Config> cfg = Config::fromToml("");

    expect(cfg.has_value());
    expect(cfg->gap == 1);
    expect(cfg->sidebarWidth == 0);
  };

  "nonsense values are configuration errors"_test = [] -> void {
    const Result<Config> colour = Config::fromToml("[theme]\nprimary = \"chartreuse\"\n");

    expect(!colour.has_value());
    expect(colour.error().code == TermflexErrorCode::ConfigurationError);
    expect(colour.error().message.find("chartreuse") != String::npos);

    const Result<Config> inverted = Config::fromToml("[layout]\nbreakpoint_small = 120\nbreakpoint_medium = 80\n");

    expect(!inverted.has_value());
    expect(inverted.error().code == TermflexErrorCode::ConfigurationError);

    const Result<Config> negative = Config::fromToml("[layout]\ngap = -1\n");

    expect(!negative.has_value());
    expect(negative.error().code == TermflexErrorCode::ConfigurationError);

    const Result<Config> heights = Config::fromToml("[layout]\nmin_header_height = 6\nmax_header_height = 2\n");

    expect(!heights.has_value());
    expect(heights.error().code == TermflexErrorCode::ConfigurationError);
  };

  "malformed TOML is a parse error"_test = [] -> void {
    const Result<Config> cfg = Config::fromToml("[layout\ngap = = 2\n");

    expect(!cfg.has_value());
    expect(cfg.error().code == TermflexErrorCode::ParseError);
  };

  "responsive options mirror the layout section"_test = [] -> void {
    Config cfg;
    cfg.breakpoints   = { .small = 50, .medium = 90 };
    cfg.gap           = 3;
    cfg.minPanelWidth = 7;

    const termflex::layout::ResponsiveOptions options = cfg.responsiveOptions();

    expect(options.breakpoints.small == 50);
    expect(options.breakpoints.medium == 90);
    expect(options.gap == 3);
    expect(options.minPanelWidth == 7);
  };

  "missing files are IO errors"_test = [] -> void {
    const Result<Config> cfg = Config::load(fs::temp_directory_path() / "termflex-test-missing" / "nope.toml");

    expect(!cfg.has_value());
    expect(cfg.error().code == TermflexErrorCode::IoError);
  };

  "default file round trips and is found via XDG_CONFIG_HOME"_test = [] -> void {
    using termflex::utils::env::SetEnv;

    const fs::path root = fs::temp_directory_path() / "termflex-test-config";
    const fs::path file = root / "termflex" / "config.toml";

    std::error_code errc;
    fs::remove_all(root, errc);

    expect(Config::writeDefault(file).has_value());
    expect(fs::exists(file));

    const Result<Config> cfg = Config::load(file);

    expect(cfg.has_value());
    expect(cfg->gap == 1);
    expect(cfg->breakpoints.medium == 120);
    expect(cfg->theme.primary == LogColor::BrightBlue);
    expect(cfg->theme.muted == LogColor::Gray);

    expect(SetEnv("XDG_CONFIG_HOME", root.string().c_str()).has_value());
    expect(Config::getConfigPath() == file);

    fs::remove_all(root, errc);
  };

  return 0;
}
