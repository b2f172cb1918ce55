/**
 * @file CLI.cpp
 * @brief Benchmark and JSON output helpers implementation
 */

#include "CLI.hpp"

#include <algorithm>                 // std::ranges::sort, std::max
#include <chrono>                    // std::chrono::{high_resolution_clock, duration}
#include <glaze/glaze.hpp>           // glz::write, glz::write_json, glz::format_error
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_values, enum_name}

#include <Termflex/Utils/Error.hpp>
#include <Termflex/Utils/Logging.hpp>

namespace termflex::cli {
  using namespace utils::types;
  using namespace utils::logging;
  using namespace config;

  using enum utils::error::TermflexErrorCode;

  auto RunBenchmark(
    const ui::ScreenOptions& options,
    const Config&            config,
    const i32                iterations
  ) -> Vec<BenchmarkResult> {
    using std::chrono::high_resolution_clock, std::chrono::duration;

    const i32 passes = std::max(iterations, 1);

    Vec<BenchmarkResult> results;
    results.reserve(magic_enum::enum_count<ui::Screen>());

    for (const ui::Screen screen : magic_enum::enum_values<ui::Screen>()) {
      bool rendered = true;

      auto start = high_resolution_clock::now();

      for (i32 pass = 0; pass < passes; ++pass)
        rendered = !ui::RenderScreen(screen, options, config).empty() && rendered;

      auto end = high_resolution_clock::now();
      auto dur = duration<f64, std::milli>(end - start).count();

      results.push_back({ .name = String(magic_enum::enum_name(screen)), .durationMs = dur / passes, .success = rendered });
    }

    return results;
  }

  auto PrintBenchmarkReport(const Vec<BenchmarkResult>& results) -> Unit {
    Vec<BenchmarkResult> sorted = results;

    // Slowest first
    std::ranges::sort(sorted, [](const BenchmarkResult& resA, const BenchmarkResult& resB) -> bool {
      return resA.durationMs > resB.durationMs;
    });

    usize maxNameLen = 0;
    for (const BenchmarkResult& result : sorted)
      maxNameLen = std::max(maxNameLen, result.name.size());

    f64 totalTime = 0.0;

    Println("Benchmark Results:");
    Println("==================");
    Println();
    Println("Screens (mean per render):");
    Println("--------------------------");

    for (const BenchmarkResult& result : sorted) {
      String status  = result.success ? "✓" : "✗";
      String padding = String(maxNameLen - result.name.size(), ' ');
      Println("  {} {}{} {:>8.3f} ms", status, result.name, padding, result.durationMs);
      totalTime += result.durationMs;
    }

    Println();
    Println("  Total: {:>8.3f} ms ({} screens)", totalTime, sorted.size());
  }

  auto DescribeFlexLayout(const layout::FlexContainer& container) -> FlexLayoutJson {
    const layout::FlexLayout geometry = container.computeLayout();

    return {
      .direction      = String(magic_enum::enum_name(container.direction())),
      .justifyContent = String(magic_enum::enum_name(container.justifyContent())),
      .alignItems     = String(magic_enum::enum_name(container.alignItems())),
      .containerMain  = geometry.containerMain,
      .availableMain  = geometry.availableMain,
      .crossSize      = geometry.crossSize,
      .leftover       = geometry.leftover,
      .order          = geometry.order,
      .sizes          = geometry.sizes,
      .spacing        = geometry.spacing,
      .clamps         = geometry.clamps.names(),
    };
  }

  auto FormatFlexJson(const layout::FlexContainer& container, const bool prettyJson) -> Result<String> {
    const FlexLayoutJson output = DescribeFlexLayout(container);

    String jsonStr;

    glz::error_ctx errorContext =
      prettyJson
      ? glz::write<glz::opts { .prettify = true }>(output, jsonStr)
      : glz::write_json(output, jsonStr);

    if (errorContext)
      ERR_FMT(InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    return jsonStr;
  }
} // namespace termflex::cli
