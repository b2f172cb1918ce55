/**
 * @file CLI.hpp
 * @brief Benchmark and JSON output helpers for the termflex CLI.
 */

#pragma once

#include <glaze/glaze.hpp> // glz::meta, glz::object

#include <Termflex/Layout/Flex.hpp>
#include <Termflex/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "UI/Screens.hpp"

namespace termflex::cli {
  /**
   * @brief Timing of one screen's render passes.
   */
  struct BenchmarkResult {
    utils::types::String name;
    utils::types::f64    durationMs; ///< Mean wall time of one render.
    bool                 success;    ///< False when the render produced nothing.
  };

  /**
   * @struct FlexLayoutJson
   * @brief Serializable view of a FlexContainer and its computed geometry.
   */
  struct FlexLayoutJson {
    utils::types::String                    direction;
    utils::types::String                    justifyContent;
    utils::types::String                    alignItems;
    utils::types::i32                       containerMain = 0;
    utils::types::i32                       availableMain = 0;
    utils::types::i32                       crossSize     = 0;
    utils::types::i32                       leftover      = 0;
    utils::types::Vec<utils::types::usize>  order;
    utils::types::Vec<utils::types::i32>    sizes;
    utils::types::Vec<utils::types::i32>    spacing;
    utils::types::Vec<utils::types::String> clamps;
  };

  /**
   * @brief Renders every screen `iterations` times at the given size.
   * @return One result per screen, in Screen order.
   */
  auto RunBenchmark(
    const ui::ScreenOptions& options,
    const config::Config&    config,
    utils::types::i32        iterations
  ) -> utils::types::Vec<BenchmarkResult>;

  /**
   * @brief Prints the results slowest first, with a total.
   */
  auto PrintBenchmarkReport(const utils::types::Vec<BenchmarkResult>& results) -> utils::types::Unit;

  /**
   * @brief Collects the container's settings and computeLayout() output.
   */
  auto DescribeFlexLayout(const layout::FlexContainer& container) -> FlexLayoutJson;

  /**
   * @brief Serializes DescribeFlexLayout() with glaze.
   * @return InternalError if glaze fails to write.
   */
  auto FormatFlexJson(const layout::FlexContainer& container, bool prettyJson) -> utils::types::Result<utils::types::String>;
} // namespace termflex::cli

namespace glz {
  template <>
  struct meta<termflex::cli::FlexLayoutJson> {
    using T = termflex::cli::FlexLayoutJson;

    // clang-format off
    static constexpr auto value = object(
      "direction",      &T::direction,
      "justifyContent", &T::justifyContent,
      "alignItems",     &T::alignItems,
      "containerMain",  &T::containerMain,
      "availableMain",  &T::availableMain,
      "crossSize",      &T::crossSize,
      "leftover",       &T::leftover,
      "order",          &T::order,
      "sizes",          &T::sizes,
      "spacing",        &T::spacing,
      "clamps",         &T::clamps
    );
    // clang-format on
  };
} // namespace glz
