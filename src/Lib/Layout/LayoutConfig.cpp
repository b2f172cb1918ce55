#include <Termflex/Layout/LayoutConfig.hpp>

#include <algorithm>                 // std::max
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_values, magic_enum::enum_name

using namespace termflex::utils::types;

namespace termflex::layout {
  auto LayoutConfig::sanitized() const -> LayoutConfig {
    return {
      .width         = std::max(width, 0),
      .height        = std::max(height, 0),
      .padding       = std::max(padding, 0),
      .margin        = std::max(margin, 0),
      .gap           = std::max(gap, 0),
      .minPanelWidth = std::max(minPanelWidth, 0),
    };
  }

  auto ClampFlags::names() const -> Vec<String> {
    Vec<String> out;

    for (const ClampFlag flag : magic_enum::enum_values<ClampFlag>())
      if (has(flag))
        out.emplace_back(magic_enum::enum_name(flag));

    return out;
  }

  auto ClampFlags::describe() const -> String {
    String out;

    for (const String& name : names()) {
      if (!out.empty())
        out += '|';
      out += name;
    }

    return out;
  }
} // namespace termflex::layout
