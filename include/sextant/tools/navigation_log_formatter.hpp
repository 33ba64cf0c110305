#pragma once

#include "sextant/navigation/navigation_types.hpp"

#include <string>

namespace sextant::tools {

// One JSON object per event, without a trailing newline.
[[nodiscard]] std::string format_navigation_event_json(const sextant::navigation::NavigationEvent& event);

}  // namespace sextant::tools
