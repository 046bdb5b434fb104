#include "common/types.hpp"

namespace runway {

const char* ToString(RunwayEvent ev) {
  switch (ev) {
    case RunwayEvent::Takeoff:    return "takeoff";
    case RunwayEvent::Landing:    return "landing";
    case RunwayEvent::TouchAndGo: return "touch-n-go";
    case RunwayEvent::None:       break;
  }
  return "";
}

} // namespace runway
