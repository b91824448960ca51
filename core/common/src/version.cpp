#include "nodevis/common/version.hpp"

#ifndef NODEVIS_VERSION_STRING
#define NODEVIS_VERSION_STRING "0.0.0"
#endif

namespace nodevis::common {

std::string_view version() {
  return NODEVIS_VERSION_STRING;
}

}  // namespace nodevis::common
