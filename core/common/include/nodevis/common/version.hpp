#pragma once

#include <string_view>

namespace nodevis::common {

std::string_view version();

}  // namespace nodevis::common
