#pragma once

#include <cstdint>

namespace apparatus::util {

// Wall-clock milliseconds since the Unix epoch. Unit creation times and
// acknowledgement times are stamped with this.
uint64_t NowMs();

} // namespace apparatus::util
