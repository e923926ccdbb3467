#include "time.hpp"

#include <chrono>

namespace apparatus::util {

uint64_t NowMs() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

} // namespace apparatus::util
