#ifndef __OC_TEST_HEADERS__
#define __OC_TEST_HEADERS__

#include "Headers.hpp"

#include "catch2/catch.hpp"

namespace oc {
/** @brief Polls @p condition until it holds or @p timeoutMs passed. */
inline bool waitUntil(std::function<bool()> condition,
                      int64_t timeoutMs = 5000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}
}  // namespace oc

#endif  // __OC_TEST_HEADERS__
