#ifndef __OC_CONNECTION_ID_REGISTRY__
#define __OC_CONNECTION_ID_REGISTRY__

#include "Headers.hpp"

namespace oc {
/**
 * @brief Hands out connection ids.  Shared by every listener that should draw
 * from the same id space.
 */
class ConnectionIdRegistry {
 public:
  ConnectionIdRegistry() : nextId(1) {}

  uint64_t allocate() { return nextId.fetch_add(1); }

  /** @brief Registry shared by everything in this process. */
  static shared_ptr<ConnectionIdRegistry> processWide() {
    static shared_ptr<ConnectionIdRegistry> registry(
        new ConnectionIdRegistry());
    return registry;
  }

 protected:
  std::atomic<uint64_t> nextId;
};
}  // namespace oc

#endif  // __OC_CONNECTION_ID_REGISTRY__
