#ifndef __OC_ERRORS__
#define __OC_ERRORS__

#include "Headers.hpp"

namespace oc {
/**
 * @brief The underlying channel failed, closed, overflowed or timed out.
 */
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const string& what) : std::runtime_error(what) {}
};

/** @brief A wait expired before anything settled it. */
class TimeoutError : public TransportError {
 public:
  explicit TimeoutError(const string& what) : TransportError(what) {}
};

/**
 * @brief The peer sent something the relay protocol does not allow at this
 * point (wrong command, malformed fields, undecodable challenge).
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief Programmer error such as double start or concurrent waits on one
 * socket.
 */
class UsageError : public std::logic_error {
 public:
  explicit UsageError(const string& what) : std::logic_error(what) {}
};
}  // namespace oc

#endif  // __OC_ERRORS__
