#ifndef __OC_HEADERS__
#define __OC_HEADERS__

#include <paths.h>
#include <signal.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#ifndef OC_VERSION
#define OC_VERSION "unknown"
#endif

// Timeouts are expressed in milliseconds.  Negative values select the default
// timeout of the object doing the waiting.
static const int64_t USE_DEFAULT_TIMEOUT = -1;
static const int64_t WAIT_FOREVER = std::numeric_limits<int64_t>::max();

// The relay server expects a pong within this window after each ping.
static const int64_t DEFAULT_PONG_TIMEOUT_MS = 2000;
// Delay before a failed spare connection is retried.
static const int64_t DEFAULT_RECONNECT_TIMEOUT_MS = 5000;
// Undrained messages a BlockingMessageSocket holds before it gives up.
static const size_t DEFAULT_MAX_QUEUED_MESSAGES = 10;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

namespace oc {
inline void initSodium() {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
}

inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  initSodium();
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
}

inline bool isHexString(const string &s) {
  if (s.length() % 2 != 0) {
    return false;
  }
  for (char c : s) {
    if (!isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

/** @brief Lowercase hex encoding of an arbitrary byte string. */
inline string bytesToHex(const string &bytes) {
  string hex(bytes.length() * 2 + 1, '\0');
  sodium_bin2hex(&hex[0], hex.length(),
                 reinterpret_cast<const unsigned char *>(bytes.data()),
                 bytes.length());
  hex.resize(bytes.length() * 2);
  return hex;
}

/**
 * @brief Decodes a hex string into raw bytes.
 * @throws std::runtime_error if the input is not valid hex.
 */
inline string hexToBytes(const string &hex) {
  if (!isHexString(hex)) {
    throw std::runtime_error("Not a hex string: '" + hex + "'");
  }
  string bytes(hex.length() / 2, '\0');
  size_t decodedLength = 0;
  if (sodium_hex2bin(reinterpret_cast<unsigned char *>(&bytes[0]),
                     bytes.length(), hex.c_str(), hex.length(), NULL,
                     &decodedLength, NULL) != 0 ||
      decodedLength != bytes.length()) {
    throw std::runtime_error("Failed to decode hex string");
  }
  return bytes;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

/** @brief Resolves a timeout argument against a default. */
inline int64_t resolveTimeout(int64_t timeoutMs, int64_t defaultTimeoutMs) {
  return timeoutMs < 0 ? defaultTimeoutMs : timeoutMs;
}
}  // namespace oc

#endif  // __OC_HEADERS__
