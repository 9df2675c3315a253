#ifndef __OC_CRYPTO_HANDLER__
#define __OC_CRYPTO_HANDLER__

#include <sodium.h>

#include "Headers.hpp"

namespace oc {

/**
 * @brief Public key encryption between this instance and a peer.
 *
 * Wraps libsodium crypto_box.  Every ciphertext carries its own random nonce
 * in front of the sealed box, so no state is shared between calls.
 */
class CryptoHandler {
 public:
  /**
   * @param secretKey Exactly crypto_box_SECRETKEYBYTES raw bytes.
   */
  explicit CryptoHandler(const string& secretKey);
  ~CryptoHandler();

  /**
   * @brief Seals @p plaintext for the owner of @p peerPublicKey.
   * @return nonce || box
   */
  string encrypt(const string& peerPublicKey, const string& plaintext);

  /**
   * @brief Opens a nonce || box message sent by @p peerPublicKey.
   * @throws std::runtime_error if the message is truncated or forged.
   */
  string decrypt(const string& peerPublicKey, const string& ciphertext);

  /** @brief The public key matching the secret key. */
  string getPublicKey() const;

  /** @brief Creates a fresh box key pair as (public, secret). */
  static pair<string, string> generateKeyPair();

  /** @brief Creates a fresh signing key pair as (public, secret). */
  static pair<string, string> generateSignKeyPair();

 protected:
  void checkPeerKey(const string& peerPublicKey) const;

  unsigned char secretKey[crypto_box_SECRETKEYBYTES];
  unsigned char publicKey[crypto_box_PUBLICKEYBYTES];
};
}  // namespace oc

#endif  // __OC_CRYPTO_HANDLER__
