#include "CryptoHandler.hpp"

#define SODIUM_FAIL(X)                                         \
  {                                                            \
    int rc = (X);                                              \
    if ((rc) == -1) STFATAL << "Crypto Error: (" << rc << ")"; \
  }

namespace oc {

CryptoHandler::CryptoHandler(const string& _secretKey) {
  initSodium();
  if (_secretKey.length() != crypto_box_SECRETKEYBYTES) {
    throw std::runtime_error("Invalid secret key length: " +
                             to_string(_secretKey.length()));
  }
  memcpy(secretKey, _secretKey.data(), crypto_box_SECRETKEYBYTES);
  SODIUM_FAIL(crypto_scalarmult_base(publicKey, secretKey));
}

CryptoHandler::~CryptoHandler() {
  sodium_memzero(secretKey, sizeof(secretKey));
}

string CryptoHandler::encrypt(const string& peerPublicKey,
                              const string& plaintext) {
  checkPeerKey(peerPublicKey);
  string retval(crypto_box_NONCEBYTES + crypto_box_MACBYTES + plaintext.length(),
                '\0');
  unsigned char* nonce = (unsigned char*)&retval[0];
  randombytes_buf(nonce, crypto_box_NONCEBYTES);
  SODIUM_FAIL(crypto_box_easy(
      (unsigned char*)&retval[crypto_box_NONCEBYTES],
      (const unsigned char*)plaintext.data(), plaintext.length(), nonce,
      (const unsigned char*)peerPublicKey.data(), secretKey));
  return retval;
}

string CryptoHandler::decrypt(const string& peerPublicKey,
                              const string& ciphertext) {
  checkPeerKey(peerPublicKey);
  if (ciphertext.length() < crypto_box_NONCEBYTES + crypto_box_MACBYTES) {
    throw std::runtime_error("Ciphertext too short: " +
                             to_string(ciphertext.length()) + " bytes");
  }
  const unsigned char* nonce = (const unsigned char*)ciphertext.data();
  size_t boxLength = ciphertext.length() - crypto_box_NONCEBYTES;
  string retval(boxLength - crypto_box_MACBYTES, '\0');
  if (crypto_box_open_easy(
          (unsigned char*)&retval[0],
          (const unsigned char*)ciphertext.data() + crypto_box_NONCEBYTES,
          boxLength, nonce, (const unsigned char*)peerPublicKey.data(),
          secretKey) == -1) {
    throw std::runtime_error("Decrypt failed.  Possible key mismatch?");
  }
  return retval;
}

string CryptoHandler::getPublicKey() const {
  return string((const char*)publicKey, crypto_box_PUBLICKEYBYTES);
}

pair<string, string> CryptoHandler::generateKeyPair() {
  initSodium();
  string pk(crypto_box_PUBLICKEYBYTES, '\0');
  string sk(crypto_box_SECRETKEYBYTES, '\0');
  SODIUM_FAIL(crypto_box_keypair((unsigned char*)&pk[0],
                                 (unsigned char*)&sk[0]));
  return make_pair(pk, sk);
}

pair<string, string> CryptoHandler::generateSignKeyPair() {
  initSodium();
  string pk(crypto_sign_PUBLICKEYBYTES, '\0');
  string sk(crypto_sign_SECRETKEYBYTES, '\0');
  SODIUM_FAIL(crypto_sign_keypair((unsigned char*)&pk[0],
                                  (unsigned char*)&sk[0]));
  return make_pair(pk, sk);
}

void CryptoHandler::checkPeerKey(const string& peerPublicKey) const {
  if (peerPublicKey.length() != crypto_box_PUBLICKEYBYTES) {
    throw std::runtime_error("Invalid peer public key length: " +
                             to_string(peerPublicKey.length()));
  }
}
}  // namespace oc
