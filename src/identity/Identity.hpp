#ifndef __OC_IDENTITY__
#define __OC_IDENTITY__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace oc {
/**
 * @brief Public half of an instance identity, safe to share.  Keys are hex.
 */
struct Identity {
  string personEmail;
  string instanceName;
  string personKeyPublic;
  string personSignKeyPublic;
  string instanceKeyPublic;
  string commServerUrl;
};

/**
 * @brief Identity including the secret keys.  Never sent over the wire.
 */
struct IdentityWithSecrets {
  string personEmail;
  string instanceName;
  string personKeySecret;
  string personKeyPublic;
  string personSignKeySecret;
  string personSignKeyPublic;
  string instanceKeySecret;
  string instanceKeyPublic;
  string commServerUrl;
};

bool isIdentity(const json& j);
bool isIdentityWithSecrets(const json& j);

json identityToJson(const Identity& identity);
json identityToJson(const IdentityWithSecrets& identity);

/** @throws std::runtime_error if @p j is not a public identity */
Identity identityFromJson(const json& j);

/** @throws std::runtime_error if @p j is not a secret identity */
IdentityWithSecrets identityWithSecretsFromJson(const json& j);

Identity toPublicIdentity(const IdentityWithSecrets& identity);

/**
 * @brief Creates fresh key pairs.  Missing names are replaced by random
 * strings.
 */
IdentityWithSecrets generateNewIdentity(
    const string& commServerUrl,
    const std::optional<string>& personEmail = std::nullopt,
    const std::optional<string>& instanceName = std::nullopt);

/** @throws std::runtime_error if the file is missing or malformed */
Identity readIdentityFile(const string& path);
IdentityWithSecrets readIdentityWithSecretsFile(const string& path);

void writeIdentityFile(const string& path, const Identity& identity);
void writeIdentityFile(const string& path, const IdentityWithSecrets& identity);

/**
 * @brief Generates an identity and writes <prefix>_secret.id.json and
 * <prefix>.id.json.
 */
IdentityWithSecrets writeNewIdentityToFiles(
    const string& prefix, const string& commServerUrl,
    const std::optional<string>& personEmail = std::nullopt,
    const std::optional<string>& instanceName = std::nullopt);
}  // namespace oc

#endif  // __OC_IDENTITY__
