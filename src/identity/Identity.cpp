#include "Identity.hpp"

#include "CryptoHandler.hpp"

namespace oc {
namespace {
const int RANDOM_NAME_LENGTH = 32;

bool hasHexField(const json& j, const char* key) {
  return hasStringField(j, key) && isHexString(j[key].get<string>());
}

bool hasType(const json& j, const char* type) {
  return hasStringField(j, "type") && j["type"].get<string>() == type;
}

json readJsonFile(const string& path) {
  std::ifstream in(path);
  if (!in.good()) {
    throw std::runtime_error("Cannot open identity file " + path);
  }
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    throw std::runtime_error("Identity file " + path + " is not valid JSON");
  }
  return j;
}

void writeJsonFile(const string& path, const json& j) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.good()) {
    throw std::runtime_error("Cannot write identity file " + path);
  }
  out << j.dump(4);
  if (!out.good()) {
    throw std::runtime_error("Writing identity file " + path + " failed");
  }
}
}  // namespace

bool isIdentity(const json& j) {
  return j.is_object() && hasType(j, "public") &&
         hasStringField(j, "personEmail") &&
         hasStringField(j, "instanceName") &&
         hasHexField(j, "personKeyPublic") &&
         hasHexField(j, "personSignKeyPublic") &&
         hasHexField(j, "instanceKeyPublic") &&
         hasStringField(j, "commServerUrl");
}

bool isIdentityWithSecrets(const json& j) {
  return j.is_object() && hasType(j, "secret") &&
         hasStringField(j, "personEmail") &&
         hasStringField(j, "instanceName") &&
         hasHexField(j, "personKeySecret") &&
         hasHexField(j, "personKeyPublic") &&
         hasHexField(j, "personSignKeySecret") &&
         hasHexField(j, "personSignKeyPublic") &&
         hasHexField(j, "instanceKeySecret") &&
         hasHexField(j, "instanceKeyPublic") &&
         hasStringField(j, "commServerUrl");
}

json identityToJson(const Identity& identity) {
  return {{"type", "public"},
          {"personEmail", identity.personEmail},
          {"instanceName", identity.instanceName},
          {"personKeyPublic", identity.personKeyPublic},
          {"personSignKeyPublic", identity.personSignKeyPublic},
          {"instanceKeyPublic", identity.instanceKeyPublic},
          {"commServerUrl", identity.commServerUrl}};
}

json identityToJson(const IdentityWithSecrets& identity) {
  return {{"type", "secret"},
          {"personEmail", identity.personEmail},
          {"instanceName", identity.instanceName},
          {"personKeySecret", identity.personKeySecret},
          {"personKeyPublic", identity.personKeyPublic},
          {"personSignKeySecret", identity.personSignKeySecret},
          {"personSignKeyPublic", identity.personSignKeyPublic},
          {"instanceKeySecret", identity.instanceKeySecret},
          {"instanceKeyPublic", identity.instanceKeyPublic},
          {"commServerUrl", identity.commServerUrl}};
}

Identity identityFromJson(const json& j) {
  if (!isIdentity(j)) {
    throw std::runtime_error("Data is not a public identity");
  }
  Identity identity;
  identity.personEmail = j["personEmail"].get<string>();
  identity.instanceName = j["instanceName"].get<string>();
  identity.personKeyPublic = j["personKeyPublic"].get<string>();
  identity.personSignKeyPublic = j["personSignKeyPublic"].get<string>();
  identity.instanceKeyPublic = j["instanceKeyPublic"].get<string>();
  identity.commServerUrl = j["commServerUrl"].get<string>();
  return identity;
}

IdentityWithSecrets identityWithSecretsFromJson(const json& j) {
  if (!isIdentityWithSecrets(j)) {
    throw std::runtime_error("Data is not a secret identity");
  }
  IdentityWithSecrets identity;
  identity.personEmail = j["personEmail"].get<string>();
  identity.instanceName = j["instanceName"].get<string>();
  identity.personKeySecret = j["personKeySecret"].get<string>();
  identity.personKeyPublic = j["personKeyPublic"].get<string>();
  identity.personSignKeySecret = j["personSignKeySecret"].get<string>();
  identity.personSignKeyPublic = j["personSignKeyPublic"].get<string>();
  identity.instanceKeySecret = j["instanceKeySecret"].get<string>();
  identity.instanceKeyPublic = j["instanceKeyPublic"].get<string>();
  identity.commServerUrl = j["commServerUrl"].get<string>();
  return identity;
}

Identity toPublicIdentity(const IdentityWithSecrets& identity) {
  Identity publicIdentity;
  publicIdentity.personEmail = identity.personEmail;
  publicIdentity.instanceName = identity.instanceName;
  publicIdentity.personKeyPublic = identity.personKeyPublic;
  publicIdentity.personSignKeyPublic = identity.personSignKeyPublic;
  publicIdentity.instanceKeyPublic = identity.instanceKeyPublic;
  publicIdentity.commServerUrl = identity.commServerUrl;
  return publicIdentity;
}

IdentityWithSecrets generateNewIdentity(
    const string& commServerUrl, const std::optional<string>& personEmail,
    const std::optional<string>& instanceName) {
  auto personKeys = CryptoHandler::generateKeyPair();
  auto personSignKeys = CryptoHandler::generateSignKeyPair();
  auto instanceKeys = CryptoHandler::generateKeyPair();

  IdentityWithSecrets identity;
  identity.personEmail =
      personEmail ? *personEmail : genRandomAlphaNum(RANDOM_NAME_LENGTH);
  identity.instanceName =
      instanceName ? *instanceName : genRandomAlphaNum(RANDOM_NAME_LENGTH);
  identity.personKeyPublic = bytesToHex(personKeys.first);
  identity.personKeySecret = bytesToHex(personKeys.second);
  identity.personSignKeyPublic = bytesToHex(personSignKeys.first);
  identity.personSignKeySecret = bytesToHex(personSignKeys.second);
  identity.instanceKeyPublic = bytesToHex(instanceKeys.first);
  identity.instanceKeySecret = bytesToHex(instanceKeys.second);
  identity.commServerUrl = commServerUrl;
  return identity;
}

Identity readIdentityFile(const string& path) {
  json j = readJsonFile(path);
  if (!isIdentity(j)) {
    throw std::runtime_error("File " + path +
                             " does not contain a public identity");
  }
  return identityFromJson(j);
}

IdentityWithSecrets readIdentityWithSecretsFile(const string& path) {
  json j = readJsonFile(path);
  if (!isIdentityWithSecrets(j)) {
    throw std::runtime_error("File " + path +
                             " does not contain a secret identity");
  }
  return identityWithSecretsFromJson(j);
}

void writeIdentityFile(const string& path, const Identity& identity) {
  writeJsonFile(path, identityToJson(identity));
}

void writeIdentityFile(const string& path,
                       const IdentityWithSecrets& identity) {
  writeJsonFile(path, identityToJson(identity));
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace);
}

IdentityWithSecrets writeNewIdentityToFiles(
    const string& prefix, const string& commServerUrl,
    const std::optional<string>& personEmail,
    const std::optional<string>& instanceName) {
  IdentityWithSecrets identity =
      generateNewIdentity(commServerUrl, personEmail, instanceName);
  writeIdentityFile(prefix + "_secret.id.json", identity);
  writeIdentityFile(prefix + ".id.json", toPublicIdentity(identity));
  LOG(INFO) << "Wrote identity files " << prefix << "_secret.id.json and "
            << prefix << ".id.json";
  return identity;
}
}  // namespace oc
