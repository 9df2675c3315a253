#include <cxxopts.hpp>

#include "CryptoHandler.hpp"
#include "Identity.hpp"
#include "LogHandler.hpp"
#include "RelayListener.hpp"
#include "SimpleIni.h"
#include "sago/platform_folders.h"

using namespace oc;

namespace {
volatile sig_atomic_t shutdownRequested = 0;

void requestShutdown(int signum) { shutdownRequested = 1; }

string defaultIdentityPath() {
  return (fs::path(sago::getConfigHome()) / "onecomm" / "instance_secret.id.json")
      .string();
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  oc::HandleTerminate();

  cxxopts::Options options(
      "oclisten", "Keeps spare connections at a ONE relay server and accepts "
                  "peers that connect through it");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("server", "Relay server url (ws:// or wss://)",
         cxxopts::value<string>())  //
        ("identity", "Secret identity file of this instance",
         cxxopts::value<string>())  //
        ("spare", "Number of spare connections kept at the relay",
         cxxopts::value<int>())  //
        ("reconnect-timeout", "Delay before retrying a failed connection (ms)",
         cxxopts::value<int64_t>())  //
        ("pong-timeout", "How long to wait for a pong (ms)",
         cxxopts::value<int64_t>())  //
        ("generate-identity",
         "Write <prefix>_secret.id.json and <prefix>.id.json and exit",
         cxxopts::value<string>(), "PREFIX")  //
        ("email", "Person email used by --generate-identity",
         cxxopts::value<string>())  //
        ("instance", "Instance name used by --generate-identity",
         cxxopts::value<string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "oclisten"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "oclisten version " << OC_VERSION << endl;
      exit(0);
    }

    string serverUrl;
    string identityPath;
    RelayListenerConfig config;
    bool logToStdout = result.count("logtostdout") > 0;
    int verbosity = 0;
    string maxlogsize = "20971520";

    if (!result["cfgfile"].as<string>().empty()) {
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc != 0) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
      const char *url = ini.GetValue("Relay", "url", NULL);
      if (url) {
        serverUrl = url;
      }
      config.spareConnectionLimit = size_t(
          ini.GetLongValue("Relay", "spare_connections",
                           long(config.spareConnectionLimit)));
      config.reconnectTimeoutMs = ini.GetLongValue(
          "Relay", "reconnect_timeout_ms", long(config.reconnectTimeoutMs));
      config.pongTimeoutMs = ini.GetLongValue("Relay", "pong_timeout_ms",
                                              long(config.pongTimeoutMs));
      const char *identityFile = ini.GetValue("Identity", "file", NULL);
      if (identityFile) {
        identityPath = identityFile;
      }
      verbosity = int(ini.GetLongValue("Debug", "verbose", 0));
      logToStdout =
          logToStdout || ini.GetBoolValue("Debug", "logtostdout", false);
      // read log file size limit
      const char *logsize = ini.GetValue("Debug", "logsize", NULL);
      if (logsize && atoi(logsize) != 0) {
        maxlogsize = string(logsize);
      }
    }

    // Command line wins over the config file
    if (result.count("server")) {
      serverUrl = result["server"].as<string>();
    }
    if (result.count("identity")) {
      identityPath = result["identity"].as<string>();
    }
    if (result.count("spare")) {
      int spare = result["spare"].as<int>();
      if (spare <= 0) {
        CLOG(INFO, "stdout") << "--spare must be at least 1" << endl;
        exit(1);
      }
      config.spareConnectionLimit = size_t(spare);
    }
    if (result.count("reconnect-timeout")) {
      config.reconnectTimeoutMs = result["reconnect-timeout"].as<int64_t>();
    }
    if (result.count("pong-timeout")) {
      config.pongTimeoutMs = result["pong-timeout"].as<int64_t>();
    }
    if (result.count("verbose")) {
      verbosity = result["verbose"].as<int>();
    }
    if (identityPath.empty()) {
      identityPath = defaultIdentityPath();
    }

    LogHandler::setupLogFile(&defaultConf, result["logdir"].as<string>(),
                             "oclisten", logToStdout, maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setVerbosity(verbosity);
    el::Helpers::setThreadName("oclisten-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (result.count("generate-identity")) {
      if (serverUrl.empty()) {
        CLOG(INFO, "stdout") << "--generate-identity needs --server" << endl;
        exit(1);
      }
      std::optional<string> email;
      std::optional<string> instance;
      if (result.count("email")) {
        email = result["email"].as<string>();
      }
      if (result.count("instance")) {
        instance = result["instance"].as<string>();
      }
      string prefix = result["generate-identity"].as<string>();
      IdentityWithSecrets identity =
          writeNewIdentityToFiles(prefix, serverUrl, email, instance);
      CLOG(INFO, "stdout") << "Wrote " << prefix << "_secret.id.json and "
                           << prefix << ".id.json for instance "
                           << identity.instanceName << endl;
      exit(0);
    }

    IdentityWithSecrets identity = readIdentityWithSecretsFile(identityPath);
    if (serverUrl.empty()) {
      serverUrl = identity.commServerUrl;
    }
    if (serverUrl.empty()) {
      CLOG(INFO, "stdout") << "No relay server url given" << endl;
      exit(1);
    }

    initSodium();
    auto crypto = make_shared<CryptoHandler>(
        hexToBytes(identity.instanceKeySecret));

    RelayListener listener(config);
    listener.setCrypto(
        [crypto](const string &peerPublicKey, const string &data) {
          return crypto->encrypt(peerPublicKey, data);
        },
        [crypto](const string &peerPublicKey, const string &data) {
          return crypto->decrypt(peerPublicKey, data);
        });
    listener.onStateChange.connect([](ListenerState newState,
                                      ListenerState oldState,
                                      const string &reason) {
      CLOG(INFO, "stdout") << listenerStateName(oldState) << " -> "
                           << listenerStateName(newState)
                           << (reason.empty() ? "" : " (" + reason + ")")
                           << endl;
    });
    listener.onConnection.connect(
        [](shared_ptr<BlockingMessageSocket> socket) {
          CLOG(INFO, "stdout")
              << "Peer connected on " << socket->describe() << endl;
          // oclisten only demonstrates the hand-over, it has no session
          // protocol to speak.
          socket->close("oclisten does not serve sessions");
        });

    ::signal(SIGINT, requestShutdown);
    ::signal(SIGTERM, requestShutdown);

    listener.start(serverUrl, hexToBytes(identity.instanceKeyPublic));
    CLOG(INFO, "stdout") << "Listening as " << identity.instanceName << " at "
                         << serverUrl << endl;

    while (!shutdownRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LOG(INFO) << "Got interrupt, stopping listener";
    listener.stop();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &e) {
    CLOG(INFO, "stdout") << "Error: " << e.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
