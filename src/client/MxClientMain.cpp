#include "ClientConfig.hpp"
#include "LogHandler.hpp"
#include "MxClient.hpp"
#include "SessionStore.hpp"
#include "WebSocketTransport.hpp"
#include "cxxopts.hpp"

using namespace mx;

namespace {
optional<string> readCodeFromStdin() {
  CLOG(INFO, "stdout") << "Enter the verification code: " << endl;
  string code;
  if (!getline(cin, code)) {
    return nullopt;
  }
  return code;
}

void printUpdate(const string& label, const json& payload) {
  CLOG(INFO, "stdout") << label << ": " << payload.dump(-1, ' ', false, json::error_handler_t::replace) << endl;
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  mx::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, mx::InterruptSignalHandler);

  cxxopts::Options options("mxclient",
                           "Stays logged in and prints incoming messages");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("phone", "Phone number used when no token is saved",
         cxxopts::value<std::string>())  //
        ("session", "Session file",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("endpoint", "WebSocket url of the server",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging")                           //
        ("debug", "Log every frame in full");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "mxclient version " << MX_VERSION << endl;
      exit(0);
    }

    ClientConfig config;
    if (result.count("cfgfile")) {
      config.loadFile(result["cfgfile"].as<string>());
    }
    // Command line wins over the config file
    if (result.count("session")) {
      config.sessionFile = result["session"].as<string>();
    }
    if (result.count("endpoint")) {
      config.endpoint = result["endpoint"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("silent")) {
      config.silent = true;
    }
    if (result.count("debug")) {
      config.debug = true;
    }

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "mxclient", result.count("logtostdout"),
                              config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("client-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    optional<string> phone;
    if (result.count("phone")) {
      phone = result["phone"].as<string>();
    } else if (const char* envPhone = ::getenv("PHONE")) {
      phone = string(envPhone);
    }

    auto store = std::make_shared<JsonFileSessionStore>(config.sessionFile);
    MxClient client(config, std::make_shared<WebSocketTransport>(), store);

    client.on(EventName::NEW_MESSAGE,
              [](const json& payload) { printUpdate("New message", payload); });
    client.on(EventName::MESSAGE_SENT, [](const json& payload) {
      printUpdate("Message sent", payload);
    });
    client.on(EventName::CONTACTS_UPDATE, [](const json& payload) {
      printUpdate("Contacts", payload);
    });
    client.on(EventName::CHATS_UPDATE,
              [](const json& payload) { printUpdate("Chats", payload); });

    CLOG(INFO, "stdout") << "Connecting to " << config.endpoint << endl;
    json login = client.start(phone, readCodeFromStdin);
    auto chats = login.find("chats");
    if (chats != login.end() && chats->is_array()) {
      CLOG(INFO, "stdout") << "Loaded " << chats->size() << " chats" << endl;
    }
    CLOG(INFO, "stdout") << "Logged in, press ctrl+c to exit" << endl;

    client.runUntilDisconnected();
  } catch (const cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const AuthFailed& af) {
    CLOG(INFO, "stdout") << "Login failed (" << authFailureKindName(af.getKind())
                         << "): " << af.what() << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  } catch (const json::exception& je) {
    CLOG(INFO, "stdout") << "Error: " << je.what() << endl;
    exit(1);
  }

  return 0;
}
