#include <cxxopts.hpp>

#include "ControlChannel.hpp"
#include "EventDispatcher.hpp"
#include "Headers.hpp"
#include "LinkConfig.hpp"
#include "LogHandler.hpp"
#include "PairingCoordinator.hpp"
#include "QrPayload.hpp"
#include "ScanSession.hpp"
#include "SimulatedScanCapability.hpp"
#include "TcpSocketHandler.hpp"

using namespace scanlink;

namespace {
volatile sig_atomic_t interrupted = 0;

void interruptSignalHandler(int signum) { interrupted = 1; }

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  scanlink::HandleTerminate();

  ::signal(SIGINT, interruptSignalHandler);
  ::signal(SIGTERM, interruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("scanlink",
                           "Pairs this device with a room scan console");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "IPv4 address of the console",
         cxxopts::value<std::string>())  //
        ("token", "Session token shown by the console",
         cxxopts::value<std::string>())  //
        ("qr", "Text of a scanned pairing QR code",
         cxxopts::value<std::string>())  //
        ("p,port", "Console port",
         cxxopts::value<int>()->default_value(
             std::to_string(DEFAULT_CONSOLE_PORT)))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())                         //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging")                           //
        ("no-reconnect", "Give up when the connection drops")  //
        ("k,keepalive",
         "Seconds between keepalive packets, which the console must echo "
         "(0 disables)",
         cxxopts::value<int>())  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "scanlink version " << SCANLINK_VERSION << endl;
      exit(0);
    }

    LinkConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      try {
        config = LinkConfig::loadFromFile(cfgfilename);
      } catch (const std::runtime_error& re) {
        STFATAL << re.what();
      }
    }

    // Command line values take precedence over the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("token")) {
      config.token = result["token"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("silent")) {
      config.silent = true;
    }
    if (result.count("no-reconnect")) {
      config.reconnectEnabled = false;
    }
    if (result.count("keepalive")) {
      config.keepaliveSeconds = result["keepalive"].as<int>();
    }

    optional<QrScanResult> qrScan;
    if (result.count("qr")) {
      string error;
      qrScan = parseQrPayload(result["qr"].as<string>(), &error);
      if (!qrScan) {
        CLOG(INFO, "stdout") << error << endl;
        exit(1);
      }
    }

    string logDirectory = GetTempDirectory() + "scanlink";
    if (result.count("logdir")) {
      logDirectory = result["logdir"].as<string>();
    }
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "scanlink",
                              result.count("logtostdout") > 0,
                              result.count("logtostdout") == 0,
                              config.maxLogSize);
    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("scanlink-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    shared_ptr<EventDispatcher> dispatcher(new EventDispatcher());
    shared_ptr<SocketHandler> socketHandler(
        new TcpSocketHandler(10 * 1000));
    shared_ptr<ControlChannel> channel(new ControlChannel(
        socketHandler, dispatcher, config.toChannelOptions()));
    shared_ptr<SimulatedScanCapability> capability(
        new SimulatedScanCapability());
    PairingCoordinator coordinator(channel, capability, config.port);

    PairingOutcome outcome = qrScan
                                 ? coordinator.pair(*qrScan)
                                 : coordinator.pair(config.host, config.token);
    if (!outcome.isSuccess()) {
      CLOG(INFO, "stdout") << outcome.describe() << endl;
      if (outcome.getKind() == PairingOutcome::Kind::INVALID) {
        CLOG(INFO, "stdout") << options.help({}) << endl;
      }
      return 1;
    }
    auto credentials = *coordinator.getCredentials();
    CLOG(INFO, "stdout") << "Paired with " << credentials << endl;

    int exitCode = 0;
    {
      ScanSession session(channel, dispatcher, capability, credentials);
      session.begin();
      while (!interrupted) {
        auto state = channel->getState();
        if (state.getStatus() == ConnectionStatus::FAILED) {
          CLOG(INFO, "stdout") << "Connection ended: " << state << endl;
          exitCode = 1;
          break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      if (interrupted) {
        LOG(INFO) << "Got interrupt, shutting down";
      }
      session.end();
    }

    auto stats = channel->getStats();
    LOG(INFO) << "Frames sent: " << stats.framesSent
              << " received: " << stats.framesReceived
              << " dropped: " << stats.droppedSends
              << " decode errors: " << stats.decodeErrors
              << " reconnects: " << stats.reconnects;

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    return exitCode;
  } catch (cxxopts::OptionException& oe) {
    handleParseException(oe, options);
  }
  return 1;
}
