#include <cxxopts.hpp>

#include "AdminServer.hpp"
#include "BridgeConfig.hpp"
#include "BridgeServer.hpp"
#include "CertificateProvisioner.hpp"
#include "LogHandler.hpp"
#include "WebSocketTransport.hpp"

using namespace sb;

namespace {
/**
 * Opens the websocket listeners. In secure mode TLS goes on `port` with a
 * plain fallback on `port + 1`; if TLS cannot be set up a single plain
 * listener takes `port`.
 */
void openListeners(WebSocketTransport* transport, const BridgeConfig& config) {
  if (!config.secure) {
    transport->listen(config.bindIp, config.port);
    return;
  }

  shared_ptr<boost::asio::ssl::context> sslContext;
  try {
    CertificateProvisioner provisioner(config.certDir);
    provisioner.ensureCertificate();
    sslContext = provisioner.createServerContext();
  } catch (const std::exception& e) {
    STERROR << "Failed to set up TLS: " << e.what();
    CLOG(INFO, "stdout") << "TLS unavailable, falling back to plain websocket"
                         << endl;
    transport->listen(config.bindIp, config.port);
    return;
  }

  transport->listen(config.bindIp, config.port, sslContext);
  transport->listen(config.bindIp, config.port + 1);
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  sb::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, sb::InterruptSignalHandler);
  // Writes to closed sockets and pipes are reported as errors instead
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("sbserver",
                           "Browser terminals and command routing over "
                           "websockets");
  try {
    options.allow_unrecognised_options();
    BridgeConfig::addOptions(&options);

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "sbserver version " << SB_VERSION << endl;
      exit(0);
    }

    BridgeConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      try {
        config.loadIniFile(result["cfgfile"].as<string>());
      } catch (const std::runtime_error& e) {
        STFATAL << e.what();
      }
    }
    config.applyCommandLine(result);

    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    el::Loggers::setVerboseLevel(config.verbose);

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    LogHandler::setupLogFiles(&defaultConf, config.logDir, "sbserver",
                              config.logToStdout, !config.logToStdout,
                              config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("sbserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    LOG(INFO) << "Starting sbserver " << SB_VERSION;

    shared_ptr<TerminalSessionManager> terminalManager(
        new TerminalSessionManager(config.limits));
    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
    shared_ptr<ToolRegistry> toolRegistry(new ToolRegistry(subprocessUtils));
    shared_ptr<CommandRoutingEngine> routingEngine(new CommandRoutingEngine(
        toolRegistry, subprocessUtils, config.historyMaxEntries));
    shared_ptr<SessionStore> sessionStore(new MemorySessionStore());

    BridgeServerOptions serverOptions;
    serverOptions.autoAuth = config.autoAuth;
    serverOptions.heartbeatTimeoutMs = config.heartbeatTimeoutMs;
    shared_ptr<BridgeServer> bridgeServer(new BridgeServer(
        terminalManager, routingEngine, sessionStore, serverOptions));

    WebSocketTransport transport(bridgeServer);
    transport.setAllowedOrigins(config.allowedOrigins);
    try {
      openListeners(&transport, config);
    } catch (const boost::system::system_error& e) {
      STFATAL << "Cannot listen on port " << config.port << ": " << e.what();
    }
    transport.startSweeps(config.pingIntervalMs, config.cleanupIntervalMs);

    std::unique_ptr<AdminServer> adminServer;
    if (config.adminPort > 0) {
      adminServer.reset(
          new AdminServer(bridgeServer, terminalManager, routingEngine));
      try {
        adminServer->start(config.bindIp, config.adminPort);
      } catch (const std::runtime_error& e) {
        STERROR << e.what();
        adminServer.reset();
      }
    }

    CLOG(INFO, "stdout") << "sbserver listening on " << config.bindIp << ":"
                         << config.port
                         << (config.autoAuth ? " (auto-auth)" : "") << endl;
    transport.run();

    LOG(INFO) << "Shutting down";
    if (adminServer) {
      adminServer->stop();
    }
    bridgeServer->shutdown();
    terminalManager->shutdown();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
