#include "BridgeConfig.hpp"

#include "LogHandler.hpp"

namespace sb {
BridgeConfig::BridgeConfig()
    : certDir(defaultCertDirectory()),
      allowedOrigins({"localhost", "127.0.0.1"}),
      logDir(LogHandler::defaultLogDirectory()) {}

string BridgeConfig::defaultCertDirectory() {
  return sago::getConfigHome() + "/shellbridge/ssl";
}

void BridgeConfig::addOptions(cxxopts::Options* options) {
  options->add_options()             //
      ("h,help", "Print help")       //
      ("version", "Print version")   //
      ("port", "Port for the websocket listener",
       cxxopts::value<int>()->default_value(to_string(DEFAULT_BRIDGE_PORT)))  //
      ("bindip", "IP to listen on",
       cxxopts::value<string>()->default_value("127.0.0.1"))  //
      ("adminport", "Port for the admin HTTP API, 0 to disable",
       cxxopts::value<int>()->default_value(to_string(DEFAULT_ADMIN_PORT)))  //
      ("secure", "Serve TLS, with a plain fallback on port + 1")            //
      ("autoauth", "Assign a token on connect without an auth frame")       //
      ("certdir", "Directory holding key.pem and cert.pem",
       cxxopts::value<string>()->default_value(""))  //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("logtostdout", "log to stdout")                    //
      ("logdir", "Directory for log files",
       cxxopts::value<std::string>()->default_value(""))  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"), "LEVEL")  //
      ;
}

void BridgeConfig::loadIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  loadIni(ini);
}

void BridgeConfig::loadIni(const CSimpleIniA& ini) {
  port = int(ini.GetLongValue("Networking", "port", port));
  const char* bindIpPtr = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIpPtr) {
    bindIp = string(bindIpPtr);
  }
  adminPort = int(ini.GetLongValue("Networking", "admin_port", adminPort));
  secure = ini.GetBoolValue("Networking", "secure", secure);
  autoAuth = ini.GetBoolValue("Networking", "auto_auth", autoAuth);
  const char* certDirPtr = ini.GetValue("Networking", "cert_dir", NULL);
  if (certDirPtr && strlen(certDirPtr)) {
    certDir = string(certDirPtr);
  }
  const char* originsPtr = ini.GetValue("Networking", "allowed_origins", NULL);
  if (originsPtr) {
    allowedOrigins.clear();
    for (const auto& origin : split(originsPtr, ',')) {
      string trimmed = trim(origin);
      if (!trimmed.empty()) {
        allowedOrigins.push_back(trimmed);
      }
    }
  }

  limits.maxTerminalsPerUser = size_t(ini.GetLongValue(
      "Limits", "max_terminals_per_user", long(limits.maxTerminalsPerUser)));
  limits.maxGlobalTerminals = size_t(ini.GetLongValue(
      "Limits", "max_global_terminals", long(limits.maxGlobalTerminals)));
  limits.sessionMemoryBudgetBytes =
      int64_t(ini.GetLongValue(
          "Limits", "session_memory_mb",
          long(limits.sessionMemoryBudgetBytes / (1024 * 1024)))) *
      1024 * 1024;
  limits.idleTimeoutMs =
      int64_t(ini.GetLongValue("Limits", "idle_timeout_minutes",
                               long(limits.idleTimeoutMs / 60000))) *
      60000;
  limits.aggressiveTimeoutMs =
      int64_t(ini.GetLongValue("Limits", "aggressive_timeout_minutes",
                               long(limits.aggressiveTimeoutMs / 60000))) *
      60000;
  limits.exitGraceMs =
      int64_t(ini.GetLongValue("Limits", "exit_grace_seconds",
                               long(limits.exitGraceMs / 1000))) *
      1000;
  historyMaxEntries = size_t(ini.GetLongValue(
      "Limits", "history_max_entries", long(historyMaxEntries)));

  pingIntervalMs =
      int64_t(ini.GetLongValue("Heartbeat", "ping_interval_seconds",
                               long(pingIntervalMs / 1000))) *
      1000;
  heartbeatTimeoutMs = int64_t(ini.GetLongValue(
                           "Heartbeat", "timeout_seconds",
                           long(heartbeatTimeoutMs / 1000))) *
                       1000;
  cleanupIntervalMs =
      int64_t(ini.GetLongValue("Heartbeat", "cleanup_interval_seconds",
                               long(cleanupIntervalMs / 1000))) *
      1000;

  verbose = int(ini.GetLongValue("Debug", "verbose", verbose));
  silent = ini.GetLongValue("Debug", "silent", silent ? 1 : 0) != 0;
  // read log file size limit
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxLogSize is a string of int value
    maxLogSize = to_string(atoll(logsize));
  }
}

void BridgeConfig::applyCommandLine(const cxxopts::ParseResult& result) {
  if (result.count("port")) {
    port = result["port"].as<int>();
  }
  if (result.count("bindip")) {
    bindIp = result["bindip"].as<string>();
  }
  if (result.count("adminport")) {
    adminPort = result["adminport"].as<int>();
  }
  if (result.count("secure")) {
    secure = true;
  }
  if (result.count("autoauth")) {
    autoAuth = true;
  }
  if (result.count("certdir") && !result["certdir"].as<string>().empty()) {
    certDir = result["certdir"].as<string>();
  }
  if (result.count("logtostdout")) {
    logToStdout = true;
  }
  if (result.count("logdir") && !result["logdir"].as<string>().empty()) {
    logDir = result["logdir"].as<string>();
  }
  if (result.count("verbose")) {
    verbose = result["verbose"].as<int>();
  }
}
}  // namespace sb
