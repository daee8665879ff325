#ifndef __SB_BRIDGE_CONFIG_HPP__
#define __SB_BRIDGE_CONFIG_HPP__

#include <cxxopts.hpp>

#include "Headers.hpp"
#include "SimpleIni.h"
#include "TerminalSessionManager.hpp"

namespace sb {
/**
 * @brief Settings for sbserver, merged from the INI file and the command
 * line. Command line values win over the file.
 */
struct BridgeConfig {
  int port = DEFAULT_BRIDGE_PORT;
  string bindIp = "127.0.0.1";
  /** @brief 0 disables the admin HTTP surface. */
  int adminPort = DEFAULT_ADMIN_PORT;
  bool secure = false;
  bool autoAuth = false;
  string certDir;
  /** @brief Origin hosts accepted on websocket upgrade, "*" for any. */
  vector<string> allowedOrigins;

  bool logToStdout = false;
  string logDir;
  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";

  TerminalLimits limits;
  size_t historyMaxEntries = 1000;

  int64_t pingIntervalMs = 15000;
  int64_t heartbeatTimeoutMs = 30000;
  int64_t cleanupIntervalMs = 300000;

  BridgeConfig();

  /**
   * @brief Loads an INI file on top of the current values.
   * @throws std::runtime_error when the file cannot be read.
   */
  void loadIniFile(const string& filename);
  void loadIni(const CSimpleIniA& ini);
  /** @brief Applies every option the user gave explicitly. */
  void applyCommandLine(const cxxopts::ParseResult& result);

  static void addOptions(cxxopts::Options* options);
  static string defaultCertDirectory();
};
}  // namespace sb

#endif  // __SB_BRIDGE_CONFIG_HPP__
