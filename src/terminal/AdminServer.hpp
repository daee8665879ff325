#ifndef __SB_ADMIN_SERVER_HPP__
#define __SB_ADMIN_SERVER_HPP__

#include "BridgeServer.hpp"
#include "CommandRoutingEngine.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "TerminalSessionManager.hpp"

namespace sb {
/**
 * @brief Plain HTTP/JSON surface for health checks, routed commands,
 * history, processes, tools and agent configuration.
 */
class AdminServer {
 public:
  AdminServer(shared_ptr<BridgeServer> _bridgeServer,
              shared_ptr<TerminalSessionManager> _terminalManager,
              shared_ptr<CommandRoutingEngine> _routingEngine);
  ~AdminServer();

  /**
   * @brief Binds and serves on a background thread. Port 0 picks a free
   * port.
   * @return the bound port.
   * @throws std::runtime_error when the port cannot be bound.
   */
  int start(const string& bindIp, int port);
  void stop();
  int getPort() const { return port; }

 protected:
  shared_ptr<BridgeServer> bridgeServer;
  shared_ptr<TerminalSessionManager> terminalManager;
  shared_ptr<CommandRoutingEngine> routingEngine;
  httplib::Server httpServer;
  std::thread serverThread;
  int port;

  void registerRoutes();
};
}  // namespace sb

#endif  // __SB_ADMIN_SERVER_HPP__
