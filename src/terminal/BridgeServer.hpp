#ifndef __SB_BRIDGE_SERVER_HPP__
#define __SB_BRIDGE_SERVER_HPP__

#include "BridgeException.hpp"
#include "ClientChannel.hpp"
#include "CommandRoutingEngine.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionStore.hpp"
#include "TerminalSessionManager.hpp"

namespace sb {
struct BridgeServerOptions {
  /** @brief Bind a fresh token on connect instead of waiting for `auth`. */
  bool autoAuth = false;
  int64_t heartbeatTimeoutMs = 30000;
  int routingThreads = 8;
};

/**
 * @brief Per-connection protocol state machine.
 *
 * Frames arrive from the transport through `onFrame`, are validated and
 * turned into session manager or routing engine calls. Session output and
 * routed command events are sent back to whichever connection currently
 * holds the token.
 */
class BridgeServer : public TerminalEventHandler, public RoutingEventHandler {
 public:
  BridgeServer(shared_ptr<TerminalSessionManager> _terminalManager,
               shared_ptr<CommandRoutingEngine> _routingEngine,
               shared_ptr<SessionStore> _sessionStore,
               const BridgeServerOptions& _options);
  virtual ~BridgeServer();

  /** @brief Registers the connection and sends the first ping. */
  void onConnect(shared_ptr<ClientChannel> channel);
  void onFrame(uint64_t channelId, const string& text);
  /** @brief Releases the token. Terminal sessions outlive the connection. */
  void onDisconnect(uint64_t channelId);

  /**
   * @brief Pings every authenticated connection and closes the ones that
   * have been silent for longer than the heartbeat timeout.
   * @return number of evicted connections.
   */
  size_t heartbeatSweep();
  /**
   * @brief Forgets connections whose transport is closed, then runs the
   * session manager's reclamation.
   * @return number of connections removed.
   */
  size_t reclaimSweep();

  size_t getClientCount() const;
  size_t getAuthenticatedCount() const;
  bool isTokenBound(const string& uuid) const;
  /** @brief [{id, uuid, authenticated, remoteAddress, connectedAt}] */
  json listClients() const;

  /** @brief Closes every connection and stops the routing workers. */
  void shutdown();

  static bool isValidUuid(const string& uuid);

  virtual void onTerminalCreated(const TerminalSessionInfo& info);
  virtual void onTerminalOutput(const string& uuid, const string& terminalId,
                                const string& data);
  virtual void onTerminalExit(const string& uuid, const string& terminalId,
                              int exitCode);
  virtual void onAgentOutput(const string& uuid, const string& terminalId,
                             const string& tool, const string& chunk,
                             bool isStderr);
  virtual void onCommandRouted(const string& uuid, const string& terminalId,
                               const RouteResult& result, int64_t duration);

 protected:
  struct ConnectedClient {
    shared_ptr<ClientChannel> channel;
    string uuid;
    bool authenticated = false;
    int64_t lastHeartbeat = 0;
    int64_t connectedAt = 0;
  };

  shared_ptr<TerminalSessionManager> terminalManager;
  shared_ptr<CommandRoutingEngine> routingEngine;
  shared_ptr<SessionStore> sessionStore;
  BridgeServerOptions options;

  /** @brief Guards `clients` and `tokenToChannel`. */
  mutable recursive_mutex classMutex;
  map<uint64_t, shared_ptr<ConnectedClient>> clients;
  map<string, uint64_t> tokenToChannel;
  std::unique_ptr<ThreadPool> routingThreadPool;

  shared_ptr<ConnectedClient> getClient(uint64_t channelId) const;
  shared_ptr<ClientChannel> channelForToken(const string& uuid) const;
  /** @brief The token bound to the connection, if it has authenticated. */
  optional<string> tokenFor(const shared_ptr<ConnectedClient>& client) const;

  void sendFrame(const shared_ptr<ClientChannel>& channel, json frame) const;
  void sendError(const shared_ptr<ClientChannel>& channel,
                 const string& message) const;
  void sendToToken(const string& uuid, const json& frame) const;

  void dispatch(const shared_ptr<ConnectedClient>& client, const json& frame);
  void bindToken(const shared_ptr<ConnectedClient>& client,
                 const string& uuid);

  void handleAuth(const shared_ptr<ConnectedClient>& client,
                  const json& frame);
  void handleTerminalInput(const shared_ptr<ClientChannel>& channel,
                           const string& uuid, const json& frame);
  void handleTerminalResize(const shared_ptr<ClientChannel>& channel,
                            const string& uuid, const json& frame);
  void handleTerminalCreate(const shared_ptr<ClientChannel>& channel,
                            const string& uuid, const json& frame);
  void handleTerminalClose(const shared_ptr<ClientChannel>& channel,
                           const string& uuid, const json& frame);
  void handleTerminalList(const shared_ptr<ClientChannel>& channel,
                          const string& uuid);
  void handleTerminalBroadcast(const shared_ptr<ClientChannel>& channel,
                               const string& uuid, const json& frame);
  void handleCommandRoute(const shared_ptr<ClientChannel>& channel,
                          const string& uuid, const json& frame);
  void handleCommandParse(const shared_ptr<ClientChannel>& channel,
                          const json& frame);
  void handleCommandHistory(const shared_ptr<ClientChannel>& channel,
                            const string& uuid, const json& frame);
  void handleToolHistory(const shared_ptr<ClientChannel>& channel,
                         const string& uuid, const json& frame);
  void handleCommandKill(const shared_ptr<ClientChannel>& channel,
                         const string& uuid, const json& frame);
};
}  // namespace sb

#endif  // __SB_BRIDGE_SERVER_HPP__
