#ifndef __SB_WEBSOCKET_TRANSPORT_HPP__
#define __SB_WEBSOCKET_TRANSPORT_HPP__

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "BridgeServer.hpp"
#include "Headers.hpp"

namespace sb {
/**
 * @brief Accepts websocket connections (plain or TLS) and feeds their text
 * frames to the BridgeServer.
 *
 * All socket work happens on one io_context. Each connection runs on its
 * own strand with an outbound queue, so frames leave in the order they
 * were sent.
 */
class WebSocketTransport {
 public:
  explicit WebSocketTransport(shared_ptr<BridgeServer> _server);
  ~WebSocketTransport();

  /**
   * @brief Opens a listener. A NULL context means plain websocket.
   * @throws boost::system::system_error when the port cannot be bound.
   */
  void listen(const string& bindIp, int port,
              shared_ptr<boost::asio::ssl::context> sslContext = NULL);

  /**
   * @brief Hosts allowed in the Origin header of the upgrade request, used
   * by listeners opened afterwards. Requests without an Origin header are
   * always accepted. An entry starting with '.' matches any subdomain.
   */
  void setAllowedOrigins(const vector<string>& origins);
  static bool isOriginAllowed(const vector<string>& allowedOrigins,
                              const string& origin);

  /** @brief Schedules the heartbeat and reclamation sweeps. */
  void startSweeps(int64_t pingIntervalMs, int64_t cleanupIntervalMs);

  /** @brief Runs the I/O loop on the calling thread until `stop`. */
  void run();
  void stop();

  /** @brief Ports actually bound, useful when listening on port 0. */
  vector<int> getListeningPorts() const;

  class Listener;

 protected:
  shared_ptr<BridgeServer> server;
  boost::asio::io_context ioContext;
  boost::asio::steady_timer heartbeatTimer;
  boost::asio::steady_timer cleanupTimer;
  boost::asio::signal_set signals;
  vector<shared_ptr<Listener>> listeners;
  vector<string> allowedOrigins;
  shared_ptr<atomic<uint64_t>> nextChannelId;

  void scheduleHeartbeat(int64_t intervalMs);
  void scheduleCleanup(int64_t intervalMs);
};
}  // namespace sb

#endif  // __SB_WEBSOCKET_TRANSPORT_HPP__
