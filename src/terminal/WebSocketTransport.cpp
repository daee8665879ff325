#include "WebSocketTransport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace sb {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {
const size_t MAX_MESSAGE_BYTES = 4 * 1024 * 1024;
const int HANDSHAKE_TIMEOUT_SECONDS = 30;

typedef beast::ssl_stream<beast::tcp_stream> TlsStream;

string originHost(const string& origin) {
  string host = origin;
  auto schemeEnd = host.find("://");
  if (schemeEnd != string::npos) {
    host = host.substr(schemeEnd + 3);
  }
  auto end = host.find_first_of(":/");
  if (end != string::npos) {
    host = host.substr(0, end);
  }
  return host;
}

/**
 * One websocket connection. NextLayer is beast::tcp_stream for plain
 * connections and TlsStream for secure ones. Every member is only touched
 * from the connection's strand, except `open` which backs isOpen().
 */
template <class NextLayer>
class WebSocketSession
    : public ClientChannel,
      public std::enable_shared_from_this<WebSocketSession<NextLayer>> {
 public:
  template <class... Args>
  WebSocketSession(uint64_t _id, const string& _remoteAddress,
                   shared_ptr<BridgeServer> _server,
                   const vector<string>& _allowedOrigins, Args&&... args)
      : ws(std::forward<Args>(args)...),
        id(_id),
        remoteAddress(_remoteAddress),
        server(_server),
        allowedOrigins(_allowedOrigins),
        open(false),
        registered(false),
        closeRequested(false),
        closing(false),
        finished(false) {}

  void start() {
    net::dispatch(ws.get_executor(),
                  beast::bind_front_handler(&WebSocketSession::onStart,
                                            this->shared_from_this()));
  }

  virtual void send(const json& frame) {
    // Terminal output is not guaranteed to be valid UTF-8
    string text = frame.dump(-1, ' ', false, json::error_handler_t::replace);
    auto self = this->shared_from_this();
    net::post(ws.get_executor(), [self, text]() { self->queueWrite(text); });
  }

  virtual bool isOpen() const { return open; }

  virtual void close() {
    open = false;
    auto self = this->shared_from_this();
    net::post(ws.get_executor(), [self]() {
      self->closeRequested = true;
      if (self->outbox.empty()) {
        self->doClose();
      }
    });
  }

  virtual uint64_t getId() const { return id; }
  virtual string getRemoteAddress() const { return remoteAddress; }

 protected:
  websocket::stream<NextLayer> ws;
  beast::flat_buffer buffer;
  http::request<http::string_body> upgradeRequest;
  http::response<http::string_body> rejectResponse;
  deque<string> outbox;
  uint64_t id;
  string remoteAddress;
  shared_ptr<BridgeServer> server;
  vector<string> allowedOrigins;
  atomic<bool> open;
  bool registered;
  bool closeRequested;
  bool closing;
  bool finished;

  void onStart() {
    beast::get_lowest_layer(ws).expires_after(
        std::chrono::seconds(HANDSHAKE_TIMEOUT_SECONDS));
    if constexpr (std::is_same<NextLayer, TlsStream>::value) {
      ws.next_layer().async_handshake(
          ssl::stream_base::server,
          beast::bind_front_handler(&WebSocketSession::onTlsHandshake,
                                    this->shared_from_this()));
    } else {
      readUpgrade();
    }
  }

  void onTlsHandshake(beast::error_code ec) {
    if (ec) {
      fail(ec, "TLS handshake");
      return;
    }
    readUpgrade();
  }

  void readUpgrade() {
    http::async_read(ws.next_layer(), buffer, upgradeRequest,
                     beast::bind_front_handler(&WebSocketSession::onUpgradeRead,
                                               this->shared_from_this()));
  }

  void onUpgradeRead(beast::error_code ec, std::size_t) {
    if (ec) {
      fail(ec, "upgrade read");
      return;
    }
    buffer.consume(buffer.size());
    if (!websocket::is_upgrade(upgradeRequest)) {
      reject(http::status::upgrade_required, "WebSocket upgrade required");
      return;
    }
    string origin(upgradeRequest[http::field::origin]);
    if (!WebSocketTransport::isOriginAllowed(allowedOrigins, origin)) {
      LOG(WARNING) << "Rejected connection from " << remoteAddress
                   << " with origin " << origin;
      reject(http::status::forbidden, "Origin not allowed");
      return;
    }

    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
          res.set(http::field::server, string("ShellBridge/") + SB_VERSION);
        }));
    ws.read_message_max(MAX_MESSAGE_BYTES);
    ws.async_accept(upgradeRequest,
                    beast::bind_front_handler(&WebSocketSession::onAccept,
                                              this->shared_from_this()));
  }

  void reject(http::status status, const string& body) {
    rejectResponse = http::response<http::string_body>(
        status, upgradeRequest.version());
    rejectResponse.set(http::field::content_type, "text/plain");
    rejectResponse.keep_alive(false);
    rejectResponse.body() = body;
    rejectResponse.prepare_payload();
    auto self = this->shared_from_this();
    http::async_write(ws.next_layer(), rejectResponse,
                      [self](beast::error_code, std::size_t) {
                        self->finish();
                      });
  }

  void onAccept(beast::error_code ec) {
    if (ec) {
      fail(ec, "websocket accept");
      return;
    }
    open = true;
    registered = true;
    server->onConnect(this->shared_from_this());
    doRead();
  }

  void doRead() {
    ws.async_read(buffer,
                  beast::bind_front_handler(&WebSocketSession::onRead,
                                            this->shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
      finish();
      return;
    }
    if (ec) {
      fail(ec, "read");
      return;
    }
    string text = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    server->onFrame(id, text);
    doRead();
  }

  void queueWrite(const string& text) {
    if (finished || closeRequested) {
      return;
    }
    outbox.push_back(text);
    if (outbox.size() > 1) {
      // A write is already in flight
      return;
    }
    doWrite();
  }

  void doWrite() {
    ws.text(true);
    ws.async_write(net::buffer(outbox.front()),
                   beast::bind_front_handler(&WebSocketSession::onWrite,
                                             this->shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      fail(ec, "write");
      return;
    }
    outbox.pop_front();
    if (!outbox.empty()) {
      doWrite();
    } else if (closeRequested) {
      doClose();
    }
  }

  void doClose() {
    if (closing || finished) {
      return;
    }
    closing = true;
    if (!registered) {
      finish();
      return;
    }
    auto self = this->shared_from_this();
    ws.async_close(websocket::close_code::normal,
                   [self](beast::error_code) { self->finish(); });
  }

  void fail(beast::error_code ec, const char* what) {
    if (ec != net::error::operation_aborted) {
      VLOG(1) << "Connection " << id << " " << what << ": " << ec.message();
    }
    finish();
  }

  void finish() {
    if (finished) {
      return;
    }
    finished = true;
    open = false;
    outbox.clear();
    beast::get_lowest_layer(ws).close();
    if (registered) {
      server->onDisconnect(id);
    }
  }
};
}  // namespace

class WebSocketTransport::Listener
    : public std::enable_shared_from_this<WebSocketTransport::Listener> {
 public:
  Listener(net::io_context& _ioContext, const tcp::endpoint& endpoint,
           shared_ptr<ssl::context> _sslContext,
           shared_ptr<BridgeServer> _server,
           const vector<string>& _allowedOrigins,
           shared_ptr<atomic<uint64_t>> _nextChannelId)
      : ioContext(_ioContext),
        acceptor(net::make_strand(_ioContext)),
        sslContext(_sslContext),
        server(_server),
        allowedOrigins(_allowedOrigins),
        nextChannelId(_nextChannelId) {
    acceptor.open(endpoint.protocol());
    acceptor.set_option(net::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(net::socket_base::max_listen_connections);
    port = acceptor.local_endpoint().port();
  }

  void start() { doAccept(); }

  void stop() {
    auto self = shared_from_this();
    net::post(acceptor.get_executor(), [self]() {
      beast::error_code ec;
      self->acceptor.close(ec);
    });
  }

  int getPort() const { return port; }

 protected:
  net::io_context& ioContext;
  tcp::acceptor acceptor;
  shared_ptr<ssl::context> sslContext;
  shared_ptr<BridgeServer> server;
  vector<string> allowedOrigins;
  shared_ptr<atomic<uint64_t>> nextChannelId;
  int port;

  void doAccept() {
    acceptor.async_accept(
        net::make_strand(ioContext),
        beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
  }

  void onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
      return;
    }
    if (ec) {
      LOG(WARNING) << "Accept failed on port " << port << ": "
                   << ec.message();
    } else {
      beast::error_code addressError;
      auto remote = socket.remote_endpoint(addressError);
      string remoteAddress =
          addressError ? string("unknown")
                       : remote.address().to_string() + ":" +
                             to_string(remote.port());
      uint64_t id = (*nextChannelId)++;
      VLOG(1) << "Accepted " << remoteAddress << " on port " << port;
      if (sslContext) {
        make_shared<WebSocketSession<TlsStream>>(id, remoteAddress, server,
                                                 allowedOrigins,
                                                 std::move(socket),
                                                 *sslContext)
            ->start();
      } else {
        make_shared<WebSocketSession<beast::tcp_stream>>(
            id, remoteAddress, server, allowedOrigins, std::move(socket))
            ->start();
      }
    }
    if (acceptor.is_open()) {
      doAccept();
    }
  }
};

WebSocketTransport::WebSocketTransport(shared_ptr<BridgeServer> _server)
    : server(_server),
      ioContext(1),
      heartbeatTimer(ioContext),
      cleanupTimer(ioContext),
      signals(ioContext, SIGTERM),
      nextChannelId(new atomic<uint64_t>(1)) {}

WebSocketTransport::~WebSocketTransport() { stop(); }

void WebSocketTransport::listen(const string& bindIp, int port,
                                shared_ptr<ssl::context> sslContext) {
  auto address = net::ip::make_address(bindIp.empty() ? "0.0.0.0" : bindIp);
  tcp::endpoint endpoint(address, (unsigned short)port);
  auto listener =
      make_shared<Listener>(ioContext, endpoint, sslContext, server,
                            allowedOrigins, nextChannelId);
  listener->start();
  listeners.push_back(listener);
  LOG(INFO) << (sslContext ? "Secure websocket (wss)" : "Websocket (ws)")
            << " listening on " << endpoint.address().to_string() << ":"
            << listener->getPort();
}

void WebSocketTransport::setAllowedOrigins(const vector<string>& origins) {
  allowedOrigins = origins;
}

bool WebSocketTransport::isOriginAllowed(const vector<string>& allowedOrigins,
                                         const string& origin) {
  if (origin.empty() || allowedOrigins.empty()) {
    return true;
  }
  string host = originHost(origin);
  for (const auto& allowed : allowedOrigins) {
    if (allowed == "*" || allowed == origin || allowed == host) {
      return true;
    }
    if (allowed.size() > 1 && allowed[0] == '.' &&
        host.size() > allowed.size() &&
        host.compare(host.size() - allowed.size(), allowed.size(), allowed) ==
            0) {
      return true;
    }
  }
  return false;
}

void WebSocketTransport::startSweeps(int64_t pingIntervalMs,
                                     int64_t cleanupIntervalMs) {
  scheduleHeartbeat(pingIntervalMs);
  scheduleCleanup(cleanupIntervalMs);
}

void WebSocketTransport::scheduleHeartbeat(int64_t intervalMs) {
  heartbeatTimer.expires_after(std::chrono::milliseconds(intervalMs));
  heartbeatTimer.async_wait([this, intervalMs](beast::error_code ec) {
    if (ec) {
      return;
    }
    size_t evicted = server->heartbeatSweep();
    if (evicted) {
      LOG(INFO) << "Heartbeat sweep evicted " << evicted << " clients";
    }
    scheduleHeartbeat(intervalMs);
  });
}

void WebSocketTransport::scheduleCleanup(int64_t intervalMs) {
  cleanupTimer.expires_after(std::chrono::milliseconds(intervalMs));
  cleanupTimer.async_wait([this, intervalMs](beast::error_code ec) {
    if (ec) {
      return;
    }
    server->reclaimSweep();
    scheduleCleanup(intervalMs);
  });
}

void WebSocketTransport::run() {
  signals.async_wait([this](beast::error_code ec, int signo) {
    if (ec) {
      return;
    }
    LOG(INFO) << "Got signal " << signo << ", stopping";
    stop();
  });
  ioContext.run();
}

void WebSocketTransport::stop() {
  for (auto& listener : listeners) {
    listener->stop();
  }
  ioContext.stop();
}

vector<int> WebSocketTransport::getListeningPorts() const {
  vector<int> ports;
  for (const auto& listener : listeners) {
    ports.push_back(listener->getPort());
  }
  return ports;
}
}  // namespace sb
