#include "AdminServer.hpp"

namespace sb {
namespace {
const char* JSON_TYPE = "application/json";

void reply(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace),
                  JSON_TYPE);
}

void replyError(httplib::Response& res, int status, const string& message) {
  reply(res, {{"error", message}}, status);
}

/** Parses the body as a JSON object, replying 400 when it is not one. */
optional<json> parseBody(const httplib::Request& req, httplib::Response& res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::exception& e) {
    replyError(res, 400, string("Invalid JSON body: ") + e.what());
    return std::nullopt;
  }
  if (!body.is_object()) {
    replyError(res, 400, "Request body must be a JSON object");
    return std::nullopt;
  }
  return body;
}

string bodyString(const json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}

json toolsJson(const vector<ToolInfo>& tools) {
  json retval = json::array();
  for (const auto& tool : tools) {
    retval.push_back(tool.toJson());
  }
  return retval;
}
}  // namespace

AdminServer::AdminServer(shared_ptr<BridgeServer> _bridgeServer,
                         shared_ptr<TerminalSessionManager> _terminalManager,
                         shared_ptr<CommandRoutingEngine> _routingEngine)
    : bridgeServer(_bridgeServer),
      terminalManager(_terminalManager),
      routingEngine(_routingEngine),
      port(0) {
  registerRoutes();
}

AdminServer::~AdminServer() { stop(); }

int AdminServer::start(const string& bindIp, int _port) {
  if (_port == 0) {
    port = httpServer.bind_to_any_port(bindIp.c_str());
  } else if (httpServer.bind_to_port(bindIp.c_str(), _port)) {
    port = _port;
  } else {
    port = -1;
  }
  if (port <= 0) {
    throw std::runtime_error("Cannot bind admin server to " + bindIp + ":" +
                             to_string(_port));
  }
  serverThread = std::thread([this]() {
    el::Helpers::setThreadName("admin-http");
    if (!httpServer.listen_after_bind()) {
      LOG(WARNING) << "Admin server stopped listening";
    }
  });
  LOG(INFO) << "Admin API listening on " << bindIp << ":" << port;
  return port;
}

void AdminServer::stop() {
  if (serverThread.joinable()) {
    httpServer.stop();
    serverThread.join();
  }
}

void AdminServer::registerRoutes() {
  httpServer.Get("/health", [this](const httplib::Request&,
                                   httplib::Response& res) {
    reply(res, {{"status", "ok"},
                {"version", SB_VERSION},
                {"sessions", terminalManager->getSessionCount()},
                {"clients", bridgeServer->getClientCount()},
                {"timestamp", nowMillis()}});
  });

  httpServer.Get("/sessions", [this](const httplib::Request&,
                                     httplib::Response& res) {
    json body = terminalManager->getResourceUsage();
    json sessions = json::array();
    for (const auto& session : terminalManager->listActive()) {
      json entry = session.toJson();
      entry["uuid"] = session.uuid;
      sessions.push_back(entry);
    }
    body["sessions"] = sessions;
    body["clients"] = bridgeServer->listClients();
    reply(res, body);
  });

  httpServer.Post("/commands/parse", [this](const httplib::Request& req,
                                            httplib::Response& res) {
    auto body = parseBody(req, res);
    if (!body) {
      return;
    }
    string command = bodyString(*body, "command");
    if (command.empty()) {
      replyError(res, 400, "Command is required");
      return;
    }
    reply(res, routingEngine->parse(command).toJson());
  });

  httpServer.Post("/commands/route", [this](const httplib::Request& req,
                                            httplib::Response& res) {
    auto body = parseBody(req, res);
    if (!body) {
      return;
    }
    string uuid = bodyString(*body, "uuid");
    string terminalId = bodyString(*body, "terminalId");
    string command = bodyString(*body, "command");
    if (uuid.empty() || terminalId.empty() || command.empty()) {
      replyError(res, 400, "uuid, terminalId and command are required");
      return;
    }
    if (!BridgeServer::isValidUuid(uuid)) {
      replyError(res, 400, "Invalid UUID format");
      return;
    }
    optional<string> workingDirectory;
    string cwd = bodyString(*body, "workingDirectory");
    if (!cwd.empty()) {
      workingDirectory = cwd;
    }
    auto result =
        routingEngine->route(uuid, terminalId, command, workingDirectory);
    reply(res, result.toJson());
  });

  httpServer.Get(R"(/history/([^/]+)/terminal/([^/]+))",
                 [this](const httplib::Request& req, httplib::Response& res) {
                   auto ledger = routingEngine->getHistory().getTerminalHistory(
                       req.matches[1], req.matches[2]);
                   if (!ledger) {
                     replyError(res, 404, "No history for terminal");
                     return;
                   }
                   reply(res, ledger->toJson());
                 });

  httpServer.Get(R"(/history/([^/]+)/tools)",
                 [this](const httplib::Request& req, httplib::Response& res) {
                   json histories = json::array();
                   for (const auto& ledger :
                        routingEngine->getHistory().getUserToolHistories(
                            req.matches[1])) {
                     histories.push_back(ledger.toJson());
                   }
                   reply(res, histories);
                 });

  httpServer.Get(
      R"(/history/([^/]+)/tools/([^/]+))",
      [this](const httplib::Request& req, httplib::Response& res) {
        string uuid = req.matches[1];
        string tool = req.matches[2];
        auto& history = routingEngine->getHistory();
        if (req.has_param("limit")) {
          size_t limit = 10;
          try {
            limit = size_t(std::stoul(req.get_param_value("limit")));
          } catch (const std::logic_error&) {
            replyError(res, 400, "limit must be a positive number");
            return;
          }
          json commands = json::array();
          for (const auto& entry :
               history.getRecentCommands(uuid, tool, limit)) {
            commands.push_back(entry.toJson());
          }
          reply(res, {{"tool", tool}, {"commands", commands}});
          return;
        }
        auto ledger = history.getToolHistory(uuid, tool);
        if (!ledger) {
          replyError(res, 404, "No history for tool " + tool);
          return;
        }
        reply(res, ledger->toJson());
      });

  httpServer.Get(R"(/history/([^/]+)/stats)",
                 [this](const httplib::Request& req, httplib::Response& res) {
                   reply(res, routingEngine->getHistory().getHistoryStats(
                                  req.matches[1]));
                 });

  httpServer.Delete(R"(/history/([^/]+))", [this](const httplib::Request& req,
                                                  httplib::Response& res) {
    routingEngine->getHistory().clearUserHistory(req.matches[1]);
    reply(res, {{"success", true}});
  });

  httpServer.Get("/processes", [this](const httplib::Request&,
                                      httplib::Response& res) {
    reply(res, {{"processes", routingEngine->getActiveProcesses()},
                {"count", routingEngine->getActiveProcessCount()}});
  });

  httpServer.Post(R"(/processes/([^/]+)/kill)",
                  [this](const httplib::Request& req, httplib::Response& res) {
                    string terminalId = req.matches[1];
                    if (!routingEngine->killProcess(terminalId)) {
                      reply(res, {{"success", false},
                                  {"error", "No process for " + terminalId}},
                            404);
                      return;
                    }
                    reply(res, {{"success", true}});
                  });

  httpServer.Get("/tools", [this](const httplib::Request&,
                                  httplib::Response& res) {
    reply(res, toolsJson(routingEngine->getRegistry()->detectAllTools()));
  });

  httpServer.Get("/tools/stats", [this](const httplib::Request&,
                                        httplib::Response& res) {
    reply(res, routingEngine->getRegistry()->getToolStatistics());
  });

  httpServer.Post("/tools/refresh", [this](const httplib::Request&,
                                           httplib::Response& res) {
    reply(res, toolsJson(routingEngine->getRegistry()->refreshAllTools()));
  });

  httpServer.Get("/agents", [this](const httplib::Request&,
                                   httplib::Response& res) {
    json agents = json::array();
    for (const auto& name : routingEngine->getParser()->getAgentTools()) {
      auto config = routingEngine->getAgentConfig(name);
      agents.push_back(config ? config->toJson()
                              : json({{"executable", name}}));
    }
    reply(res, agents);
  });

  httpServer.Post(R"(/agents/([^/]+))", [this](const httplib::Request& req,
                                               httplib::Response& res) {
    auto body = parseBody(req, res);
    if (!body) {
      return;
    }
    string name = req.matches[1];
    try {
      auto config = AgentToolConfig::fromJson(name, *body);
      routingEngine->addAgentTool(name, config);
      reply(res, {{"success", true}, {"agent", config.toJson()}});
    } catch (const BridgeException& e) {
      replyError(res, 400, e.what());
    }
  });

  httpServer.Delete(R"(/agents/([^/]+))", [this](const httplib::Request& req,
                                                 httplib::Response& res) {
    string name = req.matches[1];
    if (!routingEngine->removeAgentTool(name)) {
      replyError(res, 404, "Unknown agent tool " + name);
      return;
    }
    reply(res, {{"success", true}});
  });
}
}  // namespace sb
