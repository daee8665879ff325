#include "ToolRegistry.hpp"

#include <regex>

#include "BridgeException.hpp"

namespace sb {
namespace {
const int64_t DEFAULT_CACHE_DURATION_MS = 5 * 60 * 1000;
const int64_t VERSION_TIMEOUT_MS = 5000;

struct ToolDefinition {
  const char* name;
  const char* displayName;
  ToolCategory category;
  const char* description;
  const char* installUrl;
  const char* installCommand;
  vector<string> versionCommand;
};

const vector<ToolDefinition>& builtinTools() {
  static const vector<ToolDefinition> tools = {
      {"claude-code", "Claude Code", ToolCategory::Ai,
       "Anthropic's CLI for Claude AI assistance",
       "https://github.com/anthropic-ai/claude-code",
       "npm install -g @anthropic-ai/claude-code",
       {"claude", "--version"}},
      {"gemini", "Gemini CLI", ToolCategory::Ai, "Google's Gemini AI CLI tool",
       "https://ai.google.dev/docs", "pip install google-generativeai",
       {"gemini", "--version"}},
      {"git", "Git", ToolCategory::Development,
       "Distributed version control system", "https://git-scm.com/downloads",
       "",
       {"git", "--version"}},
      {"node", "Node.js", ToolCategory::Development,
       "JavaScript runtime built on the V8 engine",
       "https://nodejs.org/en/download", "", {"node", "--version"}},
      {"python", "Python", ToolCategory::Development,
       "High-level programming language", "https://www.python.org/downloads",
       "", {"python", "--version"}},
      {"cargo", "Rust Cargo", ToolCategory::Development,
       "Rust package manager and build system", "https://rustup.rs", "",
       {"cargo", "--version"}},
      {"docker", "Docker", ToolCategory::Devops,
       "Build, ship and run applications in containers",
       "https://docs.docker.com/get-docker", "", {"docker", "--version"}},
      {"kubectl", "Kubernetes CLI", ToolCategory::Devops,
       "Command-line tool for controlling Kubernetes clusters",
       "https://kubernetes.io/docs/tasks/tools/install-kubectl", "",
       {"kubectl", "version", "--client"}},
      {"terraform", "Terraform", ToolCategory::Devops,
       "Infrastructure as Code tool", "https://www.terraform.io/downloads", "",
       {"terraform", "--version"}},
      {"aws", "AWS CLI", ToolCategory::Cloud,
       "Amazon Web Services command-line interface", "https://aws.amazon.com/cli",
       "pip install awscli", {"aws", "--version"}},
      {"gcloud", "Google Cloud CLI", ToolCategory::Cloud,
       "Google Cloud Platform command-line interface",
       "https://cloud.google.com/sdk/docs/install", "", {"gcloud", "--version"}},
      {"az", "Azure CLI", ToolCategory::Cloud,
       "Microsoft Azure command-line interface",
       "https://docs.microsoft.com/en-us/cli/azure/install-azure-cli", "",
       {"az", "--version"}},
      {"mysql", "MySQL", ToolCategory::Database, "MySQL database client",
       "https://dev.mysql.com/downloads/mysql", "", {"mysql", "--version"}},
      {"psql", "PostgreSQL", ToolCategory::Database, "PostgreSQL database client",
       "https://www.postgresql.org/download", "", {"psql", "--version"}},
      {"redis-cli", "Redis CLI", ToolCategory::Database,
       "Redis command-line interface", "https://redis.io/download", "",
       {"redis-cli", "--version"}},
      {"curl", "cURL", ToolCategory::System,
       "Command-line tool for transferring data",
       "https://curl.se/download.html", "", {"curl", "--version"}},
      {"wget", "wget", ToolCategory::System, "Network downloader",
       "https://www.gnu.org/software/wget", "", {"wget", "--version"}},
      {"jq", "jq", ToolCategory::System, "Lightweight JSON processor",
       "https://stedolan.github.io/jq/download", "", {"jq", "--version"}},
  };
  return tools;
}
}  // namespace

const char* toolCategoryName(ToolCategory category) {
  switch (category) {
    case ToolCategory::Ai:
      return "ai";
    case ToolCategory::Development:
      return "development";
    case ToolCategory::Devops:
      return "devops";
    case ToolCategory::System:
      return "system";
    case ToolCategory::Database:
      return "database";
    case ToolCategory::Cloud:
      return "cloud";
    case ToolCategory::Unknown:
      return "unknown";
  }
  return "unknown";
}

json ToolInfo::toJson() const {
  json j = {{"name", name},
            {"displayName", displayName},
            {"category", toolCategoryName(category)},
            {"description", description},
            {"isInstalled", isInstalled},
            {"isAvailable", isInstalled},
            {"lastChecked", lastChecked}};
  j["path"] = path ? json(*path) : json(nullptr);
  j["version"] = version ? json(*version) : json(nullptr);
  if (!installUrl.empty()) {
    j["installUrl"] = installUrl;
  }
  if (!installCommand.empty()) {
    j["installCommand"] = installCommand;
  }
  return j;
}

ToolRegistry::ToolRegistry(shared_ptr<SubprocessUtils> _subprocessUtils)
    : subprocessUtils(_subprocessUtils),
      cacheDurationMs(DEFAULT_CACHE_DURATION_MS) {
  initializeToolDefinitions();
}

void ToolRegistry::initializeToolDefinitions() {
  for (const auto& def : builtinTools()) {
    ToolInfo info;
    info.name = def.name;
    info.displayName = def.displayName;
    info.category = def.category;
    info.description = def.description;
    info.installUrl = def.installUrl;
    info.installCommand = def.installCommand;
    info.versionCommand = def.versionCommand;
    info.lastChecked = nowMillis();
    registry[info.name] = info;
  }
}

bool ToolRegistry::hasTool(const string& name) const {
  lock_guard<recursive_mutex> guard(registryMutex);
  return registry.find(name) != registry.end();
}

optional<ToolInfo> ToolRegistry::getTool(const string& name) const {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = registry.find(name);
  if (it == registry.end()) {
    return std::nullopt;
  }
  return it->second;
}

vector<ToolInfo> ToolRegistry::getAllTools() const {
  lock_guard<recursive_mutex> guard(registryMutex);
  vector<ToolInfo> tools;
  for (const auto& it : registry) {
    tools.push_back(it.second);
  }
  return tools;
}

void ToolRegistry::registerTool(const ToolInfo& info) {
  lock_guard<recursive_mutex> guard(registryMutex);
  registry[info.name] = info;
  detectionCache.erase(info.name);
}

ToolInfo ToolRegistry::detectTool(const string& name) {
  ToolInfo info;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    auto it = registry.find(name);
    if (it == registry.end()) {
      throw BridgeException(BridgeErrorCode::NotFound,
                            "Tool " + name + " not found in registry");
    }
    auto cached = detectionCache.find(name);
    if (cached != detectionCache.end() &&
        nowMillis() - cached->second < cacheDurationMs) {
      return it->second;
    }
    info = it->second;
  }

  // Detection forks, so it runs without holding the registry lock
  info = runDetection(info);

  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = registry.find(name);
  if (it != registry.end()) {
    it->second.isInstalled = info.isInstalled;
    it->second.path = info.path;
    it->second.version = info.version;
    it->second.lastChecked = info.lastChecked;
    detectionCache[name] = info.lastChecked;
  }
  return info;
}

ToolInfo ToolRegistry::runDetection(ToolInfo info) {
  info.path = findOnPath(info.name);
  info.isInstalled = bool(info.path);
  info.version.reset();
  if (info.isInstalled && !info.versionCommand.empty()) {
    try {
      vector<string> args(info.versionCommand.begin() + 1,
                          info.versionCommand.end());
      auto result = subprocessUtils->run(info.versionCommand[0], args,
                                         VERSION_TIMEOUT_MS);
      // Some tools print their version on stderr
      info.version = parseVersion(result.output + result.error);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Failed to get version for " << info.name << ": "
                   << re.what();
    }
  }
  info.lastChecked = nowMillis();
  VLOG(1) << "Detected " << info.name << ": "
          << (info.isInstalled ? "installed" : "missing");
  return info;
}

vector<ToolInfo> ToolRegistry::detectAllTools() {
  vector<ToolInfo> tools;
  for (const auto& info : getAllTools()) {
    tools.push_back(detectTool(info.name));
  }
  return tools;
}

vector<ToolInfo> ToolRegistry::getToolsByCategory(ToolCategory category) const {
  vector<ToolInfo> tools;
  for (const auto& info : getAllTools()) {
    if (info.category == category) {
      tools.push_back(info);
    }
  }
  return tools;
}

vector<ToolInfo> ToolRegistry::getInstalledTools() {
  vector<ToolInfo> tools;
  for (const auto& info : detectAllTools()) {
    if (info.isInstalled) {
      tools.push_back(info);
    }
  }
  return tools;
}

vector<ToolInfo> ToolRegistry::getMissingTools() {
  vector<ToolInfo> tools;
  for (const auto& info : detectAllTools()) {
    if (!info.isInstalled) {
      tools.push_back(info);
    }
  }
  return tools;
}

ToolInfo ToolRegistry::refreshToolStatus(const string& name) {
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    detectionCache.erase(name);
  }
  return detectTool(name);
}

vector<ToolInfo> ToolRegistry::refreshAllTools() {
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    detectionCache.clear();
  }
  return detectAllTools();
}

json ToolRegistry::getToolStatistics() {
  auto tools = detectAllTools();
  int installed = 0;
  json byCategory = json::object();
  for (const auto& info : tools) {
    string category = toolCategoryName(info.category);
    if (!byCategory.contains(category)) {
      byCategory[category] = {{"total", 0}, {"installed", 0}};
    }
    byCategory[category]["total"] = byCategory[category]["total"].get<int>() + 1;
    if (info.isInstalled) {
      installed++;
      byCategory[category]["installed"] =
          byCategory[category]["installed"].get<int>() + 1;
    }
  }
  return {{"total", tools.size()},
          {"installed", installed},
          {"missing", int(tools.size()) - installed},
          {"byCategory", byCategory}};
}

optional<string> ToolRegistry::parseVersion(const string& output) {
  static const std::regex semver("v?(\\d+\\.\\d+\\.\\d+)");
  static const std::regex majorMinor("v?(\\d+\\.\\d+)");
  std::smatch match;
  if (std::regex_search(output, match, semver)) {
    return match[1].str();
  }
  if (std::regex_search(output, match, majorMinor)) {
    return match[1].str();
  }
  auto lines = split(output, '\n');
  string firstLine = lines.empty() ? "" : trim(lines[0]);
  if (firstLine.empty()) {
    return std::nullopt;
  }
  return firstLine;
}

optional<string> ToolRegistry::findOnPath(const string& executable) {
  if (executable.find('/') != string::npos) {
    if (::access(executable.c_str(), X_OK) == 0) {
      return executable;
    }
    return std::nullopt;
  }
  const char* pathEnv = ::getenv("PATH");
  if (pathEnv == NULL) {
    return std::nullopt;
  }
  for (const auto& dir : split(string(pathEnv), ':')) {
    if (dir.empty()) {
      continue;
    }
    string candidate = dir + "/" + executable;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}
}  // namespace sb
