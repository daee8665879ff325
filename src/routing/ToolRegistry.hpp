#ifndef __SB_TOOL_REGISTRY_HPP__
#define __SB_TOOL_REGISTRY_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SubprocessUtils.hpp"

namespace sb {
enum class ToolCategory {
  Ai,
  Development,
  Devops,
  System,
  Database,
  Cloud,
  Unknown,
};

const char* toolCategoryName(ToolCategory category);

/**
 * @brief A command line program the bridge knows how to classify, together
 * with what was learned the last time it was looked up on this machine.
 */
struct ToolInfo {
  string name;
  string displayName;
  ToolCategory category = ToolCategory::Unknown;
  string description;
  string installUrl;
  string installCommand;
  /** @brief argv used to ask the tool for its version. */
  vector<string> versionCommand;

  bool isInstalled = false;
  optional<string> path;
  optional<string> version;
  int64_t lastChecked = 0;

  json toJson() const;
};

/**
 * @brief Table of known tools with cached install detection.
 *
 * Detection looks the executable up on PATH and then runs its version
 * command. Results are reused for the cache duration (5 minutes by default).
 */
class ToolRegistry {
 public:
  explicit ToolRegistry(shared_ptr<SubprocessUtils> _subprocessUtils);
  virtual ~ToolRegistry() {}

  bool hasTool(const string& name) const;

  /** @brief Registry entry as currently known, without running detection. */
  optional<ToolInfo> getTool(const string& name) const;

  vector<ToolInfo> getAllTools() const;

  /**
   * @brief Adds or replaces an entry. Used for agent tools registered at
   * runtime.
   */
  void registerTool(const ToolInfo& info);

  /**
   * @brief Returns the install status of a tool, detecting it if the cached
   * result is missing or stale.
   * @throws BridgeException with NotFound for names not in the registry.
   */
  ToolInfo detectTool(const string& name);

  vector<ToolInfo> detectAllTools();

  vector<ToolInfo> getToolsByCategory(ToolCategory category) const;
  vector<ToolInfo> getInstalledTools();
  vector<ToolInfo> getMissingTools();

  /** @brief Forgets the cached result and detects again. */
  ToolInfo refreshToolStatus(const string& name);
  vector<ToolInfo> refreshAllTools();

  /** @brief {total, installed, missing, byCategory} */
  json getToolStatistics();

  void setCacheDurationMs(int64_t duration) { cacheDurationMs = duration; }

  /**
   * @brief Extracts "X.Y.Z" (or "X.Y") from free form version output.
   */
  static optional<string> parseVersion(const string& output);

  /** @brief Full path of an executable found on PATH, if any. */
  static optional<string> findOnPath(const string& executable);

 protected:
  mutable recursive_mutex registryMutex;
  map<string, ToolInfo> registry;
  /** @brief Tool name -> time (ms) of the last completed detection. */
  map<string, int64_t> detectionCache;
  shared_ptr<SubprocessUtils> subprocessUtils;
  int64_t cacheDurationMs;

  void initializeToolDefinitions();
  ToolInfo runDetection(ToolInfo info);
};
}  // namespace sb

#endif  // __SB_TOOL_REGISTRY_HPP__
