#include "OutputFormatter.hpp"

#include <boost/regex.hpp>

namespace sb {
namespace {
string replaceMatches(const string& text, const boost::regex& pattern,
                      const string& format) {
  try {
    // '.' stops at line ends, as in the ECMAScript grammar
    return boost::regex_replace(
        text, pattern, format,
        boost::match_default | boost::match_not_dot_newline);
  } catch (const std::runtime_error& e) {
    LOG(WARNING) << "Leaving " << text.size()
                 << " bytes unhighlighted: " << e.what();
    return text;
  }
}

string wrap(const string& text, const boost::regex& pattern,
            const string& cssClass) {
  return replaceMatches(text, pattern,
                        "<span class=\"" + cssClass + "\">$1</span>");
}

const boost::regex& re(const char* pattern) {
  // Patterns are compiled once per distinct literal
  static std::mutex cacheMutex;
  static map<const char*, std::unique_ptr<boost::regex>> cache;
  lock_guard<std::mutex> guard(cacheMutex);
  auto& slot = cache[pattern];
  if (!slot) {
    slot.reset(new boost::regex(pattern));
  }
  return *slot;
}
}  // namespace

FormattedOutput OutputFormatter::formatOutput(const CommandInfo& commandInfo,
                                              const string& output) const {
  FormattedOutput result;
  result.formatted = output;
  result.html = escapeHtml(output);
  if (!commandInfo.tool || output.empty()) {
    return result;
  }

  switch (commandInfo.category) {
    case ToolCategory::Development:
      result.html = formatDevelopmentOutput(commandInfo, output);
      break;
    case ToolCategory::Ai:
      result.html = formatMarkdown(output);
      break;
    case ToolCategory::Devops:
      result.html = formatDevOpsOutput(commandInfo, output);
      break;
    case ToolCategory::System:
      result.html = highlightSystemOutput(output);
      break;
    default:
      if (split(output, '\n').size() > 10) {
        result.html = addLineNumbers(result.html);
      }
      break;
  }
  return result;
}

string OutputFormatter::formatDevelopmentOutput(const CommandInfo& commandInfo,
                                                const string& output) const {
  const string& tool = *commandInfo.tool;
  if (tool == "git") {
    return formatGitOutput(output);
  }
  if (tool == "node") {
    return formatNodeOutput(commandInfo, output);
  }
  if (tool == "python") {
    return formatPythonOutput(output);
  }
  return escapeHtml(output);
}

string OutputFormatter::formatDevOpsOutput(const CommandInfo& commandInfo,
                                           const string& output) const {
  const string& tool = *commandInfo.tool;
  if (tool == "docker") {
    return formatDockerOutput(output);
  }
  if (tool == "kubectl") {
    return formatKubernetesOutput(output);
  }
  return escapeHtml(output);
}

string OutputFormatter::formatGitOutput(const string& output) const {
  string html = escapeHtml(output);
  html = wrap(html, re("(modified:|new file:|deleted:)"),
              "git-status-modified");
  html = wrap(html, re("(Untracked files:)"), "git-status-untracked");
  html = wrap(html, re("(Changes to be committed:)"), "git-status-staged");
  html = wrap(html, re("(\\+\\d+|-\\d+)"), "git-diff-stats");
  return html;
}

string OutputFormatter::formatNodeOutput(const CommandInfo& commandInfo,
                                         const string& output) const {
  string html = escapeHtml(output);
  if (commandInfo.command.find("npm") != string::npos ||
      commandInfo.command.find("yarn") != string::npos) {
    html = wrap(html, re("(WARN|WARNING)"), "npm-warn");
    html = wrap(html, re("(ERROR|ERR!)"), "npm-error");
    html = wrap(html, re("(\xE2\x9C\x93|\xE2\x9C\x94)"), "npm-success");
  }
  return html;
}

string OutputFormatter::formatPythonOutput(const string& output) const {
  string html = escapeHtml(output);
  html = wrap(html, re("(Traceback \\(most recent call last\\):)"),
              "python-traceback");
  html = wrap(html, re("(\\w+Error:)"), "python-error");
  // Quotes are already escaped at this point
  html = wrap(html, re("(File &quot;.*?&quot;, line \\d+)"), "python-file-ref");
  return html;
}

string OutputFormatter::formatDockerOutput(const string& output) const {
  string html = escapeHtml(output);
  html = wrap(html,
              re("(CONTAINER ID|IMAGE|COMMAND|CREATED|STATUS|PORTS|NAMES)"),
              "docker-header");
  html = wrap(html, re("(Up \\d+.*|Exited \\(\\d+\\).*)"), "docker-status");
  return html;
}

string OutputFormatter::formatKubernetesOutput(const string& output) const {
  string html = escapeHtml(output);
  html = wrap(html, re("(NAME|READY|STATUS|RESTARTS|AGE|NAMESPACE)"),
              "k8s-header");
  html = wrap(html, re("(Running|Pending|Failed|Succeeded)"), "k8s-status");
  return html;
}

string OutputFormatter::highlightSystemOutput(const string& output) const {
  string html = escapeHtml(output);
  html = wrap(html, re("(error|ERROR)"), "system-error");
  html = wrap(html, re("(warning|WARNING|warn|WARN)"), "system-warning");
  html = wrap(html, re("(success|SUCCESS|ok|OK|\xE2\x9C\x93|\xE2\x9C\x94)"),
              "system-success");
  html = wrap(html, re("(\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2})"),
              "system-timestamp");
  return html;
}

string OutputFormatter::formatMarkdown(const string& text) {
  string html = escapeHtml(text);
  html = replaceMatches(html, re("\\*\\*(.*?)\\*\\*"),
                        "<strong>$1</strong>");
  html = replaceMatches(html, re("\\*(.*?)\\*"), "<em>$1</em>");
  html = replaceMatches(html, re("`(.*?)`"), "<code>$1</code>");

  // Headers are anchored at line starts
  string result;
  size_t start = 0;
  while (start <= html.size()) {
    size_t end = html.find('\n', start);
    string line =
        html.substr(start, end == string::npos ? string::npos : end - start);
    if (line.rfind("### ", 0) == 0) {
      line = "<h3>" + line.substr(4) + "</h3>";
    } else if (line.rfind("## ", 0) == 0) {
      line = "<h2>" + line.substr(3) + "</h2>";
    } else if (line.rfind("# ", 0) == 0) {
      line = "<h1>" + line.substr(2) + "</h1>";
    }
    result += line;
    if (end == string::npos) {
      break;
    }
    result += '\n';
    start = end + 1;
  }
  return result;
}

string OutputFormatter::addLineNumbers(const string& html) {
  string result;
  int lineNumber = 1;
  size_t start = 0;
  while (true) {
    size_t end = html.find('\n', start);
    result += "<span class=\"line-number\">" + to_string(lineNumber++) +
              "</span> " +
              html.substr(start, end == string::npos ? string::npos
                                                     : end - start);
    if (end == string::npos) {
      break;
    }
    result += '\n';
    start = end + 1;
  }
  return result;
}

string OutputFormatter::escapeHtml(const string& text) {
  string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      case '"':
        escaped += "&quot;";
        break;
      case '\'':
        escaped += "&#39;";
        break;
      default:
        escaped += c;
    }
  }
  return escaped;
}
}  // namespace sb
