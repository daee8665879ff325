#ifndef __SB_OUTPUT_FORMATTER_HPP__
#define __SB_OUTPUT_FORMATTER_HPP__

#include "CommandParser.hpp"
#include "Headers.hpp"

namespace sb {
struct FormattedOutput {
  /** @brief The raw text, untouched. */
  string formatted;
  /** @brief Escaped text with `<span class=...>` annotations. */
  string html;
};

/**
 * @brief Renders captured command output as HTML for the web client.
 *
 * All text is escaped first; highlighting only ever wraps escaped text, so
 * nothing the command printed can inject markup.
 */
class OutputFormatter {
 public:
  FormattedOutput formatOutput(const CommandInfo& commandInfo,
                               const string& output) const;

  static string escapeHtml(const string& text);
  static string formatMarkdown(const string& text);
  static string addLineNumbers(const string& html);

 protected:
  string formatDevelopmentOutput(const CommandInfo& commandInfo,
                                 const string& output) const;
  string formatDevOpsOutput(const CommandInfo& commandInfo,
                            const string& output) const;
  string formatGitOutput(const string& output) const;
  string formatNodeOutput(const CommandInfo& commandInfo,
                          const string& output) const;
  string formatPythonOutput(const string& output) const;
  string formatDockerOutput(const string& output) const;
  string formatKubernetesOutput(const string& output) const;
  string highlightSystemOutput(const string& output) const;
};
}  // namespace sb

#endif  // __SB_OUTPUT_FORMATTER_HPP__
