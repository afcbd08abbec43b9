#ifndef MESSAGE_H_
#define MESSAGE_H_

/// Chat message handling: code block extraction, options and reply text

#include <map>
#include <string>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include <codie/execution.h>

struct CodeBlock {
  std::string language;
  std::string options; // the rest of the opening fence line
  std::string code;
};

using MessageOptions = std::map<std::string, std::string>;

// The first fenced block; the closing fence is the last ``` in the message
std::optional<CodeBlock> ParseCodeBlock(const std::string& message);

// Space-separated key=value pairs. Values are bare (no spaces or quotes) or quoted with
//  \" and \\ escapes. Duplicated keys are rejected. On failure, error describes why.
std::optional<MessageOptions> ParseOptions(const std::string& str, std::string* error = nullptr);

// Replace every ``` with a look-alike so output cannot close the reply's code block
std::string EscapeCodeblock(const std::string& str);

std::string FormatReply(const ExecutionResult&, const std::string& language);
nlohmann::json ResultToJson(const ExecutionResult&);

extern const char kNoCodeBlockReply[];
std::string NoLanguageReply(const std::string& code);

#endif  // MESSAGE_H_
