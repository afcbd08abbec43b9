#include "message.h"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <codie/utils.h>

namespace {

const std::string kFence = "```";
// U+02CB MODIFIER LETTER GRAVE ACCENT, three times
const std::string kEscapedFence = "\xCB\x8B\xCB\x8B\xCB\x8B";

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}
bool IsAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}
bool IsIdentifierStart(char c) {
  return IsAlpha(c) || c == '_';
}
bool IsIdentifierChar(char c) {
  return IsIdentifierStart(c) || (c >= '0' && c <= '9');
}

} // namespace

const char kNoCodeBlockReply[] =
    "Were you trying to run some code? I couldn't find any code blocks in your message.\n"
    "\n"
    "Be sure to annotate your code blocks with a language like\n"
    "\\`\\`\\`python\n"
    "print('Hello World')\n"
    "\\`\\`\\`";

std::string NoLanguageReply(const std::string& code) {
  return "I noticed you sent a code block but didn't include a language tag, so I don't know how "
         "to run it. The language goes immediately after the \\`\\`\\` like so\n"
         "\n"
         "\\`\\`\\`your-language-here\n" + code + "\\`\\`\\`";
}

std::optional<CodeBlock> ParseCodeBlock(const std::string& message) {
  size_t open = message.find(kFence);
  if (open == std::string::npos) return std::nullopt;
  size_t pos = open + kFence.size();
  size_t line_end = message.find('\n', pos);
  if (line_end == std::string::npos) return std::nullopt;
  size_t close = message.rfind(kFence);
  if (close == std::string::npos || close <= line_end) return std::nullopt;

  CodeBlock ret;
  size_t lang_end = pos;
  while (lang_end < line_end && !IsSpace(message[lang_end])) lang_end++;
  ret.language = message.substr(pos, lang_end - pos);
  size_t opt_begin = lang_end, opt_end = line_end;
  while (opt_begin < opt_end && IsSpace(message[opt_begin])) opt_begin++;
  while (opt_end > opt_begin && IsSpace(message[opt_end - 1])) opt_end--;
  ret.options = message.substr(opt_begin, opt_end - opt_begin);
  ret.code = message.substr(line_end + 1, close - line_end - 1);
  return ret;
}

std::optional<MessageOptions> ParseOptions(const std::string& str, std::string* error) {
  auto Fail = [error](std::string&& msg) -> std::optional<MessageOptions> {
    if (error) *error = std::move(msg);
    return std::nullopt;
  };
  MessageOptions ret;
  size_t pos = 0, n = str.size();
  while (pos < n && IsSpace(str[pos])) pos++;
  while (pos < n) {
    if (!IsIdentifierStart(str[pos])) {
      return Fail(fmt::format("expected an option name at position {}", pos));
    }
    size_t key_begin = pos;
    while (pos < n && IsIdentifierChar(str[pos])) pos++;
    std::string key = str.substr(key_begin, pos - key_begin);
    if (pos == n || str[pos] != '=') {
      return Fail(fmt::format("expected '=' after {}", key));
    }
    pos++;

    std::string value;
    if (pos < n && str[pos] == '"') {
      pos++;
      bool closed = false;
      while (pos < n) {
        char c = str[pos++];
        if (c == '"') {
          closed = true;
          break;
        }
        if (c == '\\') {
          if (pos == n || (str[pos] != '\\' && str[pos] != '"')) {
            return Fail(fmt::format("invalid escape in the value of {}", key));
          }
          c = str[pos++];
        }
        value.push_back(c);
      }
      if (!closed) return Fail(fmt::format("unterminated string in the value of {}", key));
    } else {
      size_t value_begin = pos;
      while (pos < n && str[pos] != ' ' && str[pos] != '"') pos++;
      if (pos == value_begin) return Fail(fmt::format("missing value of {}", key));
      value = str.substr(value_begin, pos - value_begin);
    }
    if (pos < n && !IsSpace(str[pos])) {
      return Fail(fmt::format("expected a space after the value of {}", key));
    }
    if (!ret.emplace(key, std::move(value)).second) {
      return Fail(fmt::format("duplicate key {}", key));
    }
    while (pos < n && IsSpace(str[pos])) pos++;
  }
  return ret;
}

std::string EscapeCodeblock(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  size_t pos = 0;
  for (size_t nxt; (nxt = str.find(kFence, pos)) != std::string::npos; pos = nxt + kFence.size()) {
    ret.append(str, pos, nxt - pos);
    ret += kEscapedFence;
  }
  ret.append(str, pos);
  return ret;
}

std::string FormatReply(const ExecutionResult& result, const std::string& language) {
  switch (result.error) {
    case ErrorKind::TOO_LARGE:
      return "Your code is too large for me to run.";
    case ErrorKind::RATE_LIMITED:
      return fmt::format("You're running code too often. Try again in {} seconds.",
                         (result.retry_after + 999) / 1000);
    case ErrorKind::OVERLOADED:
      return "I'm too busy to run your code right now. Try again in a moment.";
    case ErrorKind::UNSUPPORTED_LANGUAGE:
      return fmt::format("I'm sorry, I don't know how to run {}", language);
    case ErrorKind::INFRASTRUCTURE_ERROR:
      return "Something went wrong on my end while running your code. Try again later.";
    case ErrorKind::CANCELLED:
      return "Your code was not run to completion because I'm shutting down.";
    default: break;
  }
  std::string reply;
  if (result.error == ErrorKind::TIMED_OUT) {
    reply += "**TIMED OUT**\n";
  } else if (result.exit_code && *result.exit_code != 0) {
    reply += fmt::format("**EXIT STATUS:** {}\n", *result.exit_code);
  }
  if (result.output.size()) {
    reply += "```\n" + EscapeCodeblock(result.output);
    if (result.truncated) reply += "...";
    reply += "```";
  }
  return reply;
}

nlohmann::json ResultToJson(const ExecutionResult& result) {
  nlohmann::json ret{
    {"request_id", result.request_id},
    {"error", ErrorKindName(result.error)},
    {"description", ErrorKindDesc(result.error)},
    {"status", SessionStatusName(result.status)},
    {"exit_code", nullptr},
    {"output", result.output},
    {"truncated", result.truncated},
    {"discarded_bytes", result.discarded_bytes},
    {"retry_after_ms", result.retry_after},
    {"duration_ms", result.duration},
  };
  if (result.exit_code) ret["exit_code"] = *result.exit_code;
  return ret;
}
