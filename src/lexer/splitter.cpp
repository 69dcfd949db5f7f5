#include "splitter.hpp"

#include "../utils/utils.hpp"
#include "names.hpp"
#include <array>
#include <cctype>

namespace lexer {
namespace {
constexpr std::array<std::string_view, 2> kEnvironments = {"circuitikz",
                                                           "tikzpicture"};
constexpr std::array<std::string_view, 6> kStatementCommands = {
    "\\draw", "\\path", "\\node", "\\coordinate", "\\begin{scope}",
    "\\end{scope}"};

bool StartsWithAt(std::string_view text, std::size_t pos,
                  std::string_view prefix) {
  return text.substr(pos, prefix.size()) == prefix;
}

std::optional<std::string_view> CommandAt(std::string_view text,
                                          std::size_t pos) {
  for (auto command : kStatementCommands) {
    if (!StartsWithAt(text, pos, command)) {
      continue;
    }
    auto end = pos + command.size();
    // `\nodes` or `\drawing` are different commands.
    if (command.back() != '}' && end < text.size() &&
        std::isalpha(static_cast<unsigned char>(text[end]))) {
      continue;
    }
    return command;
  }
  return std::nullopt;
}

// Only blanks between the previous newline and `pos`.
bool AtLineStart(std::string_view text, std::size_t pos) {
  while (pos > 0) {
    char c = text[--pos];
    if (c == '\n') {
      return true;
    }
    if (c != ' ' && c != '\t' && c != '\r') {
      return false;
    }
  }
  return true;
}

// Skips an option block right after `\begin{scope}`.
std::size_t SkipOptions(std::string_view text, std::size_t pos) {
  auto probe = pos;
  while (probe < text.size() &&
         std::isspace(static_cast<unsigned char>(text[probe]))) {
    probe++;
  }
  if (probe >= text.size() || text[probe] != '[') {
    return pos;
  }
  int depth = 0;
  for (; probe < text.size(); probe++) {
    if (text[probe] == '[') {
      depth++;
    } else if (text[probe] == ']' && --depth == 0) {
      return probe + 1;
    }
  }
  return text.size();
}
} // namespace

std::string RemoveComments(std::string_view source) {
  std::string result;
  result.reserve(source.size());
  bool in_comment = false;
  for (std::size_t i = 0; i < source.size(); i++) {
    char c = source[i];
    if (in_comment) {
      if (c == '\n') {
        in_comment = false;
        result += c;
      }
      continue;
    }
    if (c == '\\' && i + 1 < source.size()) {
      result += c;
      result += source[++i];
      continue;
    }
    if (c == '%') {
      in_comment = true;
      continue;
    }
    result += c;
  }
  return result;
}

std::optional<std::string> ExtractDrawingBody(std::string_view source) {
  std::optional<std::string> best;
  std::size_t best_pos = std::string_view::npos;
  for (auto environment : kEnvironments) {
    std::string begin = "\\begin{" + std::string(environment) + "}";
    std::string end = "\\end{" + std::string(environment) + "}";
    auto begin_pos = source.find(begin);
    if (begin_pos == std::string_view::npos || begin_pos > best_pos) {
      continue;
    }
    auto body_pos = begin_pos + begin.size();
    auto end_pos = source.find(end, body_pos);
    if (end_pos == std::string_view::npos) {
      continue;
    }
    best_pos = begin_pos;
    best = std::string(source.substr(body_pos, end_pos - body_pos));
  }
  return best;
}

std::vector<Statement> SplitStatements(std::string_view body) {
  std::vector<Statement> statements;
  std::size_t start = 0;
  int braces = 0;
  int brackets = 0;
  int parens = 0;

  auto flush = [&](std::size_t end) {
    if (end > start) {
      auto text = body.substr(start, end - start);
      auto first = text.find_first_not_of(" \t\r\n");
      if (first != std::string_view::npos) {
        auto last = text.find_last_not_of(" \t\r\n");
        statements.push_back({std::string(text.substr(first, last - first + 1))});
      }
    }
    start = end;
    braces = brackets = parens = 0;
  };

  for (std::size_t i = 0; i < body.size(); i++) {
    char c = body[i];
    if (c == '\\') {
      auto command = CommandAt(body, i);
      if (command && braces > 0 && AtLineStart(body, i)) {
        flush(i);
      }
      if (braces == 0) {
        if (command) {
          if (brackets > 0 || parens > 0) {
            flush(i);
          }
          auto kind = ParseCommand(*command);
          if (kind == Command::kBeginScope || kind == Command::kEndScope) {
            flush(i);
            auto end = i + command->size();
            if (kind == Command::kBeginScope) {
              end = SkipOptions(body, end);
            }
            flush(end);
            i = end - 1;
            continue;
          }
        }
      }
      i++;
      continue;
    }
    switch (c) {
    case '{':
      braces++;
      break;
    case '}':
      if (braces > 0) {
        braces--;
      }
      break;
    case '[':
      if (braces == 0) {
        brackets++;
      }
      break;
    case ']':
      if (braces == 0 && brackets > 0) {
        brackets--;
      }
      break;
    case '(':
      if (braces == 0 && brackets == 0) {
        parens++;
      }
      break;
    case ')':
      if (braces == 0 && brackets == 0 && parens > 0) {
        parens--;
      }
      break;
    case ';':
      if (braces == 0 && brackets == 0) {
        flush(i + 1);
      }
      break;
    default:
      break;
    }
  }
  flush(body.size());
  return statements;
}

} // namespace lexer
