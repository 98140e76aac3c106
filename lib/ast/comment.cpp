// doculint/ast/comment.cpp - CommentGroup text extraction
//
#include <string>
#include <string_view>
#include <vector>

#include "doculint/ast/ast.hpp"

namespace doculint
{

namespace
{

bool is_lower_alnum(char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); }

/// `text` is a line comment with the leading "//" removed and no space after it.
bool is_directive(std::string_view text)
{
  for (const std::string_view prefix : {"line ", "extern ", "export "}) {
    if (text.substr(0, prefix.size()) == prefix) {
      return true;
    }
  }

  // "[a-z0-9]+:[a-z0-9]", e.g. "go:generate" or "nolint:errcheck"
  const auto colon = text.find(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
    return false;
  }
  for (size_t i = 0; i <= colon + 1; ++i) {
    if (i != colon && !is_lower_alnum(text[i])) {
      return false;
    }
  }
  return true;
}

std::string_view strip_trailing_whitespace(std::string_view line)
{
  size_t n = line.size();
  while (n > 0) {
    const char c = line[n - 1];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    --n;
  }
  return line.substr(0, n);
}

}  // namespace

std::string CommentGroup::text() const
{
  std::vector<std::string_view> lines;

  for (std::string_view c : comments) {
    if (c.size() < 2) {
      continue;
    }

    if (c[1] == '/') {
      c.remove_prefix(2);
      if (!c.empty()) {
        if (c.front() == ' ') {
          c.remove_prefix(1);
        } else if (is_directive(c)) {
          continue;
        }
      }
    } else if (c[1] == '*') {
      c = c.size() >= 4 ? c.substr(2, c.size() - 4) : std::string_view{};
    }

    size_t start = 0;
    while (true) {
      const auto nl = c.find('\n', start);
      if (nl == std::string_view::npos) {
        lines.push_back(strip_trailing_whitespace(c.substr(start)));
        break;
      }
      lines.push_back(strip_trailing_whitespace(c.substr(start, nl - start)));
      start = nl + 1;
    }
  }

  // Drop leading blank lines and collapse interior runs to one blank line.
  std::vector<std::string_view> kept;
  kept.reserve(lines.size());
  for (const auto line : lines) {
    if (!line.empty() || (!kept.empty() && !kept.back().empty())) {
      kept.push_back(line);
    }
  }
  while (!kept.empty() && kept.back().empty()) {
    kept.pop_back();
  }

  std::string out;
  for (const auto line : kept) {
    out.append(line);
    out.push_back('\n');
  }
  return out;
}

}  // namespace doculint
