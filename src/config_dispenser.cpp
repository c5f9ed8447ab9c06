
#include "config_dispenser.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {

bool is_brace(const ConfigToken& tok, const char* brace) {
  return !tok.quoted && tok.text == brace;
}

} // namespace

std::vector<ConfigToken> tokenize_config(const std::string& text,
                                         const std::string& file) {
  std::vector<ConfigToken> tokens;
  int line = 1;
  size_t i = 0;

  while (i < text.size()) {
    char c = text[i];
    if (c == '\n') {
      ++line;
      ++i;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }
    if (c == '#') {
      while (i < text.size() && text[i] != '\n') {
        ++i;
      }
      continue;
    }

    ConfigToken tok;
    tok.file = file;
    tok.line = line;

    if (c == '"') {
      tok.quoted = true;
      ++i;
      bool closed = false;
      while (i < text.size()) {
        char ch = text[i++];
        if (ch == '\\' && i < text.size() && text[i] == '"') {
          tok.text += '"';
          ++i;
          continue;
        }
        if (ch == '"') {
          closed = true;
          break;
        }
        if (ch == '\n') {
          ++line;
        }
        tok.text += ch;
      }
      if (!closed) {
        throw ConfigError("unterminated quoted string, at " + file + ":" +
                          std::to_string(tok.line));
      }
    } else {
      while (i < text.size() &&
             !std::isspace(static_cast<unsigned char>(text[i]))) {
        tok.text += text[i++];
      }
    }

    tok.end_line = line;
    tokens.push_back(std::move(tok));
  }
  return tokens;
}

bool ConfigDispenser::next() {
  if (cursor_ < static_cast<int>(tokens_.size()) - 1) {
    ++cursor_;
    return true;
  }
  return false;
}

bool ConfigDispenser::next_on_same_line() const {
  if (cursor_ < 0) {
    return !tokens_.empty();
  }
  if (cursor_ >= static_cast<int>(tokens_.size()) - 1) {
    return false;
  }
  const auto& curr = tokens_[cursor_];
  const auto& following = tokens_[cursor_ + 1];
  return curr.file == following.file && curr.end_line == following.line;
}

bool ConfigDispenser::next_arg() {
  if (!next_on_same_line() || is_brace(tokens_[cursor_ + 1], "{")) {
    return false;
  }
  ++cursor_;
  return true;
}

bool ConfigDispenser::next_block(int initial_nesting) {
  if (nesting_ > initial_nesting) {
    if (!next()) {
      throw err("unexpected end of input, expected '}'");
    }
    if (is_brace(tokens_[cursor_], "}") && !next_on_same_line()) {
      --nesting_;
    } else if (is_brace(tokens_[cursor_], "{") && !next_on_same_line()) {
      ++nesting_;
    }
    return nesting_ > initial_nesting;
  }

  // A block has to open on the line of its directive.
  if (!next_on_same_line() || !is_brace(tokens_[cursor_ + 1], "{")) {
    return false;
  }
  ++cursor_;
  if (!next()) {
    throw err("unexpected end of input, expected '}'");
  }
  if (is_brace(tokens_[cursor_], "}")) {
    return false;
  }
  ++nesting_;
  return true;
}

std::vector<std::string> ConfigDispenser::remaining_args() {
  std::vector<std::string> args;
  while (next_arg()) {
    args.push_back(val());
  }
  return args;
}

const std::string& ConfigDispenser::val() const {
  static const std::string empty;
  if (cursor_ < 0 || cursor_ >= static_cast<int>(tokens_.size())) {
    return empty;
  }
  return tokens_[cursor_].text;
}

int ConfigDispenser::line() const {
  if (cursor_ < 0 || cursor_ >= static_cast<int>(tokens_.size())) {
    return 0;
  }
  return tokens_[cursor_].line;
}

std::string ConfigDispenser::location() const {
  if (cursor_ < 0 || cursor_ >= static_cast<int>(tokens_.size())) {
    return "<input>";
  }
  return tokens_[cursor_].file + ":" + std::to_string(tokens_[cursor_].line);
}

ConfigError ConfigDispenser::arg_err() const {
  return ConfigError("wrong argument count or unexpected line ending after '" +
                     val() + "', at " + location());
}

ConfigError ConfigDispenser::err(const std::string& msg) const {
  return ConfigError(msg + ", at " + location());
}

std::chrono::nanoseconds parse_duration(const std::string& text) {
  struct Unit {
    const char* name;
    long double nanos;
  };
  static const Unit units[] = {
      {"ns", 1.0L},           {"us", 1e3L},   {"\xC2\xB5s", 1e3L},
      {"\xCE\xBCs", 1e3L},    {"ms", 1e6L},   {"s", 1e9L},
      {"m", 60e9L},           {"h", 3600e9L}, {"d", 86400e9L},
  };

  const auto invalid = [&text](const std::string& why) {
    return std::invalid_argument(why + " in duration '" + text + "'");
  };

  size_t i = 0;
  bool negative = false;
  if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
    negative = text[0] == '-';
    ++i;
  }
  if (text.compare(i, std::string::npos, "0") == 0) {
    return std::chrono::nanoseconds(0);
  }
  if (i == text.size()) {
    throw invalid("missing value");
  }

  long double total = 0;
  while (i < text.size()) {
    size_t start = i;
    int dots = 0;
    while (i < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[i])) ||
            text[i] == '.')) {
      if (text[i] == '.') {
        ++dots;
      }
      ++i;
    }
    if (start == i || dots > 1 || (i - start == 1 && dots == 1)) {
      throw invalid("invalid number");
    }
    long double value = std::stold(text.substr(start, i - start));

    size_t unit_start = i;
    while (i < text.size() &&
           !std::isdigit(static_cast<unsigned char>(text[i])) &&
           text[i] != '.') {
      ++i;
    }
    std::string unit = text.substr(unit_start, i - unit_start);
    if (unit.empty()) {
      throw invalid("missing unit");
    }

    const Unit* found = nullptr;
    for (const auto& u : units) {
      if (unit == u.name) {
        found = &u;
        break;
      }
    }
    if (!found) {
      throw invalid("unknown unit '" + unit + "'");
    }
    total += value * found->nanos;
  }

  if (total > static_cast<long double>(std::numeric_limits<int64_t>::max())) {
    throw invalid("overflow");
  }
  auto nanos = static_cast<int64_t>(total);
  return std::chrono::nanoseconds(negative ? -nanos : nanos);
}

bool parse_bool(const std::string& text) {
  if (text == "1" || text == "t" || text == "T" || text == "TRUE" ||
      text == "true" || text == "True") {
    return true;
  }
  if (text == "0" || text == "f" || text == "F" || text == "FALSE" ||
      text == "false" || text == "False") {
    return false;
  }
  throw std::invalid_argument("invalid boolean '" + text + "'");
}

uint64_t parse_uint(const std::string& text) {
  uint64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    throw std::invalid_argument("invalid unsigned integer '" + text + "'");
  }
  return value;
}
