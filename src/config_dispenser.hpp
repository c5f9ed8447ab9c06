// config_dispenser.hpp

#pragma once
#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct ConfigToken {
  std::string text;
  std::string file;
  int line = 0;
  int end_line = 0;
  bool quoted = false;
};

std::vector<ConfigToken> tokenize_config(const std::string& text,
                                         const std::string& file);

// Walks a token stream directive by directive. Blocks are opened by a "{"
// at the end of a line and closed by a "}" on its own line.
class ConfigDispenser {
public:
  explicit ConfigDispenser(std::vector<ConfigToken> tokens)
      : tokens_(std::move(tokens)) {}

  static ConfigDispenser from_string(const std::string& text,
                                     const std::string& file = "Caddyfile") {
    return ConfigDispenser(tokenize_config(text, file));
  }

  // Advances to the next token regardless of line breaks.
  bool next();

  // Advances to the next token only if it is an argument on the same line.
  bool next_arg();

  // Iterates directives inside a block. Pass nesting() taken just before the
  // block is entered; returns false once the matching "}" is consumed.
  bool next_block(int initial_nesting);

  // Consumes all remaining arguments on the current line.
  std::vector<std::string> remaining_args();

  const std::string& val() const;
  int line() const;
  int nesting() const { return nesting_; }

  ConfigError arg_err() const;
  ConfigError err(const std::string& msg) const;

private:
  bool next_on_same_line() const;
  std::string location() const;

  std::vector<ConfigToken> tokens_;
  int cursor_ = -1;
  int nesting_ = 0;
};

// Consumes exactly one argument of the current directive.
inline std::string expect_arg(ConfigDispenser& d) {
  if (!d.next_arg()) {
    throw d.arg_err();
  }
  return d.val();
}

// Literal parsers. They throw std::invalid_argument; callers wrap the
// message into a ConfigError that names the directive.
std::chrono::nanoseconds parse_duration(const std::string& text);
bool parse_bool(const std::string& text);
uint64_t parse_uint(const std::string& text);
