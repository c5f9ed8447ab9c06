// logger.hpp

#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

class Logger {
public:
  using Field = std::pair<std::string, std::string>;
  using FieldList = std::vector<Field>;

  Logger() : name_("dynamic_sd") {}
  explicit Logger(std::string name) : name_(std::move(name)) {}

  Logger named(const std::string& child) const {
    return Logger(name_ + "." + child);
  }

  const std::string& name() const { return name_; }

  void info(const std::string& msg, const FieldList& fields = {}) const {
    write(std::cout, "INFO", msg, fields);
  }

  void error(const std::string& msg, const FieldList& fields = {}) const {
    write(std::cerr, "ERROR", msg, fields);
  }

  void debug(const std::string& msg, const FieldList& fields = {}) const {
    if (debug_enabled()) {
      write(std::cout, "DEBUG", msg, fields);
    }
  }

  static void set_debug(bool enabled) { debug_flag().store(enabled); }
  static bool debug_enabled() { return debug_flag().load(); }

private:
  static std::atomic<bool>& debug_flag() {
    static std::atomic<bool> flag{false};
    return flag;
  }

  static std::mutex& output_mutex() {
    static std::mutex m;
    return m;
  }

  void write(std::ostream& out, const char* level, const std::string& msg,
             const FieldList& fields) const {
    std::scoped_lock lock(output_mutex());
    out << level << " [" << name_ << "] " << msg;
    for (const auto& [key, value] : fields) {
      out << " " << key << "=" << value;
    }
    out << std::endl;
  }

  std::string name_;
};
