#ifndef LOG_HPP
#define LOG_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <termcolor/termcolor.hpp>

// Console output shared by the builder, the scheduler workers and the
// watch loop. Every line is written under one mutex so worker output does
// not interleave.
class Log {
public:
  static void set_verbose(bool verbose) { verbose_flag().store(verbose); }
  static bool verbose() { return verbose_flag().load(); }

  static void heading(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex());
    std::cout << "\n"
              << termcolor::bright_cyan << message << termcolor::reset << "\n";
  }

  static void info(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex());
    std::cout << termcolor::bright_blue << "ℹ " << termcolor::reset << message
              << "\n";
  }

  static void success(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex());
    std::cout << termcolor::bright_green << "✓ " << termcolor::reset << message
              << "\n";
  }

  static void file(const std::string &path, const std::string &note = "") {
    if (!verbose())
      return;
    std::lock_guard<std::mutex> lock(mutex());
    std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
              << termcolor::white << path << termcolor::reset;
    if (!note.empty()) {
      std::cout << termcolor::bright_blue << " (" << note << ")"
                << termcolor::reset;
    }
    std::cout << "\n";
  }

  static void debug(const std::string &message) {
    if (!verbose())
      return;
    std::lock_guard<std::mutex> lock(mutex());
    std::cout << termcolor::bright_blue << "  · " << termcolor::reset << message
              << "\n";
  }

  static void warn(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
              << message << "\n";
  }

  static void error(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
              << message << "\n";
  }

private:
  static std::mutex &mutex() {
    static std::mutex m;
    return m;
  }

  static std::atomic<bool> &verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
  }
};

#endif
