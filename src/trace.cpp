#include "trace.hpp"

#include <ctime>
#include <fstream>
#include <iostream>

namespace term_launcher {

bool Trace::debug_enabled_ = false;
bool Trace::console_enabled_ = true;

namespace {

std::ofstream &trace_file() {
  static std::ofstream file;
  return file;
}

const char *level_name(TraceLevel level) {
  switch (level) {
  case TraceLevel::DEBUG:
    return "DEBUG";
  case TraceLevel::WARN:
    return "WARN";
  case TraceLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

} // namespace

bool Trace::open_file(const std::string &path) {
  auto &file = trace_file();
  if (file.is_open())
    file.close();
  file.open(path, std::ios::out | std::ios::app);
  return file.is_open();
}

void Trace::close_file() {
  auto &file = trace_file();
  if (file.is_open())
    file.close();
}

void Trace::write(TraceLevel level, const std::string &tag,
                  const std::string &message) {
  auto &file = trace_file();
  if (file.is_open()) {
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    file << stamp << " " << level_name(level) << " [" << tag << "] "
         << message << "\n"
         << std::flush;
    return;
  }

  if (!console_enabled_)
    return;
  std::cerr << "[" << tag << "] " << message << std::endl;
}

} // namespace term_launcher
