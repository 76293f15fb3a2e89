#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "deteval/common/StringUtils.hpp"

namespace evlog {
enum Level { TRACE = 0, DEBUG, INFO, WARN, ERROR };
inline std::atomic<Level> g_level{INFO};
inline std::mutex g_mu;

inline const char* lvlstr(Level l) {
  switch (l) {
    case TRACE: return "TRACE";
    case DEBUG: return "DEBUG";
    case INFO: return "INFO";
    case WARN: return "WARN";
    default: return "ERROR";
  }
}

// Accepts TRACE/DEBUG/INFO/WARN(ING)/ERROR in any case.
inline bool parseLevel(const std::string& name, Level& out) {
  const std::string upper = deteval::common::toUpperCopy(deteval::common::trimCopy(name));
  if (upper == "TRACE") { out = TRACE; return true; }
  if (upper == "DEBUG") { out = DEBUG; return true; }
  if (upper == "INFO") { out = INFO; return true; }
  if (upper == "WARN" || upper == "WARNING") { out = WARN; return true; }
  if (upper == "ERROR") { out = ERROR; return true; }
  return false;
}

inline void setLevel(Level l) { g_level.store(l, std::memory_order_relaxed); }

inline bool enabled(Level l) { return l >= g_level.load(std::memory_order_relaxed); }

template <typename... A>
inline void write(Level l, const char* file, int line, const A&... a) {
  if (!enabled(l)) return;
  std::ostringstream os;
  (void)std::initializer_list<int>{(os << a, 0)...};
  auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

  struct tm tm_buf;
#if defined(_WIN32) || defined(_WIN64)
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif

  std::lock_guard<std::mutex> lk(g_mu);
  std::cerr << "[" << lvlstr(l) << "] " << std::put_time(&tm_buf, "%F %T") << " " << file
            << ":" << line << " | " << os.str() << "\n";
}
}  // namespace evlog

#define LOGT(...) evlog::write(evlog::TRACE, __FILE__, __LINE__, __VA_ARGS__)
#define LOGD(...) evlog::write(evlog::DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#define LOGI(...) evlog::write(evlog::INFO, __FILE__, __LINE__, __VA_ARGS__)
#define LOGW(...) evlog::write(evlog::WARN, __FILE__, __LINE__, __VA_ARGS__)
#define LOGE(...) evlog::write(evlog::ERROR, __FILE__, __LINE__, __VA_ARGS__)
