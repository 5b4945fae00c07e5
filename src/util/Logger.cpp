#include "cmdreg/util/Logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace cmdreg::util {

static thread_local std::map<std::string, std::string> t_ctx;

const char* levelName(LogLevel l) {
  switch (l) { case LogLevel::Trace: return "TRACE";
               case LogLevel::Debug: return "DEBUG";
               case LogLevel::Info:  return "INFO";
               case LogLevel::Warn:  return "WARN";
               case LogLevel::Error: return "ERROR"; }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "trace") return LogLevel::Trace;
  if (x == "debug") return LogLevel::Debug;
  if (x == "info")  return LogLevel::Info;
  if (x == "warn")  return LogLevel::Warn;
  if (x == "error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = nullptr;
}

void Logger::setLevel(LogLevel lvl) { lvl_ = static_cast<int>(lvl); }
void Logger::setFormatJson(bool json) { json_ = json; }

void Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = path.empty() ? stdout : static_cast<void*>(std::fopen(path.c_str(), "a"));
  if (!file_) file_ = stdout;
}

LogLevel Logger::level() const { return static_cast<LogLevel>(lvl_.load()); }

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm;
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static void appendEscaped(std::ostringstream& oss, const std::string& s) {
  for (char c : s) {
    if (c == '"' || c == '\\') oss << '\\';
    if (c == '\n') { oss << "\\n"; continue; }
    oss << c;
  }
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  std::ostringstream oss;
  if (json_) {
    oss << "{\"ts\":\"" << nowIso() << "\",\"lvl\":\"" << levelName(lvl) << "\",\"msg\":\"";
    appendEscaped(oss, msg);
    oss << "\"";
    for (auto& kv : t_ctx) {
      oss << ",\"" << kv.first << "\":\"";
      appendEscaped(oss, kv.second);
      oss << "\"";
    }
    for (auto& kv : fields) {
      oss << ",\"" << kv.k << "\":\"";
      appendEscaped(oss, kv.v);
      oss << "\"";
    }
    oss << "}\n";
  } else {
    oss << '[' << nowIso() << "] " << std::left << std::setw(5) << levelName(lvl) << ' ' << msg;
    for (auto& kv : t_ctx) oss << ' ' << kv.first << '=' << kv.second;
    for (auto& kv : fields) oss << ' ' << kv.k << '=' << kv.v;
    oss << '\n';
  }

  const std::string line = oss.str();
  std::lock_guard<std::mutex> lk(mx_);
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);
  std::fwrite(line.data(), 1, line.size(), f);
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) {
  for (auto& kv : add) {
    auto it = t_ctx.find(kv.k);
    if (it != t_ctx.end()) previous_.push_back({it->first, it->second});
    else                   added_.push_back(kv.k);
    t_ctx[kv.k] = kv.v;
  }
}

Logger::Scoped::~Scoped() {
  for (auto& k : added_) t_ctx.erase(k);
  for (auto& kv : previous_) t_ctx[kv.k] = kv.v;
}

} // namespace cmdreg::util
