#include "utils.hpp"
#include "errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext new_sha256_context() {
  DigestContext ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Unable to initialise SHA-256 digest");
  }
  return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
  std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx, out.data(), &length) != 1) {
    throw std::runtime_error("Unable to finalise SHA-256 digest");
  }
  out.resize(length);
  return hex_from_bytes(out);
}

} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& b){
  std::ostringstream oss;
  for(auto c : b) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  return oss.str();
}

std::string sha256_hex(const std::string& data){
  auto ctx = new_sha256_context();
  if(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
  return finish_hex(ctx.get());
}

std::string sha256_file_hex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw SyncError(ErrorKind::Io, path.string(), "unable to open file for hashing");
  }
  auto ctx = new_sha256_context();
  std::array<char, 64 * 1024> buffer{};
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      throw SyncError(ErrorKind::Io, path.string(), "SHA-256 update failed");
    }
  }
  if(in.bad()) {
    throw SyncError(ErrorKind::Io, path.string(), "read failed while hashing");
  }
  return finish_hex(ctx.get());
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::vector<std::string> split(const std::string& value, char separator) {
  std::vector<std::string> out;
  std::string current;
  std::istringstream iss(value);
  while(std::getline(iss, current, separator)) {
    current = trim_copy(current);
    if(!current.empty()) out.push_back(current);
  }
  return out;
}

std::string human_size(uint64_t bytes) {
  static const std::array<const char*, 5> units = {"B", "kB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1000.0 && unit + 1 < units.size()) {
    value /= 1000.0;
    ++unit;
  }
  char buf[32];
  if(unit == 0) {
    std::snprintf(buf, sizeof(buf), "%llu %s", static_cast<unsigned long long>(bytes), units[unit]);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
  }
  return buf;
}

std::string format_utc(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

bool parse_iso8601(const std::string& text, std::chrono::system_clock::time_point& out) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int consumed = 0;
  if(std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                 &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
    if(std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
      return false;
    }
  }
  if(month < 1 || month > 12 || day < 1 || day > 31) return false;

  std::size_t pos = static_cast<std::size_t>(consumed);
  if(pos < text.size() && text[pos] == '.') {
    ++pos;
    while(pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
  }
  long offset_seconds = 0;
  if(pos < text.size()) {
    char sign = text[pos];
    if(sign == 'Z' || sign == 'z') {
      ++pos;
    } else if(sign == '+' || sign == '-') {
      int oh = 0, om = 0;
      if(std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return false;
      offset_seconds = (oh * 3600L + om * 60L) * (sign == '+' ? 1 : -1);
      pos = text.size();
    } else {
      return false;
    }
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  std::time_t t = timegm(&tm);
  if(t == static_cast<std::time_t>(-1)) return false;
  out = std::chrono::system_clock::from_time_t(t - offset_seconds);
  return true;
}
