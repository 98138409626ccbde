// src/io/fs_util.cpp

#include "hmb/io/fs_util.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iterator>

namespace hmb {
namespace io {

namespace fs = std::filesystem;

bool EnsureDirExists(const fs::path& dir, Error* err) {
  if (dir.empty()) return true;
  std::error_code ec;
  if (fs::is_directory(dir, ec)) return true;
  if (fs::exists(dir, ec)) {
    SetErr(err, ErrorKind::Store, dir.string() + " exists and is not a directory");
    return false;
  }
  if (!fs::create_directories(dir, ec) && ec) {
    SetErr(err, ErrorKind::Store, "mkdir " + dir.string() + ": " + ec.message());
    return false;
  }
  return true;
}

bool ReadFileToString(const fs::path& p, std::string* out, Error* err) {
  std::ifstream in(p, std::ios::binary);
  if (!in) {
    SetErr(err, ErrorKind::Store, "cannot read " + p.string());
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    SetErr(err, ErrorKind::Store, "read error on " + p.string());
    return false;
  }
  return true;
}

std::optional<std::string> ReadFileIfPresent(const fs::path& p) {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) return std::nullopt;
  std::string text;
  if (!ReadFileToString(p, &text)) return std::nullopt;
  return text;
}

bool WriteStringToFile(const fs::path& p, std::string_view data, Error* err) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) {
    SetErr(err, ErrorKind::Store, "cannot write " + p.string());
    return false;
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out) {
    SetErr(err, ErrorKind::Store, "write error on " + p.string());
    return false;
  }
  return true;
}

bool ReplaceFileAtomic(const fs::path& p, std::string_view data, Error* err) {
  fs::path tmp = p;
  tmp += ".tmp";
  if (!WriteStringToFile(tmp, data, err)) return false;
  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) {
    const std::string why = ec.message();
    fs::remove(tmp, ec);
    SetErr(err, ErrorKind::Store, "cannot replace " + p.string() + ": " + why);
    return false;
  }
  return true;
}

std::string SanitizeName(std::string_view s) {
  if (s.empty()) return "_";
  std::string out(s);
  for (char& c : out) {
    const unsigned char u = static_cast<unsigned char>(c);
    if (!(std::isalnum(u) && u < 0x80) && c != '.' && c != '_' && c != '-') c = '_';
  }
  return out;
}

std::string NowIso8601Utc() {
  const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf, n);
}

}  // namespace io
}  // namespace hmb
