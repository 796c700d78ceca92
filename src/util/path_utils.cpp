#include "rtcsv/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#if defined(RTCSV_USE_OPENSSL)
  #include <openssl/evp.h>
#endif

namespace rtcsv {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return (char)std::tolower(c); });
  if (ext == ".csv") return FileFormat::CSV;
  if (ext == ".tsv" || ext == ".tab") return FileFormat::TSV;
  if (ext == ".txt") return FileFormat::Text;
  return FileFormat::Unknown;
}

std::string default_delimiter(FileFormat f) {
  switch (f) {
    case FileFormat::TSV:  return "\t";
    case FileFormat::Text: return ";";
    case FileFormat::CSV:
    case FileFormat::Unknown: break;
  }
  return ",";
}

std::string hex_hash_prefix(std::string_view data, int len) {
#ifdef RTCSV_USE_OPENSSL
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) == 1) {
    std::ostringstream o;
    for (unsigned int i = 0; i < md_len && (int)(i * 2) < len; ++i)
      o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
    auto s = o.str();
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
#endif
  // Fallback (non-crypto)
  size_t h = std::hash<std::string_view>{}(data);
  std::ostringstream o; o << std::hex << h;
  auto s = o.str(); if ((int)s.size() > len) s.resize(len); return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\' || c==':') c='-';
    while (!s.empty() && (s.front()=='-' || s.front()=='.')) s.erase(s.begin());
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
