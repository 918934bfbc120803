#include "util.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <string>

namespace util {

std::int64_t unix_now_seconds() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string rfc1123_gmt(std::int64_t epoch_seconds) {
  std::time_t t = static_cast<std::time_t>(epoch_seconds);
  std::tm gm{};
#if defined(_WIN32)
  gmtime_s(&gm, &t);
#else
  gmtime_r(&t, &gm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&gm, "%a, %d %b %Y %H:%M:%S GMT");
  return oss.str();
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::optional<std::string> percent_decode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c == '%') {
      if (i + 2 >= in.size()) return std::nullopt;
      int hi = hex_value(in[i + 1]);
      int lo = hex_value(in[i + 2]);
      if (hi < 0 || lo < 0) return std::nullopt;
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

static bool is_unreserved(unsigned char c) {
  // RFC 3986 unreserved = ALPHA / DIGIT / "-" / "." / "_" / "~"
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

std::string percent_encode(std::string_view in, bool encode_slash) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if (!encode_slash && c == '/') {
      out.push_back('/');
      continue;
    }
    if (is_unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[(c >> 4) & 0xF]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

std::vector<std::pair<std::string, std::string>> parse_query(std::string_view query) {
  std::vector<std::pair<std::string, std::string>> out;
  if (query.empty()) return out;
  size_t start = 0;
  while (start <= query.size()) {
    size_t amp = query.find('&', start);
    if (amp == std::string_view::npos) amp = query.size();
    std::string_view part = query.substr(start, amp - start);
    if (!part.empty()) {
      size_t eq = part.find('=');
      std::string_view k = (eq == std::string_view::npos) ? part : part.substr(0, eq);
      std::string_view v = (eq == std::string_view::npos) ? std::string_view{} : part.substr(eq + 1);
      auto kd = percent_decode(k);
      auto vd = percent_decode(v);
      if (!kd) kd = std::string(k);
      if (!vd) vd = std::string(v);
      out.emplace_back(std::move(*kd), std::move(*vd));
    }
    if (amp == query.size()) break;
    start = amp + 1;
  }
  return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
  std::string out;
  bool first = true;
  for (const auto& kv : params) {
    if (!first) out.push_back('&');
    first = false;
    out += percent_encode(kv.first, true);
    out.push_back('=');
    out += percent_encode(kv.second, true);
  }
  return out;
}

std::string trim_ws(std::string_view s) {
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

std::string trim_and_collapse_ws(std::string_view s) {
  // Trim
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;

  std::string out;
  out.reserve(e - b);
  bool in_ws = false;
  for (size_t i = b; i < e; ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (std::isspace(c)) {
      if (!in_ws) {
        out.push_back(' ');
        in_ws = true;
      }
    } else {
      out.push_back(static_cast<char>(c));
      in_ws = false;
    }
  }
  return out;
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

static std::vector<std::uint8_t> digest_bin(const EVP_MD* md, std::string_view data) {
  std::vector<std::uint8_t> out;
  if (!md) return out;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) return out;

  if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    return out;
  }
  if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    return out;
  }

  unsigned int len = 0;
  int out_len = EVP_MD_size(md);
  if (out_len <= 0) {
    EVP_MD_CTX_free(ctx);
    return out;
  }
  out.resize(static_cast<size_t>(out_len));
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    out.clear();
    return out;
  }
  out.resize(static_cast<size_t>(len));
  EVP_MD_CTX_free(ctx);
  return out;
}

std::vector<std::uint8_t> sha256_bin(std::string_view data) {
  return digest_bin(EVP_sha256(), data);
}

std::string hex_lower(const std::vector<std::uint8_t>& bytes) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.resize(bytes.size() * 2);
  for (size_t i = 0; i < bytes.size(); ++i) {
    out[2 * i] = hex[(bytes[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[bytes[i] & 0xF];
  }
  return out;
}

std::string md5_hex(std::string_view data) {
  auto v = digest_bin(EVP_md5(), data);
  return hex_lower(v);
}

std::string base64_encode(std::string_view in) {
  // EVP_EncodeBlock expects output length >= 4*ceil(n/3) + 1
  const auto in_len = static_cast<int>(in.size());
  const int out_len = 4 * ((in_len + 2) / 3);
  std::string out;
  out.resize(out_len + 1);
  int wrote = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              reinterpret_cast<const unsigned char*>(in.data()), in_len);
  out.resize(wrote);
  return out;
}

std::optional<std::string> base64_decode(std::string_view in) {
  // EVP_DecodeBlock writes 3/4 of input length
  std::string out;
  out.resize((in.size() * 3) / 4 + 3);
  int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
  if (len < 0) return std::nullopt;

  // Remove padding influence
  size_t pad = 0;
  if (!in.empty() && in.back() == '=') pad++;
  if (in.size() >= 2 && in[in.size() - 2] == '=') pad++;

  out.resize(static_cast<size_t>(len) - pad);
  return out;
}

static const char kBase58Alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int base58_value(char c) {
  static const std::array<int, 256> table = [] {
    std::array<int, 256> t{};
    t.fill(-1);
    for (int i = 0; i < 58; ++i) {
      t[static_cast<unsigned char>(kBase58Alphabet[i])] = i;
    }
    return t;
  }();
  return table[static_cast<unsigned char>(c)];
}

std::string base58_encode(std::string_view in) {
  size_t zeros = 0;
  while (zeros < in.size() && in[zeros] == '\0') ++zeros;

  // log(256) / log(58) ~= 1.37
  std::vector<std::uint8_t> digits((in.size() - zeros) * 138 / 100 + 1, 0);
  size_t used = 0;
  for (size_t i = zeros; i < in.size(); ++i) {
    int carry = static_cast<unsigned char>(in[i]);
    size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
      carry += 256 * (*it);
      *it = static_cast<std::uint8_t>(carry % 58);
      carry /= 58;
    }
    used = j;
  }

  auto it = digits.begin();
  while (it != digits.end() && *it == 0) ++it;

  std::string out(zeros, '1');
  out.reserve(zeros + static_cast<size_t>(digits.end() - it));
  for (; it != digits.end(); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::optional<std::string> base58_decode(std::string_view in) {
  size_t ones = 0;
  while (ones < in.size() && in[ones] == '1') ++ones;

  // log(58) / log(256) ~= 0.733
  std::vector<std::uint8_t> bytes((in.size() - ones) * 733 / 1000 + 1, 0);
  size_t used = 0;
  for (size_t i = ones; i < in.size(); ++i) {
    int carry = base58_value(in[i]);
    if (carry < 0) return std::nullopt;
    size_t j = 0;
    for (auto it = bytes.rbegin(); (carry != 0 || j < used) && it != bytes.rend(); ++it, ++j) {
      carry += 58 * (*it);
      *it = static_cast<std::uint8_t>(carry % 256);
      carry /= 256;
    }
    used = j;
  }

  auto it = bytes.begin();
  while (it != bytes.end() && *it == 0) ++it;

  std::string out(ones, '\0');
  out.append(it, bytes.end());
  return out;
}

static std::string check_sum(std::string_view versioned) {
  auto first = sha256_bin(versioned);
  auto second = sha256_bin(std::string_view(reinterpret_cast<const char*>(first.data()), first.size()));
  if (second.size() < 4) return std::string();
  return std::string(reinterpret_cast<const char*>(second.data()), 4);
}

std::string base58_check_encode(std::string_view payload, std::uint8_t version) {
  std::string b;
  b.reserve(1 + payload.size() + 4);
  b.push_back(static_cast<char>(version));
  b.append(payload.data(), payload.size());
  b += check_sum(b);
  return base58_encode(b);
}

std::optional<CheckDecoded> base58_check_decode(std::string_view in) {
  auto decoded = base58_decode(in);
  if (!decoded || decoded->size() < 5) return std::nullopt;

  std::string_view d = *decoded;
  std::string_view body = d.substr(0, d.size() - 4);
  std::string_view sum = d.substr(d.size() - 4);
  const std::string expected = check_sum(body);
  if (expected.size() != 4 || sum != expected) return std::nullopt;

  CheckDecoded out;
  out.version = static_cast<std::uint8_t>(body[0]);
  out.payload = std::string(body.substr(1));
  return out;
}

std::string html_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '\"': out += "&#34;"; break;
      case '\'': out += "&#39;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

std::string format_size_base10(std::int64_t size) {
  if (size == 0) return "0 B";

  struct Unit {
    double scale;
    const char* name;
  };
  static const std::array<Unit, 6> units = {{
    {1e18, "EB"}, {1e15, "PB"}, {1e12, "TB"}, {1e9, "GB"}, {1e6, "MB"}, {1e3, "KB"},
  }};

  const double abs = static_cast<double>(size < 0 ? -size : size);
  for (const auto& u : units) {
    if (abs >= u.scale * 2 / 3) {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%.1f %s", static_cast<double>(size) / u.scale, u.name);
      return buf;
    }
  }
  return std::to_string(size) + " B";
}

std::string clean_path(std::string_view path) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= path.size()) {
    size_t slash = path.find('/', start);
    if (slash == std::string_view::npos) slash = path.size();
    std::string_view seg = path.substr(start, slash - start);
    if (seg == "..") {
      if (!parts.empty()) parts.pop_back();
    } else if (!seg.empty() && seg != ".") {
      parts.push_back(seg);
    }
    if (slash == path.size()) break;
    start = slash + 1;
  }

  std::string out;
  for (auto seg : parts) {
    out.push_back('/');
    out.append(seg.data(), seg.size());
  }
  if (out.empty()) out = "/";
  return out;
}

std::string content_type_for_key(std::string_view key) {
  size_t slash = key.rfind('/');
  std::string_view name = (slash == std::string_view::npos) ? key : key.substr(slash + 1);
  size_t dot = name.rfind('.');
  if (dot == std::string_view::npos) return "application/octet-stream";
  const std::string ext = to_lower(name.substr(dot + 1));

  if (ext == "html" || ext == "htm") return "text/html; charset=utf-8";
  if (ext == "css") return "text/css; charset=utf-8";
  if (ext == "js" || ext == "mjs") return "text/javascript; charset=utf-8";
  if (ext == "json") return "application/json";
  if (ext == "txt") return "text/plain; charset=utf-8";
  if (ext == "xml") return "text/xml; charset=utf-8";
  if (ext == "svg") return "image/svg+xml";
  if (ext == "png") return "image/png";
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "gif") return "image/gif";
  if (ext == "webp") return "image/webp";
  if (ext == "ico") return "image/x-icon";
  if (ext == "pdf") return "application/pdf";
  if (ext == "wasm") return "application/wasm";
  if (ext == "mp4") return "video/mp4";
  if (ext == "webm") return "video/webm";
  if (ext == "mp3") return "audio/mpeg";
  if (ext == "woff2") return "font/woff2";
  return "application/octet-stream";
}

} // namespace util
