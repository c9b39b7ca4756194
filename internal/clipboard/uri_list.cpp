#include "uri_list.hpp"

#include <cctype>

namespace tierbridge::clipboard {

namespace {

constexpr std::string_view kFileScheme = "file://";
constexpr std::string_view kLocalhost  = "localhost";

bool Unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

} // namespace

std::string PercentEncodePath(std::string_view path) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(path.size());
  for (unsigned char c : path) {
    if (Unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      const int hi = HexValue(text[i + 1]);
      const int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string EncodeUriList(const std::vector<std::string>& paths) {
  std::string out;
  for (const auto& path : paths) {
    out.append(kFileScheme);
    out.append(PercentEncodePath(path));
    out.append("\r\n");
  }
  return out;
}

std::vector<std::string> DecodeUriList(std::string_view text) {
  std::vector<std::string> paths;

  size_t pos = 0;
  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    auto line = Trim(text.substr(pos, end - pos));
    pos       = end + 1;

    if (line.empty() || line.front() == '#') continue;

    if (line.substr(0, kFileScheme.size()) == kFileScheme) {
      auto rest = line.substr(kFileScheme.size());
      if (rest.substr(0, kLocalhost.size()) == kLocalhost) rest.remove_prefix(kLocalhost.size());
      if (rest.empty() || rest.front() != '/') continue; // remote host
      paths.push_back(PercentDecode(rest));
    } else if (line.front() == '/') {
      paths.emplace_back(line);
    }
  }
  return paths;
}

} // namespace tierbridge::clipboard
