#include "cmdai/config.hpp"

#include <cctype>

#include "cmdai/command_extract.hpp"

namespace cmdai {

std::string backend_type_to_string(BackendType type) {
  switch (type) {
    case BackendType::Ollama:
      return "ollama";
  }
  return "ollama";
}

bool backend_type_from_string(const std::string& value, BackendType& out) {
  const std::string normalized = to_lower(trim(value));
  if (normalized == "ollama") {
    out = BackendType::Ollama;
    return true;
  }
  return false;
}

bool Config::operator==(const Config& other) const {
  return m_model == other.m_model && m_url == other.m_url && m_backendType == other.m_backendType &&
         m_promptPrefix == other.m_promptPrefix && m_autoRunPrompt == other.m_autoRunPrompt &&
         m_timeoutSeconds == other.m_timeoutSeconds && m_extra == other.m_extra;
}

bool is_valid_http_url(const std::string& url, std::string& error) {
  std::size_t schemeEnd = 0;
  if (url.rfind("http://", 0) == 0) {
    schemeEnd = 7;
  } else if (url.rfind("https://", 0) == 0) {
    schemeEnd = 8;
  } else {
    error = "url must start with http:// or https://";
    return false;
  }

  for (char c : url) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      error = "url must not contain whitespace";
      return false;
    }
  }

  const std::size_t authorityEnd = url.find_first_of("/?#", schemeEnd);
  const std::string authority = url.substr(schemeEnd, authorityEnd - schemeEnd);
  const std::size_t at = authority.rfind('@');
  const std::string hostPort = at == std::string::npos ? authority : authority.substr(at + 1);

  std::string host = hostPort;
  std::string port;
  if (!hostPort.empty() && hostPort[0] == '[') {
    const std::size_t close = hostPort.find(']');
    if (close == std::string::npos) {
      error = "url has an unterminated IPv6 host";
      return false;
    }
    host = hostPort.substr(0, close + 1);
    if (close + 1 < hostPort.size()) {
      if (hostPort[close + 1] != ':') {
        error = "url has garbage after the IPv6 host";
        return false;
      }
      port = hostPort.substr(close + 2);
    }
  } else if (const std::size_t colon = hostPort.rfind(':'); colon != std::string::npos) {
    host = hostPort.substr(0, colon);
    port = hostPort.substr(colon + 1);
    if (port.empty()) {
      error = "url has an empty port";
      return false;
    }
  }

  if (host.empty() || host == "[]") {
    error = "url has no host";
    return false;
  }
  for (char c : port) {
    if (c < '0' || c > '9') {
      error = "url port is not numeric: " + port;
      return false;
    }
  }
  if (!port.empty() && (port.size() > 5 || std::stoul(port) > 65535)) {
    error = "url port out of range: " + port;
    return false;
  }

  error.clear();
  return true;
}

bool is_valid_utf8(const std::string& value) {
  std::size_t i = 0;
  while (i < value.size()) {
    const auto lead = static_cast<unsigned char>(value[i]);
    std::size_t extra = 0;
    unsigned int codePoint = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      codePoint = lead & 0x07;
    } else {
      return false;
    }
    if (extra > value.size() - i - 1) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto next = static_cast<unsigned char>(value[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      codePoint = (codePoint << 6) | (next & 0x3F);
    }
    const unsigned int minimum = extra == 1 ? 0x80 : (extra == 2 ? 0x800 : 0x10000);
    if (codePoint < minimum || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::string resolve_endpoint_url(const std::string& url) {
  const std::size_t schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) {
    return url;
  }
  const std::size_t pathStart = url.find('/', schemeEnd + 3);
  if (pathStart == std::string::npos || url.find_first_of("?#", pathStart) != std::string::npos) {
    return url;
  }
  std::string path = url.substr(pathStart);
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  if (path != "/api") {
    return url;
  }
  return url.substr(0, pathStart) + path + "/chat";
}

bool parse_bool(const std::string& value, bool& out) {
  const std::string normalized = to_lower(trim(value));
  if (normalized == "true" || normalized == "yes" || normalized == "on" || normalized == "1" ||
      normalized == "enabled") {
    out = true;
    return true;
  }
  if (normalized == "false" || normalized == "no" || normalized == "off" || normalized == "0" ||
      normalized == "disabled") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace cmdai
