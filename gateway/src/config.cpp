#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace msgate::gateway {

namespace {

std::string Trim(const std::string& input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  char* end_ptr = nullptr;
  const unsigned long value = std::strtoul(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || value > 0xFFFFFFFFul) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "on") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

struct IniState {
  std::string section;
  GatewayConfig* cfg{nullptr};
};

bool ApplyKV(IniState& state, const std::string& key,
             const std::string& value) {
  if (state.section == "storage") {
    if (key == "mount_point") {
      state.cfg->storage.mount_point = value;
    } else if (key == "key_path") {
      state.cfg->storage.key_path = value;
    } else if (key == "volume_dir") {
      state.cfg->storage.volume_dir = value;
    } else if (key == "mapping_name") {
      state.cfg->storage.mapping_name = value;
    } else if (key == "test_mode") {
      return ParseBool(value, state.cfg->storage.test_mode);
    }
    return true;
  }
  if (state.section == "gateway") {
    if (key == "history_limit") {
      return ParseUint32(value, state.cfg->gateway.history_limit);
    }
    if (key == "notify_seconds") {
      return ParseUint32(value, state.cfg->gateway.notify_seconds);
    }
    if (key == "contact_ext") {
      state.cfg->gateway.contact_ext = value;
    } else if (key == "debug_log") {
      return ParseBool(value, state.cfg->gateway.debug_log);
    }
    return true;
  }
  if (state.section == "listener") {
    if (key == "restart_initial_ms") {
      return ParseUint32(value, state.cfg->listener.restart_initial_ms);
    }
    if (key == "restart_max_ms") {
      return ParseUint32(value, state.cfg->listener.restart_max_ms);
    }
    return true;
  }
  if (state.section == "transport") {
    if (key == "spool_dir") {
      state.cfg->transport.spool_dir = value;
    } else if (key == "poll_interval_ms") {
      return ParseUint32(value, state.cfg->transport.poll_interval_ms);
    }
    return true;
  }
  return true;
}

bool ParseIni(const std::string& path, GatewayConfig& out, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "config file not found: " + path;
    return false;
  }

  IniState state;
  state.cfg = &out;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    const std::string trimmed = StripInlineComment(Trim(line));
    if (trimmed.empty()) {
      continue;
    }
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      state.section = trimmed.substr(1, trimmed.size() - 2);
      continue;
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos) {
      std::ostringstream oss;
      oss << "invalid line " << line_no;
      error = oss.str();
      return false;
    }
    std::string key = Trim(trimmed.substr(0, pos));
    std::string value = Trim(trimmed.substr(pos + 1));
    if (!ApplyKV(state, key, value)) {
      std::ostringstream oss;
      oss << "invalid value for " << key << " on line " << line_no;
      error = oss.str();
      return false;
    }
  }
  return true;
}

bool IsSafeName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find('/') == std::string::npos;
}

}  // namespace

bool LoadConfig(const std::string& path, GatewayConfig& out_config,
                std::string& error) {
  out_config = GatewayConfig{};
  if (!ParseIni(path, out_config, error)) {
    return false;
  }
  if (out_config.storage.mount_point.empty()) {
    error = "storage mount_point missing";
    return false;
  }
  if (out_config.storage.key_path.empty()) {
    error = "storage key_path missing";
    return false;
  }
  if (out_config.gateway.history_limit == 0) {
    error = "gateway history_limit must be positive";
    return false;
  }
  if (!IsSafeName(out_config.gateway.contact_ext)) {
    error = "gateway contact_ext invalid";
    return false;
  }
  if (out_config.listener.restart_initial_ms == 0 ||
      out_config.listener.restart_max_ms <
          out_config.listener.restart_initial_ms) {
    error = "listener restart backoff invalid";
    return false;
  }
  if (out_config.transport.poll_interval_ms == 0) {
    out_config.transport.poll_interval_ms = 500;
  }
  return true;
}

}  // namespace msgate::gateway
