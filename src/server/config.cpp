#include <textscrub/server/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace textscrub::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>         Listen port (default: 8080)\n"
            << "  --threads <n>             Worker threads (default: auto)\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --max-text-bytes <n>      Largest accepted text (default: 1048576)\n"
            << "  --max-cells <n>           Diff alignment budget, 0 = unlimited\n"
            << "  --on-limit <policy>       Over budget: reject, lines or omit (default: lines)\n"
            << "  --keyboard-only           Also drop non-keyboard characters except emoji\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --port 8080\n"
            << "  " << argv0 << " --config /etc/textscrub/server.yaml\n"
            << "  " << argv0 << " --max-cells 1000000 --on-limit reject\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

uint16_t ParsePort(const std::string& value) {
  const uint64_t port = ParseUnsigned(value, "port");
  if (port > 65535) {
    throw std::runtime_error("Invalid port number: " + value);
  }
  return static_cast<uint16_t>(port);
}

// Comma separated, each entry trimmed, empty entries skipped
std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= value.size()) {
    size_t comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    std::string item = Trim(value.substr(start, comma - start));
    if (!item.empty()) items.push_back(std::move(item));
    start = comma + 1;
  }
  return items;
}

void SetPolicy(const std::string& value, LimitPolicy* policy) {
  if (!ParseLimitPolicy(value, policy)) {
    throw std::runtime_error("Invalid on_limit: " + value +
                             " (must be reject, lines, or omit)");
  }
}

}  // namespace

uint64_t ParseUnsigned(const std::string& value, const std::string& what) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid " + what + ": '" + value + "' (expected a number)");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Invalid " + what + ": '" + value + "' (out of range)");
  }
}

const char* LimitPolicyName(LimitPolicy policy) {
  switch (policy) {
    case LimitPolicy::kReject: return "reject";
    case LimitPolicy::kLines: return "lines";
    case LimitPolicy::kOmit: return "omit";
  }
  return "unknown";
}

bool ParseLimitPolicy(const std::string& text, LimitPolicy* policy) {
  if (text == "reject") {
    *policy = LimitPolicy::kReject;
  } else if (text == "lines") {
    *policy = LimitPolicy::kLines;
  } else if (text == "omit") {
    *policy = LimitPolicy::kOmit;
  } else {
    return false;
  }
  return true;
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        config.server.port = ParsePort(value);
      } else if (key == "threads") {
        config.server.threads = static_cast<uint32_t>(ParseUnsigned(value, "threads"));
      } else if (key == "log_level") {
        config.server.log_level = value;
      } else if (key == "cors_allow_origin") {
        config.server.cors_allow_origin = value;
      }
    } else if (current_section == "limits") {
      if (key == "max_text_bytes") {
        config.limits.max_text_bytes = ParseUnsigned(value, "max_text_bytes");
      }
    } else if (current_section == "diff") {
      if (key == "max_alignment_cells") {
        config.diff.max_alignment_cells = ParseUnsigned(value, "max_alignment_cells");
      } else if (key == "on_limit") {
        SetPolicy(value, &config.diff.on_limit);
      }
    } else if (current_section == "normalizer") {
      if (key == "keyboard_only") {
        config.normalizer.keyboard_only = ParseBool(value);
      } else if (key == "strip_markdown") {
        config.normalizer.strip_markdown = ParseBool(value);
      } else if (key == "remove_codepoints") {
        config.normalizer.remove_codepoints = SplitList(value);
      }
    } else if (current_section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseBool(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The config file is the base layer, so find it before applying flags
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config = LoadFromFile(argv[i + 1]);
      break;
    }
  }

  auto next = [&](int* i, const char* message) -> std::string {
    if (++*i >= argc) {
      throw std::runtime_error(message);
    }
    return argv[*i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      ++i;  // Already loaded
    } else if (arg == "--host") {
      config.server.host = next(&i, "--host requires an address argument");
    } else if (arg == "--port" || arg == "-p") {
      config.server.port = ParsePort(next(&i, "--port requires a port number"));
    } else if (arg == "--threads") {
      config.server.threads =
          static_cast<uint32_t>(ParseUnsigned(next(&i, "--threads requires a number"), "threads"));
    } else if (arg == "--log-level") {
      config.server.log_level = next(&i, "--log-level requires a level");
    } else if (arg == "--max-text-bytes") {
      config.limits.max_text_bytes =
          ParseUnsigned(next(&i, "--max-text-bytes requires a number"), "max_text_bytes");
    } else if (arg == "--max-cells") {
      config.diff.max_alignment_cells =
          ParseUnsigned(next(&i, "--max-cells requires a number"), "max_alignment_cells");
    } else if (arg == "--on-limit") {
      SetPolicy(next(&i, "--on-limit requires a policy"), &config.diff.on_limit);
    } else if (arg == "--keyboard-only") {
      config.normalizer.keyboard_only = true;
    } else if (arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  // Validate log level
  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (server.cors_allow_origin.empty()) {
    throw std::runtime_error("server.cors_allow_origin must not be empty");
  }

  if (limits.max_text_bytes == 0) {
    throw std::runtime_error("limits.max_text_bytes must be greater than 0");
  }
  if (limits.max_text_bytes > LimitsConfig::kMaxTextBytesLimit) {
    throw std::runtime_error("limits.max_text_bytes must be at most " +
                             std::to_string(LimitsConfig::kMaxTextBytesLimit) + ": " +
                             std::to_string(limits.max_text_bytes));
  }

  if (metrics.enabled) {
    if (metrics.path.empty() || metrics.path[0] != '/') {
      throw std::runtime_error("metrics.path must start with '/': " + metrics.path);
    }
    if (metrics.path == "/" || metrics.path == "/health" || metrics.path == "/api/v1/clean") {
      throw std::runtime_error("metrics.path collides with an API route: " + metrics.path);
    }
  }

  // Surfaces bad remove_codepoints entries
  BuildRuleSet();
}

RuleSet Config::BuildRuleSet() const {
  try {
    return MakeRuleSet(normalizer);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("Invalid normalizer section: ") + e.what());
  }
}

}  // namespace textscrub::server
