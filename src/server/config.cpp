#include <bookland/server/config.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace bookland::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>         Listen port (default: 8080)\n"
            << "  --threads <n>             Worker threads (default: auto)\n"
            << "  --catalog-path <path>     UPC catalog database (optional)\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --port 8080\n"
            << "  " << argv0 << " --catalog-path /data/bookland/catalog\n"
            << "  " << argv0 << " --config /etc/bookland/server.yaml\n";
}

std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string Unquote(const std::string& value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

// std::stoul accepts trailing junk and negative numbers; reject both.
uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid value for " + key + ": '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Value out of range for " + key + ": " + value);
  }
}

uint16_t ParsePort(const std::string& value) {
  uint64_t port = ParseUnsigned("port", value);
  if (port == 0 || port > 65535) {
    throw std::runtime_error("Invalid port number: " + value);
  }
  return static_cast<uint16_t>(port);
}

const char* RequireValue(int argc, char** argv, int* i, const char* what) {
  if (++*i >= argc) {
    throw std::runtime_error(std::string(argv[*i - 1]) + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

// Format:
//   key: value
//   section:
//     key: value
Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') continue;

    size_t colon = line.find(':');
    if (colon == std::string::npos) continue;

    std::string key = Trim(line.substr(0, colon));
    std::string value = Unquote(Trim(line.substr(colon + 1)));

    // A key with no value opens a section
    if (value.empty()) {
      section = key;
      continue;
    }

    if (section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        config.server.port = ParsePort(value);
      } else if (key == "threads") {
        config.server.threads = static_cast<uint32_t>(ParseUnsigned(key, value));
      } else if (key == "log_level") {
        config.server.log_level = value;
      }
    } else if (section == "catalog") {
      if (key == "path") {
        config.catalog.path = value;
      } else if (key == "block_cache_bytes") {
        config.catalog.options.block_cache_bytes = ParseUnsigned(key, value);
      } else if (key == "bloom_bits_per_key") {
        config.catalog.options.bloom_bits_per_key =
            static_cast<int>(ParseUnsigned(key, value));
      }
    } else if (section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseBool(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    } else if (section.empty() && key == "catalog_path") {
      config.catalog.path = value;
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  std::string config_file;

  // Flags are collected first so a config file can be applied underneath them
  std::optional<std::string> host;
  std::optional<uint16_t> port;
  std::optional<uint32_t> threads;
  std::optional<std::string> catalog_path;
  std::optional<std::string> log_level;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      config_file = RequireValue(argc, argv, &i, "a path argument");
    } else if (arg == "--host") {
      host = RequireValue(argc, argv, &i, "an address argument");
    } else if (arg == "--port" || arg == "-p") {
      port = ParsePort(RequireValue(argc, argv, &i, "a port number"));
    } else if (arg == "--threads") {
      threads = static_cast<uint32_t>(
          ParseUnsigned("threads", RequireValue(argc, argv, &i, "a number")));
    } else if (arg == "--catalog-path") {
      catalog_path = RequireValue(argc, argv, &i, "a path");
    } else if (arg == "--log-level") {
      log_level = RequireValue(argc, argv, &i, "a level");
    } else {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  Config config = config_file.empty() ? Config{} : LoadFromFile(config_file);

  if (host) config.server.host = *host;
  if (port) config.server.port = *port;
  if (threads) config.server.threads = *threads;
  if (catalog_path) config.catalog.path = *catalog_path;
  if (log_level) config.server.log_level = *log_level;

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: 0");
  }

  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/': " + metrics.path);
  }

  if (!catalog.path.empty() && catalog.options.block_cache_bytes == 0) {
    throw std::runtime_error("catalog.block_cache_bytes must be positive");
  }
}

}  // namespace bookland::server
