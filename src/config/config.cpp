#include "config/config.hpp"
#include "logger/logger.hpp"
#include <cstdlib>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace config {

namespace {

std::optional<std::string> get_env(const char* key) {
  if (const char* value = std::getenv(key)) {
    return std::string(value);
  }
  return std::nullopt;
}

void check_log_level(const std::string& level) {
  try {
    logging::parse_severity(level);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
}

} // namespace


//==============================================
// LOADING
//==============================================

void Config::load_from_env() {
  if (auto value = get_env("CHUNKSTORE_ENDPOINT")) endpoint = *value;
  if (auto value = get_env("CHUNKSTORE_DATABASE")) database = *value;
  if (auto value = get_env("CHUNKSTORE_PREFIX")) collection_prefix = *value;
  if (auto value = get_env("CHUNKSTORE_CHUNK_SIZE")) chunk_size = parse_chunk_size(*value);
  if (auto value = get_env("CHUNKSTORE_LOG_FILE")) log_file = *value;
  if (auto value = get_env("CHUNKSTORE_LOG_LEVEL")) {
    check_log_level(*value);
    log_level = *value;
  }
}

void Config::apply_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-e", &endpoint},
    {"--endpoint", &endpoint},
    {"-d", &database},
    {"--database", &database},
    {"-p", &collection_prefix},
    {"--prefix", &collection_prefix},
    {"-l", &log_file},
    {"--log-file", &log_file},
    {"-v", &log_level},
    {"--log-level", &log_level}
  };

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);
    if (i + 1 >= argc) {
      throw ConfigError("missing value for " + flag);
    }
    const std::string value(argv[i + 1]);

    if (flag == "-c" || flag == "--chunk-size") {
      chunk_size = parse_chunk_size(value);
      continue;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      throw ConfigError("unknown argument " + flag);
    }
    if (it->second == &log_level) {
      check_log_level(value);
    }
    *it->second = value;
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: endpoint=" << endpoint << " database=" << database
                           << " prefix=" << collection_prefix << " chunk_size=" << chunk_size;
}


//==============================================
// CONVERSION
//==============================================

store::StoreOptions Config::store_options() const {
  store::StoreOptions options;
  options.collection_prefix = collection_prefix;
  options.chunk_size = chunk_size;
  return options;
}

std::size_t parse_chunk_size(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError("chunk size '" + value + "' is not a positive integer");
  }

  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::out_of_range&) {
    throw ConfigError("chunk size '" + value + "' is too large");
  }

  if (parsed == 0) {
    throw ConfigError("chunk size must be positive");
  }
  if (parsed > store::MAX_CHUNK_SIZE) {
    throw ConfigError("chunk size '" + value + "' exceeds " + std::to_string(store::MAX_CHUNK_SIZE));
  }
  return static_cast<std::size_t>(parsed);
}

std::string usage(const std::string& program_name) {
  std::stringstream ss;
  ss << "Usage: " << program_name << " [options]\n"
     << "Options (environment variable in brackets):\n"
     << "  -e, --endpoint    Backend: sqlite://<path> or memory:// [CHUNKSTORE_ENDPOINT]\n"
     << "  -d, --database    Namespace for collections [CHUNKSTORE_DATABASE]\n"
     << "  -p, --prefix      Collection name prefix [CHUNKSTORE_PREFIX]\n"
     << "  -c, --chunk-size  Chunk size in bytes for new objects [CHUNKSTORE_CHUNK_SIZE]\n"
     << "  -l, --log-file    Log file, console when empty [CHUNKSTORE_LOG_FILE]\n"
     << "  -v, --log-level   trace|debug|info|warning|error|fatal [CHUNKSTORE_LOG_LEVEL]\n"
     << "Example: " << program_name << " -e sqlite://objects.db -c 1048576\n";
  return ss.str();
}

} // namespace config
} // namespace chunkstore
