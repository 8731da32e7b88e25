#ifndef CHUNKSTORE_CONFIG_HPP
#define CHUNKSTORE_CONFIG_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include "store/object_store.hpp"

namespace chunkstore {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config error: " + message) {}
};

struct Config {
  // Backend endpoint, see document::open_document_store
  std::string endpoint = "sqlite://chunkstore.db";
  // Namespace for the collections inside the backend
  std::string database = "chunkstore";
  std::string collection_prefix = "fs.";
  std::size_t chunk_size = store::DEFAULT_CHUNK_SIZE;
  // Empty logs to the console
  std::string log_file;
  std::string log_level = "info";

  // ---- LOADING ----
  // Overrides fields from CHUNKSTORE_* environment variables that are set
  void load_from_env();
  // Overrides fields from command line flags; argv[0] is skipped
  void apply_command_line(int argc, char* argv[]);


  // ---- CONVERSION ----
  store::StoreOptions store_options() const;
};

// Parses a positive byte count; throws ConfigError otherwise
std::size_t parse_chunk_size(const std::string& value);

// Usage text for the command line flags
std::string usage(const std::string& program_name);

} // namespace config
} // namespace chunkstore

#endif // CHUNKSTORE_CONFIG_HPP
