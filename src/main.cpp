#include "cli/cli.hpp"
#include "config/config.hpp"
#include "document/document_store.hpp"
#include "logger/logger.hpp"
#include "store/object_store.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <boost/log/trivial.hpp>

namespace {

bool load_config(int argc, char* argv[], chunkstore::config::Config& config) {
  try {
    config.load_from_env();
    config.apply_command_line(argc, argv);
  } catch (const chunkstore::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    std::cerr << chunkstore::config::usage(argv[0]);
    return false;
  }
  return true;
}

void setup_logging(const chunkstore::config::Config& config) {
  const auto level = chunkstore::logging::parse_severity(config.log_level);
  if (config.log_file.empty()) {
    chunkstore::logging::init_console_logging(level);
  } else {
    chunkstore::logging::init_logging(config.log_file, level);
  }
}

bool run_shell(const chunkstore::config::Config& config) {
  try {
    auto backend = chunkstore::document::open_document_store(config.endpoint, config.database);
    chunkstore::store::ObjectStore store(backend, config.store_options());
    chunkstore::cli::CLI cli(store);

    cli.run();
    store.close();
    return true;
  } catch (const chunkstore::store::StoreError& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "Error: Failed to open object store: " << e.what() << '\n';
    return false;
  } catch (const chunkstore::document::DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "Error: Failed to open backend " << config.endpoint << ": " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  chunkstore::config::Config config;
  if (!load_config(argc, argv, config)) {
    return 1;
  }

  try {
    setup_logging(config);
    return run_shell(config) ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << '\n';
    return 2;
  }
}
