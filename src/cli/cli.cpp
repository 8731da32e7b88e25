#include "cli/cli.hpp"
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace cli {

namespace {

document::Document parse_scalar(const std::string& text) {
  if (text == "true") return true;
  if (text == "false") return false;
  if (text.empty()) return text;

  // Whole-string numeric parses only, "12abc" stays a string
  char* end = nullptr;
  errno = 0;
  const long long integer = std::strtoll(text.c_str(), &end, 10);
  if (*end == '\0' && errno == 0) {
    return static_cast<std::int64_t>(integer);
  }

  errno = 0;
  const double real = std::strtod(text.c_str(), &end);
  if (*end == '\0' && errno == 0 && std::isfinite(real)) {
    return real;
  }
  return text;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::ObjectStore& store, std::istream& input, std::ostream& output)
  : store_(store)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "chunkstore> " << std::flush;

  while (std::getline(input_, line)) {
    if (!execute(line)) {
      break;
    }
    output_ << "chunkstore> " << std::flush;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> args{std::istream_iterator<std::string>(iss), std::istream_iterator<std::string>()};
  if (args.empty()) {
    return true;
  }

  const std::string command = args.front();
  args.erase(args.begin());
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "quit") {
    return false;
  }
  else if (command == "put") {
    handle_put_command(args);
  }
  else if (command == "get") {
    handle_get_command(args, false);
  }
  else if (command == "fastget") {
    handle_get_command(args, true);
  }
  else if (command == "stat") {
    handle_stat_command(args);
  }
  else if (command == "verify") {
    handle_verify_command(args);
  }
  else if (command == "delete") {
    handle_delete_command(args);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}


//==============================================
// ARGUMENT PARSING
//==============================================

document::Document CLI::parse_metadata(const std::vector<std::string>& pairs) {
  document::Document metadata = document::Document::object();
  for (const auto& pair : pairs) {
    const auto equals = pair.find('=');
    if (equals == std::string::npos || equals == 0) {
      throw std::invalid_argument("metadata '" + pair + "' is not key=value");
    }
    metadata[pair.substr(0, equals)] = parse_scalar(pair.substr(equals + 1));
  }
  return metadata;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_put_command(const std::vector<std::string>& args) {
  if (args.empty()) {
    output_ << "Usage: put <file> [key=value ...]" << std::endl;
    return;
  }

  std::ifstream file(args[0], std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << args[0] << std::endl;
    return;
  }

  try {
    std::vector<uint8_t> data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    auto metadata = parse_metadata(std::vector<std::string>(args.begin() + 1, args.end()));
    const std::string id = store_.put(data, metadata);
    output_ << id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::vector<std::string>& args, bool concurrent) {
  if (args.size() != 2) {
    output_ << "Usage: " << (concurrent ? "fastget" : "get") << " <id> <file>" << std::endl;
    return;
  }

  try {
    const auto object = concurrent ? store_.fast_get(args[0]) : store_.get(args[0]);

    std::ofstream file(args[1], std::ios::binary | std::ios::trunc);
    if (!file) {
      output_ << "Error opening file: " << args[1] << std::endl;
      return;
    }
    file.write(reinterpret_cast<const char*>(object.data.data()),
               static_cast<std::streamsize>(object.data.size()));
    if (!file) {
      output_ << "Error writing file: " << args[1] << std::endl;
      return;
    }

    output_ << "Wrote " << object.data.size() << " bytes to " << args[1] << std::endl;
    output_ << "metadata: " << object.metadata.dump() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error retrieving object", e.what());
  }
}

void CLI::handle_stat_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    output_ << "Usage: stat <id>" << std::endl;
    return;
  }

  try {
    const auto manifest = store_.stat(args[0]);
    const std::time_t created = std::chrono::system_clock::to_time_t(manifest.created_at);
    const std::time_t issued = static_cast<std::time_t>(manifest.id.timestamp());

    output_ << "id:         " << manifest.id.to_hex() << '\n'
            << "issued:     " << std::put_time(std::gmtime(&issued), "%Y-%m-%d %H:%M:%S UTC") << '\n'
            << "length:     " << manifest.length << '\n'
            << "chunk size: " << manifest.chunk_size << '\n'
            << "created:    " << std::put_time(std::gmtime(&created), "%Y-%m-%d %H:%M:%S UTC") << '\n'
            << "md5:        " << manifest.checksum << '\n'
            << "metadata:   " << manifest.metadata.dump() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading object", e.what());
  }
}

void CLI::handle_verify_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    output_ << "Usage: verify <id>" << std::endl;
    return;
  }

  try {
    output_ << (store_.verify(args[0]) ? "Checksum OK" : "Checksum MISMATCH") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error verifying object", e.what());
  }
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    output_ << "Usage: delete <id>" << std::endl;
    return;
  }

  try {
    store_.remove(args[0]);
    output_ << "Object deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting object", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                        Display this help message" << std::endl;
  output_ << "  put <file> [key=value ...]  Store <file> with optional metadata" << std::endl;
  output_ << "  get <id> <file>             Write object <id> to <file>" << std::endl;
  output_ << "  fastget <id> <file>         Same as get, fetching chunks concurrently" << std::endl;
  output_ << "  stat <id>                   Show the manifest of object <id>" << std::endl;
  output_ << "  verify <id>                 Check object <id> against its MD5" << std::endl;
  output_ << "  delete <id>                 Delete object <id>" << std::endl;
  output_ << "  quit                        Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace chunkstore
