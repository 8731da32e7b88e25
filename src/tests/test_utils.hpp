#ifndef CHUNKSTORE_TEST_UTILS_HPP
#define CHUNKSTORE_TEST_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

// Set logging severity level and configure logging
inline void init_test_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::clog,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    // Chunk-level debug output is too noisy for multi-megabyte payloads
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::core::get()->set_logging_enabled(true);

    boost::log::add_common_attributes();
}

// Deterministic pseudo-random payload
inline std::vector<uint8_t> make_payload(std::size_t size, std::uint32_t seed = 42) {
    std::vector<uint8_t> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

// Unique path under the system temp directory
inline std::filesystem::path unique_temp_path(const std::string& prefix) {
    return std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
         "_" + std::to_string(std::random_device{}()));
}

#endif // CHUNKSTORE_TEST_UTILS_HPP
