#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "document/document.hpp"
#include "store/object_store.hpp"

namespace chunkstore {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(store::ObjectStore& store, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();
    // Executes one command line; returns false once the shell should stop
    bool execute(const std::string& line);


    // ---- ARGUMENT PARSING ----
    // Turns key=value pairs into a metadata mapping. Values parse as
    // integer, float, true/false, otherwise string.
    static document::Document parse_metadata(const std::vector<std::string>& pairs);

private:
    // ---- PARAMETERS ----
    store::ObjectStore& store_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void handle_put_command(const std::vector<std::string>& args);
    void handle_get_command(const std::vector<std::string>& args, bool concurrent);
    void handle_stat_command(const std::vector<std::string>& args);
    void handle_verify_command(const std::vector<std::string>& args);
    void handle_delete_command(const std::vector<std::string>& args);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace chunkstore
