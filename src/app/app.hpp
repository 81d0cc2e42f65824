#pragma once
// Purpose: Command-line driver. Loads configuration and layout records,
// builds the responsive grid and writes its serialized document.

#include <ostream>
#include <string>
#include <vector>

#include "config.hpp"

namespace app {

// Parse argv into overrides. Returns false (with a message in 'error') on an
// unknown flag or a bad value; 'help' is set when usage was requested.
bool parse_args(const std::vector<std::string>& args, config::Overrides& out, bool& help, std::string& error);

std::string usage();

class App {
public:
    // out receives the document when no output path is configured.
    App(std::vector<std::string> args, std::ostream& out);

    int run();

private:
    std::vector<std::string> args_;
    std::ostream& out_;
};

} // namespace app
