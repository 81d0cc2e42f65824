#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "app/app.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    app::App application(std::move(args), std::cout);
    return application.run();
}
