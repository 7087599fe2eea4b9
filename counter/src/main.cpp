#include "Cli.h"

#include <iostream>
#include <string_view>
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("wordcount"));

    std::vector<std::string_view> args(argv + 1, argv + argc);
    return wordcount::Run(args, std::cin, std::cout, std::cerr);
}
