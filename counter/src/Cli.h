#ifndef COUNTER_CLI_H
#define COUNTER_CLI_H

#include <istream>
#include <ostream>
#include <string_view>
#include <vector>

namespace wordcount {

constexpr int ExitSuccess = 0;
constexpr int ExitFailure = 1;
constexpr int ExitInvalidEncoding = 2;

/**
 * @brief Runs the wordcount command line.
 *
 * args excludes the program name. The input "-" is read from in, the report
 * and --help go to out, usage errors go to err. Diagnostics go through spdlog.
 *
 * @return ExitSuccess, ExitFailure for bad options and I/O errors, or
 * ExitInvalidEncoding when the input is not valid UTF-8
 */
int Run(const std::vector<std::string_view>& args, std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace wordcount

#endif
