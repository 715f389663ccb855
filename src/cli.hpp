#pragma once
#include "config.hpp"
#include <argparse/argparse.hpp>

namespace fenrom {

/**
 * @brief Registers every command line option on the parser
 *
 * Short "-v" belongs to the parser's --version, so verbose output is "-V".
 */
void addArguments(argparse::ArgumentParser& program);

// Reads a parsed command line. Throws std::invalid_argument on an unknown enum value.
Config buildConfig(const argparse::ArgumentParser& program);

} // namespace fenrom
