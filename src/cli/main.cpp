// Numify Expression Compiler - Main Entry Point
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "cli/driver.hpp"
#include "error/errors.hpp"

#include <iostream>
#include <string>
#include <vector>

using numify::errors::RED;
using numify::errors::RESET;

// Main entry point for the numify command-line tool
int main(int argc, char* argv[]) {
  if (argc < 2 || std::string(argv[1]) == "help" || std::string(argv[1]) == "--help") {
    numify::cli::printUsage(argv[0], std::cout);
    return argc < 2 ? 1 : 0;
  }

  std::string command = argv[1];
  if (command != "eval" && command != "source") {
    std::cerr << RED << "Error:" << RESET << " Unknown command " << command << std::endl;
    numify::cli::printUsage(argv[0], std::cout);
    return 1;
  }

  try {
    numify::cli::Invocation inv =
        numify::cli::parseInvocation(std::vector<std::string>(argv + 2, argv + argc));
    numify::DiagnosticEngine diags;
    if (inv.debug) {
      diags.setReportLevel(numify::DiagnosticLevel::Debug);
    }
    return command == "eval" ? numify::cli::runEval(inv, diags, std::cout)
                             : numify::cli::runSource(inv, diags, std::cout);
  } catch (const numify::NumifyError& e) {
    std::cerr << e.display() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << RED << "Error:" << RESET << " " << e.what() << std::endl;
    return 1;
  }
}
