// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// Hoist - Resumable multipart uploads to S3-compatible storage

#include <exception>
#include <iostream>

#include "commands.hpp"

/**
 * Main entry point for hoist
 */
int main(int argc, char* argv[]) {
  hoist::cli::Commands commands;

  try {
    return commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (...) {
    std::cerr << "Error: Unknown exception occurred" << std::endl;
    return 1;
  }
}
