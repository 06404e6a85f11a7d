/**
 * @file builddeck_main.cpp
 * @brief BuildDeck command-line launcher - Main Entry Point
 *
 * Usage:
 *   builddeck build --engine /opt/UE5 --project ~/Shooter/Shooter.uproject
 *   builddeck package --engine /opt/UE5 --project Shooter.uproject --platform Linux
 *   builddeck build ... --dry-run   # Print the command line only
 */

#include "BuildDeck/editor/cli_launcher.hpp"
#include <QCoreApplication>
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("builddeck");

  try {
    BuildDeck::editor::CliLauncher launcher;
    return launcher.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return BuildDeck::editor::CliLauncher::EXIT_FAILED;
  }
}
