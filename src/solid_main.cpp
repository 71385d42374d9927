#include <solid/cli_exit_codes.h>
#include <solid/solid_lint.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: solid-lint <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze   Check a declaration listing (default if no command is "
         "given).\n"
      << "  rules     List the available rules.\n\n"
      << "Run 'solid-lint analyze --help' for analysis options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return solid::kCleanExitCode;
    }

    std::string command = "analyze";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() &&
        (arguments.front() == "analyze" || arguments.front() == "rules")) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "rules") {
      return solid::RunRules(command_arguments);
    }
    return solid::RunAnalyze(command_arguments);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return solid::kErrorExitCode;
  }
}
