#include <ansiviz/cli.h>
#include <ansiviz/cli_exit_codes.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: ansiviz <command> [options]\n\n"
      << "Commands:\n"
      << "  generate  Render a Mermaid diagram of an Ansible repository "
         "(default if no command is given).\n\n"
      << "Run 'ansiviz generate --help' for generation options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return ansiviz::kExitSuccess;
    }

    std::string command = "generate";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }

    if (command == "generate") {
      const std::vector<std::string> generate_arguments(
          arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
          arguments.end());
      return ansiviz::RunGenerate(generate_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::invalid_argument &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return ansiviz::kExitFailure;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return ansiviz::ExitCodeForError(ex);
  }
}
