#include <bundler/bundle_cli.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() && arguments.front() == "flatten-icon") {
      return bundler::RunFlattenIcon(
          std::vector<std::string>(arguments.begin() + 1, arguments.end()));
    }

    return bundler::RunBuild(arguments, bundler::ProcessEnvironment(),
                             std::filesystem::current_path());
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
