#include "core/site_builder.hpp"
#include "utils/errors.hpp"
#include "utils/file_watcher_listener.hpp"
#include "utils/log.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "Kiln - A static site build engine\n\n";
  std::cout << "Commands:\n";
  std::cout << "  kiln build [paths...]     Build the site (or only the given "
               "paths)\n";
  std::cout << "  kiln watch                Build, then rebuild on change\n";
  std::cout << "  kiln check                Collate and validate redirects\n";
  std::cout << "  kiln --help               Show this help\n\n";
  std::cout << "Options:\n";
  std::cout << "  --profile NAME            Build profile (default: debug)\n";
  std::cout << "  --force                   Ignore the incremental manifest\n";
  std::cout << "  --verbose                 Log every file\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  fs::path project_root = fs::current_path();

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  BuildFlags flags;
  std::vector<std::string> paths;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--profile" || arg == "-p") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return 1;
      }
      flags.profile = argv[++i];
    } else if (arg == "--release") {
      flags.profile = "release";
    } else if (arg == "--force" || arg == "-f") {
      flags.force = true;
    } else if (arg == "--verbose" || arg == "-v") {
      Log::set_verbose(true);
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      print_usage();
      return 1;
    } else {
      paths.push_back(arg);
    }
  }

  try {

    if (command == "build") {
      SiteBuilder builder(project_root, flags);
      builder.build(builder.scope_for(paths));
    } else if (command == "watch") {
      SiteBuilder builder(project_root, flags);
      watch_site(builder);
    } else if (command == "check") {
      SiteBuilder builder(project_root, flags);
      builder.check();
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }

  } catch (const MultiError &e) {
    for (const auto &error : e.errors()) {
      Log::error(error.what());
    }
    std::cerr << "Fatal error: " << e.errors().size()
              << " file(s) failed to build" << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
