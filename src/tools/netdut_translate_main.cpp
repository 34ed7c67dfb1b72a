#include "netdut/Errors.hpp"
#include "netdut/Logger.hpp"
#include "netdut/SessionConfig.hpp"
#include "netdut/translate/Translator.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace netdut;

void print_usage() {
  std::cout << "Usage: netdut-translate <dialect> [options] [--] "
               "[commands...|-]\n\n";
  std::cout << "Rewrites canonical (EOS) command lines for <dialect> and "
               "prints one per line.\n";
  std::cout << "With '-' the commands are read from stdin.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config <file>      Session config (YAML) with extra rules\n";
  std::cout << "  --response <file>    Normalize the keys of a JSON reply "
               "instead\n";
  std::cout << "  --log-level <level>  Log level (default: warn)\n";
  std::cout << "  --log-file <file>    Also write the log to <file>\n";
  std::cout << "\nExamples:\n";
  std::cout << "  netdut-translate mos 'interface Ethernet10' "
               "'l1 source interface Ethernet12'\n";
  std::cout << "  netdut-translate mos --response show_version.json\n";
}

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string dialect = argv[1];
  if (dialect == "-h" || dialect == "--help") {
    print_usage();
    return 0;
  }

  std::string config_path;
  std::string response_path;
  std::string log_level = "warn";
  std::string log_file;
  std::vector<std::string> commands;
  bool read_stdin = false;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--response" && i + 1 < argc) {
      response_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--log-file" && i + 1 < argc) {
      log_file = argv[++i];
    } else if (arg == "--") {
      for (++i; i < argc; ++i) {
        commands.push_back(argv[i]);
      }
    } else if (arg == "-") {
      read_stdin = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Error: Unknown or incomplete option: " << arg << "\n";
      print_usage();
      return 1;
    } else {
      commands.push_back(arg);
    }
  }

  try {
    SessionConfig config;
    if (!config_path.empty()) {
      config = SessionConfig::from_file(config_path);
    }
    config.dialect = dialect;
    config.log_level = log_level;
    config.log_file = log_file;
    init_logging(config);

    auto translator = build_translator(config);

    if (!response_path.empty()) {
      std::ifstream in(response_path);
      if (!in) {
        std::cerr << "Error: Cannot open response file: " << response_path
                  << "\n";
        return 1;
      }
      auto reply = nlohmann::json::parse(in);
      std::cout << translator->translate_response(dialect, reply).dump(2)
                << "\n";
      return 0;
    }

    if (read_stdin) {
      std::string block((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());
      auto lines = split_commands(block);
      commands.insert(commands.end(), lines.begin(), lines.end());
    }

    if (commands.empty()) {
      std::cerr << "Error: No commands given\n";
      return 1;
    }

    for (const auto &line : translator->translate_commands(dialect, commands)) {
      std::cout << line << "\n";
    }
    return 0;
  } catch (const ConfigurationError &ex) {
    std::cerr << "Configuration error: " << ex.what() << "\n";
    return 2;
  } catch (const nlohmann::json::parse_error &ex) {
    std::cerr << "Invalid JSON in " << response_path << ": " << ex.what()
              << "\n";
    return 2;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
