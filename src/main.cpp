#include <iostream>
#include <vector>
#include <string>
#include "cli/kuberun_cli.hpp"
#include "cli/arg_parser.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    kuberun run "
              << theme::color::RESET << "<pipeline> [args...] [options]"
              << theme::color::DIM
              << "   Execute a workflow in a Kubernetes cluster" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    kuberun log"
              << theme::color::RESET << theme::color::DIM
              << "                                  List previous runs" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    kuberun config init"
              << theme::color::RESET << theme::color::DIM
              << "                          Write ~/.kuberun/config.yaml" << theme::color::RESET << "\n";
    std::cout << theme::section("Run options");
    std::cout << run_options_help();
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Use '-' as pipeline to read the script from standard input.\n"
              << "    kuberun --version        Show version\n"
              << "    kuberun --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        KuberunCLI cli;
        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::BLUE << theme::color::BOLD << "kuberun"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << KUBERUN_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        } else if (cmd == "run") {
            std::vector<std::string> args(argv + 2, argv + argc);
            std::string command_line;
            for (int i = 0; i < argc; i++) {
                if (i) command_line += ' ';
                command_line += argv[i];
            }
            return cli.run_launch(args, command_line);
        } else if (cmd == "log") {
            return cli.run_log();
        } else if (cmd == "config") {
            if (argc < 3 || std::string(argv[2]) != "init") {
                std::cout << theme::fail("Unknown config command.");
                std::cout << theme::step("Usage: kuberun config init");
                return 1;
            }
            return cli.run_config_init();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
