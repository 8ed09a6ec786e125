#include <iostream>
#include <vector>
#include <string>
#include "cli/droidlink_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::GREEN_BRAND << "    droidlink"
              << theme::color::RESET << theme::color::DIM
              << "                  Connect and enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::GREEN_BRAND << "    droidlink connect"
              << theme::color::RESET << theme::color::DIM
              << "          Connect and enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::GREEN_BRAND << "    droidlink watch"
              << theme::color::RESET << theme::color::DIM
              << "            Poll and print state changes" << theme::color::RESET << "\n";
    std::cout << theme::color::GREEN_BRAND << "    droidlink status"
              << theme::color::RESET << theme::color::DIM
              << "           Connect, poll once and print" << theme::color::RESET << "\n";
    std::cout << theme::color::GREEN_BRAND << "    droidlink init"
              << theme::color::RESET << theme::color::DIM
              << "             Write a default config" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    droidlink --config " << theme::color::RESET << theme::color::SLATE << "<path>"
              << theme::color::RESET << theme::color::DIM << "   Use another config file\n"
              << "    droidlink --version        Show version\n"
              << "    droidlink --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        fs::path config_path = Config::get_config_path();
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--config") {
                if (i + 1 >= args.size()) {
                    std::cout << theme::fail("--config needs a path.");
                    return 1;
                }
                config_path = args[i + 1];
                args.erase(args.begin() + i, args.begin() + i + 2);
                break;
            }
        }

        std::string cmd = args.empty() ? "connect" : args[0];

        if (cmd == "--version") {
            std::cout << theme::color::GREEN_BRAND << theme::color::BOLD << "droidlink"
                      << theme::color::RESET << theme::color::DIM
                      << " version " DROIDLINK_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        DroidlinkCLI cli(config_path);

        if (cmd == "connect") {
            cli.run_connected_repl();
        } else if (cmd == "watch") {
            return cli.run_watch();
        } else if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "init") {
            return cli.run_init();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
