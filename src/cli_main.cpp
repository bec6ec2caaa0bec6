#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "ovini/Errors.hpp"
#include "ovini/Loader.hpp"
#include "ovini/Util.hpp"

using namespace ovini;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("ovini", "Load grouped settings with overrides and print them");
        options.positional_help("FILE [GROUP [SETTING]]");

        options.add_options()
            ("o,override", "Enable an override (repeatable, or comma-separated)",
                cxxopts::value<std::vector<std::string>>())
            ("v,verbose", "Print diagnostics to stderr")
            ("h,help", "Show help");

        // File + lookup captured as positional strings
        options.add_options()
            ("args", "FILE [GROUP [SETTING]]", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"args"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("args")) {
            std::cout << options.help({""}) << "\n";
            return result.count("help") ? 0 : 1;
        }

        auto args = result["args"].as<std::vector<std::string>>();
        if (args.size() > 3) {
            std::cerr << "Error: too many arguments\n";
            return 1;
        }
        const bool verbose = result.count("verbose") > 0;

        std::vector<std::string> names;
        if (result.count("override")) {
            names = result["override"].as<std::vector<std::string>>();
        }
        OverrideSet enabled = make_override_set(names);

        if (verbose) {
            std::cerr << "Loading " << args[0] << " with overrides: ["
                      << join(std::vector<std::string>(enabled.begin(), enabled.end()), ',')
                      << "]\n";
        }

        Config cfg = load_config_with(args[0], enabled);

        if (verbose) {
            std::cerr << "Loaded " << cfg.size() << " group(s): "
                      << join(cfg.group_names(), ',') << "\n";
        }

        // Whole tree
        if (args.size() == 1) {
            std::cout << to_display_string(cfg.data()) << "\n";
            return 0;
        }

        // GROUP or GROUP SETTING
        Entry entry = cfg[args[1]];
        if (args.size() == 3) {
            entry = entry[args[2]];
        }
        if (!entry) {
            std::cerr << "Key not found: " << entry.path() << "\n";
            return 1;
        }
        std::cout << to_display_string(entry.value()) << "\n";
        return 0;

    } catch (const ParseError& pe) {
        std::cerr << "Error: " << pe.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
