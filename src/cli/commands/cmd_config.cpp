#include "cmd_config.hpp"

#include <iostream>

namespace todo::cli {

int run_config(const CliOptions& options) {
    auto config = load_config(options);
    if (!config) {
        return 1;
    }

    std::string path =
        options.config_path.empty() ? config::Config::default_path() : options.config_path;

    auto json = config::to_json(*config);
    json.set("path", json::json_string(path));
    std::cout << json.to_string_pretty() << "\n";
    return 0;
}

} // namespace todo::cli
