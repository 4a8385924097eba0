#include "config/config.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace todo::config {

auto Config::default_path() -> std::string {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (fs::path(xdg) / "todo" / "config.toml").string();
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / ".config" / "todo" / "config.toml").string();
    }
    return "config.toml";
}

auto Config::load(const std::string& path) -> Result<Config, std::string> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        TODO_LOG_DEBUG("config", "No config at " << path << ", using defaults");
        return Config{};
    }

    std::ifstream file(path);
    if (!file) {
        return "Cannot open config file: " + path;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    ConfigParser parser(buffer.str());
    auto config = parser.parse();
    if (!config) {
        return path + ": " + parser.get_error();
    }

    TODO_LOG_DEBUG("config", "Loaded " << path << " (" << config->todo_state.size()
                                       << " state aliases, " << config->handlers.size()
                                       << " handlers)");
    return std::move(*config);
}

auto to_json(const Config& config) -> json::JsonValue {
    auto string_map = [](const std::map<std::string, std::string>& entries) {
        auto obj = json::json_object();
        for (const auto& [key, value] : entries) {
            obj.set(key, json::json_string(value));
        }
        return obj;
    };

    auto root = json::json_object();
    root.set("bullet_point",
             config.bullet_point ? json::json_string(*config.bullet_point) : json::json_null());
    root.set("todo_state", string_map(config.todo_state));
    root.set("handlers", string_map(config.handlers));

    if (config.todo_state_ops) {
        auto ops = json::json_object();
        ops.set("default", json::json_string(config.todo_state_ops->default_state));
        ops.set("brackets", json::json_bool(config.todo_state_ops->brackets));
        root.set("todo_state_ops", std::move(ops));
    } else {
        root.set("todo_state_ops", json::json_null());
    }
    return root;
}

} // namespace todo::config
