#pragma once

#include <string>

namespace binview::ui {

// Complete SGR sequences for the four visual roles.
struct Palette {
  std::string cursor;
  std::string cell1;
  std::string cell2;
  std::string status;
};

struct Config {
  // SGR parameter strings as written in the config file, e.g. "0;40;37;1;7"
  struct Colors {
    std::string cursor{"0;40;37;1;7"};
    std::string cell1{"0;40;37"};
    std::string cell2{"0;40;37;1"};
    std::string status{"0;33;1"};
  } colors;
  std::string output{"stderr"};  // "stderr" or "stdout"
};

// Process-wide configuration, resolved once: TOML -> env -> compiled default.
const Config& config();

// Resolve a configuration from an explicit file (empty path = env/defaults only).
Config load_config(const std::string& path);

[[nodiscard]] Palette make_palette(const Config::Colors& c);
[[nodiscard]] const Palette& default_palette();

std::string config_file_path();
[[nodiscard]] bool write_default_config(const std::string& path, std::string& err);

// Environment variable helpers
const char* getenv_compat(const char* name);

} // namespace binview::ui
