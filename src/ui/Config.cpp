#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace binview::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("BINVIEW_", 0) == 0) {
    alt = std::string("binview_") + n.substr(8);
  } else if (n.rfind("binview_", 0) == 0) {
    alt = std::string("BINVIEW_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/binview/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/binview/config.toml";
  return {};
}

// Digits and ';' only; anything else would corrupt the escape sequence.
static bool valid_sgr_params(const std::string& v) {
  if (v.empty()) return false;
  for (char c : v)
    if (!std::isdigit(static_cast<unsigned char>(c)) && c != ';') return false;
  return true;
}

// Resolve an SGR role from TOML -> env -> compiled default
static std::string resolve_sgr(const util::TomlReader& toml, bool have_toml,
                               const char* key, const char* env_name,
                               const std::string& def) {
  if (have_toml && toml.has("colors", key)) {
    std::string val = toml.get_string("colors", key);
    if (valid_sgr_params(val)) return val;
    std::fprintf(stderr, "binview: config: ignoring invalid colors.%s \"%s\"\n",
                 key, val.c_str());
  }
  if (const char* v = getenv_compat(env_name)) {
    if (valid_sgr_params(v)) return v;
    std::fprintf(stderr, "binview: config: ignoring invalid %s \"%s\"\n", env_name, v);
  }
  return def;
}

static std::string resolve_output(const util::TomlReader& toml, bool have_toml,
                                  const std::string& def) {
  std::string val;
  if (have_toml && toml.has("ui", "output")) val = toml.get_string("ui", "output");
  else if (const char* v = getenv_compat("BINVIEW_OUTPUT")) val = v;
  if (val.empty()) return def;
  if (val == "stderr" || val == "stdout") return val;
  std::fprintf(stderr, "binview: config: unknown output \"%s\", using %s\n",
               val.c_str(), def.c_str());
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  const Config defaults{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) {
    for (int ln : toml.bad_lines())
      std::fprintf(stderr, "binview: config: %s:%d: expected key = value\n", path.c_str(), ln);
  }

  // --- [colors] ---
  c.colors.cursor = resolve_sgr(toml, have_toml, "cursor", "BINVIEW_CURSOR_SGR", defaults.colors.cursor);
  c.colors.cell1  = resolve_sgr(toml, have_toml, "cell1",  "BINVIEW_CELL1_SGR",  defaults.colors.cell1);
  c.colors.cell2  = resolve_sgr(toml, have_toml, "cell2",  "BINVIEW_CELL2_SGR",  defaults.colors.cell2);
  c.colors.status = resolve_sgr(toml, have_toml, "status", "BINVIEW_STATUS_SGR", defaults.colors.status);

  // --- [ui] ---
  c.output = resolve_output(toml, have_toml, defaults.output);
  return c;
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

Palette make_palette(const Config::Colors& c) {
  return Palette{sgr(c.cursor), sgr(c.cell1), sgr(c.cell2), sgr(c.status)};
}

const Palette& default_palette() {
  static const Palette p = make_palette(Config::Colors{});
  return p;
}

bool write_default_config(const std::string& path, std::string& err) {
  if (path.empty()) {
    err = "cannot determine config path (HOME unset)";
    return false;
  }
  std::error_code ec;
  auto dir = std::filesystem::path(path).parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  if (ec) {
    err = dir.string() + ": " + ec.message();
    return false;
  }
  const Config defaults{};
  util::TomlReader toml;
  toml.set("colors", "cursor", defaults.colors.cursor);
  toml.set("colors", "cell1", defaults.colors.cell1);
  toml.set("colors", "cell2", defaults.colors.cell2);
  toml.set("colors", "status", defaults.colors.status);
  toml.set("ui", "output", defaults.output);
  if (!toml.save(path)) {
    err = path + ": cannot write";
    return false;
  }
  return true;
}

} // namespace binview::ui
