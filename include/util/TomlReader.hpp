#pragma once

#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace binview::util {

// Flat [section] / key = value reader. Enough TOML for a handful of color
// strings; no arrays, tables or escapes.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    bad_lines_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) {
        bad_lines_.push_back(lineno);
        continue;
      }
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (key.empty()) {
        bad_lines_.push_back(lineno);
        continue;
      }
      // Strip surrounding quotes from string values
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  bool save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : sec.entries)
        out << k << " = \"" << v << "\"\n";
    }
    return out.good();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  // 1-based line numbers that were neither comments, sections nor key = value.
  [[nodiscard]] const std::vector<int>& bad_lines() const { return bad_lines_; }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;
  std::vector<int> bad_lines_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace binview::util
