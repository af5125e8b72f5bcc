#include "app/Config.hpp"
#include "model/NodeTypes.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace tally::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  // The alias flips the case of the whole name, not just the prefix.
  if (n.rfind("TALLY_", 0) == 0) {
    alt = n;
    for (auto& c : alt) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  } else if (n.rfind("tally_", 0) == 0) {
    alt = n;
    for (auto& c : alt) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::logic_error&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("TALLY_CONFIG"); p && *p)
    return std::string(p);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/tally/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/tally/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* key, const char* env_name, int def) {
  if (have_toml && toml.has("progress", key))
    return toml.get_int("progress", key, def);
  return getenv_int(env_name, def);
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* key, const char* env_name, bool def) {
  if (have_toml && toml.has("progress", key))
    return toml.get_bool("progress", key, def);
  return env_flag(env_name, def);
}

Options apply_config(Options base) {
  util::TomlReader toml;
  auto path = config_file_path();
  bool have_toml = !path.empty() && toml.load(path);

  using std::chrono::milliseconds;
  auto as_ms = [](std::chrono::nanoseconds ns) {
    return static_cast<int>(std::chrono::duration_cast<milliseconds>(ns).count());
  };

  int refresh = resolve_int(toml, have_toml, "refresh_ms", "TALLY_REFRESH_MS", as_ms(base.refresh_rate));
  int delay = resolve_int(toml, have_toml, "initial_delay_ms", "TALLY_INITIAL_DELAY_MS", as_ms(base.initial_delay));
  int capacity = resolve_int(toml, have_toml, "node_capacity", "TALLY_NODE_CAPACITY",
                             static_cast<int>(std::min(base.node_capacity, model::kMaxCapacity)));

  base.refresh_rate = milliseconds(std::clamp(refresh, 10, 10000));
  base.initial_delay = milliseconds(std::clamp(delay, 0, 60000));
  base.node_capacity = static_cast<size_t>(std::clamp(capacity, 1, static_cast<int>(model::kMaxCapacity)));
  base.disable = resolve_bool(toml, have_toml, "disable", "TALLY_DISABLE", base.disable);
  return base;
}

} // namespace tally::app
