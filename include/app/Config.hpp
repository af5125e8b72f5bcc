#pragma once

#include <string>
#include "app/Options.hpp"

namespace tally::app {

// Environment variable helpers (TALLY_X or tally_x)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

// $TALLY_CONFIG, else $XDG_CONFIG_HOME/tally/config.toml, else
// $HOME/.config/tally/config.toml. Empty when none can be formed.
[[nodiscard]] std::string config_file_path();

// Overlays the [progress] table of the config file, then TALLY_* environment
// variables, onto the caller's defaults. Values are clamped to sane ranges.
[[nodiscard]] Options apply_config(Options base);

} // namespace tally::app
