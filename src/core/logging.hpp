#pragma once

#include <string>

/// Route the default spdlog logger to stderr at the given level
/// ("trace", "debug", "info", "warn", "error"). Unknown levels fall back to info.
void init_logging(const std::string& level);
