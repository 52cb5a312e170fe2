#pragma once

#include <chrono>
#include <string>

// Writes one timestamped line to stdout. Safe to call from any thread.
void log_line(const std::string& msg);

// Same as log_line but to stderr, for fatal diagnostics.
void log_error(const std::string& msg);

/**
 * @brief Parses a duration such as "10m", "30s", "1h30m", "250ms" or "1.5s".
 * Units: h, m, s, ms, us (or \u00b5s), ns. Sub-millisecond parts are truncated.
 * A bare "0" is accepted. Throws std::invalid_argument on anything else.
 */
std::chrono::milliseconds parse_duration(const std::string& text);

std::string format_duration(std::chrono::milliseconds d);
