#pragma once

#include <string>
#include <ctime>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Render a UTC epoch timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SSZ).
std::string format_utc_iso(std::time_t t);

} // namespace platform
