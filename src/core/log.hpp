#pragma once

#include <string>

// Debug log file. Defaults to <tmp>/sshlink_debug.log.
std::string sshlink_log_path();
void set_log_path(const std::string& path);

// Append a timestamped line to the debug log. Thread-safe; never throws.
void sshlink_log(const std::string& msg);
