#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Returns the login shell for the current user ($SHELL, then passwd, then /bin/sh).
std::string default_shell();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
