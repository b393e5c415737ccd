#include "platform.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

std::string default_shell() {
    const char* shell = std::getenv("SHELL");
    if (shell && *shell && access(shell, X_OK) == 0) return shell;
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_shell && *pw->pw_shell && access(pw->pw_shell, X_OK) == 0) {
        return pw->pw_shell;
    }
    return "/bin/sh";
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
