#include "gitmark/platform.hpp"

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace gitmark::platform {

bool stdout_is_tty() {
#ifdef _WIN32
    return ::_isatty(_fileno(stdout)) != 0;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

bool supports_color(ColorPolicy policy) {
    switch (policy) {
    case ColorPolicy::Always:
        return true;
    case ColorPolicy::Never:
        return false;
    case ColorPolicy::Auto:
        break;
    }
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    return stdout_is_tty();
}

void enable_virtual_terminal_processing() {
#ifdef _WIN32
    HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return;
    }
    DWORD mode = 0;
    if (!::GetConsoleMode(handle, &mode)) {
        return;
    }
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    ::SetConsoleMode(handle, mode);
#endif
}

} // namespace gitmark::platform
