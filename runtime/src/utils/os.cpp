#include <exgroup/utils/os.h>

#if defined(_WIN32)
#include <Windows.h>
#include <io.h>
#include <process.h>
#elif defined(__APPLE__) && defined(__MACH__)
#include <pthread.h>
#include <unistd.h>
#else
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>

namespace exgroup::os {

#if defined(_WIN32)

int pid() {
    static const auto v = _getpid();
    return v;
}

int tid() {
    static thread_local const auto v = GetCurrentThreadId();
    return static_cast<int>(v);
}

bool is_color_terminal() noexcept { return true; }

bool in_terminal(FILE* file) { return _isatty(_fileno(file)) != 0; }

bool open_virtual_terminal() {
    const HANDLE handle = GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }

    DWORD mode = 0;
    if (!GetConsoleMode(handle, &mode)) {
        return false;
    }

    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
}

#else

int pid() {
    static const auto v = ::getpid();
    return v;
}

int tid() {
#if defined(__APPLE__) && defined(__MACH__)
    static thread_local const auto v = [] {
        uint64_t id = 0;
        pthread_threadid_np(nullptr, &id);
        return static_cast<int>(id);
    }();
#else
    static thread_local const auto v = static_cast<int>(::syscall(SYS_gettid));
#endif
    return v;
}

// Determine if the terminal supports colors
// Based on: https://github.com/agauniyal/rang/
bool is_color_terminal() noexcept {
    static const bool result = []() {
        if (std::getenv("COLORTERM") != nullptr) {
            return true;
        }

        static constexpr std::array<const char*, 16> terms = {{"ansi", "color", "console", "cygwin", "gnome", "konsole",
                                                               "kterm", "linux", "msys", "putty", "rxvt", "screen", "vt100",
                                                               "xterm", "alacritty", "vt102"}};
        const char* env_term_p = std::getenv("TERM");
        if (env_term_p == nullptr) {
            return false;
        }

        return std::any_of(terms.begin(), terms.end(),
                           [&](const char* term) { return std::strstr(env_term_p, term) != nullptr; });
    }();

    return result;
}

bool in_terminal(FILE* file) { return ::isatty(fileno(file)) != 0; }

#endif

std::string type_name(const std::type_info& type) {
#if defined(__GNUC__) || defined(__clang__)
    int status = 0;
    char* demangled = abi::__cxa_demangle(type.name(), nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        std::string result(demangled);
        std::free(demangled);  // NOLINT(cppcoreguidelines-no-malloc)
        return result;
    }
    std::free(demangled);  // NOLINT(cppcoreguidelines-no-malloc)
#endif
    // msvc 的 name() 已是可读形式，如 "class foo"
    return type.name();
}

}  // namespace exgroup::os
