#include "processUtils.hpp"
#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

void ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(_WIN32)
    std::wstring wname(name.begin(), name.end());
    // Best-effort: ignore failures on older Windows versions
    ::SetThreadDescription(::GetCurrentThread(), wname.c_str());
#elif defined(__APPLE__)
    // macOS supports setting name for current thread only
    pthread_setname_np(name.c_str());
#elif defined(__linux__)
    // Linux limits names to 16 chars including NUL; longer names are rejected with ERANGE
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
#else
    (void)name; // no-op on unsupported platforms
#endif
}
