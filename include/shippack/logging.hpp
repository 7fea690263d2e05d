#pragma once

#include <mutex>

namespace shippack {

// Global mutex to keep stderr logs from concurrent optimizations readable (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

// Progress logging is enabled per options struct with `log_every` (0 = silent).
inline bool should_log(int log_every, int step) {
    return log_every > 0 && (step % log_every) == 0;
}

}  // namespace shippack
