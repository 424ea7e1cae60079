#include "progress_utils.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>

#include <R.h>
#include <R_ext/Print.h>

namespace connstat {

/**
 * @brief Prints elapsed wall-clock time with a message
 *
 * Durations of a minute or more are formatted "m:ss.xxx", shorter ones
 * "s.xxx". steady_clock is used so that the timing of parallel sections is
 * wall-clock time, not summed CPU time.
 *
 * @example
 * auto ptm = std::chrono::steady_clock::now();
 * // ...
 * elapsed_time(ptm, "Shuffled controls", true);  // "Shuffled controls (1:23.456)"
 */
void elapsed_time(std::chrono::time_point<std::chrono::steady_clock> start_time,
                  const char* message,
                  bool with_brackets) {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    double elapsed = duration.count() / 1000.0;
    int minutes = static_cast<int>(elapsed / 60);
    int seconds = static_cast<int>(std::fmod(elapsed, 60));
    int ms = static_cast<int>(std::fmod(elapsed * 1000, 1000));

    char time_str[32];
    if (minutes > 0) {
        std::snprintf(time_str, sizeof(time_str), "%d:%02d.%03d", minutes, seconds, ms);
    } else {
        std::snprintf(time_str, sizeof(time_str), "%d.%03d", seconds, ms);
    }

    if (with_brackets) {
        Rprintf("%s (%s)\n", message, time_str);
    } else {
        Rprintf("%s %s\n", message, time_str);
    }
}

void progress_tracker_t::step_done() {
    ++completed;
    if (completed % update_frequency != 0 && completed != total_steps) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - start_time).count();
    double progress = total_steps > 0 ? 100.0 * completed / total_steps : 100.0;
    double remaining = elapsed * static_cast<double>(total_steps - completed) / completed;

    Rprintf("\r%s: %zu/%zu (%.1f%%). Est. remaining: %ds",
            task_name, completed, total_steps, progress, static_cast<int>(remaining));
    R_FlushConsole();
}

void progress_tracker_t::finish() const {
    Rprintf("\n");
    elapsed_time(start_time, task_name, true);
    R_FlushConsole();
}

} // namespace connstat
