// progress_utils.hpp
#ifndef CONNSTAT_PROGRESS_UTILS_HPP
#define CONNSTAT_PROGRESS_UTILS_HPP

#include <chrono>
#include <cstddef>

namespace connstat {

/**
 * @brief Prints "message mm:ss.xxx" (or "message (mm:ss.xxx)") to the R console
 */
void elapsed_time(std::chrono::time_point<std::chrono::steady_clock> start_time,
                  const char* message,
                  bool with_brackets = false);

/**
 * @struct progress_tracker_t
 * @brief Console progress line for loops over independent work items
 *
 * Not thread-safe; call step_done() from inside an omp critical section when
 * the loop is parallel.
 */
struct progress_tracker_t {
    std::chrono::steady_clock::time_point start_time;
    size_t total_steps;
    size_t completed;
    size_t update_frequency;  // print every update_frequency completed steps
    const char* task_name;

    progress_tracker_t(size_t total, const char* name, size_t freq = 10)
        : start_time(std::chrono::steady_clock::now()),
          total_steps(total),
          completed(0),
          update_frequency(freq > 0 ? freq : 1),
          task_name(name) {}

    /// Marks one more step as done and prints if due.
    void step_done();

    void finish() const;
};

} // namespace connstat

#endif // CONNSTAT_PROGRESS_UTILS_HPP
