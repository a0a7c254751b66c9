#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>

/**
 * @brief System thread handles and iteration counters
 *
 * Scan workers are owned by the scanner for the duration of a scan; only
 * long-lived threads are held here.
 */
struct SystemThreads {
    std::thread logger_thread;    // Logging system thread

    std::atomic<unsigned long> logger_flushes{0};      // Batches written by the logging thread

    SystemThreads() = default;

    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
};

#endif // SYSTEM_THREADS_HPP
