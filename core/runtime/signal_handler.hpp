#pragma once

#include <atomic>

namespace inventory {
namespace runtime {

// Turns SIGINT/SIGTERM into a polled shutdown flag
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Test hook
    static void reset() { shutdown_requested_.store(false); }

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace inventory
