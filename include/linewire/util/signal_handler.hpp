#ifndef LINEWIRE_UTIL_SIGNAL_HANDLER_HPP
#define LINEWIRE_UTIL_SIGNAL_HANDLER_HPP

#include <atomic>

namespace linewire::util {

class SignalHandler {
public:
    // routes SIGINT and SIGTERM to request_shutdown()
    static void install();
    static bool should_shutdown();
    static void wait_for_shutdown();
    static void request_shutdown();
    static void reset();

private:
    static std::atomic<bool> shutdown_requested_;
};

} //namespace linewire::util

#endif
