#include "verifetch/download/clock.hpp"
#include <chrono>
#include <thread>

namespace verifetch {
namespace download {

Clock Clock::system() {
    Clock clock;
    clock.now = [] {
        auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    };
    clock.sleep = [](double seconds) {
        if (seconds > 0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
        }
    };
    return clock;
}

}}
