#pragma once

#include <functional>

namespace verifetch {
namespace download {

// Time source and sleep used by retry backoff and throttling; tests swap in
// a fake so no real time passes.
struct Clock {
    std::function<double()> now;
    std::function<void(double seconds)> sleep;

    static Clock system();
};

}}
