#include "Clock.h"
#include <chrono>

namespace BehaviorSentinel {

    int64_t systemNowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    Clock systemClock() {
        return [] { return systemNowMs(); };
    }

}
