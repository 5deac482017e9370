#pragma once

#include <cstdint>
#include <functional>

namespace BehaviorSentinel {

    /// Source of wall-clock time in epoch milliseconds
    using Clock = std::function<int64_t()>;

    int64_t systemNowMs();

    /// Clock backed by std::chrono::system_clock
    Clock systemClock();

}
