#pragma once

#include "TouchTypes.h"
#include <map>
#include <optional>
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief Groups DOWN..MOVE..UP samples per pointer into completed gestures
     *
     * A new DOWN for a pointer restarts its path. MOVE and UP without an open
     * path are ignored. The raw path is discarded once its features are taken.
     * Not thread-safe; TouchAgent serializes access.
     */
    class GestureSegmenter {
    public:
        void onDown(const TouchSample& sample);
        void onMove(const TouchSample& sample);

        /**
         * @brief Close the pointer's path
         * @return Features when the path has at least two samples
         */
        std::optional<GestureFeatures> onUp(const TouchSample& sample);

        void clear();
        size_t activePointers() const { return activePaths_.size(); }

    private:
        std::map<int, std::vector<TouchSample>> activePaths_;
    };

}
