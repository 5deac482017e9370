#include "GestureSegmenter.h"
#include "FeatureExtractor.h"

namespace BehaviorSentinel {

    void GestureSegmenter::onDown(const TouchSample& sample) {
        activePaths_[sample.pointerId] = {sample};
    }

    void GestureSegmenter::onMove(const TouchSample& sample) {
        auto it = activePaths_.find(sample.pointerId);
        if (it != activePaths_.end()) {
            it->second.push_back(sample);
        }
    }

    std::optional<GestureFeatures> GestureSegmenter::onUp(const TouchSample& sample) {
        auto it = activePaths_.find(sample.pointerId);
        if (it == activePaths_.end()) {
            return std::nullopt;
        }

        std::vector<TouchSample> path = std::move(it->second);
        activePaths_.erase(it);
        path.push_back(sample);

        if (path.size() < 2) {
            return std::nullopt;
        }
        return FeatureExtractor::extract(path);
    }

    void GestureSegmenter::clear() {
        activePaths_.clear();
    }

}
