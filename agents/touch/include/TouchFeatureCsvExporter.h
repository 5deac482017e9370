#pragma once

#include "Result.h"
#include "TouchAgent.h"
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace BehaviorSentinel {

    /**
     * @brief Appends gesture feature vectors to <dir>/<prefix>_touch_features_<YYYYMMDD_HHMMSS>.csv
     *
     * The header row is written before the first vector. Register with
     * TouchAgent::addFeatureListener(exporter->listener()); the exporter must
     * outlive the registration.
     */
    class TouchFeatureCsvExporter {
    public:
        static Result<std::unique_ptr<TouchFeatureCsvExporter>> create(const std::string& directory,
                                                                       const std::string& prefix);
        ~TouchFeatureCsvExporter();

        TouchFeatureCsvExporter(const TouchFeatureCsvExporter&) = delete;
        TouchFeatureCsvExporter& operator=(const TouchFeatureCsvExporter&) = delete;

        void onGestureFeatures(const GestureFeatures& features);
        TouchAgent::FeatureListener listener();

        const std::string& path() const { return path_; }
        size_t rowsWritten() const;

    private:
        TouchFeatureCsvExporter(std::string path, std::ofstream out);

        mutable std::mutex mutex_;
        std::string path_;
        std::ofstream out_;
        bool headerWritten_{false};
        size_t rows_{0};
    };

}
