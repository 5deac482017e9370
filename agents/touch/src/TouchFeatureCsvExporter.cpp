#include "TouchFeatureCsvExporter.h"
#include "Logger.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace BehaviorSentinel {

    namespace {

        std::string fileStamp() {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            struct tm tmBuf;
            localtime_r(&now, &tmBuf);
            std::ostringstream ss;
            ss << std::put_time(&tmBuf, "%Y%m%d_%H%M%S");
            return ss.str();
        }

    }

    Result<std::unique_ptr<TouchFeatureCsvExporter>> TouchFeatureCsvExporter::create(const std::string& directory,
                                                                                     const std::string& prefix) {
        using ExporterPtr = std::unique_ptr<TouchFeatureCsvExporter>;

        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            return Err<ExporterPtr>(ErrorCode::FileWriteError,
                                    "cannot create export directory " + directory + ": " + ec.message());
        }

        auto path = (std::filesystem::path(directory) / (prefix + "_touch_features_" + fileStamp() + ".csv")).string();
        std::ofstream out(path, std::ios::app);
        if (!out.is_open()) {
            return Err<ExporterPtr>(ErrorCode::FileWriteError, "cannot open " + path);
        }
        return ExporterPtr(new TouchFeatureCsvExporter(path, std::move(out)));
    }

    TouchFeatureCsvExporter::TouchFeatureCsvExporter(std::string path, std::ofstream out)
        : path_(std::move(path)), out_(std::move(out)) {
    }

    TouchFeatureCsvExporter::~TouchFeatureCsvExporter() {
        out_.close();
        Logger::instance().info("Feature CSV exported to: " + path_ + " (" + std::to_string(rows_) + " rows)",
                                "TouchFeatureCsvExporter");
    }

    void TouchFeatureCsvExporter::onGestureFeatures(const GestureFeatures& features) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!headerWritten_) {
            out_ << GestureFeatures::csvHeader() << '\n';
            headerWritten_ = true;
        }
        out_ << features.toCsvRow() << '\n';
        out_.flush();
        if (!out_) {
            Logger::instance().error("error writing CSV row to " + path_, "TouchFeatureCsvExporter");
            out_.clear();
            return;
        }
        ++rows_;
    }

    TouchAgent::FeatureListener TouchFeatureCsvExporter::listener() {
        return [this](const GestureFeatures& features) { onGestureFeatures(features); };
    }

    size_t TouchFeatureCsvExporter::rowsWritten() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_;
    }

}
