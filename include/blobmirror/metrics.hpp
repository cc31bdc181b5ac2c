#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobmirror {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports mirror run metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically serializes the registry to the
/// .prom file using atomic temp+rename, so long runs can be watched while
/// they progress.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    // --- Counter accessors ---
    prometheus::Counter& objects_listed() { return *objects_listed_; }
    prometheus::Counter& objects_downloaded() { return *objects_downloaded_; }
    prometheus::Counter& objects_skipped() { return *objects_skipped_; }
    prometheus::Counter& objects_exists() { return *objects_exists_; }
    prometheus::Counter& objects_failed() { return *objects_failed_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }

    // --- Gauge / histogram accessors ---
    prometheus::Gauge& run_failed() { return *run_failed_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* objects_listed_;
    prometheus::Counter* objects_downloaded_;
    prometheus::Counter* objects_skipped_;
    prometheus::Counter* objects_exists_;
    prometheus::Counter* objects_failed_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Gauge* run_failed_;
    prometheus::Histogram* download_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace blobmirror
