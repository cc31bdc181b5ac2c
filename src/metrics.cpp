#include "blobmirror/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace blobmirror {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    objects_listed_ = &prometheus::BuildCounter()
        .Name("blobmirror_objects_listed_total")
        .Help("Objects returned by the container listing")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& objects_family = prometheus::BuildCounter()
        .Name("blobmirror_objects_total")
        .Help("Objects processed, by outcome")
        .Labels(labels)
        .Register(*registry_);
    objects_downloaded_ = &objects_family.Add({{"result", "downloaded"}});
    objects_skipped_ = &objects_family.Add({{"result", "skipped"}});
    objects_exists_ = &objects_family.Add({{"result", "exists"}});
    objects_failed_ = &objects_family.Add({{"result", "failed"}});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("blobmirror_download_bytes_total")
        .Help("Total bytes written to the output tree")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    run_failed_ = &prometheus::BuildGauge()
        .Name("blobmirror_run_failed")
        .Help("1 if the run ended with a global failure")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    download_duration_ = &prometheus::BuildHistogram()
        .Name("blobmirror_download_duration_seconds")
        .Help("Per-object download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace blobmirror
