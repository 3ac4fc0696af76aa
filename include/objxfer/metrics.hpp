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

namespace objxfer {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. Engine components take a nullable pointer to the exporter.
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

    /// Serialize the registry now. Returns false if the file could not be written.
    bool write_file();

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& retries_total() { return *retries_total_; }
    prometheus::Counter& session_restarts_total() { return *session_restarts_total_; }
    prometheus::Counter& parts_uploaded() { return *parts_uploaded_; }
    prometheus::Counter& parts_resumed() { return *parts_resumed_; }
    prometheus::Counter& jobs_succeeded() { return *jobs_succeeded_; }
    prometheus::Counter& jobs_failed() { return *jobs_failed_; }
    prometheus::Counter& jobs_skipped() { return *jobs_skipped_; }

    // --- Gauge accessors ---
    prometheus::Gauge& jobs_in_flight() { return *jobs_in_flight_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }
    prometheus::Histogram& request_duration() { return *request_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* retries_total_;
    prometheus::Counter* session_restarts_total_;
    prometheus::Counter* parts_uploaded_;
    prometheus::Counter* parts_resumed_;
    prometheus::Counter* jobs_succeeded_;
    prometheus::Counter* jobs_failed_;
    prometheus::Counter* jobs_skipped_;

    // --- Gauges ---
    prometheus::Gauge* jobs_in_flight_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;
    prometheus::Histogram* request_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::mutex write_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace objxfer
