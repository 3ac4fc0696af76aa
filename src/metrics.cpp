#include "objxfer/metrics.hpp"
#include "objxfer/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace objxfer {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("objxfer_uploads_total")
        .Help("Object uploads finished")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("objxfer_upload_bytes_total")
        .Help("Bytes acknowledged by the server")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& downloads_family = prometheus::BuildCounter()
        .Name("objxfer_downloads_total")
        .Help("Object downloads finished")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("objxfer_download_bytes_total")
        .Help("Bytes received from the server")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    retries_total_ = &prometheus::BuildCounter()
        .Name("objxfer_retries_total")
        .Help("Requests retried after a transient failure")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    session_restarts_total_ = &prometheus::BuildCounter()
        .Name("objxfer_session_restarts_total")
        .Help("Resumable sessions restarted after expiry")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& parts_family = prometheus::BuildCounter()
        .Name("objxfer_multipart_parts_total")
        .Help("Multipart upload parts")
        .Labels(labels)
        .Register(*registry_);
    parts_uploaded_ = &parts_family.Add({{"result", "uploaded"}});
    parts_resumed_ = &parts_family.Add({{"result", "resumed"}});

    auto& jobs_family = prometheus::BuildCounter()
        .Name("objxfer_batch_jobs_total")
        .Help("Parallel batch jobs by final status")
        .Labels(labels)
        .Register(*registry_);
    jobs_succeeded_ = &jobs_family.Add({{"result", "succeeded"}});
    jobs_failed_ = &jobs_family.Add({{"result", "failed"}});
    jobs_skipped_ = &jobs_family.Add({{"result", "skipped"}});

    // --- Gauges ---

    jobs_in_flight_ = &prometheus::BuildGauge()
        .Name("objxfer_jobs_in_flight")
        .Help("Batch jobs currently running")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("objxfer_upload_duration_seconds")
        .Help("Whole-object upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});

    download_duration_ = &prometheus::BuildHistogram()
        .Name("objxfer_download_duration_seconds")
        .Help("Whole-object download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});

    request_duration_ = &prometheus::BuildHistogram()
        .Name("objxfer_request_duration_seconds")
        .Help("Single HTTP request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});
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

bool MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot publish metrics file %s: %s",
                 prom_file_path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace objxfer
