#include "flatpush/metrics.hpp"
#include "flatpush/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace flatpush {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& api_calls_family = prometheus::BuildCounter()
        .Name("flatpush_api_calls_total")
        .Help("Total build service API calls")
        .Labels(labels)
        .Register(*registry_);
    api_calls_success_ = &api_calls_family.Add({{"result", "success"}});
    api_calls_failure_ = &api_calls_family.Add({{"result", "failure"}});

    api_retries_total_ = &prometheus::BuildCounter()
        .Name("flatpush_api_retries_total")
        .Help("Total API calls retried after a transient failure")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    objects_uploaded_family_ = &prometheus::BuildCounter()
        .Name("flatpush_objects_uploaded_total")
        .Help("Total objects uploaded, by object kind")
        .Labels(labels)
        .Register(*registry_);

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("flatpush_upload_bytes_total")
        .Help("Total bytes uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    upload_batches_total_ = &prometheus::BuildCounter()
        .Name("flatpush_upload_batches_total")
        .Help("Total upload requests sent")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    missing_queries_total_ = &prometheus::BuildCounter()
        .Name("flatpush_missing_queries_total")
        .Help("Total missing_objects requests")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    job_polls_total_ = &prometheus::BuildCounter()
        .Name("flatpush_job_polls_total")
        .Help("Total job status polls")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    api_call_duration_ = &prometheus::BuildHistogram()
        .Name("flatpush_api_call_duration_seconds")
        .Help("API call duration in seconds, including retries")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});

    upload_batch_duration_ = &prometheus::BuildHistogram()
        .Name("flatpush_upload_batch_duration_seconds")
        .Help("Upload batch duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

prometheus::Counter& MetricsExporter::objects_uploaded(const std::string& kind) {
    // Family::Add returns the existing series for known labels
    return objects_uploaded_family_->Add({{"kind", kind}});
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
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename metrics file to %s: %s",
                 prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace flatpush
