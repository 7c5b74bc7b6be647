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
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace flatpush {

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

/// Exports flatpush metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename, so a long push (or a long job wait) is observable while it runs.
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
    prometheus::Counter& api_calls_success() { return *api_calls_success_; }
    prometheus::Counter& api_calls_failure() { return *api_calls_failure_; }
    prometheus::Counter& api_retries_total() { return *api_retries_total_; }
    prometheus::Counter& objects_uploaded(const std::string& kind);
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& upload_batches_total() { return *upload_batches_total_; }
    prometheus::Counter& missing_queries_total() { return *missing_queries_total_; }
    prometheus::Counter& job_polls_total() { return *job_polls_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& api_call_duration() { return *api_call_duration_; }
    prometheus::Histogram& upload_batch_duration() { return *upload_batch_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* api_calls_success_;
    prometheus::Counter* api_calls_failure_;
    prometheus::Counter* api_retries_total_;
    prometheus::Family<prometheus::Counter>* objects_uploaded_family_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* upload_batches_total_;
    prometheus::Counter* missing_queries_total_;
    prometheus::Counter* job_polls_total_;

    // --- Histograms ---
    prometheus::Histogram* api_call_duration_;
    prometheus::Histogram* upload_batch_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace flatpush
