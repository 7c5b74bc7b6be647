#pragma once

#include "flatpush/build_client.hpp"
#include "flatpush/constants.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace flatpush {

class ObjectStore;

struct PushOptions {
    std::string build_url;
    std::vector<std::string> branches;        // Empty: every app/, runtime/ and screenshots/ ref
    bool minimal_token = false;               // Upload with a short-lived upload-only token
    std::vector<std::string> ignore_deltas;   // Globs of app/runtime ids; "*" disables deltas
    std::vector<std::string> extra_ids;
    bool commit = false;
    bool publish = false;
    bool wait = false;
    bool wait_update = false;
    CommitOptions commit_options;
    uint64_t batch_limit = constants::UPLOAD_CHUNK_LIMIT;
};

// Counters of one push, for progress reporting
struct PushStats {
    size_t metadata_objects = 0;
    size_t missing_metadata = 0;
    size_t file_objects = 0;
    size_t missing_files = 0;
    size_t upload_requests = 0;
    size_t delta_parts = 0;
};

/// Pushes local refs to a build and optionally commits and publishes it.
///
/// Steps run strictly in sequence: metadata diff, file diff, file upload,
/// metadata upload, deltas, refs, extra ids, commit, publish, repo update.
/// Any failure aborts the remaining steps; a re-run only uploads what the
/// build still reports missing.
class PushPipeline {
public:
    PushPipeline(BuildClient& client, const ObjectStore& store);

    /// Resolve the refs to push once, up front. Unknown branches are a UsageError.
    std::map<std::string, std::string> snapshot_refs(const std::vector<std::string>& branches) const;

    /// Run the push. Returns the build document, extended with commit_job,
    /// publish_job and update_job when those ran.
    nlohmann::json run(const PushOptions& options);

    const PushStats& stats() const { return stats_; }

private:
    BuildClient upload_client(const PushOptions& options);

    BuildClient& client_;
    const ObjectStore& store_;
    PushStats stats_;
};

}  // namespace flatpush
