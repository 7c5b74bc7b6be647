#include "flatpush/push.hpp"
#include "flatpush/delta_uploader.hpp"
#include "flatpush/errors.hpp"
#include "flatpush/log.hpp"
#include "flatpush/reachability.hpp"
#include "flatpush/storage/object_store.hpp"
#include "flatpush/upload_scheduler.hpp"

#include <algorithm>

namespace flatpush {

namespace {

const std::vector<std::string> DEFAULT_REF_PREFIXES = {"app/", "runtime/", "screenshots/"};

std::string join(const std::map<std::string, std::string>& refs) {
    std::string out;
    for (const auto& [ref, commit] : refs) {
        if (!out.empty()) out += ", ";
        out += ref;
    }
    return out;
}

}  // namespace

PushPipeline::PushPipeline(BuildClient& client, const ObjectStore& store)
    : client_(client)
    , store_(store) {}

std::map<std::string, std::string> PushPipeline::snapshot_refs(
    const std::vector<std::string>& branches) const {
    if (branches.empty()) {
        return store_.list_refs(DEFAULT_REF_PREFIXES);
    }

    std::map<std::string, std::string> refs;
    for (const auto& branch : branches) {
        auto commit = store_.resolve_ref(branch);
        if (!commit) {
            throw UsageError("Refspec '" + branch + "' not found in " + store_.path().string());
        }
        refs[branch] = *commit;
    }
    return refs;
}

BuildClient PushPipeline::upload_client(const PushOptions& options) {
    if (!options.minimal_token) {
        return client_;
    }
    const auto build_id = net::build_url_id(options.build_url);
    auto token = client_.create_token(net::build_url_to_manager(options.build_url),
                                      constants::MINIMAL_TOKEN_NAME, "build/" + build_id, {"upload"},
                                      constants::MINIMAL_TOKEN_DURATION_SECONDS);
    if (!token.contains("token") || !token["token"].is_string()) {
        throw std::runtime_error("token_subset response has no token");
    }
    return client_.with_token(token["token"].get<std::string>());
}

nlohmann::json PushPipeline::run(const PushOptions& options) {
    stats_ = {};
    const auto& build_url = options.build_url;

    auto refs = snapshot_refs(options.branches);
    std::vector<std::string> commits;
    commits.reserve(refs.size());
    for (const auto& [ref, commit] : refs) commits.push_back(commit);

    // The minimal token only covers the transfer; everything after uses the full one
    auto uploader = upload_client(options);

    log_info("Uploading refs to %s: [%s]", build_url.c_str(), join(refs).c_str());

    ReachabilityWalker walker(store_);
    auto metadata = walker.needed_metadata(commits);
    stats_.metadata_objects = metadata.size();
    log_info("Refs contain %zu metadata objects", metadata.size());

    auto missing_metadata = uploader.missing_objects(build_url, metadata);
    stats_.missing_metadata = missing_metadata.size();
    log_info("Remote missing %zu of those", missing_metadata.size());

    auto files = walker.needed_files(missing_metadata);
    stats_.file_objects = files.size();
    log_info("Has %zu file objects for those", files.size());

    auto missing_files = uploader.missing_objects(build_url, files);
    stats_.missing_files = missing_files.size();
    log_info("Remote missing %zu of those", missing_files.size());

    // Files first, so no metadata object ever references an absent file
    UploadScheduler scheduler(uploader, store_, options.batch_limit);
    log_info("Uploading file objects");
    stats_.upload_requests += scheduler.upload_objects(build_url, missing_files);
    log_info("Uploading metadata objects");
    stats_.upload_requests += scheduler.upload_objects(build_url, missing_metadata);

    log_info("Uploading deltas");
    const bool deltas_disabled = std::find(options.ignore_deltas.begin(), options.ignore_deltas.end(),
                                           "*") != options.ignore_deltas.end();
    if (!deltas_disabled) {
        DeltaUploader deltas(uploader, store_);
        stats_.delta_parts = deltas.upload_deltas(build_url, refs, options.ignore_deltas);
        if (stats_.delta_parts > 0) ++stats_.upload_requests;
    }

    for (const auto& [ref, commit] : refs) {
        log_info("Setting ref %s to %s", ref.c_str(), commit.c_str());
        client_.create_ref(build_url, ref, commit);
    }

    if (!options.extra_ids.empty()) {
        client_.add_extra_ids(build_url, options.extra_ids);
    }

    nlohmann::json commit_job;
    nlohmann::json publish_job;
    nlohmann::json update_job;

    if (options.commit) {
        // A publish in the same run needs the commit finished first
        commit_job = client_.commit_build(build_url, options.commit_options,
                                          options.wait || options.publish);
    }

    if (options.publish) {
        publish_job = client_.publish_build(build_url, options.wait || options.wait_update);

        update_job = client_.follow_update_job(build_url, publish_job, options.wait_update);
    }

    auto data = client_.get_build(build_url);
    if (!commit_job.empty()) data["commit_job"] = commit_job;
    if (!publish_job.empty()) data["publish_job"] = publish_job;
    if (!update_job.empty()) data["update_job"] = update_job;
    return data;
}

}  // namespace flatpush
