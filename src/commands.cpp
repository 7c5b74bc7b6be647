#include "flatpush/commands.hpp"
#include "flatpush/build_client.hpp"
#include "flatpush/log.hpp"
#include "flatpush/push.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace flatpush {

CommandRunner::CommandRunner(const ClientConfig& config, net::HttpTransport& transport,
                             Waiter& waiter, std::ostream& out)
    : config_(config)
    , transport_(transport)
    , waiter_(waiter)
    , out_(out) {}

CommandResult CommandRunner::run() {
    BuildClient client(transport_, waiter_, config_.token, config_.retry_policy());
    client.set_metrics(metrics_);
    client.set_job_output(out_);

    CommandResult result;
    try {
        result = Success{dispatch(client)};
    } catch (const UsageError& e) {
        result = UsageFailure{e.what()};
    } catch (const ApiError& e) {
        result = ApiFailure{e.url(), e.status(), e.body()};
    } catch (const FailedJobError& e) {
        result = JobFailure{e.job()};
    } catch (const CancelledError& e) {
        result = InternalFailure{"Cancelled", e.what()};
    } catch (const TransportError& e) {
        result = InternalFailure{"TransportError", e.what()};
    } catch (const ObjectStoreError& e) {
        result = InternalFailure{"ObjectStoreError", e.what()};
    } catch (const nlohmann::json::exception& e) {
        result = InternalFailure{"JsonError", e.what()};
    } catch (const std::exception& e) {
        result = InternalFailure{"Exception", e.what()};
    }

    if (!std::holds_alternative<Success>(result)) {
        log_error("%s", result_message(result).c_str());
    }
    return result;
}

bool CommandRunner::emit(const ClientConfig& config, const CommandResult& result,
                         std::ostream& out) {
    const auto doc = result_to_json(result);
    bool ok = true;

    if (!config.output.empty()) {
        auto tmp = config.output;
        tmp += ".tmp";
        {
            std::ofstream ofs(tmp);
            if (ofs) ofs << doc.dump(4) << "\n";
            ok = static_cast<bool>(ofs);
        }
        std::error_code ec;
        if (ok) std::filesystem::rename(tmp, config.output, ec);
        if (!ok || ec) {
            log_error("Failed to write %s", config.output.c_str());
            std::filesystem::remove(tmp, ec);
            ok = false;
        }
    }

    if (config.print_output) {
        out << doc.dump(4) << std::endl;
    }
    return ok;
}

nlohmann::json CommandRunner::dispatch(BuildClient& client) {
    switch (config_.command) {
        case Command::Create:      return create(client);
        case Command::Push:        return push(client);
        case Command::Commit:      return commit(client);
        case Command::Publish:     return publish(client);
        case Command::Purge:       return purge(client);
        case Command::CreateToken: return create_token(client);
        case Command::FollowJob:   return follow_job(client);
        case Command::None:        break;
    }
    throw std::logic_error("no command selected");
}

nlohmann::json CommandRunner::create(BuildClient& client) {
    auto build = client.create_build(config_.manager_url, config_.repo, config_.create_options);
    if (!config_.print_output) {
        out_ << build.value("location", "") << std::endl;
    }
    return build;
}

nlohmann::json CommandRunner::push(BuildClient& client) {
    auto store = ObjectStoreFactory::open(config_.repo_path, backend_);
    log_debug("Opened %s repository %s", store->type_name().c_str(), store->path().c_str());

    PushOptions options;
    options.build_url = config_.build_url;
    options.branches = config_.branches;
    options.minimal_token = config_.minimal_token;
    options.ignore_deltas = config_.ignore_deltas;
    options.extra_ids = config_.extra_ids;
    options.commit = config_.commit;
    options.publish = config_.publish;
    options.wait = config_.wait;
    options.wait_update = config_.wait_update;
    options.commit_options = config_.commit_options;

    PushPipeline pipeline(client, *store);
    auto data = pipeline.run(options);

    const auto& stats = pipeline.stats();
    log_debug("push: %zu/%zu metadata and %zu/%zu file objects missing, %zu upload requests, "
              "%zu delta parts",
              stats.missing_metadata, stats.metadata_objects, stats.missing_files,
              stats.file_objects, stats.upload_requests, stats.delta_parts);
    return data;
}

nlohmann::json CommandRunner::commit(BuildClient& client) {
    return client.commit_build(config_.build_url, config_.commit_options, config_.wait);
}

nlohmann::json CommandRunner::publish(BuildClient& client) {
    auto job = client.publish_build(config_.build_url, config_.wait || config_.wait_update);
    auto update_job = client.follow_update_job(config_.build_url, job, config_.wait_update);
    if (!update_job.empty()) {
        job["update_job"] = update_job;
    }
    return job;
}

nlohmann::json CommandRunner::purge(BuildClient& client) {
    return client.purge_build(config_.build_url);
}

nlohmann::json CommandRunner::create_token(BuildClient& client) {
    auto token = client.create_token(config_.manager_url, config_.token_name, config_.token_subject,
                                     config_.token_scope, config_.token_duration_secs);
    if (!config_.print_output) {
        out_ << token.value("token", "") << std::endl;
    }
    return token;
}

nlohmann::json CommandRunner::follow_job(BuildClient& client) {
    return client.wait_for_job(config_.job_url);
}

}  // namespace flatpush
