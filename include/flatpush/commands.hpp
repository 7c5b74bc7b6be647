#pragma once

#include "flatpush/cancel.hpp"
#include "flatpush/client_config.hpp"
#include "flatpush/errors.hpp"
#include "flatpush/net/http.hpp"
#include "flatpush/storage/object_store.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace flatpush {

class BuildClient;
class MetricsExporter;

/// Runs the sub-command selected in a ClientConfig against the build service.
///
/// Every failure is turned into a CommandResult; run() only throws for
/// programming errors (an unset command).
class CommandRunner {
public:
    CommandRunner(const ClientConfig& config, net::HttpTransport& transport, Waiter& waiter,
                  std::ostream& out = std::cout);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }
    void set_store_backend(ObjectStoreBackend backend) { backend_ = backend; }

    CommandResult run();

    /// Write `result` where the config asks for it: --output file and/or stdout.
    /// Returns false when the output file could not be written.
    static bool emit(const ClientConfig& config, const CommandResult& result,
                     std::ostream& out = std::cout);

private:
    nlohmann::json dispatch(BuildClient& client);

    nlohmann::json create(BuildClient& client);
    nlohmann::json push(BuildClient& client);
    nlohmann::json commit(BuildClient& client);
    nlohmann::json publish(BuildClient& client);
    nlohmann::json purge(BuildClient& client);
    nlohmann::json create_token(BuildClient& client);
    nlohmann::json follow_job(BuildClient& client);

    const ClientConfig& config_;
    net::HttpTransport& transport_;
    Waiter& waiter_;
    std::ostream& out_;
    MetricsExporter* metrics_ = nullptr;
    ObjectStoreBackend backend_ = ObjectStoreBackend::Auto;
};

}  // namespace flatpush
