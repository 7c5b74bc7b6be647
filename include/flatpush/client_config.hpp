#pragma once

#include "flatpush/build_client.hpp"
#include "flatpush/constants.hpp"
#include "flatpush/net/http.hpp"
#include "flatpush/retry.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flatpush {

enum class Command {
    None,
    Create,
    Push,
    Commit,
    Publish,
    Purge,
    CreateToken,
    FollowJob
};

const char* command_name(Command command);

/// Configuration for one flatpush invocation: global options, the
/// sub-command and its arguments.
struct ClientConfig {
    // --- Global ---
    bool show_help = false;                 // --help was given; nothing else parsed
    bool verbose = false;
    bool debug = false;                     // libcurl tracing
    std::filesystem::path output;           // Write the JSON result here
    bool print_output = false;              // Print the JSON result to stdout
    std::string token;
    std::filesystem::path token_file;
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;
    std::string user_agent = constants::DEFAULT_USER_AGENT;
    unsigned retry_max_elapsed_secs = constants::RETRY_MAX_ELAPSED_SECONDS;
    unsigned retry_max_wait_secs = constants::RETRY_MAX_WAIT_SECONDS;
    unsigned connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    unsigned request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;
    bool verify_ssl = true;
    std::string ca_bundle;

    // --- Command ---
    Command command = Command::None;

    // URLs (whichever the command takes)
    std::string manager_url;
    std::string build_url;
    std::string job_url;

    // push <build_url> <repo_path> [branch...]
    std::filesystem::path repo_path;
    std::vector<std::string> branches;
    bool minimal_token = false;
    std::vector<std::string> ignore_deltas;
    std::vector<std::string> extra_ids;
    bool commit = false;
    bool publish = false;
    bool wait = false;
    bool wait_update = false;
    CommitOptions commit_options;

    // create <manager_url> <repo> [app_id]
    std::string repo;
    CreateBuildOptions create_options;

    // create-token <manager_url> <name> <subject> <scope...>
    std::string token_name;
    std::string token_subject;
    std::vector<std::string> token_scope;
    uint64_t token_duration_secs = constants::DEFAULT_TOKEN_DURATION_SECONDS;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr). With --help
    /// the usage goes to stdout and the result only has show_help set.
    static std::optional<ClientConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Pick the bearer token: --token, then --token-file, then $REPO_TOKEN.
    /// Returns error message or empty string.
    std::string resolve_token();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    net::HttpClientConfig http_config() const;
    RetryPolicy retry_policy() const;
};

}  // namespace flatpush
