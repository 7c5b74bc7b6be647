#include "flatpush/client_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>

namespace flatpush {

const char* command_name(Command command) {
    switch (command) {
        case Command::None: return "";
        case Command::Create: return "create";
        case Command::Push: return "push";
        case Command::Commit: return "commit";
        case Command::Publish: return "publish";
        case Command::Purge: return "purge";
        case Command::CreateToken: return "create-token";
        case Command::FollowJob: return "follow-job";
    }
    return "";
}

namespace {

std::optional<Command> parse_command(const std::string& name) {
    for (auto command : {Command::Create, Command::Push, Command::Commit, Command::Publish,
                         Command::Purge, Command::CreateToken, Command::FollowJob}) {
        if (name == command_name(command)) return command;
    }
    return std::nullopt;
}

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

void print_usage(std::ostream& out = std::cerr) {
    out <<
        "Usage: flatpush [global options] <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  create <manager_url> <repo> [app_id]     Create a new build\n"
        "      --public-download / --no-public-download\n"
        "      --build-log-url <url>\n"
        "  push <build_url> <repo_path> [branch...] Push refs to a build\n"
        "      --minimal-token                      Upload with an upload-only token\n"
        "      --ignore-delta <glob>                Skip deltas of matching ids (repeatable)\n"
        "      --extra-id <id>                      Add an extra id (repeatable)\n"
        "      --commit                             Commit the build after pushing\n"
        "      --publish                            Commit and publish the build\n"
        "      --wait                               Wait for the commit/publish jobs\n"
        "      --wait-update                        Wait for the repo update job\n"
        "      --end-of-life <msg>                  Mark the pushed refs end-of-life\n"
        "      --end-of-life-rebase <id>            End-of-life rebase target\n"
        "      --token-type <n>                     Token type required to download\n"
        "  commit <build_url>                       Commit a build\n"
        "      --wait, --end-of-life, --end-of-life-rebase, --token-type\n"
        "  publish <build_url>                      Publish a committed build\n"
        "      --wait, --wait-update\n"
        "  purge <build_url>                        Purge a build\n"
        "  create-token <manager_url> <name> <subject> <scope...>\n"
        "      --duration <secs>                    Token lifetime (default: 86400)\n"
        "  follow-job <job_url>                     Follow a job until it finishes\n"
        "\n"
        "Global options:\n"
        "  --verbose, -v                            Verbose output\n"
        "  --debug                                  Trace HTTP requests\n"
        "  --output <file>                          Write the JSON result to a file\n"
        "  --print-output                           Print the JSON result to stdout\n"
        "  --token <token>                          Bearer token\n"
        "  --token-file <path>                      Read the bearer token from a file\n"
        "                                           (default: $REPO_TOKEN)\n"
        "  --config <path>                          JSON config file\n"
        "  --metrics-file <path>                    Prometheus .prom file for node_exporter textfile collector\n"
        "  --user-agent <string>                    HTTP user agent\n"
        "  --retry-max-elapsed <secs>               Give up retrying after this long (default: 300)\n"
        "  --retry-max-wait <secs>                  Longest backoff between retries (default: 60)\n"
        "  --help                                   Show this help\n";
}

}  // namespace

std::optional<ClientConfig> ClientConfig::from_args(int argc, char* argv[]) {
    ClientConfig config;
    std::vector<std::string> positionals;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--debug") {
                config.debug = true;
            } else if (arg == "--output") {
                auto* v = next_arg(i, "--output");
                if (!v) return std::nullopt;
                config.output = v;
            } else if (arg == "--print-output") {
                config.print_output = true;
            } else if (arg == "--token") {
                auto* v = next_arg(i, "--token");
                if (!v) return std::nullopt;
                config.token = v;
            } else if (arg == "--token-file") {
                auto* v = next_arg(i, "--token-file");
                if (!v) return std::nullopt;
                config.token_file = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--user-agent") {
                auto* v = next_arg(i, "--user-agent");
                if (!v) return std::nullopt;
                config.user_agent = v;
            } else if (arg == "--retry-max-elapsed") {
                auto* v = next_arg(i, "--retry-max-elapsed");
                if (!v) return std::nullopt;
                config.retry_max_elapsed_secs = static_cast<unsigned>(std::stoul(v));
            } else if (arg == "--retry-max-wait") {
                auto* v = next_arg(i, "--retry-max-wait");
                if (!v) return std::nullopt;
                config.retry_max_wait_secs = static_cast<unsigned>(std::stoul(v));
            // push
            } else if (arg == "--minimal-token") {
                config.minimal_token = true;
            } else if (arg == "--ignore-delta") {
                auto* v = next_arg(i, "--ignore-delta");
                if (!v) return std::nullopt;
                config.ignore_deltas.push_back(v);
            } else if (arg == "--extra-id") {
                auto* v = next_arg(i, "--extra-id");
                if (!v) return std::nullopt;
                config.extra_ids.push_back(v);
            } else if (arg == "--commit") {
                config.commit = true;
            } else if (arg == "--publish") {
                config.publish = true;
            } else if (arg == "--wait") {
                config.wait = true;
            } else if (arg == "--wait-update") {
                config.wait_update = true;
            } else if (arg == "--end-of-life") {
                auto* v = next_arg(i, "--end-of-life");
                if (!v) return std::nullopt;
                config.commit_options.end_of_life = v;
            } else if (arg == "--end-of-life-rebase") {
                auto* v = next_arg(i, "--end-of-life-rebase");
                if (!v) return std::nullopt;
                config.commit_options.end_of_life_rebase = v;
            } else if (arg == "--token-type") {
                auto* v = next_arg(i, "--token-type");
                if (!v) return std::nullopt;
                config.commit_options.token_type = std::stoi(v);
            // create
            } else if (arg == "--public-download") {
                config.create_options.public_download = true;
            } else if (arg == "--no-public-download") {
                config.create_options.public_download = false;
            } else if (arg == "--build-log-url") {
                auto* v = next_arg(i, "--build-log-url");
                if (!v) return std::nullopt;
                config.create_options.build_log_url = v;
            // create-token
            } else if (arg == "--duration") {
                auto* v = next_arg(i, "--duration");
                if (!v) return std::nullopt;
                config.token_duration_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(std::cout);
                config.show_help = true;
                return config;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else {
                positionals.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        // std::stoul and friends on a malformed number
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    if (positionals.empty()) {
        std::cerr << "Error: no command given\n";
        print_usage();
        return std::nullopt;
    }

    auto command = parse_command(positionals[0]);
    if (!command) {
        std::cerr << "Error: unknown command: " << positionals[0] << "\n";
        print_usage();
        return std::nullopt;
    }
    config.command = *command;

    const std::vector<std::string> args(positionals.begin() + 1, positionals.end());
    auto need = [&](size_t min, size_t max, const char* usage) -> bool {
        if (args.size() < min || args.size() > max) {
            std::cerr << "Error: usage: flatpush " << command_name(config.command) << " " << usage << "\n";
            return false;
        }
        return true;
    };

    switch (config.command) {
        case Command::Create:
            if (!need(2, 3, "<manager_url> <repo> [app_id]")) return std::nullopt;
            config.manager_url = args[0];
            config.repo = args[1];
            if (args.size() > 2) config.create_options.app_id = args[2];
            break;
        case Command::Push:
            if (!need(2, SIZE_MAX, "<build_url> <repo_path> [branch...]")) return std::nullopt;
            config.build_url = args[0];
            config.repo_path = args[1];
            config.branches.assign(args.begin() + 2, args.end());
            break;
        case Command::Commit:
        case Command::Publish:
        case Command::Purge:
            if (!need(1, 1, "<build_url>")) return std::nullopt;
            config.build_url = args[0];
            break;
        case Command::CreateToken:
            if (!need(4, SIZE_MAX, "<manager_url> <name> <subject> <scope...>")) return std::nullopt;
            config.manager_url = args[0];
            config.token_name = args[1];
            config.token_subject = args[2];
            config.token_scope.assign(args.begin() + 3, args.end());
            break;
        case Command::FollowJob:
            if (!need(1, 1, "<job_url>")) return std::nullopt;
            config.job_url = args[0];
            break;
        case Command::None:
            return std::nullopt;
    }

    return config;
}

bool ClientConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("token_file")) token_file = j["token_file"].get<std::string>();
        if (j.contains("output")) output = j["output"].get<std::string>();
        if (j.contains("print_output")) print_output = j["print_output"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("user_agent")) user_agent = j["user_agent"].get<std::string>();
        if (j.contains("retry_max_elapsed_secs"))
            retry_max_elapsed_secs = j["retry_max_elapsed_secs"].get<unsigned>();
        if (j.contains("retry_max_wait_secs"))
            retry_max_wait_secs = j["retry_max_wait_secs"].get<unsigned>();
        if (j.contains("connect_timeout_secs"))
            connect_timeout_secs = j["connect_timeout_secs"].get<unsigned>();
        if (j.contains("request_timeout_secs"))
            request_timeout_secs = j["request_timeout_secs"].get<unsigned>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_bundle")) ca_bundle = j["ca_bundle"].get<std::string>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string ClientConfig::resolve_token() {
    if (!token.empty()) {
        return {};
    }
    if (!token_file.empty()) {
        std::ifstream ifs(token_file);
        if (!ifs) {
            return "cannot read token file: " + token_file.string();
        }
        token = trim(std::string((std::istreambuf_iterator<char>(ifs)),
                                 std::istreambuf_iterator<char>()));
        if (token.empty()) {
            return "token file is empty: " + token_file.string();
        }
        return {};
    }
    if (const char* env = std::getenv(constants::TOKEN_ENV_VAR)) {
        token = env;
    }
    if (token.empty()) {
        return "No token available, pass with --token, --token-file or $REPO_TOKEN";
    }
    return {};
}

std::string ClientConfig::validate() const {
    if (command == Command::None) return "no command given";
    if (token.empty()) return "No token available, pass with --token, --token-file or $REPO_TOKEN";
    if (retry_max_wait_secs == 0) return "retry_max_wait must be > 0";
    if (connect_timeout_secs == 0 || request_timeout_secs == 0) return "timeouts must be > 0";

    switch (command) {
        case Command::Create:
        case Command::CreateToken:
            if (manager_url.empty()) return "manager_url is required";
            break;
        case Command::Push:
            if (build_url.empty()) return "build_url is required";
            if (repo_path.empty()) return "repo_path is required";
            break;
        case Command::Commit:
        case Command::Publish:
        case Command::Purge:
            if (build_url.empty()) return "build_url is required";
            break;
        case Command::FollowJob:
            if (job_url.empty()) return "job_url is required";
            break;
        case Command::None:
            break;
    }
    if (command == Command::CreateToken && token_scope.empty()) return "at least one scope is required";
    return {};
}

net::HttpClientConfig ClientConfig::http_config() const {
    net::HttpClientConfig http;
    http.default_connect_timeout = std::chrono::seconds(connect_timeout_secs);
    http.default_total_timeout = std::chrono::seconds(request_timeout_secs);
    http.verify_ssl = verify_ssl;
    http.ca_bundle = ca_bundle;
    http.user_agent = user_agent;
    http.verbose = debug;
    return http;
}

RetryPolicy ClientConfig::retry_policy() const {
    RetryPolicy policy;
    policy.max_elapsed = std::chrono::seconds(retry_max_elapsed_secs);
    policy.max_wait = std::chrono::seconds(retry_max_wait_secs);
    return policy;
}

}  // namespace flatpush
