// Test suite for moving objects to a build.
//
// Tests:
//   1. Remote diff (missing_objects chunking, gzip bodies)
//   2. Upload batch planning and the upload scheduler
//   3. Static delta selection
//   4. Push pipeline end to end against a scripted build service

#include "test_support.hpp"

#include "flatpush/build_client.hpp"
#include "flatpush/delta_name.hpp"
#include "flatpush/delta_uploader.hpp"
#include "flatpush/lazy_file.hpp"
#include "flatpush/push.hpp"
#include "flatpush/upload_scheduler.hpp"

#include <algorithm>
#include <set>
#include <sstream>

using namespace flatpush;

namespace {

const std::string BUILD_URL = "https://hub.example.com/api/v1/build/12";
const std::string JOB_BASE = "https://hub.example.com/api/v1/job/";
constexpr uint64_t MiB = 1024 * 1024;

// Fail fast: a single attempt per call
RetryPolicy no_retry() {
    RetryPolicy policy;
    policy.max_elapsed = std::chrono::seconds(0);
    return policy;
}

std::vector<std::string> wanted_of(const net::HttpRequest& request) {
    auto raw = gzip_decompress(request.body);
    auto body = nlohmann::json::parse(raw.begin(), raw.end());
    return body["wanted"].get<std::vector<std::string>>();
}

std::vector<std::string> part_names(const net::HttpRequest& request) {
    std::vector<std::string> names;
    for (const auto& part : request.parts) names.push_back(part.filename);
    return names;
}

std::string path_of(const std::string& url) {
    auto scheme = url.find("://");
    auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    return slash == std::string::npos ? "/" : url.substr(slash);
}

/// Scripted build service: everything succeeds, missing_objects answers
/// through `missing`, jobs finish on their first poll.
FakeTransport::Handler build_service(
    std::function<std::vector<std::string>(const std::vector<std::string>&)> missing,
    std::map<std::string, nlohmann::json> jobs = {}) {
    return [missing, jobs](const net::HttpRequest& request) -> net::HttpResponse {
        const auto& url = request.url;
        if (ends_with(url, "/missing_objects")) {
            return json_response(200, {{"missing", missing(wanted_of(request))}});
        }
        if (ends_with(url, "/upload") || ends_with(url, "/build_ref") ||
            ends_with(url, "/add_extra_ids")) {
            return json_response(200, nlohmann::json::object());
        }
        if (ends_with(url, "/api/v1/token_subset")) {
            return json_response(200, {{"token", "minimal"}});
        }
        if (ends_with(url, "/commit")) {
            return json_response(200, {{"id", 1}, {"status", 0}}, {{"Location", JOB_BASE + "1"}});
        }
        if (ends_with(url, "/publish")) {
            return json_response(200, {{"id", 2}, {"status", 0}}, {{"Location", JOB_BASE + "2"}});
        }
        auto job = jobs.find(url);
        if (job != jobs.end()) {
            return json_response(200, job->second);
        }
        if (url == BUILD_URL && request.method == net::HttpMethod::GET) {
            return json_response(200, {{"id", 12}, {"repo", "stable"}, {"repo_state", 0}});
        }
        return json_response(404, {{"message", "unexpected " + url}});
    };
}

struct AppFixture {
    MemoryObjectStore store;
    std::string commit = fake_checksum("commit");
    std::string tree = fake_checksum("tree");
    std::string meta = fake_checksum("meta");
    std::vector<std::string> files = {fake_checksum("f1"), fake_checksum("f2"), fake_checksum("f3")};
    std::string ref = "app/org.example.App/x86_64/stable";

    AppFixture() {
        store.refs[ref] = commit;
        store.add_commit(commit, tree, meta);
        store.add_dirtree(tree, files);
        store.sizes[object_name(files[0], ObjectType::File)] = 1 * MiB;
        store.sizes[object_name(files[1], ObjectType::File)] = 1 * MiB;
        store.sizes[object_name(files[2], ObjectType::File)] = 3 * MiB;
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// 1. Remote diff
// ---------------------------------------------------------------------------

static void test_missing_objects() {
    std::cout << "\n=== Remote diff ===" << std::endl;

    {
        TEST(chunks_of_2000);
        FakeTransport transport;
        FakeWaiter waiter;
        // Server is missing every third object
        transport.set_handler([](const net::HttpRequest& request) {
            std::vector<std::string> missing;
            auto wanted = wanted_of(request);
            for (size_t i = 0; i < wanted.size(); i += 3) missing.push_back(wanted[i]);
            return json_response(200, {{"missing", missing}});
        });
        BuildClient client(transport, waiter, "tok");

        std::vector<std::string> wanted;
        for (int i = 0; i < 4500; ++i) {
            wanted.push_back(object_name(fake_checksum(std::to_string(i)), ObjectType::File));
        }
        auto missing = client.missing_objects(BUILD_URL, wanted);

        ASSERT_EQ(transport.requests.size(), 3u, "ceil(4500/2000) requests");
        ASSERT_EQ(wanted_of(transport.requests[0]).size(), 2000u, "first chunk");
        ASSERT_EQ(wanted_of(transport.requests[2]).size(), 500u, "last chunk");
        ASSERT_EQ(missing.size(), 667u + 667u + 167u, "concatenated answers");

        std::set<std::string> unique(missing.begin(), missing.end());
        std::set<std::string> all(wanted.begin(), wanted.end());
        ASSERT_EQ(unique.size(), missing.size(), "no duplicates");
        ASSERT_TRUE(std::includes(all.begin(), all.end(), unique.begin(), unique.end()),
                    "subset of the input");
        PASS();
    }
    {
        TEST(request_is_gzipped_json);
        FakeTransport transport;
        FakeWaiter waiter;
        transport.push(json_response(200, {{"missing", nlohmann::json::array()}}));
        BuildClient client(transport, waiter, "tok");
        client.missing_objects(BUILD_URL, {"a.filez"});

        const auto& request = transport.requests.at(0);
        ASSERT_EQ(request.url, BUILD_URL + "/missing_objects", "url");
        ASSERT_TRUE(request.method == net::HttpMethod::POST, "POST");
        ASSERT_EQ(request.headers.get("Content-Encoding").value_or(""), std::string("gzip"),
                  "content encoding");
        ASSERT_EQ(request.headers.content_type().value_or(""), std::string("application/json"),
                  "content type");
        ASSERT_EQ(request.headers.get("Authorization").value_or(""), std::string("Bearer tok"),
                  "bearer token");
        ASSERT_EQ(wanted_of(request).at(0), std::string("a.filez"), "decoded body");
        PASS();
    }
    {
        TEST(exact_multiple_of_chunk);
        FakeTransport transport;
        FakeWaiter waiter;
        transport.set_handler([](const net::HttpRequest&) {
            return json_response(200, {{"missing", nlohmann::json::array()}});
        });
        BuildClient client(transport, waiter, "tok");
        std::vector<std::string> wanted(4000, "x.filez");
        client.missing_objects(BUILD_URL, wanted);
        ASSERT_EQ(transport.requests.size(), 2u, "two full chunks");
        PASS();
    }
    {
        TEST(nothing_wanted_no_request);
        FakeTransport transport;
        FakeWaiter waiter;
        BuildClient client(transport, waiter, "tok");
        auto missing = client.missing_objects(BUILD_URL, {});
        ASSERT_TRUE(missing.empty(), "nothing missing");
        ASSERT_EQ(transport.requests.size(), 0u, "no request");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Upload batches
// ---------------------------------------------------------------------------

static void test_upload_batches() {
    std::cout << "\n=== Upload batches ===" << std::endl;

    auto item = [](const std::string& name, uint64_t size) {
        return UploadItem{name, "/nonexistent/" + name, size};
    };

    {
        TEST(one_one_three_mib);
        auto batches = plan_upload_batches({item("a", 1 * MiB), item("b", 1 * MiB), item("c", 3 * MiB)},
                                           4 * MiB);
        ASSERT_EQ(batches.size(), 2u, "two batches");
        ASSERT_EQ(batches[0].size(), 2u, "first batch has a and b");
        ASSERT_EQ(batches[1].size(), 1u, "second batch has c");
        ASSERT_EQ(batches[1][0].name, std::string("c"), "c alone");
        PASS();
    }
    {
        TEST(oversized_item_travels_alone);
        auto batches = plan_upload_batches({item("a", 1 * MiB), item("big", 9 * MiB), item("b", 1 * MiB)},
                                           4 * MiB);
        ASSERT_EQ(batches.size(), 3u, "three batches");
        ASSERT_EQ(batches[1].size(), 1u, "big alone");
        ASSERT_EQ(batches[1][0].name, std::string("big"), "big item");
        PASS();
    }
    {
        TEST(batches_respect_limit);
        std::vector<UploadItem> items;
        for (int i = 0; i < 200; ++i) {
            items.push_back(item(std::to_string(i), static_cast<uint64_t>((i * 7919) % 5000) * 1024));
        }
        const uint64_t limit = 256 * 1024;
        auto batches = plan_upload_batches(items, limit);
        size_t total = 0;
        for (const auto& batch : batches) {
            uint64_t sum = 0;
            for (const auto& it : batch) sum += it.size;
            ASSERT_TRUE(!batch.empty(), "no empty batch");
            ASSERT_TRUE(sum <= limit || batch.size() == 1, "batch over the limit");
            total += batch.size();
        }
        ASSERT_EQ(total, items.size(), "every item scheduled once");
        PASS();
    }
    {
        TEST(empty_input_no_batches);
        ASSERT_TRUE(plan_upload_batches({}, 4 * MiB).empty(), "no batches");
        PASS();
    }
    {
        TEST(scheduler_sends_one_request_per_batch);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        transport.set_handler([](const net::HttpRequest&) {
            return json_response(200, nlohmann::json::object());
        });
        BuildClient client(transport, waiter, "tok");
        UploadScheduler scheduler(client, fx.store, 4 * MiB);

        std::vector<std::string> names;
        for (const auto& f : fx.files) names.push_back(object_name(f, ObjectType::File));
        auto requests = scheduler.upload_objects(BUILD_URL, names);

        ASSERT_EQ(requests, 2u, "two upload requests");
        ASSERT_EQ(transport.requests.size(), 2u, "two requests sent");
        ASSERT_EQ(transport.requests[0].url, BUILD_URL + "/upload", "upload url");
        auto first = part_names(transport.requests[0]);
        ASSERT_EQ(first.size(), 2u, "first request parts");
        ASSERT_EQ(first[0], names[0], "first part named after the object");
        ASSERT_EQ(transport.requests[0].parts[0].path,
                  fx.store.object_path(fx.files[0], ObjectType::File), "part path");
        ASSERT_EQ(transport.requests[1].parts[0].size, 3 * MiB, "part size");
        PASS();
    }
    {
        TEST(scheduler_rejects_bad_names);
        MemoryObjectStore store;
        FakeTransport transport;
        FakeWaiter waiter;
        BuildClient client(transport, waiter, "tok");
        UploadScheduler scheduler(client, store);
        ASSERT_THROWS(scheduler.upload_objects(BUILD_URL, {"bogus"}), ObjectStoreError,
                      "should throw");
        ASSERT_EQ(transport.requests.size(), 0u, "nothing sent");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Deltas
// ---------------------------------------------------------------------------

static void test_deltas() {
    std::cout << "\n=== Static deltas ===" << std::endl;

    auto root = make_temp_dir("flatpush-deltas");
    MemoryObjectStore store(root);
    auto app_commit = fake_checksum("app");
    auto runtime_commit = fake_checksum("runtime");
    auto other_commit = fake_checksum("other");
    auto from = fake_checksum("from");

    store.deltas = {app_commit, from + "-" + other_commit, runtime_commit};
    for (const auto& name : {app_commit, runtime_commit}) {
        auto dir = store.delta_dir(name);
        write_file(dir / "superblock", std::string("sb"));
        write_file(dir / "0", std::string("part0"));
        write_file(dir / "1", std::string("part1-longer"));
    }

    std::map<std::string, std::string> refs = {
        {"app/org.example.App/x86_64/stable", app_commit},
        {"runtime/org.example.Platform/x86_64/1.0", runtime_commit},
        {"app/org.other.App/x86_64/stable", other_commit},
        {"screenshots/x86_64", app_commit},
    };

    {
        TEST(should_skip_delta_globs);
        ASSERT_TRUE(should_skip_delta("org.example.App", {"org.example.*"}), "glob match");
        ASSERT_TRUE(!should_skip_delta("org.example.App", {"org.other.*"}), "no match");
        ASSERT_TRUE(should_skip_delta("anything", {"*"}), "star");
        ASSERT_TRUE(!should_skip_delta("anything", {}), "no globs");
        PASS();
    }
    {
        TEST(selects_from_scratch_deltas_of_pushed_refs);
        FakeTransport transport;
        FakeWaiter waiter;
        BuildClient client(transport, waiter, "tok");
        DeltaUploader uploader(client, store);

        auto items = uploader.select_delta_parts(refs, {});
        ASSERT_EQ(items.size(), 6u, "three parts each for app and runtime");

        auto enc = delta_name_encode(app_commit);
        std::set<std::string> names;
        for (const auto& it : items) names.insert(it.name);
        ASSERT_TRUE(names.count(enc + ".0.delta"), "part 0");
        ASSERT_TRUE(names.count(enc + ".1.delta"), "part 1");
        ASSERT_TRUE(names.count(enc + ".superblock.delta"), "superblock");
        for (const auto& it : items) {
            ASSERT_TRUE(it.name.rfind(delta_name_encode(other_commit), 0) != 0,
                        "incremental delta must not be sent");
        }
        PASS();
    }
    {
        TEST(ignore_globs_skip_ids);
        FakeTransport transport;
        FakeWaiter waiter;
        BuildClient client(transport, waiter, "tok");
        DeltaUploader uploader(client, store);

        auto items = uploader.select_delta_parts(refs, {"org.example.Plat*"});
        ASSERT_EQ(items.size(), 3u, "runtime skipped");
        ASSERT_TRUE(items[0].name.rfind(delta_name_encode(app_commit), 0) == 0, "app delta kept");
        PASS();
    }
    {
        TEST(all_parts_in_one_request);
        FakeTransport transport;
        FakeWaiter waiter;
        transport.push(json_response(200, nlohmann::json::object()));
        BuildClient client(transport, waiter, "tok");
        DeltaUploader uploader(client, store);

        auto count = uploader.upload_deltas(BUILD_URL, refs, {});
        ASSERT_EQ(count, 6u, "six parts");
        ASSERT_EQ(transport.requests.size(), 1u, "one request");
        ASSERT_EQ(transport.requests[0].parts.size(), 6u, "all parts attached");
        ASSERT_EQ(transport.requests[0].parts[0].size, read_file(transport.requests[0].parts[0].path).size(),
                  "part size from disk");
        PASS();
    }
    {
        TEST(no_deltas_no_request);
        MemoryObjectStore bare;
        FakeTransport transport;
        FakeWaiter waiter;
        BuildClient client(transport, waiter, "tok");
        DeltaUploader uploader(client, bare);
        ASSERT_EQ(uploader.upload_deltas(BUILD_URL, refs, {}), 0u, "nothing uploaded");
        ASSERT_EQ(transport.requests.size(), 0u, "no request");
        PASS();
    }

    fs::remove_all(root);
}

// ---------------------------------------------------------------------------
// 4. Push pipeline
// ---------------------------------------------------------------------------

static void test_push_pipeline() {
    std::cout << "\n=== Push pipeline ===" << std::endl;

    // Remote lacks the root dirtree and every file
    auto missing_tree_and_files = [](const std::vector<std::string>& wanted) {
        std::vector<std::string> missing;
        for (const auto& name : wanted) {
            if (ends_with(name, ".dirtree") || ends_with(name, ".filez")) missing.push_back(name);
        }
        return missing;
    };

    {
        TEST(one_ref_three_files_one_dirtree);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        transport.set_handler(build_service(missing_tree_and_files));
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        options.branches = {fx.ref};
        auto data = pipeline.run(options);

        const auto& stats = pipeline.stats();
        ASSERT_EQ(stats.metadata_objects, 3u, "commit, dirtree, dirmeta");
        ASSERT_EQ(stats.missing_metadata, 1u, "dirtree missing");
        ASSERT_EQ(stats.missing_files, 3u, "three files missing");
        ASSERT_EQ(stats.upload_requests, 3u, "two file batches and one metadata batch");

        std::vector<std::string> paths;
        for (const auto& r : transport.requests) paths.push_back(path_of(r.url));
        const std::vector<std::string> expected = {
            "/api/v1/build/12/missing_objects", "/api/v1/build/12/missing_objects",
            "/api/v1/build/12/upload", "/api/v1/build/12/upload", "/api/v1/build/12/upload",
            "/api/v1/build/12/build_ref", "/api/v1/build/12",
        };
        ASSERT_EQ(paths.size(), expected.size(), "request count");
        for (size_t i = 0; i < expected.size(); ++i) {
            ASSERT_EQ(paths[i], expected[i], "request " + std::to_string(i));
        }

        // Files go up before the metadata that references them
        ASSERT_EQ(part_names(transport.requests[2]).size(), 2u, "1MiB + 1MiB");
        ASSERT_EQ(part_names(transport.requests[3]).size(), 1u, "3MiB alone");
        ASSERT_EQ(part_names(transport.requests[4]).at(0), object_name(fx.tree, ObjectType::DirTree),
                  "metadata last");

        auto ref_body = request_json(transport.requests[5]);
        ASSERT_EQ(ref_body["ref"].get<std::string>(), fx.ref, "ref name");
        ASSERT_EQ(ref_body["commit"].get<std::string>(), fx.commit, "ref commit");
        ASSERT_EQ(data["id"].get<int>(), 12, "build document returned");
        ASSERT_TRUE(!data.contains("commit_job"), "no commit requested");
        PASS();
    }
    {
        TEST(up_to_date_build_uploads_nothing);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        transport.set_handler(build_service([](const std::vector<std::string>&) {
            return std::vector<std::string>{};
        }));
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        pipeline.run(options);

        ASSERT_EQ(pipeline.stats().upload_requests, 0u, "no uploads");
        for (const auto& r : transport.requests) {
            ASSERT_TRUE(!ends_with(r.url, "/upload"), "no upload request");
        }
        PASS();
    }
    {
        TEST(default_refs_cover_app_runtime_screenshots);
        AppFixture fx;
        fx.store.refs["appstream/x86_64"] = fx.commit;
        fx.store.refs["screenshots/x86_64"] = fx.commit;
        FakeTransport transport;
        FakeWaiter waiter;
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, fx.store);

        auto refs = pipeline.snapshot_refs({});
        ASSERT_EQ(refs.size(), 2u, "app and screenshots refs");
        ASSERT_TRUE(!refs.count("appstream/x86_64"), "appstream not pushed by default");
        PASS();
    }
    {
        TEST(unknown_branch_is_usage_error);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        options.branches = {"app/org.missing.App/x86_64/stable"};
        ASSERT_THROWS(pipeline.run(options), UsageError, "should throw");
        ASSERT_EQ(transport.requests.size(), 0u, "nothing sent");
        PASS();
    }
    {
        TEST(minimal_token_only_for_transfer);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        transport.set_handler(build_service(missing_tree_and_files));
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        options.minimal_token = true;
        options.extra_ids = {"org.example.App.Locale"};
        pipeline.run(options);

        const auto& token_req = transport.requests.at(0);
        ASSERT_EQ(token_req.url, std::string("https://hub.example.com/api/v1/token_subset"),
                  "token url at the manager root");
        ASSERT_EQ(token_req.headers.get("Authorization").value_or(""), std::string("Bearer full"),
                  "minted with the full token");
        auto body = request_json(token_req);
        ASSERT_EQ(body["name"].get<std::string>(), std::string("minimal-upload"), "token name");
        ASSERT_EQ(body["sub"].get<std::string>(), std::string("build/12"), "token subject");
        ASSERT_EQ(body["scope"].dump(), std::string("[\"upload\"]"), "token scope");
        ASSERT_EQ(body["duration"].get<int>(), 3600, "token duration");

        for (const auto& r : transport.requests) {
            const auto auth = r.headers.get("Authorization").value_or("");
            if (ends_with(r.url, "/missing_objects") || ends_with(r.url, "/upload")) {
                ASSERT_EQ(auth, std::string("Bearer minimal"), "transfer uses minimal token");
            } else if (ends_with(r.url, "/build_ref") || ends_with(r.url, "/add_extra_ids") ||
                       r.url == BUILD_URL) {
                ASSERT_EQ(auth, std::string("Bearer full"), "build calls use the full token");
            }
        }
        PASS();
    }
    {
        TEST(ignore_all_deltas);
        AppFixture fx;
        auto root = make_temp_dir("flatpush-push-deltas");
        MemoryObjectStore store(root);
        store.refs = fx.store.refs;
        store.commits = fx.store.commits;
        store.dirtrees = fx.store.dirtrees;
        store.deltas = {fx.commit};
        write_file(store.delta_dir(fx.commit) / "superblock", std::string("sb"));

        FakeTransport transport;
        FakeWaiter waiter;
        transport.set_handler(build_service([](const std::vector<std::string>&) {
            return std::vector<std::string>{};
        }));
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, store);

        PushOptions options;
        options.build_url = BUILD_URL;
        options.ignore_deltas = {"*"};
        pipeline.run(options);
        ASSERT_EQ(pipeline.stats().delta_parts, 0u, "no delta parts");

        options.ignore_deltas.clear();
        pipeline.run(options);
        ASSERT_EQ(pipeline.stats().delta_parts, 1u, "superblock uploaded");
        fs::remove_all(root);
        PASS();
    }
    {
        TEST(commit_publish_and_update_job);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        std::map<std::string, nlohmann::json> jobs = {
            {JOB_BASE + "1", {{"id", 1}, {"status", 2}, {"log", "committed\n"}, {"results", "{}"}}},
            {JOB_BASE + "2", {{"id", 2}, {"status", 2}, {"log", ""},
                              {"results", "{\"update-repo-job\": 3}"}}},
            {JOB_BASE + "3", {{"id", 3}, {"status", 2}, {"log", ""}, {"results", "{}"}}},
        };
        transport.set_handler(build_service(missing_tree_and_files, jobs));
        BuildClient client(transport, waiter, "full");
        std::ostringstream job_log;
        client.set_job_output(job_log);
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        options.commit = true;
        options.publish = true;
        options.wait_update = true;
        options.commit_options.end_of_life = "use org.example.NewApp";
        auto data = pipeline.run(options);

        ASSERT_EQ(data["commit_job"]["location"].get<std::string>(), JOB_BASE + "1",
                  "commit job location");
        ASSERT_EQ(data["publish_job"]["results"]["update-repo-job"].get<int>(), 3,
                  "publish results decoded");
        ASSERT_EQ(data["update_job"]["location"].get<std::string>(), JOB_BASE + "3",
                  "update job location");
        ASSERT_TRUE(job_log.str().find("| committed\n") != std::string::npos, "commit log streamed");

        std::vector<std::string> tail;
        for (const auto& r : transport.requests) tail.push_back(path_of(r.url));
        auto commit_at = std::find(tail.begin(), tail.end(), "/api/v1/build/12/commit");
        auto publish_at = std::find(tail.begin(), tail.end(), "/api/v1/build/12/publish");
        ASSERT_TRUE(commit_at != tail.end() && publish_at != tail.end(), "commit and publish sent");
        ASSERT_TRUE(commit_at < publish_at, "commit before publish");
        ASSERT_EQ(tail.back(), std::string("/api/v1/build/12"), "build fetched last");

        auto commit_req = std::find_if(transport.requests.begin(), transport.requests.end(),
                                       [](const net::HttpRequest& r) { return ends_with(r.url, "/commit"); });
        auto commit_body = request_json(*commit_req);
        ASSERT_EQ(commit_body["endoflife"].get<std::string>(), std::string("use org.example.NewApp"),
                  "end of life forwarded");
        ASSERT_TRUE(commit_body["endoflife_rebase"].is_null(), "rebase unset");
        PASS();
    }
    {
        TEST(publish_without_commit_flag_skips_commit);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        transport.set_handler(build_service(missing_tree_and_files));
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        options.publish = true;
        auto data = pipeline.run(options);

        for (const auto& r : transport.requests) {
            ASSERT_TRUE(!ends_with(r.url, "/commit"), "no commit requested");
        }
        ASSERT_TRUE(!data.contains("commit_job"), "no commit job");
        ASSERT_EQ(data["publish_job"]["location"].get<std::string>(), JOB_BASE + "2", "publish started");
        PASS();
    }
    {
        TEST(failed_batch_retried_whole);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        auto service = build_service(missing_tree_and_files);
        int uploads = 0;
        transport.set_handler([service, &uploads](const net::HttpRequest& request) {
            if (ends_with(request.url, "/upload") && ++uploads == 1) {
                return json_response(500, {{"status", 500}, {"message", "try again"}});
            }
            return service(request);
        });
        BuildClient client(transport, waiter, "full");
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        options.branches = {fx.ref};
        pipeline.run(options);

        std::vector<size_t> upload_at;
        for (size_t i = 0; i < transport.requests.size(); ++i) {
            if (ends_with(transport.requests[i].url, "/upload")) upload_at.push_back(i);
        }
        ASSERT_TRUE(upload_at.size() >= 2, "failed batch sent again");
        ASSERT_EQ(upload_at[1], upload_at[0] + 1, "retry follows the failure");

        const auto& first = transport.requests[upload_at[0]].parts;
        const auto& again = transport.requests[upload_at[1]].parts;
        ASSERT_TRUE(!first.empty(), "batch has parts");
        ASSERT_EQ(first.size(), again.size(), "same number of parts");
        for (size_t i = 0; i < first.size(); ++i) {
            ASSERT_EQ(first[i].filename, again[i].filename, "same part name");
            ASSERT_EQ(first[i].path, again[i].path, "same part path");
            ASSERT_EQ(first[i].size, again[i].size, "same part size");
        }
        ASSERT_EQ(waiter.delays.size(), 1u, "one backoff");
        ASSERT_EQ(upload_at.size(), 4u, "three batches plus one retry");

        bool ref_built = false;
        for (const auto& r : transport.requests) {
            if (ends_with(r.url, "/build_ref")) ref_built = true;
        }
        ASSERT_TRUE(ref_built, "push continues to build_ref");
        PASS();
    }
    {
        TEST(failed_upload_aborts_push);
        AppFixture fx;
        FakeTransport transport;
        FakeWaiter waiter;
        auto service = build_service(missing_tree_and_files);
        transport.set_handler([service](const net::HttpRequest& request) {
            if (ends_with(request.url, "/upload")) {
                return json_response(500, {{"status", 500}, {"message", "disk full"}});
            }
            return service(request);
        });
        BuildClient client(transport, waiter, "full", no_retry());
        PushPipeline pipeline(client, fx.store);

        PushOptions options;
        options.build_url = BUILD_URL;
        bool thrown = false;
        try {
            pipeline.run(options);
        } catch (const ApiError& e) {
            thrown = true;
            ASSERT_EQ(e.status(), 500, "status kept");
            ASSERT_EQ(e.body()["message"].get<std::string>(), std::string("disk full"), "body kept");
        }
        ASSERT_TRUE(thrown, "ApiError expected");
        for (const auto& r : transport.requests) {
            ASSERT_TRUE(!ends_with(r.url, "/build_ref"), "no ref set after a failed upload");
        }
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Lazy upload parts
// ---------------------------------------------------------------------------

static void test_lazy_file() {
    std::cout << "\n=== Lazy file parts ===" << std::endl;

    auto tmpdir = make_temp_dir("flatpush-lazy");
    auto path = tmpdir / "object.filez";
    write_file(path, std::string(10, 'z'));

    {
        TEST(opens_on_first_read_and_closes_at_size);
        LazyFileReader reader(path, 10, 4);
        ASSERT_TRUE(!reader.is_open(), "not opened up front");

        char buf[16];
        ASSERT_EQ(reader.read(buf, sizeof(buf)), 4, "first block");
        ASSERT_TRUE(reader.is_open(), "open while streaming");
        ASSERT_EQ(reader.read(buf, sizeof(buf)), 4, "second block");
        ASSERT_EQ(reader.read(buf, sizeof(buf)), 2, "tail");
        ASSERT_TRUE(!reader.is_open(), "closed once size is reached");
        ASSERT_TRUE(reader.finished(), "finished");
        ASSERT_EQ(reader.bytes_read(), 10u, "bytes read");
        ASSERT_EQ(reader.read(buf, sizeof(buf)), 0, "eof after finish");
        PASS();
    }
    {
        TEST(rewind_restarts);
        LazyFileReader reader(path, 10);
        char buf[16];
        ASSERT_EQ(reader.read(buf, sizeof(buf)), 10, "whole file");
        reader.rewind();
        ASSERT_TRUE(!reader.finished() && reader.bytes_read() == 0, "reset");
        ASSERT_EQ(reader.read(buf, 3), 3, "reads again");
        PASS();
    }
    {
        TEST(missing_file_reports_error);
        LazyFileReader reader(tmpdir / "gone.filez", 10);
        char buf[4];
        ASSERT_EQ(reader.read(buf, sizeof(buf)), -1, "error");
        ASSERT_TRUE(reader.error().find("gone.filez") != std::string::npos, "error names file");
        PASS();
    }

    fs::remove_all(tmpdir);
}

int main() {
    std::cout << "flatpush transfer test suite" << std::endl;
    std::cout << "============================" << std::endl;

    test_missing_objects();
    test_upload_batches();
    test_deltas();
    test_lazy_file();
    test_push_pipeline();

    return report_results("Transfer");
}
