#include "flatpush/delta_uploader.hpp"
#include "flatpush/build_client.hpp"
#include "flatpush/delta_name.hpp"
#include "flatpush/log.hpp"
#include "flatpush/storage/object_store.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace flatpush {

namespace {

std::vector<std::string> split_ref(const std::string& ref) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto slash = ref.find('/', start);
        parts.push_back(ref.substr(start, slash == std::string::npos ? slash : slash - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return parts;
}

}  // namespace

bool should_skip_delta(const std::string& id, const std::vector<std::string>& globs) {
    return std::any_of(globs.begin(), globs.end(), [&](const std::string& glob) {
        return fnmatch(glob.c_str(), id.c_str(), 0) == 0;
    });
}

DeltaUploader::DeltaUploader(BuildClient& client, const ObjectStore& store)
    : client_(client)
    , store_(store) {}

std::vector<UploadItem> DeltaUploader::select_delta_parts(
    const std::map<std::string, std::string>& refs,
    const std::vector<std::string>& ignore_globs) const {
    std::vector<UploadItem> items;

    auto names = store_.list_deltas();
    if (names.empty()) return items;
    const std::set<std::string> deltas(names.begin(), names.end());

    for (const auto& [ref, commit] : refs) {
        // A from-scratch delta is named after its target commit alone
        if (!deltas.count(commit)) continue;
        if (!ref.starts_with("app/") && !ref.starts_with("runtime/")) continue;

        auto parts = split_ref(ref);
        if (parts.size() != 4) continue;
        if (should_skip_delta(parts[1], ignore_globs)) {
            log_debug("Skipping delta for %s", ref.c_str());
            continue;
        }

        const auto encoded = delta_name_encode(commit);
        log_info(" %s: %s", ref.c_str(), encoded.c_str());

        const auto dir = store_.delta_dir(commit);
        std::vector<std::filesystem::path> files;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (entry.is_regular_file()) files.push_back(entry.path());
        }
        if (ec) {
            throw ObjectStoreError("Cannot list delta " + dir.string() + ": " + ec.message());
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            const auto size = std::filesystem::file_size(file, ec);
            if (ec) {
                throw ObjectStoreError("Cannot stat " + file.string() + ": " + ec.message());
            }
            items.push_back({encoded + "." + file.filename().string() + ".delta", file, size});
        }
    }
    return items;
}

size_t DeltaUploader::upload_deltas(const std::string& build_url,
                                    const std::map<std::string, std::string>& refs,
                                    const std::vector<std::string>& ignore_globs) {
    auto items = select_delta_parts(refs, ignore_globs);
    if (items.empty()) return 0;

    std::vector<net::FilePart> parts;
    parts.reserve(items.size());
    for (const auto& item : items) {
        parts.push_back({item.name, item.path, item.size});
    }
    client_.upload_files(build_url, parts);
    return parts.size();
}

}  // namespace flatpush
