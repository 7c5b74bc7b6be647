#pragma once

#include "flatpush/constants.hpp"
#include "flatpush/net/http.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace flatpush {

class BuildClient;
class ObjectStore;

// One file to upload under its remote name
struct UploadItem {
    std::string name;
    std::filesystem::path path;
    uint64_t size = 0;
};

/// Split `items` (order preserved) into batches whose summed size stays
/// within `limit`. An item larger than `limit` travels alone.
std::vector<std::vector<UploadItem>> plan_upload_batches(const std::vector<UploadItem>& items,
                                                         uint64_t limit);

/// Sends objects of the local store to a build, one bounded batch at a time.
class UploadScheduler {
public:
    UploadScheduler(BuildClient& client, const ObjectStore& store,
                    uint64_t batch_limit = constants::UPLOAD_CHUNK_LIMIT);

    /// Upload objects given by name ("<checksum>.<kind>"). Returns the number
    /// of upload requests sent.
    size_t upload_objects(const std::string& build_url, const std::vector<std::string>& names);

    /// Upload arbitrary files, batched the same way.
    size_t upload_items(const std::string& build_url, const std::vector<UploadItem>& items);

private:
    BuildClient& client_;
    const ObjectStore& store_;
    uint64_t batch_limit_;
};

}  // namespace flatpush
