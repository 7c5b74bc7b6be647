#include "flatpush/upload_scheduler.hpp"
#include "flatpush/build_client.hpp"
#include "flatpush/storage/object_store.hpp"

namespace flatpush {

std::vector<std::vector<UploadItem>> plan_upload_batches(const std::vector<UploadItem>& items,
                                                         uint64_t limit) {
    std::vector<std::vector<UploadItem>> batches;
    std::vector<UploadItem> pending;
    uint64_t pending_size = 0;

    for (const auto& item : items) {
        // Flush first if this item would bring the batch over the limit
        if (!pending.empty() && pending_size + item.size > limit) {
            batches.push_back(std::move(pending));
            pending.clear();
            pending_size = 0;
        }
        pending.push_back(item);
        pending_size += item.size;
    }
    if (!pending.empty()) {
        batches.push_back(std::move(pending));
    }
    return batches;
}

UploadScheduler::UploadScheduler(BuildClient& client, const ObjectStore& store, uint64_t batch_limit)
    : client_(client)
    , store_(store)
    , batch_limit_(batch_limit) {}

size_t UploadScheduler::upload_objects(const std::string& build_url,
                                       const std::vector<std::string>& names) {
    std::vector<UploadItem> items;
    items.reserve(names.size());
    for (const auto& name : names) {
        auto parsed = parse_object_name(name);
        if (!parsed) {
            throw ObjectStoreError("Invalid object name '" + name + "'");
        }
        const auto& [checksum, type] = *parsed;
        items.push_back({name, store_.object_path(checksum, type), store_.object_size(checksum, type)});
    }
    return upload_items(build_url, items);
}

size_t UploadScheduler::upload_items(const std::string& build_url,
                                     const std::vector<UploadItem>& items) {
    auto batches = plan_upload_batches(items, batch_limit_);
    for (const auto& batch : batches) {
        std::vector<net::FilePart> parts;
        parts.reserve(batch.size());
        for (const auto& item : batch) {
            parts.push_back({item.name, item.path, item.size});
        }
        client_.upload_files(build_url, parts);
    }
    return batches.size();
}

}  // namespace flatpush
