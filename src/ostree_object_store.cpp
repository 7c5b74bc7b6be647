// libostree-backed object store, built with -DFLATPUSH_WITH_OSTREE=ON
#include "flatpush/storage/object_store.hpp"
#include "flatpush/errors.hpp"

#include <ostree.h>

#include <algorithm>

namespace flatpush {

namespace {

std::string take_gerror(GError* error) {
    std::string message = error ? error->message : "unknown error";
    if (error) g_error_free(error);
    return message;
}

struct VariantDeleter {
    void operator()(GVariant* v) const { g_variant_unref(v); }
};
using VariantPtr = std::unique_ptr<GVariant, VariantDeleter>;

class OstreeObjectStore : public ObjectStore {
public:
    explicit OstreeObjectStore(const std::filesystem::path& path)
        : path_(std::filesystem::absolute(path)) {
        GFile* file = g_file_new_for_path(path_.c_str());
        repo_ = ostree_repo_new(file);
        g_object_unref(file);

        GError* error = nullptr;
        if (!ostree_repo_open(repo_, nullptr, &error)) {
            g_object_unref(repo_);
            repo_ = nullptr;
            throw UsageError("Can't open repo " + path.string() + ": " + take_gerror(error));
        }
    }

    ~OstreeObjectStore() override {
        if (repo_) g_object_unref(repo_);
    }

    OstreeObjectStore(const OstreeObjectStore&) = delete;
    OstreeObjectStore& operator=(const OstreeObjectStore&) = delete;

    std::string type_name() const override { return "libostree"; }

    const std::filesystem::path& path() const override { return path_; }

    std::optional<std::string> resolve_ref(const std::string& ref) const override {
        char* rev = nullptr;
        GError* error = nullptr;
        if (!ostree_repo_resolve_rev(repo_, ref.c_str(), TRUE, &rev, &error)) {
            throw ObjectStoreError("Failed to resolve " + ref + ": " + take_gerror(error));
        }
        if (!rev) return std::nullopt;
        std::string result(rev);
        g_free(rev);
        return result;
    }

    std::map<std::string, std::string> list_refs(
        const std::vector<std::string>& prefixes) const override {
        GHashTable* all_refs = nullptr;
        GError* error = nullptr;
        if (!ostree_repo_list_refs(repo_, nullptr, &all_refs, nullptr, &error)) {
            throw ObjectStoreError("Failed to list refs: " + take_gerror(error));
        }

        std::map<std::string, std::string> refs;
        GHashTableIter iter;
        gpointer key = nullptr;
        gpointer value = nullptr;
        g_hash_table_iter_init(&iter, all_refs);
        while (g_hash_table_iter_next(&iter, &key, &value)) {
            std::string name(static_cast<const char*>(key));
            bool wanted = prefixes.empty() ||
                std::any_of(prefixes.begin(), prefixes.end(),
                            [&](const std::string& p) { return name.starts_with(p); });
            if (wanted) {
                refs[name] = static_cast<const char*>(value);
            }
        }
        g_hash_table_unref(all_refs);
        return refs;
    }

    CommitObject load_commit(const std::string& checksum) const override {
        auto v = load_variant(OSTREE_OBJECT_TYPE_COMMIT, checksum);
        return parse_commit(checksum, bytes_of(v.get()));
    }

    DirTreeObject load_dirtree(const std::string& checksum) const override {
        auto v = load_variant(OSTREE_OBJECT_TYPE_DIR_TREE, checksum);
        return parse_dirtree(checksum, bytes_of(v.get()));
    }

    DirMetaObject load_dirmeta(const std::string& checksum) const override {
        auto v = load_variant(OSTREE_OBJECT_TYPE_DIR_META, checksum);
        return parse_dirmeta(checksum, bytes_of(v.get()));
    }

    std::vector<std::string> list_deltas() const override {
        GPtrArray* deltas = nullptr;
        GError* error = nullptr;
        if (!ostree_repo_list_static_delta_names(repo_, &deltas, nullptr, &error)) {
            throw ObjectStoreError("Failed to list deltas: " + take_gerror(error));
        }
        std::vector<std::string> names;
        names.reserve(deltas->len);
        for (guint i = 0; i < deltas->len; ++i) {
            names.emplace_back(static_cast<const char*>(g_ptr_array_index(deltas, i)));
        }
        g_ptr_array_unref(deltas);
        std::sort(names.begin(), names.end());
        return names;
    }

    std::filesystem::path object_path(const std::string& checksum,
                                      ObjectType type) const override {
        char* relative = ostree_get_relative_object_path(checksum.c_str(), to_ostree(type), TRUE);
        std::filesystem::path result = path_ / relative;
        g_free(relative);
        return result;
    }

private:
    static OstreeObjectType to_ostree(ObjectType type) {
        switch (type) {
            case ObjectType::File: return OSTREE_OBJECT_TYPE_FILE;
            case ObjectType::DirTree: return OSTREE_OBJECT_TYPE_DIR_TREE;
            case ObjectType::DirMeta: return OSTREE_OBJECT_TYPE_DIR_META;
            case ObjectType::Commit: return OSTREE_OBJECT_TYPE_COMMIT;
        }
        return OSTREE_OBJECT_TYPE_FILE;
    }

    static std::span<const uint8_t> bytes_of(GVariant* v) {
        return {static_cast<const uint8_t*>(g_variant_get_data(v)), g_variant_get_size(v)};
    }

    VariantPtr load_variant(OstreeObjectType type, const std::string& checksum) const {
        GVariant* v = nullptr;
        GError* error = nullptr;
        if (!ostree_repo_load_variant(repo_, type, checksum.c_str(), &v, &error)) {
            throw ObjectStoreError("Failed to load " + checksum + ": " + take_gerror(error));
        }
        return VariantPtr(v);
    }

    std::filesystem::path path_;
    OstreeRepo* repo_ = nullptr;
};

}  // namespace

std::unique_ptr<ObjectStore> create_ostree_object_store(const std::filesystem::path& path) {
    return std::make_unique<OstreeObjectStore>(path);
}

}  // namespace flatpush
