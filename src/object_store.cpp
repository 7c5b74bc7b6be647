#include "flatpush/storage/object_store.hpp"
#include "flatpush/delta_name.hpp"
#include "flatpush/errors.hpp"
#include "flatpush/gvariant.hpp"
#include "flatpush/log.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace flatpush {

#ifdef FLATPUSH_HAVE_OSTREE
// Defined in ostree_object_store.cpp
std::unique_ptr<ObjectStore> create_ostree_object_store(const std::filesystem::path& path);
#endif

namespace gv = gvariant;

const char* object_type_suffix(ObjectType type) {
    switch (type) {
        case ObjectType::File: return "filez";
        case ObjectType::DirTree: return "dirtree";
        case ObjectType::DirMeta: return "dirmeta";
        case ObjectType::Commit: return "commit";
    }
    return "unknown";
}

std::string object_name(const std::string& checksum, ObjectType type) {
    return checksum + "." + object_type_suffix(type);
}

std::optional<std::pair<std::string, ObjectType>> parse_object_name(const std::string& name) {
    auto dot = name.find('.');
    if (dot == std::string::npos) return std::nullopt;
    auto checksum = name.substr(0, dot);
    if (!is_valid_checksum(checksum)) return std::nullopt;

    const auto suffix = name.substr(dot + 1);
    for (auto type : {ObjectType::File, ObjectType::DirTree, ObjectType::DirMeta, ObjectType::Commit}) {
        if (suffix == object_type_suffix(type)) {
            return std::make_pair(std::move(checksum), type);
        }
    }
    return std::nullopt;
}

bool is_valid_checksum(const std::string& checksum) {
    if (checksum.size() != 64) return false;
    return std::all_of(checksum.begin(), checksum.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

// --- Payload decoders ---

namespace {

const gv::Member VAR{1, 0};
const gv::Member VAR8{8, 0};
const gv::Member U32{4, 4};
const gv::Member U64{8, 8};

std::string checksum_from_bytes(gv::View bytes, const std::string& owner, bool allow_empty) {
    if (bytes.empty() && allow_empty) return {};
    if (bytes.size() != 32) {
        throw ObjectStoreError("Invalid checksum of length " + std::to_string(bytes.size()) +
                               " in object " + owner);
    }
    return gv::to_hex(bytes);
}

}  // namespace

CommitObject parse_commit(const std::string& checksum, std::span<const uint8_t> data) {
    try {
        // (a{sv}aya(say)sstayay)
        auto fields = gv::split_tuple(data, {VAR8, VAR, VAR, VAR, VAR, U64, VAR, VAR});
        CommitObject commit;
        commit.checksum = checksum;
        commit.parent = checksum_from_bytes(fields[1], checksum, true);
        commit.subject = gv::read_string(fields[3]);
        commit.body = gv::read_string(fields[4]);
        commit.timestamp = gv::read_u64_be(fields[5]);
        commit.root_contents = checksum_from_bytes(fields[6], checksum, false);
        commit.root_metadata = checksum_from_bytes(fields[7], checksum, false);
        return commit;
    } catch (const gv::FormatError& e) {
        throw ObjectStoreError("Malformed commit " + checksum + ": " + e.what());
    }
}

DirTreeObject parse_dirtree(const std::string& checksum, std::span<const uint8_t> data) {
    try {
        // (a(say)a(sayay))
        auto fields = gv::split_tuple(data, {VAR, VAR});
        DirTreeObject tree;
        tree.checksum = checksum;

        for (auto entry : gv::split_array(fields[0])) {
            auto parts = gv::split_tuple(entry, {VAR, VAR});
            tree.files.push_back({gv::read_string(parts[0]),
                                  checksum_from_bytes(parts[1], checksum, false)});
        }
        for (auto entry : gv::split_array(fields[1])) {
            auto parts = gv::split_tuple(entry, {VAR, VAR, VAR});
            tree.dirs.push_back({gv::read_string(parts[0]),
                                 checksum_from_bytes(parts[1], checksum, false),
                                 checksum_from_bytes(parts[2], checksum, false)});
        }
        return tree;
    } catch (const gv::FormatError& e) {
        throw ObjectStoreError("Malformed dirtree " + checksum + ": " + e.what());
    }
}

DirMetaObject parse_dirmeta(const std::string& checksum, std::span<const uint8_t> data) {
    try {
        // (uuua(ayay)), integers stored big-endian
        auto fields = gv::split_tuple(data, {U32, U32, U32, VAR});
        DirMetaObject meta;
        meta.checksum = checksum;
        meta.uid = gv::read_u32_be(fields[0]);
        meta.gid = gv::read_u32_be(fields[1]);
        meta.mode = gv::read_u32_be(fields[2]);
        return meta;
    } catch (const gv::FormatError& e) {
        throw ObjectStoreError("Malformed dirmeta " + checksum + ": " + e.what());
    }
}

// --- ObjectStore defaults ---

uint64_t ObjectStore::object_size(const std::string& checksum, ObjectType type) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(object_path(checksum, type), ec);
    if (ec) {
        throw ObjectStoreError("Cannot stat object " + object_name(checksum, type) + ": " +
                               ec.message());
    }
    return size;
}

std::filesystem::path ObjectStore::delta_dir(const std::string& delta_name) const {
    auto encoded = delta_name_encode(delta_name);
    return path() / "deltas" / encoded.substr(0, 2) / encoded.substr(2);
}

namespace {

std::string sha256_hex(const std::vector<uint8_t>& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return gv::to_hex(gv::View(digest, digest_len));
}

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

bool has_any_prefix(const std::string& name, const std::vector<std::string>& prefixes) {
    if (prefixes.empty()) return true;
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](const std::string& p) { return name.starts_with(p); });
}

// Reads the repository layout directly:
//   refs/heads/<ref>, refs/remotes/<remote>/<ref>
//   objects/<2 hex>/<62 hex>.<suffix>
//   deltas/<2 chars>/<rest of encoded name>/<part>
class OnDiskObjectStore : public ObjectStore {
public:
    explicit OnDiskObjectStore(const std::filesystem::path& path)
        : path_(std::filesystem::absolute(path)) {
        std::error_code ec;
        if (!std::filesystem::is_directory(path_ / "objects", ec) ||
            !std::filesystem::exists(path_ / "config", ec)) {
            throw UsageError("Can't open repo " + path.string() + ": not an OSTree repository");
        }
    }

    std::string type_name() const override { return "on-disk"; }

    const std::filesystem::path& path() const override { return path_; }

    std::optional<std::string> resolve_ref(const std::string& ref) const override {
        if (is_valid_checksum(ref)) {
            return ref;
        }

        std::filesystem::path ref_file;
        auto colon = ref.find(':');
        if (colon != std::string::npos) {
            ref_file = path_ / "refs" / "remotes" / ref.substr(0, colon) / ref.substr(colon + 1);
        } else {
            ref_file = path_ / "refs" / "heads" / ref;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(ref_file, ec)) {
            return std::nullopt;
        }
        return read_ref_file(ref_file, ref);
    }

    std::map<std::string, std::string> list_refs(
        const std::vector<std::string>& prefixes) const override {
        std::map<std::string, std::string> refs;

        collect_refs(path_ / "refs" / "heads", "", prefixes, refs);

        std::error_code ec;
        auto remotes = path_ / "refs" / "remotes";
        if (std::filesystem::is_directory(remotes, ec)) {
            for (const auto& remote : std::filesystem::directory_iterator(remotes, ec)) {
                if (!remote.is_directory()) continue;
                collect_refs(remote.path(), remote.path().filename().string() + ":", prefixes, refs);
            }
        }
        return refs;
    }

    CommitObject load_commit(const std::string& checksum) const override {
        return parse_commit(checksum, read_verified(checksum, ObjectType::Commit));
    }

    DirTreeObject load_dirtree(const std::string& checksum) const override {
        return parse_dirtree(checksum, read_verified(checksum, ObjectType::DirTree));
    }

    DirMetaObject load_dirmeta(const std::string& checksum) const override {
        return parse_dirmeta(checksum, read_verified(checksum, ObjectType::DirMeta));
    }

    std::vector<std::string> list_deltas() const override {
        std::vector<std::string> names;
        std::error_code ec;
        auto deltas = path_ / "deltas";
        if (!std::filesystem::is_directory(deltas, ec)) {
            return names;
        }

        for (const auto& prefix_dir : std::filesystem::directory_iterator(deltas, ec)) {
            if (!prefix_dir.is_directory()) continue;
            const auto prefix = prefix_dir.path().filename().string();
            for (const auto& delta_dir : std::filesystem::directory_iterator(prefix_dir.path(), ec)) {
                if (!delta_dir.is_directory()) continue;
                const auto encoded = prefix + delta_dir.path().filename().string();
                try {
                    names.push_back(delta_name_decode(encoded));
                } catch (const std::invalid_argument& e) {
                    log_debug("Ignoring unexpected entry %s in deltas: %s",
                              delta_dir.path().c_str(), e.what());
                }
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    std::filesystem::path object_path(const std::string& checksum,
                                      ObjectType type) const override {
        if (!is_valid_checksum(checksum)) {
            throw ObjectStoreError("Invalid object checksum '" + checksum + "'");
        }
        return path_ / "objects" / checksum.substr(0, 2) /
               (checksum.substr(2) + "." + object_type_suffix(type));
    }

private:
    std::string read_ref_file(const std::filesystem::path& file, const std::string& ref) const {
        std::ifstream in(file);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (!in && !in.eof()) {
            throw ObjectStoreError("Failed to read ref " + ref);
        }
        content = trim(std::move(content));
        if (!is_valid_checksum(content)) {
            throw ObjectStoreError("Ref " + ref + " does not point to a valid checksum");
        }
        return content;
    }

    void collect_refs(const std::filesystem::path& root,
                      const std::string& name_prefix,
                      const std::vector<std::string>& prefixes,
                      std::map<std::string, std::string>& out) const {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) return;

        for (const auto& entry : std::filesystem::recursive_directory_iterator(root, ec)) {
            if (!entry.is_regular_file()) continue;
            auto name = name_prefix + entry.path().lexically_relative(root).generic_string();
            if (!has_any_prefix(name, prefixes)) continue;
            out[name] = read_ref_file(entry.path(), name);
        }
    }

    // Metadata objects are named by the SHA-256 of their serialized bytes
    std::vector<uint8_t> read_verified(const std::string& checksum, ObjectType type) const {
        auto file = object_path(checksum, type);
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            throw ObjectStoreError("Object not found: " + object_name(checksum, type));
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                                  std::istreambuf_iterator<char>());

        auto actual = sha256_hex(data);
        if (actual != checksum) {
            throw ObjectStoreError("Corrupted object " + object_name(checksum, type) +
                                   ": actual checksum " + actual);
        }
        return data;
    }

    std::filesystem::path path_;
};

}  // namespace

// --- Factory ---

bool ObjectStoreFactory::native_available() {
#ifdef FLATPUSH_HAVE_OSTREE
    return true;
#else
    return false;
#endif
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::open_on_disk(const std::filesystem::path& path) {
    return std::make_unique<OnDiskObjectStore>(path);
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::open_native(const std::filesystem::path& path) {
#ifdef FLATPUSH_HAVE_OSTREE
    return create_ostree_object_store(path);
#else
    throw UsageError("Can't open repo " + path.string() +
                     ": flatpush was built without libostree support");
#endif
}

std::unique_ptr<ObjectStore> ObjectStoreFactory::open(const std::filesystem::path& path,
                                                      ObjectStoreBackend backend) {
    std::unique_ptr<ObjectStore> store;
    switch (backend) {
        case ObjectStoreBackend::Native:
            store = open_native(path);
            break;
        case ObjectStoreBackend::OnDisk:
            store = open_on_disk(path);
            break;
        case ObjectStoreBackend::Auto:
            store = native_available() ? open_native(path) : open_on_disk(path);
            break;
    }
    log_debug("Opened %s object store at %s", store->type_name().c_str(), path.c_str());
    return store;
}

}  // namespace flatpush
