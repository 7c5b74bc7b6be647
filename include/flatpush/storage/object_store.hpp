#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flatpush {

// Kinds of content-addressed objects
enum class ObjectType {
    File,
    DirTree,
    DirMeta,
    Commit
};

// Wire/disk suffix: "filez", "dirtree", "dirmeta", "commit"
const char* object_type_suffix(ObjectType type);

// "<checksum>.<suffix>", the name the build service knows an object by
std::string object_name(const std::string& checksum, ObjectType type);

// Split "<checksum>.<suffix>"; nullopt for an unknown suffix or bad checksum
std::optional<std::pair<std::string, ObjectType>> parse_object_name(const std::string& name);

// 64 lowercase hex digits
bool is_valid_checksum(const std::string& checksum);

// Failure to read or decode a local object
class ObjectStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CommitObject {
    std::string checksum;
    std::string parent;          // Empty for the first commit of a branch
    std::string subject;
    std::string body;
    uint64_t timestamp = 0;      // Seconds since epoch
    std::string root_contents;   // DirTree checksum
    std::string root_metadata;   // DirMeta checksum
};

struct DirTreeFile {
    std::string name;
    std::string checksum;
};

struct DirTreeSubdir {
    std::string name;
    std::string tree_checksum;
    std::string meta_checksum;
};

struct DirTreeObject {
    std::string checksum;
    std::vector<DirTreeFile> files;
    std::vector<DirTreeSubdir> dirs;
};

struct DirMetaObject {
    std::string checksum;
    uint32_t uid = 0;
    uint32_t gid = 0;
    uint32_t mode = 0;
};

// Decoders for the serialized object payloads, shared by all store variants.
// Throw ObjectStoreError when the payload is malformed.
CommitObject parse_commit(const std::string& checksum, std::span<const uint8_t> data);
DirTreeObject parse_dirtree(const std::string& checksum, std::span<const uint8_t> data);
DirMetaObject parse_dirmeta(const std::string& checksum, std::span<const uint8_t> data);

// Read-only view over a local content-addressed commit repository
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Store variant name (for logging)
    virtual std::string type_name() const = 0;

    virtual const std::filesystem::path& path() const = 0;

    // Resolve a ref (or a full checksum) to a commit checksum
    virtual std::optional<std::string> resolve_ref(const std::string& ref) const = 0;

    // Every local ref starting with one of `prefixes` (all refs when empty)
    virtual std::map<std::string, std::string> list_refs(
        const std::vector<std::string>& prefixes = {}) const = 0;

    virtual CommitObject load_commit(const std::string& checksum) const = 0;
    virtual DirTreeObject load_dirtree(const std::string& checksum) const = 0;
    virtual DirMetaObject load_dirmeta(const std::string& checksum) const = 0;

    // Decoded names of every static delta in the repository
    virtual std::vector<std::string> list_deltas() const = 0;

    // On-disk location of an object
    virtual std::filesystem::path object_path(const std::string& checksum,
                                              ObjectType type) const = 0;

    // Size in bytes of an object as it would be uploaded
    virtual uint64_t object_size(const std::string& checksum, ObjectType type) const;

    // Directory holding the parts of a static delta (decoded name)
    virtual std::filesystem::path delta_dir(const std::string& delta_name) const;
};

// Store variant selection
enum class ObjectStoreBackend {
    Auto,     // libostree when built in, on-disk reader otherwise
    Native,   // libostree
    OnDisk    // Direct reader of the repository layout
};

class ObjectStoreFactory {
public:
    // Open an existing repository; throws UsageError when `path` is not one
    static std::unique_ptr<ObjectStore> open(
        const std::filesystem::path& path,
        ObjectStoreBackend backend = ObjectStoreBackend::Auto);

    static std::unique_ptr<ObjectStore> open_on_disk(const std::filesystem::path& path);

    // Throws UsageError when libostree support was not compiled in
    static std::unique_ptr<ObjectStore> open_native(const std::filesystem::path& path);

    static bool native_available();
};

}  // namespace flatpush
