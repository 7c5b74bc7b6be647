#pragma once

#include "flatpush/upload_scheduler.hpp"

#include <map>
#include <string>
#include <vector>

namespace flatpush {

class BuildClient;
class ObjectStore;

/// True if `id` (the second component of an app/runtime ref) matches one of
/// the shell-style `globs`.
bool should_skip_delta(const std::string& id, const std::vector<std::string>& globs);

/// Uploads from-scratch static deltas of the pushed app and runtime refs.
///
/// Only a delta named exactly after the pushed commit is sent: the build
/// service cannot be assumed to hold the source of an incremental delta.
class DeltaUploader {
public:
    DeltaUploader(BuildClient& client, const ObjectStore& store);

    /// Delta part files to upload for `refs` (ref -> commit), named
    /// "<encoded delta name>.<part>.delta".
    std::vector<UploadItem> select_delta_parts(const std::map<std::string, std::string>& refs,
                                               const std::vector<std::string>& ignore_globs) const;

    /// Upload every selected part in a single request. Returns the part count.
    size_t upload_deltas(const std::string& build_url,
                         const std::map<std::string, std::string>& refs,
                         const std::vector<std::string>& ignore_globs);

private:
    BuildClient& client_;
    const ObjectStore& store_;
};

}  // namespace flatpush
