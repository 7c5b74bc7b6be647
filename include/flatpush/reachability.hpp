#pragma once

#include "flatpush/storage/object_store.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace flatpush {

/// Computes the object closure of a set of commits.
///
/// DirTrees are content addressed and heavily shared between commits and
/// parents, so every DirTree is loaded at most once per needed_metadata() call: once its
/// checksum is in the visited index its whole subtree is known to be in the
/// result already.
class ReachabilityWalker {
public:
    explicit ReachabilityWalker(const ObjectStore& store);

    /// Names ("<csum>.commit", ".dirtree", ".dirmeta") of every metadata
    /// object reachable from `commits`, without duplicates, in discovery order.
    std::vector<std::string> needed_metadata(const std::vector<std::string>& commits);

    /// Names ("<csum>.filez") of the files referenced directly by the DirTree
    /// objects among `metadata_names`. Other names are ignored.
    std::vector<std::string> needed_files(const std::vector<std::string>& metadata_names);

    /// Number of DirTree objects loaded by the last needed_metadata() call
    size_t dirtrees_visited() const { return dirtrees_visited_; }

private:
    struct TreeNode {
        std::string tree_checksum;
        std::string meta_checksum;
    };

    // Registers a (dirtree, dirmeta) pair; returns false if the tree was seen before
    bool enter_tree(const std::string& tree, const std::string& meta,
                    std::vector<size_t>& stack);
    void add_object(const std::string& name);

    const ObjectStore& store_;

    // Arena of discovered trees plus checksum -> arena index
    std::vector<TreeNode> nodes_;
    std::unordered_map<std::string, size_t> tree_index_;

    std::vector<std::string> result_;
    std::unordered_set<std::string> result_set_;
    size_t dirtrees_visited_ = 0;
};

}  // namespace flatpush
