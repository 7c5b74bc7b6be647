#include "flatpush/reachability.hpp"

namespace flatpush {

namespace {

constexpr const char DIRTREE_SUFFIX[] = ".dirtree";

}  // namespace

ReachabilityWalker::ReachabilityWalker(const ObjectStore& store)
    : store_(store) {}

void ReachabilityWalker::add_object(const std::string& name) {
    if (result_set_.insert(name).second) {
        result_.push_back(name);
    }
}

bool ReachabilityWalker::enter_tree(const std::string& tree, const std::string& meta,
                                    std::vector<size_t>& stack) {
    // The DirMeta belongs to this occurrence of the tree, record it even
    // when the tree itself was already processed under another parent.
    add_object(object_name(meta, ObjectType::DirMeta));

    auto [it, inserted] = tree_index_.emplace(tree, nodes_.size());
    if (!inserted) {
        return false;
    }
    nodes_.push_back({tree, meta});
    add_object(object_name(tree, ObjectType::DirTree));
    stack.push_back(it->second);
    return true;
}

std::vector<std::string> ReachabilityWalker::needed_metadata(const std::vector<std::string>& commits) {
    result_.clear();
    result_set_.clear();
    nodes_.clear();
    tree_index_.clear();
    dirtrees_visited_ = 0;

    std::vector<size_t> stack;
    for (const auto& checksum : commits) {
        auto name = object_name(checksum, ObjectType::Commit);
        if (result_set_.count(name)) continue;
        add_object(name);

        auto commit = store_.load_commit(checksum);
        enter_tree(commit.root_contents, commit.root_metadata, stack);

        while (!stack.empty()) {
            const size_t index = stack.back();
            stack.pop_back();

            // Copy: enter_tree() may grow the arena
            const auto tree_checksum = nodes_[index].tree_checksum;
            auto tree = store_.load_dirtree(tree_checksum);
            ++dirtrees_visited_;

            // Reverse push keeps children in their stored order
            for (auto dir = tree.dirs.rbegin(); dir != tree.dirs.rend(); ++dir) {
                enter_tree(dir->tree_checksum, dir->meta_checksum, stack);
            }
        }
    }
    return result_;
}

std::vector<std::string> ReachabilityWalker::needed_files(const std::vector<std::string>& metadata_names) {
    std::vector<std::string> files;
    std::unordered_set<std::string> seen;

    for (const auto& name : metadata_names) {
        if (!name.ends_with(DIRTREE_SUFFIX)) continue;
        auto checksum = name.substr(0, name.size() - (sizeof(DIRTREE_SUFFIX) - 1));

        auto tree = store_.load_dirtree(checksum);
        for (const auto& file : tree.files) {
            auto file_name = object_name(file.checksum, ObjectType::File);
            if (seen.insert(file_name).second) {
                files.push_back(std::move(file_name));
            }
        }
    }
    return files;
}

}  // namespace flatpush
