#pragma once
#include <string>
#include <vector>
#include <set>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "tools/IgnorePolicy.hpp"

namespace repopatch {

enum class NodeType { File, Folder };

struct TreeNode {
    NodeType type = NodeType::File;
    std::string name;
    std::string path;                 // absolute
    std::vector<TreeNode> children;   // folders only, directory-first natural order

    bool is_folder() const { return type == NodeType::Folder; }
};

// Sibling nodes of one directory, already sorted.
using TreeListing = std::vector<TreeNode>;

// Failure to enumerate the walk root itself
class TreeBuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TreeBuilder {
public:
    // Throws TreeBuildError when `root` cannot be enumerated. Problems below
    // the root drop the affected subdirectory and are logged.
    static TreeListing build_tree(const std::filesystem::path& root);

    static TreeListing build_tree(const std::filesystem::path& root, const IgnorePolicy& policy);

    // {"name": {"type": "file"|"folder", "path": ..., "children": {...}|null}, ...}
    static nlohmann::ordered_json to_json(const TreeListing& listing);

private:
    static TreeListing walk(const std::filesystem::path& dir,
                            const IgnorePolicy& policy,
                            std::set<std::filesystem::path>& ancestry);
};

}
