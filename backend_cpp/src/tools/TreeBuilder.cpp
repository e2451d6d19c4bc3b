#include "tools/TreeBuilder.hpp"
#include "utils/NaturalOrder.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace fs = std::filesystem;

namespace {

struct DirEntryInfo {
    std::string name;
    fs::path path;
    bool is_dir = false;
};

}

TreeListing TreeBuilder::build_tree(const fs::path& root) {
    return build_tree(root, IgnorePolicy::for_root(root));
}

TreeListing TreeBuilder::build_tree(const fs::path& root, const IgnorePolicy& policy) {
    std::set<fs::path> ancestry;
    std::error_code ec;
    fs::path canonical_root = fs::canonical(root, ec);
    ancestry.insert(ec ? root : canonical_root);
    return walk(root, policy, ancestry);
}

TreeListing TreeBuilder::walk(const fs::path& dir, const IgnorePolicy& policy, std::set<fs::path>& ancestry) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw TreeBuildError("Failed to read directory: " + ec.message());
    }

    // 1. Collect non-ignored entries
    std::vector<DirEntryInfo> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw TreeBuildError("Directory entry error: " + ec.message());
        }

        DirEntryInfo info;
        info.path = it->path();
        if (!info.path.is_absolute()) info.path = dir / info.path;
        info.name = info.path.filename().string();

        std::error_code type_ec;
        info.is_dir = it->is_directory(type_ec);  // follows symlinks

        if (policy.is_ignored(info.path, info.is_dir)) continue;
        entries.push_back(std::move(info));
    }
    if (ec) {
        throw TreeBuildError("Directory entry error: " + ec.message());
    }

    // 2. Directories first, then natural order
    std::sort(entries.begin(), entries.end(), [](const DirEntryInfo& a, const DirEntryInfo& b) {
        return directory_first_less(a.is_dir, a.name, b.is_dir, b.name);
    });

    // 3. Recurse; folders that end up empty are dropped
    TreeListing listing;
    for (auto& entry : entries) {
        if (!entry.is_dir) {
            listing.push_back(TreeNode{NodeType::File, entry.name, entry.path.string(), {}});
            continue;
        }

        std::error_code canon_ec;
        fs::path canonical = fs::canonical(entry.path, canon_ec);
        if (canon_ec) {
            spdlog::warn("⚠️ Skipping directory {}: {}", entry.path.string(), canon_ec.message());
            continue;
        }
        if (ancestry.count(canonical)) {
            spdlog::warn("🔁 Skipping directory {}: link cycle back to {}", entry.path.string(), canonical.string());
            continue;
        }

        ancestry.insert(canonical);
        try {
            TreeListing children = walk(entry.path, policy.descend(entry.path), ancestry);
            if (!children.empty()) {
                listing.push_back(TreeNode{NodeType::Folder, entry.name, entry.path.string(), std::move(children)});
            }
        } catch (const TreeBuildError& e) {
            spdlog::warn("⚠️ Skipping directory {}: {}", entry.path.string(), e.what());
        }
        ancestry.erase(canonical);
    }

    return listing;
}

nlohmann::ordered_json TreeBuilder::to_json(const TreeListing& listing) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& node : listing) {
        nlohmann::ordered_json j;
        j["type"] = node.is_folder() ? "folder" : "file";
        j["path"] = node.path;
        if (node.is_folder()) {
            j["children"] = to_json(node.children);
        } else {
            j["children"] = nullptr;
        }
        out[node.name] = std::move(j);
    }
    return out;
}

}
