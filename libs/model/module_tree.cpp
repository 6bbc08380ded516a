/**
 * @file module_tree.cpp
 * @brief Flat per-file declarations -> module tree mirroring the input layout
 */

#include "tsgen/model.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <tuple>

namespace tsgen::model {

namespace {

[[nodiscard]] ModuleNode& directory_child(ModuleNode& parent, const std::string& segment)
{
    auto it = std::ranges::find_if(parent.children, [&segment](const ModuleNode& child) {
        return !child.is_file && child.segment == segment;
    });
    if (it != parent.children.end()) {
        return *it;
    }
    ModuleNode dir{.segment = segment,
                   .path = parent.path.empty() ? segment : parent.path + "/" + segment};
    parent.children.push_back(std::move(dir));
    return parent.children.back();
}

void sort_children(ModuleNode& node)
{
    std::ranges::stable_sort(node.children, [](const ModuleNode& a, const ModuleNode& b) {
        return std::tie(a.segment, a.is_file) < std::tie(b.segment, b.is_file);
    });
    for (auto& child : node.children) {
        sort_children(child);
    }
}

struct DeclarationCount
{
    std::size_t commands = 0;
    std::size_t types = 0;

    bool operator==(const DeclarationCount&) const = default;
};

[[nodiscard]] DeclarationCount count_declarations(const ModuleNode& node)
{
    DeclarationCount count{.commands = node.commands.size(), .types = node.types.size()};
    for (const auto& child : node.children) {
        const auto sub = count_declarations(child);
        count.commands += sub.commands;
        count.types += sub.types;
    }
    return count;
}

}  // namespace

tsgen::Result<ModuleNode> assemble_module_tree(std::vector<FileAnalysis>& files,
                                               std::vector<Diagnostic>& diagnostics)
{
    DeclarationCount expected;
    for (const auto& file : files) {
        expected.commands += file.commands.size();
        expected.types += file.types.size();
    }

    ModuleNode root;
    // directory path -> wrapper name -> file that claimed it
    std::map<std::string, std::map<std::string, std::string>> wrappers;

    for (auto& file : files) {
        if (!file.file.parsed) {
            continue;
        }
        const auto dirs = common::split_parent_segments(file.file.path).first;
        ModuleNode* parent = &root;
        for (const auto& dir : dirs) {
            parent = &directory_child(*parent, dir);
        }

        const std::string& stem = file.file.module_path.back();
        std::string wrapper = common::to_pascal_case(stem);
        if (!file.commands.empty()) {
            auto& claimed = wrappers[parent->path];
            if (auto it = claimed.find(wrapper); it != claimed.end()) {
                std::string candidate;
                for (int suffix = 2;; ++suffix) {
                    candidate = std::format("{}{}", wrapper, suffix);
                    if (!claimed.contains(candidate)) {
                        break;
                    }
                }
                diagnostics.push_back(Diagnostic::warning(
                    diag::kNameCollision,
                    SourceLocation{.file = file.file.path},
                    std::format("wrapper '{}' is already generated for {}; using '{}'",
                                wrapper,
                                it->second,
                                candidate)));
                wrapper = std::move(candidate);
            }
            claimed.emplace(wrapper, file.file.path);
        }

        parent->children.push_back(ModuleNode{.segment = stem,
                                              .path = parent->path,
                                              .is_file = true,
                                              .wrapper_name = std::move(wrapper),
                                              .source = file.file.path,
                                              .commands = std::move(file.commands),
                                              .types = std::move(file.types)});
        file.commands.clear();
        file.types.clear();
    }

    sort_children(root);

    if (const auto owned = count_declarations(root); owned != expected) {
        return std::unexpected(
            Error::make("InternalInvariantViolation",
                        std::format("{} commands and {} types were collected but the module tree owns {} and {}",
                                    expected.commands,
                                    expected.types,
                                    owned.commands,
                                    owned.types)));
    }
    return root;
}

}  // namespace tsgen::model
