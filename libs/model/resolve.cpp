/**
 * @file resolve.cpp
 * @brief Second-pass resolution of forward type references
 */

#include "tsgen/model.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <ranges>
#include <set>

namespace tsgen::model {

namespace {

struct Candidate
{
    std::string id;
    std::string module;
    std::vector<std::string> module_path;
    bool derives_serialize = false;
    bool derives_deserialize = false;
};

/// The module segments written before a referenced type name.
struct Qualifier
{
    std::vector<std::string> segments;  ///< without crate/self/super
    bool qualified = false;
    bool crate_local = false;  ///< starts with crate, self or super
    bool self_relative = false;
};

[[nodiscard]] Qualifier reference_qualifier(std::string_view path)
{
    Qualifier qualifier;
    for (auto part : path | std::views::split(std::string_view("::"))) {
        qualifier.segments.emplace_back(part.begin(), part.end());
    }
    if (!qualifier.segments.empty()) {
        qualifier.segments.pop_back();
    }
    if (qualifier.segments.empty()) {
        return qualifier;
    }
    qualifier.qualified = true;
    const auto& head = qualifier.segments.front();
    qualifier.crate_local = head == "crate" || head == "self" || head == "super";
    qualifier.self_relative = head == "self";
    std::erase_if(qualifier.segments, [](const std::string& s) {
        return s == "crate" || s == "self" || s == "super";
    });
    return qualifier;
}

[[nodiscard]] bool ends_with(const std::vector<std::string>& haystack,
                             const std::vector<std::string>& suffix)
{
    if (suffix.size() > haystack.size()) {
        return false;
    }
    return std::ranges::equal(haystack | std::views::drop(haystack.size() - suffix.size()), suffix);
}

/**
 * Declarations by bare name, in scan order.
 */
class ReferenceIndex
{
public:
    explicit ReferenceIndex(const std::vector<FileAnalysis>& files)
    {
        for (const auto& file : files) {
            for (const auto& decl : file.types) {
                auto module_path = file.file.module_path;
                // a/mod.rs is module a; lib.rs and main.rs are the crate root
                if (!module_path.empty()
                    && (module_path.back() == "mod" || module_path.back() == "lib"
                        || module_path.back() == "main")) {
                    module_path.pop_back();
                }
                m_by_name[decl.name].push_back(Candidate{.id = decl.id,
                                                         .module = decl.module,
                                                         .module_path = std::move(module_path),
                                                         .derives_serialize = decl.derives_serialize,
                                                         .derives_deserialize = decl.derives_deserialize});
                m_by_id[decl.id] = m_by_name[decl.name].back();
            }
        }
    }

    [[nodiscard]] const Candidate* find(const types::TypeDescriptor& ref,
                                        const std::string& from_module) const
    {
        auto it = m_by_name.find(ref.name);
        if (it == m_by_name.end() || it->second.empty()) {
            return nullptr;
        }
        const auto& candidates = it->second;
        const auto qualifier = reference_qualifier(ref.path);
        const auto same_file = [&]() -> const Candidate* {
            auto same = std::ranges::find(candidates, from_module, &Candidate::module);
            return same == candidates.end() ? nullptr : &*same;
        };

        if (!qualifier.qualified) {
            if (const auto* local = same_file()) {
                return local;
            }
            return &candidates.front();
        }
        if (qualifier.self_relative && qualifier.segments.empty()) {
            if (const auto* local = same_file()) {
                return local;
            }
        }
        if (!qualifier.segments.empty()) {
            for (const auto& candidate : candidates) {
                if (ends_with(candidate.module_path, qualifier.segments)) {
                    return &candidate;
                }
            }
        }
        // serde_json::Value, anyhow::Error: another crate's type, not ours
        if (!qualifier.crate_local) {
            return nullptr;
        }
        return &candidates.front();
    }

    [[nodiscard]] const Candidate* by_id(const std::string& id) const
    {
        auto it = m_by_id.find(id);
        return it == m_by_id.end() ? nullptr : &it->second;
    }

private:
    std::map<std::string, std::vector<Candidate>> m_by_name;
    std::map<std::string, Candidate> m_by_id;
};

void resolve_descriptor(types::TypeDescriptor& type,
                        const ReferenceIndex& index,
                        const std::string& from_module,
                        const SourceLocation& location,
                        std::vector<Diagnostic>& diagnostics)
{
    types::visit(type, [&](types::TypeDescriptor& node) {
        if (node.kind != types::TypeDescriptor::Kind::kNamedRef || node.target.has_value()) {
            return;
        }
        if (const auto* candidate = index.find(node, from_module)) {
            node.target = candidate->id;
            return;
        }
        diagnostics.push_back(Diagnostic::warning(
            diag::kUnsupportedType,
            location,
            std::format("type '{}' is not declared in any scanned file", node.path)));
        node = types::TypeDescriptor::make_unsupported(node.path);
    });
}

[[nodiscard]] std::set<std::string> referenced_ids(const types::TypeDescriptor& type)
{
    std::set<std::string> ids;
    types::visit(type, [&ids](const types::TypeDescriptor& node) {
        if (node.target.has_value()) {
            ids.insert(*node.target);
        }
    });
    return ids;
}

void check_serde_derives(const CommandFunction& command,
                         const ReferenceIndex& index,
                         std::vector<Diagnostic>& diagnostics)
{
    for (const auto& id : referenced_ids(command.result_type)) {
        const auto* candidate = index.by_id(id);
        if (candidate != nullptr && !candidate->derives_serialize) {
            diagnostics.push_back(Diagnostic::warning(
                diag::kMissingSerialize,
                command.location,
                std::format("command '{}' returns '{}' which does not derive Serialize",
                            command.name,
                            id)));
        }
    }
    for (const auto& param : command.params) {
        for (const auto& id : referenced_ids(param.type)) {
            const auto* candidate = index.by_id(id);
            if (candidate != nullptr && !candidate->derives_deserialize) {
                diagnostics.push_back(Diagnostic::warning(
                    diag::kMissingDeserialize,
                    param.location,
                    std::format("parameter '{}' of command '{}' takes '{}' which does not derive Deserialize",
                                param.name,
                                command.name,
                                id)));
            }
        }
    }
}

}  // namespace

void resolve_references(std::vector<FileAnalysis>& files, std::vector<Diagnostic>& diagnostics)
{
    const ReferenceIndex index(files);

    for (auto& file : files) {
        const std::string& module = file.file.path;
        for (auto& command : file.commands) {
            for (auto& param : command.params) {
                resolve_descriptor(param.type, index, module, param.location, diagnostics);
            }
            resolve_descriptor(command.return_type, index, module, command.location, diagnostics);
            command.result_type = types::narrow(command.return_type);
            check_serde_derives(command, index, diagnostics);
        }
        for (auto& type : file.types) {
            for (auto& field : type.fields) {
                resolve_descriptor(field.type, index, module, field.location, diagnostics);
            }
            for (auto& variant : type.variants) {
                for (auto& field : variant.fields) {
                    resolve_descriptor(field.type, index, module, field.location, diagnostics);
                }
            }
        }
        for (auto& site : file.events) {
            resolve_descriptor(site.payload, index, module, site.location, diagnostics);
        }
    }
}

void check_type_collisions(const std::vector<FileAnalysis>& files, std::vector<Diagnostic>& diagnostics)
{
    std::map<std::string, std::string> first_declared_in;
    for (const auto& file : files) {
        for (const auto& decl : file.types) {
            auto [it, inserted] = first_declared_in.try_emplace(decl.name, decl.module);
            if (inserted) {
                continue;
            }
            diagnostics.push_back(Diagnostic::warning(
                diag::kNameCollision,
                decl.location,
                std::format("type '{}' is also declared in {}", decl.name, it->second)));
        }
    }
}

}  // namespace tsgen::model
