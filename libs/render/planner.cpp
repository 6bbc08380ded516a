/**
 * @file planner.cpp
 * @brief Semantic model -> artifact paths and template contexts
 */

#include "tsgen/render.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>
#include <map>
#include <ranges>
#include <set>
#include <tuple>

namespace tsgen::render {

namespace {

using nlohmann::json;
using types::TypeDescriptor;

[[nodiscard]] std::string path_join(std::initializer_list<std::string_view> parts)
{
    std::string result;
    for (auto part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += '/';
        }
        result += part;
    }
    return result;
}

/// Import specifier from the directory of @p from to @p target (both relative to the output root).
[[nodiscard]] std::string import_path(std::string_view from, std::string_view target)
{
    const auto depth = common::split_parent_segments(from).first.size();
    return common::climb(depth) + std::string(target);
}

[[nodiscard]] json doc_lines(const std::string& doc)
{
    json lines = json::array();
    if (doc.empty()) {
        return lines;
    }
    for (auto line : doc | std::views::split('\n')) {
        lines.push_back(std::string(line.begin(), line.end()));
    }
    return lines;
}

[[nodiscard]] bool references_types(const TypeDescriptor& type)
{
    bool found = false;
    types::visit(type, [&found](const TypeDescriptor& node) {
        found = found || node.kind == TypeDescriptor::Kind::kNamedRef;
    });
    return found;
}

[[nodiscard]] json command_context(const model::CommandFunction& command)
{
    json params = json::array();
    for (const auto& param : command.params) {
        params.push_back(json{
            {"name", param.ts_name},
            { "key", param.arg_key},
            {"type", to_typescript(param.type)}
        });
    }
    return json{
        {      "name",                   command.name},
        {    "method",            command.method_name},
        {"doc_lines",           doc_lines(command.doc)},
        {    "params",                  std::move(params)},
        {    "result", to_typescript(command.result_type)}
    };
}

[[nodiscard]] bool module_uses_types(const model::ModuleNode& node)
{
    return std::ranges::any_of(node.commands, [](const model::CommandFunction& command) {
        return references_types(command.result_type)
               || std::ranges::any_of(command.params, [](const model::Parameter& param) {
                      return references_types(param.type);
                  });
    });
}

void plan_module(const model::ModuleNode& node,
                 const RenderOptions& options,
                 std::vector<ArtifactPlan>& plans)
{
    const std::string file_name = node.wrapper_name + ".ts";
    const std::string api_path = path_join({kApiDir, node.path, file_name});
    const std::string interface_path = path_join({kCommandInterfaceDir, node.path, file_name});
    const std::string interface_module = path_join({kCommandInterfaceDir, node.path, node.wrapper_name});

    json commands = json::array();
    for (const auto& command : node.commands) {
        commands.push_back(command_context(command));
    }
    const bool uses_types = module_uses_types(node);

    const auto context_for = [&](const std::string& artifact_path) {
        return json{
            {       "wrapper",                         node.wrapper_name},
            {        "source",                               node.source},
            {    "uses_types",                                uses_types},
            {    "types_path",     import_path(artifact_path, kTypesDir)},
            {"interface_path", import_path(artifact_path, interface_module)},
            {      "commands",                                  commands}
        };
    };

    plans.push_back(ArtifactPlan{.path = api_path,
                                 .template_name = std::string(templates::kCommandWrapper),
                                 .context = context_for(api_path)});
    plans.push_back(ArtifactPlan{.path = interface_path,
                                 .template_name = std::string(templates::kCommandInterface),
                                 .context = context_for(interface_path)});
    if (options.mock_api) {
        const std::string mock_path = path_join({kMockDir, node.path, file_name});
        plans.push_back(ArtifactPlan{.path = mock_path,
                                     .template_name = std::string(templates::kMockApi),
                                     .context = context_for(mock_path)});
    }
}

// ----------------------------------------------------------------------------
// Data types
// ----------------------------------------------------------------------------

[[nodiscard]] std::string quoted(std::string_view text)
{
    return json(std::string(text)).dump();
}

[[nodiscard]] std::string inline_fields(const std::vector<model::Field>& fields)
{
    if (fields.empty()) {
        return "{}";
    }
    std::string out = "{ ";
    for (const auto& [index, field] : std::views::enumerate(fields)) {
        if (index > 0) {
            out += "; ";
        }
        out += field.name + ": " + to_typescript(field.type, "");
    }
    return out + " }";
}

[[nodiscard]] std::string tuple_of(const std::vector<model::Field>& fields)
{
    if (fields.size() == 1) {
        return to_typescript(fields.front().type, "");
    }
    std::string out = "[";
    for (const auto& [index, field] : std::views::enumerate(fields)) {
        if (index > 0) {
            out += ", ";
        }
        out += to_typescript(field.type, "");
    }
    return out + "]";
}

[[nodiscard]] std::string variant_text(const model::Variant& variant)
{
    switch (variant.shape) {
        case syntax::VariantShape::kUnit:
            return quoted(variant.name);
        case syntax::VariantShape::kTuple:
            if (variant.fields.empty()) {
                return std::format("{{ {}: [] }}", variant.name);
            }
            return std::format("{{ {}: {} }}", variant.name, tuple_of(variant.fields));
        case syntax::VariantShape::kStruct:
            return std::format("{{ {}: {} }}", variant.name, inline_fields(variant.fields));
    }
    return quoted(variant.name);
}

[[nodiscard]] json type_context(const model::TypeDeclaration& decl)
{
    json context = {
        {     "name",             decl.name},
        {   "source",           decl.module},
        {"doc_lines", doc_lines(decl.doc)}
    };
    if (decl.kind == syntax::TypeDeclKind::kEnum) {
        if (decl.variants.empty()) {
            context["form"] = "alias";
            context["alias"] = "never";
            return context;
        }
        json variants = json::array();
        for (const auto& variant : decl.variants) {
            variants.push_back(json{
                {"doc_lines", doc_lines(variant.doc)},
                {     "text",  variant_text(variant)}
            });
        }
        context["form"] = "union";
        context["variants"] = std::move(variants);
        return context;
    }
    switch (decl.shape) {
        case syntax::StructShape::kNamed: {
            json fields = json::array();
            for (const auto& field : decl.fields) {
                fields.push_back(json{
                    {     "name",                      field.name},
                    {"doc_lines",            doc_lines(field.doc)},
                    {     "type", to_typescript(field.type, "")}
                });
            }
            context["form"] = "interface";
            context["fields"] = std::move(fields);
            break;
        }
        case syntax::StructShape::kTuple:
            context["form"] = "alias";
            context["alias"] = decl.fields.empty() ? std::string("[]") : tuple_of(decl.fields);
            break;
        case syntax::StructShape::kUnit:
            context["form"] = "alias";
            context["alias"] = "null";
            break;
    }
    return context;
}

void plan_types(const model::SemanticModel& model, std::vector<ArtifactPlan>& plans)
{
    std::vector<const model::TypeDeclaration*> decls;
    std::map<std::string, std::size_t> scan_index;
    for (const auto& [index, file] : std::views::enumerate(model.files)) {
        scan_index[file.path] = static_cast<std::size_t>(index);
    }
    model::for_each_file(model.root, [&decls](const model::ModuleNode& node) {
        for (const auto& decl : node.types) {
            decls.push_back(&decl);
        }
    });
    if (decls.empty()) {
        return;
    }
    // by name, then scan order (declaration order inside one file is already kept)
    std::ranges::stable_sort(decls, [&scan_index](const auto* a, const auto* b) {
        return std::tie(a->name, scan_index[a->module]) < std::tie(b->name, scan_index[b->module]);
    });

    json entries = json::array();
    for (const auto* decl : decls) {
        entries.push_back(type_context(*decl));
    }
    plans.push_back(ArtifactPlan{.path = path_join({kTypesDir, "index.ts"}),
                                 .template_name = std::string(templates::kTypesIndex),
                                 .context = json{{"types", std::move(entries)}}});
}

// ----------------------------------------------------------------------------
// Events
// ----------------------------------------------------------------------------

void plan_events(const model::SemanticModel& model, std::vector<ArtifactPlan>& plans)
{
    for (const auto& scope : model.events) {
        const std::string path = path_join({kEventsDir, scope.class_name + ".ts"});
        json entries = json::array();
        bool uses_types = false;
        for (const auto& entry : scope.entries) {
            uses_types = uses_types || references_types(entry.payload);
            entries.push_back(json{
                {    "name",                entry.name},
                {"callback",            entry.callback},
                { "payload", to_typescript(entry.payload)}
            });
        }
        const bool global = scope.scope.kind == events::ScopeKind::kGlobal;
        plans.push_back(ArtifactPlan{.path = path,
                                     .template_name = std::string(templates::kEventHandlers),
                                     .context = json{
                                         {"class_name",                  scope.class_name},
                                         {     "scope",     global ? "global" : "window"},
                                         {     "label",                 scope.scope.label},
                                         {"uses_types",                        uses_types},
                                         {"types_path", import_path(path, kTypesDir)},
                                         {   "entries",               std::move(entries)}
        }});
    }
}

// ----------------------------------------------------------------------------
// Barrels
// ----------------------------------------------------------------------------

void plan_barrels(const RenderOptions& options, std::vector<ArtifactPlan>& plans)
{
    std::set<std::string> existing;
    std::map<std::string, std::set<std::string>> children;
    for (const auto& plan : plans) {
        existing.insert(plan.path);
        auto [dirs, file_name] = common::split_parent_segments(plan.path);
        std::string stem = file_name.substr(0, file_name.rfind('.'));
        std::string dir;
        for (const auto& segment : dirs) {
            children[dir].insert(segment);
            dir = dir.empty() ? segment : dir + "/" + segment;
        }
        if (stem != "index") {
            children[dir].insert(std::move(stem));
        }
    }

    for (const auto& [dir, names] : children) {
        if (dir.empty()) {
            continue;
        }
        const std::string path = dir + "/index.ts";
        if (existing.contains(path)) {
            continue;
        }
        json exports = json::array();
        for (const auto& name : names) {
            exports.push_back("./" + name);
        }
        plans.push_back(ArtifactPlan{.path = path,
                                     .template_name = std::string(templates::kBarrel),
                                     .context = json{{"exports", std::move(exports)}}});
    }

    if (auto root = children.find(""); root != children.end()) {
        json exports = json::array();
        bool mock = false;
        for (const auto& name : root->second) {
            if (name == kMockDir) {
                mock = true;
                continue;
            }
            exports.push_back("./" + name);
        }
        plans.push_back(ArtifactPlan{.path = "index.ts",
                                     .template_name = std::string(templates::kRootIndex),
                                     .context = json{
                                         { "exports", std::move(exports)},
                                         {"mock_api",   mock && options.mock_api}
        }});
    }
}

}  // namespace

std::vector<ArtifactPlan> plan_artifacts(const model::SemanticModel& model, const RenderOptions& options)
{
    std::vector<ArtifactPlan> plans;
    model::for_each_file(model.root, [&](const model::ModuleNode& node) {
        if (!node.commands.empty()) {
            plan_module(node, options, plans);
        }
    });
    plan_types(model, plans);
    plan_events(model, plans);
    plan_barrels(options, plans);

    std::ranges::sort(plans, [](const ArtifactPlan& a, const ArtifactPlan& b) {
        return common::stable_string_less(a.path, b.path);
    });
    return plans;
}

}  // namespace tsgen::render
