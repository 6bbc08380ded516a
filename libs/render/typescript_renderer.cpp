/**
 * @file typescript_renderer.cpp
 * @brief Built-in TypeScript templates
 */

#include "tsgen/render.hpp"
#include "tsgen/version.hpp"

#include <format>
#include <functional>
#include <map>
#include <ranges>

namespace tsgen::render {

namespace {

using nlohmann::json;
using types::TypeDescriptor;

constexpr std::string_view kIndent = "    ";

[[nodiscard]] bool needs_parens(std::string_view ts)
{
    return ts.find(" | ") != std::string_view::npos;
}

/// JavaScript single-quoted string literal
[[nodiscard]] std::string single_quoted(std::string_view text)
{
    std::string out = "'";
    for (char c : text) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out + "'";
}

[[nodiscard]] std::string double_quoted(const std::string& text)
{
    return json(text).dump();
}

/// JSDoc block, one " * " line per doc line; nothing for an empty doc.
void append_doc(std::string& out, const json& lines, std::string_view indent)
{
    if (lines.empty()) {
        return;
    }
    out += std::format("{}/**\n", indent);
    for (const auto& line : lines) {
        std::string text = line.get<std::string>();
        for (auto pos = text.find("*/"); pos != std::string::npos; pos = text.find("*/", pos)) {
            text.replace(pos, 2, "*\\/");
        }
        out += text.empty() ? std::format("{} *\n", indent) : std::format("{} * {}\n", indent, text);
    }
    out += std::format("{} */\n", indent);
}

[[nodiscard]] std::string parameter_list(const json& params)
{
    std::string out;
    for (const auto& param : params) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::format("{}: {}", param.at("name").get<std::string>(), param.at("type").get<std::string>());
    }
    return out;
}

[[nodiscard]] std::string invoke_arguments(const json& params)
{
    if (params.empty()) {
        return {};
    }
    std::string out;
    for (const auto& param : params) {
        const auto name = param.at("name").get<std::string>();
        const auto key = param.at("key").get<std::string>();
        out += out.empty() ? "{ " : ", ";
        out += key == name ? name : std::format("{}: {}", key, name);
    }
    return ", " + out + " }";
}

[[nodiscard]] std::string signature(const json& command)
{
    return std::format("{}({}): Promise<{}>",
                       command.at("method").get<std::string>(),
                       parameter_list(command.at("params")),
                       command.at("result").get<std::string>());
}

void append_header(std::string& out)
{
    out += kGeneratedBanner;
    out += "\n";
}

void append_types_import(std::string& out, const json& context)
{
    if (context.at("uses_types").get<bool>()) {
        out += std::format("import * as T from \"{}\";\n", context.at("types_path").get<std::string>());
    }
}

// ----------------------------------------------------------------------------
// Templates
// ----------------------------------------------------------------------------

std::string render_command_wrapper(const json& context)
{
    const auto wrapper = context.at("wrapper").get<std::string>();
    std::string out;
    append_header(out);
    out += "import { invoke } from \"@tauri-apps/api/core\";\n";
    append_types_import(out, context);
    out += std::format("import {{ I{} }} from \"{}\";\n\n",
                       wrapper,
                       context.at("interface_path").get<std::string>());

    out += std::format("export class {} implements I{} {{\n", wrapper, wrapper);
    const auto& commands = context.at("commands");
    for (const auto& command : commands) {
        if (&command != &commands.front()) {
            out += "\n";
        }
        append_doc(out, command.at("doc_lines"), kIndent);
        out += std::format("{}async {} {{\n", kIndent, signature(command));
        out += std::format("{}{}return invoke<{}>({}{});\n",
                           kIndent,
                           kIndent,
                           command.at("result").get<std::string>(),
                           double_quoted(command.at("name").get<std::string>()),
                           invoke_arguments(command.at("params")));
        out += std::format("{}}}\n", kIndent);
    }
    out += "}\n\n";
    out += std::format("export function create{}(): I{} {{\n", wrapper, wrapper);
    out += std::format("{}return new {}();\n", kIndent, wrapper);
    out += "}\n";
    return out;
}

std::string render_command_interface(const json& context)
{
    std::string out;
    append_header(out);
    append_types_import(out, context);
    if (context.at("uses_types").get<bool>()) {
        out += "\n";
    }
    out += std::format("export interface I{} {{\n", context.at("wrapper").get<std::string>());
    const auto& commands = context.at("commands");
    for (const auto& command : commands) {
        if (&command != &commands.front()) {
            out += "\n";
        }
        append_doc(out, command.at("doc_lines"), kIndent);
        out += std::format("{}{};\n", kIndent, signature(command));
    }
    out += "}\n";
    return out;
}

std::string render_mock_api(const json& context)
{
    const auto wrapper = context.at("wrapper").get<std::string>();
    std::string out;
    append_header(out);
    append_types_import(out, context);
    out += std::format("import {{ I{} }} from \"{}\";\n\n",
                       wrapper,
                       context.at("interface_path").get<std::string>());

    out += std::format("export class Mock{} implements I{} {{\n", wrapper, wrapper);
    const auto& commands = context.at("commands");
    for (const auto& command : commands) {
        if (&command != &commands.front()) {
            out += "\n";
        }
        out += std::format("{}async {} {{\n", kIndent, signature(command));
        out += std::format("{}{}throw new Error({});\n",
                           kIndent,
                           kIndent,
                           double_quoted(command.at("method").get<std::string>() + " is not implemented"));
        out += std::format("{}}}\n", kIndent);
    }
    out += "}\n";
    return out;
}

std::string render_types_index(const json& context)
{
    std::string out;
    append_header(out);
    for (const auto& type : context.at("types")) {
        const auto name = type.at("name").get<std::string>();
        const auto form = type.at("form").get<std::string>();
        out += std::format("\n//- Generated from {}\n", type.at("source").get<std::string>());
        append_doc(out, type.at("doc_lines"), "");

        if (form == "interface") {
            out += std::format("export interface {} {{\n", name);
            for (const auto& field : type.at("fields")) {
                append_doc(out, field.at("doc_lines"), kIndent);
                out += std::format("{}{}: {};\n",
                                   kIndent,
                                   field.at("name").get<std::string>(),
                                   field.at("type").get<std::string>());
            }
            out += "}\n";
        } else if (form == "union") {
            out += std::format("export type {} =\n", name);
            const auto& variants = type.at("variants");
            for (std::size_t i = 0; i < variants.size(); ++i) {
                append_doc(out, variants[i].at("doc_lines"), kIndent);
                out += std::format("{}| {}{}\n",
                                   kIndent,
                                   variants[i].at("text").get<std::string>(),
                                   i + 1 == variants.size() ? ";" : "");
            }
        } else {
            out += std::format("export type {} = {};\n", name, type.at("alias").get<std::string>());
        }
    }
    return out;
}

std::string render_event_handlers(const json& context)
{
    const bool global = context.at("scope").get<std::string>() == "global";
    const auto& entries = context.at("entries");
    std::string out;
    append_header(out);
    out += "import { Event, listen, UnlistenFn } from \"@tauri-apps/api/event\";\n";
    append_types_import(out, context);
    out += "\n";

    out += std::format("export abstract class {} {{\n", context.at("class_name").get<std::string>());
    out += std::format("{}private readonly unlistenFns: Promise<UnlistenFn>[] = [];\n\n", kIndent);
    out += std::format("{}protected constructor() {{\n", kIndent);
    const std::string options =
        global ? std::string()
               : std::format(", {{ target: {{ kind: 'AnyLabel', label: {} }} }}",
                             single_quoted(context.at("label").get<std::string>()));
    for (const auto& entry : entries) {
        out += std::format("{0}{0}this.unlistenFns.push(\n", kIndent);
        out += std::format("{0}{0}{0}listen<{1}>({2}, (event) => {{ this.{3}(event); }}{4}));\n",
                           kIndent,
                           entry.at("payload").get<std::string>(),
                           single_quoted(entry.at("name").get<std::string>()),
                           entry.at("callback").get<std::string>(),
                           options);
    }
    out += std::format("{}}}\n\n", kIndent);

    out += std::format("{}public async Unlisten() {{\n", kIndent);
    out += std::format("{0}{0}for (const x of this.unlistenFns) {{\n", kIndent);
    out += std::format("{0}{0}{0}(await x)();\n", kIndent);
    out += std::format("{0}{0}}}\n", kIndent);
    out += std::format("{}}}\n", kIndent);

    for (const auto& entry : entries) {
        out += "\n";
        out += std::format("{}abstract {}(event: Event<{}>): void;\n",
                           kIndent,
                           entry.at("callback").get<std::string>(),
                           entry.at("payload").get<std::string>());
    }
    out += "}\n";
    return out;
}

std::string render_barrel(const json& context)
{
    std::string out;
    append_header(out);
    for (const auto& target : context.at("exports")) {
        out += std::format("export * from \"{}\";\n", target.get<std::string>());
    }
    return out;
}

std::string render_root_index(const json& context)
{
    std::string out = render_barrel(context);
    if (context.at("mock_api").get<bool>()) {
        out += "// export * from \"./mock-api\";\n";
    }
    return out;
}

using TemplateFn = std::function<std::string(const json&)>;

[[nodiscard]] const std::map<std::string, TemplateFn, std::less<>>& template_table()
{
    static const std::map<std::string, TemplateFn, std::less<>> table = {
        {std::string(templates::kCommandWrapper),     render_command_wrapper},
        {std::string(templates::kCommandInterface), render_command_interface},
        {std::string(templates::kMockApi),                  render_mock_api},
        {std::string(templates::kTypesIndex),           render_types_index},
        {std::string(templates::kEventHandlers),     render_event_handlers},
        {std::string(templates::kBarrel),                     render_barrel},
        {std::string(templates::kRootIndex),             render_root_index},
    };
    return table;
}

}  // namespace

std::string to_typescript(const TypeDescriptor& type, std::string_view type_prefix)
{
    switch (type.kind) {
        case TypeDescriptor::Kind::kPrimitive:
            return std::string(types::primitive_name(type.primitive));
        case TypeDescriptor::Kind::kOptional:
            return to_typescript(type.args.front(), type_prefix) + " | undefined";
        case TypeDescriptor::Kind::kResult:
            return to_typescript(type.args.front(), type_prefix);
        case TypeDescriptor::Kind::kCollection: {
            const std::string element = to_typescript(type.args.front(), type_prefix);
            return needs_parens(element) ? std::format("({})[]", element) : element + "[]";
        }
        case TypeDescriptor::Kind::kMap:
            return std::format("Record<{}, {}>",
                               to_typescript(type.args[0], type_prefix),
                               to_typescript(type.args[1], type_prefix));
        case TypeDescriptor::Kind::kTuple: {
            std::string out = "[";
            for (const auto& [index, element] : std::views::enumerate(type.args)) {
                if (index > 0) {
                    out += ", ";
                }
                out += to_typescript(element, type_prefix);
            }
            return out + "]";
        }
        case TypeDescriptor::Kind::kNamedRef:
            return std::string(type_prefix) + type.name;
        case TypeDescriptor::Kind::kOpaque:
        case TypeDescriptor::Kind::kUnsupported:
            return "unknown";
    }
    return "unknown";
}

tsgen::Result<std::string> TypeScriptRenderer::render(std::string_view template_name,
                                                      const nlohmann::json& context) const
{
    const auto& table = template_table();
    auto it = table.find(template_name);
    if (it == table.end()) {
        return std::unexpected(
            Error::make("UnknownTemplate", std::format("No template named '{}'", template_name)));
    }
    try {
        return it->second(context);
    } catch (const json::exception& e) {
        return std::unexpected(Error::make(
            "TemplateContextInvalid",
            std::format("Context for template '{}' is malformed: {}", template_name, e.what())));
    }
}

tsgen::Result<std::vector<Artifact>> render_artifacts(const std::vector<ArtifactPlan>& plans,
                                                      const Renderer& renderer)
{
    std::vector<Artifact> artifacts;
    artifacts.reserve(plans.size());
    for (const auto& plan : plans) {
        auto content = renderer.render(plan.template_name, plan.context);
        if (!content) {
            return std::unexpected(Error::make(content.error().code,
                                               std::format("{}: {}", plan.path, content.error().message)));
        }
        artifacts.push_back(Artifact{.path = plan.path, .content = std::move(*content)});
    }
    return artifacts;
}

}  // namespace tsgen::render
