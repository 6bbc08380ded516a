/**
 * @file command_builder.cpp
 * @brief Marked functions -> CommandFunction entries
 */

#include "tsgen/model.hpp"
#include "tsgen/source.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>
#include <set>

namespace tsgen::model {

namespace {

constexpr std::string_view kSnakeCase = "snake_case";

[[nodiscard]] bool is_identifier(std::string_view text)
{
    if (text.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(text.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    return std::ranges::all_of(text, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

[[nodiscard]] std::string argument_key(const std::string& name, std::string_view rename_all)
{
    if (rename_all == kSnakeCase) {
        return name;
    }
    return common::to_camel_case(name);
}

}  // namespace

std::vector<std::string> module_path_of(std::string_view relative_path)
{
    auto [segments, file_name] = common::split_parent_segments(relative_path);
    if (file_name.ends_with(source::kSourceExtension)) {
        file_name.resize(file_name.size() - source::kSourceExtension.size());
    }
    segments.push_back(std::move(file_name));
    return segments;
}

std::vector<CommandFunction> build_commands(const syntax::ParsedFile& file,
                                            types::TypeResolver& resolver,
                                            std::vector<Diagnostic>& diagnostics)
{
    std::vector<CommandFunction> commands;
    std::set<std::string> seen;

    for (const auto& fn : file.functions) {
        if (!fn.is_command || fn.in_impl) {
            continue;
        }
        if (seen.contains(fn.name)) {
            diagnostics.push_back(Diagnostic::warning(
                diag::kNameCollision,
                fn.location,
                std::format("command '{}' is declared more than once in {}; keeping the first",
                            fn.name,
                            file.path)));
            continue;
        }
        seen.insert(fn.name);

        CommandFunction command{.name = fn.name,
                                .method_name = common::to_camel_case(fn.name),
                                .doc = fn.doc,
                                .module = file.path,
                                .rename_all = fn.rename_all,
                                .is_async = fn.is_async,
                                .location = fn.location};

        for (const auto& [index, param] : std::views::enumerate(fn.params)) {
            auto resolved = resolver.classify_param(param.type, param.location);
            if (types::is_excluded(resolved.handle)) {
                command.injected.push_back(param.name);
                continue;
            }
            std::string name = param.name;
            if (!is_identifier(name)) {
                diagnostics.push_back(Diagnostic::warning(
                    diag::kUnsupportedType,
                    param.location,
                    std::format("parameter pattern '{}' of command '{}' has no argument key",
                                param.name,
                                fn.name)));
                name = std::format("arg{}", index);
            }
            command.params.push_back(Parameter{.name = name,
                                               .ts_name = common::to_camel_case(name),
                                               .arg_key = argument_key(name, fn.rename_all),
                                               .type = std::move(resolved.type),
                                               .is_reference = resolved.is_reference,
                                               .canonical_path = std::move(resolved.canonical_path),
                                               .location = param.location});
        }

        command.return_type = fn.return_type.has_value()
                                  ? resolver.classify(*fn.return_type, fn.location)
                                  : types::TypeDescriptor::make_primitive(types::PrimitiveKind::kVoid);
        command.result_type = types::narrow(command.return_type);
        commands.push_back(std::move(command));
    }
    return commands;
}

}  // namespace tsgen::model
