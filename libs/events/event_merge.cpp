/**
 * @file event_merge.cpp
 * @brief Per-scope merge of event sites into handler declarations
 */

#include "tsgen/common.hpp"
#include "tsgen/events.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <set>

namespace tsgen::events {

std::string scope_class_name(const EventScope& scope)
{
    if (scope.kind == ScopeKind::kGlobal) {
        return "GlobalEventHandlers";
    }
    return common::to_pascal_case(scope.label) + "WindowEventHandlers";
}

std::string callback_name(std::string_view event_name)
{
    return "On" + common::to_pascal_case(event_name);
}

std::vector<EventScopeModel> merge_event_sites(const std::vector<EventSite>& sites,
                                               std::vector<Diagnostic>& diagnostics)
{
    std::map<EventScope, EventScopeModel> scopes;
    std::map<EventScope, std::set<std::string>> callbacks;

    for (const auto& site : sites) {
        auto [it, inserted] = scopes.try_emplace(site.scope);
        EventScopeModel& scope = it->second;
        if (inserted) {
            scope.scope = site.scope;
        }

        auto same_name = [&site](const EventEntry& entry) { return entry.name == site.name; };
        auto existing = std::ranges::find_if(scope.entries, [&](const EventEntry& entry) {
            return same_name(entry) && entry.payload == site.payload;
        });
        if (existing != scope.entries.end()) {
            existing->sites.push_back(site.location);
            continue;
        }

        const auto occurrences = std::ranges::count_if(scope.entries, same_name);
        std::string key = site.name;
        std::string callback = callback_name(site.name);
        if (occurrences > 0) {
            key = std::format("{}#{}", site.name, occurrences + 1);
            callback = std::format("{}{}", callback, occurrences + 1);
            diagnostics.push_back(Diagnostic::warning(
                diag::kNameCollision,
                site.location,
                std::format("event '{}' is emitted with a different payload than before; keyed as '{}'",
                            site.name,
                            key)));
        }

        auto& taken = callbacks[site.scope];
        if (taken.contains(callback)) {
            const std::string base = callback;
            for (int suffix = 2; taken.contains(callback); ++suffix) {
                callback = std::format("{}{}", base, suffix);
            }
            diagnostics.push_back(Diagnostic::warning(
                diag::kNameCollision,
                site.location,
                std::format("callback '{}' for event '{}' is taken; using '{}'", base, site.name, callback)));
        }
        taken.insert(callback);

        scope.entries.push_back(EventEntry{.key = std::move(key),
                                           .name = site.name,
                                           .callback = std::move(callback),
                                           .payload = site.payload,
                                           .sites = {site.location}});
    }

    std::vector<EventScopeModel> result;
    result.reserve(scopes.size());
    std::set<std::string> class_names;
    for (auto& [scope, model] : scopes) {
        std::string name = scope_class_name(scope);
        if (class_names.contains(name)) {
            const std::string base = name;
            for (int suffix = 2; class_names.contains(name); ++suffix) {
                name = std::format("{}{}", base, suffix);
            }
            diagnostics.push_back(Diagnostic::warning(
                diag::kNameCollision,
                model.entries.front().sites.front(),
                std::format("handler class '{}' for window '{}' is taken; using '{}'", base, scope.label, name)));
        }
        class_names.insert(name);
        model.class_name = std::move(name);
        result.push_back(std::move(model));
    }
    return result;
}

void to_json(nlohmann::json& j, const EventScope& scope)
{
    j = nlohmann::json{
        { "kind", scope.kind == ScopeKind::kGlobal ? "global" : "window"},
        {"label",                                         scope.label}
    };
}

void to_json(nlohmann::json& j, const EventEntry& entry)
{
    j = nlohmann::json{
        {     "key",      entry.key},
        {    "name",     entry.name},
        {"callback", entry.callback},
        { "payload",  entry.payload},
        {   "sites",    entry.sites}
    };
}

void to_json(nlohmann::json& j, const EventScopeModel& scope)
{
    j = nlohmann::json{
        {     "scope",      scope.scope},
        {"class_name", scope.class_name},
        {   "entries",    scope.entries}
    };
}

}  // namespace tsgen::events
