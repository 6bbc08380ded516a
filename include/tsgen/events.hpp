#pragma once

/**
 * @file events.hpp
 * @brief Event broadcast sites and their per-scope merge
 */

#include "tsgen/diagnostics.hpp"
#include "tsgen/syntax.hpp"
#include "tsgen/types.hpp"

#include <compare>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tsgen::events {

enum class ScopeKind {
    kGlobal,
    kWindow,
};

/// Broadcast audience. Global sorts before every window; windows sort by label.
struct EventScope
{
    ScopeKind kind = ScopeKind::kGlobal;
    std::string label;  ///< window label or handle identifier, empty for kGlobal

    auto operator<=>(const EventScope&) const = default;
};

struct EventSite
{
    std::string name;
    types::TypeDescriptor payload;
    EventScope scope;
    SourceLocation location;
};

/// One callback of a scope: every site with the same (name, payload).
struct EventEntry
{
    std::string key;       ///< event name, "name#2" for a colliding payload
    std::string name;
    std::string callback;  ///< "OnWindowEvent"
    types::TypeDescriptor payload;
    std::vector<SourceLocation> sites;
};

struct EventScopeModel
{
    EventScope scope;
    std::string class_name;  ///< "GlobalEventHandlers", "MainWindowEventHandlers"
    std::vector<EventEntry> entries;
};

/**
 * @brief Finds `emit` / `emit_to` calls in the function bodies of one file
 *
 * Receivers are resolved through function parameters, `let` bindings and
 * window lookups (`get_webview_window("label")`). Sites whose name, target
 * or receiver cannot be determined statically are dropped with a warning.
 */
class EventDetector
{
public:
    EventDetector(const syntax::ParsedFile& file,
                  types::TypeResolver& resolver,
                  std::vector<Diagnostic>& diagnostics);

    /// Sites in source order.
    [[nodiscard]] std::vector<EventSite> detect();

private:
    void scan_function(const syntax::FunctionDecl& function, std::vector<EventSite>& sites);

    const syntax::ParsedFile& m_file;
    types::TypeResolver& m_resolver;
    std::vector<Diagnostic>& m_diagnostics;
};

/// "GlobalEventHandlers" or "<Label>WindowEventHandlers"
[[nodiscard]] std::string scope_class_name(const EventScope& scope);

/// "window-event" -> "OnWindowEvent"
[[nodiscard]] std::string callback_name(std::string_view event_name);

/**
 * Merge sites (in scan order) into per-scope declarations.
 *
 * Sites with equal (scope, name, payload) share one entry. A differing
 * payload under an existing (scope, name) gets its own entry keyed
 * "name#N" and a NameCollisionWarning. Scopes come out Global first, then
 * windows by label; entries keep first-discovery order.
 */
[[nodiscard]] std::vector<EventScopeModel> merge_event_sites(const std::vector<EventSite>& sites,
                                                             std::vector<Diagnostic>& diagnostics);

void to_json(nlohmann::json& j, const EventScope& scope);
void to_json(nlohmann::json& j, const EventEntry& entry);
void to_json(nlohmann::json& j, const EventScopeModel& scope);

}  // namespace tsgen::events
