#pragma once

/**
 * @file render.hpp
 * @brief Artifact planning and TypeScript rendering
 *
 * plan_artifacts() decides every output path and builds one JSON context
 * per artifact; a Renderer turns (template name, context) into text. Both
 * are pure, so the same model always renders to the same bytes.
 */

#include "tsgen/common.hpp"
#include "tsgen/model.hpp"
#include "tsgen/types.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tsgen::render {

/// Template names
namespace templates {
constexpr std::string_view kCommandWrapper = "command_wrapper";
constexpr std::string_view kCommandInterface = "command_interface";
constexpr std::string_view kMockApi = "mock_api";
constexpr std::string_view kTypesIndex = "types_index";
constexpr std::string_view kEventHandlers = "event_handlers";
constexpr std::string_view kBarrel = "barrel";
constexpr std::string_view kRootIndex = "root_index";
}  // namespace templates

/// Top-level output directories
constexpr std::string_view kApiDir = "tauria-api";
constexpr std::string_view kCommandInterfaceDir = "interface/commands";
constexpr std::string_view kTypesDir = "interface/types";
constexpr std::string_view kEventsDir = "tauria-api/events";
constexpr std::string_view kMockDir = "mock-api";

struct RenderOptions
{
    bool mock_api = false;
};

struct ArtifactPlan
{
    std::string path;  ///< relative to the output root, '/'-separated
    std::string template_name;
    nlohmann::json context;
};

struct Artifact
{
    std::string path;
    std::string content;
};

/**
 * TypeScript spelling of a descriptor.
 * @param type_prefix Qualifier for named types ("T." outside the types index)
 */
[[nodiscard]] std::string to_typescript(const types::TypeDescriptor& type,
                                        std::string_view type_prefix = "T.");

/**
 * Map the model to the ordered list of artifacts (sorted by path).
 */
[[nodiscard]] std::vector<ArtifactPlan> plan_artifacts(const model::SemanticModel& model,
                                                       const RenderOptions& options);

/**
 * Template name + JSON context -> artifact text.
 */
class Renderer
{
public:
    Renderer() = default;
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;
    Renderer(Renderer&&) = delete;
    Renderer& operator=(Renderer&&) = delete;
    virtual ~Renderer() = default;

    [[nodiscard]] virtual tsgen::Result<std::string> render(std::string_view template_name,
                                                           const nlohmann::json& context) const = 0;
};

/**
 * Built-in TypeScript templates (see templates::).
 */
class TypeScriptRenderer final : public Renderer
{
public:
    [[nodiscard]] tsgen::Result<std::string> render(std::string_view template_name,
                                                   const nlohmann::json& context) const override;
};

/**
 * Apply @p renderer to every plan entry, preserving order.
 * Fails on the first entry the renderer rejects.
 */
[[nodiscard]] tsgen::Result<std::vector<Artifact>> render_artifacts(const std::vector<ArtifactPlan>& plans,
                                                                     const Renderer& renderer);

}  // namespace tsgen::render
