/**
 * @file test_render.cpp
 * @brief Artifact planning and TypeScript template output
 */

#include "tsgen/analyzer.hpp"
#include "tsgen/render.hpp"
#include "tsgen/version.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace tsgen::render::tests {
namespace {

using types::PrimitiveKind;
using types::TypeDescriptor;

const std::map<std::string, std::string> kBackend = {
    {"src/commands/user.rs", R"(
use tauri::{AppHandle, Manager, State};
use crate::models::{User, Role};

/// Look up one user.
#[tauri::command]
pub async fn get_user(state: State<'_, Db>, id: u32) -> Result<User, String> {
    todo!()
}

#[tauri::command]
pub fn list_roles() -> Vec<Role> {
    vec![]
}

#[tauri::command]
pub fn broadcast(app: AppHandle, text: String) {
    app.emit("user-changed", text.clone()).ok();
    if let Some(main) = app.get_webview_window("main") {
        main.emit("window-event", 1).ok();
        main.emit("main_event", "done").ok();
    }
}
)"},
    {      "src/models.rs", R"(
#[derive(Serialize, Deserialize)]
pub struct User {
    /// Identifier
    pub id: u32,
    /// Display name
    pub name: String,
    pub role: Role,
}

#[derive(Serialize, Deserialize)]
pub enum Role { Admin, Member }
)"},
    {"src/commands/admin.rs", R"(
#[tauri::command(rename_all = "snake_case")]
pub fn ban_user(user_id: u32, reason: Option<String>) -> Result<(), String> {
    Ok(())
}
)"},
};

model::SemanticModel analyze(const std::map<std::string, std::string>& files)
{
    source::MemoryFileProvider provider(files);
    auto result = analyzer::Analyzer(analyzer::AnalyzeOptions{.jobs = 1}).analyze(provider);
    EXPECT_TRUE(result) << (result ? std::string{} : result.error().message);
    return result ? std::move(result->model) : model::SemanticModel{};
}

std::map<std::string, std::string> render_all(const model::SemanticModel& model, bool mock_api = false)
{
    const auto plans = plan_artifacts(model, RenderOptions{.mock_api = mock_api});
    auto artifacts = render_artifacts(plans, TypeScriptRenderer());
    EXPECT_TRUE(artifacts) << (artifacts ? std::string{} : artifacts.error().message);
    std::map<std::string, std::string> files;
    if (artifacts) {
        for (auto& artifact : *artifacts) {
            files.emplace(artifact.path, std::move(artifact.content));
        }
    }
    return files;
}

std::vector<std::string> paths_of(const std::vector<ArtifactPlan>& plans)
{
    std::vector<std::string> paths;
    for (const auto& plan : plans) {
        paths.push_back(plan.path);
    }
    return paths;
}

std::string banner()
{
    return std::string(kGeneratedBanner) + "\n";
}

/// Fails on one template, renders a fixed text otherwise.
class RejectingRenderer final : public Renderer
{
public:
    [[nodiscard]] tsgen::Result<std::string> render(std::string_view template_name,
                                                   const nlohmann::json& /*context*/) const override
    {
        if (template_name == templates::kTypesIndex) {
            return std::unexpected(Error::make("TemplateContextInvalid", "no types today"));
        }
        return std::string("ok");
    }
};

}  // namespace

// ============================================================================
// to_typescript
// ============================================================================

TEST(ToTypeScript, Primitives)
{
    EXPECT_EQ(to_typescript(TypeDescriptor::make_primitive(PrimitiveKind::kString)), "string");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_primitive(PrimitiveKind::kNumber)), "number");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_primitive(PrimitiveKind::kBoolean)), "boolean");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_primitive(PrimitiveKind::kVoid)), "void");
}

TEST(ToTypeScript, Wrappers)
{
    const auto number = TypeDescriptor::make_primitive(PrimitiveKind::kNumber);
    const auto text = TypeDescriptor::make_primitive(PrimitiveKind::kString);

    EXPECT_EQ(to_typescript(TypeDescriptor::make_optional(text)), "string | undefined");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_result(number, text)), "number");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_collection(number)), "number[]");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_collection(TypeDescriptor::make_optional(number))),
              "(number | undefined)[]");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_map(text, number)), "Record<string, number>");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_tuple({text, number})), "[string, number]");
}

TEST(ToTypeScript, NamedTypesUsePrefix)
{
    const auto user = TypeDescriptor::make_named("crate::models::User");
    EXPECT_EQ(to_typescript(user), "T.User");
    EXPECT_EQ(to_typescript(user, ""), "User");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_collection(user)), "T.User[]");
}

TEST(ToTypeScript, OpaqueAndUnsupportedAreUnknown)
{
    EXPECT_EQ(to_typescript(TypeDescriptor::make_opaque("serde_json::Value")), "unknown");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_unsupported("impl Fn()")), "unknown");
    EXPECT_EQ(to_typescript(TypeDescriptor::make_optional(TypeDescriptor::make_unsupported("dyn Any"))),
              "unknown | undefined");
}

// ============================================================================
// Planning
// ============================================================================

TEST(PlanArtifacts, PathsAndTemplates)
{
    const auto model = analyze(kBackend);
    const auto plans = plan_artifacts(model, RenderOptions{});
    const auto paths = paths_of(plans);

    EXPECT_TRUE(std::ranges::is_sorted(paths));
    const std::vector<std::string> expected = {
        "index.ts",
        "interface/commands/index.ts",
        "interface/commands/src/commands/Admin.ts",
        "interface/commands/src/commands/User.ts",
        "interface/commands/src/commands/index.ts",
        "interface/commands/src/index.ts",
        "interface/index.ts",
        "interface/types/index.ts",
        "tauria-api/events/GlobalEventHandlers.ts",
        "tauria-api/events/MainWindowEventHandlers.ts",
        "tauria-api/events/index.ts",
        "tauria-api/index.ts",
        "tauria-api/src/commands/Admin.ts",
        "tauria-api/src/commands/User.ts",
        "tauria-api/src/commands/index.ts",
        "tauria-api/src/index.ts",
    };
    EXPECT_EQ(paths, expected);

    const auto template_of = [&plans](std::string_view path) {
        return std::ranges::find(plans, path, &ArtifactPlan::path)->template_name;
    };
    EXPECT_EQ(template_of("index.ts"), templates::kRootIndex);
    EXPECT_EQ(template_of("interface/index.ts"), templates::kBarrel);
    EXPECT_EQ(template_of("interface/types/index.ts"), templates::kTypesIndex);
    EXPECT_EQ(template_of("interface/commands/src/commands/User.ts"), templates::kCommandInterface);
    EXPECT_EQ(template_of("tauria-api/src/commands/User.ts"), templates::kCommandWrapper);
    EXPECT_EQ(template_of("tauria-api/events/GlobalEventHandlers.ts"), templates::kEventHandlers);
}

TEST(PlanArtifacts, FilesWithoutCommandsHaveNoWrapper)
{
    const auto model = analyze({
        {"src/models.rs", "#[derive(Serialize)]\npub struct User { id: u32 }\n"}
    });
    const auto paths = paths_of(plan_artifacts(model, RenderOptions{}));
    EXPECT_EQ(paths,
              (std::vector<std::string>{"index.ts", "interface/index.ts", "interface/types/index.ts"}));
}

TEST(PlanArtifacts, EmptyModelHasNoArtifacts)
{
    const auto model = analyze({
        {"src/main.rs", "fn main() {}\n"}
    });
    EXPECT_TRUE(plan_artifacts(model, RenderOptions{}).empty());
}

TEST(PlanArtifacts, MockApiIsOptIn)
{
    const auto model = analyze(kBackend);
    const auto without = paths_of(plan_artifacts(model, RenderOptions{}));
    EXPECT_TRUE(std::ranges::none_of(without, [](const std::string& p) { return p.starts_with("mock-api/"); }));

    const auto with = paths_of(plan_artifacts(model, RenderOptions{.mock_api = true}));
    EXPECT_TRUE(std::ranges::contains(with, "mock-api/src/commands/User.ts"));
    EXPECT_TRUE(std::ranges::contains(with, "mock-api/src/commands/Admin.ts"));
    EXPECT_TRUE(std::ranges::contains(with, "mock-api/index.ts"));
    EXPECT_TRUE(std::ranges::is_sorted(with));
}

TEST(PlanArtifacts, Deterministic)
{
    const auto first = plan_artifacts(analyze(kBackend), RenderOptions{.mock_api = true});
    const auto second = plan_artifacts(analyze(kBackend), RenderOptions{.mock_api = true});
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].path, second[i].path);
        EXPECT_EQ(first[i].template_name, second[i].template_name);
        EXPECT_EQ(first[i].context, second[i].context);
    }
}

// ============================================================================
// Templates
// ============================================================================

TEST(RenderTemplates, EveryArtifactStartsWithBanner)
{
    const auto files = render_all(analyze(kBackend), true);
    ASSERT_FALSE(files.empty());
    for (const auto& [path, content] : files) {
        EXPECT_TRUE(content.starts_with(banner())) << path;
    }
}

TEST(RenderTemplates, CommandWrapperWithoutTypes)
{
    const auto files = render_all(analyze(kBackend));
    const std::string expected = banner() +
                                 R"(import { invoke } from "@tauri-apps/api/core";
import { IAdmin } from "../../../interface/commands/src/commands/Admin";

export class Admin implements IAdmin {
    async banUser(userId: number, reason: string | undefined): Promise<void> {
        return invoke<void>("ban_user", { user_id: userId, reason });
    }
}

export function createAdmin(): IAdmin {
    return new Admin();
}
)";
    EXPECT_EQ(files.at("tauria-api/src/commands/Admin.ts"), expected);
}

TEST(RenderTemplates, CommandWrapperWithTypes)
{
    const auto files = render_all(analyze(kBackend));
    const std::string expected = banner() +
                                 R"(import { invoke } from "@tauri-apps/api/core";
import * as T from "../../../interface/types";
import { IUser } from "../../../interface/commands/src/commands/User";

export class User implements IUser {
    /**
     * Look up one user.
     */
    async getUser(id: number): Promise<T.User> {
        return invoke<T.User>("get_user", { id });
    }

    async listRoles(): Promise<T.Role[]> {
        return invoke<T.Role[]>("list_roles");
    }

    async broadcast(text: string): Promise<void> {
        return invoke<void>("broadcast", { text });
    }
}

export function createUser(): IUser {
    return new User();
}
)";
    EXPECT_EQ(files.at("tauria-api/src/commands/User.ts"), expected);
}

TEST(RenderTemplates, CommandInterface)
{
    const auto files = render_all(analyze(kBackend));
    const std::string expected = banner() +
                                 R"(import * as T from "../../../interface/types";

export interface IUser {
    /**
     * Look up one user.
     */
    getUser(id: number): Promise<T.User>;

    listRoles(): Promise<T.Role[]>;

    broadcast(text: string): Promise<void>;
}
)";
    EXPECT_EQ(files.at("interface/commands/src/commands/User.ts"), expected);

    const std::string admin = banner() +
                              R"(export interface IAdmin {
    banUser(userId: number, reason: string | undefined): Promise<void>;
}
)";
    EXPECT_EQ(files.at("interface/commands/src/commands/Admin.ts"), admin);
}

TEST(RenderTemplates, MockApi)
{
    const auto files = render_all(analyze(kBackend), true);
    const std::string expected = banner() +
                                 R"(import { IAdmin } from "../../../interface/commands/src/commands/Admin";

export class MockAdmin implements IAdmin {
    async banUser(userId: number, reason: string | undefined): Promise<void> {
        throw new Error("banUser is not implemented");
    }
}
)";
    EXPECT_EQ(files.at("mock-api/src/commands/Admin.ts"), expected);
}

TEST(RenderTemplates, TypesIndex)
{
    const auto files = render_all(analyze(kBackend));
    const std::string expected = banner() + R"(
//- Generated from src/models.rs
export type Role =
    | "Admin"
    | "Member";

//- Generated from src/models.rs
export interface User {
    /**
     * Identifier
     */
    id: number;
    /**
     * Display name
     */
    name: string;
    role: Role;
}
)";
    EXPECT_EQ(files.at("interface/types/index.ts"), expected);
}

TEST(RenderTemplates, TypeShapes)
{
    const auto files = render_all(analyze({
        {"src/shapes.rs", R"(
#[derive(Serialize)]
pub struct Point(f64, f64);

#[derive(Serialize)]
pub struct Id(u32);

#[derive(Serialize)]
pub struct Marker;

#[derive(Serialize)]
pub enum Never {}

#[derive(Serialize)]
pub enum Shape {
    Empty,
    Circle(f64),
    Rect { w: f64, h: f64 },
    Pair(u8, Option<String>),
}

#[derive(Serialize)]
pub struct Holder {
    shape: Shape,
    ids: Vec<Option<Id>>,
}
)"}
    }));
    const std::string expected = banner() + R"(
//- Generated from src/shapes.rs
export interface Holder {
    shape: Shape;
    ids: (Id | undefined)[];
}

//- Generated from src/shapes.rs
export type Id = number;

//- Generated from src/shapes.rs
export type Marker = null;

//- Generated from src/shapes.rs
export type Never = never;

//- Generated from src/shapes.rs
export type Point = [number, number];

//- Generated from src/shapes.rs
export type Shape =
    | "Empty"
    | { Circle: number }
    | { Rect: { w: number; h: number } }
    | { Pair: [number, string | undefined] };
)";
    EXPECT_EQ(files.at("interface/types/index.ts"), expected);
}

TEST(RenderTemplates, GlobalEventHandlers)
{
    const auto files = render_all(analyze(kBackend));
    const std::string expected = banner() +
                                 R"(import { Event, listen, UnlistenFn } from "@tauri-apps/api/event";

export abstract class GlobalEventHandlers {
    private readonly unlistenFns: Promise<UnlistenFn>[] = [];

    protected constructor() {
        this.unlistenFns.push(
            listen<string>('user-changed', (event) => { this.OnUserChanged(event); }));
    }

    public async Unlisten() {
        for (const x of this.unlistenFns) {
            (await x)();
        }
    }

    abstract OnUserChanged(event: Event<string>): void;
}
)";
    EXPECT_EQ(files.at("tauria-api/events/GlobalEventHandlers.ts"), expected);
}

TEST(RenderTemplates, WindowEventHandlersTargetLabel)
{
    const auto files = render_all(analyze(kBackend));
    const std::string expected = banner() +
                                 R"(import { Event, listen, UnlistenFn } from "@tauri-apps/api/event";

export abstract class MainWindowEventHandlers {
    private readonly unlistenFns: Promise<UnlistenFn>[] = [];

    protected constructor() {
        this.unlistenFns.push(
            listen<number>('window-event', (event) => { this.OnWindowEvent(event); }, { target: { kind: 'AnyLabel', label: 'main' } }));
        this.unlistenFns.push(
            listen<string>('main_event', (event) => { this.OnMainEvent(event); }, { target: { kind: 'AnyLabel', label: 'main' } }));
    }

    public async Unlisten() {
        for (const x of this.unlistenFns) {
            (await x)();
        }
    }

    abstract OnWindowEvent(event: Event<number>): void;

    abstract OnMainEvent(event: Event<string>): void;
}
)";
    EXPECT_EQ(files.at("tauria-api/events/MainWindowEventHandlers.ts"), expected);
}

TEST(RenderTemplates, EventPayloadUsesTypes)
{
    const auto files = render_all(analyze({
        {"src/lib.rs", R"(
use tauri::{AppHandle, Emitter};

#[derive(Serialize, Clone)]
pub struct Progress { done: u32 }

#[tauri::command]
fn start(app: AppHandle) {
    app.emit("progress", Progress { done: 0 }).ok();
}
)"}
    }));
    const auto& content = files.at("tauria-api/events/GlobalEventHandlers.ts");
    EXPECT_NE(content.find("import * as T from \"../../interface/types\";\n"), std::string::npos);
    EXPECT_NE(content.find("listen<T.Progress>('progress'"), std::string::npos);
    EXPECT_NE(content.find("abstract OnProgress(event: Event<T.Progress>): void;"), std::string::npos);
}

TEST(RenderTemplates, Barrels)
{
    const auto files = render_all(analyze(kBackend), true);
    EXPECT_EQ(files.at("tauria-api/src/commands/index.ts"),
              banner() + "export * from \"./Admin\";\nexport * from \"./User\";\n");
    EXPECT_EQ(files.at("tauria-api/index.ts"),
              banner() + "export * from \"./events\";\nexport * from \"./src\";\n");
    EXPECT_EQ(files.at("interface/index.ts"),
              banner() + "export * from \"./commands\";\nexport * from \"./types\";\n");
    EXPECT_EQ(files.at("index.ts"),
              banner() + "export * from \"./interface\";\nexport * from \"./tauria-api\";\n"
                         "// export * from \"./mock-api\";\n");
}

TEST(RenderTemplates, RootIndexWithoutMock)
{
    const auto files = render_all(analyze(kBackend));
    EXPECT_EQ(files.at("index.ts"),
              banner() + "export * from \"./interface\";\nexport * from \"./tauria-api\";\n");
}

// ============================================================================
// Renderer errors
// ============================================================================

TEST(TypeScriptRenderer, UnknownTemplate)
{
    auto result = TypeScriptRenderer().render("no_such_template", nlohmann::json::object());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "UnknownTemplate");
}

TEST(TypeScriptRenderer, MalformedContext)
{
    auto result = TypeScriptRenderer().render(templates::kBarrel, nlohmann::json::object());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "TemplateContextInvalid");
}

TEST(RenderArtifacts, FailureNamesArtifact)
{
    const auto plans = plan_artifacts(analyze(kBackend), RenderOptions{});
    auto result = render_artifacts(plans, RejectingRenderer());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "TemplateContextInvalid");
    EXPECT_TRUE(result.error().message.starts_with("interface/types/index.ts: "));
}

TEST(RenderArtifacts, PreservesPlanOrder)
{
    const auto plans = plan_artifacts(analyze(kBackend), RenderOptions{});
    auto result = render_artifacts(plans, RejectingRenderer());
    ASSERT_FALSE(result);

    std::vector<ArtifactPlan> without_types;
    std::ranges::copy_if(plans, std::back_inserter(without_types), [](const ArtifactPlan& plan) {
        return plan.template_name != templates::kTypesIndex;
    });
    auto rendered = render_artifacts(without_types, RejectingRenderer());
    ASSERT_TRUE(rendered) << rendered.error().message;
    ASSERT_EQ(rendered->size(), without_types.size());
    for (std::size_t i = 0; i < without_types.size(); ++i) {
        EXPECT_EQ((*rendered)[i].path, without_types[i].path);
        EXPECT_EQ((*rendered)[i].content, "ok");
    }
}

}  // namespace tsgen::render::tests
