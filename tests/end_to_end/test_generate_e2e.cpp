/**
 * @file test_generate_e2e.cpp
 * @brief End-to-end generation: backend tree on disk -> tsgen -> TypeScript tree
 */

#include "tsgen/analyzer.hpp"
#include "tsgen/render.hpp"
#include "tsgen/schema_validate.hpp"
#include "tsgen/source.hpp"
#include "tsgen/writer.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

[[nodiscard]] std::string quote_path(const fs::path& path)
{
    return std::format("\"{}\"", path.string());
}

[[nodiscard]] int run_command(const std::string& command)
{
    return std::system(command.c_str());
}

[[nodiscard]] std::string tsgen_command()
{
    return quote_path(fs::path(TSGEN_BIN_DIR) / "tsgen");
}

void write_file(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/// Relative path -> content for every regular file below @p root.
std::map<std::string, std::string> snapshot(const fs::path& root)
{
    std::map<std::string, std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files.emplace(fs::relative(entry.path(), root).generic_string(), read_file(entry.path()));
        }
    }
    return files;
}

void write_backend(const fs::path& root)
{
    write_file(root / "Cargo.toml", "[package]\nname = \"demo\"\n");
    write_file(root / "src/main.rs", R"(
mod commands;
mod models;

fn main() {
    tauri::Builder::default()
        .invoke_handler(tauri::generate_handler![commands::user::get_user])
        .run(tauri::generate_context!())
        .unwrap();
}
)");
    write_file(root / "src/models.rs", R"(
use serde::{Deserialize, Serialize};

/// A registered user.
#[derive(Serialize, Deserialize, Clone)]
pub struct User {
    pub id: u32,
    pub name: String,
    pub tags: Vec<String>,
}

#[derive(Serialize, Deserialize, Clone)]
pub enum Status {
    Online,
    Away { since: u64 },
}
)");
    write_file(root / "src/commands/user.rs", R"(
use tauri::{AppHandle, Emitter, Manager, State, WebviewWindow};
use crate::models::{Status, User};

/// Fetch a user by id.
#[tauri::command]
pub async fn get_user(state: State<'_, Db>, user_id: u32) -> Result<User, String> {
    todo!()
}

#[tauri::command]
pub fn set_status(window: WebviewWindow, status: Status) {
    window.emit("status-changed", status.clone()).ok();
}

#[tauri::command]
pub fn refresh(app: AppHandle) {
    app.emit("refreshed", ()).ok();
}
)");
    write_file(root / "src/commands/settings.rs", R"(
use std::collections::HashMap;

#[tauri::command]
pub fn load_settings() -> HashMap<String, String> {
    HashMap::new()
}
)");
}

}  // namespace

TEST(GenerateE2E, WritesExpectedTree)
{
    TempDir temp_dir("tsgen_e2e_tree");
    const auto input = temp_dir.path() / "backend";
    const auto output = temp_dir.path() / "generated";
    write_backend(input);

    const std::string command = std::format("{} generate --input-path {} --output-path {} --jobs 1 > {}",
                                            tsgen_command(),
                                            quote_path(input),
                                            quote_path(output),
                                            quote_path(temp_dir.path() / "stdout.txt"));
    ASSERT_EQ(run_command(command), 0) << command;

    for (const char* relative : {"index.ts",
                                 "interface/index.ts",
                                 "interface/types/index.ts",
                                 "interface/commands/src/commands/User.ts",
                                 "interface/commands/src/commands/Settings.ts",
                                 "tauria-api/src/commands/User.ts",
                                 "tauria-api/src/commands/Settings.ts",
                                 "tauria-api/src/commands/index.ts",
                                 "tauria-api/events/GlobalEventHandlers.ts"}) {
        EXPECT_TRUE(fs::exists(output / relative)) << relative;
    }
    EXPECT_FALSE(fs::exists(output / "mock-api"));
    EXPECT_FALSE(fs::exists(temp_dir.path() / ".generated.tsgen-staging"));

    const auto user = read_file(output / "tauria-api/src/commands/User.ts");
    EXPECT_NE(user.find("async getUser(userId: number): Promise<T.User> {"), std::string::npos) << user;
    EXPECT_NE(user.find("return invoke<T.User>(\"get_user\", { userId });"), std::string::npos) << user;
    EXPECT_NE(user.find("async setStatus(status: T.Status): Promise<void> {"), std::string::npos) << user;

    const auto settings = read_file(output / "tauria-api/src/commands/Settings.ts");
    EXPECT_NE(settings.find("Promise<Record<string, string>>"), std::string::npos) << settings;
    EXPECT_EQ(settings.find("import * as T"), std::string::npos) << settings;

    const auto types = read_file(output / "interface/types/index.ts");
    EXPECT_NE(types.find("export interface User {\n    id: number;\n    name: string;\n    tags: string[];\n}"),
              std::string::npos)
        << types;
    EXPECT_NE(types.find("    | { Away: { since: number } };"), std::string::npos) << types;

    const auto global = read_file(output / "tauria-api/events/GlobalEventHandlers.ts");
    EXPECT_NE(global.find("listen<void>('refreshed'"), std::string::npos) << global;

    const auto stdout_text = read_file(temp_dir.path() / "stdout.txt");
    EXPECT_TRUE(stdout_text.starts_with(std::format("[generate] Wrote {} artifacts", snapshot(output).size())))
        << stdout_text;
}

TEST(GenerateE2E, WindowParameterScopesEvents)
{
    TempDir temp_dir("tsgen_e2e_window");
    const auto input = temp_dir.path() / "backend";
    const auto output = temp_dir.path() / "generated";
    write_backend(input);

    const std::string command = std::format("{} generate --input-path {} --output-path {}",
                                            tsgen_command(),
                                            quote_path(input),
                                            quote_path(output));
    ASSERT_EQ(run_command(command), 0) << command;

    const auto handlers = read_file(output / "tauria-api/events/WindowWindowEventHandlers.ts");
    EXPECT_NE(handlers.find("export abstract class WindowWindowEventHandlers {"), std::string::npos) << handlers;
    EXPECT_NE(handlers.find("listen<T.Status>('status-changed'"), std::string::npos) << handlers;
    EXPECT_NE(handlers.find("{ target: { kind: 'AnyLabel', label: 'window' } }"), std::string::npos) << handlers;
}

TEST(GenerateE2E, MockApiFromConfigFile)
{
    TempDir temp_dir("tsgen_e2e_config");
    const auto input = temp_dir.path() / "backend";
    const auto output = temp_dir.path() / "generated";
    write_backend(input);
    const nlohmann::json config = {
        { "input_path",  input.string()},
        {"output_path", output.string()},
        {   "mock_api",            true}
    };
    write_file(temp_dir.path() / "tsgen.json", config.dump(2));

    const std::string command = std::format("{} generate --config {} --schema-dir {}",
                                            tsgen_command(),
                                            quote_path(temp_dir.path() / "tsgen.json"),
                                            quote_path(TSGEN_SCHEMA_DIR));
    ASSERT_EQ(run_command(command), 0) << command;

    const auto mock = read_file(output / "mock-api/src/commands/User.ts");
    EXPECT_NE(mock.find("export class MockUser implements IUser {"), std::string::npos) << mock;
    EXPECT_NE(read_file(output / "index.ts").find("// export * from \"./mock-api\";"), std::string::npos);
}

TEST(GenerateE2E, InvalidConfigFails)
{
    TempDir temp_dir("tsgen_e2e_bad_config");
    write_file(temp_dir.path() / "tsgen.json", R"({"input_path": "x"})");

    const std::string command = std::format("{} generate --config {} --schema-dir {} 2> {}",
                                            tsgen_command(),
                                            quote_path(temp_dir.path() / "tsgen.json"),
                                            quote_path(TSGEN_SCHEMA_DIR),
                                            quote_path(temp_dir.path() / "stderr.txt"));
    EXPECT_NE(run_command(command), 0) << command;
    EXPECT_NE(read_file(temp_dir.path() / "stderr.txt").find("does not match config.v1"), std::string::npos);
}

TEST(GenerateE2E, MissingPathsFail)
{
    const std::string command = std::format("{} generate --input-path src-tauri > /dev/null 2>&1", tsgen_command());
    EXPECT_NE(run_command(command), 0) << command;
}

TEST(GenerateE2E, SyntaxErrorStillWritesOtherFiles)
{
    TempDir temp_dir("tsgen_e2e_syntax_error");
    const auto input = temp_dir.path() / "backend";
    const auto output = temp_dir.path() / "generated";
    write_backend(input);
    write_file(input / "src/broken.rs", "#[tauri::command]\nfn broken( {\n");

    const std::string command = std::format("{} generate --input-path {} --output-path {} 2> {}",
                                            tsgen_command(),
                                            quote_path(input),
                                            quote_path(output),
                                            quote_path(temp_dir.path() / "stderr.txt"));
    EXPECT_NE(run_command(command), 0) << command;
    EXPECT_TRUE(fs::exists(output / "tauria-api/src/commands/User.ts"));
    EXPECT_FALSE(fs::exists(output / "tauria-api/src/Broken.ts"));
    EXPECT_NE(read_file(temp_dir.path() / "stderr.txt").find("src/broken.rs"), std::string::npos);
}

TEST(GenerateE2E, ModelOutMatchesSchema)
{
    TempDir temp_dir("tsgen_e2e_model");
    const auto input = temp_dir.path() / "backend";
    const auto model_path = temp_dir.path() / "model.json";
    write_backend(input);

    const std::string command = std::format("{} analyze --input-path {} --model-out {} --schema-dir {} > /dev/null",
                                            tsgen_command(),
                                            quote_path(input),
                                            quote_path(model_path),
                                            quote_path(TSGEN_SCHEMA_DIR));
    ASSERT_EQ(run_command(command), 0) << command;

    const auto text = read_file(model_path);
    const auto model = nlohmann::json::parse(text);
    auto valid = tsgen::common::validate_json(model, tsgen::common::schema_file(TSGEN_SCHEMA_DIR, "model.v1"));
    ASSERT_TRUE(valid) << valid.error().message;
    EXPECT_EQ(model.at("schema_version"), "model.v1");
    EXPECT_EQ(text.find("\n"), text.size() - 1);
}

TEST(GenerateE2E, OutputIndependentOfJobs)
{
    TempDir temp_dir("tsgen_e2e_jobs");
    const auto input = temp_dir.path() / "backend";
    write_backend(input);
    for (int i = 0; i < 12; ++i) {
        write_file(input / std::format("src/extra/mod_{}.rs", i),
                   std::format("#[tauri::command]\npub fn ping_{0}(n: u32) -> u32 {{ n }}\n", i));
    }

    std::map<std::string, std::string> first;
    for (const int jobs : {1, 4}) {
        const auto output = temp_dir.path() / std::format("out_{}", jobs);
        const auto model_path = temp_dir.path() / std::format("model_{}.json", jobs);
        const std::string command =
            std::format("{} generate --input-path {} --output-path {} --jobs {} --model-out {} > /dev/null",
                        tsgen_command(),
                        quote_path(input),
                        quote_path(output),
                        jobs,
                        quote_path(model_path));
        ASSERT_EQ(run_command(command), 0) << command;

        auto files = snapshot(output);
        files.emplace("<model>", read_file(model_path));
        if (first.empty()) {
            first = std::move(files);
        } else {
            EXPECT_EQ(files, first);
        }
    }
    EXPECT_TRUE(first.contains("tauria-api/src/extra/Mod11.ts"));
}

TEST(GenerateE2E, LibraryPipelineMatchesCli)
{
    TempDir temp_dir("tsgen_e2e_library");
    const auto input = temp_dir.path() / "backend";
    const auto cli_output = temp_dir.path() / "cli";
    const auto lib_output = temp_dir.path() / "lib";
    write_backend(input);

    const std::string command = std::format("{} generate --input-path {} --output-path {} > /dev/null",
                                            tsgen_command(),
                                            quote_path(input),
                                            quote_path(cli_output));
    ASSERT_EQ(run_command(command), 0) << command;

    const tsgen::source::DiskFileProvider provider{input};
    auto analysis = tsgen::analyzer::Analyzer().analyze(provider);
    ASSERT_TRUE(analysis) << analysis.error().message;
    const auto plans = tsgen::render::plan_artifacts(analysis->model, tsgen::render::RenderOptions{});
    auto artifacts = tsgen::render::render_artifacts(plans, tsgen::render::TypeScriptRenderer());
    ASSERT_TRUE(artifacts) << artifacts.error().message;
    tsgen::writer::DiskWriter writer{lib_output};
    auto commit = writer.commit(*artifacts);
    ASSERT_TRUE(commit) << commit.error().message;

    EXPECT_EQ(snapshot(lib_output), snapshot(cli_output));
}

TEST(GenerateE2E, Version)
{
    TempDir temp_dir("tsgen_e2e_version");
    const std::string command =
        std::format("{} --version > {}", tsgen_command(), quote_path(temp_dir.path() / "version.txt"));
    ASSERT_EQ(run_command(command), 0) << command;
    EXPECT_TRUE(read_file(temp_dir.path() / "version.txt").starts_with("tsgen "));
}
