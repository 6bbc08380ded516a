/**
 * @file test_type_resolver.cpp
 * @brief Type classification, handle exclusion and narrowing tests
 */

#include "tsgen/syntax.hpp"
#include "tsgen/types.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace tsgen;
using namespace tsgen::types;
using Kind = TypeDescriptor::Kind;

namespace {

const SourceLocation kLocation{.file = "src/lib.rs", .line = 3, .column = 5};

syntax::TypeExpr type_expr(std::string_view text)
{
    auto parsed = syntax::parse_type_text(text);
    EXPECT_TRUE(parsed) << (parsed ? std::string{} : parsed.error().reason);
    return parsed ? *parsed : syntax::TypeExpr{};
}

class TypeResolverTest : public ::testing::Test
{
protected:
    TypeDescriptor classify(std::string_view text)
    {
        TypeResolver resolver(m_aliases, m_diagnostics);
        return resolver.classify(type_expr(text), kLocation);
    }

    ResolvedParam classify_param(std::string_view text)
    {
        TypeResolver resolver(m_aliases, m_diagnostics);
        return resolver.classify_param(type_expr(text), kLocation);
    }

    syntax::AliasTable m_aliases;
    std::vector<Diagnostic> m_diagnostics;
};

}  // namespace

TEST_F(TypeResolverTest, Primitives)
{
    EXPECT_EQ(classify("String"), TypeDescriptor::make_primitive(PrimitiveKind::kString));
    EXPECT_EQ(classify("&str"), TypeDescriptor::make_primitive(PrimitiveKind::kString));
    EXPECT_EQ(classify("std::path::PathBuf"), TypeDescriptor::make_primitive(PrimitiveKind::kString));
    EXPECT_EQ(classify("u64"), TypeDescriptor::make_primitive(PrimitiveKind::kNumber));
    EXPECT_EQ(classify("f32"), TypeDescriptor::make_primitive(PrimitiveKind::kNumber));
    EXPECT_EQ(classify("bool"), TypeDescriptor::make_primitive(PrimitiveKind::kBoolean));
    EXPECT_TRUE(classify("()").is_void());
    EXPECT_TRUE(m_diagnostics.empty());
}

TEST_F(TypeResolverTest, Wrappers)
{
    const auto number = TypeDescriptor::make_primitive(PrimitiveKind::kNumber);
    const auto text = TypeDescriptor::make_primitive(PrimitiveKind::kString);

    EXPECT_EQ(classify("Option<u32>"), TypeDescriptor::make_optional(number));
    EXPECT_EQ(classify("Vec<String>"), TypeDescriptor::make_collection(text));
    EXPECT_EQ(classify("&[u8]"), TypeDescriptor::make_collection(number));
    EXPECT_EQ(classify("[u8; 4]"), TypeDescriptor::make_collection(number));
    EXPECT_EQ(classify("HashSet<u32>"), TypeDescriptor::make_collection(number));
    EXPECT_EQ(classify("std::collections::BTreeMap<String, u32>"), TypeDescriptor::make_map(text, number));
    EXPECT_EQ(classify("(String, u32)"), TypeDescriptor::make_tuple({text, number}));
    EXPECT_EQ(classify("Box<Arc<String>>"), text);
    EXPECT_EQ(classify("Cow<'static, str>"), text);
}

TEST_F(TypeResolverTest, ResultKeepsBothSides)
{
    auto result = classify("Result<Vec<User>, String>");
    ASSERT_EQ(result.kind, Kind::kResult);
    ASSERT_EQ(result.args.size(), 2U);
    EXPECT_EQ(result.args[0].kind, Kind::kCollection);
    EXPECT_EQ(result.args[1], TypeDescriptor::make_primitive(PrimitiveKind::kString));

    auto single = classify("anyhow::Result<u32>");
    EXPECT_EQ(single.kind, Kind::kNamedRef);

    auto bare = classify("Result<u32>");
    ASSERT_EQ(bare.kind, Kind::kResult);
    EXPECT_EQ(bare.args[1], TypeDescriptor::make_primitive(PrimitiveKind::kString));
}

TEST_F(TypeResolverTest, NamedReferences)
{
    m_aliases["User"] = "crate::models::User";
    auto user = classify("User");
    ASSERT_EQ(user.kind, Kind::kNamedRef);
    EXPECT_EQ(user.path, "crate::models::User");
    EXPECT_EQ(user.name, "User");
    EXPECT_FALSE(user.target.has_value());

    auto local = classify("Settings");
    ASSERT_EQ(local.kind, Kind::kNamedRef);
    EXPECT_EQ(local.path, "Settings");
    EXPECT_EQ(local.name, "Settings");
    EXPECT_TRUE(m_diagnostics.empty());
}

TEST_F(TypeResolverTest, OpaqueResponse)
{
    m_aliases["ipc"] = "tauri::ipc";
    auto response = classify("ipc::Response");
    EXPECT_EQ(response, TypeDescriptor::make_opaque("tauri::ipc::Response"));
}

TEST_F(TypeResolverTest, UnsupportedForms)
{
    auto pointer = classify("*const u8");
    EXPECT_EQ(pointer.kind, Kind::kUnsupported);
    EXPECT_EQ(pointer.path, "*const u8");

    auto std_item = classify("std::time::Instant");
    EXPECT_EQ(std_item.kind, Kind::kUnsupported);

    ASSERT_EQ(m_diagnostics.size(), 2U);
    EXPECT_EQ(m_diagnostics[0].code, diag::kUnsupportedType);
    EXPECT_EQ(m_diagnostics[0].severity, Severity::kWarning);
    EXPECT_EQ(m_diagnostics[0].location.line, 3);
    EXPECT_NE(m_diagnostics[0].message.find("'*const u8'"), std::string::npos);
}

TEST_F(TypeResolverTest, ExcludedHandles)
{
    m_aliases["Window"] = "tauri::Window";
    m_aliases["MyWin"] = "tauri::WebviewWindow";
    m_aliases["State"] = "tauri::State";

    auto window = classify_param("Window");
    EXPECT_EQ(window.handle, HandleKind::kWindow);
    EXPECT_FALSE(window.is_reference);
    EXPECT_EQ(window.canonical_path, "tauri::Window");

    auto aliased = classify_param("&MyWin");
    EXPECT_EQ(aliased.handle, HandleKind::kWindow);
    EXPECT_TRUE(aliased.is_reference);
    EXPECT_EQ(aliased.canonical_path, "tauri::WebviewWindow");

    auto state = classify_param("State<'_, Db>");
    EXPECT_EQ(state.handle, HandleKind::kState);

    auto app = classify_param("tauri::AppHandle");
    EXPECT_EQ(app.handle, HandleKind::kApp);

    auto qualified = classify_param("tauri::webview::Webview<R>");
    EXPECT_EQ(qualified.handle, HandleKind::kWindow);

    EXPECT_TRUE(m_diagnostics.empty());
}

TEST_F(TypeResolverTest, OrdinaryParams)
{
    auto id = classify_param("u32");
    EXPECT_EQ(id.handle, HandleKind::kNone);
    EXPECT_EQ(id.type, TypeDescriptor::make_primitive(PrimitiveKind::kNumber));

    auto name = classify_param("&str");
    EXPECT_TRUE(name.is_reference);
    EXPECT_EQ(name.type, TypeDescriptor::make_primitive(PrimitiveKind::kString));

    // only the bridge's own window type is injected
    auto foreign = classify_param("other::Window");
    EXPECT_EQ(foreign.handle, HandleKind::kNone);
    EXPECT_EQ(foreign.type.kind, Kind::kNamedRef);
}

TEST(HandleClassification, ExclusionSet)
{
    EXPECT_EQ(classify_handle("tauri::Window"), HandleKind::kWindow);
    EXPECT_EQ(classify_handle("tauri::window::Window"), HandleKind::kWindow);
    EXPECT_EQ(classify_handle("tauri::State"), HandleKind::kState);
    EXPECT_EQ(classify_handle("tauri::AppHandle"), HandleKind::kApp);
    EXPECT_EQ(classify_handle("Window"), HandleKind::kNone);
    EXPECT_TRUE(is_excluded(HandleKind::kState));
    EXPECT_FALSE(is_excluded(HandleKind::kNone));
}

TEST(CanonicalPath, AliasExpansion)
{
    syntax::AliasTable aliases{
        {"ipc", "tauri::ipc"}
    };
    EXPECT_EQ(canonical_path({"ipc", "Response"}, aliases), "tauri::ipc::Response");
    EXPECT_EQ(canonical_path({"crate", "models", "User"}, aliases), "crate::models::User");
    EXPECT_EQ(canonical_path({}, aliases), "");
}

TEST(Narrowing, ResultUnwrapped)
{
    const auto number = TypeDescriptor::make_primitive(PrimitiveKind::kNumber);
    const auto text = TypeDescriptor::make_primitive(PrimitiveKind::kString);

    EXPECT_EQ(narrow(TypeDescriptor::make_result(number, text)), number);
    EXPECT_EQ(narrow(TypeDescriptor::make_optional(TypeDescriptor::make_result(number, text))),
              TypeDescriptor::make_optional(number));
    EXPECT_EQ(narrow(TypeDescriptor::make_collection(TypeDescriptor::make_result(text, text))),
              TypeDescriptor::make_collection(text));
    EXPECT_EQ(narrow(number), number);
}

TEST(TypeJson, NamedCarriesTarget)
{
    auto user = TypeDescriptor::make_named("crate::models::User");
    user.target = "src/models.rs#User";
    nlohmann::json j = user;
    EXPECT_EQ(j["kind"], "named");
    EXPECT_EQ(j["name"], "User");
    EXPECT_EQ(j["target"], "src/models.rs#User");

    nlohmann::json optional = TypeDescriptor::make_optional(TypeDescriptor::make_primitive(PrimitiveKind::kBoolean));
    EXPECT_EQ(optional["kind"], "optional");
    EXPECT_EQ(optional["args"][0]["primitive"], "boolean");
}
