#include <gtest/gtest.h>
#include "tagreg/codegen.hpp"
#include "tagreg/registry.hpp"
#include "tagreg/registry_error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

using namespace tagreg;
using namespace std::chrono_literals;

class CodegenTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir = std::filesystem::temp_directory_path() /
                  ("tagreg_codegen_test_" + std::string(info->name()) + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(tempDir);
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    RegistryConfig makeConfig() const {
        RegistryConfig config;
        config.storePath = tempDir / "types.toml";
        config.lockTimeout = 2000ms;
        return config;
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path tempDir;
};

// ============================================================================
// Names
// ============================================================================

TEST_F(CodegenTest, ConstantNameReplacesPunctuation) {
    EXPECT_EQ(HeaderGenerator::constantName("test1"), "test1");
    EXPECT_EQ(HeaderGenerator::constantName("render.opaque"), "render_opaque");
    EXPECT_EQ(HeaderGenerator::constantName("a b-c"), "a_b_c");
    EXPECT_EQ(HeaderGenerator::constantName("3d"), "tag_3d");
}

TEST_F(CodegenTest, ExplicitConstantName) {
    HeaderGenerator gen;
    gen.addTag("OPAQUE=render pass: opaque");

    Registry registry(makeConfig());
    std::string header = gen.render(registry);
    EXPECT_NE(header.find("inline constexpr tagreg::Uuid OPAQUE{"), std::string::npos);
    EXPECT_TRUE(registry.find(TagNamespace::Custom, "render pass: opaque").has_value());
}

TEST_F(CodegenTest, EqualsSignWithoutIdentifierIsPartOfTag) {
    // "a.b" is not an identifier, so the whole text is the tag
    HeaderGenerator gen;
    gen.addTag("a.b=c");

    Registry registry(makeConfig());
    std::string header = gen.render(registry);
    EXPECT_NE(header.find("inline constexpr tagreg::Uuid a_b_c{"), std::string::npos);
    EXPECT_TRUE(registry.find(TagNamespace::Custom, "a.b=c").has_value());
}

TEST_F(CodegenTest, KeywordNameRejected) {
    HeaderGenerator gen;
    EXPECT_THROW(gen.addTag("class"), std::invalid_argument);
    EXPECT_THROW(gen.addTag("while"), std::invalid_argument);
}

TEST_F(CodegenTest, ConflictingConstantRejected) {
    HeaderGenerator gen;
    gen.addTag("render.opaque");
    EXPECT_NO_THROW(gen.addTag("render.opaque"));  // same request twice is fine
    EXPECT_THROW(gen.addTag("render_opaque"), std::invalid_argument);
}

TEST_F(CodegenTest, InvalidTagRejected) {
    HeaderGenerator gen;
    EXPECT_THROW(gen.addTag(""), InvalidKey);
    EXPECT_THROW(gen.addType("geo:Point"), InvalidKey);
}

TEST_F(CodegenTest, InvalidNamespaceRejected) {
    HeaderGenerator gen;
    gen.setNamespace("app::2tags");
    gen.addTag("test1");

    Registry registry(makeConfig());
    EXPECT_THROW((void)gen.render(registry), std::invalid_argument);
}

// ============================================================================
// Rendering
// ============================================================================

TEST_F(CodegenTest, UuidInitializerFormat) {
    auto id = Uuid::parse("67e55044-10b1-426f-9247-bb680e5fe0c8").value();
    EXPECT_EQ(uuidInitializer(id),
              "tagreg::Uuid::Bytes{0x67, 0xe5, 0x50, 0x44, 0x10, 0xb1, 0x42, 0x6f, "
              "0x92, 0x47, 0xbb, 0x68, 0x0e, 0x5f, 0xe0, 0xc8}");
}

TEST_F(CodegenTest, RenderEmbedsResolvedIdentifiers) {
    HeaderGenerator gen;
    gen.setNamespace("demo_tags");
    gen.addInclude("demo_types.hpp");
    gen.addType("::geo::Point");
    gen.addType("ui::Point");
    gen.addTag("test1");

    Registry registry(makeConfig());
    std::string header = gen.render(registry);

    Uuid geo = registry.findType("geo::Point").value();
    Uuid ui = registry.findType("ui::Point").value();
    Uuid test1 = registry.find(TagNamespace::Custom, "test1").value();

    EXPECT_EQ(header.rfind("// Generated by tagreg from types.toml. Do not edit.\n#pragma once\n", 0), 0u);
    EXPECT_NE(header.find("#include <tagreg/unique_tag.hpp>"), std::string::npos);
    EXPECT_NE(header.find("#include \"demo_types.hpp\""), std::string::npos);
    EXPECT_NE(header.find("struct TypeTag<::geo::Point>"), std::string::npos);
    EXPECT_NE(header.find("struct TypeTag<::ui::Point>"), std::string::npos);
    EXPECT_NE(header.find(uuidInitializer(geo)), std::string::npos);
    EXPECT_NE(header.find(uuidInitializer(ui)), std::string::npos);
    EXPECT_NE(header.find("namespace demo_tags {"), std::string::npos);
    EXPECT_NE(header.find("inline constexpr tagreg::Uuid test1{" + uuidInitializer(test1) + "};"),
              std::string::npos);
}

TEST_F(CodegenTest, RenderIsStable) {
    HeaderGenerator gen;
    gen.addType("geo::Point");
    gen.addTag("test1");

    Registry registry(makeConfig());
    EXPECT_EQ(gen.render(registry), gen.render(registry));
}

TEST_F(CodegenTest, DuplicateTypeRenderedOnce) {
    HeaderGenerator gen;
    gen.addType("geo::Point");
    gen.addType(" ::geo :: Point");

    Registry registry(makeConfig());
    std::string header = gen.render(registry);
    auto first = header.find("struct TypeTag<::geo::Point>");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(header.find("struct TypeTag<::geo::Point>", first + 1), std::string::npos);
}

TEST_F(CodegenTest, KeywordTypesTakeNoScopePrefix) {
    HeaderGenerator gen;
    gen.addType("unsigned   int");
    gen.addType("int");
    gen.addType("std::size_t");

    Registry registry(makeConfig());
    std::string header = gen.render(registry);
    EXPECT_NE(header.find("struct TypeTag<unsigned int> {"), std::string::npos);
    EXPECT_NE(header.find("struct TypeTag<int> {"), std::string::npos);
    EXPECT_NE(header.find("struct TypeTag<::std::size_t> {"), std::string::npos);
    EXPECT_EQ(header.find("::unsigned"), std::string::npos);
    EXPECT_EQ(header.find("::int"), std::string::npos);
}

TEST_F(CodegenTest, WriteToSkipsUnchangedOutput) {
    HeaderGenerator gen;
    gen.addTag("test1");
    auto out = tempDir / "generated" / "tags.hpp";

    Registry registry(makeConfig());
    EXPECT_TRUE(gen.writeTo(out, registry));
    std::string first = readFile(out);
    EXPECT_FALSE(gen.writeTo(out, registry));
    EXPECT_EQ(readFile(out), first);

    gen.addTag("test2");
    EXPECT_TRUE(gen.writeTo(out, registry));
    EXPECT_NE(readFile(out).find("test2"), std::string::npos);
}

TEST_F(CodegenTest, RegenerationAcrossBuildsIsIdentical) {
    auto out = tempDir / "tags.hpp";
    {
        HeaderGenerator gen;
        gen.addType("geo::Point");
        gen.addTag("test1");
        Registry registry(makeConfig());
        EXPECT_TRUE(gen.writeTo(out, registry));
    }

    // A clean rebuild against the same store must not touch the header
    HeaderGenerator gen;
    gen.addType("geo::Point");
    gen.addTag("test1");
    Registry registry(makeConfig());
    EXPECT_FALSE(gen.writeTo(out, registry));
}
