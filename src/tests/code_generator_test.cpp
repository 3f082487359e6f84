#include <gtest/gtest.h>
#include "code/code_generator.hpp"
#include "code/document_types.hpp"
#include "test_utils.hpp"
#include <set>
#include <string>

using namespace docreg::code;

class CodeGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logging();
    }
};

TEST_F(CodeGeneratorTest, GeneratedCodeShape) {
    for (const auto& type : document_types()) {
        std::string code = generate_code(type.prefix);
        EXPECT_EQ(code.size(), FULL_CODE_LENGTH);
        EXPECT_EQ(code.substr(0, 2), type.prefix);
        EXPECT_EQ(code[2], '-');
        EXPECT_TRUE(is_full_code(code)) << code;
    }
}

TEST_F(CodeGeneratorTest, PrefixIsUpperCased) {
    std::string code = generate_code("cm");
    EXPECT_EQ(code.substr(0, 3), "CM-");
    EXPECT_TRUE(is_full_code(code));
}

TEST_F(CodeGeneratorTest, InvalidPrefixThrows) {
    EXPECT_THROW(generate_code(""), MalformedCodeError);
    EXPECT_THROW(generate_code("C"), MalformedCodeError);
    EXPECT_THROW(generate_code("CMX"), MalformedCodeError);
    EXPECT_THROW(generate_code("C1"), MalformedCodeError);
}

// Every alphabet symbol shows up across many generated codes
TEST_F(CodeGeneratorTest, UsesWholeAlphabet) {
    std::set<char> seen;
    std::set<std::string> codes;
    for (int i = 0; i < 500; ++i) {
        std::string code = generate_code("OT");
        codes.insert(code);
        seen.insert(code.begin() + 3, code.end());
    }
    EXPECT_EQ(seen.size(), std::string(CODE_ALPHABET).size());
    EXPECT_EQ(codes.size(), 500u);
}

TEST_F(CodeGeneratorTest, DeriveShortCode) {
    EXPECT_EQ(derive_short_code("CM-A1B2C3D4E5F6"), "ABCDEF");
    EXPECT_EQ(derive_short_code("cm-a1b2c3d4e5f6"), "ABCDEF");
    EXPECT_EQ(derive_short_code("IA-123456789012"), "135791");
}

TEST_F(CodeGeneratorTest, DeriveShortCodeIsStable) {
    std::string code = generate_code("IR");
    std::string short_code = derive_short_code(code);
    EXPECT_EQ(short_code.size(), SHORT_CODE_LENGTH);
    EXPECT_TRUE(is_short_code(short_code));
    EXPECT_EQ(derive_short_code(code), short_code);
}

TEST_F(CodeGeneratorTest, DeriveShortCodeRejectsMalformed) {
    EXPECT_THROW(derive_short_code(""), MalformedCodeError);
    EXPECT_THROW(derive_short_code("ABCDEF"), MalformedCodeError);
    EXPECT_THROW(derive_short_code("CM_A1B2C3D4E5F6"), MalformedCodeError);
    EXPECT_THROW(derive_short_code("CM-A1B2C3D4E5F"), MalformedCodeError);
    EXPECT_THROW(derive_short_code("C1-A1B2C3D4E5F6"), MalformedCodeError);
}

TEST_F(CodeGeneratorTest, NormalizeAndClassify) {
    EXPECT_EQ(normalize_code("  cm-a1b2c3d4e5f6\n"), "CM-A1B2C3D4E5F6");
    EXPECT_EQ(normalize_code("   "), "");
    EXPECT_EQ(normalize_code(""), "");

    EXPECT_TRUE(is_full_code("CM-A1B2C3D4E5F6"));
    EXPECT_FALSE(is_full_code("cm-a1b2c3d4e5f6"));
    EXPECT_FALSE(is_full_code("CM-A1B2C3D4E5F6X"));

    EXPECT_TRUE(is_short_code("ABCDEF"));
    EXPECT_TRUE(is_short_code("A1B2C3"));
    EXPECT_FALSE(is_short_code("ABCDE"));
    EXPECT_FALSE(is_short_code("ABC-EF"));

    EXPECT_TRUE(is_valid_prefix("CM"));
    EXPECT_TRUE(is_valid_prefix("zz"));
    EXPECT_FALSE(is_valid_prefix("C"));
}

TEST_F(CodeGeneratorTest, DocumentTypeCatalog) {
    ASSERT_EQ(document_types().size(), 5u);

    auto cm = document_type_for_prefix("cm");
    ASSERT_TRUE(cm.has_value());
    EXPECT_EQ(cm->code, "carta_manifestacion");

    auto ot = document_type_for_code("OT-ABCDEF123456");
    ASSERT_TRUE(ot.has_value());
    EXPECT_EQ(ot->display, "Otros Documentos");

    EXPECT_FALSE(document_type_for_prefix("ZZ").has_value());
    EXPECT_FALSE(document_type_for_code("C").has_value());
}
