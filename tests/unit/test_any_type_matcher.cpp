#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "auditor/any_type_matcher.h"

using namespace StrictKit::Audit;

class AnyTypeMatcherTest : public ::testing::Test {
protected:
    uint32_t countTs(const std::string& code) const {
        const auto n = matcher_.countEscapeMarkers("src/file.ts", code);
        EXPECT_TRUE(n.has_value()) << "parse unexpectedly failed for: " << code;
        return n.value_or(0);
    }

    AnyTypeMatcher matcher_;
};

TEST_F(AnyTypeMatcherTest, VariableAnnotation) {
    EXPECT_EQ(countTs("let x: any = 1;"), 1u);
}

TEST_F(AnyTypeMatcherTest, UnionMember) {
    EXPECT_EQ(countTs("type T = string | any;"), 1u);
}

TEST_F(AnyTypeMatcherTest, ReturnAndParameterTypes) {
    EXPECT_EQ(countTs("function f(a: any, b: number): any { return a; }"), 2u);
}

TEST_F(AnyTypeMatcherTest, AsAnyAssertion) {
    EXPECT_EQ(countTs("const y = (window as any).foo;"), 1u);
}

TEST_F(AnyTypeMatcherTest, GenericArgumentsAndArrays) {
    EXPECT_EQ(countTs("const m: Map<string, any> = new Map();\nlet list: any[] = [];"), 2u);
}

TEST_F(AnyTypeMatcherTest, MappedTypeValue) {
    EXPECT_EQ(countTs("type Loose<T> = { [K in keyof T]: any };"), 1u);
}

TEST_F(AnyTypeMatcherTest, CommentsStringsAndIdentifiersIgnored) {
    const std::string code =
        "// any in a comment: any\n"
        "/* x: any */\n"
        "const s = 'x: any';\n"
        "const t = `as any`;\n"
        "const anyValue: number = 3;\n"
        "const company = { many: 1 };\n";
    EXPECT_EQ(countTs(code), 0u);
}

TEST_F(AnyTypeMatcherTest, CleanFileIsZero) {
    EXPECT_EQ(countTs("export function add(a: number, b: number): number { return a + b; }"), 0u);
    EXPECT_EQ(countTs("let u: unknown = JSON.parse('{}');"), 0u);
}

TEST_F(AnyTypeMatcherTest, EmptySourceIsZero) {
    EXPECT_EQ(countTs(""), 0u);
}

TEST_F(AnyTypeMatcherTest, TsxUsesJsxGrammar) {
    const std::string code =
        "export const View = (props: any) => <div className=\"any\">{props.x}</div>;\n";
    const auto n = matcher_.countEscapeMarkers("src/View.tsx", code);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 1u);
}

TEST_F(AnyTypeMatcherTest, SyntaxErrorsStillCounted) {
    // Error recovery keeps the valid declaration before the broken one
    const auto n = matcher_.countEscapeMarkers("src/broken.ts", "let a: any = 1;\nlet b = ;\n");
    ASSERT_TRUE(n.has_value());
    EXPECT_GE(*n, 1u);
}

TEST_F(AnyTypeMatcherTest, TsxPathDetection) {
    EXPECT_TRUE(AnyTypeMatcher::isTsxPath("a/b/c.tsx"));
    EXPECT_FALSE(AnyTypeMatcher::isTsxPath("a/b/c.ts"));
    EXPECT_FALSE(AnyTypeMatcher::isTsxPath("tsx"));
}
