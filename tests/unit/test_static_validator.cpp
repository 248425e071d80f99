#include <gtest/gtest.h>

#include "sandbox/static_validator.hpp"

using namespace snipguard;
using snipguard::sandbox::StaticValidator;

TEST(StaticValidatorTest, AcceptsPlainArithmetic) {
    StaticValidator validator;
    EXPECT_TRUE(validator.Validate("2 + 2").ok);
    EXPECT_TRUE(validator.Validate("result = sum(range(10))\nprint(result)").ok);
    EXPECT_TRUE(validator.Validate("import math\nresult = math.sqrt(16)").ok);
}

TEST(StaticValidatorTest, RejectsImportOs) {
    StaticValidator validator;
    const auto verdict = validator.Validate("import os");
    EXPECT_FALSE(verdict.ok);
    EXPECT_EQ("import os", verdict.pattern);
    EXPECT_EQ("Code contains potentially dangerous operation: import os", verdict.reason);
}

TEST(StaticValidatorTest, MatchIsCaseInsensitive) {
    StaticValidator validator;
    const auto verdict = validator.Validate("IMPORT OS");
    EXPECT_FALSE(verdict.ok);
    EXPECT_EQ("import os", verdict.pattern);
}

TEST(StaticValidatorTest, FirstMatchWins) {
    StaticValidator validator;
    const auto verdict = validator.Validate("eval('1')\nimport os");
    EXPECT_FALSE(verdict.ok);
    EXPECT_EQ("import os", verdict.pattern);
}

TEST(StaticValidatorTest, RejectsIntrospectionAccessors) {
    StaticValidator validator;
    EXPECT_FALSE(validator.Validate("().__class__.__bases__").ok);
    EXPECT_FALSE(validator.Validate("getattr(x, 'y')").ok);
    EXPECT_FALSE(validator.Validate("globals()").ok);
    EXPECT_FALSE(validator.Validate("vars(x)").ok);
    EXPECT_FALSE(validator.Validate("open('/etc/passwd')").ok);
}

TEST(StaticValidatorTest, RejectsDetachedDynamicCall) {
    StaticValidator validator;
    const auto verdict = validator.Validate("eval  ('1+1')");
    EXPECT_FALSE(verdict.ok);
    EXPECT_EQ("dynamic call with detached parenthesis", verdict.pattern);
}

TEST(StaticValidatorTest, RejectsAliasOfDynamicPrimitive) {
    StaticValidator validator;
    const auto verdict = validator.Validate("f = eval\nf('1')");
    EXPECT_FALSE(verdict.ok);
    EXPECT_EQ("alias of a dynamic execution primitive", verdict.pattern);
}

TEST(StaticValidatorTest, RejectsCharacterCodeBuilding) {
    StaticValidator validator;
    const auto verdict = validator.Validate("name = chr(111) + chr(115)");
    EXPECT_FALSE(verdict.ok);
    EXPECT_EQ("character-code string building", verdict.pattern);
}

TEST(StaticValidatorTest, RejectsNulByteAndOversizedSnippets) {
    StaticValidator validator;
    EXPECT_FALSE(validator.Validate(std::string("1\0", 2)).ok);
    EXPECT_FALSE(validator.Validate(std::string(64 * 1024 + 1, '1')).ok);
}

TEST(StaticValidatorTest, StandardPolicyAllowsStringBuilding) {
    StaticValidator validator(config::DenylistPolicy::kStandard);
    EXPECT_TRUE(validator.Validate("greeting = 'a' + 'b'").ok);
    EXPECT_TRUE(validator.Validate("'{} items'.format(3)").ok);
}

TEST(StaticValidatorTest, StrictPolicyRejectsStringBuilding) {
    StaticValidator validator(config::DenylistPolicy::kStrict);
    EXPECT_FALSE(validator.Validate("\"a\" + \"b\"").ok);
    EXPECT_FALSE(validator.Validate("'{} items'.format(3)").ok);
    EXPECT_FALSE(validator.Validate("','.join(['a', 'b'])").ok);
    EXPECT_FALSE(validator.Validate("x = f'{y}'").ok);
    EXPECT_TRUE(validator.Validate("2 + 2").ok);
}

TEST(StaticValidatorTest, StrictPolicyOnlyNarrows) {
    StaticValidator standard(config::DenylistPolicy::kStandard);
    StaticValidator strict(config::DenylistPolicy::kStrict);
    EXPECT_TRUE(standard.Validate("x = 'a' + 'b'").ok);
    EXPECT_FALSE(strict.Validate("x = 'a' + 'b'").ok);
    EXPECT_FALSE(standard.Validate("import os").ok);
    EXPECT_FALSE(strict.Validate("import os").ok);
    EXPECT_EQ(config::DenylistPolicy::kStandard, standard.Policy());
    EXPECT_EQ(config::DenylistPolicy::kStrict, strict.Policy());
}
