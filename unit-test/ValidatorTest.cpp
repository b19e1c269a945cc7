#include "exec/validator.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace pyexec;

static void expect_rejected(const string &source, const string &message) {
    auto error = validate_script(source);
    ASSERT_TRUE(error.has_value()) << source;
    EXPECT_EQ(error->type, error_type::VALIDATION_ERROR);
    EXPECT_EQ(error->message, message);
}

TEST(ValidatorTest, AcceptsMinimalScript) {
    EXPECT_FALSE(validate_script("def main():\n    return {\"a\": 1}\n"));
}

TEST(ValidatorTest, AcceptsHelperFunctionsAroundMain) {
    string source = R"PY(
import math

def helper(x):
    return x * 2

def main():
    value = helper(21)
    return {"value": value, "pi": math.pi}

def unused():
    pass
)PY";
    EXPECT_FALSE(validate_script(source));
}

TEST(ValidatorTest, AcceptsBareReturn) {
    EXPECT_FALSE(validate_script("def main():\n    print('x')\n    return\n"));
}

TEST(ValidatorTest, AcceptsUnreachableOrNestedReturn) {
    // 只做浅层检查，运行时才会暴露问题
    EXPECT_FALSE(validate_script("def main():\n    if False:\n        return 1\n    x = 1\n"));
    EXPECT_FALSE(validate_script("def main():\n    def inner():\n        return 1\n    inner()\n"));
}

TEST(ValidatorTest, RejectsEmptyScript) {
    expect_rejected("", "Script content cannot be empty");
    expect_rejected("   \n\t\n  ", "Script content cannot be empty");
}

TEST(ValidatorTest, RejectsMissingMain) {
    expect_rejected("print('hello world')\n", "Script must contain a 'main()' function");
    expect_rejected("def main(x):\n    return x\n", "Script must contain a 'main()' function");
    expect_rejected("def not_main():\n    return 1\n", "Script must contain a 'main()' function");
}

TEST(ValidatorTest, RejectsMainWithoutReturn) {
    expect_rejected("def main():\n    print('hello')\n", "main() function must contain a return statement");
}

TEST(ValidatorTest, ReturnInSiblingFunctionDoesNotCount) {
    string source = "def main():\n    print('hello')\n\ndef helper():\n    return 1\n";
    expect_rejected(source, "main() function must contain a return statement");
}

TEST(ValidatorTest, IdentifierStartingWithReturnIsNotAReturn) {
    string source = "def main():\n    returned = 1\n    return_value = returned\n";
    expect_rejected(source, "main() function must contain a return statement");
}

TEST(ValidatorTest, EmptyCheckComesFirst) {
    auto error = validate_script("\n\n");
    ASSERT_TRUE(error);
    EXPECT_EQ(error->message, "Script content cannot be empty");
}
