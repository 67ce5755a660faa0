#include <nlohmann/json.hpp>
#include <regex>
#include "gtest/gtest.h"
#include "sandbox/validator.hpp"

using namespace std;
using namespace sandbox;
using namespace nlohmann;

class CodeValidatorTest : public ::testing::Test {
protected:
    python_ast_parser parser;
    code_validator validator{parser, validator_config::defaults()};

    validation_result validate(const string &code) {
        return validator.validate(code, language::PYTHON);
    }
};

TEST_F(CodeValidatorTest, AllowedLibraries) {
    auto result = validate(R"(import numpy as np
import pandas as pd
import numpy.linalg
from matplotlib import pyplot as plt
from collections import Counter
import re

df = pd.DataFrame({"a": np.arange(10)})
pattern = re.compile(r"\d+")
print(df.describe())
plt.plot(df["a"])
plt.show()
)");
    EXPECT_TRUE(result.valid) << result.error;
    EXPECT_EQ(result.kind, error_kind::NONE);
    EXPECT_FALSE(result.repaired_code);
}

TEST_F(CodeValidatorTest, ForbiddenImport) {
    auto result = validate("import numpy as np\nimport os\nos.system('ls')\n");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden import: os (line 2)");
}

TEST_F(CodeValidatorTest, ForbiddenSubmoduleImport) {
    auto result = validate("import os.path");
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden import: os.path (line 1)");

    result = validate("\nfrom subprocess import run\n");
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden import: subprocess (line 2)");
}

TEST_F(CodeValidatorTest, RelativeImport) {
    auto result = validate("from . import secrets\n");
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_NE(result.error.find("Forbidden import"), string::npos);
}

TEST_F(CodeValidatorTest, ForbiddenFunctionCall) {
    auto result = validate("x = 1\nprint(eval('x + 1'))\n");
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden function call: eval (line 2)");

    result = validate("with open('/etc/passwd') as f:\n    print(f.read())\n");
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden function call: open (line 1)");
}

TEST_F(CodeValidatorTest, DangerousPattern) {
    auto result = validate("name = '__subclasses__'\n");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error.rfind("Dangerous pattern detected: ", 0), 0u) << result.error;

    result = validate("b = __builtins__\n");
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
}

TEST_F(CodeValidatorTest, ForbiddenBuiltinReference) {
    auto result = validate("f = open\nprint(f('/etc/hostname').read())\n");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden function reference: open (line 1)");

    result = validate("handlers = [print, eval]\n");
    EXPECT_EQ(result.error, "Forbidden function reference: eval (line 1)");

    // 赋值不是引用
    result = validate("input = 3\nfile = 'a.csv'\n");
    EXPECT_TRUE(result.valid) << result.error;
}

TEST_F(CodeValidatorTest, PrivateAttribute) {
    auto result = validate("import random\nrandom._os.system('id')\n");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden private attribute: _os (line 2)");

    result = validate("print(().__class__.__bases__[0].__subclasses__())\n");
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error.rfind("Forbidden private attribute: ", 0), 0u) << result.error;

    result = validate("import numpy as np\nprint(np.linalg.norm([3, 4]))\n");
    EXPECT_TRUE(result.valid) << result.error;
}

TEST_F(CodeValidatorTest, AttributeCallsAreNotBuiltins) {
    auto result = validate("import re\nimport pandas as pd\nr = re.compile('a')\ndf = pd.DataFrame()\ndf.eval('a = 1')\n");
    EXPECT_TRUE(result.valid) << result.error;
}

TEST_F(CodeValidatorTest, SyntaxError) {
    auto result = validate("def f(:\n    pass\n");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.kind, error_kind::SYNTAX_ERROR);
    EXPECT_EQ(result.error.rfind("Invalid syntax: ", 0), 0u) << result.error;
    EXPECT_NE(result.error.find("(line 1)"), string::npos) << result.error;
}

TEST_F(CodeValidatorTest, RepairedCode) {
    auto result = validate("for i in range(3):\nprint(i)\n");
    EXPECT_TRUE(result.valid) << result.error;
    ASSERT_TRUE(result.repaired_code);
    EXPECT_EQ(*result.repaired_code, "for i in range(3):\n    print(i)\n");
}

TEST_F(CodeValidatorTest, RepairedCodeIsChecked) {
    auto result = validate("if True:\nimport os\n");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.kind, error_kind::SECURITY_VIOLATION);
    EXPECT_EQ(result.error, "Forbidden import: os (line 2)");
}

TEST_F(CodeValidatorTest, EmptyCode) {
    auto result = validate("  \n\t\n");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.kind, error_kind::INVALID_REQUEST);
    EXPECT_EQ(result.error, "No code provided");
}

TEST_F(CodeValidatorTest, OtherLanguagesNotChecked) {
    EXPECT_TRUE(validator.validate("SELECT * FROM users;", language::SQL).valid);
    EXPECT_TRUE(validator.validate("x <- c(1, 2, 3)", language::R).valid);
}

TEST_F(CodeValidatorTest, ValidationResultJson) {
    auto result = validate("import socket");
    json j = result;
    EXPECT_EQ(j["valid"], false);
    EXPECT_EQ(j["error_kind"], "security_violation");
    EXPECT_EQ(j["error"], "Forbidden import: socket (line 1)");
}

TEST(ValidatorConfigTest, PartialConfigKeepsDefaults) {
    validator_config config = json::parse(R"({"allowed_modules": ["math"], "forbidden_builtins": ["print"]})").get<validator_config>();
    EXPECT_EQ(config.allowed_modules, (set<string>{"math"}));
    EXPECT_EQ(config.dangerous_patterns, validator_config::defaults().dangerous_patterns);

    python_ast_parser parser;
    code_validator validator(parser, config);
    EXPECT_TRUE(validator.validate("import math\nx = math.sqrt(2)", language::PYTHON).valid);
    EXPECT_EQ(validator.validate("import numpy", language::PYTHON).error, "Forbidden import: numpy (line 1)");
    EXPECT_EQ(validator.validate("print(1)", language::PYTHON).error, "Forbidden function call: print (line 1)");
}

TEST(ValidatorConfigTest, InvalidPattern) {
    validator_config config = validator_config::defaults();
    config.dangerous_patterns.push_back("(unclosed");
    python_ast_parser parser;
    EXPECT_THROW(code_validator validator(parser, config), regex_error);
}
