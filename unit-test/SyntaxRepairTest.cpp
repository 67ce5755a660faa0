#include "gtest/gtest.h"
#include "sandbox/parser.hpp"
#include "sandbox/repair.hpp"
#include "sandbox/source_lines.hpp"

using namespace std;
using namespace sandbox;

class SyntaxRepairTest : public ::testing::Test {
protected:
    python_ast_parser parser;
    syntax_repairer repairer{parser};

    bool parses(const string &code) {
        return parser.parse(code).ok;
    }
};

TEST_F(SyntaxRepairTest, ValidCodeUnchanged) {
    string code = "import numpy as np\n\ndef f(x):\n  return x * 2\n\nprint(f(np.pi))\n";
    EXPECT_EQ(repairer.repair(code), code);
    EXPECT_EQ(repairer.repair(""), "");
}

TEST_F(SyntaxRepairTest, MissingIndentation) {
    string code = "for i in range(3):\nprint(i)\n";
    ASSERT_FALSE(parses(code));
    string repaired = repairer.repair(code);
    EXPECT_EQ(repaired, "for i in range(3):\n    print(i)\n");
    EXPECT_TRUE(parses(repaired));
}

TEST_F(SyntaxRepairTest, InconsistentIndentation) {
    string code = "if True:\n  x = 1\n      y = 2\nprint(x + y)";
    ASSERT_FALSE(parses(code));
    EXPECT_EQ(repairer.repair(code), "if True:\n    x = 1\n    y = 2\nprint(x + y)");
}

TEST_F(SyntaxRepairTest, MisalignedElse) {
    string code = "x = 1\nif x:\n    print(\"a\")\n    else:\n    print(\"b\")\n";
    ASSERT_FALSE(parses(code));
    EXPECT_EQ(repairer.repair(code), "x = 1\nif x:\n    print(\"a\")\nelse:\n    print(\"b\")\n");
}

TEST_F(SyntaxRepairTest, UnclosedString) {
    string code = "greeting = \"hello\nprint(greeting)\n";
    ASSERT_FALSE(parses(code));
    EXPECT_EQ(repairer.repair(code), "greeting = \"hello\"\nprint(greeting)\n");
}

TEST_F(SyntaxRepairTest, UnclosedTripleQuotedString) {
    string code = "doc = \"\"\"first line\nsecond line\n";
    ASSERT_FALSE(parses(code));
    string repaired = repairer.repair(code);
    EXPECT_NE(repaired, code);
    EXPECT_TRUE(parses(repaired));
}

TEST_F(SyntaxRepairTest, TripleQuotedStringKeepsIndentation) {
    string code = "text = \"\"\"\n   keep\n      these\n\"\"\"\nif text:\nprint(text)\n";
    string repaired = repairer.repair(code);
    EXPECT_EQ(repaired, "text = \"\"\"\n   keep\n      these\n\"\"\"\nif text:\n    print(text)\n");
}

TEST_F(SyntaxRepairTest, UnrepairableReturnedUnchanged) {
    string code = "print(\"hello)";
    EXPECT_EQ(repairer.repair(code), code);

    code = "def f(:\n    pass\n";
    EXPECT_EQ(repairer.repair(code), code);
}

TEST_F(SyntaxRepairTest, Idempotent) {
    for (string code : {"for i in range(3):\nprint(i)\n",
                        "greeting = \"hello\nprint(greeting)\n",
                        "print(\"hello)",
                        "x = [1,\n     2]\n"}) {
        string once = repairer.repair(code);
        EXPECT_EQ(repairer.repair(once), once) << code;
    }
}

TEST(SyntaxRepairPassTest, IndentBlockBodies) {
    EXPECT_EQ(syntax_repairer::indent_block_bodies("while True:\nbreak\n"), "while True:\n    break\n");
    EXPECT_EQ(syntax_repairer::indent_block_bodies("if x:\n\n  y()\n"), "if x:\n\n  y()\n");
    // 括号内的冒号不会开始代码块
    EXPECT_EQ(syntax_repairer::indent_block_bodies("d = {\n'a':\n1}\n"), "d = {\n'a':\n1}\n");
}

TEST(SyntaxRepairPassTest, CloseStringLiterals) {
    EXPECT_EQ(syntax_repairer::close_string_literals("a = 'x\nb = \"y\""), "a = 'x'\nb = \"y\"");
    // 注释中的引号不影响
    EXPECT_EQ(syntax_repairer::close_string_literals("a = 1  # it's\n"), "a = 1  # it's\n");
}

TEST(SourceLinesTest, ScanLines) {
    scan_result scan = scan_lines(split_lines("x = (1,\n  2)\nif x:\n\ty = '''\n  z\n'''\n"));
    ASSERT_EQ(scan.lines.size(), 6u);
    EXPECT_FALSE(scan.lines[0].continuation);
    EXPECT_TRUE(scan.lines[1].continuation);
    EXPECT_TRUE(scan.lines[2].opens_block);
    EXPECT_EQ(scan.lines[2].first_word, "if");
    EXPECT_EQ(scan.lines[3].indent_width, 8);
    EXPECT_TRUE(scan.lines[4].in_string);
    EXPECT_TRUE(scan.lines[5].in_string);
    EXPECT_TRUE(scan.open_triple_quote.empty());
}

TEST(SourceLinesTest, MaskLiterals) {
    EXPECT_EQ(mask_literals("f('a(b', x)  # c)"), "f(     , x)      ");
    EXPECT_EQ(mask_literals("s = '''x\n'y'\n''' + \"\\\"\""), "s =     \n   \n    +     ");
    // 未闭合的单引号字符串在行尾结束
    EXPECT_EQ(mask_literals("a = 'b\nc()"), "a =   \nc()");
}

TEST(SourceLinesTest, SplitAndJoin) {
    EXPECT_EQ(split_lines("a\r\nb\n"), (vector<string>{"a", "b"}));
    EXPECT_EQ(join_lines({"a", "b"}, true), "a\nb\n");
    EXPECT_EQ(python_string_literal("it's\n"), "'it\\'s\\n'");
}
