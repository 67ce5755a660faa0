#include <filesystem>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/capture.hpp"
#include "sandbox/context.hpp"
#include "sandbox/parser.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

class ContextBuilderTest : public ::testing::Test {
protected:
    mock::dataset_loader loader;
    context_builder builder{loader};
    python_ast_parser parser;
};

TEST_F(ContextBuilderTest, PreambleInstallsImageHooks) {
    string preamble = context_builder::preamble();
    EXPECT_NE(preamble.find(IMAGE_MARKER), string::npos);
    EXPECT_EQ(preamble.find("{marker}"), string::npos);
    EXPECT_NE(preamble.find("use(\"Agg\")"), string::npos);
    EXPECT_NE(preamble.find("_sandbox_plt.show = _sandbox_show"), string::npos);
    EXPECT_NE(preamble.find("except ImportError"), string::npos);
    EXPECT_TRUE(parser.parse(preamble).ok);
}

TEST_F(ContextBuilderTest, UserCodeAtTheEnd) {
    string code = "print(2 + 2)";
    string script = builder.build(code, nullopt);
    EXPECT_EQ(script.rfind(context_builder::preamble(), 0), 0u);
    EXPECT_EQ(script.substr(script.size() - code.size() - 1), code + "\n");
    EXPECT_EQ(script.find("Dataset loaded"), string::npos);
    EXPECT_TRUE(parser.parse(script).ok);
}

TEST_F(ContextBuilderTest, DatasetInjected) {
    loader.dataset = tabular_dataset{"/data/session's.parquet", "parquet"};
    string script = builder.build("print(df.head())\n", string("session"));
    EXPECT_NE(script.find("read_parquet('/data/session\\'s.parquet')"), string::npos) << script;
    EXPECT_NE(script.find("Dataset loaded: {df.shape[0]} rows, {df.shape[1]} columns"), string::npos) << script;
    EXPECT_LT(script.find("read_parquet"), script.find("print(df.head())"));
    EXPECT_TRUE(parser.parse(script).ok);
}

TEST_F(ContextBuilderTest, NoDatasetWithoutSession) {
    loader.dataset = tabular_dataset{"/data/a.csv", "csv"};
    EXPECT_EQ(builder.build("print(1)", nullopt).find("read_csv"), string::npos);
}

TEST_F(ContextBuilderTest, RewriteFileReads) {
    string code = "import pandas as pd\ndata = pd.read_csv('sales.csv')\nprint(data.shape)\n";

    string rewritten = context_builder::rewrite_file_reads(code, true);
    EXPECT_EQ(rewritten,
              "import pandas as pd\n"
              "# File access is disabled in the sandbox: data = pd.read_csv('sales.csv')\n"
              "data = df\n"
              "print(data.shape)\n");

    rewritten = context_builder::rewrite_file_reads(code, false);
    EXPECT_EQ(rewritten,
              "import pandas as pd\n"
              "# File access is disabled in the sandbox: data = pd.read_csv('sales.csv')\n"
              "data = None\n"
              "print(data.shape)\n");
}

TEST_F(ContextBuilderTest, RewriteKeepsBlockStructure) {
    string code =
        "import numpy as np\n"
        "for name in ['a', 'b']:\n"
        "    arr = np.loadtxt(name,\n"
        "                     delimiter=',')\n"
        "    print(name)\n";
    string rewritten = context_builder::rewrite_file_reads(code, false);
    EXPECT_EQ(rewritten,
              "import numpy as np\n"
              "for name in ['a', 'b']:\n"
              "    # File access is disabled in the sandbox: arr = np.loadtxt(name,\n"
              "    # delimiter=',')\n"
              "    arr = None\n"
              "    print(name)\n");
    EXPECT_TRUE(parser.parse(rewritten).ok);

    code = "import pandas as pd\nwith pd.read_csv('a.csv', chunksize=10) as reader:\n    print(reader)\n";
    rewritten = context_builder::rewrite_file_reads(code, true);
    EXPECT_NE(rewritten.find("if False:\n    print(reader)"), string::npos) << rewritten;
    EXPECT_TRUE(parser.parse(rewritten).ok);
}

TEST_F(ContextBuilderTest, RewriteIgnoresStringsAndOtherCalls) {
    string code = "import pandas as pd\ns = \"\"\"\npd.read_csv('x')\n\"\"\"\ndf2 = pd.DataFrame({'a': [1]})\n";
    EXPECT_EQ(context_builder::rewrite_file_reads(code, true), code);

    code = "print('Tip: call pd.read_csv(path) to load data')  # or np.load(path)\nobj.pd.read_csv('x')\n";
    EXPECT_EQ(context_builder::rewrite_file_reads(code, false), code);
}

TEST_F(ContextBuilderTest, RewriteOnlyTheCall) {
    string code =
        "import pandas as pd\n"
        "x = 1; y = pd.read_csv('a.csv')\n"
        "print(x)\n";
    string rewritten = context_builder::rewrite_file_reads(code, false);
    EXPECT_EQ(rewritten,
              "import pandas as pd\n"
              "# File access is disabled in the sandbox: x = 1; y = pd.read_csv('a.csv')\n"
              "x = 1; y = None\n"
              "print(x)\n");
    EXPECT_TRUE(parser.parse(rewritten).ok);

    code = "print(pd.read_csv('a.csv', sep=')').head(), pd.read_json(pd.read_csv('b')))\n";
    EXPECT_EQ(context_builder::rewrite_file_reads(code, true),
              "# File access is disabled in the sandbox: " + code + "print(df.head(), df)\n");
}

TEST_F(ContextBuilderTest, RewriteCallOnContinuationLine) {
    string code =
        "frames = [\n"
        "    pd.read_csv('a.csv'),\n"
        "    'pd.read_csv(b)',\n"
        "]\n";
    string rewritten = context_builder::rewrite_file_reads(code, true);
    EXPECT_EQ(rewritten,
              "# File access is disabled in the sandbox: frames = [\n"
              "# pd.read_csv('a.csv'),\n"
              "# 'pd.read_csv(b)',\n"
              "# ]\n"
              "frames = [\n"
              "    df,\n"
              "    'pd.read_csv(b)',\n"
              "]\n");
    EXPECT_TRUE(parser.parse(rewritten).ok);
}

TEST(DatasetLoaderTest, LookupByFormat) {
    fs::path dir = fs::temp_directory_path() / "sandbox-unit-test-datasets";
    fs::remove_all(dir);
    fs::create_directories(dir);
    write_file_content(dir / "abc.json", "[]");
    write_file_content(dir / "abc.xlsx", "");
    write_file_content(dir / "def.csv", "a,b\n1,2\n");

    directory_dataset_loader loader(dir);
    auto dataset = loader.load("abc");
    ASSERT_TRUE(dataset);
    EXPECT_EQ(dataset->format, "json");
    EXPECT_EQ(dataset->path, dir / "abc.json");

    dataset = loader.load("def");
    ASSERT_TRUE(dataset);
    EXPECT_EQ(dataset->format, "csv");

    EXPECT_FALSE(loader.load("missing"));
    EXPECT_FALSE(loader.load("../def"));
    fs::remove_all(dir);
}
