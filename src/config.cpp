#include "config.hpp"

namespace sandbox {
using namespace std;

filesystem::path PYTHON_EXECUTABLE = "python3";
filesystem::path TEMP_DIR = "/tmp/sandbox";
filesystem::path DATASET_DIR = "datasets";
filesystem::path IMAGE_DIR = "images";
filesystem::path HISTORY_FILE = "history.jsonl";
int MAX_TIMEOUT = 300;        // 5min
int MAX_MEMORY_LIMIT = 2048;  // 2G
size_t MAX_OUTPUT_SIZE = 16 << 20;  // 16M
bool INLINE_IMAGES = false;
bool DEBUG = false;

}  // namespace sandbox
