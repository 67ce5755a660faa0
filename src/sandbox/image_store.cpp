#include "sandbox/image_store.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

image_store::~image_store() = default;

directory_image_store::directory_image_store(const fs::path &dir)
    : dir(dir) {}

string directory_image_store::store(const captured_image &image) {
    fs::create_directories(dir);
    fs::path file = dir / assert_safe_path(image.name);
    write_file_content(file, image.data);
    LOG(INFO) << "Saved image " << file << " (" << image.width << "x" << image.height << ", " << image.data.size() << " bytes)";
    return image.name;
}

}  // namespace sandbox
