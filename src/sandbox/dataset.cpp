#include "sandbox/dataset.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

dataset_loader::~dataset_loader() = default;

directory_dataset_loader::directory_dataset_loader(const fs::path &dir)
    : dir(fs::absolute(dir)) {}

optional<tabular_dataset> directory_dataset_loader::load(const string &session_id) const {
    static const char *formats[] = {"csv", "parquet", "json", "xlsx"};

    string name;
    try {
        name = assert_safe_path(session_id);
    } catch (runtime_error &ex) {
        LOG(WARNING) << "Refusing to look up dataset: " << ex.what();
        return nullopt;
    }

    for (const char *format : formats) {
        fs::path path = dir / (name + "." + format);
        error_code ec;
        if (fs::is_regular_file(path, ec))
            return tabular_dataset{path, format};
    }
    return nullopt;
}

}  // namespace sandbox
