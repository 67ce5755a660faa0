#include "sandbox/history.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <fstream>
#include <map>
#include <system_error>
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

history_sink::~history_sink() = default;

jsonl_history_sink::jsonl_history_sink(const fs::path &path)
    : path(path), lock_path(path.string() + ".lock") {}

void jsonl_history_sink::record(const execution_record &record) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    scoped_file_lock lock(lock_path, false);

    ofstream fout(path, ios::app);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open history file " + path.string());
    fout << json(record).dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    if (!fout)
        throw system_error(errno, system_category(), "unable to write history file " + path.string());
}

vector<execution_record> jsonl_history_sink::recent(const string &caller_id, size_t limit) const {
    if (!fs::exists(path)) return {};
    scoped_file_lock lock(lock_path, true);

    ifstream fin(path);
    map<string, execution_record> records;
    string line;
    size_t line_number = 0;
    while (getline(fin, line)) {
        ++line_number;
        if (line.empty()) continue;
        try {
            execution_record record = json::parse(line).get<execution_record>();
            if (!caller_id.empty() && record.caller_id != caller_id) continue;
            records[record.id] = move(record);
        } catch (exception &ex) {
            LOG(WARNING) << "Skipping malformed history entry " << path << ":" << line_number << ": " << ex.what();
        }
    }

    vector<execution_record> result;
    for (auto &[id, record] : records)
        result.push_back(move(record));
    sort(result.begin(), result.end(), [](const execution_record &a, const execution_record &b) {
        return a.created_at > b.created_at;
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

}  // namespace sandbox
