#include "common/io_utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>
#include <vector>
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, size_t limit) {
    ifstream fin(path, ios::binary);
    if (!fin) return "";
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    if (fin.peek() != char_traits<char>::eof())
        str += "\n... (truncated)";
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout << content;
    fout.close();
    if (!fout) throw system_error(errno, system_category(), "unable to write file " + path.string());
}

optional<fs::path> find_executable(const string &name) {
    if (name.empty()) return nullopt;
    if (name.find('/') != string::npos) {
        if (access(name.c_str(), X_OK) == 0) return fs::path(name);
        return nullopt;
    }

    const char *env_path = getenv("PATH");
    string search_path = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return nullopt;
}

string random_uuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

fs::path create_unique_directory(const fs::path &root) {
    fs::create_directories(root);
    fs::path dir = root / random_uuid();
    if (!fs::create_directory(dir))
        throw system_error(make_error_code(errc::file_exists), "scratch directory already exists " + dir.string());
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
    // 编译器和选手程序以 RUN_USER_ID 运行，需要在该文件夹中写入编译产物和临时文件
    if (RUN_USER_ID >= 0 && chown(dir.c_str(), RUN_USER_ID, RUN_GROUP_ID) != 0)
        throw system_error(errno, system_category(), "unable to chown scratch directory " + dir.string());
    return dir;
}

}  // namespace grader
