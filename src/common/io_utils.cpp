#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

namespace coderun {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content, fs::perms perms) {
    {
        ofstream fout(path.string(), ios::binary | ios::trunc);
        if (!fout)
            throw system_error(errno, system_category(), "unable to create " + path.string());
        fout << content;
        if (!fout)
            throw system_error(errno, system_category(), "unable to write " + path.string());
    }
    fs::permissions(path, perms, fs::perm_options::replace);
}

string read_input(const string &path) {
    if (path == "-") {
        return string((istreambuf_iterator<char>(cin)),
                      (istreambuf_iterator<char>()));
    }
    return read_file_content(path);
}

fs::path make_unique_directory(const fs::path &parent, const string &prefix) {
    fs::create_directories(parent);
    // boost::uuids::random_generator 不是线程安全的，每次调用都构造新的生成器
    fs::path dir = parent / (prefix + boost::lexical_cast<string>(boost::uuids::random_generator()()));
    if (!fs::create_directory(dir))
        throw runtime_error("directory " + dir.string() + " already exists");
    fs::permissions(dir,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
    return dir;
}

scoped_directory::scoped_directory() {}

scoped_directory::scoped_directory(const fs::path &path) : dir(path) {}

scoped_directory::scoped_directory(scoped_directory &&other) noexcept : dir(move(other.dir)) {
    other.dir.clear();
}

scoped_directory::~scoped_directory() {
    release();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) noexcept {
    swap(dir, other.dir);
    return *this;
}

const fs::path &scoped_directory::path() const {
    return dir;
}

void scoped_directory::release() {
    if (dir.empty()) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove directory " << dir << ": " << ec.message();
    dir.clear();
}

}  // namespace coderun
