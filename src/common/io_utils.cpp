#include "common/io_utils.hpp"
#include <fstream>
#include <regex>
#include "common/exceptions.hpp"

namespace runbox {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin)
        throw internal_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string assert_safe_path(const string &subpath) {
    static const regex allowed("^[A-Za-z0-9._/-]+$");
    if (subpath.empty() || subpath.front() == '/' || !regex_match(subpath, allowed))
        throw validation_error("file name is not safe " + subpath);
    if (subpath == ".." || subpath.find("../") != string::npos ||
        (subpath.size() >= 3 && subpath.compare(subpath.size() - 3, 3, "/..") == 0))
        throw validation_error("file name is not safe " + subpath);
    return subpath;
}

}  // namespace runbox
