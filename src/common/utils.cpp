#include "common/utils.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <cstdlib>

namespace runbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_suffix(size_t length) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    // random_generator 不是线程安全的，每个线程持有自己的一份
    thread_local boost::uuids::random_generator generator;
    string result;
    while (result.size() < length) {
        boost::uuids::uuid uuid = generator();
        for (auto byte : uuid) {
            if (result.size() == length) break;
            result.push_back(alphabet[byte % (sizeof(alphabet) - 1)]);
        }
    }
    return result;
}

string shell_quote(const string &value) {
    string result = "'";
    for (char c : value) {
        if (c == '\'')
            result += "'\\''";
        else
            result.push_back(c);
    }
    result.push_back('\'');
    return result;
}

string base64_encode(const string &data) {
    using namespace boost::archive::iterators;
    using base64_iterator = base64_from_binary<transform_width<string::const_iterator, 6, 8>>;
    string result(base64_iterator(data.begin()), base64_iterator(data.end()));
    result.append((3 - data.size() % 3) % 3, '=');
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

long long elapsed_time::milliseconds() const {
    return duration<chrono::milliseconds>().count();
}

}  // namespace runbox
