#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runbox {
using namespace std;

runbox_exception::runbox_exception()
    : runbox_exception("") {}

runbox_exception::runbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

validation_error::validation_error(const string &message)
    : runbox_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : runbox_exception("Unsupported language: " + language), language(language) {}

container_missing::container_missing(const string &container, const string &message)
    : runbox_exception(message), container(container) {}

execution_timeout::execution_timeout(const string &message)
    : runbox_exception(message) {}

engine_error::engine_error(long status_code, const string &message)
    : runbox_exception(message), status_code(status_code) {}

bool engine_error::is_not_found() const {
    return status_code == 404;
}

network_error::network_error(const string &message)
    : runbox_exception(message) {}

internal_error::internal_error(const string &message)
    : runbox_exception(message) {}

}  // namespace runbox
