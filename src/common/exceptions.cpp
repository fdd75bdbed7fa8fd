#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <sstream>

namespace grader {
using namespace std;

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

string describe_exception(const exception &ex) {
    stringstream ss;
    if (auto gex = dynamic_cast<const grader_exception *>(&ex))
        ss << *gex;
    else
        ss << boost::diagnostic_information(ex);
    return ss.str();
}

}  // namespace grader
