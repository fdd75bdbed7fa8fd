#include "common/utils.hpp"
#include <fmt/core.h>

namespace grader {
using namespace std;

string format_percent(double ratio) {
    return fmt::format("{:.1f}%", ratio * 100);
}

string quote(const string &str) {
    string result = "'";
    for (unsigned char c : str) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '\'': result += "\\'"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (c < 0x20 || c == 0x7f)
                    result += fmt::format("\\x{:02x}", c);
                else
                    result += (char)c;
        }
    }
    result += "'";
    return result;
}

}  // namespace grader
