#include "language/java.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

java_adapter::java_adapter()
    : language_adapter(resource_limits(15000, 15000, 512,
                                       resource_limits::DEFAULT_STACK_MB,
                                       resource_limits::DEFAULT_FILE_SIZE_MB,
                                       resource_limits::DEFAULT_OPEN_FILES,
                                       64),
                       "java", "javac") {}

string java_adapter::name() const {
    return "java";
}

string java_adapter::entry_file() const {
    return "Main.java";
}

string java_adapter::template_content() const {
    return R"(import java.io.*;
import java.util.*;

public class Main {
    public static void main(String[] args) throws IOException {
        BufferedReader reader = new BufferedReader(new InputStreamReader(System.in));
        // Write your solution here
    }
}
)";
}

bool java_adapter::validate_solution(const filesystem::path &workdir) const {
    string content = read_entry(workdir);
    return boost::algorithm::contains(content, "class Main") && boost::algorithm::contains(content, "main(");
}

vector<string> java_adapter::compile_command() const {
    return make_command(compiler, "-encoding", "UTF-8", entry_file());
}

vector<string> java_adapter::run_command(const resource_limits &limits) const {
    return make_command(executable,
                        "-Xmx" + to_string(limits.memory_mb()) + "m",
                        "-Xss" + to_string(limits.stack_mb()) + "m",
                        "-cp", ".", "Main");
}

int64_t java_adapter::address_space_reserve_mb() const {
    return RUNTIME_RESERVE_MB;
}

}  // namespace grader
