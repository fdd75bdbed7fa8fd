#include "compare/comparator.hpp"

namespace grader {
using namespace std;

string to_string(comparison_verdict verdict) {
    switch (verdict) {
        case comparison_verdict::MATCH: return "MATCH";
        case comparison_verdict::MISMATCH: return "MISMATCH";
        default: return "ERROR";
    }
}

}  // namespace grader
