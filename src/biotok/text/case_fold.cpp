#include <biotok/text/case_fold.hpp>

namespace biotok::text {

std::string to_lower_ascii(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return s;
}

void fold_case(SubTokens& sub_tokens) {
    for (auto& sub : sub_tokens) {
        sub = to_lower_ascii(std::move(sub));
    }
}

}  // namespace biotok::text
