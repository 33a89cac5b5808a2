/**
 * @file response_expression.cpp
 * @brief Avatar expression tag for a reply
 */

#include "response_expression.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace rey {
namespace session {

namespace {

struct ExpressionRule {
    const char* expression;
    std::vector<const char*> keywords;
};

// Order matters: the first matching rule wins.
const ExpressionRule EXPRESSION_RULES[] = {
    {"sad", {"sorry", "unfortunately", "sad", "bad news", "can't", "unable"}},
    {"love", {"love", "heart", "\xE2\x9D\xA4", "\xF0\x9F\x92\x95", "amazing", "wonderful"}},
    {"laughing",
     {"haha", "lol", "funny", "\xF0\x9F\x98\x82", "\xF0\x9F\xA4\xA3", "hilarious", "joke"}},
    {"surprised", {"wow", "whoa", "amazing", "incredible", "!!"}},
    {"confused", {"hmm", "interesting", "let me think", "not sure", "maybe"}},
    {"excited", {"great", "awesome", "perfect", "excellent", "yay", "\xF0\x9F\x8E\x89"}},
    {"happy", {"good", "nice", "sure", "okay", "happy", "\xF0\x9F\x98\x8A", "\xF0\x9F\x99\x82"}},
    {"wink", {";)", "wink", "heh", "between us"}},
    {"excited", {"\xF0\x9F\xA6\x9E", "lobster"}},
};

}  // namespace

const char* detect_expression(const std::string& reply) {
    std::string lower(reply);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& rule : EXPRESSION_RULES) {
        for (const char* keyword : rule.keywords) {
            if (lower.find(keyword) != std::string::npos) {
                return rule.expression;
            }
        }
    }
    return "happy";
}

}  // namespace session
}  // namespace rey
