/**
 * @file response_expression.h
 * @brief Internal: avatar expression tag for a reply
 */

#ifndef REY_RESPONSE_EXPRESSION_INTERNAL_H
#define REY_RESPONSE_EXPRESSION_INTERNAL_H

#include <string>

namespace rey {
namespace session {

/**
 * Pick an expression tag ("sad", "love", "laughing", "surprised", "confused",
 * "excited", "happy", "wink") by case-insensitive keyword match on the reply.
 * Categories are checked in that order; the default is "happy".
 */
const char* detect_expression(const std::string& reply);

}  // namespace session
}  // namespace rey

#endif  // REY_RESPONSE_EXPRESSION_INTERNAL_H
