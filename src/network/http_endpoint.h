/**
 * @file http_endpoint.h
 * @brief Internal: split a base URL into what httplib::Client needs
 */

#ifndef REY_NETWORK_HTTP_ENDPOINT_INTERNAL_H
#define REY_NETWORK_HTTP_ENDPOINT_INTERNAL_H

#include <string>

namespace rey {
namespace net {

struct HttpEndpoint {
    std::string scheme_host_port;  // "https://api.example.com:443"
    std::string path_prefix;       // "" or "/proxy" (no trailing slash)
};

/// Accepts http:// and https:// URLs with optional port and path.
bool parse_http_endpoint(const std::string& url, HttpEndpoint& out);

}  // namespace net
}  // namespace rey

#endif  // REY_NETWORK_HTTP_ENDPOINT_INTERNAL_H
