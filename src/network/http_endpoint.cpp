/**
 * @file http_endpoint.cpp
 * @brief Split a base URL into what httplib::Client needs
 */

#include "http_endpoint.h"

#include <regex>

namespace rey {
namespace net {

bool parse_http_endpoint(const std::string& url, HttpEndpoint& out) {
    std::regex url_regex(R"((http|https)://([^:/?#]+)(?::(\d+))?(/[^?#]*)?)");
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return false;
    }

    const std::string scheme = match[1].str();
    const std::string host = match[2].str();
    const std::string port = match[3].matched ? match[3].str()
                                              : (scheme == "https" ? "443" : "80");

    out.scheme_host_port = scheme + "://" + host + ":" + port;

    std::string path = match[4].matched ? match[4].str() : "";
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    out.path_prefix = path;
    return true;
}

}  // namespace net
}  // namespace rey
