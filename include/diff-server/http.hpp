/// @file http.hpp
/// @brief Transport-neutral HTTP request and response values.
///
/// The library neither listens on sockets nor opens connections. A front
/// end converts its own requests into HttpRequest and calls
/// Service::handle(); outgoing client view fetches go through a Transport
/// supplied by the embedding application.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace diff_server {

/// Orders header names case-insensitively.
struct HeaderNameLess {
    using is_transparent = void;
    auto operator()(std::string_view a, std::string_view b) const -> bool {
        auto n = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < n; ++i) {
            auto ca = std::tolower(static_cast<unsigned char>(a[i]));
            auto cb = std::tolower(static_cast<unsigned char>(b[i]));
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

/// Header map with case-insensitive names.
using Headers = std::map<std::string, std::string, HeaderNameLess>;

struct HttpRequest {
    std::string method{"POST"};
    std::string path;  ///< Request target: a path for incoming requests, a URL for outgoing ones.
    Headers headers;
    std::string body;

    /// Header value, or nullopt if absent.
    auto header(std::string_view name) const -> std::optional<std::string> {
        auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

struct HttpResponse {
    int status{200};
    std::string content_type{"text/plain; charset=utf-8"};
    std::string body;
};

/// Sends an outgoing request and waits at most `timeout` for the response.
/// Throws on network failure or timeout.
using Transport = std::function<HttpResponse(const HttpRequest& request,
                                             std::chrono::milliseconds timeout)>;

}  // namespace diff_server
