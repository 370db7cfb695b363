// Fuzz target for backend response decoding — any body must either yield a
// client view or fail as upstream_fetch_failure.

#include <diff-server/client_view.hpp>
#include <diff-server/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto body = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto response = diff_server::parse_client_view_response(body);
        // The checksum is kept eagerly; recomputing from the entries must agree.
        auto again = diff_server::Snapshot(response.client_view.entries());
        if (again.checksum() != response.client_view.checksum()) std::abort();
    } catch (const diff_server::Exception& e) {
        if (e.kind() != diff_server::ErrorKind::upstream_fetch_failure) std::abort();
    }
    return 0;
}
