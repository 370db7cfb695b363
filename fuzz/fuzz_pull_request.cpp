// Fuzz target for pull request decoding and field validation — any input
// must either parse or fail with bad_request, never crash or throw
// anything else.

#include <diff-server/error.hpp>
#include <diff-server/pull.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto body = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto request = diff_server::parse_pull_request(body);
        auto base = diff_server::validate_base_state_id(request.base_state_id);
        auto checksum = diff_server::validate_checksum(request.checksum);

        // Accepted ids must render back to their input (modulo hex case).
        if (base && base->to_string() != *request.base_state_id) std::abort();
        if (checksum && checksum->to_string().size() != request.checksum->size()) std::abort();
    } catch (const diff_server::Exception& e) {
        if (e.kind() != diff_server::ErrorKind::bad_request) std::abort();
    }
    return 0;
}
