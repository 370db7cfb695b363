// Fuzz target for patch application — input is {"base": {...}, "patch": [...]}.
// Whenever apply() succeeds, diffing base against the result and applying
// that diff must reproduce the result exactly.

#include <diff-server/error.hpp>
#include <diff-server/patch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ds = diff_server;
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto input = nlohmann::json::parse(text, nullptr, false);
    if (input.is_discarded() || !input.is_object()) return 0;
    auto base_it = input.find("base");
    auto patch_it = input.find("patch");
    if (base_it == input.end() || patch_it == input.end() || !patch_it->is_array()) return 0;

    try {
        auto base = ds::Snapshot::from_json(*base_it);
        auto patch = patch_it->get<ds::Patch>();
        auto result = ds::apply(base, patch);

        auto replay = ds::apply(base, ds::diff(base, result));
        if (replay.checksum() != result.checksum()) std::abort();
        if (!ds::diff(replay, result).empty()) std::abort();
    } catch (const ds::Exception& e) {
        if (e.kind() != ds::ErrorKind::invalid_patch &&
            e.kind() != ds::ErrorKind::bad_request) {
            std::abort();
        }
    }
    return 0;
}
