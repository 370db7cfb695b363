// diff-server benchmarks — measures throughput of checksumming, diffing,
// patch application and the full pull path.

#include <diff-server/diff_server.hpp>

#include <benchmark/benchmark.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

using namespace diff_server;

namespace {

auto make_map(std::size_t n, std::int64_t salt = 0) -> Snapshot::Map {
    auto entries = Snapshot::Map{};
    for (std::size_t i = 0; i < n; ++i) {
        entries.emplace("key" + std::to_string(i),
                        Value{{"n", static_cast<std::int64_t>(i) + salt}, {"tag", "item"}});
    }
    return entries;
}

// Every tenth key changed, a few dropped, a few added.
auto make_edited(const Snapshot& base, std::size_t n) -> Snapshot {
    auto entries = base.entries();
    for (std::size_t i = 0; i < n; i += 10) {
        entries["key" + std::to_string(i)] = Value{{"n", -1}, {"tag", "edited"}};
    }
    for (std::size_t i = 5; i < n; i += 97) {
        entries.erase("key" + std::to_string(i));
    }
    for (std::size_t i = 0; i < n / 50; ++i) {
        entries.emplace("new" + std::to_string(i), Value(static_cast<std::int64_t>(i)));
    }
    return Snapshot{std::move(entries)};
}

class StaticGetter final : public ClientViewGetter {
public:
    explicit StaticGetter(std::size_t n) : view_{make_map(n)} {}

    auto get(const Account&, const ClientViewRequest&, std::string_view)
        -> ClientViewResponse override {
        return ClientViewResponse{view_, ++mutation_};
    }

private:
    Snapshot view_;
    std::atomic<std::uint64_t> mutation_{0};
};

auto bench_accounts() -> AccountRegistry {
    auto account = Account{};
    account.id = "bench";
    account.name = "bench";
    return AccountRegistry{std::vector<Account>{account}};
}

}  // anonymous namespace

// =============================================================================
// Snapshot
// =============================================================================

// Sizes straddle Snapshot::parallel_threshold.
static void bm_checksum(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto entries = make_map(n);
    for (auto _ : state) {
        auto snapshot = Snapshot{entries};
        benchmark::DoNotOptimize(snapshot.checksum());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_checksum)->RangeMultiplier(4)->Range(64, 65536);

static void bm_with(benchmark::State& state) {
    const auto base = Snapshot{make_map(static_cast<std::size_t>(state.range(0)))};
    std::int64_t i = 0;
    for (auto _ : state) {
        auto next = base.with("key0", Value(i++));
        benchmark::DoNotOptimize(next.checksum());
    }
}
BENCHMARK(bm_with)->Range(64, 16384);

// =============================================================================
// Diff and apply
// =============================================================================

static void bm_diff(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto base = Snapshot{make_map(n)};
    const auto target = make_edited(base, n);
    for (auto _ : state) {
        auto patch = diff(base, target);
        benchmark::DoNotOptimize(patch.data());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff)->Range(64, 16384);

static void bm_diff_bootstrap(benchmark::State& state) {
    const auto target = Snapshot{make_map(static_cast<std::size_t>(state.range(0)))};
    for (auto _ : state) {
        auto patch = diff(nullptr, target);
        benchmark::DoNotOptimize(patch.data());
    }
}
BENCHMARK(bm_diff_bootstrap)->Range(64, 16384);

static void bm_apply(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto base = Snapshot{make_map(n)};
    const auto patch = diff(base, make_edited(base, n));
    for (auto _ : state) {
        auto result = apply(base, patch);
        benchmark::DoNotOptimize(result.checksum());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patch.size()));
}
BENCHMARK(bm_apply)->Range(64, 16384);

// =============================================================================
// Pull
// =============================================================================

// Every iteration fetches, commits to the in-memory store and diffs
// against the previous state.
static void bm_pull(benchmark::State& state) {
    set_log_level(spdlog::level::warn);
    auto service = Service{bench_accounts(), memory_store_factory(),
                           std::make_shared<StaticGetter>(static_cast<std::size_t>(state.range(0)))};
    auto request = PullRequest{};
    request.account_id = "bench";
    request.client_id = "client";
    for (auto _ : state) {
        auto response = service.pull(request);
        request.base_state_id = response.state_id;
        request.checksum = response.checksum.to_string();
        benchmark::DoNotOptimize(response.patch.data());
    }
}
BENCHMARK(bm_pull)->Range(16, 4096);

static void bm_handle_pull_json(benchmark::State& state) {
    set_log_level(spdlog::level::warn);
    auto service = Service{bench_accounts(), memory_store_factory(),
                           std::make_shared<StaticGetter>(256)};
    const auto body = std::string{R"({"accountID":"bench","clientID":"client"})"};
    for (auto _ : state) {
        auto response = service.handle(HttpRequest{"POST", "/pull", {}, body});
        benchmark::DoNotOptimize(response.body.data());
    }
}
BENCHMARK(bm_handle_pull_json);
