#include <benchmark/benchmark.h>

#include "auction.hpp"
#include "custody.hpp"
#include "replay.hpp"
#include "treasury.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr auction::AccountId kHouse  = 1'000;
constexpr auction::AccountId kSeller = 1;
constexpr auction::AssetId   kAsset  = 7;

// -------------------------
// Env helpers (MSVC-safe)
// -------------------------
std::string get_env_str(const char* key) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, key) != 0 || !buf) {
        return {};
    }
    std::string val(buf);
    free(buf);
    return val;
#else
    if (const char* v = std::getenv(key); v && *v) {
        return std::string(v);
    }
    return {};
#endif
}

// -------------------------
// Journal discovery
// -------------------------
std::vector<std::string> discover_journals() {
    const auto root = get_env_str("JOURNAL_ROOT");
    if (root.empty()) {
        throw std::runtime_error("JOURNAL_ROOT not set. Export it in the shell.");
    }

    fs::path dir(root);
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        throw std::runtime_error("JOURNAL_ROOT is not a directory: " + root);
    }

    std::vector<std::string> out;
    for (const auto& ent : fs::recursive_directory_iterator(dir)) {
        if (!ent.is_regular_file()) continue;
        if (ent.path().extension() == ".journal") {
            out.push_back(ent.path().string());
        }
    }

    if (out.empty()) {
        throw std::runtime_error("No .journal files found under JOURNAL_ROOT");
    }

    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> g_all_journals;

void ensure_journals_loaded_or_skip(benchmark::State& state) {
    if (!g_all_journals.empty()) return;
    try {
        g_all_journals = discover_journals();
    } catch (const std::exception& e) {
        state.SkipWithError(e.what());
    }
}

// -------------------------
// Fixture
// -------------------------
struct Market {
    auction::AssetRegistry registry;
    auction::Treasury      treasury;
    auction::AuctionHouse  house;

    Market() : house(make_params(), registry, treasury) {}

    static auction::AuctionParams make_params() {
        auction::AuctionParams p;
        p.house = kHouse;
        return p;
    }

    bool open_listing() {
        return registry.mint(kAsset, kSeller) &&
               registry.approve(kSeller, kAsset, kHouse) &&
               house.list(kAsset, kSeller, auction::kValueScale, 0) == auction::RejectReason::None;
    }
};

// Bidders alternate between two accounts; each accepted bid displaces the other.
template <bool Rejecting>
void RunOutbidChain(benchmark::State& state) {
    const auto n_bids = static_cast<std::size_t>(state.range(0));
    std::uint64_t bids = 0;

    for (auto _ : state) {
        state.PauseTiming();
        Market m;
        if (!m.open_listing()) {
            state.SkipWithError("Failed to open listing");
            break;
        }
        if (Rejecting) {
            m.treasury.set_rejecting(2, true);
            m.treasury.set_rejecting(3, true);
        }
        state.ResumeTiming();

        for (std::size_t i = 0; i < n_bids; ++i) {
            const auction::AccountId bidder = (i % 2 == 0) ? 2 : 3;
            const auto rr = m.house.place_bid(kAsset, bidder, m.house.next_min_bid(kAsset));
            benchmark::DoNotOptimize(rr);
        }
        bids += n_bids;
        benchmark::DoNotOptimize(m.house.ledger().credits_q);
    }

    state.SetItemsProcessed(static_cast<int64_t>(bids));
}

void BM_OutbidChain_Refund(benchmark::State& state) {
    RunOutbidChain<false>(state);
}

void BM_OutbidChain_Credit(benchmark::State& state) {
    RunOutbidChain<true>(state);
}

void BM_Replay_Journal(benchmark::State& state) {
    ensure_journals_loaded_or_skip(state);
    if (state.error_occurred()) return;

    const std::size_t n_files = std::min(static_cast<std::size_t>(state.range(0)), g_all_journals.size());
    std::uint64_t records = 0;
    std::uint64_t rejected = 0;

    for (auto _ : state) {
        for (std::size_t i = 0; i < n_files; ++i) {
            state.PauseTiming();
            auction::journal::ReplayKernel kernel(g_all_journals[i]);
            auction::AssetRegistry registry;
            auction::Treasury treasury;
            auction::AuctionHouse house(Market::make_params(), registry, treasury);
            state.ResumeTiming();

            const auto stats = auction::journal::replay(kernel, house, registry);
            records += stats.applied + stats.rejected;
            rejected += stats.rejected;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(records));
    state.counters["n_files"] = benchmark::Counter(static_cast<double>(n_files), benchmark::Counter::kAvgThreads);
    state.counters["rejected"] = benchmark::Counter(static_cast<double>(rejected), benchmark::Counter::kAvgIterations);
}

} // namespace

BENCHMARK(BM_OutbidChain_Refund)->Arg(16)->Arg(256)->Arg(4096);
BENCHMARK(BM_OutbidChain_Credit)->Arg(16)->Arg(256)->Arg(4096);
BENCHMARK(BM_Replay_Journal)->Arg(1)->Arg(4)->Arg(16);

BENCHMARK_MAIN();
