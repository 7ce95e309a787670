#include "journal.hpp"

#include "custody.hpp"
#include "replay.hpp"

namespace auction::journal {

const char* op_name(Op op) noexcept {
    switch (op) {
        case Op::Mint:     return "mint";
        case Op::Approve:  return "approve";
        case Op::List:     return "list";
        case Op::Unlist:   return "unlist";
        case Op::Bid:      return "bid";
        case Op::Settle:   return "settle";
        case Op::Withdraw: return "withdraw";
    }
    return "unknown";
}

bool parse_op(const std::string& name, Op& out) noexcept {
    for (std::uint8_t v = static_cast<std::uint8_t>(Op::Mint);
         v <= static_cast<std::uint8_t>(Op::Withdraw); ++v) {
        const Op op = static_cast<Op>(v);
        if (name == op_name(op)) {
            out = op;
            return true;
        }
    }
    return false;
}

RejectReason apply(const OpRecord& rec, AuctionHouse& house, AssetRegistry& registry) {
    if (rec.ts_ns < 0 || !is_known_op(rec.op)) return RejectReason::InvalidParams;

    house.advance(Ns{static_cast<u64>(rec.ts_ns)});

    switch (static_cast<Op>(rec.op)) {
        case Op::Mint:
            return registry.mint(rec.asset, rec.caller) ? RejectReason::None : RejectReason::InvalidParams;
        case Op::Approve:
            return registry.approve(rec.caller, rec.asset, rec.account) ? RejectReason::None
                                                                        : RejectReason::NotOwner;
        case Op::List:
            return house.list(rec.asset, rec.caller, rec.amount_q, rec.aux_q);
        case Op::Unlist:
            return house.unlist(rec.asset, rec.caller);
        case Op::Bid:
            return house.place_bid(rec.asset, rec.caller, rec.amount_q);
        case Op::Settle:
            return house.settle(rec.asset, rec.caller);
        case Op::Withdraw:
            return house.withdraw_all_failed_credits(rec.caller, rec.account);
    }
    return RejectReason::InvalidParams;
}

ReplayStats replay(ReplayKernel& kernel, AuctionHouse& house, AssetRegistry& registry) {
    ReplayStats stats{};
    while (const OpRecord* rec = kernel.next()) {
        if (apply(*rec, house, registry) == RejectReason::None)
            ++stats.applied;
        else
            ++stats.rejected;
    }
    return stats;
}

} // namespace auction::journal
