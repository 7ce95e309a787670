#include "auction.hpp"
#include "auction_math.hpp"

#include <limits>

namespace auction
{

  RejectReason AuctionHouse::place_bid(AssetId asset, AccountId caller, i64 value_q)
  {
    if ( caller == kNoAccount || caller == params_.house )
      return reject_(asset, caller, RejectReason::InvalidParams);

    const auto lit = listings_.find(asset);
    if ( lit == listings_.end() || !lit->second.listed )
      return reject_(asset, caller, RejectReason::NotListed);

    Listing& l = lit->second;
    if ( l.auction_end != Ns{0} && now_ >= l.auction_end )
      return reject_(asset, caller, RejectReason::AuctionEnded);

    const auto bit = bids_.find(asset);
    const bool has_prev = bit != bids_.end();
    const Bid displaced = has_prev ? bit->second : Bid{};

    const RejectReason vr = validate_bid_(l, has_prev ? &displaced : nullptr, value_q);
    if ( vr != RejectReason::None )
      return reject_(asset, caller, vr);

    i64 received = 0;
    if ( math::add_i64_overflow(ledger_.received_q, value_q, &received) )
      return reject_(asset, caller, RejectReason::InvalidParams);

    // A deadline past the end of the clock would wrap to the past.
    if ( params_.auction_extension.value > std::numeric_limits<u64>::max() - now_.value )
      return reject_(asset, caller, RejectReason::InvalidParams);

    // BidAccepted + Refunded/Credited + Settled + seller Credited
    if ( !has_event_capacity_(4) )
      return reject_(asset, caller, RejectReason::InsufficientResources);

    // Effects: the new leader, escrow and deadline are committed before any
    // value leaves the house.
    bids_[asset] = Bid{caller, value_q};
    ledger_.received_q = received;
    ledger_.escrow_q += value_q - displaced.amount_q;
    l.auction_end = now_ + params_.auction_extension;
    const bool buy_now = l.buy_now_price_q > 0 && value_q >= l.buy_now_price_q;

    (void)push_event_(EventType::BidAccepted, asset, caller, value_q, RejectReason::None);

    // Interactions. `l` may be stale past this point if a recipient re-enters.
    if ( has_prev )
      refund_or_credit_(asset, displaced);

    if ( buy_now ) {
      // A re-entrant higher bid during the refund may already have replaced us.
      const auto now_lit = listings_.find(asset);
      const auto now_bit = bids_.find(asset);
      const bool still_ours = now_lit != listings_.end() && now_lit->second.listed &&
                              now_bit != bids_.end() && now_bit->second.bidder == caller &&
                              now_bit->second.amount_q == value_q;
      if ( still_ours ) {
        const RejectReason sr = finalize_sale_(asset);
        if ( sr != RejectReason::None ) {
          // The bid stands; the sale can still close through settle().
          (void)push_event_(EventType::Reject, asset, caller, value_q, sr);
        }
      }
    }

    return RejectReason::None;
  }

  RejectReason AuctionHouse::validate_bid_(const Listing& l, const Bid* prev, i64 value_q) const
  {
    if ( value_q <= 0 )
      return RejectReason::BidTooLow;

    if ( prev == nullptr )
      return value_q >= l.min_price_q ? RejectReason::None : RejectReason::BidTooLow;

    if ( !math::meets_increment(value_q, prev->amount_q, params_.min_increment_pct) )
      return RejectReason::BidTooLow;
    return RejectReason::None;
  }

  void AuctionHouse::refund_or_credit_(AssetId asset, const Bid& displaced)
  {
    AUCTION_ASSERT(displaced.bidder != kNoAccount);
    AUCTION_ASSERT(displaced.amount_q > 0);

    // Counted as paid before the call so the ledger balances at the suspension point.
    ledger_.paid_out_q += displaced.amount_q;

    const TransferStatus ts = payments_.send(displaced.bidder, displaced.amount_q);
    if ( ts == TransferStatus::Ok ) {
      (void)push_event_(EventType::Refunded, asset, displaced.bidder, displaced.amount_q, RejectReason::None);
      return;
    }

    ledger_.paid_out_q -= displaced.amount_q;
    credit_(displaced.bidder, displaced.amount_q);
    (void)push_event_(
        EventType::Credited,
        asset,
        displaced.bidder,
        displaced.amount_q,
        RejectReason::TransferFailed);
  }

} // namespace auction
