#include "auction.hpp"

namespace auction
{

  RejectReason AuctionHouse::settle(AssetId asset, AccountId caller)
  {
    const auto lit = listings_.find(asset);
    if ( lit == listings_.end() || !lit->second.listed )
      return reject_(asset, caller, RejectReason::NotListed);

    if ( bids_.find(asset) == bids_.end() )
      return reject_(asset, caller, RejectReason::NoBid);

    const Listing& l = lit->second;
    if ( l.auction_end == Ns{0} || now_ < l.auction_end )
      return reject_(asset, caller, RejectReason::AuctionNotEnded);

    // Settled + seller Credited
    if ( !has_event_capacity_(2) )
      return reject_(asset, caller, RejectReason::InsufficientResources);

    const RejectReason sr = finalize_sale_(asset);
    if ( sr != RejectReason::None )
      return reject_(asset, caller, sr);
    return RejectReason::None;
  }

  RejectReason AuctionHouse::finalize_sale_(AssetId asset)
  {
    const auto lit = listings_.find(asset);
    const auto bit = bids_.find(asset);
    AUCTION_ASSERT(lit != listings_.end() && lit->second.listed);
    AUCTION_ASSERT(bit != bids_.end());

    Listing& l = lit->second;
    const Bid winner = bit->second;
    const AccountId seller = l.seller;

    bids_.erase(bit);
    ledger_.escrow_q -= winner.amount_q;
    l.listed = false;

    if ( !custody_.transfer_custody(params_.house, asset, params_.house, winner.bidder) ) {
      l.listed = true;
      ledger_.escrow_q += winner.amount_q;
      bids_[asset] = winner;
      return RejectReason::CustodyFailed;
    }

    (void)push_event_(EventType::Settled, asset, winner.bidder, winner.amount_q, RejectReason::None);

    // Seller proceeds follow the same push-then-credit path as outbid refunds.
    ledger_.paid_out_q += winner.amount_q;
    if ( payments_.send(seller, winner.amount_q) != TransferStatus::Ok ) {
      ledger_.paid_out_q -= winner.amount_q;
      credit_(seller, winner.amount_q);
      (void)push_event_(EventType::Credited, asset, seller, winner.amount_q, RejectReason::TransferFailed);
    }
    return RejectReason::None;
  }

} // namespace auction
