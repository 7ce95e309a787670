#include "auction.hpp"

namespace auction
{

  RejectReason AuctionHouse::list(AssetId asset, AccountId caller, i64 min_price_q, i64 buy_now_price_q)
  {
    // The house never lists on its own behalf; whatever it holds is already in custody.
    if ( caller == kNoAccount || caller == params_.house )
      return reject_(asset, caller, RejectReason::NotOwner);

    const AccountId owner = custody_.owner_of(asset);
    if ( owner == kNoAccount || owner != caller )
      return reject_(asset, caller, RejectReason::NotOwner);

    if ( min_price_q < 0 || buy_now_price_q < 0 )
      return reject_(asset, caller, RejectReason::InvalidParams);
    if ( buy_now_price_q > 0 && buy_now_price_q < min_price_q )
      return reject_(asset, caller, RejectReason::InvalidParams);

    if ( !has_event_capacity_(1) )
      return reject_(asset, caller, RejectReason::InsufficientResources);

    const bool known = listings_.find(asset) != listings_.end();
    if ( !known && params_.max_listings > 0 && listings_.size() >= params_.max_listings )
      return reject_(asset, caller, RejectReason::InsufficientResources);

    // A listed asset is owned by the house, so caller ownership implies no live listing or bid.
    AUCTION_ASSERT(bids_.find(asset) == bids_.end());

    if ( !custody_.transfer_custody(params_.house, asset, caller, params_.house) )
      return reject_(asset, caller, RejectReason::CustodyFailed);

    Listing l{};
    l.seller = caller;
    l.min_price_q = min_price_q;
    l.buy_now_price_q = buy_now_price_q;
    l.listed = true;
    l.auction_end = Ns{0};
    listings_[asset] = l;

    (void)push_event_(EventType::Listed, asset, caller, min_price_q, RejectReason::None);
    return RejectReason::None;
  }

  RejectReason AuctionHouse::unlist(AssetId asset, AccountId caller)
  {
    const auto it = listings_.find(asset);
    if ( it == listings_.end() )
      return reject_(asset, caller, RejectReason::NotListed);

    Listing& l = it->second;
    if ( caller != l.seller )
      return reject_(asset, caller, RejectReason::NotSeller);
    if ( !l.listed )
      return reject_(asset, caller, RejectReason::NotListed);

    // Escrow of an outstanding bid has no owner-side exit; settle instead.
    if ( bids_.find(asset) != bids_.end() )
      return reject_(asset, caller, RejectReason::HasActiveBid);

    if ( !has_event_capacity_(1) )
      return reject_(asset, caller, RejectReason::InsufficientResources);

    l.listed = false;
    if ( !custody_.transfer_custody(params_.house, asset, params_.house, l.seller) ) {
      l.listed = true;
      return reject_(asset, caller, RejectReason::CustodyFailed);
    }

    (void)push_event_(EventType::Unlisted, asset, caller, 0, RejectReason::None);
    return RejectReason::None;
  }

} // namespace auction
