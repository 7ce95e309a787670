#include "auction.hpp"

#include <stdexcept>

#include "auction_math.hpp"

namespace auction
{

  const char* to_string(RejectReason r) noexcept
  {
    switch ( r ) {
      case RejectReason::None:
        return "none";
      case RejectReason::NotOwner:
        return "caller does not own the asset";
      case RejectReason::NotSeller:
        return "caller is not the seller";
      case RejectReason::NotListed:
        return "asset is not listed";
      case RejectReason::BidTooLow:
        return "bid below the minimum or the required increment";
      case RejectReason::NotReceiver:
        return "caller is not the credit receiver";
      case RejectReason::NoCredits:
        return "no credits to withdraw";
      case RejectReason::WithdrawFailed:
        return "credit withdrawal transfer failed";
      case RejectReason::TransferFailed:
        return "value transfer failed";
      case RejectReason::CustodyFailed:
        return "custody transfer failed";
      case RejectReason::HasActiveBid:
        return "listing has an active bid";
      case RejectReason::NoBid:
        return "listing has no bid";
      case RejectReason::AuctionEnded:
        return "auction has ended";
      case RejectReason::AuctionNotEnded:
        return "auction has not ended";
      case RejectReason::InvalidParams:
        return "invalid parameters";
      case RejectReason::InsufficientResources:
        return "insufficient resources";
    }
    return "unknown";
  }

  AuctionHouse::AuctionHouse(const AuctionParams& params, AssetCustody& custody, ValueTransfer& payments)
      : params_(params), custody_(custody), payments_(payments)
  {
    if ( params_.house == kNoAccount )
      throw std::invalid_argument("AuctionParams.house must be a real account");
    if ( params_.min_increment_pct == 0 || params_.min_increment_pct > 1000 )
      throw std::invalid_argument("AuctionParams.min_increment_pct must be in [1, 1000]");
    if ( params_.auction_extension == Ns{0} )
      throw std::invalid_argument("AuctionParams.auction_extension must be positive");

    if ( params_.max_events > 0 )
      events_.reserve(params_.max_events);
  }

  void AuctionHouse::advance(Ns now)
  {
    if ( now > now_ )
      now_ = now;
  }

  Listing AuctionHouse::listing(AssetId asset) const
  {
    const auto it = listings_.find(asset);
    return it == listings_.end() ? Listing{} : it->second;
  }

  Bid AuctionHouse::highest_bid(AssetId asset) const
  {
    const auto it = bids_.find(asset);
    return it == bids_.end() ? Bid{} : it->second;
  }

  i64 AuctionHouse::credited_balance(AccountId account) const
  {
    const auto it = credits_.find(account);
    return it == credits_.end() ? 0 : it->second;
  }

  i64 AuctionHouse::next_min_bid(AssetId asset) const
  {
    const auto bit = bids_.find(asset);
    if ( bit != bids_.end() )
      return math::min_next_bid(bit->second.amount_q, params_.min_increment_pct);

    const auto lit = listings_.find(asset);
    if ( lit == listings_.end() )
      return 0;
    return lit->second.min_price_q > 0 ? lit->second.min_price_q : 1;
  }

  bool AuctionHouse::has_event_capacity_(std::size_t n) const
  {
    return params_.max_events == 0 || events_.size() + n <= params_.max_events;
  }

  bool AuctionHouse::push_event_(EventType et, AssetId asset, AccountId account, i64 amount_q, RejectReason rr)
  {
    if ( !has_event_capacity_(1) )
      return false;
    events_.push_back(Event{now_, et, asset, account, amount_q, rr});
    return true;
  }

  RejectReason AuctionHouse::reject_(AssetId asset, AccountId account, RejectReason rr)
  {
    AUCTION_ASSERT(rr != RejectReason::None);
    (void)push_event_(EventType::Reject, asset, account, 0, rr);
    return rr;
  }

} // namespace auction
