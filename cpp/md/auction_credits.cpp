#include "auction.hpp"

namespace auction
{

  void AuctionHouse::credit_(AccountId account, i64 amount_q)
  {
    AUCTION_ASSERT(amount_q > 0);
    credits_[account] += amount_q;
    ledger_.credits_q += amount_q;
  }

  RejectReason AuctionHouse::withdraw_all_failed_credits(AccountId caller, AccountId receiver)
  {
    // Only the owner of a balance may pull it, and only to itself.
    if ( caller != receiver )
      return reject_(0, caller, RejectReason::NotReceiver);

    const auto it = credits_.find(receiver);
    if ( it == credits_.end() || it->second <= 0 )
      return reject_(0, caller, RejectReason::NoCredits);

    if ( !has_event_capacity_(1) )
      return reject_(0, caller, RejectReason::InsufficientResources);

    // Zero before the payout: a re-entrant withdrawal sees NoCredits.
    const i64 amount_q = it->second;
    credits_.erase(it);
    ledger_.credits_q -= amount_q;
    ledger_.paid_out_q += amount_q;

    const TransferStatus ts = payments_.send(receiver, amount_q);
    if ( ts != TransferStatus::Ok ) {
      // Added back rather than overwritten: credits that arrived during the
      // call (a re-entrant outbid refund, for instance) must survive.
      ledger_.paid_out_q -= amount_q;
      credit_(receiver, amount_q);
      return reject_(0, caller, RejectReason::WithdrawFailed);
    }

    (void)push_event_(EventType::Withdrawn, 0, receiver, amount_q, RejectReason::None);
    return RejectReason::None;
  }

} // namespace auction
