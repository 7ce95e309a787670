#include "treasury.hpp"

#include <utility>

namespace auction
{

  TransferStatus Treasury::send(AccountId to, i64 amount_q)
  {
    if ( to == kNoAccount || amount_q <= 0 ) {
      ++failed_sends_;
      return TransferStatus::Rejected;
    }

    const auto rit = rejecting_.find(to);
    if ( rit != rejecting_.end() && rit->second ) {
      ++failed_sends_;
      return TransferStatus::Rejected;
    }

    const auto hit = hooks_.find(to);
    if ( hit != hooks_.end() ) {
      // Copy: the hook may replace or clear itself while running.
      const ReceiveHook hook = hit->second;
      const TransferStatus ts = hook(to, amount_q);
      if ( ts != TransferStatus::Ok ) {
        ++failed_sends_;
        return ts;
      }
    }

    balances_[to] += amount_q;
    total_sent_q_ += amount_q;
    return TransferStatus::Ok;
  }

  void Treasury::set_rejecting(AccountId account, bool rejecting)
  {
    rejecting_[account] = rejecting;
  }

  void Treasury::set_hook(AccountId account, ReceiveHook hook)
  {
    hooks_[account] = std::move(hook);
  }

  void Treasury::clear_hook(AccountId account)
  {
    hooks_.erase(account);
  }

  i64 Treasury::balance(AccountId account) const
  {
    const auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
  }

} // namespace auction
