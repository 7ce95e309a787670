#pragma once

#include <functional>
#include <map>

#include "auction.hpp"

namespace auction
{

  /// In-memory value primitive with per-account receive behaviour.
  ///
  /// An account's receive hook runs inside send(), before the result is
  /// returned, and may call back into the AuctionHouse. A hook returning
  /// anything but Ok makes the whole send fail and credits nothing.
  class Treasury final : public ValueTransfer
  {
  public:
    using ReceiveHook = std::function<TransferStatus(AccountId to, i64 amount_q)>;

    TransferStatus send(AccountId to, i64 amount_q) override;

    // Accounts that refuse every incoming transfer.
    void set_rejecting(AccountId account, bool rejecting);

    void set_hook(AccountId account, ReceiveHook hook);
    void clear_hook(AccountId account);

    // Value delivered to `account` so far.
    i64 balance(AccountId account) const;
    i64 total_sent() const { return total_sent_q_; }
    u64 failed_sends() const { return failed_sends_; }

  private:
    std::map<AccountId, i64> balances_;
    std::map<AccountId, bool> rejecting_;
    std::map<AccountId, ReceiveHook> hooks_;

    i64 total_sent_q_{0};
    u64 failed_sends_{0};
  };

} // namespace auction
