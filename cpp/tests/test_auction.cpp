#undef NDEBUG

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>

#include "auction.hpp"
#include "auction_math.hpp"
#include "custody.hpp"
#include "treasury.hpp"

namespace
{
  using auction::AccountId;
  using auction::AssetId;
  using auction::EventType;
  using auction::i64;
  using auction::Ns;
  using auction::RejectReason;
  using auction::TransferStatus;

  constexpr AccountId kHouse = 1000;
  constexpr AccountId kSeller = 1;
  constexpr AccountId kX = 2;
  constexpr AccountId kY = 3;
  constexpr AccountId kZ = 4;

  constexpr i64 kOne = auction::kValueScale;
  constexpr i64 kOnePointTwo = 120'000'000;

  constexpr Ns kExtension{60ULL * 1'000'000'000ULL};

  auction::AuctionParams make_params()
  {
    auction::AuctionParams p{};
    p.house = kHouse;
    p.auction_extension = kExtension;
    p.min_increment_pct = 5;
    return p;
  }

  struct Fixture
  {
    auction::AssetRegistry registry;
    auction::Treasury treasury;
    auction::AuctionHouse house;

    explicit Fixture(const auction::AuctionParams& p = make_params()) : house(p, registry, treasury) {}

    RejectReason list_new(AssetId asset, AccountId seller, i64 min_q, i64 buy_now_q = 0)
    {
      if ( !registry.mint(asset, seller) )
        return RejectReason::InvalidParams;
      if ( !registry.approve(seller, asset, kHouse) )
        return RejectReason::NotOwner;
      return house.list(asset, seller, min_q, buy_now_q);
    }

    bool balanced() const
    {
      const auction::Ledger& l = house.ledger();
      return l.received_q - l.paid_out_q == l.escrow_q + l.credits_q &&
             treasury.total_sent() == l.paid_out_q;
    }
  };

  // Registry front that refuses to hand assets to one account.
  class RefusingCustody final : public auction::AssetCustody
  {
  public:
    auction::AssetRegistry inner;
    AccountId refuse_to{auction::kNoAccount};

    AccountId owner_of(AssetId asset) const override { return inner.owner_of(asset); }

    bool transfer_custody(AccountId mover, AssetId asset, AccountId from, AccountId to) override
    {
      if ( to == refuse_to )
        return false;
      return inner.transfer_custody(mover, asset, from, to);
    }
  };

  std::size_t count_events(const auction::AuctionHouse& h, EventType et)
  {
    std::size_t n = 0;
    for ( const auto& e : h.events() ) {
      if ( e.type == et )
        ++n;
    }
    return n;
  }

  bool last_reject_is(const auction::AuctionHouse& h, RejectReason rr)
  {
    if ( h.events().empty() )
      return false;
    const auto& e = h.events().back();
    return e.type == EventType::Reject && e.reject_reason == rr;
  }

} // namespace

int main()
{
  // ----------------------------
  // 1) Example scenario, direct refund path
  // ----------------------------
  {
    Fixture fx;
    assert(fx.list_new(0, kSeller, kOne) == RejectReason::None);

    assert(fx.house.place_bid(0, kX, kOne) == RejectReason::None);
    assert(fx.house.highest_bid(0).bidder == kX);
    assert(fx.house.highest_bid(0).amount_q == kOne);

    assert(fx.house.place_bid(0, kY, kOnePointTwo) == RejectReason::None);
    assert(fx.house.highest_bid(0).bidder == kY);
    assert(fx.house.highest_bid(0).amount_q == kOnePointTwo);

    // Refund-or-credit: exactly one of the two, never both.
    assert(fx.treasury.balance(kX) == kOne);
    assert(fx.house.credited_balance(kX) == 0);
    assert(count_events(fx.house, EventType::Refunded) == 1);
    assert(count_events(fx.house, EventType::Credited) == 0);

    assert(fx.house.ledger().escrow_q == kOnePointTwo);
    assert(fx.balanced());
  }

  // ----------------------------
  // 2) Example scenario, credit fallback + withdrawal access control
  // ----------------------------
  {
    Fixture fx;
    assert(fx.list_new(0, kSeller, kOne) == RejectReason::None);

    fx.treasury.set_rejecting(kX, true);
    assert(fx.house.place_bid(0, kX, kOne) == RejectReason::None);
    assert(fx.house.place_bid(0, kY, kOnePointTwo) == RejectReason::None); // never reverts on refund failure

    assert(fx.treasury.balance(kX) == 0);
    assert(fx.house.credited_balance(kX) == kOne);
    assert(fx.house.highest_bid(0).bidder == kY);
    assert(fx.balanced());

    // The credited refund is tagged with the internal transfer failure.
    bool saw_credit = false;
    for ( const auto& e : fx.house.events() ) {
      if ( e.type == EventType::Credited ) {
        saw_credit = true;
        assert(e.account == kX);
        assert(e.amount_q == kOne);
        assert(e.reject_reason == RejectReason::TransferFailed);
      }
    }
    assert(saw_credit);

    // Third party naming X as receiver.
    assert(fx.house.withdraw_all_failed_credits(kZ, kX) == RejectReason::NotReceiver);
    assert(last_reject_is(fx.house, RejectReason::NotReceiver));
    assert(fx.house.credited_balance(kX) == kOne);
    assert(fx.treasury.balance(kZ) == 0);

    // Even the current leader cannot pull someone else's credit.
    assert(fx.house.withdraw_all_failed_credits(kY, kX) == RejectReason::NotReceiver);
    assert(fx.house.credited_balance(kX) == kOne);

    // X still refuses value: the withdrawal fails atomically.
    assert(fx.house.withdraw_all_failed_credits(kX, kX) == RejectReason::WithdrawFailed);
    assert(fx.house.credited_balance(kX) == kOne);
    assert(fx.balanced());

    fx.treasury.set_rejecting(kX, false);
    assert(fx.house.withdraw_all_failed_credits(kX, kX) == RejectReason::None);
    assert(fx.treasury.balance(kX) == kOne);
    assert(fx.house.credited_balance(kX) == 0);
    assert(count_events(fx.house, EventType::Withdrawn) == 1);

    // No double drain.
    assert(fx.house.withdraw_all_failed_credits(kX, kX) == RejectReason::NoCredits);
    assert(fx.treasury.balance(kX) == kOne);
    assert(fx.balanced());

    // Accounts that never had credit.
    assert(fx.house.withdraw_all_failed_credits(kZ, kZ) == RejectReason::NoCredits);
  }

  // ----------------------------
  // 3) Increment enforcement at exactly 5%
  // ----------------------------
  {
    Fixture fx;
    assert(fx.list_new(7, kSeller, kOne) == RejectReason::None);

    const i64 prev = 100 * kOne;
    assert(fx.house.place_bid(7, kX, prev) == RejectReason::None);
    assert(fx.house.next_min_bid(7) == 105 * kOne);

    assert(fx.house.place_bid(7, kY, prev) == RejectReason::BidTooLow);            // equal
    assert(fx.house.place_bid(7, kY, 105 * kOne - 1) == RejectReason::BidTooLow);  // just below
    assert(fx.house.place_bid(7, kY, 104 * kOne) == RejectReason::BidTooLow);
    assert(fx.house.highest_bid(7).bidder == kX);
    assert(fx.house.highest_bid(7).amount_q == prev);

    assert(fx.house.place_bid(7, kY, 105 * kOne) == RejectReason::None);           // exactly 1.05x
    assert(fx.house.highest_bid(7).bidder == kY);
    assert(fx.house.place_bid(7, kZ, 200 * kOne) == RejectReason::None);           // well above
    assert(fx.balanced());
  }

  // 3b) Tiny amounts: integer rounding must not admit an equal bid.
  {
    Fixture fx;
    assert(fx.list_new(8, kSeller, 0) == RejectReason::None);

    assert(fx.house.place_bid(8, kX, 0) == RejectReason::BidTooLow); // zero is never a bid
    assert(fx.house.place_bid(8, kX, 1) == RejectReason::None);
    assert(fx.house.next_min_bid(8) == 2);
    assert(fx.house.place_bid(8, kY, 1) == RejectReason::BidTooLow);
    assert(fx.house.place_bid(8, kY, 2) == RejectReason::None);

    assert(fx.house.place_bid(8, kZ, 20) == RejectReason::None);
    assert(fx.house.next_min_bid(8) == 21);
    assert(fx.house.place_bid(8, kX, 20) == RejectReason::BidTooLow);
    assert(fx.house.place_bid(8, kX, 21) == RejectReason::None);
    assert(fx.balanced());
  }

  // 3c) First bid is checked against the listing minimum only.
  {
    Fixture fx;
    assert(fx.list_new(9, kSeller, 3 * kOne) == RejectReason::None);
    assert(fx.house.next_min_bid(9) == 3 * kOne);
    assert(fx.house.place_bid(9, kX, 3 * kOne - 1) == RejectReason::BidTooLow);
    assert(fx.house.highest_bid(9).bidder == auction::kNoAccount);
    assert(fx.house.place_bid(9, kX, 3 * kOne) == RejectReason::None);
    assert(fx.house.ledger().received_q == 3 * kOne);
  }

  // 3d) Overflow-safe math helpers.
  {
    using auction::math::meets_increment;
    using auction::math::min_next_bid;
    const i64 big = (std::numeric_limits<i64>::max)() / 2;
    assert(!meets_increment(big, big, 5));
    assert(meets_increment((std::numeric_limits<i64>::max)(), big, 5));
    assert(min_next_bid((std::numeric_limits<i64>::max)() - 1, 5) == (std::numeric_limits<i64>::max)());
    assert(min_next_bid(100, 5) == 105);
    assert(min_next_bid(101, 5) == 107); // ceil(106.05)
  }

  // ----------------------------
  // 4) Anti-sniping extension resets the deadline on every bid
  // ----------------------------
  {
    Fixture fx;
    assert(fx.list_new(1, kSeller, kOne) == RejectReason::None);
    assert(fx.house.listing(1).auction_end == Ns{0});

    fx.house.advance(Ns{1'000});
    assert(fx.house.place_bid(1, kX, kOne) == RejectReason::None);
    assert(fx.house.listing(1).auction_end == Ns{1'000} + kExtension);

    // One nanosecond before the deadline: still open, deadline resets.
    const Ns late = Ns{1'000} + Ns{kExtension.value - 1};
    fx.house.advance(late);
    assert(fx.house.place_bid(1, kY, 2 * kOne) == RejectReason::None);
    assert(fx.house.listing(1).auction_end == late + kExtension);

    // Rejected bids leave the deadline untouched.
    fx.house.advance(late + Ns{5});
    assert(fx.house.place_bid(1, kZ, 2 * kOne) == RejectReason::BidTooLow);
    assert(fx.house.listing(1).auction_end == late + kExtension);

    // The clock never moves backwards.
    fx.house.advance(Ns{10});
    assert(fx.house.now() == late + Ns{5});

    // At the deadline the auction is closed to bids.
    fx.house.advance(late + kExtension);
    assert(fx.house.place_bid(1, kZ, 10 * kOne) == RejectReason::AuctionEnded);
    assert(fx.house.highest_bid(1).bidder == kY);
  }

  // ----------------------------
  // 5) Listing / custody coupling
  // ----------------------------
  {
    Fixture fx;
    assert(fx.registry.mint(2, kSeller));

    // Not the owner.
    assert(fx.house.list(2, kZ, kOne, 0) == RejectReason::NotOwner);
    assert(fx.house.list(99, kSeller, kOne, 0) == RejectReason::NotOwner); // unknown asset
    assert(fx.house.list(2, kHouse, kOne, 0) == RejectReason::NotOwner);
    assert(!fx.house.listing(2).listed);

    // Owner without approval: custody cannot move.
    assert(fx.house.list(2, kSeller, kOne, 0) == RejectReason::CustodyFailed);
    assert(fx.registry.owner_of(2) == kSeller);
    assert(!fx.house.listing(2).listed);

    assert(fx.registry.approve(kSeller, 2, kHouse));

    // Buy-now below the minimum is rejected before custody moves.
    assert(fx.house.list(2, kSeller, 5 * kOne, 2 * kOne) == RejectReason::InvalidParams);
    assert(fx.house.list(2, kSeller, -1, 0) == RejectReason::InvalidParams);
    assert(fx.registry.owner_of(2) == kSeller);

    assert(fx.house.list(2, kSeller, kOne, 0) == RejectReason::None);
    assert(fx.registry.owner_of(2) == kHouse);
    assert(fx.house.listing(2).listed);
    assert(fx.house.listing(2).seller == kSeller);
    assert(count_events(fx.house, EventType::Listed) == 1);

    // Listed again by anyone: the house owns it now.
    assert(fx.house.list(2, kSeller, kOne, 0) == RejectReason::NotOwner);

    // Only the seller may unlist.
    assert(fx.house.unlist(2, kZ) == RejectReason::NotSeller);
    assert(fx.registry.owner_of(2) == kHouse);

    assert(fx.house.unlist(2, kSeller) == RejectReason::None);
    assert(fx.registry.owner_of(2) == kSeller);
    assert(!fx.house.listing(2).listed);
    assert(fx.house.listing(2).seller == kSeller); // tombstone

    assert(fx.house.unlist(2, kSeller) == RejectReason::NotListed);
    assert(fx.house.unlist(42, kSeller) == RejectReason::NotListed);
    assert(fx.house.place_bid(2, kX, kOne) == RejectReason::NotListed);

    // Relist after unlisting overwrites the tombstone.
    assert(fx.registry.approve(kSeller, 2, kHouse));
    assert(fx.house.list(2, kSeller, 2 * kOne, 0) == RejectReason::None);
    assert(fx.house.listing(2).min_price_q == 2 * kOne);

    // An outstanding bid blocks unlisting; custody stays with the house.
    assert(fx.house.place_bid(2, kX, 2 * kOne) == RejectReason::None);
    assert(fx.house.unlist(2, kSeller) == RejectReason::HasActiveBid);
    assert(fx.registry.owner_of(2) == kHouse);
    assert(fx.house.listing(2).listed);
    assert(fx.balanced());
  }

  // ----------------------------
  // 6) Settlement after the deadline
  // ----------------------------
  {
    Fixture fx;
    assert(fx.list_new(3, kSeller, kOne) == RejectReason::None);

    assert(fx.house.settle(3, kZ) == RejectReason::NoBid);
    assert(fx.house.settle(77, kZ) == RejectReason::NotListed);

    assert(fx.house.place_bid(3, kX, kOne) == RejectReason::None);
    assert(fx.house.place_bid(3, kY, 2 * kOne) == RejectReason::None);
    assert(fx.house.settle(3, kZ) == RejectReason::AuctionNotEnded);

    fx.house.advance(fx.house.listing(3).auction_end);
    assert(fx.house.settle(3, kZ) == RejectReason::None); // anyone may settle

    assert(fx.registry.owner_of(3) == kY);
    assert(fx.treasury.balance(kSeller) == 2 * kOne);
    assert(!fx.house.listing(3).listed);
    assert(fx.house.highest_bid(3).bidder == auction::kNoAccount);
    assert(fx.house.highest_bid(3).amount_q == 0);
    assert(fx.house.ledger().escrow_q == 0);
    assert(count_events(fx.house, EventType::Settled) == 1);

    assert(fx.house.settle(3, kZ) == RejectReason::NotListed);
    assert(fx.house.place_bid(3, kZ, 5 * kOne) == RejectReason::NotListed);
    assert(fx.balanced());

    // The winner can list it again.
    assert(fx.registry.approve(kY, 3, kHouse));
    assert(fx.house.list(3, kY, kOne, 0) == RejectReason::None);
    assert(fx.house.listing(3).seller == kY);
    assert(fx.house.listing(3).auction_end == Ns{0});
  }

  // 6b) Seller proceeds fall back to credit.
  {
    Fixture fx;
    assert(fx.list_new(4, kSeller, kOne) == RejectReason::None);
    fx.treasury.set_rejecting(kSeller, true);

    assert(fx.house.place_bid(4, kX, 3 * kOne) == RejectReason::None);
    fx.house.advance(fx.house.listing(4).auction_end);
    assert(fx.house.settle(4, kX) == RejectReason::None);

    assert(fx.registry.owner_of(4) == kX);
    assert(fx.treasury.balance(kSeller) == 0);
    assert(fx.house.credited_balance(kSeller) == 3 * kOne);
    assert(fx.balanced());

    fx.treasury.set_rejecting(kSeller, false);
    assert(fx.house.withdraw_all_failed_credits(kX, kSeller) == RejectReason::NotReceiver);
    assert(fx.house.withdraw_all_failed_credits(kSeller, kSeller) == RejectReason::None);
    assert(fx.treasury.balance(kSeller) == 3 * kOne);
    assert(fx.house.ledger().credits_q == 0);
    assert(fx.balanced());
  }

  // ----------------------------
  // 7) Buy-now closes the sale on the qualifying bid
  // ----------------------------
  {
    Fixture fx;
    assert(fx.list_new(5, kSeller, kOne, 10 * kOne) == RejectReason::None);

    assert(fx.house.place_bid(5, kX, 2 * kOne) == RejectReason::None);
    assert(fx.house.listing(5).listed);

    assert(fx.house.place_bid(5, kY, 10 * kOne) == RejectReason::None);
    assert(fx.treasury.balance(kX) == 2 * kOne);         // displaced bid refunded
    assert(fx.registry.owner_of(5) == kY);
    assert(fx.treasury.balance(kSeller) == 10 * kOne);
    assert(!fx.house.listing(5).listed);
    assert(fx.house.highest_bid(5).bidder == auction::kNoAccount);
    assert(fx.house.ledger().escrow_q == 0);

    assert(fx.house.place_bid(5, kZ, 20 * kOne) == RejectReason::NotListed);
    assert(fx.balanced());
  }

  // 7b) The refunded bidder outbids from inside its refund and takes the buy-now sale.
  {
    Fixture fx;
    assert(fx.list_new(6, kSeller, kOne, 10 * kOne) == RejectReason::None);
    assert(fx.house.place_bid(6, kX, 5 * kOne) == RejectReason::None);

    RejectReason nested = RejectReason::InvalidParams;
    fx.treasury.set_hook(kX, [&](AccountId, i64) {
      fx.treasury.clear_hook(kX);
      nested = fx.house.place_bid(6, kX, 1'050'000'000);
      return TransferStatus::Ok;
    });

    assert(fx.house.place_bid(6, kY, 10 * kOne) == RejectReason::None);
    assert(nested == RejectReason::None);
    assert(fx.registry.owner_of(6) == kX);
    assert(!fx.house.listing(6).listed);
    assert(fx.house.highest_bid(6).bidder == auction::kNoAccount);
    assert(count_events(fx.house, EventType::Settled) == 1);

    assert(fx.treasury.balance(kX) == 5 * kOne);
    assert(fx.treasury.balance(kY) == 10 * kOne);
    assert(fx.treasury.balance(kSeller) == 1'050'000'000);
    assert(fx.house.ledger().escrow_q == 0);
    assert(fx.house.ledger().credits_q == 0);
    assert(fx.house.ledger().received_q == 5 * kOne + 10 * kOne + 1'050'000'000);
    assert(fx.balanced());
  }

  // 7c) Buy-now whose custody move fails: the bid stands and settle() closes it later.
  {
    RefusingCustody custody;
    auction::Treasury treasury;
    auction::AuctionHouse house(make_params(), custody, treasury);

    assert(custody.inner.mint(7, kSeller));
    assert(custody.inner.approve(kSeller, 7, kHouse));
    assert(house.list(7, kSeller, kOne, 10 * kOne) == RejectReason::None);
    assert(house.place_bid(7, kX, 2 * kOne) == RejectReason::None);

    custody.refuse_to = kY;
    assert(house.place_bid(7, kY, 10 * kOne) == RejectReason::None);
    assert(last_reject_is(house, RejectReason::CustodyFailed));
    assert(house.listing(7).listed);
    assert(house.highest_bid(7).bidder == kY);
    assert(house.highest_bid(7).amount_q == 10 * kOne);
    assert(custody.owner_of(7) == kHouse);
    assert(treasury.balance(kX) == 2 * kOne);
    assert(treasury.balance(kSeller) == 0);
    assert(house.ledger().escrow_q == 10 * kOne);

    assert(house.settle(7, kZ) == RejectReason::AuctionNotEnded);

    custody.refuse_to = auction::kNoAccount;
    house.advance(house.listing(7).auction_end);
    assert(house.settle(7, kZ) == RejectReason::None);
    assert(custody.owner_of(7) == kY);
    assert(treasury.balance(kSeller) == 10 * kOne);

    const auction::Ledger& l = house.ledger();
    assert(l.escrow_q == 0);
    assert(l.received_q - l.paid_out_q == l.escrow_q + l.credits_q);
    assert(treasury.total_sent() == l.paid_out_q);
  }

  // ----------------------------
  // 8) Re-entrancy: a recipient calling back during the payout
  // ----------------------------

  // 8a) Repeated withdrawal from inside the payout sees a zero balance.
  {
    Fixture fx;
    assert(fx.list_new(10, kSeller, kOne) == RejectReason::None);
    fx.treasury.set_rejecting(kX, true);
    assert(fx.house.place_bid(10, kX, kOne) == RejectReason::None);
    assert(fx.house.place_bid(10, kY, 2 * kOne) == RejectReason::None);
    assert(fx.house.credited_balance(kX) == kOne);
    fx.treasury.set_rejecting(kX, false);

    int reentries = 0;
    RejectReason nested = RejectReason::None;
    i64 seen_balance = -1;
    fx.treasury.set_hook(kX, [&](AccountId, i64) {
      ++reentries;
      seen_balance = fx.house.credited_balance(kX);
      nested = fx.house.withdraw_all_failed_credits(kX, kX);
      return TransferStatus::Ok;
    });

    assert(fx.house.withdraw_all_failed_credits(kX, kX) == RejectReason::None);
    assert(reentries == 1);
    assert(seen_balance == 0);
    assert(nested == RejectReason::NoCredits);
    assert(fx.treasury.balance(kX) == kOne);
    assert(fx.house.credited_balance(kX) == 0);
    assert(fx.balanced());
  }

  // 8b) A refund recipient re-bidding from inside its refund sees itself already displaced.
  {
    Fixture fx;
    assert(fx.list_new(11, kSeller, kOne) == RejectReason::None);
    assert(fx.house.place_bid(11, kX, kOne) == RejectReason::None);

    AccountId leader_during_refund = auction::kNoAccount;
    RejectReason nested = RejectReason::InvalidParams;
    fx.treasury.set_hook(kX, [&](AccountId, i64) {
      leader_during_refund = fx.house.highest_bid(11).bidder;
      fx.treasury.clear_hook(kX);
      nested = fx.house.place_bid(11, kX, 3 * kOne);
      return TransferStatus::Ok;
    });

    assert(fx.house.place_bid(11, kY, 2 * kOne) == RejectReason::None);
    assert(leader_during_refund == kY);
    assert(nested == RejectReason::None);
    assert(fx.house.highest_bid(11).bidder == kX);
    assert(fx.house.highest_bid(11).amount_q == 3 * kOne);
    assert(fx.treasury.balance(kX) == kOne);
    assert(fx.treasury.balance(kY) == 2 * kOne);
    assert(fx.house.ledger().escrow_q == 3 * kOne);
    assert(fx.balanced());
  }

  // 8c) A hostile recipient cannot drain a third party's credit from inside a callback.
  {
    Fixture fx;
    assert(fx.list_new(12, kSeller, kOne) == RejectReason::None);
    fx.treasury.set_rejecting(kX, true);
    assert(fx.house.place_bid(12, kX, kOne) == RejectReason::None);
    assert(fx.house.place_bid(12, kZ, 2 * kOne) == RejectReason::None);
    assert(fx.house.credited_balance(kX) == kOne);

    RejectReason nested = RejectReason::None;
    fx.treasury.set_hook(kZ, [&](AccountId, i64) {
      nested = fx.house.withdraw_all_failed_credits(kZ, kX);
      return TransferStatus::Ok;
    });
    assert(fx.house.place_bid(12, kY, 3 * kOne) == RejectReason::None);
    assert(nested == RejectReason::NotReceiver);
    assert(fx.house.credited_balance(kX) == kOne);
    assert(fx.treasury.balance(kZ) == 2 * kOne);
    assert(fx.balanced());
  }

  // 8d) A failed withdrawal restores the balance without losing credit earned during the call.
  {
    Fixture fx;
    assert(fx.list_new(13, kSeller, kOne) == RejectReason::None);
    assert(fx.list_new(14, kSeller, kOne) == RejectReason::None);

    fx.treasury.set_rejecting(kX, true);
    assert(fx.house.place_bid(13, kX, kOne) == RejectReason::None);
    assert(fx.house.place_bid(13, kY, 2 * kOne) == RejectReason::None);
    assert(fx.house.credited_balance(kX) == kOne);
    fx.treasury.set_rejecting(kX, false);

    assert(fx.house.place_bid(14, kX, 4 * kOne) == RejectReason::None);

    // Outer call: withdrawal payout. Inner call: the outbid refund for asset 14.
    int depth = 0;
    RejectReason nested_bid = RejectReason::InvalidParams;
    fx.treasury.set_hook(kX, [&](AccountId, i64) {
      ++depth;
      if ( depth == 1 ) {
        nested_bid = fx.house.place_bid(14, kY, 5 * kOne);
        return TransferStatus::ResourceExhausted;
      }
      return TransferStatus::Rejected;
    });

    assert(fx.house.withdraw_all_failed_credits(kX, kX) == RejectReason::WithdrawFailed);
    assert(depth == 2);
    assert(nested_bid == RejectReason::None);
    assert(fx.house.highest_bid(14).bidder == kY);
    assert(fx.house.credited_balance(kX) == kOne + 4 * kOne);
    assert(fx.treasury.balance(kX) == 0);
    assert(fx.balanced());
  }

  // ----------------------------
  // 9) Audit log capacity makes operations fail whole
  // ----------------------------
  {
    auction::AuctionParams p = make_params();
    p.max_events = 3;
    Fixture fx(p);
    assert(fx.list_new(20, kSeller, kOne) == RejectReason::None);
    assert(fx.house.events().size() == 1);

    // A bid needs room for its worst case; nothing changes when it is missing.
    assert(fx.house.place_bid(20, kX, kOne) == RejectReason::InsufficientResources);
    assert(fx.house.highest_bid(20).bidder == auction::kNoAccount);
    assert(fx.house.ledger().received_q == 0);
    assert(fx.house.listing(20).auction_end == Ns{0});
    assert(fx.house.events().size() <= p.max_events);
  }

  // 9b) Listing capacity.
  {
    auction::AuctionParams p = make_params();
    p.max_listings = 1;
    Fixture fx(p);
    assert(fx.list_new(21, kSeller, kOne) == RejectReason::None);
    assert(fx.list_new(22, kSeller, kOne) == RejectReason::InsufficientResources);
    assert(fx.registry.owner_of(22) == kSeller);
  }

  // 9c) A full log does not mask the reason an operation is refused.
  {
    auction::AuctionParams p = make_params();
    p.max_events = 1;
    Fixture fx(p);
    assert(fx.list_new(30, kSeller, kOne) == RejectReason::None);
    assert(fx.house.events().size() == 1);

    assert(fx.house.place_bid(31, kX, kOne) == RejectReason::NotListed);
    assert(fx.house.list(30, kX, kOne, 0) == RejectReason::NotOwner);
    assert(fx.house.place_bid(30, kX, kOne) == RejectReason::InsufficientResources);

    assert(fx.registry.mint(32, kX));
    assert(fx.registry.approve(kX, 32, kHouse));
    assert(fx.house.list(32, kX, -kOne, 0) == RejectReason::InvalidParams);
    assert(fx.house.list(32, kX, kOne, 0) == RejectReason::InsufficientResources);
    assert(fx.registry.owner_of(32) == kX);
    assert(fx.house.events().size() == 1);
  }

  // ----------------------------
  // 10) Params validation and reason text
  // ----------------------------
  {
    auction::AssetRegistry registry;
    auction::Treasury treasury;

    auction::AuctionParams bad = make_params();
    bad.house = auction::kNoAccount;
    bool threw = false;
    try {
      auction::AuctionHouse h(bad, registry, treasury);
    }
    catch ( const std::invalid_argument& ) {
      threw = true;
    }
    assert(threw);

    bad = make_params();
    bad.min_increment_pct = 0;
    threw = false;
    try {
      auction::AuctionHouse h(bad, registry, treasury);
    }
    catch ( const std::invalid_argument& ) {
      threw = true;
    }
    assert(threw);

    bad = make_params();
    bad.auction_extension = Ns{0};
    threw = false;
    try {
      auction::AuctionHouse h(bad, registry, treasury);
    }
    catch ( const std::invalid_argument& ) {
      threw = true;
    }
    assert(threw);

    // Every reason has its own text.
    for ( int a = 0; a <= static_cast<int>(RejectReason::InsufficientResources); ++a ) {
      for ( int b = a + 1; b <= static_cast<int>(RejectReason::InsufficientResources); ++b ) {
        assert(std::strcmp(
                   auction::to_string(static_cast<RejectReason>(a)),
                   auction::to_string(static_cast<RejectReason>(b))) != 0);
      }
    }
  }

  // 10b) A deadline that would run past the end of the clock refuses the bid.
  {
    auction::AuctionParams p = make_params();
    p.auction_extension = Ns{std::numeric_limits<std::uint64_t>::max()};
    Fixture fx(p);
    assert(fx.list_new(40, kSeller, kOne) == RejectReason::None);
    fx.house.advance(Ns{1000});

    assert(fx.house.place_bid(40, kX, kOne) == RejectReason::InvalidParams);
    assert(fx.house.highest_bid(40).bidder == auction::kNoAccount);
    assert(fx.house.listing(40).auction_end == Ns{0});
    assert(fx.house.ledger().received_q == 0);
    assert(fx.house.settle(40, kZ) == RejectReason::NoBid);
    assert(fx.balanced());
  }

  // ----------------------------
  // 11) Registry approvals are single-use
  // ----------------------------
  {
    auction::AssetRegistry r;
    assert(r.mint(1, kSeller));
    assert(!r.mint(1, kX));
    assert(!r.mint(2, auction::kNoAccount));
    assert(!r.approve(kX, 1, kHouse));
    assert(!r.transfer_custody(kHouse, 1, kSeller, kHouse));
    assert(r.approve(kSeller, 1, kHouse));
    assert(!r.transfer_custody(kHouse, 1, kX, kHouse)); // wrong `from`
    assert(r.transfer_custody(kHouse, 1, kSeller, kHouse));
    assert(r.owner_of(1) == kHouse);
    assert(r.approved(1) == auction::kNoAccount);
    assert(r.transfer_custody(kHouse, 1, kHouse, kSeller)); // owner moves its own asset
    assert(!r.transfer_custody(kHouse, 1, kSeller, kHouse));
  }

  return 0;
}
