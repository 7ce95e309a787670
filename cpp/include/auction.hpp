#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <vector>

#ifndef AUCTION_ASSERT
#  define AUCTION_ASSERT(x) assert(x)
#endif

namespace auction
{

  /// All value amounts are fixed-point int64: value_q = value * kValueScale.
  using i64 = std::int64_t;
  using u64 = std::uint64_t;
  using u32 = std::uint32_t;

  using AccountId = u64;
  using AssetId = u64;

  inline constexpr AccountId kNoAccount = 0;
  inline constexpr i64 kValueScale = 100'000'000; // 1e8

  /// Strongly-typed nanoseconds for clarity.
  struct Ns
  {
    u64 value{0};
    constexpr Ns() = default;
    constexpr explicit Ns(u64 v) : value(v) {}

    friend constexpr Ns operator+(Ns a, Ns b) { return Ns{a.value + b.value}; }

    friend constexpr bool operator==(Ns a, Ns b) { return a.value == b.value; }
    friend constexpr bool operator!=(Ns a, Ns b) { return a.value != b.value; }
    friend constexpr bool operator<(Ns a, Ns b) { return a.value < b.value; }
    friend constexpr bool operator<=(Ns a, Ns b) { return a.value <= b.value; }
    friend constexpr bool operator>(Ns a, Ns b) { return a.value > b.value; }
    friend constexpr bool operator>=(Ns a, Ns b) { return a.value >= b.value; }
  };

  inline constexpr Ns kSecond{1'000'000'000ULL};

  enum class RejectReason : std::uint8_t
  {
    None = 0,
    NotOwner = 1,
    NotSeller = 2,
    NotListed = 3,
    BidTooLow = 4,
    NotReceiver = 5,
    NoCredits = 6,
    WithdrawFailed = 7,
    TransferFailed = 8, // refund path only; never returned by place_bid
    CustodyFailed = 9,
    HasActiveBid = 10,
    NoBid = 11,
    AuctionEnded = 12,
    AuctionNotEnded = 13,
    InvalidParams = 14,
    InsufficientResources = 15 // audit log / listing capacity
  };

  /// Stable, human-readable reason text.
  const char* to_string(RejectReason r) noexcept;

  /// Outcome of a bounded-effort outbound value transfer.
  enum class TransferStatus : std::uint8_t
  {
    Ok = 0,
    Rejected = 1,         // recipient refused the value
    ResourceExhausted = 2 // recipient ran past the effort budget
  };

  /// Asset-ownership primitive consumed by the house.
  class AssetCustody
  {
  public:
    virtual ~AssetCustody() = default;

    // kNoAccount if the asset does not exist.
    virtual AccountId owner_of(AssetId asset) const = 0;

    // Moves `asset` from `from` to `to` on behalf of `mover`.
    // Must fail unless `from` is the current owner and `mover` is either the
    // owner or the account the owner approved for this asset.
    virtual bool transfer_custody(AccountId mover, AssetId asset, AccountId from, AccountId to) = 0;
  };

  /// Outbound value primitive. Every send() is an external call: the
  /// recipient may re-enter the house before it returns.
  class ValueTransfer
  {
  public:
    virtual ~ValueTransfer() = default;

    virtual TransferStatus send(AccountId to, i64 amount_q) = 0;
  };

  struct AuctionParams
  {
    // Account the house holds custody and escrow under.
    AccountId house{kNoAccount};

    // Anti-sniping window: every accepted bid sets auction_end = now + extension.
    Ns auction_extension{15 * 60 * kSecond.value};

    // Next bid must be >= previous * (100 + pct) / 100 (and strictly greater).
    u32 min_increment_pct{5};

    // Hard caps (0 => unbounded).
    std::size_t max_events{0};
    std::size_t max_listings{0};
  };

  struct Listing
  {
    AccountId seller{kNoAccount};
    i64 min_price_q{0};
    i64 buy_now_price_q{0}; // 0 => buy-now disabled
    bool listed{false};
    Ns auction_end{0};      // 0 => no bid yet, no deadline
  };

  struct Bid
  {
    AccountId bidder{kNoAccount};
    i64 amount_q{0};
  };

  /// House-wide value accounting. Invariant:
  ///   received_q - paid_out_q == escrow_q + credits_q
  struct Ledger
  {
    i64 received_q{0}; // value attached to accepted bids
    i64 paid_out_q{0}; // refunds, seller proceeds and withdrawals delivered
    i64 escrow_q{0};   // sum of current highest bids
    i64 credits_q{0};  // sum of outstanding credit entries
  };

  /// Audit log entry.
  enum class EventType : std::uint8_t
  {
    Listed = 0,
    Unlisted = 1,
    BidAccepted = 2,
    Refunded = 3,
    Credited = 4,
    Withdrawn = 5,
    Settled = 6,
    Reject = 7
  };

  struct Event
  {
    Ns ts{0};
    EventType type{EventType::Listed};
    AssetId asset{0};
    AccountId account{kNoAccount};
    i64 amount_q{0};
    RejectReason reject_reason{RejectReason::None};
  };

  /// Listing registry, auction engine and credit ledger over one state store.
  ///
  /// Every mutating entry point is all-or-nothing: a non-None return means no
  /// state changed (apart from a best-effort Reject audit entry). Internal
  /// bookkeeping is always committed before an outbound ValueTransfer::send,
  /// so a recipient re-entering the house observes post-update state.
  class AuctionHouse final
  {
  public:
    AuctionHouse(const AuctionParams& params, AssetCustody& custody, ValueTransfer& payments);

    AuctionHouse(const AuctionHouse&) = delete;
    AuctionHouse& operator=(const AuctionHouse&) = delete;

    // Moves the clock forward; earlier timestamps are ignored.
    void advance(Ns now);

    // --- Listing registry ---
    [[nodiscard]] RejectReason list(AssetId asset, AccountId caller, i64 min_price_q, i64 buy_now_price_q);
    [[nodiscard]] RejectReason unlist(AssetId asset, AccountId caller);

    // --- Auction engine ---
    // value_q is attached to the call; on any non-None return it is not taken.
    [[nodiscard]] RejectReason place_bid(AssetId asset, AccountId caller, i64 value_q);

    // Anyone may settle once the deadline has passed.
    [[nodiscard]] RejectReason settle(AssetId asset, AccountId caller);

    // --- Credit ledger ---
    [[nodiscard]] RejectReason withdraw_all_failed_credits(AccountId caller, AccountId receiver);

    // --- Accessors ---
    Listing listing(AssetId asset) const;
    Bid highest_bid(AssetId asset) const;
    i64 credited_balance(AccountId account) const;

    // Minimum accepted amount for the next bid on a listed asset.
    i64 next_min_bid(AssetId asset) const;

    Ns now() const { return now_; }
    const AuctionParams& params() const { return params_; }
    const Ledger& ledger() const { return ledger_; }
    const std::vector<Event>& events() const { return events_; }

  private:
    bool has_event_capacity_(std::size_t n) const;

    // Attempts to append an event to the log.
    // Returns false if event capacity is exceeded.
    bool push_event_(EventType et, AssetId asset, AccountId account, i64 amount_q, RejectReason rr);
    RejectReason reject_(AssetId asset, AccountId account, RejectReason rr);

    RejectReason validate_bid_(const Listing& l, const Bid* prev, i64 value_q) const;

    // Returns displaced value to its bidder; falls back to credit on failure.
    void refund_or_credit_(AssetId asset, const Bid& displaced);
    void credit_(AccountId account, i64 amount_q);

    // Closes a sale: bid/escrow cleared, custody to the winner, seller paid.
    RejectReason finalize_sale_(AssetId asset);

    AuctionParams params_{};
    AssetCustody& custody_;
    ValueTransfer& payments_;

    Ns now_{0};
    Ledger ledger_{};

    // Tombstones stay with listed=false.
    std::map<AssetId, Listing> listings_;
    std::map<AssetId, Bid> bids_;
    std::map<AccountId, i64> credits_;

    std::vector<Event> events_;
  };

} // namespace auction
