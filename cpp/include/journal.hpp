#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "auction.hpp"

/*
 * =============================================================================
 *  Auction Operation Journal (mmappable, fixed-size, versioned, deterministic)
 * =============================================================================
 *
 * A journal is the ordered list of externally triggered operations a house
 * processed (or should process). Replaying it against a fresh AuctionHouse
 * with the same params reproduces the exact same state and audit log.
 *
 * File layout:
 *   [FileHeader][OpRecord][OpRecord]...[OpRecord]
 *
 * Producers:
 * - journal::Writer (tests, tools)
 * - csv_gz_to_journal converter (scaling decimals to fixed-point)
 *
 * Consumers:
 * - journal::ReplayKernel: mmap + iterate records
 * - Python: numpy.memmap with a matching dtype
 *
 * Platform note:
 * - This format assumes little-endian (common on x86_64).
 *
 * Padding / packing policy:
 * - No #pragma pack(1); layout is pinned with static_assert(sizeof/offsetof).
 */

namespace auction::journal
{

  constexpr std::uint32_t kMagic = 0x4A435541; // "AUCJ" in little-endian
  constexpr std::uint16_t kVersion = 1;
  constexpr std::uint32_t kEndianCheck = 0x01020304;

  enum class Op : std::uint8_t
  {
    Mint = 1,     // caller = owner
    Approve = 2,  // caller = owner, account = approved operator
    List = 3,     // amount_q = min price, aux_q = buy-now price
    Unlist = 4,
    Bid = 5,      // amount_q = attached value
    Settle = 6,
    Withdraw = 7  // account = receiver
  };

  inline bool is_known_op(std::uint8_t op) noexcept
  {
    return op >= static_cast<std::uint8_t>(Op::Mint) && op <= static_cast<std::uint8_t>(Op::Withdraw);
  }

  const char* op_name(Op op) noexcept;

  // Parses the lowercase CSV spelling ("mint", "bid", ...). False if unknown.
  bool parse_op(const std::string& name, Op& out) noexcept;

  /* =========================
   *  File header (32 bytes)
   * ========================= */
  struct FileHeader final
  {
    std::uint32_t magic;        // kMagic
    std::uint16_t version;      // kVersion
    std::uint16_t reserved;     // 0
    std::uint32_t record_size;  // sizeof(OpRecord)
    std::uint32_t endian_check; // kEndianCheck
    std::int64_t value_scale;   // auction::kValueScale
    std::uint64_t record_count; // 0 if unknown at write-time
  };

  static_assert(std::is_trivially_copyable_v<FileHeader>,
                "FileHeader must be POD/trivially copyable.");
  static_assert(sizeof(FileHeader) == 32, "FileHeader must be exactly 32 bytes.");

  /* =========================
   *  Operation record (56 bytes)
   * =========================
   *
   * - ts_ns: house clock at which the operation is applied (non-decreasing).
   * - op: journal::Op; unknown values are rejected by apply().
   * - Unused fields MUST be 0.
   */
  struct OpRecord final
  {
    std::int64_t ts_ns;
    std::uint8_t op;
    std::uint8_t pad[7];
    std::uint64_t caller;
    std::uint64_t asset;
    std::int64_t amount_q;
    std::int64_t aux_q;
    std::uint64_t account;
  };

  static_assert(std::is_trivially_copyable_v<OpRecord>, "OpRecord must be POD/trivially copyable.");
  static_assert(alignof(OpRecord) == 8, "OpRecord alignment should remain 8 bytes.");
  static_assert(sizeof(OpRecord) == 56, "OpRecord size must remain 56 bytes.");

  static_assert(offsetof(OpRecord, ts_ns) == 0);
  static_assert(offsetof(OpRecord, op) == 8);
  static_assert(offsetof(OpRecord, caller) == 16);
  static_assert(offsetof(OpRecord, asset) == 24);
  static_assert(offsetof(OpRecord, amount_q) == 32);
  static_assert(offsetof(OpRecord, aux_q) == 40);
  static_assert(offsetof(OpRecord, account) == 48);

  inline OpRecord make_record(std::int64_t ts_ns,
                              Op op,
                              AccountId caller,
                              AssetId asset,
                              i64 amount_q = 0,
                              i64 aux_q = 0,
                              AccountId account = kNoAccount) noexcept
  {
    OpRecord r{};
    r.ts_ns = ts_ns;
    r.op = static_cast<std::uint8_t>(op);
    r.caller = caller;
    r.asset = asset;
    r.amount_q = amount_q;
    r.aux_q = aux_q;
    r.account = account;
    return r;
  }

  inline FileHeader make_header(std::uint64_t record_count = 0) noexcept
  {
    FileHeader h{};
    h.magic = kMagic;
    h.version = kVersion;
    h.reserved = 0;
    h.record_size = static_cast<std::uint32_t>(sizeof(OpRecord));
    h.endian_check = kEndianCheck;
    h.value_scale = kValueScale;
    h.record_count = record_count;
    return h;
  }

} // namespace auction::journal
