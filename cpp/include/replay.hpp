#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "auction.hpp"
#include "journal.hpp"

namespace auction
{
  class AssetRegistry;
}

namespace auction::journal {

/**
 * ReplayKernel
 * -------------
 * A zero-copy, sequential reader over a memory-mapped operation journal.
 *
 * Lifetime:
 * - ReplayKernel owns the memory mapping.
 * - Pointers returned by next()/data()/begin()/end() remain valid
 *   until the ReplayKernel is destroyed.
 *
 * Threading:
 * - Single-threaded replay; the house itself is sequential.
 */
class ReplayKernel final {
public:
    /**
     * Construct a replay kernel by memory-mapping a journal file.
     *
     * Performs header validation:
     * - magic / version / endian check / value scale
     * - record_size consistency
     * - file_size == header + record_count * sizeof(OpRecord)
     *
     * Throws std::runtime_error on failure.
     */
    explicit ReplayKernel(const std::string& journal_path);

    ReplayKernel(const ReplayKernel&) = delete;
    ReplayKernel& operator=(const ReplayKernel&) = delete;

    ReplayKernel(ReplayKernel&&) noexcept;
    ReplayKernel& operator=(ReplayKernel&&) noexcept;

    ~ReplayKernel();

    std::size_t size() const noexcept { return size_; }

    /**
     * Current replay cursor position [0, size()].
     */
    std::size_t pos() const noexcept { return pos_; }

    void reset() noexcept { pos_ = 0; }

    /**
     * Advance the cursor and return the next record, or nullptr at end-of-stream.
     */
    [[nodiscard]]
    const OpRecord* next() noexcept;

    const OpRecord* begin() const noexcept { return data_; }
    const OpRecord* end() const noexcept { return data_ + size_; }
    const OpRecord* data() const noexcept { return data_; }

    /**
     * No bounds checking (caller responsibility).
     */
    const OpRecord& operator[](std::size_t idx) const noexcept {
        return data_[idx];
    }

private:
    const OpRecord* data_ = nullptr;
    std::size_t     size_ = 0;
    std::size_t     pos_  = 0;

    void*       view_ = nullptr;   // base address returned by mmap
    std::size_t view_len_ = 0;
    int         fd_ = -1;

    void map_file_(const std::string& path);
    void unmap_file_() noexcept;
};

/**
 * Summary of a replay run.
 */
struct ReplayStats {
    std::uint64_t applied  = 0;
    std::uint64_t rejected = 0;
};

/**
 * Apply one journal record: advances the house clock to ts_ns, then
 * dispatches. Mint/Approve go to the registry; everything else to the house.
 * Unknown ops return RejectReason::InvalidParams.
 */
RejectReason apply(const OpRecord& rec, AuctionHouse& house, AssetRegistry& registry);

/**
 * Apply every remaining record of `kernel` in order.
 */
ReplayStats replay(ReplayKernel& kernel, AuctionHouse& house, AssetRegistry& registry);

} // namespace auction::journal
