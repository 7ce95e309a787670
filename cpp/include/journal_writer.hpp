#pragma once

#include <cstdint>
#include <fstream>
#include <string>

#include "journal.hpp"

namespace auction::journal {

/**
 * Writer
 * ------
 * Crash-safe journal producer:
 * - writes to "<path>.part" with a provisional header (record_count = 0)
 * - close() finalises the header, checks the file size and renames
 *   .part -> path atomically
 *
 * Destroying an unclosed Writer removes the .part file.
 * All failures throw std::runtime_error.
 */
class Writer final {
public:
    explicit Writer(const std::string& path);

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    ~Writer();

    void append(const OpRecord& rec);

    std::uint64_t count() const noexcept { return count_; }

    void close();

private:
    std::string   path_;
    std::string   tmp_path_;
    std::ofstream out_;
    std::uint64_t count_  = 0;
    bool          closed_ = false;
};

} // namespace auction::journal
