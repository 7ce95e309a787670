#pragma once

#include <cstdint>
#include <string>

namespace auction::journal {

struct ConvertStats {
    std::uint64_t records  = 0;
    std::uint64_t bad_rows = 0;
};

/**
 * Convert a gzip CSV of operations into a journal file.
 *
 * Header-driven columns: ts_ns, op, caller, asset, amount, aux, account.
 * ts_ns, op and caller are required; amount/aux are decimals in whole value
 * units and are scaled by kValueScale. Invalid rows are counted and skipped.
 *
 * Throws std::runtime_error on I/O failure or a missing required column.
 */
ConvertStats convert(const std::string& input_path, const std::string& output_path);

} // namespace auction::journal
