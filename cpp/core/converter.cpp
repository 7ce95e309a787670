/*
Builds an operation journal from a gzip-compressed CSV export of auction activity.

- Input is read straight from the .csv.gz stream (zlib); nothing is unpacked to disk
- Lines of any length are read whole
- Columns are located by header name, so their order does not matter
- Decimal amounts are vetted by fast_float and scaled to fixed-point exactly,
  with NaN, overflow and excess fractional digits rejected
- Output goes through journal::Writer and only appears once complete

Columns (any order, unknown columns ignored):
    ts_ns, op, caller, asset, amount, aux, account
- ts_ns, op and caller must be present
- asset and account are unsigned integers, empty -> 0
- amount and aux are decimals in whole value units, empty -> 0
*/

#include "converter.hpp"

#include "auction_math.hpp"
#include "journal.hpp"
#include "journal_writer.hpp"

#include <zlib.h>

#include <fast_float/fast_float.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace auction::journal {

namespace {

// Owns an open gzFile.
struct GzFile {
  gzFile f{nullptr};
  explicit GzFile(const char* path) {
    f = gzopen(path, "rb");
    if (!f) {
      throw std::runtime_error(std::string("gzopen failed for: ") + path);
    }
  }
  ~GzFile() {
    if (f) gzclose(f);
  }
  GzFile(const GzFile&) = delete;
  GzFile& operator=(const GzFile&) = delete;
};

/* -----------------------------
 * gzgets() truncates when line > buffer; accumulate until '\n' or EOF.
 * Throws on a zlib stream error so a corrupt file is never mistaken for EOF.
 * ----------------------------- */
bool gz_readline(gzFile f, std::string& out) {
  out.clear();
  char buf[8192];

  while (true) {
    char* res = gzgets(f, buf, static_cast<int>(sizeof(buf)));
    if (!res) {
      int errnum = Z_OK;
      const char* msg = gzerror(f, &errnum);
      if (errnum != Z_OK && errnum != Z_BUF_ERROR) {
        throw std::runtime_error(std::string("gzip read error: ") + msg);
      }
      return !out.empty();
    }
    out.append(res);

    if (!out.empty() && out.back() == '\n') {
      while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
      return true;
    }
  }
}

/* -----------------------------
 * CSV tokenizer; views point into `line`. No quoted fields.
 * ----------------------------- */
void split_csv_views(const std::string& line, std::vector<std::string_view>& fields) {
  fields.clear();

  const char* s = line.data();
  const std::size_t n = line.size();

  std::size_t start = 0;
  for (std::size_t i = 0; i <= n; ++i) {
    if (i == n || line[i] == ',') {
      fields.emplace_back(s + start, i - start);
      start = i + 1;
    }
  }
}

bool parse_i64(std::string_view sv, std::int64_t& out) {
  if (sv.empty()) return false;
  const char* b = sv.data();
  const char* e = b + sv.size();
  auto res = std::from_chars(b, e, out, 10);
  return res.ec == std::errc{} && res.ptr == e;
}

bool parse_u64(std::string_view sv, std::uint64_t& out) {
  if (sv.empty()) return false;
  const char* b = sv.data();
  const char* e = b + sv.size();
  auto res = std::from_chars(b, e, out, 10);
  return res.ec == std::errc{} && res.ptr == e;
}

// Decimal digits after the point that `scale` (a power of ten) can hold.
int scale_digits(std::int64_t scale) {
  int d = 0;
  while (scale > 1) {
    scale /= 10;
    ++d;
  }
  return d;
}

// Decimal -> value_q, exact. fast_float vets the token; the integer and
// fractional digits are then scaled in integer arithmetic. Negative,
// non-finite, exponent-form and out-of-range inputs fail, as do inputs with
// more fractional digits than `scale` holds.
bool parse_fixed(std::string_view sv, std::int64_t scale, std::int64_t& out) {
  if (sv.empty()) return false;

  double v = 0.0;
  const char* b = sv.data();
  const char* e = b + sv.size();

  auto r = fast_float::from_chars(b, e, v);
  if (r.ec != std::errc{} || r.ptr != e) return false;
  if (!std::isfinite(v) || v < 0.0) return false;

  const std::size_t dot = sv.find('.');
  const std::string_view int_part = sv.substr(0, dot);
  const std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : sv.substr(dot + 1);

  std::int64_t whole = 0;
  if (!int_part.empty() && !(int_part.size() == 2 && int_part == "-0")) {
    if (!parse_i64(int_part, whole) || whole < 0) return false;
  }

  const int max_frac = scale_digits(scale);
  if (static_cast<int>(frac_part.size()) > max_frac) return false;

  std::int64_t frac = 0;
  if (!frac_part.empty()) {
    if (frac_part.front() < '0' || frac_part.front() > '9') return false;
    if (!parse_i64(frac_part, frac)) return false;
  }
  for (int i = static_cast<int>(frac_part.size()); i < max_frac; ++i) frac *= 10;

  std::int64_t scaled = 0;
  if (math::mul_i64_overflow(whole, scale, &scaled)) return false;
  if (math::add_i64_overflow(scaled, frac, &out)) return false;
  return true;
}

int find_col(const std::vector<std::string_view>& header, std::string_view name) {
  for (int i = 0; i < static_cast<int>(header.size()); ++i) {
    if (header[i] == name) return i;
  }
  return -1;
}

struct ColumnMap {
  int ts_ns{-1};
  int op{-1};
  int caller{-1};
  int asset{-1};
  int amount{-1};
  int aux{-1};
  int account{-1};
};

ColumnMap build_column_map(const std::vector<std::string_view>& header) {
  ColumnMap m{};
  m.ts_ns   = find_col(header, "ts_ns");
  m.op      = find_col(header, "op");
  m.caller  = find_col(header, "caller");
  m.asset   = find_col(header, "asset");
  m.amount  = find_col(header, "amount");
  m.aux     = find_col(header, "aux");
  m.account = find_col(header, "account");

  if (m.ts_ns < 0) throw std::runtime_error("Missing required column: ts_ns");
  if (m.op < 0) throw std::runtime_error("Missing required column: op");
  if (m.caller < 0) throw std::runtime_error("Missing required column: caller");
  return m;
}

std::string_view field_or_empty(const std::vector<std::string_view>& row, int col) {
  if (col < 0 || col >= static_cast<int>(row.size())) return {};
  return row[col];
}

/* -----------------------------
 * Parse a CSV row into an OpRecord. Returns false if the row is invalid.
 * Policy:
 * - ts_ns, op, caller must parse
 * - optional fields: empty -> 0, present but malformed -> invalid row
 * ----------------------------- */
bool parse_row_to_record(const std::vector<std::string_view>& row, const ColumnMap& cm, OpRecord& rec) {
  rec = OpRecord{};

  std::int64_t ts = 0;
  if (!parse_i64(field_or_empty(row, cm.ts_ns), ts) || ts < 0) return false;
  rec.ts_ns = ts;

  Op op{};
  if (!parse_op(std::string(field_or_empty(row, cm.op)), op)) return false;
  rec.op = static_cast<std::uint8_t>(op);

  if (!parse_u64(field_or_empty(row, cm.caller), rec.caller)) return false;

  const std::string_view asset = field_or_empty(row, cm.asset);
  if (!asset.empty() && !parse_u64(asset, rec.asset)) return false;

  const std::string_view account = field_or_empty(row, cm.account);
  if (!account.empty() && !parse_u64(account, rec.account)) return false;

  const std::string_view amount = field_or_empty(row, cm.amount);
  if (!amount.empty() && !parse_fixed(amount, kValueScale, rec.amount_q)) return false;

  const std::string_view aux = field_or_empty(row, cm.aux);
  if (!aux.empty() && !parse_fixed(aux, kValueScale, rec.aux_q)) return false;

  return true;
}

} // namespace

ConvertStats convert(const std::string& input_path, const std::string& output_path) {
  const fs::path in(input_path);
  if (!fs::exists(in)) {
    throw std::runtime_error("Input not found: " + in.string());
  }

  GzFile gz(in.string().c_str());
  Writer writer(output_path);

  std::string line;
  std::vector<std::string_view> fields;
  fields.reserve(16);
  if (!gz_readline(gz.f, line)) {
    throw std::runtime_error("Input appears empty (no CSV header): " + in.string());
  }
  split_csv_views(line, fields);
  const ColumnMap cm = build_column_map(fields);

  ConvertStats stats{};
  OpRecord rec{};
  std::int64_t last_ts = 0;
  const std::uint64_t log_every = 1'000'000;

  while (gz_readline(gz.f, line)) {
    if (line.empty()) continue;
    split_csv_views(line, fields);

    if (!parse_row_to_record(fields, cm, rec)) {
      ++stats.bad_rows;
      continue;
    }

    // The house clock never runs backwards; an out-of-order row would be
    // applied at the wrong time.
    if (rec.ts_ns < last_ts) {
      ++stats.bad_rows;
      continue;
    }
    last_ts = rec.ts_ns;

    writer.append(rec);
    ++stats.records;
    if (stats.records % log_every == 0) {
      std::cerr << "[INFO] records_written=" << stats.records << " bad_rows=" << stats.bad_rows << "\n";
    }
  }

  writer.close();

  std::cerr << "[OK] Converted " << stats.records << " records"
            << " (bad_rows=" << stats.bad_rows << ") -> " << output_path << "\n";
  return stats;
}

} // namespace auction::journal
