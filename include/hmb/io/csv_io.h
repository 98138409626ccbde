#pragma once
// hmb/io/csv_io.h
//
// CSV for report tables (runs.csv, summary.csv, <bench>_export.csv).
// A cell is quoted only when it contains the separator, a quote or a line
// break; embedded quotes are doubled. Rows end with '\n'.

#include "hmb/core/error.h"
#include "hmb/core/types.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace hmb {
namespace csv {

inline constexpr char kQuote = '"';

inline std::string EscapeCell(std::string_view cell, char sep = ',') {
  if (cell.find_first_of(std::string{sep, kQuote, '\n', '\r'}) == std::string_view::npos) {
    return std::string(cell);
  }
  std::string out(1, kQuote);
  for (char c : cell) {
    out.push_back(c);
    if (c == kQuote) out.push_back(kQuote);
  }
  out.push_back(kQuote);
  return out;
}

class Writer {
 public:
  explicit Writer(char sep = ',') : sep_(sep) {}

  // Truncates `path`. StoreError when it cannot be opened.
  bool Open(const std::filesystem::path& path, Error* err = nullptr) {
    path_ = path;
    out_.open(path, std::ios::out | std::ios::trunc);
    if (!out_) {
      SetErr(err, ErrorKind::Store, "cannot open " + path.string() + " for writing");
      return false;
    }
    return true;
  }

  bool WriteRow(const std::vector<std::string>& cells, Error* err = nullptr) {
    if (!out_.is_open()) {
      SetErr(err, ErrorKind::Store, "CSV writer is not open");
      return false;
    }
    for (usize i = 0; i < cells.size(); ++i) {
      if (i) out_ << sep_;
      out_ << EscapeCell(cells[i], sep_);
    }
    out_ << '\n';
    if (!out_) {
      SetErr(err, ErrorKind::Store, "write failed: " + path_.string());
      return false;
    }
    ++rows_;
    return true;
  }

  usize RowsWritten() const noexcept { return rows_; }

 private:
  char sep_;
  std::filesystem::path path_;
  std::ofstream out_;
  usize rows_ = 0;
};

// Reads one row back (tests, tools). Quoted cells may contain the separator
// and doubled quotes but not line breaks.
inline std::vector<std::string> SplitRow(std::string_view line, char sep = ',') {
  std::vector<std::string> cells(1);
  bool quoted = false;
  for (usize i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c != kQuote) {
        cells.back().push_back(c);
      } else if (i + 1 < line.size() && line[i + 1] == kQuote) {
        cells.back().push_back(kQuote);
        ++i;
      } else {
        quoted = false;
      }
    } else if (c == kQuote) {
      quoted = true;
    } else if (c == sep) {
      cells.emplace_back();
    } else {
      cells.back().push_back(c);
    }
  }
  return cells;
}

}  // namespace csv
}  // namespace hmb
