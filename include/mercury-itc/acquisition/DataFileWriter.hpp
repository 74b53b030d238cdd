#pragma once
#include "mercury-itc/export.h"
#include <string>
#include <vector>

namespace mercuryitc {
namespace acquisition {

using DataRow = std::vector<double>;

/// Plain-text numeric tables: '#'-prefixed header lines followed by one
/// row per line, values in %.6e separated by single spaces.
class MERCURY_ITC_API DataFileWriter {
public:
  /// Rewrite path with the full table. Throws ItcError on I/O failure.
  static void write(const std::string &path, const std::string &header,
                    const std::vector<DataRow> &rows);

  static std::string format_row(const DataRow &row);

  /// Header text with every line prefixed by '#'
  static std::string format_header(const std::string &header);

  /// Copy of the given columns, in the given order
  static std::vector<DataRow> select_columns(const std::vector<DataRow> &rows,
                                             const std::vector<size_t> &columns);

  static double column_min(const std::vector<DataRow> &rows, size_t column);
  static double column_max(const std::vector<DataRow> &rows, size_t column);
};

} // namespace acquisition
} // namespace mercuryitc
