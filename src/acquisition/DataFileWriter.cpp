#include "mercury-itc/acquisition/DataFileWriter.hpp"
#include "mercury-itc/Errors.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace mercuryitc {
namespace acquisition {

std::string DataFileWriter::format_header(const std::string &header) {
  std::ostringstream out;
  std::istringstream in(header);
  std::string line;
  while (std::getline(in, line)) {
    out << '#' << line << '\n';
  }
  return out.str();
}

std::string DataFileWriter::format_row(const DataRow &row) {
  std::string out;
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0) {
      out += ' ';
    }
    out += fmt::format("{:.6e}", row[i]);
  }
  return out;
}

void DataFileWriter::write(const std::string &path, const std::string &header,
                           const std::vector<DataRow> &rows) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file) {
    throw ItcError("Cannot open data file for writing: " + path);
  }

  file << format_header(header);
  for (const auto &row : rows) {
    file << format_row(row) << '\n';
  }

  file.flush();
  if (!file) {
    throw ItcError("Failed writing data file: " + path);
  }
}

std::vector<DataRow>
DataFileWriter::select_columns(const std::vector<DataRow> &rows,
                               const std::vector<size_t> &columns) {
  std::vector<DataRow> out;
  out.reserve(rows.size());
  for (const auto &row : rows) {
    DataRow selected;
    selected.reserve(columns.size());
    for (size_t col : columns) {
      selected.push_back(row.at(col));
    }
    out.push_back(std::move(selected));
  }
  return out;
}

double DataFileWriter::column_min(const std::vector<DataRow> &rows,
                                  size_t column) {
  double result = std::numeric_limits<double>::infinity();
  for (const auto &row : rows) {
    result = std::min(result, row.at(column));
  }
  return result;
}

double DataFileWriter::column_max(const std::vector<DataRow> &rows,
                                  size_t column) {
  double result = -std::numeric_limits<double>::infinity();
  for (const auto &row : rows) {
    result = std::max(result, row.at(column));
  }
  return result;
}

} // namespace acquisition
} // namespace mercuryitc
