#include "mercury-itc/Errors.hpp"
#include "mercury-itc/acquisition/DataFileWriter.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace mercuryitc;
using namespace mercuryitc::acquisition;

namespace {

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

TEST(DataFileWriter, FormatRow) {
  EXPECT_EQ(DataFileWriter::format_row({1.5, -0.00025, 293.15}),
            "1.500000e+00 -2.500000e-04 2.931500e+02");
  EXPECT_EQ(DataFileWriter::format_row({}), "");
}

TEST(DataFileWriter, FormatHeaderPrefixesEveryLine) {
  EXPECT_EQ(DataFileWriter::format_header("Temperature (K)\nExcitation: 7mV"),
            "#Temperature (K)\n#Excitation: 7mV\n");
  EXPECT_EQ(DataFileWriter::format_header("Time\tT1"), "#Time\tT1\n");
}

TEST(DataFileWriter, WriteRewritesFile) {
  auto path = std::filesystem::temp_directory_path() / "mercury_itc_table.txt";

  DataFileWriter::write(path.string(), "Time\tT1", {{0.0, 4.2}});
  DataFileWriter::write(path.string(), "Time\tT1", {{0.0, 4.2}, {1.0, 4.3}});

  EXPECT_EQ(read_file(path), "#Time\tT1\n"
                             "0.000000e+00 4.200000e+00\n"
                             "1.000000e+00 4.300000e+00\n");
  std::filesystem::remove(path);
}

TEST(DataFileWriter, WriteToMissingDirectoryThrows) {
  EXPECT_THROW(DataFileWriter::write("/nonexistent/dir/table.txt", "x", {}),
               ItcError);
}

TEST(DataFileWriter, SelectColumns) {
  std::vector<DataRow> rows{{1, 2, 3, 4}, {5, 6, 7, 8}};
  auto selected = DataFileWriter::select_columns(rows, {3, 0});
  ASSERT_EQ(selected.size(), 2u);
  EXPECT_EQ(selected[0], (DataRow{4, 1}));
  EXPECT_EQ(selected[1], (DataRow{8, 5}));
}

TEST(DataFileWriter, ColumnExtremes) {
  std::vector<DataRow> rows{{0, 4.2}, {1, 1.6}, {2, 3.9}};
  EXPECT_DOUBLE_EQ(DataFileWriter::column_min(rows, 1), 1.6);
  EXPECT_DOUBLE_EQ(DataFileWriter::column_max(rows, 1), 4.2);
}
