#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "nodevis/common/errors.hpp"
#include "nodevis/io/dataset_loader.hpp"
#include "nodevis/io/orientation_dataset.hpp"
#include "nodevis/io/table_parsing.hpp"

namespace {

std::filesystem::path DataPath(const std::string& name) {
  return std::filesystem::path(NODEVIS_TEST_DATA_DIR) / "data" / name;
}

std::filesystem::path WriteTempFile(const std::string& name, const std::string& contents) {
  const auto directory = std::filesystem::temp_directory_path() / "nodevis_loader_test";
  std::filesystem::create_directories(directory);
  const auto path = directory / name;
  std::ofstream out(path, std::ios::trunc);
  out << contents;
  return path;
}

std::string QuatHeader(int node_id) {
  std::string header;
  for (int component = 1; component <= 4; ++component) {
    if (!header.empty()) {
      header += ",";
    }
    header += "Quat" + std::to_string(component) + "_" + std::to_string(node_id) + "_SENSOR";
  }
  return header;
}

void ExpectQuatNear(const cv::Quatd& actual, double w, double x, double y, double z) {
  EXPECT_NEAR(actual.w, w, 1e-9);
  EXPECT_NEAR(actual.x, x, 1e-9);
  EXPECT_NEAR(actual.y, y, 1e-9);
  EXPECT_NEAR(actual.z, z, 1e-9);
}

}  // namespace

TEST(DatasetLoaderTest, LoadsCsvWithGapInNodeIds) {
  const nodevis::io::Dataset dataset = nodevis::io::LoadDataset(DataPath("nodes_1_3.csv"));

  EXPECT_EQ(dataset.format, nodevis::io::DataFormat::kCsv);
  ASSERT_EQ(dataset.series.size(), 2);
  EXPECT_EQ(dataset.series[0].node_id, 1);
  EXPECT_EQ(dataset.series[1].node_id, 3);
  EXPECT_EQ(dataset.series[0].name, "1_SENSOR");
  EXPECT_EQ(dataset.frame_count, 100);
  for (const auto& series : dataset.series) {
    EXPECT_EQ(series.frame_count(), dataset.frame_count);
  }
  EXPECT_EQ(dataset.FindSeries(2), nullptr);
  ASSERT_NE(dataset.FindSeries(3), nullptr);

  ASSERT_TRUE(dataset.time_column.has_value());
  ASSERT_EQ(dataset.time_column->size(), 100);
  EXPECT_NEAR(dataset.time_column->at(99), 0.99, 1e-12);
}

TEST(DatasetLoaderTest, PreservesRowOrderAndNormalizes) {
  const nodevis::io::Dataset dataset = nodevis::io::LoadDataset(DataPath("nodes_1_3.csv"));

  const double half_angle = (10.0 * CV_PI / 180.0) / 2.0;
  ExpectQuatNear(dataset.series[0].rotations[10], std::cos(half_angle), 0.0, 0.0, std::sin(half_angle));

  // Node 3 is stored at twice unit length.
  const double node3_half_angle = (20.0 * CV_PI / 180.0) / 2.0;
  ExpectQuatNear(dataset.series[1].rotations[10], std::cos(node3_half_angle), std::sin(node3_half_angle), 0.0, 0.0);
  for (const auto& rotation : dataset.series[1].rotations) {
    EXPECT_NEAR(rotation.norm(), 1.0, 1e-12);
  }
}

TEST(DatasetLoaderTest, LoadsStoAndExcludesTimeColumn) {
  const nodevis::io::Dataset dataset = nodevis::io::LoadDataset(DataPath("four_imus.sto"));

  EXPECT_EQ(dataset.format, nodevis::io::DataFormat::kSto);
  ASSERT_EQ(dataset.series.size(), 4);
  EXPECT_EQ(dataset.frame_count, 12);
  for (std::size_t index = 0; index < dataset.series.size(); ++index) {
    EXPECT_EQ(dataset.series[index].node_id, static_cast<int>(index) + 1);
    EXPECT_NE(dataset.series[index].name, "time");
  }
  EXPECT_EQ(dataset.series[0].name, "pelvis_imu");
  EXPECT_EQ(dataset.series[3].name, "femur_l_imu");

  ASSERT_TRUE(dataset.frame_rate_hz.has_value());
  EXPECT_DOUBLE_EQ(*dataset.frame_rate_hz, 60.0);
  ASSERT_TRUE(dataset.time_column.has_value());
  EXPECT_EQ(dataset.time_column->size(), 12);

  const double half_angle = (2.0 * 5.0 * CV_PI / 180.0) / 2.0;
  ExpectQuatNear(dataset.series[1].rotations[5], std::cos(half_angle), 0.0, std::sin(half_angle), 0.0);
}

TEST(DatasetLoaderTest, LoadsCommaDelimitedStoWithSpaceSeparatedComponents) {
  const auto path = WriteTempFile("comma_columns.sto",
                                  "time,left,right\n"
                                  "0.0,1 0 0 0,0 0 0 2\n"
                                  "0.1,0 1 0 0,0 0 2 0\n");
  const nodevis::io::Dataset dataset = nodevis::io::LoadDataset(path);

  ASSERT_EQ(dataset.series.size(), 2);
  EXPECT_EQ(dataset.frame_count, 2);
  ExpectQuatNear(dataset.series[1].rotations[0], 0.0, 0.0, 0.0, 1.0);
  ExpectQuatNear(dataset.series[1].rotations[1], 0.0, 0.0, 1.0, 0.0);
}

TEST(DatasetLoaderTest, ZeroNormQuaternionReportsRowAndNode) {
  try {
    nodevis::io::LoadDataset(DataPath("zero_norm.csv"));
    FAIL() << "Expected InvalidQuaternionError";
  } catch (const nodevis::InvalidQuaternionError& ex) {
    ASSERT_TRUE(ex.row().has_value());
    EXPECT_EQ(*ex.row(), 4);
    ASSERT_TRUE(ex.node_id().has_value());
    EXPECT_EQ(*ex.node_id(), 2);
    EXPECT_LT(ex.norm(), 1e-9);
    EXPECT_NE(std::string(ex.what()).find("node 2"), std::string::npos);
  }
}

TEST(DatasetLoaderTest, RejectsMoreThanEightNodes) {
  std::string header;
  std::string row;
  for (int node_id = 1; node_id <= 9; ++node_id) {
    header += (node_id == 1 ? "" : ",") + QuatHeader(node_id);
    row += std::string(node_id == 1 ? "" : ",") + "1,0,0,0";
  }
  const auto path = WriteTempFile("nine_nodes.csv", header + "\n" + row + "\n");

  try {
    nodevis::io::LoadDataset(path);
    FAIL() << "Expected TooManyNodesError";
  } catch (const nodevis::TooManyNodesError& ex) {
    EXPECT_EQ(ex.detected(), 9);
    EXPECT_EQ(ex.limit(), nodevis::io::kMaxNodes);
  }
}

TEST(DatasetLoaderTest, BlankQuaternionCellsFailTheLoad) {
  const auto path = WriteTempFile("blank_tail.csv",
                                  "Time," + QuatHeader(1) + "\n"
                                  "0.00,1,0,0,0\n"
                                  "0.01,1,0,0,0\n"
                                  "0.02,,,,\n");
  try {
    nodevis::io::LoadDataset(path);
    FAIL() << "Expected DataFormatError";
  } catch (const nodevis::DataFormatError& ex) {
    EXPECT_EQ(ex.row(), std::optional<std::size_t>(4));
    EXPECT_EQ(ex.column(), std::optional<std::string>("Quat1_1_SENSOR"));
    EXPECT_EQ(ex.node_id(), std::optional<int>(1));
  }
}

TEST(DatasetLoaderTest, OneNodeEndingEarlyFailsTheLoad) {
  const auto path = WriteTempFile("one_node_short.csv",
                                  QuatHeader(1) + "," + QuatHeader(2) + "\n"
                                  "1,0,0,0,1,0,0,0\n"
                                  "1,0,0,0,,,,\n");
  try {
    nodevis::io::LoadDataset(path);
    FAIL() << "Expected DataFormatError";
  } catch (const nodevis::DataFormatError& ex) {
    EXPECT_EQ(ex.row(), std::optional<std::size_t>(3));
    EXPECT_EQ(ex.node_id(), std::optional<int>(2));
  }
}

TEST(DatasetLoaderTest, FrameCountMatchesDataRows) {
  const auto path = WriteTempFile("with_empty_lines.csv",
                                  QuatHeader(1) + "\n"
                                  "1,0,0,0\n"
                                  "\n"
                                  ",,,\n"
                                  "0,1,0,0\n");
  const nodevis::io::Dataset dataset = nodevis::io::LoadDataset(path);
  EXPECT_EQ(dataset.frame_count, 2);
}

TEST(DatasetLoaderTest, SeriesOfDifferentLengthsAreRagged) {
  std::vector<nodevis::io::SensorSeries> series = {{1, "1_SENSOR", {}}, {2, "2_SENSOR", {}}};
  nodevis::io::SeriesAssembler assembler("assembled.csv", std::move(series));
  assembler.Append(0, cv::Quatd(1.0, 0.0, 0.0, 0.0));
  assembler.Append(0, cv::Quatd(1.0, 0.0, 0.0, 0.0));
  assembler.Append(1, cv::Quatd(1.0, 0.0, 0.0, 0.0));
  EXPECT_THROW(assembler.Finish(), nodevis::RaggedSeriesError);
}

TEST(DatasetLoaderTest, HugeQuaternionComponentsAreNormalized) {
  const auto path = WriteTempFile("huge.csv", QuatHeader(1) + "\n1e200,1e200,0,0\n");
  const nodevis::io::Dataset dataset = nodevis::io::LoadDataset(path);
  const double half_root = std::sqrt(0.5);
  ExpectQuatNear(dataset.series[0].rotations[0], half_root, half_root, 0.0, 0.0);
}

TEST(DatasetLoaderTest, NodeIdOutOfRangeIsAFormatError) {
  const auto path = WriteTempFile("huge_id.csv",
                                  "Quat1_99999999999_SENSOR,Quat2_99999999999_SENSOR,"
                                  "Quat3_99999999999_SENSOR,Quat4_99999999999_SENSOR\n"
                                  "1,0,0,0\n");
  try {
    nodevis::io::LoadDataset(path);
    FAIL() << "Expected DataFormatError";
  } catch (const nodevis::DataFormatError& ex) {
    EXPECT_EQ(ex.row(), std::optional<std::size_t>(1));
    EXPECT_EQ(ex.column(), std::optional<std::string>("Quat1_99999999999_SENSOR"));
  }
}

TEST(DatasetLoaderTest, UnparseableCellCarriesRowAndColumn) {
  const auto path = WriteTempFile("bad_cell.csv",
                                  QuatHeader(1) + "\n"
                                  "1,0,0,0\n"
                                  "1,zero,0,0\n");
  try {
    nodevis::io::LoadDataset(path);
    FAIL() << "Expected DataFormatError";
  } catch (const nodevis::DataFormatError& ex) {
    EXPECT_EQ(ex.row(), std::optional<std::size_t>(3));
    ASSERT_TRUE(ex.column().has_value());
    EXPECT_EQ(*ex.column(), "Quat2_1_SENSOR");
  }
}

TEST(DatasetLoaderTest, MissingHeaderPatternIsAFormatError) {
  const auto path = WriteTempFile("no_quats.csv", "a,b,c\n1,2,3\n");
  EXPECT_THROW(nodevis::io::LoadDataset(path), nodevis::DataFormatError);
}

TEST(DatasetLoaderTest, IncompleteColumnGroupIsSkipped) {
  const auto path = WriteTempFile("partial.csv",
                                  QuatHeader(1) + ",Quat1_2_SENSOR,Quat2_2_SENSOR\n"
                                  "1,0,0,0,1,0\n");
  const nodevis::io::Dataset dataset = nodevis::io::LoadDataset(path);
  ASSERT_EQ(dataset.series.size(), 1);
  EXPECT_EQ(dataset.series[0].node_id, 1);
}

TEST(DatasetLoaderTest, HeaderOnlyIsEmptyDataset) {
  const auto path = WriteTempFile("header_only.csv", QuatHeader(1) + "\n");
  EXPECT_THROW(nodevis::io::LoadDataset(path), nodevis::EmptyDatasetError);
}

TEST(DatasetLoaderTest, StoCellWithWrongComponentCountIsAFormatError) {
  const auto path = WriteTempFile("three_components.sto",
                                  "endheader\n"
                                  "time\tpelvis_imu\n"
                                  "0.0\t1,0,0\n");
  try {
    nodevis::io::LoadDataset(path);
    FAIL() << "Expected DataFormatError";
  } catch (const nodevis::DataFormatError& ex) {
    EXPECT_EQ(ex.row(), std::optional<std::size_t>(3));
    EXPECT_EQ(ex.column(), std::optional<std::string>("pelvis_imu"));
  }
}

TEST(DatasetLoaderTest, StoBlankCellFailsTheLoad) {
  const auto path = WriteTempFile("blank_cell.sto",
                                  "endheader\n"
                                  "time\tpelvis_imu\ttorso_imu\n"
                                  "0.0\t1,0,0,0\t1,0,0,0\n"
                                  "0.1\t1,0,0,0\t \n");
  try {
    nodevis::io::LoadDataset(path);
    FAIL() << "Expected DataFormatError";
  } catch (const nodevis::DataFormatError& ex) {
    EXPECT_EQ(ex.row(), std::optional<std::size_t>(4));
    EXPECT_EQ(ex.column(), std::optional<std::string>("torso_imu"));
    EXPECT_EQ(ex.node_id(), std::optional<int>(2));
  }
}

TEST(DatasetLoaderTest, StoWithNineNodeColumnsIsRejected) {
  std::string header = "time";
  std::string row = "0";
  for (int index = 0; index < 9; ++index) {
    header += "\timu" + std::to_string(index);
    row += "\t1,0,0,0";
  }
  const auto path = WriteTempFile("nine.sto", header + "\n" + row + "\n");
  EXPECT_THROW(nodevis::io::LoadDataset(path), nodevis::TooManyNodesError);
}

TEST(DatasetLoaderTest, DetectsFormatFromContentWhenExtensionIsUnknown) {
  const auto csv = WriteTempFile("recording.txt", QuatHeader(1) + "\n1,0,0,0\n");
  EXPECT_EQ(nodevis::io::DetectFormat(csv), nodevis::io::DataFormat::kCsv);

  const auto sto = WriteTempFile("recording.dat", "endheader\ntime\timu\n0\t1,0,0,0\n");
  EXPECT_EQ(nodevis::io::DetectFormat(sto), nodevis::io::DataFormat::kSto);

  const auto junk = WriteTempFile("recording.bin", "hello\nworld\n");
  EXPECT_THROW(nodevis::io::DetectFormat(junk), nodevis::DataFormatError);

  EXPECT_EQ(nodevis::io::DetectFormat("whatever.XLSX"), nodevis::io::DataFormat::kXlsx);
}

TEST(DatasetLoaderTest, LoadsXlsxLikeTheEquivalentCsv) {
  const nodevis::io::Dataset workbook = nodevis::io::LoadDataset(DataPath("nodes_1_3.xlsx"));
  const nodevis::io::Dataset csv = nodevis::io::LoadDataset(DataPath("nodes_1_3.csv"));

  EXPECT_EQ(workbook.format, nodevis::io::DataFormat::kXlsx);
  ASSERT_EQ(workbook.series.size(), 2);
  EXPECT_EQ(workbook.node_ids(), csv.node_ids());
  EXPECT_EQ(workbook.frame_count, 20);
  for (std::size_t node = 0; node < workbook.series.size(); ++node) {
    for (std::size_t frame = 0; frame < workbook.frame_count; ++frame) {
      const auto& expected = csv.series[node].rotations[frame];
      ExpectQuatNear(workbook.series[node].rotations[frame], expected.w, expected.x, expected.y, expected.z);
    }
  }
}

TEST(DatasetLoaderTest, MissingFileIsAFormatError) {
  EXPECT_THROW(nodevis::io::LoadDataset(DataPath("does_not_exist.csv")), nodevis::DataFormatError);
}
