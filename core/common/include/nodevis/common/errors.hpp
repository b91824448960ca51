#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace nodevis {

// Location of a dataset problem. Rows are 1-based source rows (the header is
// row 1 for CSV/XLSX); columns are source column names.
struct ErrorContext {
  std::filesystem::path path;
  std::optional<std::size_t> row;
  std::optional<std::string> column;
  std::optional<int> node_id;
};

class DatasetError : public std::runtime_error {
 public:
  DatasetError(const std::string& message, ErrorContext context);

  const ErrorContext& context() const;
  const std::filesystem::path& path() const;
  std::optional<std::size_t> row() const;
  const std::optional<std::string>& column() const;
  std::optional<int> node_id() const;

 private:
  ErrorContext context_;
};

class DataFormatError : public DatasetError {
 public:
  using DatasetError::DatasetError;
};

class TooManyNodesError : public DatasetError {
 public:
  TooManyNodesError(std::size_t detected, std::size_t limit, ErrorContext context);

  std::size_t detected() const;
  std::size_t limit() const;

 private:
  std::size_t detected_ = 0;
  std::size_t limit_ = 0;
};

class InvalidQuaternionError : public DatasetError {
 public:
  InvalidQuaternionError(double norm, ErrorContext context);

  double norm() const;

 private:
  double norm_ = 0.0;
};

class EmptyDatasetError : public DatasetError {
 public:
  using DatasetError::DatasetError;
};

class RaggedSeriesError : public DatasetError {
 public:
  using DatasetError::DatasetError;
};

}  // namespace nodevis
