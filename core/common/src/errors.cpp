#include "nodevis/common/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace nodevis {
namespace {

std::string WithContext(const std::string& message, const ErrorContext& context) {
  std::string located = message;
  if (!context.path.empty()) {
    located += fmt::format(" [file {}", context.path.string());
    if (context.row.has_value()) {
      located += fmt::format(", row {}", *context.row);
    }
    if (context.column.has_value()) {
      located += fmt::format(", column '{}'", *context.column);
    }
    if (context.node_id.has_value()) {
      located += fmt::format(", node {}", *context.node_id);
    }
    located += "]";
  }
  return located;
}

}  // namespace

DatasetError::DatasetError(const std::string& message, ErrorContext context)
    : std::runtime_error(WithContext(message, context)), context_(std::move(context)) {}

const ErrorContext& DatasetError::context() const {
  return context_;
}

const std::filesystem::path& DatasetError::path() const {
  return context_.path;
}

std::optional<std::size_t> DatasetError::row() const {
  return context_.row;
}

const std::optional<std::string>& DatasetError::column() const {
  return context_.column;
}

std::optional<int> DatasetError::node_id() const {
  return context_.node_id;
}

TooManyNodesError::TooManyNodesError(std::size_t detected, std::size_t limit, ErrorContext context)
    : DatasetError(fmt::format("Detected {} sensor nodes, at most {} are supported", detected, limit),
                   std::move(context)),
      detected_(detected),
      limit_(limit) {}

std::size_t TooManyNodesError::detected() const {
  return detected_;
}

std::size_t TooManyNodesError::limit() const {
  return limit_;
}

InvalidQuaternionError::InvalidQuaternionError(double norm, ErrorContext context)
    : DatasetError(fmt::format("Quaternion norm {:g} is too close to zero", norm), std::move(context)),
      norm_(norm) {}

double InvalidQuaternionError::norm() const {
  return norm_;
}

}  // namespace nodevis
