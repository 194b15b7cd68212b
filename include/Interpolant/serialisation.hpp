#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/archives/binary.hpp>
#include <cereal/archives/portable_binary.hpp>
#include <cereal/archives/json.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <Eigen/Dense>

namespace cereal {

// Saving an Eigen matrix when the archive supports BinaryData: dump the storage in one go.
template <class Archive, class Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols> inline
std::enable_if_t<traits::is_output_serializable<BinaryData<Scalar>, Archive>::value, void>
CEREAL_SAVE_FUNCTION_NAME(Archive& ar, Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> const& m) {
  uint64_t rows = m.rows();
  uint64_t cols = m.cols();
  ar(rows, cols);
  ar(binary_data(m.data(), static_cast<std::size_t>(m.size()) * sizeof(Scalar)));
}

template <class Archive, class Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols> inline
std::enable_if_t<traits::is_input_serializable<BinaryData<Scalar>, Archive>::value, void>
CEREAL_LOAD_FUNCTION_NAME(Archive& ar, Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>& m) {
  uint64_t rows, cols;
  ar(rows, cols);
  m.resize(rows, cols);
  ar(binary_data(m.data(), static_cast<std::size_t>(m.size()) * sizeof(Scalar)));
}

// Text archives (JSON): element by element, column major.
template <class Archive, class Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols> inline
std::enable_if_t<!traits::is_output_serializable<BinaryData<Scalar>, Archive>::value, void>
CEREAL_SAVE_FUNCTION_NAME(Archive& ar, Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> const& m) {
  uint64_t rows = m.rows();
  uint64_t cols = m.cols();
  ar(CEREAL_NVP_("rows", rows), CEREAL_NVP_("cols", cols));
  std::vector<Scalar> data(m.data(), m.data() + m.size());
  ar(CEREAL_NVP_("data", data));
}

template <class Archive, class Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols> inline
std::enable_if_t<!traits::is_input_serializable<BinaryData<Scalar>, Archive>::value, void>
CEREAL_LOAD_FUNCTION_NAME(Archive& ar, Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>& m) {
  uint64_t rows, cols;
  std::vector<Scalar> data;
  ar(CEREAL_NVP_("rows", rows), CEREAL_NVP_("cols", cols));
  ar(CEREAL_NVP_("data", data));
  if (data.size() != rows * cols) {
    throw Exception("Serialised matrix size does not match its shape.");
  }
  m.resize(rows, cols);
  std::copy(data.begin(), data.end(), m.data());
}

}
