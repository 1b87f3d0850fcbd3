#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>
#include <optional>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>


namespace ssd_augmentation
{
/**
 * @brief Column layout of a label set
 * @details States which column of the label matrix holds which field.
 *          The default layout is [class_id, xmin, ymin, xmax, ymax].
 */
struct LabelFormat
{
  int class_id;
  int xmin;
  int ymin;
  int xmax;
  int ymax;

  LabelFormat()
  : class_id(0), xmin(1), ymin(2), xmax(3), ymax(4) {}

  LabelFormat(int class_id_col, int xmin_col, int ymin_col, int xmax_col, int ymax_col)
  : class_id(class_id_col), xmin(xmin_col), ymin(ymin_col), xmax(xmax_col), ymax(ymax_col) {}

  /**
   * @brief Smallest number of columns a label matrix needs for this layout
   */
  int min_columns() const;
};

/**
 * @brief Box annotations of one image
 * @details One row per box, columns as stated by the format. Rows are
 *          only ever removed, never reordered.
 */
struct LabelSet
{
  cv::Mat1f data;      ///< Label matrix, one row per box
  LabelFormat format;  ///< Column layout of data

  /**
   * @brief Empty label set in the default layout
   */
  LabelSet();

  /**
   * @brief Wrap an existing label matrix
   * @throws TypeMismatch if data has fewer columns than the format needs
   */
  explicit LabelSet(const cv::Mat1f & data, const LabelFormat & format = LabelFormat());

  /**
   * @brief Build a label set in the default layout from [class_id, xmin, ymin, xmax, ymax] rows
   */
  static LabelSet from_rows(const std::vector<std::array<float, 5>> & rows);

  int size() const { return data.rows; }
  bool empty() const { return data.rows == 0; }

  // Box of a row in corner coordinates
  cv::Rect2f box(int row) const;

  // Overwrite the corner coordinates of a row
  void set_box(int row, float xmin, float ymin, float xmax, float ymax);

  // Deep copy
  LabelSet clone() const;

  // Subset of rows, in the given order
  LabelSet select_rows(const std::vector<int> & rows) const;
};

/**
 * @brief Lower and upper overlap bounds
 * @details An absent endpoint leaves that side unconstrained.
 */
struct BoundPair
{
  std::optional<float> lower;
  std::optional<float> upper;

  BoundPair() = default;
  BoundPair(std::optional<float> lower_bound, std::optional<float> upper_bound)
  : lower(lower_bound), upper(upper_bound) {}

  // lower <= value <= upper, ignoring absent endpoints
  bool contains(float value) const;
};

/**
 * @brief An image together with its labels
 * @details The value every augmentation stage consumes and returns.
 */
struct Sample
{
  cv::Mat image;    ///< HxWxC image, 8-bit or 32-bit float
  LabelSet labels;  ///< Boxes in absolute pixel coordinates of image
};

} // namespace ssd_augmentation
