#include <algorithm>
#include <string>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

int LabelFormat::min_columns() const
{
  return std::max({class_id, xmin, ymin, xmax, ymax}) + 1;
}

LabelSet::LabelSet()
: data(0, LabelFormat().min_columns()), format()
{
}

LabelSet::LabelSet(const cv::Mat1f & data, const LabelFormat & format)
: data(data), format(format)
{
  if (data.rows > 0 && data.cols < format.min_columns()) {
    throw TypeMismatch("Label format needs " + std::to_string(format.min_columns()) +
      " columns, but labels have " + std::to_string(data.cols));
  }
  if (data.rows == 0 && data.cols < format.min_columns()) {
    this->data = cv::Mat1f(0, format.min_columns());
  }
}

LabelSet LabelSet::from_rows(const std::vector<std::array<float, 5>> & rows)
{
  cv::Mat1f data(static_cast<int>(rows.size()), 5);
  for (size_t i = 0; i < rows.size(); ++i) {
    for (int j = 0; j < 5; ++j) {
      data(static_cast<int>(i), j) = rows[i][j];
    }
  }
  return LabelSet(data);
}

cv::Rect2f LabelSet::box(int row) const
{
  float xmin = data(row, format.xmin);
  float ymin = data(row, format.ymin);
  float xmax = data(row, format.xmax);
  float ymax = data(row, format.ymax);
  return cv::Rect2f(xmin, ymin, xmax - xmin, ymax - ymin);
}

void LabelSet::set_box(int row, float xmin, float ymin, float xmax, float ymax)
{
  data(row, format.xmin) = xmin;
  data(row, format.ymin) = ymin;
  data(row, format.xmax) = xmax;
  data(row, format.ymax) = ymax;
}

LabelSet LabelSet::clone() const
{
  LabelSet copy;
  copy.data = data.clone();
  copy.format = format;
  return copy;
}

LabelSet LabelSet::select_rows(const std::vector<int> & rows) const
{
  LabelSet subset;
  subset.format = format;
  subset.data = cv::Mat1f(static_cast<int>(rows.size()), data.cols);
  for (size_t i = 0; i < rows.size(); ++i) {
    data.row(rows[i]).copyTo(subset.data.row(static_cast<int>(i)));
  }
  return subset;
}

bool BoundPair::contains(float value) const
{
  if (lower && value < *lower) {
    return false;
  }
  if (upper && value > *upper) {
    return false;
  }
  return true;
}

} // namespace ssd_augmentation
