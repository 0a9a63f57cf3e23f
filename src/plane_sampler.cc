//
// Created by lucius on 10/17/26.
//

#include "plane_sampler.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

MatPixelBuffer::MatPixelBuffer(std::vector<cv::Mat> planes) : planes_(std::move(planes)) {}

bool MatPixelBuffer::lock_read() {
  if (planes_.empty()) {
    return false;
  }
  lock_count_++;
  return true;
}

void MatPixelBuffer::unlock_read() {
  if (lock_count_ > 0) {
    lock_count_--;
  }
}

int MatPixelBuffer::width() const {
  return planes_.empty() ? 0 : planes_[0].cols;
}

int MatPixelBuffer::height() const {
  return planes_.empty() ? 0 : planes_[0].rows;
}

int MatPixelBuffer::plane_count() const {
  return static_cast<int>(planes_.size());
}

bool MatPixelBuffer::plane(int index, PlaneDesc &desc) const {
  if (lock_count_ == 0 or index < 0 or index >= plane_count()) {
    return false;
  }
  const auto &mat = planes_[index];
  if (mat.empty() or mat.dims != 2) {
    return false;
  }
  desc.base = mat.ptr<uint8_t>(0);
  desc.width = mat.cols;
  desc.height = mat.rows;
  desc.bytes_per_row = mat.step[0];
  desc.elem_size = mat.elemSize();
  return true;
}

std::shared_ptr<PixelBuffer> make_depth_buffer(const cv::Mat &depth) {
  if (depth.empty() or depth.type() != CV_32FC1) {
    BOOST_LOG_TRIVIAL(debug) << "depth plane must be CV_32FC1, got type " << depth.type();
    return nullptr;
  }
  return std::make_shared<MatPixelBuffer>(std::vector<cv::Mat>{depth});
}

std::shared_ptr<PixelBuffer> make_confidence_buffer(const cv::Mat &confidence) {
  if (confidence.empty() or confidence.type() != CV_8UC1) {
    BOOST_LOG_TRIVIAL(debug) << "confidence plane must be CV_8UC1, got type " << confidence.type();
    return nullptr;
  }
  return std::make_shared<MatPixelBuffer>(std::vector<cv::Mat>{confidence});
}

std::shared_ptr<PixelBuffer> make_nv12_buffer(const cv::Mat &nv12) {
  if (nv12.empty() or nv12.type() != CV_8UC1 or nv12.rows % 3 != 0 or nv12.cols % 2 != 0) {
    BOOST_LOG_TRIVIAL(debug) << "nv12 image must be CV_8UC1 with 3*h/2 rows and even width, got "
                             << nv12.cols << "x" << nv12.rows;
    return nullptr;
  }
  const int height = nv12.rows * 2 / 3;
  if (height % 2 != 0) {
    BOOST_LOG_TRIVIAL(debug) << "nv12 luma height must be even, got " << height;
    return nullptr;
  }
  cv::Mat packed = nv12.isContinuous() ? nv12 : nv12.clone();
  cv::Mat luma = packed.rowRange(0, height);
  cv::Mat chroma = packed.rowRange(height, packed.rows).reshape(2);
  return std::make_shared<MatPixelBuffer>(std::vector<cv::Mat>{luma, chroma});
}

YCbCrSampler::YCbCrSampler(const PlaneDesc &luma, const PlaneDesc &chroma) : luma_(luma), chroma_(chroma) {}

bool YCbCrSampler::valid() const {
  return luma_.base != nullptr and chroma_.base != nullptr and
         luma_.elem_size == 1 and chroma_.elem_size == 2 and
         luma_.width > 0 and luma_.height > 0 and
         chroma_.width * 2 >= luma_.width and chroma_.height * 2 >= luma_.height;
}
