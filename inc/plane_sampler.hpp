//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_PLANE_SAMPLER_HPP
#define LIDAR_FUSE_PLANE_SAMPLER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>

struct PlaneDesc {
  const uint8_t *base = nullptr;
  int width = 0;
  int height = 0;
  size_t bytes_per_row = 0;
  size_t elem_size = 0;
};

// a (possibly hardware backed) multi-plane image. planes may only be read
// between lock_read() and unlock_read().
class PixelBuffer {
public:
  virtual ~PixelBuffer() = default;

  virtual bool lock_read() = 0;
  virtual void unlock_read() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;
  virtual int plane_count() const = 0;
  virtual bool plane(int index, PlaneDesc &desc) const = 0;
};

class ScopedBufferLock {
public:
  explicit ScopedBufferLock(PixelBuffer *buffer)
      : buffer_(buffer), locked_(buffer != nullptr && buffer->lock_read()) {}

  ~ScopedBufferLock() {
    if (locked_) {
      buffer_->unlock_read();
    }
  }

  ScopedBufferLock(const ScopedBufferLock &) = delete;
  ScopedBufferLock &operator=(const ScopedBufferLock &) = delete;

  bool owns_lock() const { return locked_; }

private:
  PixelBuffer *buffer_;
  bool locked_;
};

class MatPixelBuffer : public PixelBuffer {
public:
  // every plane must be a 2d matrix, its element size becomes the plane's
  // element size. width()/height() report plane 0.
  explicit MatPixelBuffer(std::vector<cv::Mat> planes);

  bool lock_read() override;
  void unlock_read() override;

  int width() const override;
  int height() const override;
  int plane_count() const override;
  bool plane(int index, PlaneDesc &desc) const override;

  bool locked() const { return lock_count_ > 0; }

private:
  std::vector<cv::Mat> planes_;
  int lock_count_ = 0;
};

std::shared_ptr<PixelBuffer> make_depth_buffer(const cv::Mat &depth);
std::shared_ptr<PixelBuffer> make_confidence_buffer(const cv::Mat &confidence);
// nv12 is a single channel image, luma rows on top followed by height/2 rows
// of interleaved cb/cr
std::shared_ptr<PixelBuffer> make_nv12_buffer(const cv::Mat &nv12);

template <typename T>
class PlaneSampler {
public:
  PlaneSampler() = default;
  explicit PlaneSampler(const PlaneDesc &desc) : desc_(desc) {}

  bool valid() const {
    return desc_.base != nullptr && desc_.elem_size == sizeof(T) && desc_.width > 0 && desc_.height > 0;
  }
  int width() const { return desc_.width; }
  int height() const { return desc_.height; }

  // no bounds checks, caller keeps 0 <= col < width and 0 <= row < height
  T value(int col, int row) const {
    const auto row_ptr = desc_.base + static_cast<size_t>(row) * desc_.bytes_per_row;
    return reinterpret_cast<const T *>(row_ptr)[col];
  }

private:
  PlaneDesc desc_;
};

// 4:2:0 bi-planar luma + interleaved chroma
class YCbCrSampler {
public:
  YCbCrSampler() = default;
  YCbCrSampler(const PlaneDesc &luma, const PlaneDesc &chroma);

  bool valid() const;
  int width() const { return luma_.width; }
  int height() const { return luma_.height; }

  void sample(int col, int row, uint8_t &y, uint8_t &cb, uint8_t &cr) const {
    const auto y_index = static_cast<size_t>(row) * luma_.bytes_per_row + col;
    const auto uv_index = static_cast<size_t>(row / 2) * chroma_.bytes_per_row + (col / 2) * 2;
    y = luma_.base[y_index];
    cb = chroma_.base[uv_index];
    cr = chroma_.base[uv_index + 1];
  }

private:
  PlaneDesc luma_;
  PlaneDesc chroma_;
};

#endif //LIDAR_FUSE_PLANE_SAMPLER_HPP
