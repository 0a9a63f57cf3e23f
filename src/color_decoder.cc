//
// Created by lucius on 10/17/26.
//

#include "color_decoder.hpp"
#include <algorithm>

namespace {

inline float normalize_channel(float value) {
  return std::max(0.f, std::min(255.f, value)) / 255.f;
}

}

Color4f decode_ycbcr(uint8_t y, uint8_t cb, uint8_t cr) {
  const float y_ = static_cast<float>(y) - 16.f;
  const float cb_ = static_cast<float>(cb) - 128.f;
  const float cr_ = static_cast<float>(cr) - 128.f;

  const float r = 1.164f * y_ + 1.596f * cr_;
  const float g = 1.164f * y_ - 0.392f * cb_ - 0.813f * cr_;
  const float b = 1.164f * y_ + 2.017f * cb_;

  return Color4f(normalize_channel(r), normalize_channel(g), normalize_channel(b), 1.f);
}
