//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "model/builtin_sessions.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>

namespace mangatint {
namespace {
auto ToGray8(const cv::Mat& image01) -> cv::Mat {
  cv::Mat gray8;
  image01.convertTo(gray8, CV_8U, 255.0);
  return gray8;
}

inline auto ClampByte(float v, float lo, float hi) -> uchar {
  return cv::saturate_cast<uchar>(std::clamp(v, lo, hi));
}

// Luminance bands of the page and their (a, b) chroma in 8-bit LAB
inline void BandChroma(float g, uchar& a, uchar& b) {
  if (g > 200.0f) {
    a = ClampByte(g * 0.8f + 50.0f, 128.0f, 200.0f);
    b = ClampByte(g * 0.3f + 130.0f, 130.0f, 160.0f);
  } else if (g > 150.0f) {
    a = ClampByte(g * 0.6f + 60.0f, 128.0f, 180.0f);
    b = ClampByte(g * 0.2f + 128.0f, 125.0f, 150.0f);
  } else if (g > 100.0f) {
    a = ClampByte(g * 0.4f + 70.0f, 100.0f, 160.0f);
    b = 128;
  } else if (g > 50.0f) {
    a = ClampByte(g * 0.3f + 30.0f, 70.0f, 120.0f);
    b = ClampByte(g * 0.3f + 70.0f, 90.0f, 125.0f);
  } else if (g > 20.0f) {
    a = ClampByte(g * 0.2f + 20.0f, 60.0f, 100.0f);
    b = ClampByte(g * 0.2f + 60.0f, 80.0f, 110.0f);
  } else {
    a = 80;
    b = 85;
  }
}

// Blend a 3-channel image towards the gray page where the stroke map is set
void PullStrokesToGray(cv::Mat& bgr32, const cv::Mat& gray32, const cv::Mat& strokes) {
  cv::parallel_for_(cv::Range(0, bgr32.rows), [&](const cv::Range& range) {
    for (int y = range.start; y < range.end; ++y) {
      cv::Vec3f*   row  = bgr32.ptr<cv::Vec3f>(y);
      const float* gray = gray32.ptr<float>(y);
      const float* line = strokes.ptr<float>(y);
      for (int x = 0; x < bgr32.cols; ++x) {
        const float w = std::clamp(line[x], 0.0f, 1.0f);
        for (int c = 0; c < 3; ++c) {
          row[x][c] = row[x][c] * (1.0f - w) + gray[x] * w;
        }
      }
    }
  });
}

void CheckSameSize(const cv::Mat& a, const cv::Mat& b, const char* what) {
  if (a.size() != b.size()) {
    throw EngineExecutionError(std::string("[ERROR] BuiltinSession: Size mismatch for ") + what);
  }
}
}  // namespace

auto ToneMapBGR(const cv::Mat& gray8) -> cv::Mat {
  EASY_BLOCK("ToneMapBGR");
  CV_Assert(gray8.type() == CV_8UC1);
  cv::Mat lab(gray8.size(), CV_8UC3);
  cv::parallel_for_(cv::Range(0, gray8.rows), [&](const cv::Range& range) {
    for (int y = range.start; y < range.end; ++y) {
      const uchar* src = gray8.ptr<uchar>(y);
      cv::Vec3b*   dst = lab.ptr<cv::Vec3b>(y);
      for (int x = 0; x < gray8.cols; ++x) {
        uchar a, b;
        BandChroma(static_cast<float>(src[x]), a, b);
        dst[x] = cv::Vec3b(src[x], a, b);
      }
    }
  });
  cv::Mat bgr;
  cv::cvtColor(lab, bgr, cv::COLOR_Lab2BGR);
  cv::convertScaleAbs(bgr, bgr, 1.1, 5.0);
  return bgr;
}

auto BuiltinLineArtSession::Run(const TensorMap& inputs) -> TensorMap {
  EASY_BLOCK("BuiltinLineArt");
  const cv::Mat gray8 = ToGray8(TakeInput(inputs, "image"));

  // Dark strokes relative to their neighbourhood
  cv::Mat ink;
  cv::adaptiveThreshold(gray8, ink, 255, cv::ADAPTIVE_THRESH_MEAN_C, cv::THRESH_BINARY_INV, 15,
                        10);
  // Outlines of flat tone areas that carry no dark ink
  cv::Mat blurred, edges;
  cv::GaussianBlur(gray8, blurred, cv::Size(3, 3), 0.0);
  cv::Canny(blurred, edges, 50, 150);

  cv::Mat strokes;
  cv::bitwise_or(ink, edges, strokes);
  cv::Mat lineart;
  strokes.convertTo(lineart, CV_32F, 1.0 / 255.0);
  cv::GaussianBlur(lineart, lineart, cv::Size(3, 3), 0.0);
  return {{"lineart", lineart}};
}

auto ToneMapSession::Run(const TensorMap& inputs) -> TensorMap {
  EASY_BLOCK("ToneMapSession");
  const cv::Mat& image = TakeInput(inputs, "image");
  cv::Mat        color;
  ToneMapBGR(ToGray8(image)).convertTo(color, CV_32F, 1.0 / 255.0);

  auto lineart = inputs.find("lineart");
  if (lineart != inputs.end() && !lineart->second.empty()) {
    CheckSameSize(image, lineart->second, "lineart");
    PullStrokesToGray(color, image, lineart->second);
  }
  return {{"color", color}};
}

auto TonePriorDenoiserSession::Run(const TensorMap& inputs) -> TensorMap {
  EASY_BLOCK("TonePriorDenoiser");
  const cv::Mat& sample    = TakeInput(inputs, "sample");
  const cv::Mat& sigma_t   = TakeInput(inputs, "sigma");
  const cv::Mat& control   = TakeInput(inputs, "control");
  const cv::Mat& embedding = TakeInput(inputs, "embedding");
  const cv::Mat& image     = TakeInput(inputs, "image");
  CheckSameSize(sample, control, "control");
  CheckSameSize(sample, image, "image");
  if (sample.type() != CV_32FC3 || embedding.total() < 3) {
    throw EngineExecutionError("[ERROR] TonePriorDenoiser: Unexpected tensor layout");
  }

  // Clean estimate in [-1, 1]
  cv::Mat target;
  ToneMapBGR(ToGray8(image)).convertTo(target, CV_32F, 2.0 / 255.0, -1.0);
  const float* emb = embedding.ptr<float>(0);
  target += cv::Scalar(emb[0] * tint_scale_, emb[1] * tint_scale_, emb[2] * tint_scale_);

  cv::Mat gray_signed;
  image.convertTo(gray_signed, CV_32F, 2.0, -1.0);
  PullStrokesToGray(target, gray_signed, control);

  // Preconditioned denoiser: the sample is trusted more as sigma falls
  const float sigma    = std::max(sigma_t.at<float>(0, 0), 1e-6f);
  const float data_var = sigma_data_ * sigma_data_;
  const float skip     = data_var / (sigma * sigma + data_var);
  cv::Mat     denoised = sample * skip + target * (1.0f - skip);
  cv::Mat     eps      = (sample - denoised) / sigma;
  return {{"eps", eps}};
}

auto CreateBuiltinSession(const std::string& name) -> std::shared_ptr<InferenceSession> {
  if (name == "lineart") {
    return std::make_shared<BuiltinLineArtSession>();
  }
  if (name == "tone-map") {
    return std::make_shared<ToneMapSession>();
  }
  if (name == "tone-prior") {
    return std::make_shared<TonePriorDenoiserSession>();
  }
  throw ModelLoadError("[ERROR] ModelLoader: Unknown builtin model '" + name + "'");
}
};  // namespace mangatint
