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

#include "model/dnn_session.hpp"

#include <easy/profiler.h>

#include <filesystem>
#include <iostream>
#include <opencv2/imgproc.hpp>
#include <utility>
#include <vector>

#include "type/errors.hpp"

namespace mangatint {
namespace {
void ConfigureBackend(cv::dnn::Net& net, const ComputeDevice& device) {
  switch (device.type_) {
    case DeviceType::CUDA:
      net.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
      net.setPreferableTarget(device.precision_ == Precision::FP16
                                  ? cv::dnn::DNN_TARGET_CUDA_FP16
                                  : cv::dnn::DNN_TARGET_CUDA);
      break;
    case DeviceType::OPENCL:
      net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
      net.setPreferableTarget(device.precision_ == Precision::FP16
                                  ? cv::dnn::DNN_TARGET_OPENCL_FP16
                                  : cv::dnn::DNN_TARGET_OPENCL);
      break;
    default:
      net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
      net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
      break;
  }
}

auto IsVector(const cv::Mat& tensor) -> bool { return tensor.rows == 1 && tensor.channels() == 1; }
}  // namespace

DnnSession::DnnSession(cv::dnn::Net net, std::string uri, int input_size)
    : net_(std::move(net)), uri_(std::move(uri)), input_size_(input_size) {}

auto DnnSession::Load(const ModelConfig& config, const ComputeDevice& device)
    -> std::shared_ptr<DnnSession> {
  EASY_BLOCK("DnnSession::Load");
  if (!std::filesystem::exists(config.uri_)) {
    throw ModelLoadError("[ERROR] DnnSession: Model file not found: " + config.uri_);
  }
  try {
    cv::dnn::Net net = cv::dnn::readNet(config.uri_);
    if (net.empty()) {
      throw ModelLoadError("[ERROR] DnnSession: Empty network in " + config.uri_);
    }
    ConfigureBackend(net, device);
    std::cout << "[INFO] DnnSession: Loaded " << config.uri_ << " on " << device.name_ << " ("
              << PrecisionToString(device.precision_) << ")" << std::endl;
    return std::make_shared<DnnSession>(std::move(net), config.uri_, config.input_size_);
  } catch (const cv::Exception& e) {
    throw ModelLoadError("[ERROR] DnnSession: Failed to read " + config.uri_ + ": " + e.what());
  }
}

auto DnnSession::Run(const TensorMap& inputs) -> TensorMap {
  EASY_BLOCK("DnnSession::Run");
  cv::Size image_size;
  for (const auto& [name, tensor] : inputs) {
    if (tensor.empty()) {
      continue;
    }
    if (IsVector(tensor)) {
      net_.setInput(tensor, name);
      continue;
    }
    if (image_size.empty()) {
      image_size = tensor.size();
    }
    cv::Size blob_size = input_size_ > 0 ? cv::Size(input_size_, input_size_) : tensor.size();
    net_.setInput(cv::dnn::blobFromImage(tensor, 1.0, blob_size, cv::Scalar(), false, false,
                                         CV_32F),
                  name);
  }

  std::vector<std::string> names = net_.getUnconnectedOutLayersNames();
  std::vector<cv::Mat>     blobs;
  net_.forward(blobs, names);

  TensorMap outputs;
  for (size_t i = 0; i < blobs.size() && i < names.size(); ++i) {
    cv::Mat output = blobs[i];
    if (output.dims == 4) {
      std::vector<cv::Mat> images;
      cv::dnn::imagesFromBlob(output, images);
      output = images.front();
      if (!image_size.empty() && output.size() != image_size) {
        cv::resize(output, output, image_size, 0, 0, cv::INTER_LINEAR);
      }
    }
    outputs.emplace(names[i], output);
  }
  return outputs;
}
};  // namespace mangatint
