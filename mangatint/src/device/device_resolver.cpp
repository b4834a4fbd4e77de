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

#include "device/device_resolver.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/core/cuda.hpp>
#include <opencv2/core/ocl.hpp>
#include <opencv2/dnn.hpp>
#include <utility>

#include "type/errors.hpp"

namespace mangatint {
namespace {
auto HasDnnTarget(cv::dnn::Backend backend, cv::dnn::Target target) -> bool {
  const auto targets = cv::dnn::getAvailableTargets(backend);
  return std::find(targets.begin(), targets.end(), target) != targets.end();
}

auto ProbeCuda() -> bool {
  try {
    if (cv::cuda::getCudaEnabledDeviceCount() <= 0) {
      return false;
    }
    return HasDnnTarget(cv::dnn::DNN_BACKEND_CUDA, cv::dnn::DNN_TARGET_CUDA);
  } catch (const cv::Exception& e) {
    throw DeviceUnavailableError(std::string("[WARN] DeviceResolver: CUDA probe failed: ") +
                                 e.what());
  }
}

auto ProbeOpenCL() -> bool {
  try {
    if (!cv::ocl::haveOpenCL() || !cv::ocl::useOpenCL()) {
      return false;
    }
    return HasDnnTarget(cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_OPENCL);
  } catch (const cv::Exception& e) {
    throw DeviceUnavailableError(std::string("[WARN] DeviceResolver: OpenCL probe failed: ") +
                                 e.what());
  }
}

auto MakeDevice(DeviceType type) -> ComputeDevice {
  ComputeDevice device;
  device.type_      = type;
  device.precision_ = (type == DeviceType::CPU) ? Precision::FP32 : Precision::FP16;
  device.name_      = DeviceTypeToString(type);
  return device;
}
}  // namespace

auto DeviceTypeToString(DeviceType type) -> std::string {
  switch (type) {
    case DeviceType::CUDA:
      return "cuda";
    case DeviceType::OPENCL:
      return "opencl";
    default:
      return "cpu";
  }
}

auto PrecisionToString(Precision precision) -> std::string {
  return precision == Precision::FP16 ? "fp16" : "fp32";
}

DeviceResolver::DeviceResolver() : probes_(DefaultProbes()) {}

DeviceResolver::DeviceResolver(std::vector<BackendProbe> probes) : probes_(std::move(probes)) {}

auto DeviceResolver::DefaultProbes() -> std::vector<BackendProbe> {
  return {
      {DeviceType::CUDA, ProbeCuda},
      {DeviceType::OPENCL, ProbeOpenCL},
      {DeviceType::CPU, []() { return true; }},
  };
}

auto DeviceResolver::Probe() const -> ComputeDevice {
  for (const auto& probe : probes_) {
    if (probe.type_ == DeviceType::CPU) {
      return MakeDevice(DeviceType::CPU);
    }
    try {
      if (probe.available_ && probe.available_()) {
        return MakeDevice(probe.type_);
      }
    } catch (const DeviceUnavailableError& e) {
      // Fall down the chain
      std::cerr << e.what() << std::endl;
    }
  }
  return MakeDevice(DeviceType::CPU);
}

auto DeviceResolver::Resolve() -> ComputeDevice {
  std::call_once(resolved_flag_, [this]() {
    resolved_ = Probe();
    std::cout << "[INFO] DeviceResolver: Using " << resolved_.name_ << " ("
              << PrecisionToString(resolved_.precision_) << ")" << std::endl;
  });
  return resolved_;
}

auto DeviceResolver::System() -> DeviceResolver& {
  static DeviceResolver resolver;
  return resolver;
}
};  // namespace mangatint
