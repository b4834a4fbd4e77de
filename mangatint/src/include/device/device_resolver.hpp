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

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mangatint {
enum class DeviceType : uint8_t { CUDA, OPENCL, CPU };
enum class Precision : uint8_t { FP16, FP32 };

struct ComputeDevice {
  DeviceType  type_      = DeviceType::CPU;
  Precision   precision_ = Precision::FP32;
  std::string name_      = "cpu";
};

auto DeviceTypeToString(DeviceType type) -> std::string;
auto PrecisionToString(Precision precision) -> std::string;

/**
 * @brief One entry of the backend priority chain. The probe may throw DeviceUnavailableError,
 * which the resolver treats the same as returning false.
 */
struct BackendProbe {
  DeviceType            type_;
  std::function<bool()> available_;
};

class DeviceResolver {
 private:
  std::vector<BackendProbe> probes_;

  std::once_flag            resolved_flag_;
  ComputeDevice             resolved_;

  auto                      Probe() const -> ComputeDevice;

 public:
  DeviceResolver();
  explicit DeviceResolver(std::vector<BackendProbe> probes);

  DeviceResolver(const DeviceResolver&)            = delete;
  DeviceResolver& operator=(const DeviceResolver&) = delete;

  /**
   * @brief Walk the probes in priority order, first available wins. CPU terminates the chain
   * even when no probe reports it. The result of the first call is kept for the lifetime of the
   * resolver.
   */
  auto        Resolve() -> ComputeDevice;

  static auto DefaultProbes() -> std::vector<BackendProbe>;
  /**
   * @brief Resolver over the real hardware probes, shared by the whole process since the
   * hardware does not change at runtime
   */
  static auto System() -> DeviceResolver&;
};
};  // namespace mangatint
