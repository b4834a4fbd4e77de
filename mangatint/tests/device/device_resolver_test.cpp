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

#include <gtest/gtest.h>

#include <atomic>

#include "type/errors.hpp"

namespace mangatint {
TEST(DeviceResolverTests, FirstAvailableBackend_Wins) {
  DeviceResolver resolver({{DeviceType::CUDA, []() { return false; }},
                           {DeviceType::OPENCL, []() { return true; }},
                           {DeviceType::CPU, []() { return true; }}});
  const auto     device = resolver.Resolve();
  EXPECT_EQ(device.type_, DeviceType::OPENCL);
  EXPECT_EQ(device.precision_, Precision::FP16);
  EXPECT_EQ(device.name_, "opencl");
}

TEST(DeviceResolverTests, ThrowingProbe_FallsThrough) {
  DeviceResolver resolver(
      {{DeviceType::CUDA,
        []() -> bool { throw DeviceUnavailableError("[ERROR] DeviceResolver: driver missing"); }},
       {DeviceType::CPU, []() { return true; }}});
  const auto device = resolver.Resolve();
  EXPECT_EQ(device.type_, DeviceType::CPU);
  EXPECT_EQ(device.precision_, Precision::FP32);
}

TEST(DeviceResolverTests, EmptyChain_EndsOnCpu) {
  DeviceResolver resolver(std::vector<BackendProbe>{});
  EXPECT_EQ(resolver.Resolve().type_, DeviceType::CPU);

  DeviceResolver none_available({{DeviceType::CUDA, []() { return false; }}});
  EXPECT_EQ(none_available.Resolve().name_, "cpu");
}

TEST(DeviceResolverTests, Resolve_ProbesOnlyOnce) {
  std::atomic<int> calls{0};
  DeviceResolver   resolver({{DeviceType::CUDA, [&calls]() {
                                ++calls;
                                return true;
                              }}});
  EXPECT_EQ(resolver.Resolve().type_, DeviceType::CUDA);
  EXPECT_EQ(resolver.Resolve().type_, DeviceType::CUDA);
  EXPECT_EQ(calls.load(), 1);
}

TEST(DeviceResolverTests, SystemResolver_AlwaysYieldsADevice) {
  const auto device = DeviceResolver::System().Resolve();
  EXPECT_FALSE(device.name_.empty());
  EXPECT_EQ(device.precision_ == Precision::FP32, device.type_ == DeviceType::CPU);
}

TEST(DeviceResolverTests, Names) {
  EXPECT_EQ(DeviceTypeToString(DeviceType::CUDA), "cuda");
  EXPECT_EQ(PrecisionToString(Precision::FP16), "fp16");
}
};  // namespace mangatint
