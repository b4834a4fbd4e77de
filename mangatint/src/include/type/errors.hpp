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
#include <stdexcept>
#include <string>

namespace mangatint {
enum class ErrorKind : uint8_t {
  UNKNOWN = 0,
  DEVICE_UNAVAILABLE,
  MODEL_LOAD,
  INVALID_IMAGE,
  CORRUPT_INPUT,
  ENGINE_EXECUTION,
  INVALID_REQUEST,
  CONTRACT_VIOLATION,
  ARCHIVE,
  IO
};

auto ErrorKindToString(ErrorKind kind) -> std::string;

/**
 * @brief Base of every error raised by the colorization core. The kind survives type erasure
 * through std::exception so batch error records can be classified.
 */
class ColorizeError : public std::runtime_error {
 private:
  ErrorKind kind_;

 public:
  ColorizeError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  auto Kind() const noexcept -> ErrorKind { return kind_; }
};

// Recovered by DeviceResolver, never escapes it
class DeviceUnavailableError : public ColorizeError {
 public:
  explicit DeviceUnavailableError(const std::string& message)
      : ColorizeError(ErrorKind::DEVICE_UNAVAILABLE, message) {}
};

class ModelLoadError : public ColorizeError {
 public:
  explicit ModelLoadError(const std::string& message)
      : ColorizeError(ErrorKind::MODEL_LOAD, message) {}
};

class InvalidImageError : public ColorizeError {
 public:
  explicit InvalidImageError(const std::string& message)
      : ColorizeError(ErrorKind::INVALID_IMAGE, message) {}
};

class CorruptInputError : public ColorizeError {
 public:
  explicit CorruptInputError(const std::string& message)
      : ColorizeError(ErrorKind::CORRUPT_INPUT, message) {}
};

class EngineExecutionError : public ColorizeError {
 public:
  explicit EngineExecutionError(const std::string& message)
      : ColorizeError(ErrorKind::ENGINE_EXECUTION, message) {}
};

class InvalidRequestError : public ColorizeError {
 public:
  explicit InvalidRequestError(const std::string& message)
      : ColorizeError(ErrorKind::INVALID_REQUEST, message) {}
};

// Mismatched working resolutions between map, mask and generated output
class ContractError : public ColorizeError {
 public:
  explicit ContractError(const std::string& message)
      : ColorizeError(ErrorKind::CONTRACT_VIOLATION, message) {}
};

class ArchiveError : public ColorizeError {
 public:
  explicit ArchiveError(const std::string& message) : ColorizeError(ErrorKind::ARCHIVE, message) {}
};

class OutputWriteError : public ColorizeError {
 public:
  explicit OutputWriteError(const std::string& message) : ColorizeError(ErrorKind::IO, message) {}
};
};  // namespace mangatint
