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

#include "type/errors.hpp"

namespace mangatint {
auto ErrorKindToString(ErrorKind kind) -> std::string {
  switch (kind) {
    case ErrorKind::DEVICE_UNAVAILABLE:
      return "device_unavailable";
    case ErrorKind::MODEL_LOAD:
      return "model_load";
    case ErrorKind::INVALID_IMAGE:
      return "invalid_image";
    case ErrorKind::CORRUPT_INPUT:
      return "corrupt_input";
    case ErrorKind::ENGINE_EXECUTION:
      return "engine_execution";
    case ErrorKind::INVALID_REQUEST:
      return "invalid_request";
    case ErrorKind::CONTRACT_VIOLATION:
      return "contract_violation";
    case ErrorKind::ARCHIVE:
      return "archive";
    case ErrorKind::IO:
      return "io";
    default:
      return "unknown";
  }
}
};  // namespace mangatint
