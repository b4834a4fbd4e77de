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
#include <filesystem>
#include <string>

namespace mangatint {

// Page and output paths
#define image_path_t    std::filesystem::path
#define file_path_t     std::filesystem::path

// Used by batch jobs
#define job_id_t        uint32_t
#define item_index_t    size_t

// Model registry key, e.g. "lineart", "denoiser"
#define model_id_t      std::string

#define PriorityLevel   int

enum class ColorMode { GRAY, RGB };
};  // namespace mangatint
