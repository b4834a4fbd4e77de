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

#include "engine/prompt_encoder.hpp"

#include <xxhash.h>

#include <cctype>
#include <cmath>

#include "type/errors.hpp"

namespace mangatint {
PromptEncoder::PromptEncoder(int dim) : dim_(dim) {
  if (dim_ < 3) {
    throw InvalidRequestError("[ERROR] PromptEncoder: Embedding needs at least 3 dimensions");
  }
}

auto PromptEncoder::Tokenize(const std::string& text) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  std::string              current;
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

auto PromptEncoder::Encode(const std::string& text) const -> cv::Mat {
  cv::Mat embedding = cv::Mat::zeros(1, dim_, CV_32F);
  float*  values    = embedding.ptr<float>(0);
  for (const auto& token : Tokenize(text)) {
    const XXH64_hash_t hash  = XXH64(token.data(), token.size(), 0);
    const int          index = static_cast<int>(hash % static_cast<XXH64_hash_t>(dim_));
    values[index] += (hash >> 63) ? -1.0f : 1.0f;
  }
  const double norm = cv::norm(embedding, cv::NORM_L2);
  if (norm > 0.0) {
    embedding /= norm;
  }
  return embedding;
}
};  // namespace mangatint
