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

#include "engine/engine_factory.hpp"

#include <string>
#include <utility>

#include "engine/fast_engine.hpp"
#include "engine/generative_engine.hpp"
#include "model/model_config.hpp"

namespace mangatint {
auto EngineFactory::RequiredModel(EngineVariant variant) -> model_id_t {
  switch (variant) {
    case EngineVariant::FAST:
      return std::string(models::kFastColorizer);
    default:
      return std::string(models::kDenoiser);
  }
}

auto EngineFactory::Create(EngineVariant variant, std::shared_ptr<ModelHandle> model)
    -> std::unique_ptr<IColorizationEngine> {
  switch (variant) {
    case EngineVariant::FAST:
      return std::make_unique<FastEngine>(std::move(model));
    default:
      return std::make_unique<GenerativeEngine>(std::move(model));
  }
}
};  // namespace mangatint
