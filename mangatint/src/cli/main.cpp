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

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "app/colorizer.hpp"
#include "cli/cli_args.hpp"
#include "config/colorizer_config.hpp"
#include "type/errors.hpp"

using namespace mangatint;

namespace {
void PrintUsage() {
  std::cout << "Usage:\n"
               "  mangatint colorize <image> [--output <file>] [--comparison] [options]\n"
               "  mangatint batch <dir|zip|image> [--zip] [--comparison] [options]\n"
               "  mangatint info [--config <json>]\n"
               "\n"
               "Options:\n"
               "  --config <json>          configuration file\n"
               "  --output-root <dir>      output folder\n"
               "  --engine fast|generative\n"
               "  --prompt <text>          --negative-prompt <text>\n"
               "  --strength <0.3-0.5>     --guidance <7-9>     --steps <20-30>\n"
               "  --seed <n>               --ink-threshold <0-255>\n"
               "  --max-side <px>          --no-text-protection\n"
               "  --format png|jpeg|webp|bmp\n";
}

struct CliArgs {
  std::string                command_;
  std::string                input_;
  std::optional<std::string> output_;
  std::optional<std::string> config_path_;
  std::optional<std::string> output_root_;
  std::optional<std::string> format_;
  bool                       archive_    = false;
  bool                       comparison_ = false;
  nlohmann::json             request_    = nlohmann::json::object();
};

auto ParseArgs(int argc, char** argv) -> CliArgs {
  CliArgs                  args;
  std::vector<std::string> tokens(argv + 1, argv + argc);
  if (tokens.empty()) {
    throw InvalidRequestError("[ERROR] mangatint: Missing command");
  }
  args.command_ = tokens[0];

  auto next = [&tokens](size_t& i) -> std::string {
    if (i + 1 >= tokens.size()) {
      throw InvalidRequestError("[ERROR] mangatint: " + tokens[i] + " expects a value");
    }
    return tokens[++i];
  };

  for (size_t i = 1; i < tokens.size(); ++i) {
    const std::string& token = tokens[i];
    if (token == "--config") {
      args.config_path_ = next(i);
    } else if (token == "--output") {
      args.output_ = next(i);
    } else if (token == "--output-root") {
      args.output_root_ = next(i);
    } else if (token == "--format") {
      args.format_ = next(i);
    } else if (token == "--zip") {
      args.archive_ = true;
    } else if (token == "--comparison") {
      args.comparison_ = true;
    } else if (token == "--engine") {
      args.request_["engine"] = next(i);
    } else if (token == "--prompt") {
      args.request_["prompt"] = next(i);
    } else if (token == "--negative-prompt") {
      args.request_["negative_prompt"] = next(i);
    } else if (token == "--strength") {
      args.request_["denoise_strength"] = ParseNumber(token, next(i));
    } else if (token == "--guidance") {
      args.request_["guidance_scale"] = ParseNumber(token, next(i));
    } else if (token == "--steps") {
      args.request_["steps"] = ParseInteger(token, next(i));
    } else if (token == "--seed") {
      args.request_["seed"] = ParseSeed(token, next(i));
    } else if (token == "--ink-threshold") {
      args.request_["ink_threshold"] = ParseInteger(token, next(i));
    } else if (token == "--max-side") {
      args.request_["max_side"] = ParseInteger(token, next(i));
    } else if (token == "--no-text-protection") {
      args.request_["protect_text"] = false;
    } else if (token == "-h" || token == "--help") {
      args.command_ = "help";
    } else if (!token.starts_with("--") && args.input_.empty()) {
      args.input_ = token;
    } else {
      throw InvalidRequestError("[ERROR] mangatint: Unknown argument " + token);
    }
  }
  return args;
}

auto LoadConfig(const CliArgs& args) -> ColorizerConfig {
  ColorizerConfig config =
      args.config_path_ ? ColorizerConfig::LoadFromFile(*args.config_path_) : ColorizerConfig{};
  if (args.output_root_) {
    config.output_root_ = *args.output_root_;
  }
  if (args.format_) {
    config.output_format_.format_ = FormatFromString(*args.format_);
  }
  if (args.comparison_) {
    config.save_comparison_ = true;
  }
  return config;
}

void PrintProgress(const ProgressEvent& event) {
  if (event.filename_.empty()) {
    std::cout << "[" << event.current_ << "/" << event.total_ << "] " << event.message_
              << std::endl;
    return;
  }
  std::cout << "[" << event.current_ << "/" << event.total_ << "] " << event.filename_ << " ("
            << event.percent_ << "%)" << std::endl;
}
}  // namespace

int main(int argc, char** argv) {
  CliArgs args;
  try {
    args = ParseArgs(argc, argv);
  } catch (const ColorizeError& e) {
    std::cerr << e.what() << std::endl;
    PrintUsage();
    return 2;
  }

  if (args.command_ == "help") {
    PrintUsage();
    return 0;
  }
  if ((args.command_ == "colorize" || args.command_ == "batch") && args.input_.empty()) {
    std::cerr << "[ERROR] mangatint: " << args.command_ << " needs an input" << std::endl;
    PrintUsage();
    return 2;
  }

  try {
    ColorizerConfig     config  = LoadConfig(args);
    ColorizationRequest request = ColorizationRequest::FromJson(args.request_, config.request_);

    if (args.command_ == "colorize") {
      Colorizer colorizer(config);
      std::optional<image_path_t> output;
      if (args.output_) {
        output = image_path_t(*args.output_);
      }
      auto result = colorizer.ColorizeOne(args.input_, request, output);
      std::cout << result.ToJson().dump(2) << std::endl;
      return EXIT_SUCCESS;
    }
    if (args.command_ == "batch") {
      Colorizer colorizer(config, PrintProgress);
      auto      snapshot = colorizer.ColorizeMany(args.input_, request, args.archive_);
      std::cout << snapshot.ToJson().dump(2) << std::endl;
      return snapshot.status_ == BatchJobStatus::COMPLETED ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    if (args.command_ == "info") {
      Colorizer colorizer(config);
      std::cout << colorizer.GetModelInfo().dump(2) << std::endl;
      return EXIT_SUCCESS;
    }
    std::cerr << "[ERROR] mangatint: Unknown command " << args.command_ << std::endl;
    PrintUsage();
    return 2;
  } catch (const ColorizeError& e) {
    std::cerr << "[" << ErrorKindToString(e.Kind()) << "] " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
