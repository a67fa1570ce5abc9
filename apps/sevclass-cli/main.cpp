/**
 * sevclass-cli: Classify JPEG image(s) into a severity label.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/sevclass_cli [--config path] [--backend mock|onnx] [--model path] --input a.jpg [--input b.jpg ...]
 */

#include <sevclass/app/config.hpp>
#include <sevclass/app/pipeline_builder.hpp>
#include <sevclass/app/pipeline_runner.hpp>
#include <sevclass/core/classification.hpp>
#include <sevclass/core/error.hpp>
#include <sevclass/core/pipeline.hpp>
#include <sevclass/vision/load_image.hpp>
#include <sevclass/vision/mock_inference_backend.hpp>

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

std::vector<float> parse_scores(const std::string& text) {
  std::vector<float> scores;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    scores.push_back(std::stof(item));
  }
  return scores;
}

std::string describe(const sevclass::app::ClassificationOutcome& outcome) {
  if (!outcome) {
    return "error: " + std::string(sevclass::core::to_string(outcome.error()));
  }
  std::ostringstream out;
  out << sevclass::core::to_display_string(*outcome);
  if (const auto* p = std::get_if<sevclass::core::Prediction>(&*outcome)) {
    out << " (confidence=" << p->confidence << ")";
  }
  return out.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::string mock_scores;
  std::size_t workers = 1;
  bool print_timing = false;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--input" && i + 1 < argc) {
        input_paths.emplace_back(argv[++i]);
      } else if (arg == "--backend" && i + 1 < argc) {
        backend_override = argv[++i];
      } else if (arg == "--model" && i + 1 < argc) {
        model_override = argv[++i];
      } else if (arg == "--scores" && i + 1 < argc) {
        mock_scores = argv[++i];
      } else if (arg == "--workers" && i + 1 < argc) {
        workers = static_cast<std::size_t>(std::stoul(argv[++i]));
      } else if (arg == "--timing") {
        print_timing = true;
      } else if (arg == "--help" || arg == "-h") {
        std::cout << "Usage: sevclass_cli [options] --input <jpeg> [--input <jpeg> ...]\n"
                  << "  --config <path>   Pipeline config (key=value file); default: built-in (mock)\n"
                  << "  --backend <type>  Override backend: mock | onnx (default from config)\n"
                  << "  --model <path>    Override model path (required for --backend onnx)\n"
                  << "  --scores a,b,c    Scores returned by the mock backend\n"
                  << "  --workers <n>     Classify inputs on n threads (0 = hardware concurrency)\n"
                  << "  --timing          Print per-stage timings (single input only)\n"
                  << "\nBackend selection: config file (backend_type=, model_path=) or --backend/--model.\n";
        return 0;
      } else {
        std::cerr << "Unknown argument: " << arg << " (see --help)\n";
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Bad argument: " << e.what() << " (see --help)\n";
    return 1;
  }

  if (input_paths.empty()) {
    std::cerr << "No --input given (see --help)\n";
    return 1;
  }

  sevclass::app::PipelineConfig cfg;
  try {
    cfg = config_path.empty() ? sevclass::app::default_config()
                              : sevclass::app::load_config(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load config " << config_path << ": " << e.what() << "\n";
    return 1;
  }
  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = sevclass::app::InferenceBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = sevclass::app::InferenceBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }
  if (auto valid = sevclass::app::validate_config(cfg); !valid) {
    std::cerr << "Config error: " << sevclass::core::to_string(valid.error()) << "\n";
    return 1;
  }

  sevclass::core::Pipeline pipeline;
  try {
    auto backend = sevclass::app::make_backend(cfg);
    if (auto* mock = dynamic_cast<sevclass::vision::MockInferenceBackend*>(backend.get());
        mock && !mock_scores.empty()) {
      mock->set_scores(parse_scores(mock_scores));
    }
    pipeline = sevclass::app::build_pipeline(cfg, std::move(backend));
  } catch (const std::exception& e) {
    std::cerr << "Failed to set up inference: " << e.what() << "\n";
    return 1;
  }

  // Upstream format check and file reading; the decoder validates again.
  std::vector<std::vector<std::byte>> images;
  std::vector<std::string> accepted;
  int exit_code = 0;
  for (const auto& path : input_paths) {
    if (!sevclass::vision::has_jpeg_extension(path)) {
      std::cerr << path << ": please choose a JPEG image\n";
      exit_code = 1;
      continue;
    }
    auto bytes = sevclass::vision::load_encoded_image(path);
    if (!bytes) {
      std::cerr << "Failed to read image: " << path << "\n";
      exit_code = 1;
      continue;
    }
    images.push_back(std::move(*bytes));
    accepted.push_back(path);
  }

  if (print_timing && images.size() == 1) {
    sevclass::app::StageTimingCallback timing_cb = [](std::size_t idx, double ms) {
      std::cerr << "  stage " << idx << ": " << ms << " ms\n";
    };
    auto outcome = sevclass::app::run_pipeline(pipeline, images.front(), &timing_cb);
    std::cout << accepted.front() << ": " << describe(outcome) << "\n";
    return (outcome && exit_code == 0) ? 0 : 1;
  }

  std::vector<std::string> lines(images.size());
  std::mutex lines_mutex;
  sevclass::app::run_pipeline_batch_parallel(
      pipeline, images,
      [&](std::size_t idx, const sevclass::app::ClassificationOutcome& outcome) {
        std::lock_guard lock(lines_mutex);
        lines[idx] = accepted[idx] + ": " + describe(outcome);
        if (!outcome) exit_code = 1;
      },
      workers);

  for (const auto& line : lines) {
    std::cout << line << "\n";
  }
  return exit_code;
}
