/**
 * labelnorm-cli — Correct product labels in bulk; print and export original/corrected pairs.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/labelnorm_cli [--config path] [--input path|-] [--label text]... [--output path]
 * Without --input or --label: runs on the built-in sample labels.
 * Without --output: the pairs are written to stdout in the export format.
 */

#include <labelnorm/app/batch_runner.hpp>
#include <labelnorm/app/config.hpp>
#include <labelnorm/app/label_io.hpp>
#include <labelnorm/core/error.hpp>
#include <labelnorm/core/label_record.hpp>
#include <labelnorm/core/pipeline.hpp>
#include <labelnorm/text/brand_catalog.hpp>
#include <labelnorm/text/label_normalizer.hpp>
#ifdef LABELNORM_HAS_TBB
#include <labelnorm/app/batch_runner_tbb.hpp>
#endif

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <expected>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<std::string> sample_labels() {
  return {
      "6X30G CHIPS LISSE NAT CRF CLAS",
      "1L PET PUR JUS POMME CRF EXTRA",
      "PAPERMATE 4 Magic+ effaceurs fins réécr",
      "Désodorisant 2.5ml 4scent",
      "5 BQ ALU 1,5L PROFONDE",
      "CRF Bio 500g Quinoa rouge",
      "Shampoing L'Oréal 250ML doux",
  };
}

void print_usage() {
  std::cout << "Usage: labelnorm_cli [options]\n"
            << "  --config <path>   Config (key=value file); default: built-in\n"
            << "  --input <path>    Labels, one per line; '-' reads stdin\n"
            << "  --label <text>    Label to correct (repeatable)\n"
            << "  --output <path>   Write original/corrected pairs to this file\n"
            << "  --format <type>   Export format: tsv | csv (default from config)\n"
            << "  --no-header       Omit the header row in the export\n"
            << "  --parallel        Correct in parallel (TBB builds only; no progress)\n"
            << "  --pace            Use pacing_min_ms/pacing_max_ms between labels\n"
            << "  --quiet           No progress or preview output\n"
            << "\nWithout --input or --label the built-in sample labels are used.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string output_path;
  std::string format_override;
  std::vector<std::string> labels;
  bool no_header = false;
  bool parallel = false;
  bool pace = false;
  bool quiet = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--label" && i + 1 < argc) {
      labels.emplace_back(argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      format_override = argv[++i];
    } else if (arg == "--no-header") {
      no_header = true;
    } else if (arg == "--parallel") {
      parallel = true;
    } else if (arg == "--pace") {
      pace = true;
    } else if (arg == "--quiet") {
      quiet = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  labelnorm::app::LabelConfig cfg;
  try {
    cfg = config_path.empty() ? labelnorm::app::default_config()
                              : labelnorm::app::load_config(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Invalid config " << config_path << ": " << e.what() << "\n";
    return 1;
  }

  if (!format_override.empty()) {
    auto fmt = labelnorm::app::parse_export_format(format_override);
    if (!fmt) {
      std::cerr << "Unknown --format " << format_override << " (use tsv or csv)\n";
      return 1;
    }
    cfg.export_format = *fmt;
  }
  if (no_header) cfg.write_header = false;

  if (auto valid = labelnorm::app::validate_config(cfg); !valid) {
    std::cerr << "Config error: " << labelnorm::core::error_name(valid.error()) << "\n";
    return 1;
  }

  if (!input_path.empty()) {
    auto loaded = labelnorm::app::read_labels(input_path);
    if (!loaded) {
      std::cerr << "Failed to read labels: " << input_path << "\n";
      return 1;
    }
    labels.insert(labels.end(), loaded->begin(), loaded->end());
  } else if (labels.empty()) {
    labels = sample_labels();
  }

  const labelnorm::core::LabelPipeline pipeline =
      labelnorm::text::build_label_pipeline(labelnorm::text::BrandCatalog(cfg.brands));

  std::expected<std::vector<labelnorm::core::LabelRecord>, labelnorm::core::LabelError> result;
  if (parallel) {
#ifdef LABELNORM_HAS_TBB
    result = labelnorm::app::correct_labels_tbb(pipeline, labels);
#else
    std::cerr << "--parallel not available (build with -DLABELNORM_USE_TBB=ON and TBB)\n";
    return 1;
#endif
  } else {
    labelnorm::app::PacingPolicy pacing = labelnorm::app::no_pacing();
    if (pace && cfg.pacing_max_ms > 0) {
      pacing = labelnorm::app::random_pacing(std::chrono::milliseconds(cfg.pacing_min_ms),
                                             std::chrono::milliseconds(cfg.pacing_max_ms));
    }
    const std::size_t total = labels.size();
    labelnorm::app::LabelProgressCallback progress;
    if (!quiet) {
      progress = [total](std::vector<labelnorm::core::LabelRecord> records, std::size_t index) {
        const auto& r = records[index];
        if (r.is_processing) return;
        std::cerr << "[" << (index + 1) << "/" << total << "] " << r.original << " -> "
                  << r.corrected << "\n";
      };
    }
    const labelnorm::app::BatchRunner runner(pipeline, std::move(pacing));
    result = runner.run(labels, progress);
  }

  if (!result) {
    std::cerr << "Batch error: " << labelnorm::core::error_name(result.error()) << "\n";
    return 1;
  }

  if (!output_path.empty()) {
    auto written = labelnorm::app::export_records(output_path, *result, cfg.export_format,
                                                  cfg.write_header);
    if (!written) {
      std::cerr << "Failed to write " << output_path << ": "
                << labelnorm::core::error_name(written.error()) << "\n";
      return 1;
    }
  }

  if (output_path.empty()) {
    labelnorm::app::write_records(std::cout, *result, cfg.export_format, cfg.write_header);
    return 0;
  }
  if (quiet) return 0;

  std::cout << "labels processed: " << result->size() << "\n"
            << "output: " << output_path << "\n";
  const std::size_t preview = std::min<std::size_t>(cfg.preview_count, result->size());
  for (std::size_t i = 0; i < preview; ++i) {
    const auto& r = (*result)[i];
    std::cout << (i + 1) << ". " << r.original << "\n"
              << "   -> " << r.corrected << "\n";
  }
  return 0;
}
