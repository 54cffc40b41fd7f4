// venn_simulate.cpp — Effect-measure agreement simulation tool
// Runs the Monte Carlo agreement simulation, then either renders the six-way
// Venn diagram template with the estimated probabilities (to stdout) or prints
// a summary table. Optionally exports the raw 64-subset tally.
//
// Usage: ./venn_simulate [--preset <name>] [--trials N] [--template <svg>]
//                        [--output <path.csv|.json|.parquet>] ...

#include "errors.hpp"
#include "simulation/simulation_config.hpp"
#include "simulation/simulation_driver.hpp"
#include "simulation/subset_code.hpp"
#include "venn/diagram_template.hpp"
#include "venn/tally_export.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/properties.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

// ===========================================================================
// Parquet export
// ===========================================================================
void write_parquet(const std::string& path, const AgreementTally& tally) {
    auto rows = tally_io::tally_rows(tally);

    auto schema = arrow::schema({
        arrow::field("mask", arrow::int64()),
        arrow::field("code", arrow::utf8()),
        arrow::field("measures", arrow::utf8()),
        arrow::field("count", arrow::int64()),
        arrow::field("probability", arrow::float64()),
    });

    arrow::Int64Builder mask_b;
    arrow::StringBuilder code_b;
    arrow::StringBuilder measures_b;
    arrow::Int64Builder count_b;
    arrow::DoubleBuilder prob_b;
    for (const auto& r : rows) {
        PARQUET_THROW_NOT_OK(mask_b.Append(static_cast<int64_t>(r.mask)));
        PARQUET_THROW_NOT_OK(code_b.Append(r.code));
        PARQUET_THROW_NOT_OK(measures_b.Append(r.measures));
        PARQUET_THROW_NOT_OK(count_b.Append(r.count));
        PARQUET_THROW_NOT_OK(prob_b.Append(r.probability));
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(5);
    PARQUET_THROW_NOT_OK(mask_b.Finish(&arrays[0]));
    PARQUET_THROW_NOT_OK(code_b.Finish(&arrays[1]));
    PARQUET_THROW_NOT_OK(measures_b.Finish(&arrays[2]));
    PARQUET_THROW_NOT_OK(count_b.Finish(&arrays[3]));
    PARQUET_THROW_NOT_OK(prob_b.Finish(&arrays[4]));

    auto table = arrow::Table::Make(schema, arrays);

    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    PARQUET_ASSIGN_OR_THROW(outfile, arrow::io::FileOutputStream::Open(path));

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    PARQUET_THROW_NOT_OK(parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile,
        /*chunk_size=*/static_cast<int64_t>(rows.size()), props));
    PARQUET_THROW_NOT_OK(outfile->Close());
}

void write_tally(const std::string& path, const SimulationResult& result) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".csv") {
        tally_io::write_csv(path, result.tally);
    } else if (ext == ".json") {
        tally_io::write_json(path, result);
    } else if (ext == ".parquet") {
        write_parquet(path, result.tally);
    } else {
        throw std::invalid_argument("Unsupported output format '" + ext +
                                    "'. Use .csv, .json or .parquet extension.");
    }
}

// ===========================================================================
// Summary table
// ===========================================================================
void print_summary(std::ostream& os, const SimulationResult& result) {
    os << "# mode=" << sampling_mode_str(result.config.mode())
       << " bounds=[" << result.config.lower_bound << ", " << result.config.upper_bound << "]"
       << " trials=" << result.tally.trial_count
       << " precision=" << result.config.effective_precision()
       << " seed=" << result.seed << "\n";
    os << std::left << std::setw(8) << "code" << std::setw(24) << "measures"
       << std::right << std::setw(12) << "count" << std::setw(12) << "p" << "\n";
    os << std::fixed << std::setprecision(6);
    for (const auto& row : tally_io::tally_rows(result.tally)) {
        if (row.mask == 0) continue;
        os << std::left << std::setw(8) << row.code << std::setw(24) << row.measures
           << std::right << std::setw(12) << row.count
           << std::setw(12) << row.probability << "\n";
    }
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "  --preset <name>   figure1 | figure2 | appendix-d\n"
              << "  --trials <N>      Number of trials (default 1000000)\n"
              << "  --lower <x>       Lower risk bound (default 0.0)\n"
              << "  --upper <y>       Upper risk bound (default 1.0)\n"
              << "  --tent            Tent sampling of treatment risks (default)\n"
              << "  --independent     Independent uniform sampling of all risks\n"
              << "  --precision <P>   Bisection resolution 1/P (default: trials)\n"
              << "  --seed <S>        RNG seed (default: random)\n"
              << "  --workers <W>     Worker threads (default 1)\n"
              << "  --template <svg>  Render the six-way diagram template to stdout\n"
              << "  --output <path>   Export tally (.csv, .json or .parquet)\n"
              << "  --quiet           No progress output\n"
              << "  --help            Show this message\n";
}

}  // namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    SimulationConfig config;
    std::string template_path;
    std::string output_path;
    bool quiet = false;

    try {
        // Preset first so explicit flags override it regardless of order.
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--preset" && i + 1 < argc) {
                config = SimulationConfig::preset(argv[i + 1]);
            }
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--preset" && i + 1 < argc) {
                ++i;
            } else if (arg == "--trials" && i + 1 < argc) {
                config.trial_count = std::stoll(argv[++i]);
            } else if (arg == "--lower" && i + 1 < argc) {
                config.lower_bound = std::stod(argv[++i]);
            } else if (arg == "--upper" && i + 1 < argc) {
                config.upper_bound = std::stod(argv[++i]);
            } else if (arg == "--tent") {
                config.tent_mode = true;
            } else if (arg == "--independent") {
                config.tent_mode = false;
            } else if (arg == "--precision" && i + 1 < argc) {
                config.bisection_precision = std::stoll(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                config.seed = std::stoull(argv[++i]);
            } else if (arg == "--workers" && i + 1 < argc) {
                config.num_workers = std::stoi(argv[++i]);
            } else if (arg == "--template" && i + 1 < argc) {
                template_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--quiet") {
                quiet = true;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!template_path.empty() && !std::filesystem::exists(template_path)) {
        std::cerr << ResourceNotFound(template_path).what() << "\n";
        return 2;
    }

    try {
        SimulationDriver driver(config);
        int last_pct = -1;
        if (!quiet) {
            std::cerr << "Simulating " << config.trial_count << " trials ("
                      << sampling_mode_str(config.mode()) << ", ["
                      << config.lower_bound << ", " << config.upper_bound << "], "
                      << config.num_workers << " worker(s))\n";
            driver.set_progress_callback([&last_pct](int64_t done, int64_t total) {
                int pct = static_cast<int>(done * 100 / total);
                if (pct / 10 != last_pct / 10) {
                    std::cerr << "  " << pct << "%" << "\n" << std::flush;
                    last_pct = pct;
                }
            });
        }

        auto t0 = std::chrono::steady_clock::now();
        SimulationResult result = driver.run();
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0);
        if (!quiet) {
            std::cerr << "Done in " << std::fixed << std::setprecision(2)
                      << elapsed.count() << "s (seed " << result.seed << ")\n";
        }

        if (!output_path.empty()) {
            write_tally(output_path, result);
            if (!quiet) std::cerr << "Wrote tally: " << output_path << "\n";
        }

        if (!template_path.empty()) {
            int labels = venn::render_diagram_file(template_path, std::cout, result.tally);
            if (!quiet) std::cerr << "Substituted " << labels << " region labels\n";
        } else {
            print_summary(std::cout, result);
        }
    } catch (const ResourceNotFound& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
