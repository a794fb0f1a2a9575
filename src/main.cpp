#include <ocr_layout/batch_inputs.h>
#include <ocr_layout/layout_reconstructor.h>
#include <ocr_layout/layout_options.h>
#include <ocr_layout/report_serializer.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace ocr_layout;

struct CLIOptions {
    std::string input_path;
    std::string output_path;
    std::string config_path;
    double calibration_factor = 0.0;     // 0 = keep configured value
    double column_gap = -1.0;            // < 0 = keep configured value
    double paragraph_gap = -1.0;
    int thread_count = 0;                // 0 = auto
    bool suggest_calibration = false;
    bool text_only = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input PATH           OCR chunks JSON file or directory of JSON files\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output PATH          Output file (single input) or directory (default: auto)\n";
    std::cout << "  -c, --config FILE          JSON config with \"layout\" and \"quality\" sections\n";
    std::cout << "  --calibration N            Font size calibration factor (default: 400)\n";
    std::cout << "  --column-gap X             Column gap threshold (default: 0.2)\n";
    std::cout << "  --paragraph-gap X          Paragraph gap threshold (default: 0.05)\n";
    std::cout << "  --threads N                Worker threads for directory input (default: auto)\n";
    std::cout << "  --suggest-calibration      Print a calibration factor suggested by the data\n";
    std::cout << "  --text-only                Write only the reading-order text\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (no warnings)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i chunks.json\n";
    std::cout << "  " << program_name << " -i ocr_out/ -o layouts/ --threads 4\n";
    std::cout << "  " << program_name << " -i scan.json --calibration 380 --text-only\n";
}

void print_version() {
    std::cout << "ocr-layout cli version 1.0.0\n";
    std::cout << "Built with C++17, nlohmann/json and RapidJSON\n";
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:c:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"calibration", required_argument, nullptr, 1001},
        {"column-gap", required_argument, nullptr, 1002},
        {"paragraph-gap", required_argument, nullptr, 1003},
        {"threads", required_argument, nullptr, 1004},
        {"suggest-calibration", no_argument, nullptr, 1005},
        {"text-only", no_argument, nullptr, 1006},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1007},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_path = optarg;
                break;
            case 'o':
                options.output_path = optarg;
                break;
            case 'c':
                options.config_path = optarg;
                break;
            case 1001:  // calibration
                options.calibration_factor = std::stod(optarg);
                if (options.calibration_factor <= 0.0) {
                    throw std::invalid_argument("calibration must be positive");
                }
                break;
            case 1002:  // column-gap
                options.column_gap = std::stod(optarg);
                if (options.column_gap < 0.0) {
                    throw std::invalid_argument("column-gap cannot be negative");
                }
                break;
            case 1003:  // paragraph-gap
                options.paragraph_gap = std::stod(optarg);
                if (options.paragraph_gap < 0.0) {
                    throw std::invalid_argument("paragraph-gap cannot be negative");
                }
                break;
            case 1004:  // threads
                options.thread_count = std::stoi(optarg);
                if (options.thread_count < 0) {
                    throw std::invalid_argument("thread count cannot be negative");
                }
                break;
            case 1005:
                options.suggest_calibration = true;
                break;
            case 1006:
                options.text_only = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1007:
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_path.empty()) {
        throw std::invalid_argument("Input path is required");
    }
    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

LayoutOptions build_layout_options(const CLIOptions& cli) {
    LayoutOptions options;
    if (!cli.config_path.empty()) {
        options = load_layout_options(cli.config_path);
    }
    if (cli.calibration_factor > 0.0) options.calibration_factor = cli.calibration_factor;
    if (cli.column_gap >= 0.0) options.column_gap_threshold = cli.column_gap;
    if (cli.paragraph_gap >= 0.0) options.paragraph_gap_threshold = cli.paragraph_gap;
    if (cli.thread_count > 0) options.thread_count = static_cast<size_t>(cli.thread_count);
    options.verbose = cli.verbose;
    options.quiet = cli.quiet;

    validate_layout_options(options);
    return options;
}

// Accepts a bare record array or a provider response with a "chunks" array
nlohmann::json load_records(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open input file: " + path);
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }

    if (document.is_object() && document.contains("chunks")) {
        return document["chunks"];
    }
    return document;
}

void write_output(const DocumentLayout& layout, const fs::path& output_path, bool text_only) {
    if (output_path.has_parent_path()) {
        fs::create_directories(output_path.parent_path());
    }
    std::ofstream out(output_path);
    if (!out) {
        throw std::runtime_error("Cannot write output file: " + output_path.string());
    }
    if (text_only) {
        out << layout.reconstruction.text;
    } else {
        out << ReportSerializer::to_json(layout, true);
    }
}

int process_single_file(const CLIOptions& cli, const LayoutOptions& options) {
    auto records = load_records(cli.input_path);
    LayoutReconstructor reconstructor(options);

    auto start = std::chrono::high_resolution_clock::now();
    auto layout = reconstructor.analyze(records);
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    fs::path output_path = cli.output_path;
    if (output_path.empty()) {
        fs::path input(cli.input_path);
        output_path = input.parent_path() / layout_output_name(input, cli.text_only);
    }
    write_output(layout, output_path, cli.text_only);

    if (!cli.quiet) {
        std::cout << "Saved layout of " << layout.structure.total_chunks << " fragments on "
                  << layout.structure.total_pages << " pages to " << output_path << std::endl;
        std::cout << "  Processing time: " << duration.count() << "ms" << std::endl;
        if (layout.reconstruction.used_fallback) {
            std::cout << "  Fallback used: " << layout.reconstruction.error << std::endl;
        }
        if (cli.verbose) {
            std::cout << "  Structure: " << layout.structure.to_json().dump(2) << std::endl;
        }
    }

    if (cli.suggest_calibration) {
        double factor = suggest_calibration_factor(layout.fragments, options.base_font_size, cli.quiet);
        std::cout << "Suggested calibration factor: " << std::fixed << std::setprecision(1)
                  << factor << std::endl;
    }
    return 0;
}

int process_directory(const CLIOptions& cli, const LayoutOptions& options) {
    fs::path output_dir = cli.output_path.empty() ? fs::path("./out") : fs::path(cli.output_path);
    auto inputs = plan_batch(cli.input_path, output_dir, cli.text_only);

    if (inputs.empty()) {
        std::cout << "No JSON files found in " << cli.input_path << std::endl;
        return 0;
    }

    std::vector<nlohmann::json> documents;
    std::vector<BatchInput> loaded;
    for (const auto& input : inputs) {
        try {
            documents.push_back(load_records(input.source.string()));
            loaded.push_back(input);
        } catch (const std::exception& e) {
            std::cerr << "✗ Error loading " << input.source << ": " << e.what() << std::endl;
        }
    }

    fs::create_directories(output_dir);

    LayoutReconstructor reconstructor(options);
    auto start_total = std::chrono::high_resolution_clock::now();

    auto layouts = reconstructor.analyze_batch(documents, [&cli](size_t current, size_t total) {
        if (!cli.quiet) {
            std::cout << "\rProgress: " << current << "/" << total
                      << " (" << (100 * current / total) << "%)" << std::flush;
        }
    });
    if (!cli.quiet) std::cout << std::endl;

    size_t success_count = 0;
    for (size_t i = 0; i < layouts.size(); ++i) {
        try {
            write_output(layouts[i], loaded[i].output, cli.text_only);
            success_count++;
        } catch (const std::exception& e) {
            std::cerr << "✗ Error writing " << loaded[i].output << ": " << e.what() << std::endl;
        }
    }

    auto end_total = std::chrono::high_resolution_clock::now();
    auto duration_total = std::chrono::duration_cast<std::chrono::milliseconds>(end_total - start_total);

    if (!cli.quiet) {
        auto stats = reconstructor.get_stats();
        std::cout << "\n=== Processing Complete ===\n";
        std::cout << "Successfully processed: " << success_count << "/" << inputs.size() << " files\n";
        std::cout << "Total time: " << duration_total.count() << " ms\n";
        std::cout << "Total pages: " << stats["pages_processed"] << std::endl;
        std::cout << "Fallbacks: " << stats["fallbacks"] << std::endl;
    }

    if (cli.suggest_calibration) {
        std::cout << std::fixed << std::setprecision(1);
        for (size_t i = 0; i < layouts.size(); ++i) {
            std::cout << loaded[i].source.string() << ": suggested calibration factor "
                      << suggest_calibration_factor(layouts[i].fragments, options.base_font_size, true)
                      << std::endl;
        }
        std::cout << "Suggested calibration factor (all documents): "
                  << suggest_batch_calibration_factor(layouts, options.base_font_size, cli.quiet)
                  << std::endl;
    }
    return success_count == inputs.size() ? 0 : 1;
}

int main(int argc, char* argv[]) {
    CLIOptions cli;
    try {
        cli = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (cli.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (cli.version) {
        print_version();
        return 0;
    }

    try {
        if (!fs::exists(cli.input_path)) {
            std::cerr << "Error: Input path does not exist: " << cli.input_path << std::endl;
            return 1;
        }

        LayoutOptions options = build_layout_options(cli);

        if (fs::is_regular_file(cli.input_path)) {
            return process_single_file(cli, options);
        }
        if (fs::is_directory(cli.input_path)) {
            return process_directory(cli, options);
        }
        std::cerr << "Error: Input must be a JSON file or directory" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
