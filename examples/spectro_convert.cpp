#include <spectro_bin/spectro_bin.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <map>
#include <system_error>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file1> [<file2> ...]\n";
    std::cerr << "Converts spectrophotometer binary exports to CSV.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output-dir <dir>  Write CSV files into <dir>\n";
    std::cerr << "  -h, --help              Show this help\n";
}

// Outputs written so far in this run, keyed by normalized path
using written_map = std::map<std::filesystem::path, std::filesystem::path>;

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return canonical;
}

bool convert(const std::filesystem::path& input,
             const std::filesystem::path& output_dir,
             written_map& written) {
    const auto output = spectro_bin::csv_path_for(input, output_dir);
    const auto key = normalized(output);

    auto previous = written.find(key);
    if (previous != written.end()) {
        std::cerr << "Error processing " << input.string() << ": " << output.string()
                  << " was already written for " << previous->second.string() << "\n";
        return false;
    }

    spectro_bin::csv_spectrum spectrum;
    auto result = spectro_bin::decode_file(input, spectrum);
    if (!result) {
        std::cerr << "Error processing " << input.string() << ": " << result.message << "\n";
        return false;
    }

    if (!spectrum.save(output)) {
        std::cerr << "Error processing " << input.string() << ": Failed to save: "
                  << output.string() << "\n";
        return false;
    }

    std::cout << "Processed " << input.string() << " ("
              << spectro_bin::to_string(spectrum.format()) << "), saved "
              << output.string() << "\n";
    written.emplace(key, input);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path output_dir;
    std::vector<std::filesystem::path> inputs;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (std::strcmp(argv[i], "-o") == 0 || std::strcmp(argv[i], "--output-dir") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires a directory\n";
                return 1;
            }
            output_dir = argv[++i];
            continue;
        }

        inputs.emplace_back(argv[i]);
    }

    if (inputs.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (!output_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            std::cerr << "Error: Cannot create output directory: " << output_dir.string()
                      << " (" << ec.message() << ")\n";
            return 1;
        }
    }

    // Each file stands alone; a failure never stops the batch
    written_map written;
    int failures = 0;
    for (const auto& input : inputs) {
        if (!convert(input, output_dir, written)) {
            ++failures;
        }
    }

    return failures == 0 ? 0 : 1;
}
