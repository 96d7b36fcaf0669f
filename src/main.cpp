#include "sphere/sphere.hpp"

#include <filesystem>
#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <input> [options]\n"
        << "\nConvert a SPHERE or WAVE file to WAVE, SPHERE or RAW.\n"
        << "The input format is detected from the file contents.\n"
        << "\nOptions:\n"
        << "  -o, --output PATH   Output file or directory (default: input\n"
        << "                      name with the output format suffix)\n"
        << "  -f, --format FMT    Output format: wav, sph or raw (default:\n"
        << "                      wav for SPHERE input, sph for WAVE input)\n"
        << std::endl;
}

static const char *format_label(sphere::AudioFormat fmt) {
    switch (fmt) {
    case sphere::AudioFormat::SPHERE:
        return "SPHERE";
    case sphere::AudioFormat::WAV:
        return "WAVE";
    case sphere::AudioFormat::RAW:
        return "RAW";
    default:
        return "unknown";
    }
}

int main(int argc, char *argv[]) {
    namespace fs = std::filesystem;
    using sphere::AudioFormat;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {

        // Parse arguments
        std::string input;
        std::string output;
        AudioFormat out_format = AudioFormat::Unknown;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                output = argv[++i];
            } else if ((arg == "-f" || arg == "--format") && i + 1 < argc) {
                out_format = sphere::parse_format_name(argv[++i]);
                if (out_format == AudioFormat::Unknown) {
                    std::cerr << "Unknown format: " << argv[i] << std::endl;
                    print_usage(argv[0]);
                    return 1;
                }
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (input.empty() && !arg.starts_with("-")) {
                input = arg;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (input.empty()) {
            print_usage(argv[0]);
            return 1;
        }
        if (!fs::is_regular_file(input)) {
            std::cerr << "Error: Input file is not found: \"" << input << "\""
                      << std::endl;
            return 1;
        }

        auto in_format = sphere::detect_file_format(input);
        if (in_format == AudioFormat::Unknown) {
            std::cerr << "Error: Input file type is not supported: \""
                      << input << "\"" << std::endl;
            return 1;
        }

        if (out_format == AudioFormat::Unknown) {
            out_format = in_format == AudioFormat::SPHERE ? AudioFormat::WAV
                                                          : AudioFormat::SPHERE;
        }

        // Resolve the output path
        std::string suffix = "." + sphere::format_suffix(out_format);
        fs::path out_path;
        if (output.empty()) {
            out_path = fs::path(input).replace_extension(suffix);
        } else if (fs::is_directory(output)) {
            out_path = fs::path(output) /
                       (fs::path(input).stem().string() + suffix);
        } else {
            out_path = output;
        }
        if (fs::exists(out_path) && fs::equivalent(out_path, input)) {
            std::cerr << "Error: Output would overwrite the input: \""
                      << input << "\"" << std::endl;
            return 1;
        }

        sphere::convert_file(input, out_path.string(), out_format);

        std::cout << "Success: Dump the " << format_label(out_format)
                  << " file: \"" << out_path.string() << "\"" << std::endl;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
