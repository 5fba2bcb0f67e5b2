/**
 * @file cli.cpp
 * @brief msgunpack command line interface.
 *
 * Decodes a file of concatenated MessagePack values and prints one
 * rendering per line.
 */

#include <msgunpack/msgunpack.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace msgunpack;

static void print_version() {
    std::printf("msgunpack %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nMessagePack decoder (v%s)\n", version());
    std::printf("==========================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <input>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -t             Decode arrays as tuples\n");
    std::printf("  -o             Decode maps with significant key order\n");
    std::printf("  -u             Pass invalid UTF-8 strings through as binary\n");
    std::printf("  -d <depth>     Maximum array/map nesting (default %zu)\n", MAX_DEPTH);
    std::printf("  -1             Decode only the first value\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  input          Input file, or - for standard input\n\n");
    std::printf("Examples:\n");
    std::printf("  %s data.msgpack\n", prog_name);
    std::printf("  %s -t -d 32 - < data.msgpack\n\n", prog_name);
}

static bool read_input(const std::string& path, std::vector<std::uint8_t>& buffer) {
    if (path == "-") {
        std::istreambuf_iterator<char> begin(std::cin);
        std::istreambuf_iterator<char> end;
        buffer.assign(begin, end);
        return !std::cin.bad();
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return false;
    }

    return true;
}

static int do_decode(const char* input_path, const UnpackOptions& options, bool first_only) {
    std::vector<std::uint8_t> input_data;
    if (!read_input(input_path, input_data)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    if (input_data.empty()) {
        std::fprintf(stderr, "Error: Input is empty: %s\n", input_path);
        return 1;
    }

    BufferSource source(input_data.data(), input_data.size());
    ByteReader reader(source);

    std::size_t count = 0;
    while (source.remaining() > 0) {
        std::size_t offset = reader.position();

        Value value;
        auto result = unpack(reader, options, value);
        if (result != Error::Ok) {
            std::fprintf(stderr, "Error: %s (value %zu at offset %zu)\n", error_string(result),
                         count, offset);
            return 1;
        }

        std::printf("%s\n", to_string(value).c_str());
        ++count;

        if (first_only) {
            break;
        }
    }

    return 0;
}

int main(int argc, char** argv) {
    UnpackOptions options;
    bool first_only = false;
    const char* input_path = nullptr;

    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-t") == 0) {
            options.use_tuple = true;
        } else if (std::strcmp(arg, "-o") == 0) {
            options.use_ordered_dict = true;
        } else if (std::strcmp(arg, "-u") == 0) {
            options.allow_invalid_utf8 = true;
        } else if (std::strcmp(arg, "-1") == 0) {
            first_only = true;
        } else if (std::strcmp(arg, "-d") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: -d requires a depth argument\n");
                return 1;
            }
            int depth = std::atoi(argv[++i]);
            if (depth < 0) {
                std::fprintf(stderr, "Error: depth must not be negative\n");
                return 1;
            }
            options.max_depth = static_cast<std::size_t>(depth);
        } else if (std::strcmp(arg, "-") != 0 && arg[0] == '-') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
            return 1;
        } else if (input_path == nullptr) {
            input_path = arg;
        } else {
            std::fprintf(stderr, "Error: Only one input may be given\n");
            return 1;
        }
    }

    if (input_path == nullptr) {
        std::fprintf(stderr, "Error: No input given\n");
        std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
        return 1;
    }

    return do_decode(input_path, options, first_only);
}
