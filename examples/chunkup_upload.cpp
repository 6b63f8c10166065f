/**
 * Upload a local file (or stdin) into a directory-backed object store using
 * parallel chunk uploads and a final compose.
 *
 * Usage:
 *   chunkup_upload --root <store dir> --key <object name> [--input <file>]
 *                  [--config <json>] [--chunk-size <bytes>] [--workers <n>]
 *                  [--cancel] [--verbose]
 */

#include "chunkup/storage/local_object_store.hpp"
#include "chunkup/upload/config.hpp"
#include "chunkup/upload/parallel_writer.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using chunkup::storage::LocalObjectStore;
using chunkup::upload::ParallelWriter;
using chunkup::upload::UploadConfig;
using chunkup::upload::WriterState;

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --root <dir> --key <name> [options]\n"
              << "  -r, --root <dir>          object store directory\n"
              << "  -k, --key <name>          logical object name\n"
              << "  -i, --input <file>        file to upload (default: stdin)\n"
              << "  -c, --config <file>       JSON upload config\n"
              << "      --chunk-size <bytes>  override chunk size\n"
              << "  -w, --workers <n>         override worker count\n"
              << "      --cancel              upload, then cancel instead of commit\n"
              << "  -v, --verbose             debug logging\n";
}

std::optional<std::size_t> parse_size(const std::string& text) {
    try {
        std::size_t pos = 0;
        const auto value = std::stoull(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path root;
    std::string key;
    std::optional<fs::path> input_path;
    std::optional<fs::path> config_path;
    std::optional<std::size_t> chunk_size;
    std::optional<std::size_t> workers;
    bool cancel = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-r" || arg == "--root") && i + 1 < argc) {
            root = fs::path(argv[++i]);
        } else if ((arg == "-k" || arg == "--key") && i + 1 < argc) {
            key = argv[++i];
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input_path = fs::path(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if (arg == "--chunk-size" && i + 1 < argc) {
            chunk_size = parse_size(argv[++i]);
            if (!chunk_size) {
                spdlog::error("Invalid --chunk-size");
                return 1;
            }
        } else if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            workers = parse_size(argv[++i]);
            if (!workers) {
                spdlog::error("Invalid --workers");
                return 1;
            }
        } else if (arg == "--cancel") {
            cancel = true;
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            spdlog::error("Unknown argument: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (root.empty() || key.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    UploadConfig config;
    if (config_path) {
        auto loaded = chunkup::upload::load_upload_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config {}: {}", config_path->string(), loaded.error().describe());
            return 1;
        }
        config = loaded.value();
    }
    if (chunk_size) {
        config.chunk_size = *chunk_size;
    }
    if (workers) {
        config.workers = *workers;
    }
    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("Invalid upload config: {}", valid.error().describe());
        return 1;
    }

    std::ifstream file;
    if (input_path) {
        file.open(*input_path, std::ios::binary);
        if (!file) {
            spdlog::error("Failed to open input {}", input_path->string());
            return 1;
        }
    }
    std::istream& input = input_path ? static_cast<std::istream&>(file) : std::cin;

    LocalObjectStore store(root);
    ParallelWriter writer(store, key, config);

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::uint8_t> block(kReadBlockSize);
    while (input) {
        input.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
        const auto count = static_cast<std::size_t>(input.gcount());
        if (count == 0) {
            break;
        }
        auto written = writer.write(block.data(), count);
        if (written.is_error()) {
            spdlog::error("Write failed: {}", written.error().describe());
            auto cancelled = writer.cancel();
            if (cancelled.is_error()) {
                spdlog::error("Cleanup failed: {}", cancelled.error().describe());
            }
            return 1;
        }
    }

    auto finished = cancel ? writer.cancel() : writer.commit();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (finished.is_error()) {
        spdlog::error("{} failed for {}: {}", cancel ? "Cancel" : "Commit", key, finished.error().describe());
        if (!cancel && writer.state() == WriterState::Committed) {
            spdlog::warn("{} was composed but some chunk objects could not be removed", key);
        } else if (!cancel) {
            auto cancelled = writer.cancel();
            if (cancelled.is_error()) {
                spdlog::error("Cleanup failed: {}", cancelled.error().describe());
            }
        }
        return 1;
    }

    const auto& stats = writer.stats();
    spdlog::info("{} {} bytes={} chunks={} compose_calls={} deleted={} duration={}ms",
                 cancel ? "Cancelled" : "Uploaded", key, writer.size(),
                 stats.chunks_uploaded.load(), stats.compose_calls.load(),
                 stats.objects_deleted.load(), elapsed.count());
    return 0;
}
