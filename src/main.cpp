#include "config/toml_config_source.hpp"
#include "core/utils.hpp"
#include "dispatch/flush_dispatcher.hpp"
#include "ingest/msgpack_batch_decoder.hpp"
#include "plugin/plugin_host.hpp"

#include <cstdint>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace flbkinesis;

namespace {

struct Options {
    std::string config_file;
    std::string chunk_file;
    std::string tag = "replay";
    std::optional<std::chrono::milliseconds> timeout;
};

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} --config <outputs.toml> --chunk <chunk.msgpack> [--tag <tag>] [--timeout-ms N]\n",
        argv0);
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config" && has_value) {
            opts.config_file = argv[++i];
        } else if (arg == "--chunk" && has_value) {
            opts.chunk_file = argv[++i];
        } else if (arg == "--tag" && has_value) {
            opts.tag = argv[++i];
        } else if (arg == "--timeout-ms" && has_value) {
            const std::string value = argv[++i];
            try {
                opts.timeout = std::chrono::milliseconds(std::stoll(value));
            } catch (const std::exception&) {
                std::cerr << std::format("Invalid --timeout-ms value: {}\n", value);
                return std::nullopt;
            }
        } else {
            std::cerr << std::format("Unknown or incomplete argument: {}\n", arg);
            return std::nullopt;
        }
    }

    if (opts.config_file.empty() || opts.chunk_file.empty()) {
        return std::nullopt;
    }
    return opts;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error(std::format("Cannot open {}", path));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        const TomlConfigFile file = TomlConfigFile::parse_file(opts->config_file);

        std::optional<utils::log::Level> level;
        if (!file.runtime.log_level.empty()) {
            level = utils::log::parse_level(file.runtime.log_level);
            if (!level) {
                throw std::runtime_error(std::format("Unknown log_level '{}'", file.runtime.log_level));
            }
        }

        FlushDispatcher::Config dispatch_config;
        dispatch_config.worker_threads = file.runtime.workers;
        dispatch_config.task_timeout = file.runtime.task_timeout;
        dispatch_config.shutdown_timeout = opts->timeout.value_or(file.runtime.shutdown_timeout);

        PluginHost host(PluginHost::default_factory(), dispatch_config);
        host.configure_logging(level);

        std::vector<uint32_t> ids;
        for (const auto& output : file.outputs) {
            const auto result = host.on_init(output);
            if (result.is_error()) {
                utils::log::error(std::format("Output '{}' rejected: {}", output.name(),
                                              result.error_message()));
                return 1;
            }
            ids.push_back(result.value());
        }

        if (ids.empty()) {
            utils::log::error(std::format("{} defines no [[outputs]]", opts->config_file));
            return 1;
        }

        const std::string chunk = read_file(opts->chunk_file);
        utils::log::info(std::format("Replaying {} bytes from {} to {} output(s) with tag '{}'",
                                     chunk.size(), opts->chunk_file, ids.size(), opts->tag));

        int exit_code = 0;
        for (const uint32_t id : ids) {
            MsgpackBatchDecoder decoder(chunk.data(), chunk.size());
            const FlushOutcome outcome = host.on_flush(id, decoder, opts->tag);
            if (outcome != FlushOutcome::OK) {
                utils::log::error(std::format("[kinesis {}] flush returned {}", id,
                                              flush_outcome_to_string(outcome)));
                exit_code = 1;
            }
        }

        (void)host.on_exit();

        const auto stats = host.dispatcher().get_stats();
        std::cout << std::format(
            "dispatched={} succeeded={} failed={} retry_exhausted={} timed_out={} attempts={} null_skipped={}\n",
            stats.tasks_dispatched, stats.tasks_succeeded, stats.tasks_failed,
            stats.tasks_retry_exhausted, stats.tasks_timed_out, stats.attempts_total,
            stats.records_skipped_null);

        if (stats.tasks_succeeded != stats.tasks_dispatched) {
            exit_code = 1;
        }
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
