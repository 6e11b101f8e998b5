#include "skyup/client/config.hpp"
#include "skyup/client/skynet_client.hpp"
#include "skyup/network/http_client.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace asio = boost::asio;
namespace fs = std::filesystem;

using skyup::upload::ProgressKind;

namespace {

struct CommandLine {
    std::string file;
    std::optional<std::string> portal;
    std::optional<std::string> config_path;
    skyup::upload::UploadOverrides overrides;
    bool verbose = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <file> [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --portal URL          Portal to upload to (default: " << skyup::client::kDefaultPortalUrl << ")\n";
    std::cout << "  --config FILE         JSON client config\n";
    std::cout << "  --parallel N          Number of parallel upload sessions\n";
    std::cout << "  --multiplier N        Chunk size multiplier\n";
    std::cout << "  --stagger P|none      Start each part after P% of the previous part's first chunk\n";
    std::cout << "  --dry-run             Ask the portal not to store the file\n";
    std::cout << "  --filename NAME       Name to upload the file under\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  --help                Show this help message\n";
}

std::optional<std::int64_t> parse_number(const std::string& flag, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            spdlog::error("Invalid value for {}: {}", flag, text);
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        spdlog::error("Invalid value for {}: {}", flag, text);
        return std::nullopt;
    }
}

/// RETURNS: exit code to stop with, or nullopt to continue
std::optional<int> parse_command_line(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) {
                return std::string(argv[++i]);
            }
            spdlog::error("{} requires a value", arg);
            return std::nullopt;
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--portal") {
            auto value = next();
            if (!value) return 1;
            cli.portal = *value;
        } else if (arg == "--config") {
            auto value = next();
            if (!value) return 1;
            cli.config_path = *value;
        } else if (arg == "--parallel" || arg == "--multiplier") {
            auto value = next();
            if (!value) return 1;
            auto number = parse_number(arg, *value);
            if (!number) return 1;
            if (arg == "--parallel") {
                cli.overrides.num_parallel_uploads = *number;
            } else {
                cli.overrides.chunk_size_multiplier = *number;
            }
        } else if (arg == "--stagger") {
            auto value = next();
            if (!value) return 1;
            if (*value == "none") {
                cli.overrides.stagger_percent = std::optional<int>();
            } else {
                auto number = parse_number(arg, *value);
                if (!number) return 1;
                auto percent = skyup::upload::checked_stagger_percent(*number);
                if (percent.is_error()) {
                    spdlog::error("{}", percent.error().message);
                    return 1;
                }
                cli.overrides.stagger_percent = std::optional<int>(percent.value());
            }
        } else if (arg == "--dry-run") {
            cli.overrides.dry_run = true;
        } else if (arg == "--filename") {
            auto value = next();
            if (!value) return 1;
            cli.overrides.custom_filename = *value;
        } else if (arg == "--verbose") {
            cli.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        } else if (cli.file.empty()) {
            cli.file = arg;
        } else {
            spdlog::error("Only one file can be uploaded at a time");
            return 1;
        }
    }

    if (cli.file.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    return std::nullopt;
}

void log_progress(skyup::upload::ProgressChannel& progress) {
    int last_percent = -1;
    while (auto event = progress.pop()) {
        switch (event->kind) {
            case ProgressKind::BytesSent: {
                if (event->total_bytes == 0) {
                    break;
                }
                const int percent = static_cast<int>(event->bytes_sent * 100 / event->total_bytes);
                if (percent != last_percent) {
                    last_percent = percent;
                    spdlog::info("{}% ({} / {} bytes)", percent, event->bytes_sent, event->total_bytes);
                }
                break;
            }
            case ProgressKind::PartStarted:
            case ProgressKind::PartCompleted:
                spdlog::debug("Part {}: {}", event->part_index, skyup::upload::to_string(event->kind));
                break;
            case ProgressKind::Retrying:
                spdlog::warn("Part {}: {}", event->part_index, event->detail);
                break;
            case ProgressKind::Finalizing:
                spdlog::info("Finalizing upload");
                break;
            default:
                break;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CommandLine cli;
    if (auto exit_code = parse_command_line(argc, argv, cli)) {
        return *exit_code;
    }

    skyup::client::ClientConfig config;
    if (cli.config_path) {
        auto loaded = skyup::client::load_client_config(*cli.config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error().describe() << "\n";
            return 2;
        }
        config = loaded.value();
    }
    if (cli.portal) {
        config.portal_url = *cli.portal;
    }
    spdlog::set_level(cli.verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));

    auto http = skyup::network::HttpClient::create();
    if (http.is_error()) {
        std::cerr << http.error().describe() << "\n";
        return 2;
    }
    std::shared_ptr<skyup::network::HttpTransport> transport = std::move(http.value());

    auto client = skyup::client::SkynetClient::create(config, transport);
    if (client.is_error()) {
        std::cerr << client.error().describe() << "\n";
        return 2;
    }

    skyup::upload::UploadContext context;
    context.cancel = std::make_shared<skyup::CancellationToken>();
    context.progress = std::make_shared<skyup::upload::ProgressChannel>();

    // Ctrl-C cancels the upload instead of killing the process.
    asio::io_context signals_io;
    asio::signal_set signals(signals_io, SIGINT, SIGTERM);
    auto cancel = context.cancel;
    signals.async_wait([cancel](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::warn("Received signal {}, cancelling upload", signal_number);
            cancel->cancel();
        }
    });
    std::thread signal_thread([&signals_io]() { signals_io.run(); });

    std::thread progress_thread([progress = context.progress]() { log_progress(*progress); });

    spdlog::info("Uploading {} to {}", fs::path(cli.file).string(), config.portal_url);
    auto outcome = client.value()->upload_file(cli.file, cli.overrides, context);

    progress_thread.join();
    signals_io.stop();
    signal_thread.join();

    if (outcome.is_error()) {
        std::cerr << outcome.error().describe() << "\n";
        return outcome.error().code == skyup::ErrorCode::Cancelled ? 130 : 1;
    }

    std::cout << outcome.value().uri << std::endl;
    return 0;
}
