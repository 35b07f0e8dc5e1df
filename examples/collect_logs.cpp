/**
 * @file collect_logs.cpp
 * @brief Command-line log collection from a controller and this machine
 *
 * This example demonstrates:
 * - Connecting to a controller over SSH with password or key authentication
 * - Listing remote log files with filters before collecting
 * - Running a collection job and following its progress events
 * - Reporting recoverable errors and the produced artifacts
 */

#include <kcenon/log_collector/log_collector.h>
#include <kcenon/log_collector/core/logging.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <variant>

using namespace kcenon::log_collector;

namespace {

/**
 * @brief Render one event on the console
 * @return true once the job reached a terminal state
 */
auto print_event(const collector_event& event) -> bool {
    return std::visit(
        [](const auto& e) -> bool {
            using event_type = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<event_type, connection_state_changed>) {
                std::cout << "[connection] " << e.host << ": " << to_string(e.state)
                          << std::endl;
                return false;
            } else if constexpr (std::is_same_v<event_type, job_progress>) {
                auto percent = e.total_bytes == 0
                                   ? 0.0
                                   : static_cast<double>(e.transferred_bytes) /
                                         static_cast<double>(e.total_bytes) * 100.0;
                std::cout << "\r[" << (e.phase ? to_string(*e.phase) : "starting") << "] "
                          << std::fixed << std::setprecision(1) << percent << "% ("
                          << filter_engine::format_size(e.transferred_bytes) << " / "
                          << filter_engine::format_size(e.total_bytes) << ") "
                          << e.current_file << "          " << std::flush;
                return false;
            } else if constexpr (std::is_same_v<event_type, disk_space_warning>) {
                std::cout << std::endl
                          << "[warning] " << e.location << " is nearly full: "
                          << filter_engine::format_size(e.available_bytes) << " available, "
                          << filter_engine::format_size(e.required_bytes) << " needed"
                          << std::endl;
                return false;
            } else if constexpr (std::is_same_v<event_type, job_failed>) {
                std::cout << std::endl << "Collection failed: " << e.reason.message << std::endl;
                return true;
            } else {
                std::cout << std::endl
                          << "Collection " << to_string(e.summary.status) << std::endl;
                return true;
            }
        },
        event);
}

void print_summary(const collection_job& job) {
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "       Collection Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Status:      " << to_string(job.status) << std::endl;
    std::cout << "Destination: " << job.destination.string() << std::endl;
    std::cout << "Files:       " << job.files_collected << " of " << job.files_discovered
              << std::endl;
    std::cout << "Size:        " << filter_engine::format_size(job.total_bytes) << std::endl;
    std::cout << "Duration:    " << job.duration().count() << " ms" << std::endl;
    if (job.deleted_sources > 0) {
        std::cout << "Deleted:     " << job.deleted_sources << " source files" << std::endl;
    }

    if (!job.produced_artifacts.empty()) {
        std::cout << std::endl << "Artifacts:" << std::endl;
        for (const auto& artifact : job.produced_artifacts) {
            std::cout << "  " << artifact.string() << std::endl;
        }
    }

    if (!job.errors.empty()) {
        std::cout << std::endl << "Errors (" << job.errors.size() << "):" << std::endl;
        for (const auto& err : job.errors) {
            std::cout << "  " << (err.file_path.empty() ? "-" : err.file_path) << ": "
                      << err.message << std::endl;
        }
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Collect Logs - Log Collector" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <controller_host> <destination_dir>"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Sources (at least one):" << std::endl;
    std::cout << "  --kernel                Controller kernel logs (/var/log/)" << std::endl;
    std::cout << "  --server                Controller application logs (/opt/myapp/logs/)"
              << std::endl;
    std::cout << "  --client <dir>          Log directory on this machine" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --user <name>       SSH user (default: root)" << std::endl;
    std::cout << "  -p, --port <port>       SSH port (default: 22)" << std::endl;
    std::cout << "  --password <secret>     Password authentication" << std::endl;
    std::cout << "  --key <file>            Private key authentication" << std::endl;
    std::cout << "  --since <YYYY-MM-DD>    Only files modified since this date" << std::endl;
    std::cout << "  --pattern <regex>       Only file names matching the expression"
              << std::endl;
    std::cout << "  -z, --compress          Produce archives instead of plain copies"
              << std::endl;
    std::cout << "  --delete                Delete sources once collected and verified"
              << std::endl;
    std::cout << "  --list                  List matching remote files and exit" << std::endl;
    std::cout << "  --json-logs             Emit diagnostic logs as JSON" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --kernel --password secret 192.168.1.100 ./collected"
              << std::endl;
    std::cout << "  " << program
              << " --server --client ~/.myapp/logs -z --since 2025-01-01 controller ./out"
              << std::endl;
    std::cout << "  " << program << " --kernel --key ~/.ssh/id_ed25519 --list controller ."
              << std::endl;
}

int main(int argc, char* argv[]) {
    connection_profile profile;
    collection_request request;
    std::string password;
    std::string key_path;
    std::string since;
    std::string pattern;
    bool list_only = false;
    std::string host;
    std::string destination;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--kernel") {
            request.sources.push_back(source_spec::linux_kernel_logs());
        } else if (arg == "--server") {
            request.sources.push_back(source_spec::linux_server_logs());
        } else if (arg == "--client") {
            if (++i >= argc) {
                std::cerr << "Error: --client requires an argument" << std::endl;
                return 1;
            }
            request.sources.push_back(source_spec::local_client_logs(argv[i]));
        } else if (arg == "-u" || arg == "--user") {
            if (++i >= argc) {
                std::cerr << "Error: --user requires an argument" << std::endl;
                return 1;
            }
            profile.username = argv[i];
        } else if (arg == "-p" || arg == "--port") {
            if (++i >= argc) {
                std::cerr << "Error: --port requires an argument" << std::endl;
                return 1;
            }
            std::string port = argv[i];
            if (auto valid = validate_port(port); !valid) {
                std::cerr << "Error: " << valid.error().message << std::endl;
                return 1;
            }
            profile.port = static_cast<uint16_t>(std::stoi(port));
        } else if (arg == "--password") {
            if (++i >= argc) {
                std::cerr << "Error: --password requires an argument" << std::endl;
                return 1;
            }
            password = argv[i];
        } else if (arg == "--key") {
            if (++i >= argc) {
                std::cerr << "Error: --key requires an argument" << std::endl;
                return 1;
            }
            key_path = argv[i];
        } else if (arg == "--since") {
            if (++i >= argc) {
                std::cerr << "Error: --since requires an argument" << std::endl;
                return 1;
            }
            since = argv[i];
        } else if (arg == "--pattern") {
            if (++i >= argc) {
                std::cerr << "Error: --pattern requires an argument" << std::endl;
                return 1;
            }
            pattern = argv[i];
        } else if (arg == "-z" || arg == "--compress") {
            request.compress = true;
        } else if (arg == "--delete") {
            request.delete_after_collect = true;
        } else if (arg == "--list") {
            list_only = true;
        } else if (arg == "--json-logs") {
            get_logger().set_output_format(log_output_format::json);
        } else if (arg[0] != '-') {
            if (host.empty()) {
                host = arg;
            } else if (destination.empty()) {
                destination = arg;
            }
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        }
    }

    if (host.empty() || destination.empty() || request.sources.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    profile.host = host;
    profile.credential = key_path.empty() ? auth_credential::with_password(password)
                                          : auth_credential::with_private_key(key_path);
    request.destination_root = std::filesystem::absolute(destination);

    if (!since.empty()) {
        auto filter = filter_config::date_since(since);
        if (!filter) {
            std::cerr << "Error: " << filter.error().message << std::endl;
            return 1;
        }
        request.filters.push_back(std::move(filter.value()));
    }
    if (!pattern.empty()) {
        auto filter = filter_config::pattern(pattern);
        if (!filter) {
            std::cerr << "Error: " << filter.error().message << std::endl;
            return 1;
        }
        request.filters.push_back(std::move(filter.value()));
    }

    auto service_result = collector_service::builder().build();
    if (!service_result.has_value()) {
        std::cerr << "Failed to create service: " << service_result.error().message
                  << std::endl;
        return 1;
    }
    auto& service = service_result.value();

    bool needs_session = false;
    for (const auto& source : request.sources) {
        needs_session = needs_session || source.is_remote();
    }

    if (needs_session) {
        std::cout << "Connecting to " << profile.endpoint() << "..." << std::endl;
        auto connected = service.connect(profile);
        if (!connected.has_value()) {
            std::cerr << "Failed to connect: " << connected.error().message << std::endl;
            std::cerr << std::endl;
            std::cerr << "Troubleshooting:" << std::endl;
            std::cerr << "  - Check that sshd is running on the controller" << std::endl;
            std::cerr << "  - Verify user, password or key" << std::endl;
            std::cerr << "  - Check firewall settings for port " << profile.port << std::endl;
            return 1;
        }
    }

    if (list_only) {
        for (const auto& source : request.sources) {
            if (!source.is_remote()) {
                continue;
            }
            auto listing = service.list_remote_files(source, request.filters);
            if (!listing.has_value()) {
                std::cerr << source.label << ": " << listing.error().message << std::endl;
                continue;
            }
            std::cout << std::endl << source.label << " (" << source.root_path << ")" << std::endl;
            for (const auto& entry : listing.value().entries) {
                std::cout << "  " << std::left << std::setw(48) << entry.path << std::right
                          << std::setw(12) << filter_engine::format_size(entry.size)
                          << std::endl;
            }
            std::cout << "  " << listing.value().entries.size() << " files, "
                      << filter_engine::format_size(listing.value().total_size()) << std::endl;
            for (const auto& err : listing.value().errors) {
                std::cout << "  skipped " << err.file_path << ": " << err.message << std::endl;
            }
        }
        service.disconnect();
        return 0;
    }

    auto id = service.start_collection(request);
    if (!id.has_value()) {
        std::cerr << "Failed to start collection: " << id.error().message << std::endl;
        service.disconnect();
        return 1;
    }

    auto events = service.events();
    bool finished = false;
    while (!finished) {
        auto event = events->wait_pop(std::chrono::milliseconds(500));
        if (event) {
            finished = print_event(*event);
            continue;
        }
        auto snapshot = service.snapshot(id.value());
        finished = !snapshot.has_value() || snapshot.value().is_terminal();
    }

    auto job = service.wait(id.value(), std::chrono::seconds(30));
    if (!job.has_value()) {
        std::cerr << "Failed to read job: " << job.error().message << std::endl;
        service.disconnect();
        return 1;
    }
    print_summary(job.value());
    (void)service.acknowledge(id.value());
    service.disconnect();

    return job.value().status == job_status::completed ? 0 : 1;
}
