// Section 1: Main Header
#include "program_options.h"

// Section 2: Includes
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <sstream>
#include <string>

// Third-Party Includes
#include "termcolor/termcolor.hpp"

// Section 3: Defines and Macros
// (none)

// Section 4: Static Variables
// (none)

// Section 5: Static Helpers
namespace
{
    std::vector<std::string> splitList(const std::string &value)
    {
        std::vector<std::string> items;
        std::stringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ',')) {
            item.erase(0, item.find_first_not_of(" \t"));
            item.erase(item.find_last_not_of(" \t") + 1);
            if (!item.empty())
                items.push_back(item);
        }
        return items;
    }
}

// Section 6: Static Methods
void printusage()
{
    std::cout << termcolor::white << "Usage:" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "workspace-sync [--storage=<dir>] [--cfg=<cfgfile>] [-j jobs] [-y] [-v] [--dry-run] <command> [args]" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "Commands:" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "sync [standard|force_push|force_pull]" << "\t" << "run one sync pass and wait for it" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "status" << "\t" << "print the engine status" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "test [url]" << "\t" << "ping the configured or given endpoint" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "config show | config set KEY=VALUE..." << "\t" << "print or change the stored configuration" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "conflicts" << "\t" << "list outstanding conflicts" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "resolve <id|all> <local|remote>" << "\t" << "settle conflicts" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "snapshot create | list | restore <name> | delete <name> | export <name> [file]" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "logs [limit]" << "\t" << "print the most recent log entries" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "daemon" << "\t" << "keep running with auto-sync, read commands from stdin" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "Options:" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "--storage=<dir>" << "\t" << "storage root (default: " << DEFAULT_STORAGE_DIR << ")" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "--cfg=<cfgfile>" << "\t" << "KEY=VALUE settings applied over the stored configuration" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "-j" << "\t" << "hashing threads (default: 1)" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "-y" << "\t" << "skip Y/N prompts" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "-v" << "\t" << "print every indexed file" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "--dry-run" << "\t" << "with sync: plan and print the transfers without executing them" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "--export=<file>" << "\t" << "with --dry-run: write the transfer list to a file" << "\r\n" << termcolor::reset;
    std::cout << termcolor::white << "\t" << "--dump-index=<file>" << "\t" << "write the local manifest to a file after indexing" << "\r\n" << termcolor::reset;
}

ProgramOptions ProgramOptions::parseArgs(int argc, char *argv[])
{
    ProgramOptions opts;
    opts.storage = DEFAULT_STORAGE_DIR;

    if (argc < 2)
    {
        printusage();
        exit(EXIT_FAILURE);
    }

    static constexpr int kDryRunOption = 1;
    static constexpr int kConfigFileOption = 2;
    static constexpr int kStorageOption = 3;
    static constexpr int kExportOption = 4;
    static constexpr int kDumpIndexOption = 5;
    static constexpr int kHelpOption = 6;

    static constexpr std::array<option, 7> long_options{{
        {.name = "dry-run", .has_arg = no_argument, .flag = nullptr, .val = kDryRunOption},
        {.name = "cfg", .has_arg = required_argument, .flag = nullptr, .val = kConfigFileOption},
        {.name = "storage", .has_arg = required_argument, .flag = nullptr, .val = kStorageOption},
        {.name = "export", .has_arg = required_argument, .flag = nullptr, .val = kExportOption},
        {.name = "dump-index", .has_arg = required_argument, .flag = nullptr, .val = kDumpIndexOption},
        {.name = "help", .has_arg = no_argument, .flag = nullptr, .val = kHelpOption},
        {.name = nullptr, .has_arg = 0, .flag = nullptr, .val = 0}
    }};

    int chr;
    int option_index = 0;
    while ((chr = getopt_long(argc, argv, "+j:yvh", long_options.data(), &option_index)) != -1)
    {
        switch (chr)
        {
        case 'j':
        {
            unsigned jobs = 0;
            const std::string value(optarg);
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
            if (ec != std::errc() || ptr != value.data() + value.size() || jobs == 0) {
                std::cout << termcolor::red << "Invalid job count: " << value << "\r\n" << termcolor::reset;
                exit(EXIT_FAILURE);
            }
            opts.jobs = jobs;
        }
            break;
        case 'y':
            opts.assume_yes = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case kDryRunOption:
            opts.dry_run = true;
            break;
        case kStorageOption:
            opts.storage = std::filesystem::path(optarg);
            break;
        case kExportOption:
            opts.export_file = std::filesystem::path(optarg);
            break;
        case kDumpIndexOption:
            opts.index_file = std::filesystem::path(optarg);
            break;
        case kConfigFileOption:
            opts.config_file = std::filesystem::path(optarg);
            if (!std::filesystem::exists(*opts.config_file) || !std::filesystem::is_regular_file(*opts.config_file)) {
                std::cout << termcolor::red << "Config file not found or not a regular file: " << optarg << "\r\n" << termcolor::reset;
                exit(EXIT_FAILURE);
            }
            break;
        case 'h':
        case kHelpOption:
            printusage();
            exit(EXIT_SUCCESS);
        default:
        case '?':
            printusage();
            exit(EXIT_FAILURE);
        }
    }

    for (int i = optind; i < argc; ++i)
        opts.command.emplace_back(argv[i]);
    if (opts.command.empty())
    {
        printusage();
        exit(EXIT_FAILURE);
    }

    if (opts.config_file && opts.parseConfigFile() != 0)
        exit(EXIT_FAILURE);

    return opts;
}

// Section 7: Public Methods
std::pair<std::string, std::string> ProgramOptions::parseConfigLine(const std::string &line)
{
    // Find key-value delimiter
    auto pos = line.find('=');
    if (pos == std::string::npos) {
        return {"", ""};
    }

    std::string key = line.substr(0, pos);
    std::string value = line.substr(pos + 1);

    // Trim whitespace
    key.erase(0, key.find_first_not_of(" \t\r\n"));
    key.erase(key.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t\r\n"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    return {key, value};
}

int ProgramOptions::parseConfigFile()
{
    if (!config_file) {
        return 0;
    }

    std::ifstream file(*config_file);
    if (!file.is_open()) {
        std::cerr << termcolor::red << "Failed to open config file: " << *config_file << "\r\n" << termcolor::reset;
        return -1;
    }

    std::string line;
    int lineno = 0;
    while (std::getline(file, line)) {
        ++lineno;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        auto [key, value] = parseConfigLine(line);
        if (key.empty()) {
            std::cerr << termcolor::yellow << *config_file << ":" << lineno << ": expected KEY=VALUE" << "\r\n" << termcolor::reset;
            continue;
        }
        settings.emplace_back(key, value);
    }
    return 0;
}

int ProgramOptions::applySetting(SyncConfiguration &config, const std::string &key, const std::string &value)
{
    const auto size = parseSize(value);
    const auto flag = parseBool(value);

    if (key == "ENDPOINT") config.set_endpoint(value);
    else if (key == "USERNAME") config.set_username(value);
    else if (key == "PASSWORD") config.set_password(value);
    else if (key == "TOKEN") config.set_token(value);
    else if (key == "STRATEGY") config.set_strategy(value);
    else if (key == "CONFLICT_RESOLUTION") config.set_conflict_resolution(value);
    else if (key == "TRANSPORT") config.set_transport(value);
    else if (key == "AUTO_SYNC" && flag) config.set_auto_sync(*flag);
    else if (key == "AUTO_SYNC_INTERVAL_MINUTES" && size) config.set_auto_sync_interval_minutes(static_cast<uint32_t>(*size));
    else if (key == "CHUNKING" && flag) config.mutable_chunking()->set_enabled(*flag);
    else if (key == "CHUNK_SIZE" && size) config.mutable_chunking()->set_chunk_size(*size);
    else if (key == "CHUNK_THRESHOLD" && size) config.mutable_chunking()->set_threshold(*size);
    else if (key == "COMPRESSION" && flag) config.mutable_compression()->set_enabled(*flag);
    else if (key == "COMPRESSION_ALGORITHM") config.mutable_compression()->set_algorithm(value);
    else if (key == "COMPRESSION_MIN_SIZE" && size) config.mutable_compression()->set_min_size(*size);
    else if (key == "MAX_FILE_SIZE_BYTES" && size) config.mutable_filters()->set_max_file_size(*size);
    else if (key == "EXCLUDE_BINARY" && flag) config.mutable_filters()->set_exclude_binary(*flag);
    else if (key == "INCLUDE_PATHS") {
        config.mutable_filters()->clear_include_paths();
        for (const auto &pattern : splitList(value))
            config.mutable_filters()->add_include_paths(pattern);
    }
    else if (key == "EXCLUDE_PATHS") {
        config.mutable_filters()->clear_exclude_paths();
        for (const auto &pattern : splitList(value))
            config.mutable_filters()->add_exclude_paths(pattern);
    }
    else if (key == "MAX_RETRIES" && size) config.mutable_retry()->set_max_retries(static_cast<uint32_t>(*size));
    else if (key == "RETRY_DELAY_MS" && size) config.mutable_retry()->set_retry_delay_ms(static_cast<uint32_t>(*size));
    else if (key == "REALTIME" && flag) config.mutable_realtime()->set_enabled(*flag);
    else if (key == "REALTIME_PORT" && size) config.mutable_realtime()->set_port(static_cast<uint32_t>(*size));
    else if (key == "HEARTBEAT_INTERVAL_MS" && size) config.mutable_realtime()->set_heartbeat_interval_ms(static_cast<uint32_t>(*size));
    else if (key == "RECONNECT_BASE_DELAY_MS" && size) config.mutable_realtime()->set_reconnect_base_delay_ms(static_cast<uint32_t>(*size));
    else if (key == "MAX_RECONNECT_ATTEMPTS" && size) config.mutable_realtime()->set_max_reconnect_attempts(static_cast<uint32_t>(*size));
    else {
        std::cout << termcolor::red << "Unknown setting or invalid value: " << key << "=" << value << "\r\n" << termcolor::reset;
        return -1;
    }
    return 0;
}

// Section 8: Private Methods
std::optional<uint64_t> ProgramOptions::parseSize(const std::string &value)
{
    uint64_t result = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size())
        return std::nullopt;
    return result;
}

std::optional<bool> ProgramOptions::parseBool(const std::string &value)
{
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}
