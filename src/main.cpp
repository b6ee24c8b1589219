#include "backend/Config.hpp"
#include "backend/Errors.hpp"
#include "backend/Indexer.hpp"
#include "backend/MetadataParser.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr int EXIT_USAGE = 2;

struct CommandLine {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> music_directory;
    std::optional<std::filesystem::path> cache_directory;
    std::optional<size_t> workers;
    bool force_refresh = false;
    bool only_profile = false;
    bool no_playlists = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: strata [options]\n"
           "\n"
           "Indexes a music directory into a categorized catalogue.\n"
           "\n"
           "  -c, --config PATH      Config file (default: ~/.config/strata/config.toml)\n"
           "  -m, --music-dir DIR    Music directory to index\n"
           "  -d, --cache-dir DIR    Directory for the record cache and catalogue\n"
           "  -f, --force-refresh    Re-read tags of every file\n"
           "  -o, --only-profile     Rebuild the catalogue from cached records, no scan\n"
           "  -n, --no-playlists     Do not import playlists\n"
           "  -w, --workers N        Parallel tag readers (default: number of CPUs)\n"
           "  -v, --verbose          Debug logging\n"
           "  -h, --help             Show this help\n";
}

// nullopt on usage errors (already reported)
std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    static const struct option long_options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"music-dir", required_argument, nullptr, 'm'},
        {"cache-dir", required_argument, nullptr, 'd'},
        {"force-refresh", no_argument, nullptr, 'f'},
        {"only-profile", no_argument, nullptr, 'o'},
        {"no-playlists", no_argument, nullptr, 'n'},
        {"workers", required_argument, nullptr, 'w'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    CommandLine cmd;
    int opt;
    while ((opt = getopt_long(argc, argv, "c:m:d:fonw:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c': cmd.config_file = optarg; break;
            case 'm': cmd.music_directory = optarg; break;
            case 'd': cmd.cache_directory = optarg; break;
            case 'f': cmd.force_refresh = true; break;
            case 'o': cmd.only_profile = true; break;
            case 'n': cmd.no_playlists = true; break;
            case 'v': cmd.verbose = true; break;
            case 'h': cmd.help = true; break;
            case 'w': {
                char* end = nullptr;
                long n = std::strtol(optarg, &end, 10);
                if (*optarg == '\0' || *end != '\0' || n < 1) {
                    std::cerr << "strata: --workers expects a positive number, got '" << optarg << "'\n";
                    return std::nullopt;
                }
                cmd.workers = static_cast<size_t>(n);
                break;
            }
            default:
                // getopt_long already printed the problem
                return std::nullopt;
        }
    }
    if (optind < argc) {
        std::cerr << "strata: unexpected argument '" << argv[optind] << "'\n";
        return std::nullopt;
    }
    return cmd;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace backend = strata::backend;
    using strata::util::Logger;

    auto cmd = parse_command_line(argc, argv);
    if (!cmd) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    if (cmd->help) {
        print_usage(std::cout);
        return EXIT_SUCCESS;
    }

    try {
        backend::Config config = cmd->config_file ? backend::ConfigLoader::load_from_file(*cmd->config_file)
                                                  : backend::ConfigLoader::load_config();

        if (cmd->music_directory) config.music_directory = *cmd->music_directory;
        if (cmd->cache_directory) config.cache_directory = *cmd->cache_directory;
        if (cmd->workers) config.workers = *cmd->workers;

        Logger::init(config.log_file.empty() ? config.cache_directory / "strata.log" : config.log_file);
        Logger::set_level(cmd->verbose ? Logger::Level::Debug : Logger::parse_level(config.log_level));
        Logger::info("strata starting");

        backend::RunOptions options;
        options.force_refresh = cmd->force_refresh || config.force_refresh;
        options.skip_scan = cmd->only_profile;
        options.playlists = !cmd->no_playlists;
        options.workers = config.workers;

        backend::MetadataParser extractor;
        backend::Indexer indexer(config, extractor);
        strata::model::Catalogue catalogue = indexer.run(options);

        std::cout << "Indexed " << config.music_directory.string() << ": "
                  << catalogue.categories.size() << " categories, "
                  << catalogue.playlists.size() << " playlists\n"
                  << "Catalogue: " << backend::Indexer::catalogue_path(config.cache_directory).string() << "\n";

        Logger::info("strata finished");
        return EXIT_SUCCESS;
    } catch (const strata::Error& e) {
        Logger::error(e.what());
    } catch (const std::exception& e) {
        Logger::error(std::string("Unexpected error: ") + e.what());
    }
    return EXIT_FAILURE;
}
