#include "backend_process.hpp"
#include "card_reader.hpp"
#include "config.hpp"
#include "content.hpp"
#include "control_loop.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "mapping.hpp"
#include "session_controller.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop = true; }

static void setup_signals() {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
        sigaction(sig, &sa, nullptr);
    }
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <audio_dir> <mapping_file> [options]\n"
              << "\n"
              << "Play audio files selected by RFID/NFC cards. Present a card to start its\n"
              << "track or folder, present it again to pause or resume.\n"
              << "\n"
              << "Mapping file: one '<card id hex> [label ...] <file or folder>' per line.\n"
              << "\n"
              << "Options:\n"
              << "  --poll-ms <n>               Card poll interval (default: " << RFID_DEFAULT_POLL_MS << ")\n"
              << "  --removal-dwell <n>         Empty polls before a card counts as removed (default: "
              << RFID_DEFAULT_REMOVAL_DWELL << ")\n"
              << "  --failure-threshold <n>     Reader failures in a row before reporting (default: "
              << RFID_DEFAULT_FAILURE_THRESHOLD << ")\n"
              << "  --resume <position|restart> Resume in-track or restart the track (default: position)\n"
              << "  --on-end <stop|loop>        After the last track (default: stop)\n"
              << "  --on-remove <stop|keep>     When the card is lifted (default: stop)\n"
              << "  --player <command>          Player command line (default: \"" << RFID_DEFAULT_PLAYER_COMMAND << "\")\n"
              << "  --log-file <path>           Also append log lines to a file\n"
              << "  --verbose                   Debug logging\n"
              << "  --quiet                     Warnings and errors only\n"
              << "  --help                      Show this help message\n";
}

static int parse_count(const std::string& opt, const std::string& value) {
    size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != value.size() || n < 1) {
        throw std::invalid_argument(opt + " expects a positive number, got '" + value + "'");
    }
    return n;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Parse arguments
    PlayerConfig config;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--verbose") {
                log_set_level(LogLevel::Debug);
            } else if (arg == "--quiet") {
                log_set_level(LogLevel::Warn);
            } else if (arg == "--poll-ms" && has_value) {
                config.poll_interval_ms = parse_count(arg, argv[++i]);
            } else if (arg == "--removal-dwell" && has_value) {
                config.removal_dwell = parse_count(arg, argv[++i]);
            } else if (arg == "--failure-threshold" && has_value) {
                config.failure_threshold = parse_count(arg, argv[++i]);
            } else if (arg == "--resume" && has_value) {
                config.policy.resume = parse_resume_policy(argv[++i]);
            } else if (arg == "--on-end" && has_value) {
                config.policy.on_end = parse_end_policy(argv[++i]);
            } else if (arg == "--on-remove" && has_value) {
                config.policy.on_remove = parse_removal_policy(argv[++i]);
            } else if (arg == "--player" && has_value) {
                config.player_command = argv[++i];
            } else if (arg == "--log-file" && has_value) {
                config.log_file = argv[++i];
            } else if (arg[0] != '-') {
                positional.push_back(arg);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (positional.size() != 2) {
        std::cerr << "Error: Please specify an audio folder and a mapping file." << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    config.audio_dir = positional[0];
    config.mapping_file = positional[1];

    if (!config.log_file.empty() && !log_open_file(config.log_file)) {
        std::cerr << "Error: Cannot open log file " << config.log_file << std::endl;
        return 1;
    }

    setup_signals();

    try {
        std::error_code ec;
        if (!std::filesystem::is_directory(config.audio_dir, ec)) {
            throw StartupConfigError("Audio folder not found: " + config.audio_dir);
        }

        ContentResolver resolver(load_mapping_file(config.mapping_file), config.audio_dir);
        for (const auto& entry : resolver.table()) {
            std::string target = resolver.target_path(entry.second);
            if (!std::filesystem::exists(target, ec)) {
                RFID_LOG_WARN("Card " << entry.first.to_hex() << " maps to missing " << target);
            }
        }

        auto reader = create_card_reader();
        reader->open();

        ProcessBackend backend(config.player_command, RFID_PLAYER_STOP_TIMEOUT_MS);
        SessionController controller(resolver, backend, config.policy);
        ControlLoop loop(*reader, controller, config);

        RFID_LOG_INFO("Rfid player started");
        loop.run(g_stop);
        RFID_LOG_INFO("Shutdown requested, quitting");

        reader->close();
    } catch (const StartupConfigError& e) {
        RFID_LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        RFID_LOG_ERROR("Error: " << e.what());
        return 1;
    }

    return 0;
}
