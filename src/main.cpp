#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <csignal>
#include <boost/asio.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include "feed_slots.hpp"
#include "imaging.hpp"
#include "networking.hpp"
#include "transfer_history.hpp"
#include "ui/main_window.hpp"

namespace {

const char* DEFAULT_CONFIG_FILE = "gridrelay.json";

void print_usage() {
    std::cerr << "Usage:\n"
              << "  gridrelay                                  launch the dashboard\n"
              << "  gridrelay receive [--config F] [--port P] [--output DIR]\n"
              << "  gridrelay send <host> <port> <file>... [--config F] [--identity ID]\n"
              << "                 [--frame-size N] [--columns C] [--quality Q]\n"
              << "  gridrelay write-config <file>\n";
}

struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;
};

Arguments parse_arguments(int argc, char* argv[], int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw errors::ConfigurationError("Missing value for " + arg);
            }
            args.flags[arg.substr(2)] = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

unsigned long parse_number(const std::string& text, const std::string& what, unsigned long max) {
    try {
        std::size_t used = 0;
        unsigned long value = std::stoul(text, &used);
        if (used == text.size() && value <= max) return value;
    } catch (const std::logic_error&) {
        // reported below
    }
    throw errors::ConfigurationError("Invalid " + what + ": '" + text + "'");
}

config::AppConfig load_config(const Arguments& args) {
    auto it = args.flags.find("config");
    return config::load(it != args.flags.end() ? it->second : DEFAULT_CONFIG_FILE);
}

void reject_unknown_flags(const Arguments& args, const std::vector<std::string>& known) {
    for (const auto& [name, value] : args.flags) {
        bool found = false;
        for (const auto& k : known) found = found || (k == name);
        if (!found) throw errors::ConfigurationError("Unknown option --" + name);
    }
}

int run_receive(const Arguments& args) {
    reject_unknown_flags(args, {"config", "port", "output"});
    config::AppConfig cfg = load_config(args);
    if (args.flags.count("port")) {
        cfg.receiver.port = static_cast<unsigned short>(parse_number(args.flags.at("port"), "port", 65535));
    }
    if (args.flags.count("output")) cfg.receiver.output_dir = args.flags.at("output");
    cfg.receiver.validate();

    imaging::PixbufCodec codec;
    feed::FeedSlotTable slots(cfg.receiver.slot_count, cfg.receiver.preferred_slots);
    history::TransferHistory history(cfg.receiver.history_path());

    networking::ConnectionManager manager(cfg.receiver, codec, session::SharedState{slots, history});
    manager.start();
    std::cout << "Receiving on port " << manager.port() << ". Press Ctrl+C to stop.\n";

    // Block until SIGINT/SIGTERM
    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) event_log::info("Signal " + std::to_string(signal_number) + " received, shutting down");
    });
    signal_io.run();

    std::vector<std::string> stragglers = manager.stop();

    std::cout << "Received " << history.size() << " image(s).\n";
    for (const auto& slot : slots.snapshot()) {
        if (slot.identity) std::cout << "  feed: " << *slot.identity << "\n";
    }
    if (!stragglers.empty()) {
        std::cerr << stragglers.size() << " session(s) had to be aborted:\n";
        for (const auto& peer : stragglers) std::cerr << "  " << peer << "\n";
        return 3;
    }
    return 0;
}

int run_send(const Arguments& args) {
    reject_unknown_flags(args, {"config", "identity", "frame-size", "columns", "quality"});
    if (args.positional.size() < 3) {
        print_usage();
        return 1;
    }

    config::AppConfig cfg = load_config(args);
    config::TransmitterConfig& tx = cfg.transmitter;
    tx.host = args.positional[0];
    tx.port = static_cast<unsigned short>(parse_number(args.positional[1], "port", 65535));
    if (args.flags.count("identity")) tx.identity = args.flags.at("identity");
    if (args.flags.count("frame-size")) {
        tx.frame_size = static_cast<uint32_t>(parse_number(args.flags.at("frame-size"), "frame size", 0xFFFFFFFFul));
    }
    if (args.flags.count("columns")) {
        tx.columns = static_cast<uint32_t>(parse_number(args.flags.at("columns"), "column count", 0xFFFFFFFFul));
    }
    if (args.flags.count("quality")) {
        tx.jpeg_quality = static_cast<int>(parse_number(args.flags.at("quality"), "JPEG quality", 100));
        tx.reencode = true;
    }

    imaging::PixbufCodec codec;
    networking::Transmitter transmitter(tx, &codec);

    networking::TransmitterCallbacks callbacks;
    callbacks.on_progress = [](const std::string& filename, std::size_t sent, std::size_t total) {
        int percent = (total > 0) ? static_cast<int>((sent * 100) / total) : 100;
        std::cout << "\r" << filename << ": " << sent << "/" << total << " frames (" << percent << "%)   " << std::flush;
        if (sent == total) std::cout << "\n";
    };

    std::vector<std::string> files(args.positional.begin() + 2, args.positional.end());
    std::size_t delivered = transmitter.send_files(files, callbacks);
    std::cout << "Sent " << delivered << " of " << files.size() << " image(s).\n";
    return delivered == files.size() ? 0 : 1;
}

int run_write_config(const Arguments& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return 1;
    }
    config::save(config::AppConfig{}, args.positional[0]);
    std::cout << "Wrote default configuration to " << args.positional[0] << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // No arguments → launch GUI
        if (argc == 1) {
            config::AppConfig cfg = config::load(DEFAULT_CONFIG_FILE);
            return ui::run_gui(cfg);
        }

        std::string command = argv[1];
        Arguments args = parse_arguments(argc, argv, 2);

        if (command == "receive") return run_receive(args);
        if (command == "send") return run_send(args);
        if (command == "write-config") return run_write_config(args);

        print_usage();
        return 1;
    } catch (const errors::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
