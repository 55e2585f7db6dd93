#include "config.h"
#include "hybrid_connection_manager.h"
#include "loopback_transport.h"
#include "signaling_codec.h"
#include "logger.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <chrono>
#include <vector>
#include <atomic>
#include <mutex>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  compress <file|->   Print the signaling code of a session description\n";
    std::cout << "  decompress <code>   Print the session description carried by a code\n";
    std::cout << "  demo [bytes]        Connect two in-process devices and transfer a file\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --log-level <level> debug, info, warn or error (default: warn)\n";
    std::cout << "  --config <file>     Load settings from a JSON configuration file\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " compress offer.json\n";
    std::cout << "  " << program_name << " --log-level info demo 1048576\n";
}

int run_compress(const std::string& source) {
    std::string description;
    if (source == "-") {
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        description = buffer.str();
    } else {
        std::ifstream file(source);
        if (!file) {
            LOG_MAIN_ERROR("Cannot open " << source);
            return 1;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        description = buffer.str();
    }

    xtrans::XtransError error;
    std::string code = xtrans::SignalingCodec::compress(description, &error);
    if (code.empty()) {
        LOG_MAIN_ERROR("Compression failed: " << error.to_string());
        return 1;
    }

    auto stats = xtrans::SignalingCodec::get_compression_stats(description, code);
    LOG_MAIN_INFO("Compressed " << stats.original_size << " -> " << stats.compressed_size
                  << " bytes (ratio " << stats.compression_ratio << ")");
    std::cout << code << std::endl;
    return 0;
}

int run_decompress(const std::string& code) {
    xtrans::XtransError error;
    auto description = xtrans::SignalingCodec::decompress(code, &error);
    if (!description) {
        LOG_MAIN_ERROR("Decompression failed: " << error.to_string());
        return 1;
    }
    std::cout << *description << std::endl;
    return 0;
}

int run_demo(const xtrans::XtransConfig& config, size_t file_size) {
    LOG_MAIN_INFO("=== xtrans loopback demo ===");

    auto network = std::make_shared<xtrans::LoopbackNetwork>();
    xtrans::LoopbackSignalingHub hub;

    auto make_factory = [network](const std::string& local_id) {
        return [network, local_id](xtrans::TransportKind kind, const std::string&) {
            return std::unique_ptr<xtrans::Transport>(
                new xtrans::LoopbackTransport(network, local_id + ":" + xtrans::transport_kind_to_string(kind)));
        };
    };

    xtrans::HybridConnectionManager alice(make_factory("alice"), hub.create_channel("alice"),
                                          config.strategy, config.transport);
    xtrans::HybridConnectionManager bob(make_factory("bob"), hub.create_channel("bob"),
                                        config.strategy, config.transport);

    xtrans::DeviceIdentity alice_identity("alice", "Alice's laptop");
    xtrans::DeviceIdentity bob_identity("bob", "Bob's phone");
    bob_identity.device_type = xtrans::DeviceType::MOBILE;
    alice.set_local_identity(alice_identity);
    bob.set_local_identity(bob_identity);

    // Bob accepts every offered file on a worker thread
    std::atomic<bool> received_ok(false);
    std::mutex receiver_mutex;
    std::thread receiver;
    bob.add_event_listener([&](const xtrans::ConnectionEvent& event) {
        if (event.type != xtrans::ConnectionEventType::MESSAGE_RECEIVED || !event.message ||
            !event.message->protocol || event.message->protocol->type != xtrans::DataMessageType::METADATA) {
            return;
        }
        xtrans::FileMetadata metadata = event.message->protocol->metadata;
        std::cout << "bob: incoming " << metadata.name << " (" << metadata.size << " bytes)" << std::endl;
        std::lock_guard<std::mutex> lock(receiver_mutex);
        if (receiver.joinable()) {
            return;
        }
        receiver = std::thread([&bob, &received_ok, metadata]() {
            xtrans::XtransError error;
            auto file = bob.receive_file("alice", metadata.file_id, metadata, nullptr, &error);
            if (!file) {
                LOG_MAIN_ERROR("Receive failed: " << error.to_string());
                return;
            }
            std::cout << "bob: received " << file->data.size() << " bytes" << std::endl;
            received_ok.store(file->data.size() == metadata.size);
        });
    });

    xtrans::XtransError error;
    if (!alice.connect_to_device("bob", bob_identity, &error)) {
        LOG_MAIN_ERROR("Connection failed: " << error.to_string());
        return 1;
    }

    auto state = alice.get_connection_state("bob");
    if (state) {
        std::cout << "alice: connected to bob over " << xtrans::transport_kind_to_string(state->transport_kind);
        if (state->latency_ms) {
            std::cout << " in " << *state->latency_ms << "ms";
        }
        std::cout << std::endl;
    }

    std::string text_id = alice.send_text("bob", "hello from alice", &error);
    if (text_id.empty()) {
        LOG_MAIN_WARN("Text message failed: " << error.to_string());
    }

    std::vector<uint8_t> data(file_size);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 31 + 7);
    }
    xtrans::FilePayload payload("demo.bin", "application/octet-stream", std::move(data));

    int last_percent = -1;
    bool sent = alice.send_file("bob", payload,
        [&last_percent](uint64_t done, uint64_t total, double rate) {
            int percent = total > 0 ? static_cast<int>(done * 100 / total) : 100;
            if (percent / 10 != last_percent / 10) {
                last_percent = percent;
                std::cout << "alice: " << percent << "% (" << static_cast<uint64_t>(rate / 1024) << " KiB/s)" << std::endl;
            }
        }, &error);

    {
        std::lock_guard<std::mutex> lock(receiver_mutex);
        if (receiver.joinable()) {
            receiver.join();
        }
    }

    if (!sent) {
        LOG_MAIN_ERROR("Send failed: " << error.to_string());
        return 1;
    }

    alice.disconnect("bob");
    std::cout << (received_ok.load() ? "demo: transfer verified" : "demo: transfer incomplete") << std::endl;
    return received_ok.load() ? 0 : 1;
}

int main(int argc, char* argv[]) {
    xtrans::XtransConfig config;
    config.log_level = xtrans::LogLevel::WARN;

    std::vector<std::string> args;
    std::string config_path;
    std::string log_level_name;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            log_level_name = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (!config_path.empty()) {
        xtrans::XtransError error;
        if (!xtrans::load_config_from_file(config_path, config, &error)) {
            std::cerr << "Invalid configuration: " << error.message << std::endl;
            return 1;
        }
    }

    if (!log_level_name.empty() && !xtrans::parse_log_level(log_level_name, config.log_level)) {
        std::cerr << "Unknown log level: " << log_level_name << std::endl;
        return 1;
    }
    xtrans::Logger::getInstance().set_log_level(config.log_level);

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string& command = args[0];
    if (command == "compress" && args.size() == 2) {
        return run_compress(args[1]);
    }
    if (command == "decompress" && args.size() == 2) {
        return run_decompress(args[1]);
    }
    if (command == "demo" && args.size() <= 2) {
        size_t bytes = 256 * 1024;
        if (args.size() == 2) {
            try {
                bytes = static_cast<size_t>(std::stoull(args[1]));
            } catch (const std::exception&) {
                std::cerr << "Invalid byte count: " << args[1] << std::endl;
                return 1;
            }
        }
        return run_demo(config, bytes);
    }

    print_usage(argv[0]);
    return 1;
}
