/**
 * clawlink Gateway Chat
 *
 * Interactive CLI that connects to an assistant gateway, loads a session's
 * history and streams replies to the terminal.
 *
 * Usage:
 *   ./gateway_chat [url] [options]
 *
 * Options:
 *   --token <token>          Gateway token (env: CLAWLINK_TOKEN)
 *   --password <password>    Gateway password (env: CLAWLINK_PASSWORD)
 *   --session <key>          Session key (default: main)
 *   --thinking <level>       Reasoning level forwarded with each message
 *   --verify-tls             Verify the server certificate
 *   --verbose                Debug logging
 *   --help                   Show this help message
 *
 * The URL falls back to CLAWLINK_URL.
 */

#include "clawlink/clawlink.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

// Global flag for Ctrl+C handling
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
        std::cout << "\n\nInterrupted.\n";
    }
}

struct CLIArgs {
    std::string url;
    std::optional<std::string> token;
    std::optional<std::string> password;
    std::string session_key = "main";
    std::optional<std::string> thinking;
    bool verify_tls = false;
    bool verbose = false;
    bool help = false;
};

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void print_usage(const char* program_name) {
    std::cout << "clawlink Gateway Chat\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [url] [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --token <token>          Gateway token (env: CLAWLINK_TOKEN)\n";
    std::cout << "  --password <password>    Gateway password (env: CLAWLINK_PASSWORD)\n";
    std::cout << "  --session <key>          Session key (default: main)\n";
    std::cout << "  --thinking <level>       Reasoning level forwarded with each message\n";
    std::cout << "  --verify-tls             Verify the server certificate\n";
    std::cout << "  --verbose                Debug logging\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "The URL falls back to CLAWLINK_URL.\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " wss://gateway.local:18789 --token secret\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /quit, /exit    Exit the application\n";
    std::cout << "  /history        Reload and print the session history\n";
    std::cout << "  /reconnect      Reconnect to the gateway\n";
    std::cout << "  /help           Show available commands\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--token" && i + 1 < argc) {
            args.token = argv[++i];
        }
        else if (arg == "--password" && i + 1 < argc) {
            args.password = argv[++i];
        }
        else if (arg == "--session" && i + 1 < argc) {
            args.session_key = argv[++i];
        }
        else if (arg == "--thinking" && i + 1 < argc) {
            args.thinking = argv[++i];
        }
        else if (arg == "--verify-tls") {
            args.verify_tls = true;
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else if (arg.rfind("--", 0) != 0 && args.url.empty()) {
            args.url = arg;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }

    if (args.url.empty()) {
        args.url = env_value("CLAWLINK_URL").value_or("");
    }
    if (!args.token) {
        args.token = env_value("CLAWLINK_TOKEN");
    }
    if (!args.password) {
        args.password = env_value("CLAWLINK_PASSWORD");
    }
    if (args.url.empty()) {
        args.help = true;
    }

    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_message(const clawlink::Message& message) {
    std::cout << "[" << clawlink::role_to_string(message.role) << "] ";
    if (message.thinking && !message.thinking->empty()) {
        std::cout << "(thinking: " << *message.thinking << ") ";
    }
    std::cout << message.content << "\n";
}

void print_transcript(const clawlink::ChatSession& chat) {
    print_separator();
    for (const auto& message : chat.messages()) {
        print_message(message);
    }
    print_separator();
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return args.url.empty() ? 1 : 0;
    }

    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);
    std::signal(SIGINT, signal_handler);

    clawlink::Config config;
    config.url = args.url;
    config.token = args.token;
    config.password = args.password;
    config.verify_tls_peer = args.verify_tls;

    auto connection_result = clawlink::Connection::create(config);
    if (!connection_result) {
        std::cerr << "Error: " << connection_result.error().to_string() << "\n";
        return 1;
    }
    auto connection = std::move(*connection_result);

    connection->set_state_handler([](const clawlink::ConnectionState& state) {
        std::cout << "[" << state.display_text() << "]\n";
    });

    std::cout << "Connecting to " << config.url << "...\n";
    if (auto connected = connection->connect(); !connected) {
        std::cerr << "Error: " << clawlink::describe(connected.error()) << "\n";
        return 1;
    }

    clawlink::ChatSession chat(*connection, args.session_key);

    // Print only the new tail of each draft
    auto printed = std::make_shared<size_t>(0);
    chat.set_stream_handlers({
        [printed](const clawlink::Message& draft) {
            if (draft.content.size() > *printed) {
                std::cout << draft.content.substr(*printed) << std::flush;
                *printed = draft.content.size();
            }
        },
        [printed](const clawlink::Message& message) {
            if (message.content.size() > *printed) {
                std::cout << message.content.substr(*printed);
            }
            std::cout << "\n\nYou: " << std::flush;
            *printed = 0;
        },
        [](const std::string& error) {
            std::cout << "\n[error] " << error << "\n";
        }
    });

    if (auto history = chat.load_history(); history) {
        std::cout << "Loaded " << *history << " messages for session '" << args.session_key << "'.\n";
        print_transcript(chat);
    } else {
        std::cerr << "History unavailable: " << clawlink::describe(history.error()) << "\n";
    }

    std::cout << "\nType your message and press Enter. Type '/quit' to exit.\n";

    std::string line;
    while (!g_interrupted) {
        std::cout << "\nYou: ";
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            break;  // EOF or error
        }

        // Trim whitespace
        line.erase(0, line.find_first_not_of(" \t\n\r"));
        line.erase(line.find_last_not_of(" \t\n\r") + 1);

        if (line.empty()) {
            continue;
        }

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                std::cout << "Goodbye!\n";
                break;
            }
            else if (line == "/history") {
                if (auto history = chat.load_history(); !history) {
                    std::cerr << "Error: " << clawlink::describe(history.error()) << "\n";
                } else {
                    print_transcript(chat);
                }
                continue;
            }
            else if (line == "/reconnect") {
                if (auto reconnected = connection->reconnect(); !reconnected) {
                    std::cerr << "Error: " << clawlink::describe(reconnected.error()) << "\n";
                }
                continue;
            }
            else if (line == "/help") {
                std::cout << "\nAvailable commands:\n";
                std::cout << "  /quit, /exit    Exit the application\n";
                std::cout << "  /history        Reload and print the session history\n";
                std::cout << "  /reconnect      Reconnect to the gateway\n";
                std::cout << "  /help           Show this help\n";
                continue;
            }
            else {
                std::cout << "Unknown command: " << line << "\n";
                std::cout << "Type '/help' for available commands.\n";
                continue;
            }
        }

        std::cout << "\nAssistant: " << std::flush;
        if (auto sent = chat.send_message(line, args.thinking); !sent) {
            std::cerr << "\nError: " << clawlink::describe(sent.error()) << "\n";
        }
    }

    connection->disconnect();
    std::cout << "\n";
    return 0;
}
