#include "client/request_engine.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "ipc_client.hpp"
#include "logger.hpp"
#include "options.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

rpcgate::codec::Payload payload_from_json(const std::string& text) {
    auto doc = nlohmann::json::parse(text);
    std::vector<std::uint8_t> bytes = nlohmann::json::to_msgpack(doc);
    return rpcgate::codec::Payload::unpack(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string payload_to_json(const rpcgate::codec::Payload& payload) {
    if (payload.empty()) {
        return "null";
    }
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, payload.get());
    const auto* begin = reinterpret_cast<const std::uint8_t*>(buffer.data());
    std::vector<std::uint8_t> bytes(begin, begin + buffer.size());
    return nlohmann::json::from_msgpack(bytes).dump();
}

void usage() {
    std::cerr << "usage: rpcgate_call [--socket PATH] [--config FILE] [--listen EVENT]... ACTION [JSON]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::string config_path = "rpcgate.json";
    std::string log_config_path = "log4cplus.ini";
    std::string socket_override;
    std::vector<std::string> listen;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc) {
            log_config_path = argv[++i];
        } else if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            socket_override = argv[++i];
        } else if (strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen.push_back(argv[++i]);
        } else if (argv[i][0] == '-') {
            usage();
            return 2;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        usage();
        return 2;
    }

    init_logging(log_config_path);

    rpcgate::Options options;
    rpcgate::codec::Payload payload;
    try {
        options = rpcgate::load_options(config_path);
        if (positional.size() == 2) {
            payload = payload_from_json(positional[1]);
        }
    } catch (const rpcgate::ConfigError& exc) {
        std::cerr << "Invalid configuration: " << exc.what() << std::endl;
        return 1;
    } catch (const nlohmann::json::exception& exc) {
        std::cerr << "Invalid JSON payload: " << exc.what() << std::endl;
        return 2;
    }
    if (!socket_override.empty()) {
        options.socket_path = socket_override;
    }
    options.throttle_interval = 0.0;

    rpcgate::EventLoop loop;
    rpcgate::SocketClientChannel channel(loop, options.socket_path, options.max_frame_bytes);
    rpcgate::client::RequestEngine engine(loop, channel, options);
    engine.init();

    for (const auto& event_name : listen) {
        engine.on_server_message(event_name, [event_name](const rpcgate::codec::Payload& event_payload) {
            std::cout << "event " << event_name << ": " << payload_to_json(event_payload) << std::endl;
        });
    }

    try {
        channel.connect();
    } catch (const std::system_error& exc) {
        std::cerr << "Cannot connect: " << exc.what() << std::endl;
        return 1;
    }

    int exit_code = 0;
    engine.request(positional[0], payload)
        .then(
            [&](const rpcgate::Response& response) {
                std::cout << payload_to_json(response.data) << std::endl;
                if (listen.empty()) {
                    loop.stop();
                }
            },
            [&](const rpcgate::RequestError& error) {
                std::cerr << rpcgate::to_string(error.kind) << ": " << error.message << std::endl;
                exit_code = error.is_timeout() ? 3 : 1;
                loop.stop();
            });

    loop.run();
    channel.close();
    return exit_code;
}
