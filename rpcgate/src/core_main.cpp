#include "errors.hpp"
#include "event_loop.hpp"
#include "ipc_server.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "server/router.hpp"
#include "server/server_middleware.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include <sys/prctl.h>
#include <unistd.h>

#ifndef RPCGATE_VERSION
#define RPCGATE_VERSION "0.0.0"
#endif

namespace {

std::atomic<bool> g_stop_requested{false};

void on_signal(int) {
    g_stop_requested = true;
}

void register_actions(rpcgate::server::Router& router, rpcgate::WorkerPool& workers, rpcgate::EventLoop& loop,
                      const std::set<std::string>& admins) {
    using rpcgate::codec::Packer;
    using rpcgate::codec::Payload;
    using rpcgate::server::HandlerResult;

    router.handle("ping", [&loop](const std::string&, const Payload&) {
        double now = loop.now();
        return HandlerResult::ok(Payload::build([now](Packer& pk) {
            pk.pack_map(2);
            pk.pack("pong");
            pk.pack(true);
            pk.pack("time");
            pk.pack(now);
        }));
    });

    router.handle("echo", [](const std::string&, const Payload& payload) { return HandlerResult::ok(payload); });

    // Summed on the worker pool; the responder posts back to the loop.
    router.handle_async("math.sum", [&workers](const std::string&, const Payload& payload,
                                                rpcgate::server::Responder respond) {
        if (payload.get().type != msgpack::type::ARRAY) {
            respond(HandlerResult::fail("Expected an array of numbers"));
            return;
        }
        Payload input = payload;
        workers.offload<double>(
            [input] {
                double total = 0.0;
                const auto& array = input.get().via.array;
                for (uint32_t i = 0; i < array.size; ++i) {
                    total += rpcgate::codec::as_double(array.ptr[i]);
                }
                return total;
            },
            [respond](double total) { respond(HandlerResult::ok(Payload::from(total))); },
            [respond](const std::string&) { respond(HandlerResult::fail("Operation failed")); });
    });

    router.handle("server.stats", [&router](const std::string&, const Payload&) {
        auto stats = router.stats();
        return HandlerResult::ok(Payload::build([&stats, &router](Packer& pk) {
            pk.pack_map(8);
            pk.pack("received");
            pk.pack(stats.received);
            pk.pack("invalid");
            pk.pack(stats.invalid);
            pk.pack("replays");
            pk.pack(stats.replays);
            pk.pack("unknown_actions");
            pk.pack(stats.unknown_actions);
            pk.pack("handler_failures");
            pk.pack(stats.handler_failures + stats.handler_exceptions);
            pk.pack("responses");
            pk.pack(stats.responses);
            pk.pack("events");
            pk.pack(stats.events);
            pk.pack("tracked_senders");
            pk.pack(router.rate_limiter().tracked_senders());
        }));
    });
    router.use_for_action("server.stats", rpcgate::server::admin_middleware(
                                              [admins](const std::string& sender_id) {
                                                  return admins.count(sender_id) > 0;
                                              }));

    router.handle("server.announce", [&router](const std::string& sender_id, const Payload& payload) {
        router.broadcast("announcement", payload);
        LOG4CPLUS_INFO(server_logger(), "Announcement from " << sender_id);
        return HandlerResult::ok();
    });
    router.use_for_action("server.announce", rpcgate::server::admin_middleware(
                                                 [admins](const std::string& sender_id) {
                                                     return admins.count(sender_id) > 0;
                                                 }));
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::string config_path = "rpcgate.json";
    std::string log_config_path = "log4cplus.ini";
    std::string socket_override;
    std::set<std::string> admins;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << RPCGATE_VERSION << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc) {
            log_config_path = argv[++i];
            continue;
        }

        if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            socket_override = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--socket=", 9) == 0) {
            socket_override = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--admin") == 0 && i + 1 < argc) {
            admins.insert(argv[++i]);
            continue;
        }

        std::cerr << "Unknown argument: " << argv[i] << std::endl;
        return 2;
    }

#ifdef __linux__
    if (enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(log_config_path);

    rpcgate::Options options;
    try {
        options = rpcgate::load_options(config_path);
    } catch (const rpcgate::ConfigError& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Invalid configuration: " << exc.what());
        return 1;
    }
    if (!socket_override.empty()) {
        options.socket_path = socket_override;
    }

    LOG4CPLUS_INFO(core_logger(), "rpcgate_server " << RPCGATE_VERSION << " starting");
    LOG4CPLUS_INFO(core_logger(), "Socket: " << options.socket_path);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    rpcgate::EventLoop loop;
    rpcgate::WorkerPool workers(loop, options.worker_threads);
    rpcgate::SocketServerChannel channel(loop, options.socket_path, options.max_frame_bytes);
    rpcgate::server::Router router(loop, channel, options);

    router.init();
    router.use(rpcgate::server::validation_middleware());
    router.use(rpcgate::server::security_middleware(options.max_request_age, options.max_clock_skew));
    register_actions(router, workers, loop, admins);

    try {
        channel.start();
    } catch (const std::system_error& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start IPC channel: " << exc.what());
        return 1;
    }

    std::function<void()> watch_signals;
    watch_signals = [&] {
        if (g_stop_requested) {
            router.broadcast("server.shutdown");
            loop.stop();
            return;
        }
        loop.schedule_after(0.2, watch_signals);
    };
    loop.schedule_after(0.2, watch_signals);

    loop.run();

    workers.shutdown();
    channel.stop();
    LOG4CPLUS_INFO(core_logger(), "rpcgate_server stopped");
    return 0;
}
