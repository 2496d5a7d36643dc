#include "sstun/log.hpp"
#include "sstun/openssl_cipher.hpp"
#include "sstun/service.hpp"
#include "sstun/tunnel.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <print>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 6) {
        std::println(stderr, "Usage: sstun_local <listen_port> <server_host:port> <password> [method] [bind_ip]");
        return 1;
    }

    std::string server = argv[2];
    std::string password = argv[3];
    std::string method = (argc >= 5) ? argv[4] : "aes-256-cfb";
    std::string ip = (argc == 6) ? argv[5] : "127.0.0.1";

    const char* debug_env = std::getenv("SSTUN_DEBUG");
    bool debug = debug_env && std::string(debug_env) == "1";
    sstun::log::set_debug(debug);

    try {
        auto listen_port = sstun::parse_port(argv[1]);
        if (!listen_port)
            throw std::system_error(listen_port.error(), argv[1]);
        uint16_t port = *listen_port;

        if (auto checked = sstun::split_host_port(server); !checked)
            throw std::system_error(checked.error(), server);

        sstun::ServerCipher server_cipher{server, std::make_shared<sstun::StreamCipher>(method, password)};

        sstun::ServiceOptions options;
        options.debug = debug;

        sstun::ShadowTunnelDialer dialer;
        sstun::Service service(std::move(server_cipher), dialer, options);

        asio::io_context io_context;
        asio::ip::tcp::acceptor acceptor(io_context, asio::ip::tcp::endpoint(asio::ip::make_address(ip), port));
        service.serve(std::move(acceptor));

        std::println("sstun local listening on {}:{}, tunnel {} ({})", ip, port, server, method);

        auto work_guard = asio::make_work_guard(io_context);
        unsigned thread_count = std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (unsigned i = 0; i < thread_count; ++i)
            threads.emplace_back([&io_context]() { io_context.run(); });

        // Signals are waited for off the worker pool: stop() blocks until the
        // workers have drained every connection.
        asio::io_context signal_context;
        asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([](const asio::error_code&, int signo) { std::println(stderr, "Caught signal {}", signo); });
        signal_context.run();

        service.stop();
        work_guard.reset();
        io_context.stop();
        for (auto& t : threads)
            t.join();
    } catch (std::exception& e) {
        std::println(stderr, "Exception: {}", e.what());
        return 1;
    }

    return 0;
}
