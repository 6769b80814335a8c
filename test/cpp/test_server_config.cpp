#include <catch2/catch.hpp>
#include "oauth2_server_config.hpp"
#include "oauth2_errors.hpp"
#include <thread>

using namespace oauth2_loopback;
using namespace std::chrono_literals;

TEST_CASE("ServerConfig defaults", "[server_config]") {
    auto config = ServerConfig::FromOptions(ServerOptions());

    REQUIRE(config.BindCandidates().size() == 1);
    REQUIRE(config.BindCandidates()[0] == BindAddress{"127.0.0.1", 0});
    REQUIRE_FALSE(config.HasTls());
    REQUIRE(config.Scheme() == "http");
    REQUIRE(config.SuccessHtml() == DEFAULT_SUCCESS_HTML);
    REQUIRE(config.CallbackPath() == "/");
    REQUIRE(config.GetReadySignal() == nullptr);
    REQUIRE(config.ShutdownGrace() == 3000ms);
    REQUIRE(config.ReadTimeout() == 5000ms);
    REQUIRE(config.WriteTimeout() == 5000ms);
}

TEST_CASE("ServerConfig bind candidates", "[server_config]") {
    ServerOptions options;

    SECTION("Order is preserved") {
        options.bind_addresses = {"127.0.0.1:18000", "127.0.0.1:18001", "[::1]:0"};
        auto config = ServerConfig::FromOptions(options);
        REQUIRE(config.BindCandidates().size() == 3);
        REQUIRE(config.BindCandidates()[0].port == 18000);
        REQUIRE(config.BindCandidates()[1].port == 18001);
        REQUIRE(config.BindCandidates()[2].host == "::1");
    }

    SECTION("Deprecated ports are appended after bind_addresses") {
        options.bind_addresses = {"127.0.0.1:9000"};
        options.local_server_ports = {8000, 8001};
        auto config = ServerConfig::FromOptions(options);
        REQUIRE(config.BindCandidates().size() == 3);
        REQUIRE(config.BindCandidates()[0] == BindAddress{"127.0.0.1", 9000});
        REQUIRE(config.BindCandidates()[1] == BindAddress{"127.0.0.1", 8000});
        REQUIRE(config.BindCandidates()[2] == BindAddress{"127.0.0.1", 8001});
    }

    SECTION("Deprecated address applies to deprecated ports") {
        options.local_server_address = "0.0.0.0";
        options.local_server_ports = {8000};
        auto config = ServerConfig::FromOptions(options);
        REQUIRE(config.BindCandidates().size() == 1);
        REQUIRE(config.BindCandidates()[0] == BindAddress{"0.0.0.0", 8000});
    }

    SECTION("Options are not mutated") {
        options.local_server_ports = {8000};
        ServerConfig::FromOptions(options);
        REQUIRE(options.bind_addresses.empty());
        REQUIRE(options.local_server_ports.size() == 1);
    }

    SECTION("Malformed address is a configuration error") {
        options.bind_addresses = {"127.0.0.1:0", "not-an-address"};
        REQUIRE_THROWS_AS(ServerConfig::FromOptions(options), ConfigurationError);
    }

    SECTION("Out of range deprecated port") {
        options.local_server_ports = {70000};
        REQUIRE_THROWS_AS(ServerConfig::FromOptions(options), ConfigurationError);
    }
}

TEST_CASE("ServerConfig TLS material", "[server_config]") {
    ServerOptions options;

    SECTION("Both files enable https") {
        options.cert_file = "cert.pem";
        options.key_file = "key.pem";
        auto config = ServerConfig::FromOptions(options);
        REQUIRE(config.HasTls());
        REQUIRE(config.Scheme() == "https");
    }

    SECTION("Certificate without key") {
        options.cert_file = "cert.pem";
        try {
            ServerConfig::FromOptions(options);
            FAIL("expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            std::string message = e.what();
            REQUIRE(message.find("cert_file: cert.pem") != std::string::npos);
        }
    }

    SECTION("Key without certificate") {
        options.key_file = "key.pem";
        REQUIRE_THROWS_AS(ServerConfig::FromOptions(options), ConfigurationError);
    }
}

TEST_CASE("ServerConfig callback path", "[server_config]") {
    ServerOptions options;

    SECTION("Custom path is kept") {
        options.callback_path = "/oauth/callback";
        REQUIRE(ServerConfig::FromOptions(options).CallbackPath() == "/oauth/callback");
    }

    SECTION("Invalid paths") {
        for (const std::string path : {"callback", "/a b", "/cb?x=1", "/cb#frag", "/cb\n"}) {
            options.callback_path = path;
            REQUIRE_THROWS_AS(ServerConfig::FromOptions(options), ConfigurationError);
        }
    }
}

TEST_CASE("ServerConfig timeouts", "[server_config]") {
    ServerOptions options;

    SECTION("Zero grace is allowed") {
        options.shutdown_grace = 0ms;
        REQUIRE(ServerConfig::FromOptions(options).ShutdownGrace() == 0ms);
    }

    SECTION("Negative grace is rejected") {
        options.shutdown_grace = -1ms;
        REQUIRE_THROWS_AS(ServerConfig::FromOptions(options), ConfigurationError);
    }

    SECTION("Non-positive I/O timeouts are rejected") {
        options.read_timeout = 0ms;
        REQUIRE_THROWS_AS(ServerConfig::FromOptions(options), ConfigurationError);
    }
}

TEST_CASE("ReadySignal", "[server_config]") {
    ReadySignal signal;
    REQUIRE_FALSE(signal.TryGet().has_value());
    REQUIRE_FALSE(signal.WaitFor(10ms).has_value());

    SECTION("Only the first URL is kept") {
        REQUIRE(signal.Publish("http://127.0.0.1:1234/"));
        REQUIRE_FALSE(signal.Publish("http://127.0.0.1:9999/"));
        REQUIRE(*signal.TryGet() == "http://127.0.0.1:1234/");
    }

    SECTION("Waiter is woken by Publish") {
        std::thread publisher([&signal]() {
            std::this_thread::sleep_for(20ms);
            signal.Publish("http://localhost:1/");
        });
        auto url = signal.WaitFor(5s);
        publisher.join();
        REQUIRE(url.has_value());
        REQUIRE(*url == "http://localhost:1/");
    }

    SECTION("Withdraw clears only the matching URL") {
        REQUIRE(signal.Publish("http://127.0.0.1:1234/"));
        REQUIRE_FALSE(signal.Withdraw("http://127.0.0.1:9999/"));
        REQUIRE(*signal.TryGet() == "http://127.0.0.1:1234/");

        REQUIRE(signal.Withdraw("http://127.0.0.1:1234/"));
        REQUIRE_FALSE(signal.TryGet().has_value());
        REQUIRE_FALSE(signal.Withdraw("http://127.0.0.1:1234/"));

        REQUIRE(signal.Publish("http://127.0.0.1:5678/"));
        REQUIRE(*signal.WaitFor(10ms) == "http://127.0.0.1:5678/");
    }
}
