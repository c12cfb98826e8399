/*
 * ChatRelay - configuration loading tests
 */

#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

#include "config.hpp"
#include "test_support.hpp"

using namespace chatrelay;

namespace {
// argv-style view over owned strings.
class Args {
public:
    Args(std::initializer_list<std::string> values) : storage_(values) {
        for (auto& value : storage_) {
            pointers_.push_back(value.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};
} // namespace

int main() {
    unsetenv("CHAT_HOST");
    unsetenv("CHAT_PORT");
    std::string error;

    {
        Args args{"chatrelay_server"};
        ServerConfig config;
        if (!load_server_config(args.argc(), args.argv(), config, error) || config.port != 5000 ||
            !config.bind_address.empty() || config.history_capacity != 200 ||
            config.transfer_idle_timeout != std::chrono::seconds(300) || config.log_level != LogLevel::Info) {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_server", "--debug", "6000", "127.0.0.1", "50", "60"};
        ServerConfig config;
        if (!load_server_config(args.argc(), args.argv(), config, error) || config.port != 6000 ||
            config.bind_address != "127.0.0.1" || config.history_capacity != 50 ||
            config.transfer_idle_timeout != std::chrono::seconds(60) || config.log_level != LogLevel::Debug) {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_server", "70000"};
        ServerConfig config;
        if (load_server_config(args.argc(), args.argv(), config, error) || error != "Invalid port '70000'") {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_server", "--verbose"};
        ServerConfig config;
        if (load_server_config(args.argc(), args.argv(), config, error) || error != "Unknown option --verbose") {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_server", "1", "2", "3", "4", "5"};
        ServerConfig config;
        if (load_server_config(args.argc(), args.argv(), config, error) || error != "Too many arguments") {
            FAIL();
        }
    }

    // Environment overrides defaults; positional arguments override both.
    setenv("CHAT_PORT", "7000", 1);
    {
        Args args{"chatrelay_server"};
        ServerConfig config;
        if (!load_server_config(args.argc(), args.argv(), config, error) || config.port != 7000) {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_server", "7100"};
        ServerConfig config;
        if (!load_server_config(args.argc(), args.argv(), config, error) || config.port != 7100) {
            FAIL();
        }
    }
    setenv("CHAT_PORT", "zero", 1);
    {
        Args args{"chatrelay_server"};
        ServerConfig config;
        if (load_server_config(args.argc(), args.argv(), config, error) ||
            error != "Invalid CHAT_PORT value 'zero'") {
            FAIL();
        }
    }
    unsetenv("CHAT_PORT");

    {
        Args args{"chatrelay_client"};
        ClientConfig config;
        if (load_client_config(args.argc(), args.argv(), config, error) || error != "A username is required") {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_client", "alice"};
        ClientConfig config;
        if (!load_client_config(args.argc(), args.argv(), config, error) || config.username != "alice" ||
            config.host != "127.0.0.1" || config.port != 5000 || config.chunk_size != kDefaultChunkSize ||
            config.download_dir != "downloads") {
            FAIL();
        }
    }
    setenv("CHAT_HOST", "chat.example", 1);
    setenv("CHAT_PORT", "5100", 1);
    {
        Args args{"chatrelay_client", "bob"};
        ClientConfig config;
        if (!load_client_config(args.argc(), args.argv(), config, error) || config.host != "chat.example" ||
            config.port != 5100) {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_client", "--debug", "bob", "10.0.0.2", "5200", "4096", "/tmp/in"};
        ClientConfig config;
        if (!load_client_config(args.argc(), args.argv(), config, error) || config.host != "10.0.0.2" ||
            config.port != 5200 || config.chunk_size != 4096 || config.download_dir != "/tmp/in" ||
            config.log_level != LogLevel::Debug) {
            FAIL();
        }
    }
    unsetenv("CHAT_HOST");
    unsetenv("CHAT_PORT");
    {
        Args args{"chatrelay_client", "bob", "host", "5000", "0"};
        ClientConfig config;
        if (load_client_config(args.argc(), args.argv(), config, error) || error != "Invalid chunk size '0'") {
            FAIL();
        }
    }

    {
        Args args{"chatrelay_loadtest"};
        LoadTestConfig config;
        if (!load_loadtest_config(args.argc(), args.argv(), config, error) || config.clients != 5 ||
            config.public_messages != 3 || config.private_messages != 2 || config.host != "127.0.0.1" ||
            config.port != 5000) {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_loadtest", "-c", "20", "--messages", "10", "-p", "0", "10.0.0.9", "5300"};
        LoadTestConfig config;
        if (!load_loadtest_config(args.argc(), args.argv(), config, error) || config.clients != 20 ||
            config.public_messages != 10 || config.private_messages != 0 || config.host != "10.0.0.9" ||
            config.port != 5300) {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_loadtest", "-c", "0"};
        LoadTestConfig config;
        if (load_loadtest_config(args.argc(), args.argv(), config, error) || error != "Must have at least 1 client") {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_loadtest", "-m"};
        LoadTestConfig config;
        if (load_loadtest_config(args.argc(), args.argv(), config, error) || error != "Missing value for -m") {
            FAIL();
        }
    }
    {
        Args args{"chatrelay_loadtest", "-x"};
        LoadTestConfig config;
        if (load_loadtest_config(args.argc(), args.argv(), config, error) || error != "Unknown option -x") {
            FAIL();
        }
    }

    uint16_t port = 0;
    if (parse_port("0", port) || parse_port("-1", port) || !parse_port("65535", port) || port != 65535) {
        FAIL();
    }
    return 0;
}
