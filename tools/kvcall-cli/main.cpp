#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <kvcall/client/in_process_adapter.h>
#include <kvcall/client/kv_client.h>
#include <kvcall/config/client_options.h>
#include <kvcall/config/config_helpers.h>
#include <kvcall/core/exceptions.h>
#include <kvcall/version.hpp>

namespace {

// Whitespace split with "double quoted" tokens.
std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool quoted = false;
    bool pending = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            pending = true;
        } else if (!quoted && (c == ' ' || c == '\t')) {
            if (pending) {
                tokens.push_back(current);
                current.clear();
                pending = false;
            }
        } else {
            current.push_back(c);
            pending = true;
        }
    }
    if (pending)
        tokens.push_back(current);
    return tokens;
}

int runLine(kvcall::client::KvClient& client, const std::string& line) {
    auto tokens = tokenize(line);
    if (tokens.empty())
        return 0;
    kvcall::client::CommandPacket cmd(tokens.front());
    const auto name = kvcall::config::to_lower(tokens.front());
    const bool allKeys = name == "mget" || name == "del" || name == "exists";
    const bool firstKey = name == "get" || name == "set" || name == "incrby";
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        if (allKeys || (firstKey && i == 1))
            cmd.key(tokens[i]);
        else
            cmd.arg(kvcall::codec::WireValue{tokens[i]});
    }
    try {
        std::cout << client.call(cmd).toString() << std::endl;
        return 0;
    } catch (const kvcall::KvError& e) {
        std::cerr << "(error) " << e.what() << std::endl;
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"kvcall command runner (in-process keyspace)", "kvcall-cli"};
    app.set_version_flag("--version", KVCALL_VERSION_STRING);

    std::string configPath;
    std::string connection;
    std::string prefix;
    std::string logLevel;
    bool trace = false;
    std::vector<std::string> commands;

    app.add_option("-c,--config", configPath, "Path to config.toml");
    app.add_option("--connection", connection, "Connection string, e.g. 127.0.0.1:6379,prefix=app:");
    app.add_option("--prefix", prefix, "Key prefix applied to every key argument");
    app.add_option("--log-level", logLevel, "trace|debug|info|warn|error|off");
    app.add_flag("-t,--trace", trace, "Log every call with its timing and result");
    app.add_option("commands", commands, "Commands to run, e.g. \"SET a 1\" \"GET a\"; stdin if omitted");

    CLI11_PARSE(app, argc, argv);

    auto options = kvcall::config::loadClientOptions(configPath);
    if (!options) {
        spdlog::error("Failed to load options: {}", options.error().message);
        return 2;
    }
    auto opts = std::move(options).value();
    if (!connection.empty()) {
        auto parsed = kvcall::config::ConnectionString::parse(connection);
        if (!parsed) {
            spdlog::error("{}", parsed.error().message);
            return 2;
        }
        opts.connection = std::move(parsed).value();
    }
    if (!prefix.empty())
        opts.connection.prefix = prefix;
    if (!logLevel.empty())
        opts.logLevel = logLevel;
    if (trace && (opts.logLevel == "warn" || opts.logLevel == "error"))
        opts.logLevel = "info";
    if (auto applied = kvcall::config::applyLogLevel(opts.logLevel); !applied)
        return 2;

    kvcall::client::InProcessAdapter::Options adapterOptions;
    adapterOptions.host = opts.connection.host;
    adapterOptions.encoding = opts.connection.encoding;
    adapterOptions.database = opts.connection.database;
    std::unique_ptr<kvcall::client::InProcessAdapter> adapter;
    try {
        adapter = std::make_unique<kvcall::client::InProcessAdapter>(adapterOptions);
    } catch (const kvcall::KvError& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
    kvcall::client::KvClient client(std::move(adapter), std::move(opts));

    if (trace) {
        client.notices().subscribe([](const kvcall::client::NoticeEvent& e) {
            spdlog::info("{}", e.log);
        });
    }

    int rc = 0;
    if (!commands.empty()) {
        for (const auto& line : commands)
            rc |= runLine(client, line);
    } else {
        std::string line;
        while (std::getline(std::cin, line))
            rc |= runLine(client, line);
    }
    client.dispose();
    return rc;
}
