#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <kvcall/codec/codec_hooks.h>
#include <kvcall/codec/text_encoding.h>
#include <kvcall/core/types.h>

namespace kvcall::config {

/**
 * Connection settings in the driver's connection-string form:
 *
 *   127.0.0.1:6379,password=123,defaultDatabase=13,prefix=app:
 *
 * The first element is the host. Keys are case-insensitive. The in-process adapter honours
 * host, database, prefix and encoding; credentials, client name, ssl, timeouts, pool sizing and
 * retry are validated and carried for a network transport.
 */
struct ConnectionString {
    std::string host{"127.0.0.1:6379"};
    std::string user;
    std::string password;
    int database{0};
    std::string prefix;
    std::string clientName;
    codec::TextEncoding encoding{codec::TextEncoding::Utf8};
    bool ssl{false};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds receiveTimeout{10000};
    std::chrono::milliseconds sendTimeout{10000};
    std::chrono::milliseconds idleTimeout{20000};
    int maxPoolSize{100};
    int minPoolSize{1};
    int retry{0};

    static Result<ConnectionString> parse(std::string_view text);

    // Canonical form; only non-default settings are written.
    std::string toString() const;
};

struct ClientOptions {
    ConnectionString connection;
    codec::CodecHooks hooks;
    std::string logLevel{"warn"};
};

/**
 * Resolution order: defaults, then the [client] section of the config file (connection, prefix,
 * encoding, log_level), then KVCALL_CONNECTION / KVCALL_PREFIX / KVCALL_LOG_LEVEL.
 *
 * An empty path resolves through KVCALL_CONFIG and the XDG config dir; a missing file is only an
 * error when the path was given explicitly.
 */
Result<ClientOptions> loadClientOptions(const std::filesystem::path& configPath = {});

// trace|debug|info|warn|error|critical|off
Result<void> applyLogLevel(std::string_view level);

} // namespace kvcall::config
