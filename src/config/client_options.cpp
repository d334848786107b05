#include <kvcall/codec/value_traits.h>
#include <kvcall/config/client_options.h>
#include <kvcall/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <array>
#include <optional>

namespace kvcall::config {

namespace {

std::optional<int> parseInt(const std::string& value) {
    return codec::ValueTraits<int>::tryParse(value);
}

std::optional<bool> parseBool(const std::string& value) {
    const auto v = to_lower(value);
    if (v == "true" || v == "1" || v == "yes")
        return true;
    if (v == "false" || v == "0" || v == "no")
        return false;
    return std::nullopt;
}

Error invalid(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid connection string value for '" + key + "': '" + value + "'"};
}

} // namespace

Result<ConnectionString> ConnectionString::parse(std::string_view text) {
    ConnectionString cs;
    std::string input(text);
    trim(input);
    if (input.empty())
        return Error{ErrorCode::InvalidArgument, "Connection string is empty"};

    std::size_t start = 0;
    bool first = true;
    while (start <= input.size()) {
        auto comma = input.find(',', start);
        if (comma == std::string::npos)
            comma = input.size();
        std::string item = input.substr(start, comma - start);
        start = comma + 1;
        trim(item);
        if (item.empty()) {
            first = false;
            continue;
        }

        const auto eq = item.find('=');
        if (first && eq == std::string::npos) {
            cs.host = item;
            first = false;
            continue;
        }
        first = false;
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument,
                         "Connection string element is not key=value: '" + item + "'"};
        }

        std::string key = item.substr(0, eq);
        std::string value = item.substr(eq + 1);
        trim(key);
        trim(value);
        const auto k = to_lower(key);

        auto setMs = [&](std::chrono::milliseconds& target) -> bool {
            auto n = parseInt(value);
            if (!n || *n < 0)
                return false;
            target = std::chrono::milliseconds{*n};
            return true;
        };

        if (k == "user") {
            cs.user = value;
        } else if (k == "password") {
            cs.password = value;
        } else if (k == "database" || k == "defaultdatabase") {
            auto n = parseInt(value);
            if (!n || *n < 0)
                return invalid(key, value);
            cs.database = *n;
        } else if (k == "prefix") {
            cs.prefix = value;
        } else if (k == "name" || k == "clientname") {
            cs.clientName = value;
        } else if (k == "encoding") {
            auto enc = codec::parseTextEncoding(value);
            if (!enc)
                return invalid(key, value);
            cs.encoding = *enc;
        } else if (k == "ssl") {
            auto b = parseBool(value);
            if (!b)
                return invalid(key, value);
            cs.ssl = *b;
        } else if (k == "connecttimeout") {
            if (!setMs(cs.connectTimeout))
                return invalid(key, value);
        } else if (k == "receivetimeout") {
            if (!setMs(cs.receiveTimeout))
                return invalid(key, value);
        } else if (k == "sendtimeout") {
            if (!setMs(cs.sendTimeout))
                return invalid(key, value);
        } else if (k == "idletimeout") {
            if (!setMs(cs.idleTimeout))
                return invalid(key, value);
        } else if (k == "max pool size" || k == "maxpoolsize" || k == "poolsize") {
            auto n = parseInt(value);
            if (!n || *n <= 0)
                return invalid(key, value);
            cs.maxPoolSize = *n;
        } else if (k == "min pool size" || k == "minpoolsize") {
            auto n = parseInt(value);
            if (!n || *n < 0)
                return invalid(key, value);
            cs.minPoolSize = *n;
        } else if (k == "retry") {
            auto n = parseInt(value);
            if (!n || *n < 0)
                return invalid(key, value);
            cs.retry = *n;
        } else {
            spdlog::warn("Ignoring unknown connection string key '{}'", key);
        }
    }
    return cs;
}

std::string ConnectionString::toString() const {
    const ConnectionString defaults;
    std::string out = host;
    auto add = [&out](std::string_view key, const std::string& value) {
        out.push_back(',');
        out.append(key);
        out.push_back('=');
        out.append(value);
    };
    if (!user.empty())
        add("user", user);
    if (!password.empty())
        add("password", password);
    if (database != defaults.database)
        add("defaultDatabase", std::to_string(database));
    if (!prefix.empty())
        add("prefix", prefix);
    if (!clientName.empty())
        add("clientName", clientName);
    if (encoding != defaults.encoding)
        add("encoding", std::string(codec::to_string(encoding)));
    if (ssl)
        add("ssl", "true");
    if (connectTimeout != defaults.connectTimeout)
        add("connectTimeout", std::to_string(connectTimeout.count()));
    if (receiveTimeout != defaults.receiveTimeout)
        add("receiveTimeout", std::to_string(receiveTimeout.count()));
    if (sendTimeout != defaults.sendTimeout)
        add("sendTimeout", std::to_string(sendTimeout.count()));
    if (idleTimeout != defaults.idleTimeout)
        add("idleTimeout", std::to_string(idleTimeout.count()));
    if (maxPoolSize != defaults.maxPoolSize)
        add("maxPoolSize", std::to_string(maxPoolSize));
    if (minPoolSize != defaults.minPoolSize)
        add("minPoolSize", std::to_string(minPoolSize));
    if (retry != defaults.retry)
        add("retry", std::to_string(retry));
    return out;
}

Result<ClientOptions> loadClientOptions(const std::filesystem::path& configPath) {
    ClientOptions options;

    const bool explicitPath = !configPath.empty();
    const auto path = explicitPath ? configPath : resolve_config_path();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (auto conn = parse_config_value(path, "client", "connection"); !conn.empty()) {
            auto parsed = ConnectionString::parse(conn);
            if (!parsed)
                return parsed.error();
            options.connection = std::move(parsed).value();
        }
        if (auto prefix = parse_config_value(path, "client", "prefix"); !prefix.empty()) {
            options.connection.prefix = prefix;
        }
        if (auto enc = parse_config_value(path, "client", "encoding"); !enc.empty()) {
            auto parsed = codec::parseTextEncoding(enc);
            if (!parsed)
                return Error{ErrorCode::InvalidArgument, "Unknown text encoding '" + enc + "'"};
            options.connection.encoding = *parsed;
        }
        if (auto level = parse_config_value(path, "client", "log_level"); !level.empty()) {
            options.logLevel = level;
        }
        spdlog::debug("Loaded client options from {}", path.string());
    } else if (explicitPath) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    if (const char* env = env_or_null("KVCALL_CONNECTION")) {
        auto parsed = ConnectionString::parse(env);
        if (!parsed)
            return parsed.error();
        options.connection = std::move(parsed).value();
    }
    if (const char* env = env_or_null("KVCALL_PREFIX")) {
        options.connection.prefix = env;
    }
    if (const char* env = env_or_null("KVCALL_LOG_LEVEL")) {
        options.logLevel = env;
    }
    return options;
}

Result<void> applyLogLevel(std::string_view level) {
    static constexpr std::array<std::string_view, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    const auto lower = to_lower(std::string(level));
    if (std::find(kLevels.begin(), kLevels.end(), lower) == kLevels.end()) {
        spdlog::warn("Unknown log level '{}', keeping current level", level);
        return Error{ErrorCode::InvalidArgument, "Unknown log level '" + std::string(level) + "'"};
    }
    spdlog::set_level(spdlog::level::from_str(lower));
    return Result<void>();
}

} // namespace kvcall::config
