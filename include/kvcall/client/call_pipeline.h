#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <kvcall/client/command_packet.h>
#include <kvcall/client/interceptor.h>
#include <kvcall/client/notice_sink.h>
#include <kvcall/codec/invariant_text.h>

namespace kvcall::client {

inline constexpr std::string_view kNotConnectedHost = "Not connected";

/**
 * Wraps one logical call: key prefixing, interceptor before/after hooks, timing and the trace
 * notification.
 *
 *   Idle -> Prefixed -> BeforeStage -> {Executed | Skipped} -> AfterStage -> NotifyStage -> Done
 *
 * With no interceptors and no subscribers the execute function is called directly with no
 * clock reads or allocations. Otherwise every interceptor created in the before stage sees
 * after() exactly once, even when execute throws, and the original exception is rethrown
 * once the after and notify stages have run.
 */
class CallPipeline {
public:
    using Clock = std::chrono::steady_clock;

    CallPipeline(KvClient& owner, std::string prefix, const InterceptorRegistry& interceptors,
                 const NoticeSink& notices)
        : owner_(owner), prefix_(std::move(prefix)), interceptors_(interceptors),
          notices_(notices) {}

    const std::string& prefix() const noexcept { return prefix_; }

    template <typename T, typename Fn> T run(CommandPacket& cmd, Fn&& execute) {
        static_assert(!std::is_void_v<T>, "CallPipeline::run requires a result type");
        cmd.applyPrefix(prefix_);

        const bool notice = notices_.hasSubscribers();
        const bool aop = !interceptors_.empty();
        if (!notice && !aop)
            return std::forward<Fn>(execute)();
        return runInstrumented<T>(cmd, std::forward<Fn>(execute), notice, aop);
    }

private:
    template <typename T, typename Fn>
    T runInstrumented(CommandPacket& cmd, Fn&& execute, bool notice, bool aop) {
        std::optional<Clock::time_point> overallStart;
        if (notice)
            overallStart = Clock::now();

        // BeforeStage
        std::vector<std::unique_ptr<IInterceptor>> instances;
        std::vector<Clock::time_point> starts;
        std::optional<T> result;
        if (aop) {
            auto factories = interceptors_.snapshot();
            if (factories) {
                instances.reserve(factories->size());
                starts.reserve(factories->size());
                for (const auto& entry : *factories) {
                    const auto start = Clock::now();
                    auto instance = entry.item ? entry.item() : nullptr;
                    if (!instance)
                        continue;
                    InterceptorBeforeArgs args(owner_, cmd);
                    instance->before(args);
                    if (args.valueIsChanged()) {
                        if (const auto* substitute = std::any_cast<T>(&args.value()))
                            result = *substitute;
                    }
                    instances.push_back(std::move(instance));
                    starts.push_back(start);
                }
            }
        }

        // Executed unless an interceptor supplied the value (Skipped)
        std::exception_ptr error;
        std::string errorMessage;
        if (!result) {
            try {
                result.emplace(std::forward<Fn>(execute)());
            } catch (const std::exception& e) {
                error = std::current_exception();
                errorMessage = e.what();
            } catch (...) {
                error = std::current_exception();
                errorMessage = "Unknown exception";
            }
        }

        // AfterStage
        for (std::size_t i = 0; i < instances.size(); ++i) {
            InterceptorAfterArgs args{owner_, cmd, result ? std::any(*result) : std::any{}, error,
                                      elapsedMs(starts[i])};
            instances[i]->after(args);
        }

        // NotifyStage
        if (notice) {
            const auto& host = cmd.writeHost();
            NoticeEvent event;
            event.type = NoticeType::Call;
            event.exception = error;
            event.log = fmt::format("{} ({}ms) > {}\r\n{}",
                                    host ? std::string_view(*host) : kNotConnectedHost,
                                    elapsedMs(*overallStart), cmd.toString(),
                                    error ? errorMessage : codec::toInvariantString(*result));
            if (result)
                event.tag = *result;
            notices_.publish(event);
        }

        // Done
        if (error)
            std::rethrow_exception(error);
        return std::move(*result);
    }

    static std::int64_t elapsedMs(Clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    }

    KvClient& owner_;
    std::string prefix_;
    const InterceptorRegistry& interceptors_;
    const NoticeSink& notices_;
};

} // namespace kvcall::client
