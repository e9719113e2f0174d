// include/tether/interceptor/completion_hook.h
#ifndef TETHER_INTERCEPTOR_COMPLETION_HOOK_H
#define TETHER_INTERCEPTOR_COMPLETION_HOOK_H

#include "tether/common/types.h"
#include <future>
#include <mutex>

namespace tether {

// A place where outbound metered calls can be wrapped. install() swaps in a
// pair of wrappers and hands back whatever was installed before; restore()
// puts that back.
class CallInterceptionPoint {
public:
    using SyncHandler = std::function<nlohmann::json(const CallRequest&, const CompletionFn& invoke)>;
    using AsyncHandler =
        std::function<std::future<nlohmann::json>(const CallRequest&, const AsyncCompletionFn& invoke)>;

    struct Handlers {
        SyncHandler sync;
        AsyncHandler async;

        bool empty() const { return !sync && !async; }
    };

    virtual ~CallInterceptionPoint() = default;

    virtual Handlers install(Handlers handlers) = 0;
    virtual void restore(Handlers previous) noexcept = 0;
};

// Process-wide completion entry point. Client code sends every model call
// through complete()/complete_async(); the configured backend performs the
// real call, wrapped by the installed handlers while a run is active.
class CompletionHook : public CallInterceptionPoint {
public:
    static CompletionHook& instance();

    CompletionHook() = default;
    CompletionHook(const CompletionHook&) = delete;
    CompletionHook& operator=(const CompletionHook&) = delete;

    // Without an async backend, complete_async runs the sync one on a task
    void set_backend(CompletionFn backend, AsyncCompletionFn async_backend = nullptr);
    void clear_backend();

    // Throw TetherError when no backend is configured
    nlohmann::json complete(const CallRequest& request);
    std::future<nlohmann::json> complete_async(const CallRequest& request);

    bool intercepted() const;

    Handlers install(Handlers handlers) override;
    void restore(Handlers previous) noexcept override;

private:
    AsyncCompletionFn async_invoker() const;

    mutable std::mutex mutex_;
    Handlers handlers_;
    CompletionFn backend_;
    AsyncCompletionFn async_backend_;
};

} // namespace tether

#endif // TETHER_INTERCEPTOR_COMPLETION_HOOK_H
