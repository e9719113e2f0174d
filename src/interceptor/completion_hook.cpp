// src/interceptor/completion_hook.cpp
#include "tether/interceptor/completion_hook.h"
#include "tether/common/errors.h"

namespace tether {

CompletionHook& CompletionHook::instance() {
    static CompletionHook hook;
    return hook;
}

void CompletionHook::set_backend(CompletionFn backend, AsyncCompletionFn async_backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_ = std::move(backend);
    async_backend_ = std::move(async_backend);
}

void CompletionHook::clear_backend() {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_ = nullptr;
    async_backend_ = nullptr;
}

nlohmann::json CompletionHook::complete(const CallRequest& request) {
    SyncHandler handler;
    CompletionFn backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handlers_.sync;
        backend = backend_;
    }
    if (!backend) {
        throw TetherError("No completion backend configured");
    }
    // the call itself runs unlocked
    return handler ? handler(request, backend) : backend(request);
}

AsyncCompletionFn CompletionHook::async_invoker() const {
    if (async_backend_) {
        return async_backend_;
    }
    if (!backend_) {
        return nullptr;
    }
    CompletionFn backend = backend_;
    return [backend](const CallRequest& request) {
        return std::async(std::launch::async, backend, request);
    };
}

std::future<nlohmann::json> CompletionHook::complete_async(const CallRequest& request) {
    AsyncHandler handler;
    AsyncCompletionFn invoker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handlers_.async;
        invoker = async_invoker();
    }
    if (!invoker) {
        throw TetherError("No completion backend configured");
    }
    return handler ? handler(request, invoker) : invoker(request);
}

bool CompletionHook::intercepted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !handlers_.empty();
}

CallInterceptionPoint::Handlers CompletionHook::install(Handlers handlers) {
    std::lock_guard<std::mutex> lock(mutex_);
    Handlers previous = std::move(handlers_);
    handlers_ = std::move(handlers);
    return previous;
}

void CompletionHook::restore(Handlers previous) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_ = std::move(previous);
}

} // namespace tether
