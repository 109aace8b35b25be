#pragma once

#include "Channel.hpp"
#include "Context.hpp"
#include "Task.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <variant>

namespace mclink::coro
{
    namespace detail
    {
        template<typename Ex, typename Coro>
        auto co_spawn_impl(Ex& ex, Coro coro) -> DetachedTask
        {
            co_await std::invoke(std::move(coro), ex);
        }
    }

    /** Starts coro(ex) on the executor without waiting for it. */
    template<Executor Ex, std::invocable<Ex&> Coro>
    void co_spawn(Ex& ex, Coro&& coro)
    {
        auto detached{ detail::co_spawn_impl(ex, std::forward<Coro>(coro)) };
        ex.schedule(detached.getHandle());
    }

    /**
     * Runs the task to completion on a private Context driven by the
     * calling thread and returns its value. Exceptions are rethrown here.
     */
    template<typename T>
    auto syncWait(Task<T> task) -> T
    {
        Context ctx;
        std::exception_ptr exception;
        std::conditional_t<std::is_void_v<T>, std::monostate, std::optional<T>> result;

        co_spawn(ctx, [&](IExecutor& ex) -> Task<void> {
            try {
                if constexpr (std::is_void_v<T>) {
                    co_await std::move(task);
                }
                else {
                    result.emplace(co_await std::move(task));
                }
            } catch (const std::exception&) {
                exception = std::current_exception();
            }
            ex.stop();
        });
        ctx.run();

        if (exception) {
            std::rethrow_exception(exception);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*result);
        }
    }
} // namespace mclink::coro
