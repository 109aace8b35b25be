#pragma once

#include "Context.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace mclink::coro
{
    namespace detail
    {
        struct DetachedTaskPromise;
        template<typename T>
        struct TaskPromise;
    }

    /**
     * Fire-and-forget coroutine. The frame destroys itself on completion,
     * so the handle must not be touched after it has been resumed.
     */
    class DetachedTask
    {
      public:
        using promise_type = detail::DetachedTaskPromise;
        using handle_type = std::coroutine_handle<promise_type>;

        DetachedTask(handle_type handle)
          : m_handle(handle)
        {
        }

        inline auto getHandle() const -> const handle_type& { return m_handle; }

      private:
        handle_type m_handle;
    };

    /**
     * Lazily started coroutine returning T. The body runs when the task is
     * awaited and control returns to the awaiting coroutine on completion.
     * Exceptions escaping the body are rethrown at the co_await site.
     */
    template<typename T>
    class Task
    {
      public:
        using promise_type = detail::TaskPromise<T>;
        using handle_type = std::coroutine_handle<promise_type>;

        Task(handle_type h)
          : m_handle(h)
        {
        }
        ~Task()
        {
            if (m_handle) {
                m_handle.destroy();
            }
        }

        Task(const Task&) = delete;
        auto operator=(const Task&) -> Task& = delete;

        Task(Task&& other) noexcept
          : m_handle(std::exchange(other.m_handle, nullptr))
        {
        }
        auto operator=(Task&& other) noexcept -> Task&
        {
            if (this != &other) {
                if (m_handle) {
                    m_handle.destroy();
                }
                m_handle = std::exchange(other.m_handle, nullptr);
            }
            return *this;
        }

        auto await_ready() const noexcept -> bool { return !m_handle || m_handle.done(); }
        auto await_suspend(std::coroutine_handle<> waiter) noexcept -> std::coroutine_handle<>
        {
            m_handle.promise().waiter = waiter;
            return m_handle;
        }
        auto await_resume() -> T
        {
            auto& promise{ m_handle.promise() };
            if (promise.exception) {
                std::rethrow_exception(promise.exception);
            }

            if constexpr (!std::is_void_v<T>) {
                if (!promise.value) {
                    throw std::logic_error("Task completed without returning a value");
                }
                return std::move(*promise.value);
            }
        }

        inline auto getHandle() const -> const handle_type& { return m_handle; }

      private:
        handle_type m_handle;
    };

    namespace detail
    {
        struct DetachedTaskPromise
        {
            auto get_return_object() -> DetachedTask
            {
                return DetachedTask{ DetachedTask::handle_type::from_promise(*this) };
            }
            auto initial_suspend() -> std::suspend_always { return {}; }
            auto final_suspend() noexcept -> std::suspend_never { return {}; }
            auto unhandled_exception() -> void { std::terminate(); }
            auto return_void() -> void {}
        };

        template<typename T>
        struct TaskPromiseBase
        {
            std::coroutine_handle<> waiter;
            std::exception_ptr exception;
            IExecutor* executor{ nullptr };

            // free coroutines taking the executor as first parameter
            template<typename... Args>
            TaskPromiseBase(IExecutor& ex, Args&&...)
              : executor(&ex)
            {
            }
            // member functions and lambdas taking the executor as first parameter
            template<typename Class, typename... Args>
            TaskPromiseBase(Class&&, IExecutor& ex, Args&&...)
              : executor(&ex)
            {
            }
            TaskPromiseBase() = default;

            auto get_return_object() -> Task<T>
            {
                return Task<T>::handle_type::from_promise(static_cast<TaskPromise<T>&>(*this));
            }
            auto initial_suspend() -> std::suspend_always { return {}; }
            auto final_suspend() noexcept
            {
                struct
                {
                    auto await_ready() noexcept -> bool { return false; }
                    auto await_suspend(Task<T>::handle_type handle) noexcept -> std::coroutine_handle<>
                    {
                        return handle.promise().waiter ? handle.promise().waiter : std::noop_coroutine();
                    }
                    auto await_resume() noexcept -> void {}
                } awaiter{};
                return awaiter;
            }
            auto unhandled_exception() -> void { exception = std::current_exception(); }

            template<typename U>
            auto await_transform(Task<U>&& child) -> Task<U>&&
            {
                // children inherit the executor unless they were given one
                if (child.getHandle() && executor && !child.getHandle().promise().executor) {
                    child.getHandle().promise().executor = executor;
                }
                return std::move(child);
            }
            template<typename U>
            auto await_transform(U&& awaitable) -> U&&
            {
                return std::forward<U>(awaitable);
            }
        };

        template<typename T = void>
        struct TaskPromise : public TaskPromiseBase<T>
        {
            using TaskPromiseBase<T>::TaskPromiseBase;

            std::optional<T> value;
            auto return_value(T val) -> void { value.emplace(std::move(val)); }
        };

        template<>
        struct TaskPromise<void> : public TaskPromiseBase<void>
        {
            using TaskPromiseBase<void>::TaskPromiseBase;

            auto return_void() -> void {}
        };
    }
} // namespace mclink::coro
