#pragma once

#include "Context.hpp"

#include <coroutine>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace mclink::coro
{
    namespace detail
    {
        template<typename T>
        class ChannelAwaiter;
    }

    /**
     * Multi-producer, single-consumer queue between threads and a coroutine.
     * next() suspends until a value is pushed or the channel is closed.
     * Values pushed before close() are still delivered; after that next()
     * yields std::nullopt.
     */
    template<typename T>
    class Channel
    {
        struct State
        {
            std::mutex mutex;
            std::deque<T> queue;
            bool closed{ false };
            std::coroutine_handle<> waiter;
            IExecutor* executor{ nullptr };
            std::weak_ptr<void> lifeToken;
        };

      public:
        Channel()
          : m_state(std::make_shared<State>())
        {
        }

        auto push(T value) -> void
        {
            std::unique_lock lock(m_state->mutex);
            if (m_state->closed) {
                return;
            }
            m_state->queue.push_back(std::move(value));
            wake(lock);
        }

        auto close() -> void
        {
            std::unique_lock lock(m_state->mutex);
            if (m_state->closed) {
                return;
            }
            m_state->closed = true;
            wake(lock);
        }

        auto isClosed() const -> bool
        {
            std::lock_guard lock(m_state->mutex);
            return m_state->closed;
        }

        auto next() -> detail::ChannelAwaiter<T> { return detail::ChannelAwaiter<T>{ m_state }; }

      private:
        auto wake(std::unique_lock<std::mutex>& lock) -> void
        {
            auto handle{ std::exchange(m_state->waiter, nullptr) };
            if (!handle) {
                return;
            }
            auto* executor{ std::exchange(m_state->executor, nullptr) };
            auto token{ std::exchange(m_state->lifeToken, {}) };
            lock.unlock();

            if (executor) {
                if (token.lock()) {
                    executor->schedule(handle);
                }
            }
            else {
                handle.resume();
            }
        }

        std::shared_ptr<State> m_state;

        friend class detail::ChannelAwaiter<T>;
    };

    namespace detail
    {
        template<typename T>
        class ChannelAwaiter
        {
          public:
            explicit ChannelAwaiter(std::shared_ptr<typename Channel<T>::State> state)
              : m_state(std::move(state))
            {
            }

            auto await_ready() -> bool
            {
                std::lock_guard lock(m_state->mutex);
                return m_state->closed || !m_state->queue.empty();
            }

            template<typename P>
            auto await_suspend(std::coroutine_handle<P> handle) -> bool
            {
                std::lock_guard lock(m_state->mutex);
                if (m_state->closed || !m_state->queue.empty()) {
                    return false;
                }

                m_state->waiter = handle;
                if constexpr (requires { handle.promise().executor; }) {
                    m_state->executor = handle.promise().executor;
                    if (m_state->executor) {
                        m_state->lifeToken = m_state->executor->getLifeToken();
                    }
                }
                return true;
            }

            auto await_resume() -> std::optional<T>
            {
                std::lock_guard lock(m_state->mutex);
                if (m_state->queue.empty()) {
                    return std::nullopt;
                }
                auto value{ std::move(m_state->queue.front()) };
                m_state->queue.pop_front();
                return value;
            }

          private:
            std::shared_ptr<typename Channel<T>::State> m_state;
        };
    }
} // namespace mclink::coro
