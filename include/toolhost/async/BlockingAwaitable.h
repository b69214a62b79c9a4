//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BlockingAwaitable.h
// Purpose: co_await a blocking call without occupying a thread of the awaiting coroutine's executor
//==========================================================================================================

#pragma once

#include <exception>
#include <memory>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolhost {
namespace async {

namespace detail {

// State shared between the initiating coroutine and the worker thread. The executor is declared
// first so the outstanding-work count is released only after everything else is destroyed.
template <typename T, typename Executor, typename Handler, typename Work>
struct BlockingOp {
    Executor executor;
    Handler handler;
    Work work;

    void complete(std::exception_ptr eptr, T value) {
        boost::asio::post(executor, [h = std::move(handler), eptr, v = std::move(value)]() mutable {
            std::move(h)(eptr, std::move(v));
        });
    }

    void run() {
        std::exception_ptr eptr;
        T value{};
        try {
            value = work();
        } catch (const std::exception&) {
            eptr = std::current_exception();
        }
        complete(eptr, std::move(value));
    }
};

} // namespace detail

//==========================================================================================================
// RunBlocking
// Purpose: Runs work() on a dedicated thread and resumes the awaiting coroutine on its own executor
//          once work() returns.
// Args:
//   work: Callable returning T. It must bound its own running time; nothing here cancels it.
// Returns:
//   work()'s result. A std::exception thrown by work() is rethrown in the coroutine.
// Notes:
//   The executor's outstanding-work count is held until completion, so thread_pool::join() waits
//   for calls still in flight.
//==========================================================================================================
template <typename T, typename Work>
boost::asio::awaitable<T> RunBlocking(Work work) {
    namespace net = boost::asio;
    co_return co_await net::async_initiate<decltype(net::use_awaitable), void(std::exception_ptr, T)>(
        [](auto handler, Work w) {
            auto executor = net::prefer(net::get_associated_executor(handler), net::execution::outstanding_work.tracked);
            using Op = detail::BlockingOp<T, decltype(executor), std::decay_t<decltype(handler)>, Work>;
            auto op = std::make_shared<Op>(Op{std::move(executor), std::move(handler), std::move(w)});
            try {
                std::thread([op]() { op->run(); }).detach();
            } catch (const std::system_error&) {
                op->complete(std::current_exception(), T{});
            }
        },
        net::use_awaitable, std::move(work));
}

} // namespace async
} // namespace toolhost
