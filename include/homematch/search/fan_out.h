#pragma once

#include <homematch/core/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace homematch::search {

struct FanOutOptions {
    std::optional<boost::asio::any_io_executor> executor; // nullopt = run inline
    std::chrono::milliseconds timeout{0};                 // 0 = wait indefinitely
    std::stop_token cancel;
    std::string label = "fan-out";
};

/**
 * @brief Run independent collaborator calls and join them, failing fast
 *
 * Tasks are posted to an Asio executor when one is given, otherwise run inline in order.
 * The join returns as soon as every task succeeded, one task failed, the deadline passed or
 * the caller's stop token fired. In the last three cases the shared stop source is triggered
 * so tasks that have not started yet skip their work; in-flight tasks finish on their own and
 * their late results are discarded. Task state is shared-owned, so returning early is safe.
 * Inline runs check the deadline before each task only and cannot bound a task in progress.
 */
template <typename T> class FanOut {
public:
    using Task = std::function<Result<T>(std::stop_token)>;

    using Options = FanOutOptions;

    /**
     * @brief Run @p tasks and collect their values in task order
     *
     * @return All values, or the first task error, Timeout or OperationCancelled
     */
    static Result<std::vector<T>> run(std::vector<Task> tasks, const Options& options) {
        if (tasks.empty()) {
            return std::vector<T>{};
        }
        if (options.executor) {
            return runPosted(std::move(tasks), options);
        }
        return runInline(std::move(tasks), options);
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<std::optional<T>> values;
        std::optional<Error> firstError;
        std::stop_source stop;
        size_t pending = 0;
        bool callerCancelled = false;
    };

    static Result<T> invoke(const Task& task, std::stop_token token) {
        try {
            return task(token);
        } catch (const std::exception& e) {
            return Error{ErrorCode::CollaboratorFailure, e.what()};
        }
    }

    static Result<std::vector<T>> runInline(std::vector<Task> tasks, const Options& options) {
        const auto deadline = std::chrono::steady_clock::now() + options.timeout;
        std::stop_source stop;

        std::vector<T> out;
        out.reserve(tasks.size());
        for (size_t i = 0; i < tasks.size(); ++i) {
            if (options.cancel.stop_requested()) {
                return Error{ErrorCode::OperationCancelled, options.label + " cancelled by caller"};
            }
            if (options.timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
                return Error{ErrorCode::Timeout, options.label + " timed out after " +
                                                     std::to_string(options.timeout.count()) +
                                                     " ms"};
            }
            auto r = invoke(tasks[i], stop.get_token());
            if (!r) {
                return r.error();
            }
            out.push_back(std::move(r).value());
        }
        return out;
    }

    static Result<std::vector<T>> runPosted(std::vector<Task> tasks, const Options& options) {
        auto state = std::make_shared<State>();
        state->values.resize(tasks.size());
        state->pending = tasks.size();

        for (size_t i = 0; i < tasks.size(); ++i) {
            boost::asio::post(*options.executor, [state, task = std::move(tasks[i]), i]() {
                std::optional<Result<T>> r;
                if (!state->stop.stop_requested()) {
                    r.emplace(invoke(task, state->stop.get_token()));
                }

                std::lock_guard<std::mutex> lock(state->mutex);
                if (r) {
                    if (r->has_value()) {
                        state->values[i].emplace(std::move(*r).value());
                    } else if (!state->firstError) {
                        state->firstError = r->error();
                        state->stop.request_stop();
                    }
                }
                --state->pending;
                state->cv.notify_all();
            });
        }

        // Registered before taking the lock: the callback may run immediately and locks too
        std::stop_callback onCancel(options.cancel, [state]() {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->callerCancelled = true;
            }
            state->cv.notify_all();
        });

        std::unique_lock<std::mutex> lock(state->mutex);
        auto settled = [&state]() {
            return state->pending == 0 || state->firstError.has_value() || state->callerCancelled;
        };

        if (options.timeout.count() > 0) {
            if (!state->cv.wait_for(lock, options.timeout, settled)) {
                state->stop.request_stop();
                spdlog::warn("{} timed out after {} ms ({} of {} calls outstanding)", options.label,
                             options.timeout.count(), state->pending, state->values.size());
                return Error{ErrorCode::Timeout, options.label + " timed out after " +
                                                     std::to_string(options.timeout.count()) +
                                                     " ms"};
            }
        } else {
            state->cv.wait(lock, settled);
        }

        if (state->callerCancelled) {
            state->stop.request_stop();
            return Error{ErrorCode::OperationCancelled, options.label + " cancelled by caller"};
        }
        if (state->firstError) {
            return *state->firstError;
        }

        std::vector<T> out;
        out.reserve(state->values.size());
        for (auto& v : state->values) {
            out.push_back(std::move(*v));
        }
        return out;
    }
};

} // namespace homematch::search
