// cell.hpp - Recursion cells: eager values and lazy, force-once memoized computations
#pragma once
#include "alkey/errors.hpp"
#include "alkey/events.hpp"
#include "alkey/value.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace alkey
{

    namespace detail
    {
        inline uint64_t next_cell_id()
        {
            static std::atomic<uint64_t> counter{0};
            return ++counter;
        }
    } // namespace detail

    // Backing store of a self-referential field.
    //
    // Eager cells hold their value from construction. Lazy cells hold a computation that runs at
    // most once: concurrent first forces block until the single runner finishes and then share
    // its result. A computation that throws leaves the cell pending (retryable) and surfaces as
    // ComputationFailed; the computation itself is released once the cell is forced.
    template <typename T>
    class RecursionCell
    {
    public:
        using computation = std::function<T()>;

        static std::shared_ptr<RecursionCell> eager(T v)
        {
            auto c = std::shared_ptr<RecursionCell>(new RecursionCell(false));
            c->state_ = State::Eager;
            c->value_.emplace(std::move(v));
            return c;
        }

        static std::shared_ptr<RecursionCell> lazy(computation fn, std::shared_ptr<EventSink> sink = {})
        {
            auto c = std::shared_ptr<RecursionCell>(new RecursionCell(true));
            c->state_ = State::Pending;
            c->fn_ = std::move(fn);
            c->sink_ = std::move(sink);
            return c;
        }

        RecursionCell(const RecursionCell &) = delete;
        RecursionCell &operator=(const RecursionCell &) = delete;

        const T &force()
        {
            std::unique_lock<std::mutex> lk(mu_);
            for (;;)
            {
                if (state_ == State::Eager || state_ == State::Forced)
                    return *value_;
                if (state_ == State::Running)
                {
                    if (runner_ == std::this_thread::get_id())
                        throw ComputationFailed(make_diag("E1441", "cell #" + std::to_string(id_) + " forced from inside its own computation",
                                                          "a lazy value cannot depend on itself directly"));
                    cv_.wait(lk, [&] { return state_ != State::Running; });
                    continue;
                }
                break; // Pending: this thread runs the computation
            }
            if (!fn_)
                throw ComputationFailed(make_diag("E1440", "cell #" + std::to_string(id_) + " has no computation"));
            state_ = State::Running;
            runner_ = std::this_thread::get_id();
            lk.unlock();

            Stopwatch sw;
            std::optional<T> result;
            try
            {
                result.emplace(fn_());
            }
            catch (const std::exception &e)
            {
                lk.lock();
                reset_to_pending();
                throw ComputationFailed(make_diag("E1440", "lazy computation failed in cell #" + std::to_string(id_) + ": " + e.what(),
                                                  "the cell stays pending; force again to retry"));
            }
            catch (...)
            {
                lk.lock();
                reset_to_pending();
                throw ComputationFailed(make_diag("E1440", "lazy computation failed in cell #" + std::to_string(id_) + ": unknown exception",
                                                  "the cell stays pending; force again to retry"));
            }
            const auto took = sw.elapsed();

            lk.lock();
            value_ = std::move(result);
            fn_ = nullptr;
            state_ = State::Forced;
            runner_ = std::thread::id();
            cv_.notify_all();
            lk.unlock();

            if (sink_)
                sink_->emit_payload(events::LazyForced{id_, took});
            return *value_;
        }

        bool is_lazy() const noexcept { return lazy_; }
        bool is_forced() const
        {
            std::lock_guard<std::mutex> lk(mu_);
            return state_ == State::Eager || state_ == State::Forced;
        }
        // Value if already available; never forces.
        const T *peek() const
        {
            std::lock_guard<std::mutex> lk(mu_);
            return (state_ == State::Eager || state_ == State::Forced) ? &*value_ : nullptr;
        }
        uint64_t id() const noexcept { return id_; }

    private:
        enum class State
        {
            Eager,
            Pending,
            Running,
            Forced
        };

        explicit RecursionCell(bool lazy) : lazy_(lazy), id_(detail::next_cell_id()) {}

        void reset_to_pending()
        {
            state_ = State::Pending;
            runner_ = std::thread::id();
            cv_.notify_all();
        }

        mutable std::mutex mu_;
        std::condition_variable cv_;
        State state_ = State::Pending;
        std::optional<T> value_;
        computation fn_;
        std::thread::id runner_;
        std::shared_ptr<EventSink> sink_;
        const bool lazy_;
        const uint64_t id_;
    };

    using value_cell = RecursionCell<value>;

    inline cell_ptr eager_cell(value v) { return value_cell::eager(std::move(v)); }
    inline cell_ptr lazy_cell(std::function<value()> fn, std::shared_ptr<EventSink> sink = {}) { return value_cell::lazy(std::move(fn), std::move(sink)); }

} // namespace alkey
