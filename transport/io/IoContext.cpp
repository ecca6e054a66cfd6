/**
 * \file IoContext.cpp
 * \brief Operational implementation for `transport::IoContext`.
 * \details Implements the loop body and pending operation processing. Runtime behavior:
 * - Pending operations are stolen in one batch (swap with local vector) so that
 *   operations may register further work while they run.
 * - Unfinished operations are requeued without signalling new work; the loop
 *   then sleeps up to `poll_interval` before retrying them.
 * - An exception escaping an operation is logged and the operation is dropped.
 */
#include "IoContext.hpp"
#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include "processUtils.hpp"

namespace transport {

IoContext::IoContext() = default;

IoContext::~IoContext() {
    stop();
    if (event_thread_.joinable()) {
        // released by the event thread itself after its loop retired
        event_thread_.detach();
    }
}

void IoContext::start() {
    bool expected = false;
    if (running_.compare_exchange_strong(expected, true)) {
        // Shared-owned contexts are pinned by their event thread until the loop exits
        std::shared_ptr<IoContext> self = weak_from_this().lock();
        event_thread_ = std::thread([this, self]() mutable {
            // name the thread so it's easier to identify in debuggers / profilers
            ProcessUtils::set_current_thread_name("knxlink-io");
            run_loop(self.get() ? &self : nullptr);
            // may run ~IoContext on this thread; no member access after this point
            self.reset();
        });
        if (logger_) logger_->info("IoContext started on event thread");
    }
}

void IoContext::run() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        if (logger_) logger_->warning("IoContext::run: loop already running");
        return;
    }
    run_loop(nullptr);
}

void IoContext::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lk(pending_mutex_);
            new_work_ = true;
        }
        wake_();
        if (event_thread_.joinable() && event_thread_.get_id() != std::this_thread::get_id()) {
            event_thread_.join();
        } else if (event_thread_.joinable()) {
            // stop() requested from a callback on the event thread itself
            event_thread_.detach();
        }
        if (logger_) logger_->info("IoContext stopped");
    }
}

bool IoContext::is_running() const { return running_; }

bool IoContext::running_in_this_thread() const {
    return loop_thread_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

void IoContext::set_logger(std::shared_ptr<Logger> logger) { logger_ = std::move(logger); }
std::shared_ptr<Logger> IoContext::get_logger() const { return logger_; }

void IoContext::set_poll_interval(std::chrono::milliseconds interval) {
    if (interval.count() < 1) interval = std::chrono::milliseconds(1);
    poll_interval_ms_.store(interval.count(), std::memory_order_relaxed);
}

std::chrono::milliseconds IoContext::poll_interval() const {
    return std::chrono::milliseconds(poll_interval_ms_.load(std::memory_order_relaxed));
}

void IoContext::run_loop(const std::shared_ptr<IoContext>* owner) {
    if (logger_) logger_->debug("IoContext main loop started (" + ProcessUtils::get_thread_info() + ")");

    while (running_) {
        process_pending_ops();
        if (owner && owner->use_count() == 1) {
            // every other owner is gone; nobody can register work or call stop()
            running_ = false;
            // work queued just before the last release still gets its pass
            process_pending_ops();
            if (logger_) logger_->debug("IoContext released by its owners; event loop retiring");
            break;
        }
        // Timed wait: predicate prevents lost wakeups (work queued prior to sleep)
        // and ensures prompt shutdown via !running_.
        std::unique_lock<std::mutex> lk(pending_mutex_);
        pending_cv_.wait_for(lk, poll_interval(), [this]() {
            return !running_ || new_work_;
        });
    }
    if (logger_) logger_->debug("IoContext main loop finished");
}

size_t IoContext::poll_once() {
    return process_pending_ops();
}

size_t IoContext::process_pending_ops() {
    std::vector<PendingOp> fetched;
    std::vector<PendingOp> requeue; // unfinished

    // Steal all pending ops with one lock; operations run outside the critical
    // section and may register new work.
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        new_work_ = false;
        if (pending_ops_.empty()) {
            return 0; // nothing to do
        }
        fetched.swap(pending_ops_); // pending_ops_ now empty
    }

    const auto previous_thread = loop_thread_id_.exchange(std::this_thread::get_id(), std::memory_order_acq_rel);

    size_t completed_count = 0;
    for (auto &op : fetched) {
        bool completed = false;
        try {
            if (op.try_complete) {
                completed = op.try_complete();
            } else {
                completed = true;
            }
        } catch (const std::exception &e) {
            if (logger_) logger_->error(std::string("Error in pending operation: ") + e.what());
            completed = true; // drop on exception
        }
        if (completed) {
            ++completed_count;
            size_t cat_idx = static_cast<size_t>(op.category);
            if (cat_idx >= category_count_) cat_idx = 0;
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            processed_by_category_[cat_idx]++;
        } else {
            requeue.push_back(std::move(op));
        }
    }

    loop_thread_id_.store(previous_thread, std::memory_order_release);

    if (!requeue.empty()) {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        // Keep original ordering ahead of anything registered during this pass.
        requeue.insert(requeue.end(),
                       std::make_move_iterator(pending_ops_.begin()),
                       std::make_move_iterator(pending_ops_.end()));
        pending_ops_.swap(requeue);
    }
    return completed_count;
}

void IoContext::register_pending(std::function<bool()> try_complete) {
    register_pending(PendingOpCategory::Generic, std::move(try_complete));
}

void IoContext::register_pending(PendingOpCategory category, std::function<bool()> try_complete) {
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        PendingOp op{};
        op.try_complete = std::move(try_complete);
        op.category = category;
        pending_ops_.push_back(std::move(op));
        new_work_ = true;
    }
    wake_();
}

void IoContext::post(std::function<void()> task) {
    register_pending(PendingOpCategory::Task, [t = std::move(task)]() {
        if (t) t();
        return true;
    });
}

size_t IoContext::get_total_operations_processed() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    size_t total = 0;
    for (size_t count : processed_by_category_) total += count;
    return total;
}

size_t IoContext::get_operations_processed(PendingOpCategory category) const {
    size_t idx = static_cast<size_t>(category);
    if (idx >= category_count_) return 0;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return processed_by_category_[idx];
}

size_t IoContext::pending_count() const {
    std::lock_guard<std::mutex> lk(pending_mutex_);
    return pending_ops_.size();
}

std::string IoContext::format_statistics() const {
    auto cat_name = [](PendingOpCategory c) -> const char* {
        switch (c) {
            case PendingOpCategory::Generic: return "Generic";
            case PendingOpCategory::Receive: return "Receive";
            case PendingOpCategory::Task: return "Task";
            default: return "Unknown";
        }
    };
    std::string out = "IoContext statistics: total=" + std::to_string(get_total_operations_processed());
    for (size_t cat = 0; cat < category_count_; ++cat) {
        out += std::string(", ") + cat_name(static_cast<PendingOpCategory>(cat)) + "=" +
               std::to_string(get_operations_processed(static_cast<PendingOpCategory>(cat)));
    }
    out += ", pending=" + std::to_string(pending_count());
    return out;
}

void IoContext::log_statistics() const {
    if (!logger_) return;
    logger_->info(format_statistics());
}

void IoContext::reset_statistics() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    processed_by_category_.fill(0);
}

std::shared_ptr<IoContext> default_context() {
    static std::weak_ptr<IoContext> weak;
    static std::mutex m;
    std::lock_guard<std::mutex> lk(m);
    auto s = weak.lock();
    if (!s || !s->is_running()) {  // the previous loop retired
        s = std::make_shared<IoContext>();
        s->start();
        weak = s;
    }
    return s;
}

} // namespace transport
