/**
 * \file IoContext.hpp
 * \brief Single-threaded I/O/event loop context and metrics.
 * \details Pending operations register non-blocking `try_complete()` functors.
 * The loop thread polls them and drops each one once it reports completion;
 * one-shot tasks are posted as operations that complete on their first run.
 * Uses `notify_one()` wakeups with a short poll fallback so that receive
 * pollers are retried every `poll_interval` while the loop is otherwise idle.
 */
// IoContext.hpp - Single-threaded I/O/event loop context.
#pragma once

#include "logger.hpp"
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <functional>
#include <array>
#include <chrono>
#include <cstdint>
#include <string>

namespace transport {

/** \defgroup io_context I/O Context
 *  \brief Event loop that owns every socket callback of the transport.
 */

/** \brief I/O/event loop context that polls pending operations on one thread.
 *  \details All endpoint callbacks run on the thread driving the context: the
 *  event thread after `start()`, or the caller of `run()` / `poll_once()`.
 *  Registration is thread-safe; execution is single-threaded.
 *  \ingroup io_context
 */
class IoContext : public std::enable_shared_from_this<IoContext> {
public:
	/** \brief Construct an event loop; call `start()`, `run()` or `poll_once()` to process work. */
	IoContext();
	~IoContext();

	IoContext(const IoContext&) = delete;
	IoContext& operator=(const IoContext&) = delete;

	// --- Types ---
	/** \brief Classification for per-category completion counters. */
	enum class PendingOpCategory : uint8_t { Generic = 0, Receive, Task, Count };
	/** \brief Number of categories as a compile-time constant for array sizing. */
	static constexpr size_t category_count_ = static_cast<size_t>(PendingOpCategory::Count);

	// --- Lifecycle ---
	/** \brief Start the loop on a dedicated event thread.
	 *  \details A shared-owned context is kept alive by its event thread; when
	 *  all other owners release it the loop retires and the context is destroyed
	 *  on the event thread.
	 */
	void start();
	/** \brief Run the loop on the current thread until `stop()` is requested. */
	void run();
	/** \brief Process every currently pending operation once on the calling thread.
	 *  \return Number of operations that completed during this pass.
	 */
	size_t poll_once();
	/** \brief Request shutdown and join the event thread (if any). */
	void stop();
	/** \brief True if loop is running and not yet stopped. */
	bool is_running() const;
	/** \brief True when called from the thread currently processing operations. */
	bool running_in_this_thread() const;

	// --- Logger ---
	/** \brief Set optional logger for info/error messages. */
	void set_logger(std::shared_ptr<Logger> logger);
	/** \brief Get the currently configured logger (may be null). */
	std::shared_ptr<Logger> get_logger() const;

	/** \brief Maximum idle sleep before pending operations are retried. */
	void set_poll_interval(std::chrono::milliseconds interval);
	std::chrono::milliseconds poll_interval() const;

	// --- Pending operations registration ---
	/** \brief Register a pending operation; it is retried on every pass until it returns true. */
	void register_pending(std::function<bool()> try_complete);
	/** \brief Register a categorized pending operation for metrics. */
	void register_pending(PendingOpCategory category, std::function<bool()> try_complete);
	/** \brief Run `task` once on the loop thread. */
	void post(std::function<void()> task);

	// --- Statistics ---
	/** \brief Total operations completed across all categories. */
	size_t get_total_operations_processed() const;
	/** \brief Completed operations for one category. */
	size_t get_operations_processed(PendingOpCategory category) const;
	/** \brief Number of operations currently queued (including persistent pollers). */
	size_t pending_count() const;
	/** \brief Human-readable summary of the counters. */
	std::string format_statistics() const;
	/** \brief Log the counters via logger (if set). */
	void log_statistics() const;
	/** \brief Reset all counters. */
	void reset_statistics();

private:
	/** \brief Process all currently pending operations; requeues unfinished. */
	size_t process_pending_ops();
	/** \brief Loop body shared by `run()` and the event thread.
	 *  \param owner The event thread's own reference, or null; the loop retires
	 *  once it is the last one.
	 */
	void run_loop(const std::shared_ptr<IoContext>* owner);

	/** \brief Internal representation of a pending operation awaiting readiness. */
	struct PendingOp {
		std::function<bool()> try_complete;      ///< Readiness predicate/work attempt
		PendingOpCategory category{PendingOpCategory::Generic}; ///< Metrics category
	};
	std::vector<PendingOp> pending_ops_;
	mutable std::mutex pending_mutex_;
	std::condition_variable pending_cv_;
	/** \brief Set when operations are registered; requeued pollers do not set it. */
	bool new_work_{false};
	/** \brief Wake the waiting loop thread. */
	void wake_() { pending_cv_.notify_one(); }

	std::atomic<bool> running_{false};
	std::thread event_thread_;
	std::atomic<std::thread::id> loop_thread_id_{};
	std::shared_ptr<Logger> logger_;
	std::atomic<std::chrono::milliseconds::rep> poll_interval_ms_{10};

	// Statistics state
	mutable std::mutex stats_mutex_;
	std::array<size_t, category_count_> processed_by_category_{};
};

/** \brief Process-wide context started on first use (one event thread). */
std::shared_ptr<IoContext> default_context();

} // namespace transport
