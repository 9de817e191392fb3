#pragma once

#include <cstddef>
#include <functional>

namespace backtime::utils {

/**
 * @class WorkerPool
 * @brief Runs a pull-style job on a bounded number of threads.
 *
 * drain() invokes the job repeatedly from every worker until it returns
 * false (the work source is exhausted). With a single worker the job runs
 * inline on the calling thread, so execution is strictly sequential.
 *
 * The first exception thrown by any invocation stops every worker from
 * pulling more work. Invocations already running are allowed to finish, then
 * the exception is rethrown from drain() on the calling thread.
 */
class WorkerPool {
public:
	/**
	 * @param workers Maximum number of concurrent workers; 0 selects the
	 *        hardware concurrency (at least one).
	 */
	explicit WorkerPool(std::size_t workers);

	[[nodiscard]] std::size_t workers() const noexcept {
		return workers_;
	}

	void drain(const std::function<bool()> &job) const;

private:
	std::size_t workers_;
};

} // namespace backtime::utils
