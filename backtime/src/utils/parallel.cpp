#include "backtime/utils/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace backtime::utils {

WorkerPool::WorkerPool(std::size_t workers) : workers_(workers) {
	if (workers_ == 0) {
		workers_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
	}
}

void WorkerPool::drain(const std::function<bool()> &job) const {
	if (workers_ == 1) {
		while (job()) {
		}
		return;
	}

	std::atomic<bool> stop{false};
	std::mutex error_mutex;
	std::exception_ptr first_error;

	auto worker = [&]() {
		while (!stop.load(std::memory_order_acquire)) {
			try {
				if (!job()) {
					return;
				}
			} catch (...) {
				std::lock_guard<std::mutex> lock(error_mutex);
				if (!first_error) {
					first_error = std::current_exception();
				}
				stop.store(true, std::memory_order_release);
				return;
			}
		}
	};

	std::vector<std::thread> threads;
	threads.reserve(workers_);
	try {
		for (std::size_t i = 0; i < workers_; ++i) {
			threads.emplace_back(worker);
		}
	} catch (...) {
		// Thread creation failed: let the started workers wind down before rethrowing.
		stop.store(true, std::memory_order_release);
		for (auto &thread : threads) {
			thread.join();
		}
		throw;
	}

	for (auto &thread : threads) {
		thread.join();
	}

	if (first_error) {
		std::rethrow_exception(first_error);
	}
}

} // namespace backtime::utils
