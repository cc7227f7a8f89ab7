#pragma once

#include "datasentry/core/errors.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace datasentry::core {

/**
 * @class CancellationToken
 * @brief Cooperative stop signal shared by all workers of one detection run.
 *
 * Cancelled either explicitly by the caller or implicitly once the deadline
 * has passed. Detectors poll it between sub-methods. A token linked to a
 * parent also stops when the parent does, without ever modifying it.
 */
class CancellationToken {
public:
	using Clock = std::chrono::steady_clock;

	CancellationToken() = default;
	explicit CancellationToken(Clock::time_point deadline) : deadline_(deadline) {}
	/// The parent must outlive this token.
	explicit CancellationToken(const CancellationToken *parent) : parent_(parent) {}

	CancellationToken(const CancellationToken &) = delete;
	CancellationToken &operator=(const CancellationToken &) = delete;

	void cancel() {
		cancelled_.store(true, std::memory_order_release);
	}

	void setDeadline(Clock::time_point deadline) {
		deadline_ = deadline;
	}

	const std::optional<Clock::time_point> &deadline() const {
		return deadline_;
	}

	bool isCancelled() const {
		return cancelled_.load(std::memory_order_acquire) || (parent_ && parent_->isCancelled());
	}

	bool isExpired() const {
		return (deadline_ && Clock::now() >= *deadline_) || (parent_ && parent_->isExpired());
	}

	bool shouldStop() const {
		return isCancelled() || isExpired();
	}

	/// @throws TimeoutError When the run was cancelled or its deadline passed.
	void throwIfStopped(const std::string &where) const {
		if (isCancelled()) {
			throw TimeoutError("Cancelled before " + where + ".");
		}
		if (isExpired()) {
			throw TimeoutError("Time budget exhausted before " + where + ".");
		}
	}

private:
	std::atomic<bool> cancelled_{false};
	std::optional<Clock::time_point> deadline_;
	const CancellationToken *parent_ = nullptr;
};

} // namespace datasentry::core
