//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// clock.hpp
//
// Time source and sleep capability for the polling loop
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstdint>

namespace pam_oauth2 {

class Clock {
public:
	using TimePoint = std::chrono::steady_clock::time_point;

	virtual ~Clock() = default;

	// Monotonic time for deadlines
	virtual TimePoint Now() = 0;

	virtual void SleepFor(std::chrono::seconds duration) = 0;

	// Wall-clock seconds since the epoch, for token expiry checks
	virtual int64_t UnixTime() = 0;
};

class SystemClock : public Clock {
public:
	TimePoint Now() override;
	void SleepFor(std::chrono::seconds duration) override;
	int64_t UnixTime() override;
};

}  // namespace pam_oauth2
