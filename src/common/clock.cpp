//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// clock.cpp
//
// SystemClock on top of std::chrono
//===----------------------------------------------------------------------===//

#include "common/clock.hpp"

#include <thread>

namespace pam_oauth2 {

Clock::TimePoint SystemClock::Now() {
	return std::chrono::steady_clock::now();
}

void SystemClock::SleepFor(std::chrono::seconds duration) {
	std::this_thread::sleep_for(duration);
}

int64_t SystemClock::UnixTime() {
	return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
	    .count();
}

}  // namespace pam_oauth2
