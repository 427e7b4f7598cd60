#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cmath>
#include <vector>

#include "Object.hpp"

namespace com { namespace arena {

class TimerWheel;

using Time = long double; // A point in time, as seconds since an epoch.
using Duration = long double; // A period of time in seconds.

// A Timer is its own cancellation token. Cancelled or rescheduled timers are
// dropped from the wheel lazily, the next time their slot is scanned.
class Timer : public Object {
public:
	const Duration MIN_RECUR_INTERVAL = 0.000001;

	Timer(Time when, Duration recurInterval, bool catchup);
	Timer() = delete;

	using Action = std::function<void(const std::shared_ptr<Timer> &sender, Time now)>;
	Action action;

	bool isDue(Time now) const;
	Time getNextFireTime() const;
	void setNextFireTime(Time when);

	Duration getRecurInterval() const;
	void     setRecurInterval(Duration interval);
	bool     doesRecur() const;

	void cancel();
	bool isCanceled() const;

	static Action makeAction(const std::function<void(Time now)> &fn);
	static Action makeAction(const Task &fn);

protected:
	friend class TimerWheel;

	void basicFire(const std::shared_ptr<Timer> &myself, Time now);

	Time        m_when;
	Duration    m_recurInterval;
	TimerWheel *m_wheel;
	uint64_t    m_generation;
	bool        m_canceled    :1;
	bool        m_rescheduled :1;
	bool        m_catchup     :1;
	bool        m_firing      :1;
};

// Hashed timer wheel. Slot i holds the timers whose deadline falls in a tick
// congruent to i modulo the slot count; timers more than one revolution out
// share a slot with nearer ones and are skipped until their own round.
class TimerWheel : public Object {
public:
	static const size_t DEFAULT_SLOTS = 512;

	TimerWheel(Duration granularity = 0.010, size_t numSlots = DEFAULT_SLOTS);
	~TimerWheel();

	std::shared_ptr<Timer> schedule(Time when, Duration recurInterval = 0, bool catchup = true);
	std::shared_ptr<Timer> schedule(const Timer::Action &action, Time when, Duration recurInterval = 0, bool catchup = true);

	Duration howLongToNextFire(Time now, Duration maxInterval = 5) const;

	size_t fireDueTimers(Time now); // answer number of timers fired

	void addTimer(const std::shared_ptr<Timer> &timer);

	void clear();

	size_t getPendingEntryCount() const; // includes stale entries not yet swept
	Duration getGranularity() const;

	Task onHowLongToSleepDidChange;

protected:
	struct Entry {
		std::shared_ptr<Timer> m_timer;
		uint64_t m_generation;
		uint64_t m_order;
	};

	int64_t tickOf(Time t) const;
	bool    isLive(const Entry &entry) const;
	size_t  collectDue(size_t slot, Time now, std::vector<Entry> &due);
	Time    earliestLive() const;

	Duration                          m_granularity;
	std::vector<std::vector<Entry> >  m_slots;
	int64_t                           m_cursor;
	bool                              m_cursorValid;
	bool                              m_running;
	size_t                            m_entryCount;
	uint64_t                          m_nextOrder;
	Time                              m_nextFireHint;
};

} } // namespace com::arena
