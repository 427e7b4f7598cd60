// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cmath>

#include "../include/rudp/Timer.hpp"

namespace com { namespace arena {

// --- Timer

Timer::Timer(Time when, Duration recurInterval, bool catchup) :
	m_when(when),
	m_wheel(nullptr),
	m_generation(0),
	m_canceled(false),
	m_rescheduled(false),
	m_catchup(catchup),
	m_firing(false)
{
	setRecurInterval(recurInterval);
}

bool Timer::isDue(Time now) const
{
	return m_when <= now;
}

Time Timer::getNextFireTime() const
{
	return m_when;
}

void Timer::setNextFireTime(Time when)
{
	if(isCanceled())
		return;

	m_when = when;
	m_generation++;
	m_rescheduled = true;

	if(m_wheel and not m_firing)
		m_wheel->addTimer(share_ref(this));
}

Duration Timer::getRecurInterval() const
{
	return m_recurInterval;
}

void Timer::setRecurInterval(Duration interval)
{
	if((interval > 0) and (interval < MIN_RECUR_INTERVAL))
		interval = MIN_RECUR_INTERVAL;
	m_recurInterval = interval;
}

bool Timer::doesRecur() const
{
	return (m_recurInterval > 0.0) and not isCanceled();
}

void Timer::cancel()
{
	m_canceled = true;
	if(not m_firing)
		action = nullptr; // in case any circular references
	m_wheel = nullptr;
	m_generation++;
}

bool Timer::isCanceled() const
{
	return m_canceled;
}

Timer::Action Timer::makeAction(const std::function<void(Time now)> &fn)
{
	return [=] (const std::shared_ptr<Timer> &, Time now) { fn(now); };
}

Timer::Action Timer::makeAction(const Task &fn)
{
	return [=] (const std::shared_ptr<Timer> &, Time) { fn(); };
}

void Timer::basicFire(const std::shared_ptr<Timer> &myself, Time now)
{
	if(isCanceled())
		return;

	TimerWheel *wheel = m_wheel;
	m_rescheduled = false;

	m_firing = true;
	if(action)
		action(myself, now);
	m_firing = false;

	if(isCanceled())
	{
		action = nullptr;
		return;
	}

	if(m_rescheduled)
	{
		if(wheel)
			wheel->addTimer(myself);
	}
	else if(doesRecur())
	{
		if((now > m_when) and m_catchup)
			m_when += ceill((now - m_when) / m_recurInterval) * m_recurInterval;
		else
			m_when += m_recurInterval;
		m_generation++;

		if(wheel)
			wheel->addTimer(myself);
	}
	else
		cancel();
}

// --- TimerWheel

TimerWheel::TimerWheel(Duration granularity, size_t numSlots) :
	m_granularity(granularity > 0 ? granularity : 0.010),
	m_slots(numSlots ? numSlots : DEFAULT_SLOTS),
	m_cursor(0),
	m_cursorValid(false),
	m_running(false),
	m_entryCount(0),
	m_nextOrder(0),
	m_nextFireHint(INFINITY)
{ }

TimerWheel::~TimerWheel()
{
	clear();
}

std::shared_ptr<Timer> TimerWheel::schedule(Time when, Duration recurInterval, bool catchup)
{
	auto rv = share_ref<Timer>(new Timer(when, recurInterval, catchup), false);
	addTimer(rv);
	return rv;
}

std::shared_ptr<Timer> TimerWheel::schedule(const Timer::Action &action, Time when, Duration recurInterval, bool catchup)
{
	auto rv = schedule(when, recurInterval, catchup);
	rv->action = action;
	return rv;
}

int64_t TimerWheel::tickOf(Time t) const
{
	return int64_t(floorl(t / m_granularity));
}

bool TimerWheel::isLive(const Entry &entry) const
{
	const Timer *timer = entry.m_timer.get();
	return (not timer->isCanceled()) and (timer->m_wheel == this) and (timer->m_generation == entry.m_generation);
}

void TimerWheel::addTimer(const std::shared_ptr<Timer> &timer)
{
	if((not timer) or timer->isCanceled())
		return;

	timer->m_wheel = this;

	int64_t tick = tickOf(timer->getNextFireTime());
	if(m_cursorValid and (tick < m_cursor))
		tick = m_cursor; // overdue, the current tick is always rescanned

	size_t slot = size_t(((tick % int64_t(m_slots.size())) + int64_t(m_slots.size())) % int64_t(m_slots.size()));
	Entry entry = { timer, timer->m_generation, m_nextOrder++ };
	m_slots[slot].push_back(entry);
	m_entryCount++;

	if(timer->getNextFireTime() < m_nextFireHint)
	{
		m_nextFireHint = timer->getNextFireTime();
		if(onHowLongToSleepDidChange and not m_running)
			onHowLongToSleepDidChange();
	}
}

size_t TimerWheel::collectDue(size_t slot, Time now, std::vector<Entry> &due)
{
	std::vector<Entry> &entries = m_slots[slot];
	size_t found = 0;
	size_t kept = 0;

	for(size_t i = 0; i < entries.size(); i++)
	{
		Entry &each = entries[i];
		if(not isLive(each))
			continue;
		if(each.m_timer->isDue(now))
		{
			due.push_back(each);
			found++;
			continue;
		}
		if(kept != i)
			entries[kept] = each;
		kept++;
	}

	m_entryCount -= entries.size() - kept;
	entries.resize(kept);

	return found;
}

size_t TimerWheel::fireDueTimers(Time now)
{
	size_t rv = 0;
	int64_t nowTick = tickOf(now);
	int64_t numSlots = int64_t(m_slots.size());
	std::vector<Entry> due;

	m_running = true;

	if((not m_cursorValid) or (nowTick - m_cursor + 1 >= numSlots))
	{
		for(size_t slot = 0; slot < m_slots.size(); slot++)
			collectDue(slot, now, due);
	}
	else
	{
		for(int64_t tick = m_cursor; tick <= nowTick; tick++)
			collectDue(size_t(((tick % numSlots) + numSlots) % numSlots), now, due);
	}

	if((not m_cursorValid) or (nowTick > m_cursor))
		m_cursor = nowTick;
	m_cursorValid = true;

	size_t currentSlot = size_t(((m_cursor % numSlots) + numSlots) % numSlots);
	while(not due.empty())
	{
		std::sort(due.begin(), due.end(), [] (const Entry &l, const Entry &r) {
			if(l.m_timer->getNextFireTime() == r.m_timer->getNextFireTime())
				return l.m_order < r.m_order;
			return l.m_timer->getNextFireTime() < r.m_timer->getNextFireTime();
		});

		for(auto it = due.begin(); it != due.end(); it++)
		{
			// a timer fired earlier in this batch may have cancelled or moved this one
			if(not isLive(*it))
				continue;
			it->m_timer->basicFire(it->m_timer, now);
			rv++;
		}

		due.clear();
		collectDue(currentSlot, now, due); // timers scheduled at or before now by the actions
	}

	m_running = false;
	m_nextFireHint = INFINITY;

	return rv;
}

Time TimerWheel::earliestLive() const
{
	Time rv = INFINITY;
	for(auto slot = m_slots.begin(); slot != m_slots.end(); slot++)
		for(auto it = slot->begin(); it != slot->end(); it++)
			if(isLive(*it))
				rv = std::min(rv, it->m_timer->getNextFireTime());
	return rv;
}

Duration TimerWheel::howLongToNextFire(Time now, Duration maxInterval) const
{
	if(0 == m_entryCount)
		return maxInterval;

	Time earliest = INFINITY;
	int64_t numSlots = int64_t(m_slots.size());

	if(not m_cursorValid)
		earliest = earliestLive();
	else
	{
		for(int64_t tick = m_cursor; tick < m_cursor + numSlots; tick++)
		{
			const std::vector<Entry> &entries = m_slots[size_t(((tick % numSlots) + numSlots) % numSlots)];
			for(auto it = entries.begin(); it != entries.end(); it++)
				if(isLive(*it) and (tickOf(it->m_timer->getNextFireTime()) <= tick))
					earliest = std::min(earliest, it->m_timer->getNextFireTime());
			if(earliest < INFINITY)
				break;
			if((tick + 1) * m_granularity - now >= maxInterval)
				return maxInterval;
		}
	}

	if(earliest == INFINITY)
		return maxInterval;

	return std::max(Duration(0), std::min(maxInterval, earliest - now));
}

void TimerWheel::clear()
{
	// cancel everything to break potential circular references through actions
	for(auto slot = m_slots.begin(); slot != m_slots.end(); slot++)
	{
		for(auto it = slot->begin(); it != slot->end(); it++)
			if(isLive(*it))
				it->m_timer->cancel();
		slot->clear();
	}
	m_entryCount = 0;
}

size_t TimerWheel::getPendingEntryCount() const
{
	return m_entryCount;
}

Duration TimerWheel::getGranularity() const
{
	return m_granularity;
}

} } // namespace com::arena
