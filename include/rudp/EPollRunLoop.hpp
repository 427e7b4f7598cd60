#pragma once

// Copyright © 2022 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <map>
#include <thread>
#include <queue>

#include "RunLoop.hpp"

namespace com { namespace arena {

class EPollRunLoop : public RunLoop {
public:
	EPollRunLoop(Duration timerGranularity = 0.010);
	~EPollRunLoop();

	using RunLoop::registerDescriptor;
	using RunLoop::unregisterDescriptor;

	void registerDescriptor(int fd, Condition cond, const Action &action) override;
	void unregisterDescriptor(int fd, Condition cond) override;

	// Deliver signo to task on this run loop's thread instead of asynchronously.
	// The signal is blocked in the calling thread; call before starting other
	// threads so they inherit the mask. Answers false if signalfd fails.
	bool registerSignal(int signo, const Task &task);

	void run(Duration runInterval = INFINITY, Duration minSleep = 0) override;
	bool isRunningInThisThread() const override;

	void clear() override;

protected:
	struct Descriptor;
	struct DescriptorItem;

	void processActivatedItems(std::queue<std::shared_ptr<DescriptorItem>> &activatedItems, Condition cond);
	void onSignalReadable();

	int m_epoll;
	int m_signalfd;
	std::map<int, Task> m_signalTasks;
	std::map<int, std::shared_ptr<Descriptor>> m_descriptors;
	std::atomic<std::thread::id> m_runningInThread;
};

} } // namespace com::arena
