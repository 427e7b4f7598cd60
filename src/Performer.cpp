// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/Performer.hpp"

#include <condition_variable>

#if __cpp_exceptions
  #include <new>
#else
  #include <cstdlib>
#endif

#include <fcntl.h>
#include <unistd.h>

namespace com { namespace arena {

static const int READ_PIPE_IDX  = 0;
static const int WRITE_PIPE_IDX = 1;

struct Performer::Item {
	Item(const Task &task, bool signalComplete) : m_task(task), m_complete(false)
	{
		if(signalComplete)
		{
			m_mutex = std::make_shared<std::mutex>();
			m_cond = std::make_shared<std::condition_variable>();
		}
	}

	void fire(bool runTask)
	{
		if(runTask and m_task)
			m_task();
		if(m_cond)
		{
			std::unique_lock<std::mutex> locked(*m_mutex);
			m_complete = true;
			m_cond->notify_all();
		}
	}

	Task m_task;
	bool                                     m_complete;
	std::shared_ptr<std::mutex>              m_mutex;
	std::shared_ptr<std::condition_variable> m_cond;
};

Performer::Performer(RunLoop *runLoop) :
	m_runLoop(runLoop),
	m_signaled(false),
	m_closed(false)
{
	if(pipe(m_pipe))
#if __cpp_exceptions
		throw std::bad_alloc();
#else
		abort();
#endif

	fcntl(m_pipe[READ_PIPE_IDX], F_SETFL, fcntl(m_pipe[READ_PIPE_IDX], F_GETFL) | O_NONBLOCK);

	m_runLoop->registerDescriptor(m_pipe[READ_PIPE_IDX], RunLoop::READABLE, [this] { this->onSignaled(); });
}

Performer::~Performer()
{
	close();
}

void Performer::close()
{
	if(not m_closed)
	{
		m_closed = true;

		if(m_runLoop)
			m_runLoop->unregisterDescriptor(m_pipe[READ_PIPE_IDX]);
		m_runLoop = nullptr;
		::close(m_pipe[READ_PIPE_IDX]);
		::close(m_pipe[WRITE_PIPE_IDX]);

		fireItems(); // releases any waiters without running their tasks
	}
}

bool Performer::perform(const Task &task, bool wait)
{
	if(m_closed)
		return false;

	if(wait and m_runLoop->isRunningInThisThread())
	{
		fireItems();
		if(task)
			task();
		return true;
	}

	std::shared_ptr<Item> item = std::make_shared<Item>(task, wait);
	{
		std::unique_lock<std::mutex> locked(m_mutex);
		m_items.push(item);
	}

	if(not m_signaled.exchange(true))
	{
		uint8_t buf[1] = { 0 };
		if(::write(m_pipe[WRITE_PIPE_IDX], buf, sizeof(buf)) < 0)
			m_signaled = false;
	}

	if(wait)
	{
		std::unique_lock<std::mutex> locked(*item->m_mutex);
		while(not item->m_complete)
			item->m_cond->wait(locked);
	}

	return true;
}

bool Performer::performOrRun(const Task &task)
{
	if(m_closed)
		return false;

	if(m_runLoop->isRunningInThisThread())
	{
		if(task)
			task();
		return true;
	}

	return perform(task);
}

size_t Performer::getPendingCount()
{
	std::unique_lock<std::mutex> locked(m_mutex);
	return m_items.size();
}

void Performer::onSignaled()
{
	m_signaled = false;
	uint8_t buf[16];
	while(::read(m_pipe[READ_PIPE_IDX], buf, sizeof(buf)) > 0)
		;
	fireItems();
}

void Performer::fireItems()
{
	while(true)
	{
		std::shared_ptr<Item> each;

		{
			std::unique_lock<std::mutex> locked(m_mutex);
			if(m_items.empty())
				break;
			each = m_items.front();
			m_items.pop();
		}

		each->fire(not m_closed);
	}
}

} } // namespace com::arena
