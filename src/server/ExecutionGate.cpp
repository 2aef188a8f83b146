/*
 * ExecutionGate.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "ExecutionGate.hpp"

ExecutionGate::holder_t ExecutionGate::acquire()
{
	std::unique_lock<std::mutex> lck(mtx);
	const ticket_type my_ticket = next_ticket++;
	cv.wait(lck, [this, my_ticket] {
		return now_serving == my_ticket;
	});
	return holder_t(this);
}

void ExecutionGate::release() noexcept
{
	{
		std::lock_guard<std::mutex> lck(mtx);
		++now_serving;
	}
	// 等待者各自检查是否轮到自己
	cv.notify_all();
}

std::size_t ExecutionGate::queue_length() const
{
	std::lock_guard<std::mutex> lck(mtx);
	return static_cast<std::size_t>(next_ticket - now_serving);
}
