/*
 * ExecutionGateTest.cpp
 *
 *  Created on: 2026年10月19日
 */

#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <vector>
#include <fstream>
#include <stdexcept>

#include <boost/test/minimal.hpp>

#include "ExecutionGate.hpp"
#include "logger.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	void wait_for_queue_length(const ExecutionGate & gate, std::size_t length)
	{
		while (gate.queue_length() < length) {
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}
	}
}

void test_fifo_order()
{
	ExecutionGate gate;
	std::mutex order_mtx;
	std::vector<int> order;
	std::vector<std::thread> waiters;

	ExecutionGate::holder_t holder = gate.acquire();
	BOOST_CHECK(gate.held());

	for (int i = 0; i < 6; ++i) {
		waiters.emplace_back([&gate, &order_mtx, &order, i] {
			ExecutionGate::holder_t h = gate.acquire();
			std::lock_guard<std::mutex> lck(order_mtx);
			order.push_back(i);
		});
		// 保证第 i 个等待者先于第 i + 1 个到达
		wait_for_queue_length(gate, static_cast<std::size_t>(i) + 2);
	}

	holder.release();
	BOOST_CHECK(!holder.holding());
	for (std::thread & t : waiters) {
		t.join();
	}

	BOOST_REQUIRE(order.size() == 6);
	for (int i = 0; i < 6; ++i) {
		BOOST_CHECK(order[i] == i);
	}
	BOOST_CHECK(!gate.held());
}

void test_mutual_exclusion()
{
	ExecutionGate gate;
	std::atomic<int> in_flight(0);
	std::atomic<int> max_in_flight(0);
	std::vector<std::thread> workers;

	for (int i = 0; i < 8; ++i) {
		workers.emplace_back([&] {
			for (int round = 0; round < 5; ++round) {
				ExecutionGate::holder_t h = gate.acquire();
				int now = ++in_flight;
				int prev = max_in_flight.load();
				while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {
				}
				std::this_thread::sleep_for(std::chrono::milliseconds(2));
				--in_flight;
			}
		});
	}
	for (std::thread & t : workers) {
		t.join();
	}

	BOOST_CHECK(max_in_flight == 1);
	BOOST_CHECK(gate.queue_length() == 0);
}

void test_release_on_exception()
{
	ExecutionGate gate;
	try {
		ExecutionGate::holder_t h = gate.acquire();
		throw std::runtime_error("toolchain exploded");
	} catch (const std::runtime_error & e) {
		BOOST_CHECK(!gate.held());
	}

	// 闸门没有被卡住
	ExecutionGate::holder_t h = gate.acquire();
	BOOST_CHECK(h.holding());
	BOOST_CHECK(gate.queue_length() == 1);
}

void test_moved_holder_releases_once()
{
	ExecutionGate gate;
	{
		ExecutionGate::holder_t first = gate.acquire();
		ExecutionGate::holder_t second(std::move(first));
		BOOST_CHECK(!first.holding());
		BOOST_CHECK(second.holding());
		BOOST_CHECK(gate.queue_length() == 1);
	}
	BOOST_CHECK(gate.queue_length() == 0);

	ExecutionGate::holder_t again = gate.acquire();
	BOOST_CHECK(again.holding());
}

int test_main(int argc, char *argv[])
{
	try {
		test_fifo_order();
		test_mutual_exclusion();
		test_release_on_exception();
		test_moved_holder_releases_once();
	} catch (const std::exception & e) {
		EXCEPT_FATAL("test", 0, log_fp, "ExecutionGateTest failed!", e);
		BOOST_FAIL(e.what());
	}

	return 0;
}
