/*
 * ExecutionGate.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_EXECUTIONGATE_HPP_
#define SRC_SERVER_EXECUTIONGATE_HPP_

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief 一种语言的执行闸门。同一时刻至多一个持有者, 按到达顺序 (先来先得) 授予。
 * 持有者通过 acquire 返回的 holder_t 对象持有闸门, holder_t 析构时无条件释放,
 * 因此任何退出路径 (包括异常) 都会释放闸门。
 * 若持有者所在线程在释放前崩溃, 该语言的闸门将永远无法再被获得, 需要重启进程。
 */
class ExecutionGate final : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef unsigned long ticket_type;

	private:
		mutable std::mutex mtx;
		std::condition_variable cv;
		ticket_type next_ticket; ///< 下一个到达者领到的号
		ticket_type now_serving; ///< 当前持有闸门的号

		void release() noexcept;

	public:
		class holder_t : kerbal::utility::noncopyable, kerbal::utility::nonassignable
		{
			private:
				friend class ExecutionGate;

				ExecutionGate * gate;

				explicit holder_t(ExecutionGate * gate) noexcept : gate(gate)
				{
				}

			public:
				holder_t(holder_t && src) noexcept : gate(src.gate)
				{
					src.gate = nullptr;
				}

				~holder_t() noexcept
				{
					this->release();
				}

				/**
				 * @brief 提前释放闸门, 之后析构不再释放
				 */
				void release() noexcept
				{
					if (this->gate != nullptr) {
						this->gate->release();
						this->gate = nullptr;
					}
				}

				bool holding() const noexcept
				{
					return this->gate != nullptr;
				}
		};

		ExecutionGate() noexcept :
				next_ticket(0), now_serving(0)
		{
		}

		/**
		 * @brief 阻塞直到轮到本次调用, 然后成为唯一持有者
		 */
		holder_t acquire();

		/**
		 * @brief 持有者与等待者的总数
		 */
		std::size_t queue_length() const;

		bool held() const
		{
			return this->queue_length() != 0;
		}
};

#endif /* SRC_SERVER_EXECUTIONGATE_HPP_ */
