/*
 * process.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SHARED_SRC_PROCESS_HPP_
#define SRC_SHARED_SRC_PROCESS_HPP_

#include <utility>
#include <stdexcept>
#include <cerrno>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief fork 的 RAII 封装。子进程执行 func 之后以 _exit 退出。
 * 子进程在创建时即成为一个新进程组的组长, 因此可以通过 kill_group 连同其所有后代一起终止。
 * 若 process 对象析构时子进程仍未被回收, 则杀死整个进程组并回收。
 * @warning 父进程是多线程程序, func 中只能调用异步信号安全的函数
 */
class process : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef pid_t pid_type;

	protected:
		pid_type father_id;
		pid_type child_id;

		enum
		{
			none, joined
		} status;

	public:
		template <typename Callable, typename ... Args>
		explicit process(Callable && func, Args && ... args) :
				father_id(getpid()), child_id(-1), status(joined)
		{
			child_id = fork();
			if (child_id == -1) {
				status = none;
				throw std::runtime_error("fork failed");
			} else if (child_id == 0) {
				setpgid(0, 0);
				func(std::forward<Args>(args)...);
				_exit(0);
			}
			// 父子进程都设置一次进程组, 避免父进程在子进程 setpgid 之前就试图杀死进程组
			setpgid(child_id, child_id);
		}

		~process() noexcept
		{
			if (getpid() == father_id) {
				switch (status) {
					case none:
						break;
					case joined:
						this->kill_group(SIGKILL);
						::waitpid(child_id, nullptr, 0);
						break;
				}
			}
		}

		process(process && src) noexcept :
				father_id(src.father_id), child_id(src.child_id), status(src.status)
		{
			src.father_id = 0;
			src.child_id = 0;
			src.status = none;
		}

		/**
		 * @brief 等待子进程结束, 但不回收它。子进程保持僵尸状态, 其 pid 与进程组号不会被系统复用
		 * @return 成功返回 0, 出错返回 -1
		 */
		int wait_exit_without_reaping() noexcept
		{
			if (status != joined) {
				return -1;
			}
			siginfo_t info;
			int res;
			do {
				res = ::waitid(P_PID, static_cast<id_t>(child_id), &info, WEXITED | WNOWAIT);
			} while (res == -1 && errno == EINTR);
			return res;
		}

		/**
		 * @brief Wait for the process to exit and reap it.
		 * @param status_loc The location where the process status will be put.
		 * @return For errors return (pid_type) (-1); otherwise return the process ID.
		 */
		pid_type join(int * status_loc) noexcept
		{
			if (status != joined) {
				return 0;
			}
			pid_type res;
			do {
				res = ::waitpid(this->child_id, status_loc, 0);
			} while (res == -1 && errno == EINTR);
			if (res == -1) {
				return res;
			}
			this->status = none;
			return res;
		}

		/**
		 * @brief Send signal SIG to every process in the child's process group.
		 * @return If success return 0, For errors, return other value.
		 */
		int kill_group(int sig) noexcept
		{
			if (status == none) {
				return 0;
			}
			return ::kill(-child_id, sig);
		}

};

#endif /* SRC_SHARED_SRC_PROCESS_HPP_ */
