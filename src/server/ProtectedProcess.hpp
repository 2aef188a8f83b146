/*
 * ProtectedProcess.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_PROTECTEDPROCESS_HPP_
#define SRC_SERVER_PROTECTEDPROCESS_HPP_

#include <chrono>
#include <stdexcept>
#include <string>
#include <tuple>

#include <boost/filesystem.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "ExecuteArgs.hpp"

class ProtectedProcessConfig
{
	public:

		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		boost::filesystem::path working_dir; ///< 子进程的工作目录
		boost::filesystem::path input_path;
		boost::filesystem::path output_path;
		boost::filesystem::path error_path;

		using raw_deadline_type = std::chrono::steady_clock::time_point;
		using deadline_type = optional<raw_deadline_type>;
		deadline_type deadline; ///< 墙上时间截止时刻, 到达后杀死整个进程组

		ProtectedProcessConfig(const boost::filesystem::path & working_dir,
							   const boost::filesystem::path & output_path,
							   const boost::filesystem::path & error_path) :
				working_dir(working_dir), input_path("/dev/null"), output_path(output_path), error_path(error_path)
		{
		}

		ProtectedProcessConfig& set_deadline(const raw_deadline_type & deadline)
		{
			this->deadline = deadline;
			return *this;
		}
};

enum class ProtectedProcessResult
{
	EXITED = 0, ///< 正常退出, 退出码见 exit_code
	SIGNALED = 1, ///< 被信号杀死
	REAL_TIME_LIMIT_EXCEEDED = 2, ///< 墙上时间超时, 已被强制终止
};

std::ostream& operator<<(std::ostream& out, ProtectedProcessResult result);

class ProtectedProcessDetails:
		public std::tuple<
		ProtectedProcessResult,
		std::chrono::milliseconds,
		int,
		int>
{
	private:
		using supper_t = std::tuple<
				ProtectedProcessResult,
				std::chrono::milliseconds,
				int,
				int>;
	public:
		using supper_t::supper_t;

		const ProtectedProcessResult& running_result() const
		{
			return std::get<0>(*this);
		}

		const std::chrono::milliseconds& real_time() const
		{
			return std::get<1>(*this);
		}

		/// 退出码。被信号杀死时按 shell 的惯例为 128 + 信号编号
		const int& exit_code() const
		{
			return std::get<2>(*this);
		}

		const int& signal() const
		{
			return std::get<3>(*this);
		}

		bool success() const
		{
			return running_result() == ProtectedProcessResult::EXITED && exit_code() == 0;
		}

		friend std::ostream& operator<<(std::ostream& out, const ProtectedProcessDetails & src);
};

/**
 * @brief 创建子进程执行 args, 等待其结束或超时。
 * 子进程的标准输入输出被重定向到 config 指定的文件, 工作目录为 config.working_dir。
 * 超时时整个进程组被 SIGKILL 杀死; 正常结束时残留在进程组中的后代进程同样被杀死。
 * @param args 命令行参数, args[0] 不含 '/' 时在 env 的 PATH 中查找
 * @param env 子进程的环境表
 * @throw SpawnFailedException 找不到可执行文件, fork 失败, 子进程初始化失败或 wait 失败
 */
ProtectedProcessDetails
protected_process(const ExecuteArgs & args, const ProtectedProcessConfig & config, const ExecuteArgs & env);

/**
 * @brief 在环境表的 PATH 中查找可执行文件
 * @return 找到时返回其路径, 否则返回空路径
 */
boost::filesystem::path search_executable(const std::string & name, const ExecuteArgs & env);

class SpawnFailedException: public std::runtime_error
{
	public:
		SpawnFailedException(const std::string & reason) :
				std::runtime_error(reason)
		{
		}
};

class ThreadFailedException: public SpawnFailedException
{
	public:
		ThreadFailedException() :
				SpawnFailedException("timeout killer thread failed")
		{
		}
};

#endif /* SRC_SERVER_PROTECTEDPROCESS_HPP_ */
