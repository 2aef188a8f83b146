/*
 * ProtectedProcess.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "ProtectedProcess.hpp"

#include "process.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

std::ostream& operator<<(std::ostream& out, ProtectedProcessResult result)
{
	switch (result) {
		case ProtectedProcessResult::EXITED:
			return out << "EXITED";
		case ProtectedProcessResult::SIGNALED:
			return out << "SIGNALED";
		case ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED:
			return out << "REAL_TIME_LIMIT_EXCEEDED";
	}
	return out;
}

std::ostream& operator<<(std::ostream& out, const ProtectedProcessDetails & src)
{
	return out << "result: " << src.running_result()
				<< " real_time: " << src.real_time().count() << " ms"
				<< " exit_code: " << src.exit_code()
				<< " signal: " << src.signal();
}

boost::filesystem::path search_executable(const std::string & name, const ExecuteArgs & env)
{
	if (name.find('/') != std::string::npos) {
		return name;
	}

	static const std::string PATH_EQUAL = "PATH=";
	std::string search_path = "/usr/local/bin:/usr/bin:/bin";
	for (const std::string & entry : env.list()) {
		if (entry.compare(0, PATH_EQUAL.size(), PATH_EQUAL) == 0) {
			search_path = entry.substr(PATH_EQUAL.size());
			break;
		}
	}

	std::vector<std::string> dirs;
	boost::algorithm::split(dirs, search_path, boost::algorithm::is_any_of(":"));
	for (const std::string & dir : dirs) {
		boost::filesystem::path candidate = boost::filesystem::path(dir.empty() ? "." : dir) / name;
		boost::system::error_code ec;
		if (boost::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
			return candidate;
		}
	}
	return boost::filesystem::path();
}

namespace
{
	/**
	 * @brief 子进程中所需的全部 C 字符串, 在 fork 之前准备好。
	 * fork 之后的子进程只能调用异步信号安全的函数, 不能再分配内存
	 */
	struct child_context
	{
			std::string exe_path;
			std::unique_ptr<char*[]> argv;
			std::unique_ptr<char*[]> envp;
			const char * working_dir;
			const char * input_path;
			const char * output_path;
			const char * error_path;
			int max_fd;
	};

	int redirect(const char * path, int flags, int target_fd) noexcept
	{
		int fd = ::open(path, flags, 0644);
		if (fd == -1) {
			return -1;
		}
		if (::dup2(fd, target_fd) == -1) {
			return -1;
		}
		::close(fd);
		return 0;
	}

	/*
	 * 子进程中先复位信号状态, 关闭继承来的描述符, 切换工作目录并重定向标准流, 然后用 execve 替换自身。
	 * 任何一步失败, 都产生 SIGUSR1 信号, 由父进程判定为系统错误。
	 */
	void child_main(const child_context & ctx) noexcept
	{
		sigset_t empty_set;
		sigemptyset(&empty_set);
		sigprocmask(SIG_SETMASK, &empty_set, nullptr);
		for (int sig : { SIGPIPE, SIGINT, SIGTERM, SIGUSR1 }) {
			signal(sig, SIG_DFL);
		}

		if (::chdir(ctx.working_dir) != 0) {
			raise(SIGUSR1);
			return;
		}
		if (redirect(ctx.input_path, O_RDONLY, STDIN_FILENO) != 0 ||
			redirect(ctx.output_path, O_WRONLY | O_CREAT | O_TRUNC, STDOUT_FILENO) != 0 ||
			redirect(ctx.error_path, O_WRONLY | O_CREAT | O_TRUNC, STDERR_FILENO) != 0) {
			raise(SIGUSR1);
			return;
		}
		for (int fd = STDERR_FILENO + 1; fd < ctx.max_fd; ++fd) {
			::close(fd);
		}

		execve(ctx.exe_path.c_str(), ctx.argv.get(), ctx.envp.get());
		raise(SIGUSR1);
	}

	int max_inherited_fd() noexcept
	{
		struct rlimit nofile;
		if (getrlimit(RLIMIT_NOFILE, &nofile) != 0 || nofile.rlim_cur == RLIM_INFINITY || nofile.rlim_cur > 65536) {
			return 65536;
		}
		return static_cast<int>(nofile.rlim_cur);
	}

	process spawn_child(const child_context & ctx)
	{
		try {
			return process(child_main, std::cref(ctx));
		} catch (const std::runtime_error & e) {
			throw SpawnFailedException(e.what());
		}
	}

} /* namespace */

ProtectedProcessDetails
protected_process(const ExecuteArgs & execute_args, const ProtectedProcessConfig & config, const ExecuteArgs & env)
{
	using namespace std::chrono;

	if (execute_args.empty()) {
		throw SpawnFailedException("empty command");
	}

	child_context ctx;
	boost::filesystem::path exe_path = search_executable(execute_args[0], env);
	if (exe_path.empty()) {
		throw SpawnFailedException("executable not found on PATH: " + execute_args[0]);
	}
	ctx.exe_path = exe_path.string();
	ctx.argv = execute_args.getArgs();
	ctx.envp = env.getArgs();
	ctx.working_dir = config.working_dir.c_str();
	ctx.input_path = config.input_path.c_str();
	ctx.output_path = config.output_path.c_str();
	ctx.error_path = config.error_path.c_str();
	ctx.max_fd = max_inherited_fd();

	process child_process = spawn_child(ctx);

	// record current time
	auto process_start_time_point = steady_clock::now();

	std::mutex mtx;
	std::condition_variable cv;
	bool finished = false;
	bool timed_out = false;

	std::thread timeout_killer_thread;
	if (config.deadline.has_value()) {
		try {
			timeout_killer_thread = std::thread([&child_process, &mtx, &cv, &finished, &timed_out](steady_clock::time_point deadline) {
				std::unique_lock<std::mutex> lck(mtx);
				if (!cv.wait_until(lck, deadline, [&finished] { return finished; })) {
					timed_out = true;
					child_process.kill_group(SIGKILL);
				}
			}, config.deadline.value());
		} catch (const std::system_error & e) {
			throw ThreadFailedException();
		}
	}

	// 子进程结束后先不回收, 保证计时线程发出的 kill 不会落到被复用的进程号上
	int wait_result = child_process.wait_exit_without_reaping();
	{
		std::lock_guard<std::mutex> lck(mtx);
		finished = true;
	}
	cv.notify_all();
	if (timeout_killer_thread.joinable()) {
		timeout_killer_thread.join();
	}

	milliseconds real_time = duration_cast<milliseconds>(steady_clock::now() - process_start_time_point);

	if (wait_result == -1) {
		throw SpawnFailedException("wait failed");
	}

	// 组长已退出, 进程组中可能还残留着后台进程
	child_process.kill_group(SIGKILL);

	int status = 0;
	if (child_process.join(&status) == -1) {
		throw SpawnFailedException("reap failed");
	}

	if (timed_out) {
		return ProtectedProcessDetails(ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED, real_time, 128 + SIGKILL, SIGKILL);
	}

	if (WIFSIGNALED(status)) {
		int sig = WTERMSIG(status);
		if (sig == SIGUSR1) {
			throw SpawnFailedException("child process failed to set up: " + execute_args[0]);
		}
		return ProtectedProcessDetails(ProtectedProcessResult::SIGNALED, real_time, 128 + sig, sig);
	}

	return ProtectedProcessDetails(ProtectedProcessResult::EXITED, real_time, WEXITSTATUS(status), 0);
}
