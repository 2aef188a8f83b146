/*
 * server.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "logger.hpp"
#include "server_settings.hpp"
#include "ToolchainRunner.hpp"
#include "ExecutionService.hpp"
#include "RequestHandler.hpp"

#include <iostream>
#include <fstream>
#include <cstdlib>
#include <csignal>
#include <thread>
#include <atomic>

#include <cmdline.h>
#include <httplib.h>

#include <boost/filesystem.hpp>
#include <kerbal/utility/costream.hpp>

#include <pthread.h>

std::ofstream log_fp;

namespace
{
	constexpr const char SCOPE[] = "server";
	std::atomic<bool> stop_requested(false);
}

/**
 * @brief 加载配置。顺序为: 默认值, --conf 指定的 JSON 文件, 环境变量, --log 参数
 * @throw SettingsException 配置不合法
 */
void load_config(const std::string & config_file, const std::string & log_file)
{
	extern Settings __settings;

	if (!config_file.empty()) {
		__settings.parse(config_file);
	}
	__settings.apply_environment([](const char * name) -> const char * {
		return std::getenv(name);
	});
	if (!log_file.empty()) {
		__settings.runtime.log_file_path = log_file;
	}

	const boost::filesystem::path & log_file_path = settings.get().runtime.log_file_path;
	boost::system::error_code ec;
	if (log_file_path.has_parent_path()) {
		boost::filesystem::create_directories(log_file_path.parent_path(), ec);
	}
	log_fp.open(log_file_path.string(), std::ios::app);
	if (!log_fp) {
		throw SettingsException("log file [" + log_file_path.string() + "] open failed");
	}
}

/**
 * @brief 启动时检查模板工作区与工具链。缺失时仅给出警告, 对应语言的请求会以系统错误结束
 */
void check_toolchains(const ToolchainRunner & runner)
{
	for (const LanguageTemplate & language_template : settings.get().languages) {
		const Language lang = language_template.language;
		LOG_INFO(lang, 0, log_fp, "Template: ", language_template);

		boost::system::error_code ec;
		if (!boost::filesystem::is_directory(language_template.root, ec)) {
			LOG_WARNING(lang, 0, log_fp, "Template root does not exist: ", language_template.root);
		}
		for (const ExecuteArgs * command : { &language_template.build_command, &language_template.run_command }) {
			if (command->empty()) {
				continue;
			}
			if (search_executable((*command)[0], runner.environment()).empty()) {
				LOG_WARNING(lang, 0, log_fp, "Toolchain program not found on PATH: ", (*command)[0]);
			}
		}
	}
}

/**
 * @brief 信号处理线程。收到 SIGTERM 或 SIGINT 后停止监听, 已在处理中的请求会正常完成
 */
void signal_waiting_loop(httplib::Server & server, sigset_t signal_set) noexcept
{
	int signum = 0;
	if (sigwait(&signal_set, &signum) != 0) {
		LOG_FATAL(SCOPE, 0, log_fp, "sigwait failed.");
		return;
	}
	if (!stop_requested) {
		LOG_WARNING(SCOPE, 0, log_fp, "Server has received signal ", signum, " and will exit soon after the requests are all finished!");
	}
	server.stop();
}

int main(int argc, char * argv[]) try
{
	cmdline::parser parser;
	parser.add<std::string>("conf", 'c', "Specify configure description file path.", false, "");
	parser.add<std::string>("log", 'l', "Specify log file path.", false, "");
	parser.add("version", 'v', "Display the version information.");

	parser.parse_check(argc, argv);

	if (parser.exist("version")) {
		std::cout << "Compiled at: " __DATE__ " " __TIME__ << std::endl;
		return 0;
	}

	using namespace kerbal::utility::costream;
	const auto & ccerr = costream<std::cerr>(LIGHT_RED);

	try {
		load_config(parser.get<std::string>("conf"), parser.get<std::string>("log"));
	} catch (const std::exception & e) {
		ccerr << "Configuration load failed: " << e.what() << std::endl;
		return 1;
	}
	LOG_INFO(SCOPE, 0, log_fp, "Configuration load finished! ", settings.get());

	// 在创建任何线程之前屏蔽, 使这两个信号只由信号处理线程接收
	sigset_t signal_set;
	sigemptyset(&signal_set);
	sigaddset(&signal_set, SIGTERM);
	sigaddset(&signal_set, SIGINT);
	pthread_sigmask(SIG_BLOCK, &signal_set, nullptr);
	signal(SIGPIPE, SIG_IGN);

	const ToolchainRunner runner(settings.get().runner.capture_dir, settings.get().runner.max_output_size, settings.get().environment);
	check_toolchains(runner);

	ExecutionService service(settings.get().languages, runner);
	RequestHandler handler(service, settings.get().server.max_code_size);

	httplib::Server server;
	const int worker_threads = settings.get().server.worker_threads;
	server.new_task_queue = [worker_threads] {
		return new httplib::ThreadPool(static_cast<size_t>(worker_threads));
	};
	server.set_payload_max_length(settings.get().server.max_request_size);
	handler.mount(server);

	std::thread signal_thread(signal_waiting_loop, std::ref(server), signal_set);

	LOG_INFO(SCOPE, 0, log_fp, "Server listening on ", settings.get().server.host, ":", settings.get().server.port);
	bool listened = server.listen(settings.get().server.host, settings.get().server.port);

	// 监听失败时信号处理线程仍在等待, 向自身发送 SIGTERM 使其退出
	stop_requested = true;
	kill(getpid(), SIGTERM);
	signal_thread.join();

	if (!listened) {
		LOG_FATAL(SCOPE, 0, log_fp, "Server listen on ", settings.get().server.host, ":", settings.get().server.port, " failed.");
	}
	LOG_INFO(SCOPE, 0, log_fp, "Server exit.");
	return listened ? 0 : 1;

} catch (const std::exception & e) {
	EXCEPT_FATAL(SCOPE, 0, log_fp, "An uncaught exception caught by main.", e);
	throw;
}
