/*
 * ToolchainRunner.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_TOOLCHAINRUNNER_HPP_
#define SRC_SERVER_TOOLCHAINRUNNER_HPP_

#include <map>
#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>

#include "ExecuteArgs.hpp"
#include "LanguageTemplate.hpp"
#include "ProtectedProcess.hpp"
#include "ResultClassifier.hpp"

class CaptureFailedException: public std::runtime_error
{
	public:
		CaptureFailedException(const std::string & reason) :
				std::runtime_error(reason)
		{
		}
};

/**
 * @brief 在模板工作区中执行 编译-运行 流水线。
 * 每一步都是一个独立进程组中的子进程, 标准输出与标准错误被重定向到该语言的捕获目录下的文件中。
 * 整条流水线共享一个墙上时间截止时刻, 超时后整个进程组被杀死。
 */
class ToolchainRunner
{
	private:
		boost::filesystem::path capture_dir;
		std::size_t max_output_size;
		ExecuteArgs env;

	public:
		/**
		 * @param capture_dir 捕获目录的根, 各语言使用其下以语言名命名的子目录
		 * @param max_output_size 每个流最多读回的字节数
		 * @param extra_env 追加到子进程环境中的变量, 同名时覆盖服务本身的环境变量
		 */
		ToolchainRunner(const boost::filesystem::path & capture_dir, std::size_t max_output_size,
						const std::map<std::string, std::string> & extra_env);

		/**
		 * @brief 执行流水线
		 * @warning 调用者必须持有该语言的执行闸门, 捕获目录与模板工作区都由闸门保护
		 * @throw SpawnFailedException 无法创建子进程
		 * @throw CaptureFailedException 无法创建捕获目录或读回捕获的输出
		 */
		ToolchainOutcome run(const LanguageTemplate & language_template, unsigned long request_id) const;

		const ExecuteArgs & environment() const noexcept
		{
			return env;
		}

		/**
		 * @brief 以本进程的环境为基础, 加上 overrides 中的变量
		 */
		static ExecuteArgs make_environment(const std::map<std::string, std::string> & overrides);
};

/**
 * @brief 在 cut 处截断 data 时实际应采用的长度。若 cut 落在一个 UTF-8 多字节字符中间, 则退到该字符之前
 * @param data 至少含有 cut + 1 个字节
 */
std::size_t utf8_cut_position(const char * data, std::size_t cut) noexcept;

/**
 * @brief 读回捕获文件, 超过 max_size 字节的部分被截断并加上标记。截断点不会落在 UTF-8 多字节字符中间
 * @throw CaptureFailedException 文件无法打开或读取
 */
std::string read_captured_stream(const boost::filesystem::path & file_path, std::size_t max_size);

#endif /* SRC_SERVER_TOOLCHAINRUNNER_HPP_ */
