/*
 * LanguageTemplate.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_LANGUAGETEMPLATE_HPP_
#define SRC_SERVER_LANGUAGETEMPLATE_HPP_

#include <chrono>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/regex.hpp>

#include "united_resource.hpp"
#include "ExecuteArgs.hpp"

/**
 * @brief 一种语言的模板工作区配置。进程启动时确定, 之后不再改变。
 * build_command 为空时 run_command 为编译并运行的组合命令, 此时用 compile_error_patterns
 * 区分编译错误与运行时错误
 */
class LanguageTemplate
{
	public:
		Language language;

		/** 模板工作区根目录, 子进程的工作目录 */
		boost::filesystem::path root;

		/** 入口源文件, 相对于 root */
		boost::filesystem::path entry_file;

		ExecuteArgs build_command;
		ExecuteArgs run_command;

		/** 整条流水线的墙上时间限制, 从第一个子进程创建时开始计算 */
		std::chrono::milliseconds timeout;

		std::vector<std::string> compile_error_patterns;

		/** timeout 的上限, 保证 now() + timeout 不会溢出 */
		static constexpr std::chrono::milliseconds max_timeout = std::chrono::hours(24);

	private:
		std::vector<boost::regex> compiled_patterns;

	public:
		LanguageTemplate(Language language,
						 const boost::filesystem::path & root,
						 const boost::filesystem::path & entry_file,
						 const ExecuteArgs & build_command,
						 const ExecuteArgs & run_command,
						 std::chrono::milliseconds timeout,
						 const std::vector<std::string> & compile_error_patterns);

		/**
		 * @brief 各语言的默认配置
		 */
		static LanguageTemplate default_template(Language language);

		boost::filesystem::path entry_file_path() const
		{
			return root / entry_file;
		}

		bool has_build_step() const noexcept
		{
			return !build_command.empty();
		}

		/**
		 * @brief 诊断信息是否像一个编译错误
		 */
		bool looks_like_compile_error(const std::string & diagnostic) const;

		/**
		 * @brief 检查配置是否合法并预编译正则表达式
		 * @throw std::invalid_argument 配置不合法
		 */
		void validate();
};

std::ostream& operator<<(std::ostream& out, const LanguageTemplate & src);

#endif /* SRC_SERVER_LANGUAGETEMPLATE_HPP_ */
