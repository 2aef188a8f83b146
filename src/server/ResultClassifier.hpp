/*
 * ResultClassifier.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_RESULTCLASSIFIER_HPP_
#define SRC_SERVER_RESULTCLASSIFIER_HPP_

#include <chrono>
#include <string>

#include <kerbal/data_struct/optional/optional.hpp>

#include "Result.hpp"
#include "LanguageTemplate.hpp"

/**
 * @brief 工具链流水线的原始结果
 */
struct ToolchainOutcome
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		optional<int> build_exit; ///< 编译步骤的退出码, 未执行时为空
		optional<int> run_exit; ///< 运行步骤的退出码, 未执行时为空
		int signal; ///< 最后执行的步骤被信号杀死时的信号编号, 否则为 0
		std::string stderr_text; ///< 最后执行的步骤的标准错误流
		std::string stdout_text; ///< 最后执行的步骤的标准输出流
		bool timed_out;

		ToolchainOutcome() :
				signal(0), timed_out(false)
		{
		}
};

extern const char INFRASTRUCTURE_ERROR_MESSAGE[];

std::string timeout_message(std::chrono::milliseconds timeout);

/**
 * @brief 信号的名称, 如 SIGSEGV。查表得到, 可在多个线程中同时调用
 */
const char * signal_name(int signal) noexcept;

/**
 * @brief 将流水线的结果映射为 ExecutionResult。不做任何 I/O。
 * 优先级: 超时 > 编译失败 > 运行失败 > 成功。
 * 诊断信息原样传递, 保留其中的行列号
 */
ExecutionResult classify_outcome(const ToolchainOutcome & outcome, const LanguageTemplate & language_template);

#endif /* SRC_SERVER_RESULTCLASSIFIER_HPP_ */
