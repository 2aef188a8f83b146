/*
 * ExecutionService.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_EXECUTIONSERVICE_HPP_
#define SRC_SERVER_EXECUTIONSERVICE_HPP_

#include <array>
#include <atomic>

#include <kerbal/utility/noncopyable.hpp>

#include "united_resource.hpp"
#include "LanguageTemplate.hpp"
#include "ExecutionGate.hpp"
#include "ToolchainRunner.hpp"
#include "Result.hpp"

/**
 * @brief 执行服务。每种语言对应一个固定的槽位, 其中包含该语言的模板配置与执行闸门。
 * execute 的流程为: 获得闸门 -> 写入源文件 -> 编译运行 -> 分类结果 -> 释放闸门
 */
class ExecutionService final : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef std::array<LanguageTemplate, language_count> template_registry;

	private:
		const template_registry templates;
		std::array<ExecutionGate, language_count> gates;
		const ToolchainRunner runner;
		std::atomic<unsigned long> request_counter;

	public:
		/**
		 * @param templates 按 Language 的枚举值排列的模板配置
		 * @throw std::invalid_argument templates 的排列与 Language 不对应
		 */
		ExecutionService(const template_registry & templates, const ToolchainRunner & runner);

		/**
		 * @brief 处理一次提交
		 * @return 执行结果。所有失败都被转换为 success 为 false 的结果, 闸门在任何路径上都会被释放
		 * @exception 该函数保证不抛出任何异常
		 */
		ExecutionResult execute(const Submission & submission, unsigned long request_id) noexcept;

		/**
		 * @brief 为一次请求分配日志中使用的序号
		 */
		unsigned long next_request_id() noexcept
		{
			return ++request_counter;
		}

		const LanguageTemplate & language_template(Language lang) const
		{
			return templates[language_index(lang)];
		}

		ExecutionGate & gate(Language lang)
		{
			return gates[language_index(lang)];
		}
};

#endif /* SRC_SERVER_EXECUTIONSERVICE_HPP_ */
