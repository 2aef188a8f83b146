/*
 * Result.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_RESULT_HPP_
#define SRC_SERVER_RESULT_HPP_

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "united_resource.hpp"

/**
 * @brief 一次提交, 仅在一次请求的处理过程中存在
 */
struct Submission
{
		Language language;
		std::string code;
};

/**
 * @brief 一次执行的结构化结果。success 为真时 error 为空; 为假时 error 为非空的诊断信息, output 为空
 */
struct ExecutionResult
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		bool success;
		std::string output;
		optional<std::string> error;

		/** 失败原因, 仅用于日志, 不出现在 JSON 中 */
		FailureKind kind;

		ExecutionResult() :
				success(false), kind(FailureKind::INFRASTRUCTURE)
		{
		}

		static ExecutionResult succeeded(const std::string & output);

		static ExecutionResult failed(FailureKind kind, const std::string & error);

		nlohmann::json to_json() const;

		friend std::ostream& operator<<(std::ostream& out, const ExecutionResult & src);
};

#endif /* SRC_SERVER_RESULT_HPP_ */
