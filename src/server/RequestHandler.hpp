/*
 * RequestHandler.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_REQUESTHANDLER_HPP_
#define SRC_SERVER_REQUESTHANDLER_HPP_

#include <stdexcept>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "united_resource.hpp"
#include "Result.hpp"
#include "ExecutionService.hpp"

/**
 * @brief 请求体不是合法的提交。status 为应答使用的 HTTP 状态码
 */
class SubmissionFormatException: public std::runtime_error
{
	public:
		int status;

		SubmissionFormatException(const std::string & reason, int status = 400) :
				std::runtime_error(reason), status(status)
		{
		}
};

/**
 * @brief 解析并校验请求体。请求体必须是一个 JSON 对象, 且其 code 成员为不超过 max_code_size 字节的字符串
 * @throw SubmissionFormatException 请求体不合法, 代码过长时状态码为 413, 其余为 400
 */
Submission parse_submission(Language lang, const std::string & body, std::size_t max_code_size);

/**
 * @brief 校验失败时的应答体, 与执行结果的格式相同
 */
nlohmann::json rejection_body(const std::string & reason);

/**
 * @brief HTTP 边界。校验请求, 把合法的提交交给 ExecutionService, 并把结果序列化为 JSON。
 * 执行结果无论成败, HTTP 状态码均为 200; 仅校验失败时返回 4xx, 且不触碰执行闸门
 */
class RequestHandler
{
	private:
		ExecutionService & service;
		std::size_t max_code_size;

		void handle_submission(Language lang, const httplib::Request & req, httplib::Response & res);

	public:
		RequestHandler(ExecutionService & service, std::size_t max_code_size) :
				service(service), max_code_size(max_code_size)
		{
		}

		/**
		 * @brief 在 server 上注册全部路由, 以及跨域访问所需的默认头部
		 */
		void mount(httplib::Server & server);
};

#endif /* SRC_SERVER_REQUESTHANDLER_HPP_ */
