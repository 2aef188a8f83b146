/*
 * RequestHandler.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "RequestHandler.hpp"

#include <fstream>

#include "logger.hpp"

extern std::ofstream log_fp;

namespace
{
	constexpr const char JSON_CONTENT_TYPE[] = "application/json";
	constexpr const char GREETING[] = "ts_coderun is running. POST {\"code\": ...} to /rust or /typescript.\n";

	/*
	 * output 与 error 是子进程原样输出的字节, 不一定是合法的 UTF-8。
	 * 非法的字节被替换为 U+FFFD, 而不是让 dump 抛出异常
	 */
	std::string serialize(const nlohmann::json & body)
	{
		return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	}
}

Submission parse_submission(Language lang, const std::string & body, std::size_t max_code_size)
{
	if (body.empty()) {
		throw SubmissionFormatException("Request body is empty");
	}

	nlohmann::json body_obj;
	try {
		body_obj = nlohmann::json::parse(body);
	} catch (const nlohmann::json::parse_error & e) {
		throw SubmissionFormatException("Request body is not valid JSON");
	}

	if (!body_obj.is_object()) {
		throw SubmissionFormatException("Request body must be a JSON object");
	}

	auto it = body_obj.find("code");
	if (it == body_obj.end()) {
		throw SubmissionFormatException("Missing field: code");
	}
	if (!it->is_string()) {
		throw SubmissionFormatException("Field code must be a string");
	}

	Submission submission;
	submission.language = lang;
	submission.code = it->get<std::string>();
	if (submission.code.size() > max_code_size) {
		throw SubmissionFormatException("Field code exceeds " + std::to_string(max_code_size) + " bytes", 413);
	}
	return submission;
}

nlohmann::json rejection_body(const std::string & reason)
{
	nlohmann::json body_obj;
	body_obj["success"] = false;
	body_obj["output"] = "";
	body_obj["error"] = reason;
	return body_obj;
}

void RequestHandler::handle_submission(Language lang, const httplib::Request & req, httplib::Response & res)
{
	const unsigned long request_id = service.next_request_id();

	Submission submission;
	try {
		submission = parse_submission(lang, req.body, max_code_size);
	} catch (const SubmissionFormatException & e) {
		LOG_INFO(lang, request_id, log_fp, "Submission rejected: ", e.what(), " remote: ", req.remote_addr);
		res.status = e.status;
		res.set_content(serialize(rejection_body(e.what())), JSON_CONTENT_TYPE);
		return;
	}

	LOG_INFO(lang, request_id, log_fp, "Submission received. code size: ", submission.code.size(), " remote: ", req.remote_addr);

	ExecutionResult result = service.execute(submission, request_id);
	res.status = 200;
	res.set_content(serialize(result.to_json()), JSON_CONTENT_TYPE);
}

void RequestHandler::mount(httplib::Server & server)
{
	server.set_default_headers({
		{ "Access-Control-Allow-Origin", "*" },
		{ "Access-Control-Allow-Methods", "GET, POST, OPTIONS" },
		{ "Access-Control-Allow-Headers", "Content-Type" },
	});

	server.Get("/", [](const httplib::Request &, httplib::Response & res) {
		res.set_content(GREETING, "text/plain");
	});

	server.Get("/health", [](const httplib::Request &, httplib::Response & res) {
		res.set_content("ok", "text/plain");
	});

	for (Language lang : all_languages) {
		server.Post(std::string("/") + language_name(lang), [this, lang](const httplib::Request & req, httplib::Response & res) {
			this->handle_submission(lang, req, res);
		});
	}

	server.Options(R"(.*)", [](const httplib::Request &, httplib::Response & res) {
		res.status = 204;
	});
}
