/*
 * ExecutionServiceTest.cpp
 *
 *  Created on: 2026年10月19日
 */

#include <iostream>
#include <fstream>
#include <thread>
#include <chrono>
#include <future>
#include <vector>
#include <string>

#include <boost/test/minimal.hpp>
#include <boost/filesystem.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "ExecutionService.hpp"
#include "ResultClassifier.hpp"
#include "logger.hpp"

std::ofstream log_fp("/dev/null");

using namespace kerbal::compatibility::chrono_suffix;

namespace
{
	boost::filesystem::path workspace;

	LanguageTemplate shell_template(Language lang, const boost::filesystem::path & root, std::chrono::milliseconds timeout)
	{
		switch (lang) {
			case Language::Rust:
				return LanguageTemplate(lang, root, "main.sh", {"sh", "-n", "main.sh"}, {"sh", "main.sh"}, timeout, {});
			case Language::TypeScript:
				return LanguageTemplate(lang, root, "index.sh", {}, {"sh", "index.sh"}, timeout, {"syntax error"});
		}
		throw std::invalid_argument("Undefined language enumerate");
	}

	ExecutionService::template_registry shell_registry(const std::string & name, std::chrono::milliseconds timeout)
	{
		return ExecutionService::template_registry{{
			shell_template(Language::Rust, workspace / name / "template-rs", timeout),
			shell_template(Language::TypeScript, workspace / name / "template-ts", timeout),
		}};
	}

	ToolchainRunner make_runner()
	{
		return ToolchainRunner(workspace / "capture", 1024 * 1024, std::map<std::string, std::string>());
	}

	Submission make_submission(Language lang, const std::string & code)
	{
		Submission submission;
		submission.language = lang;
		submission.code = code;
		return submission;
	}
}

void test_same_language_serialized()
{
	ExecutionService service(shell_registry("serial", 20_s), make_runner());

	std::vector<std::future<ExecutionResult>> results;
	for (int i = 0; i < 4; ++i) {
		const std::string code =
				"if [ -e busy ]; then echo overlap >&2; exit 1; fi\n"
				"touch busy\n"
				"sleep 0.2\n"
				"rm busy\n"
				"echo ok-" + std::to_string(i) + "\n";
		results.push_back(std::async(std::launch::async, [&service, code] {
			return service.execute(make_submission(Language::Rust, code), service.next_request_id());
		}));
	}

	for (int i = 0; i < 4; ++i) {
		ExecutionResult result = results[i].get();
		BOOST_CHECK(result.success);
		// 每个请求执行的都是自己写入的代码
		BOOST_CHECK(result.output == "ok-" + std::to_string(i) + "\n");
	}
	BOOST_CHECK(!service.gate(Language::Rust).held());
}

void test_languages_independent()
{
	ExecutionService service(shell_registry("independent", 20_s), make_runner());

	std::future<ExecutionResult> slow = std::async(std::launch::async, [&service] {
		return service.execute(make_submission(Language::Rust, "sleep 2\necho slow\n"), service.next_request_id());
	});
	while (!service.gate(Language::Rust).held()) {
		std::this_thread::sleep_for(1_ms);
	}

	auto start = std::chrono::steady_clock::now();
	ExecutionResult fast = service.execute(make_submission(Language::TypeScript, "echo fast\n"), service.next_request_id());
	auto elapsed = std::chrono::steady_clock::now() - start;

	BOOST_CHECK(fast.success);
	BOOST_CHECK(fast.output == "fast\n");
	BOOST_CHECK(elapsed < std::chrono::milliseconds(1500));
	BOOST_CHECK(service.gate(Language::Rust).held());

	ExecutionResult slow_result = slow.get();
	BOOST_CHECK(slow_result.success);
	BOOST_CHECK(slow_result.output == "slow\n");
}

void test_timeout_releases_gate()
{
	ExecutionService service(shell_registry("timeout", 500_ms), make_runner());

	auto start = std::chrono::steady_clock::now();
	ExecutionResult result = service.execute(make_submission(Language::Rust, "sleep 30\n"), service.next_request_id());
	auto elapsed = std::chrono::steady_clock::now() - start;

	BOOST_CHECK(!result.success);
	BOOST_CHECK(result.kind == FailureKind::TIMEOUT);
	BOOST_CHECK(result.output.empty());
	BOOST_CHECK(result.error.value() == "Execution timed out after 500 milliseconds. Your code took too long to run.");
	BOOST_CHECK(elapsed < std::chrono::seconds(5));
	BOOST_CHECK(!service.gate(Language::Rust).held());

	ExecutionResult next = service.execute(make_submission(Language::Rust, "echo next\n"), service.next_request_id());
	BOOST_CHECK(next.success);
	BOOST_CHECK(next.output == "next\n");
}

void test_invalid_program()
{
	ExecutionService service(shell_registry("invalid", 10_s), make_runner());

	ExecutionResult separate = service.execute(make_submission(Language::Rust, "if then fi (\n"), service.next_request_id());
	BOOST_CHECK(!separate.success);
	BOOST_CHECK(separate.kind == FailureKind::BUILD_FAILURE);
	BOOST_CHECK(separate.output.empty());
	BOOST_CHECK(separate.error.has_value() && !separate.error.value().empty());

	// 组合命令: 依靠诊断信息区分编译错误
	ExecutionResult combined = service.execute(make_submission(Language::TypeScript, "if then fi (\n"), service.next_request_id());
	BOOST_CHECK(!combined.success);
	BOOST_CHECK(combined.kind == FailureKind::BUILD_FAILURE);
	BOOST_CHECK(combined.output.empty());

	ExecutionResult runtime = service.execute(make_submission(Language::TypeScript, "echo half\nexit 7\n"), service.next_request_id());
	BOOST_CHECK(!runtime.success);
	BOOST_CHECK(runtime.kind == FailureKind::RUN_FAILURE);
	BOOST_CHECK(runtime.output.empty());
}

void test_infrastructure_error()
{
	const boost::filesystem::path not_a_dir = workspace / "infrastructure-file";
	{
		std::ofstream touch(not_a_dir.string());
	}
	ExecutionService::template_registry registry = shell_registry("infrastructure", 10_s);
	registry[language_index(Language::Rust)].root = not_a_dir;
	ExecutionService service(registry, make_runner());

	ExecutionResult result = service.execute(make_submission(Language::Rust, "echo hi\n"), service.next_request_id());
	BOOST_CHECK(!result.success);
	BOOST_CHECK(result.kind == FailureKind::INFRASTRUCTURE);
	BOOST_CHECK(result.error.value() == INFRASTRUCTURE_ERROR_MESSAGE);
	BOOST_CHECK(!service.gate(Language::Rust).held());
}

void test_registry_order_checked()
{
	ExecutionService::template_registry registry = shell_registry("order", 10_s);
	std::swap(registry[0], registry[1]);

	bool thrown = false;
	try {
		ExecutionService service(registry, make_runner());
	} catch (const std::invalid_argument & e) {
		thrown = true;
	}
	BOOST_CHECK(thrown);
}

int test_main(int argc, char *argv[])
{
	workspace = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("coderun-service-%%%%-%%%%");
	boost::filesystem::create_directories(workspace);

	try {
		test_same_language_serialized();
		test_languages_independent();
		test_timeout_releases_gate();
		test_invalid_program();
		test_infrastructure_error();
		test_registry_order_checked();
	} catch (const std::exception & e) {
		EXCEPT_FATAL("test", 0, log_fp, "ExecutionServiceTest failed!", e);
		boost::filesystem::remove_all(workspace);
		BOOST_FAIL(e.what());
	}

	boost::filesystem::remove_all(workspace);
	return 0;
}
