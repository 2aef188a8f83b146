/*
 * SettingsTest.cpp
 *
 *  Created on: 2026年10月19日
 */

#include <iostream>
#include <fstream>
#include <functional>
#include <map>
#include <string>

#include <boost/test/minimal.hpp>
#include <boost/filesystem.hpp>
#include <nlohmann/json.hpp>

#include "server_settings.hpp"
#include "logger.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	std::function<const char*(const char*)> fake_environment(const std::map<std::string, std::string> & variables)
	{
		return [&variables](const char * name) -> const char * {
			auto it = variables.find(name);
			return it == variables.end() ? nullptr : it->second.c_str();
		};
	}

	template <typename Callable>
	bool throws_settings_exception(Callable && func)
	{
		try {
			func();
		} catch (const SettingsException & e) {
			return true;
		}
		return false;
	}
}

void test_defaults()
{
	Settings s;
	BOOST_CHECK(s.server.host == "0.0.0.0");
	BOOST_CHECK(s.server.port == 3000);
	BOOST_CHECK(s.server.worker_threads == 8);
	BOOST_CHECK(s.runner.capture_dir == "/tmp/ts_coderun/capture");

	const LanguageTemplate & rust = s.language(Language::Rust);
	BOOST_CHECK(rust.root == "/app/template-rs");
	BOOST_CHECK(rust.entry_file == "src/main.rs");
	BOOST_CHECK(rust.has_build_step());
	BOOST_CHECK(rust.timeout == std::chrono::seconds(30));
	BOOST_CHECK(rust.looks_like_compile_error("error[E0308]: mismatched types"));

	const LanguageTemplate & typescript = s.language(Language::TypeScript);
	BOOST_CHECK(typescript.root == "/app/template-ts");
	BOOST_CHECK(!typescript.has_build_step());
	BOOST_CHECK(typescript.run_command.size() == 3);
	BOOST_CHECK(typescript.looks_like_compile_error("TypeScript error: cannot find name"));

	BOOST_CHECK(s.environment.at("SOLANA_URL") == "http://solana-validator:8899");
	BOOST_CHECK(s.environment.at("SOLANA_WS_URL") == "ws://solana-validator:8900");
}

void test_json_overrides()
{
	Settings s;
	s.parse_json(nlohmann::json::parse(R"({
		"server": { "port": 8080, "worker_threads": 2 },
		"languages": {
			"typescript": {
				"root": "/srv/template-ts",
				"build_command": ["pnpm", "exec", "tsc", "--noEmit"],
				"run_command": ["node", "dist/index.js"],
				"timeout_ms": 1500,
				"compile_error_patterns": ["TS\\d{4}"]
			}
		},
		"environment": { "RPC_URL": "http://localhost:8899" }
	})"));

	BOOST_CHECK(s.server.port == 8080);
	BOOST_CHECK(s.server.worker_threads == 2);
	BOOST_CHECK(s.server.host == "0.0.0.0");

	const LanguageTemplate & typescript = s.language(Language::TypeScript);
	BOOST_CHECK(typescript.root == "/srv/template-ts");
	BOOST_CHECK(typescript.entry_file == "src/index.ts");
	BOOST_CHECK(typescript.has_build_step());
	BOOST_CHECK(typescript.timeout == std::chrono::milliseconds(1500));
	// 新的正则已经生效
	BOOST_CHECK(typescript.looks_like_compile_error("src/index.ts(3,1): error TS2304: Cannot find name"));
	BOOST_CHECK(!typescript.looks_like_compile_error("TypeError: x is not a function"));

	BOOST_CHECK(s.language(Language::Rust).root == "/app/template-rs");
	BOOST_CHECK(s.environment.at("RPC_URL") == "http://localhost:8899");
	BOOST_CHECK(s.environment.count("SOLANA_URL") == 1);
}

void test_environment_overrides()
{
	Settings s;
	const std::map<std::string, std::string> variables = {
		{ "PORT", "4000" },
		{ "HOST", "127.0.0.1" },
		{ "TEMPLATE_RS", "/opt/template-rs" },
		{ "RUST_TIMEOUT_SECS", "5" },
		{ "TYPESCRIPT_TIMEOUT_SECS", "7" },
		{ "SOLANA_URL", "http://127.0.0.1:8899" },
		{ "CAPTURE_DIR", "/var/tmp/capture" },
	};
	s.apply_environment(fake_environment(variables));

	BOOST_CHECK(s.server.port == 4000);
	BOOST_CHECK(s.server.host == "127.0.0.1");
	BOOST_CHECK(s.language(Language::Rust).root == "/opt/template-rs");
	BOOST_CHECK(s.language(Language::Rust).timeout == std::chrono::seconds(5));
	BOOST_CHECK(s.language(Language::TypeScript).timeout == std::chrono::seconds(7));
	BOOST_CHECK(s.environment.at("SOLANA_URL") == "http://127.0.0.1:8899");
	BOOST_CHECK(s.environment.at("SOLANA_WS_URL") == "ws://solana-validator:8900");
	BOOST_CHECK(s.runner.capture_dir == "/var/tmp/capture");
}

void test_malformed_settings()
{
	const std::map<std::string, std::string> bad_port = { { "PORT", "http" } };
	BOOST_CHECK(throws_settings_exception([&bad_port] {
		Settings s;
		s.apply_environment(fake_environment(bad_port));
	}));

	const std::map<std::string, std::string> zero_timeout = { { "RUST_TIMEOUT_SECS", "0" } };
	BOOST_CHECK(throws_settings_exception([&zero_timeout] {
		Settings s;
		s.apply_environment(fake_environment(zero_timeout));
	}));

	const std::map<std::string, std::string> huge_timeout = { { "RUST_TIMEOUT_SECS", "9223372036854775807" } };
	BOOST_CHECK(throws_settings_exception([&huge_timeout] {
		Settings s;
		s.apply_environment(fake_environment(huge_timeout));
	}));

	const std::map<std::string, std::string> day_and_a_second = { { "TYPESCRIPT_TIMEOUT_SECS", "86401" } };
	BOOST_CHECK(throws_settings_exception([&day_and_a_second] {
		Settings s;
		s.apply_environment(fake_environment(day_and_a_second));
	}));

	const std::map<std::string, std::string> one_day = { { "TYPESCRIPT_TIMEOUT_SECS", "86400" } };
	Settings longest;
	longest.apply_environment(fake_environment(one_day));
	BOOST_CHECK(longest.language(Language::TypeScript).timeout == LanguageTemplate::max_timeout);

	const std::map<std::string, std::string> negative_timeout = { { "RUST_TIMEOUT_SECS", "-9223372036854775807" } };
	BOOST_CHECK(throws_settings_exception([&negative_timeout] {
		Settings s;
		s.apply_environment(fake_environment(negative_timeout));
	}));

	BOOST_CHECK(throws_settings_exception([] {
		Settings s;
		s.parse_json(nlohmann::json::parse(R"({"languages": {"typescript": {"timeout_ms": 9223372036854775807}}})"));
	}));

	BOOST_CHECK(throws_settings_exception([] {
		Settings s;
		s.parse_json(nlohmann::json::parse(R"({"server": {"port": "3000"}})"));
	}));

	BOOST_CHECK(throws_settings_exception([] {
		Settings s;
		s.parse_json(nlohmann::json::parse(R"({"languages": {"rust": {"run_command": []}}})"));
	}));

	BOOST_CHECK(throws_settings_exception([] {
		Settings s;
		s.parse_json(nlohmann::json::parse(R"({"languages": {"rust": {"compile_error_patterns": ["("]}}})"));
	}));
}

void test_config_file(const boost::filesystem::path & workspace)
{
	const boost::filesystem::path config_file = workspace / "server_conf.json";
	{
		std::ofstream fout(config_file.string());
		fout << R"({"runtime": {"log_file_path": "/tmp/coderun-test.log"}, "runner": {"max_output_size": 4096}})";
	}
	Settings s;
	s.parse(config_file);
	BOOST_CHECK(s.runtime.log_file_path == "/tmp/coderun-test.log");
	BOOST_CHECK(s.runner.max_output_size == 4096);

	const boost::filesystem::path broken_file = workspace / "broken.json";
	{
		std::ofstream fout(broken_file.string());
		fout << "{ \"server\": ";
	}
	BOOST_CHECK(throws_settings_exception([&broken_file] {
		Settings s;
		s.parse(broken_file);
	}));

	BOOST_CHECK(throws_settings_exception([&workspace] {
		Settings s;
		s.parse(workspace / "no-such-file.json");
	}));
}

int test_main(int argc, char *argv[])
{
	const boost::filesystem::path workspace = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("coderun-settings-%%%%-%%%%");
	boost::filesystem::create_directories(workspace);

	try {
		test_defaults();
		test_json_overrides();
		test_environment_overrides();
		test_malformed_settings();
		test_config_file(workspace);
	} catch (const std::exception & e) {
		EXCEPT_FATAL("test", 0, log_fp, "SettingsTest failed!", e);
		boost::filesystem::remove_all(workspace);
		BOOST_FAIL(e.what());
	}

	boost::filesystem::remove_all(workspace);
	return 0;
}
