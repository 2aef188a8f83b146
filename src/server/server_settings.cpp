/*
 * server_settings.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "server_settings.hpp"

#include <fstream>
#include <iostream>

#include <boost/lexical_cast.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

Settings::Settings() :
		languages{{LanguageTemplate::default_template(Language::Rust), LanguageTemplate::default_template(Language::TypeScript)}}
{
	runtime.log_file_path = "/tmp/ts_coderun/server.log";

	server.host = "0.0.0.0";
	server.port = 3000;
	server.worker_threads = 8;
	server.max_request_size = 1024 * 1024;
	server.max_code_size = 512 * 1024;

	runner.capture_dir = "/tmp/ts_coderun/capture";
	runner.max_output_size = 1024 * 1024;

	environment["SOLANA_URL"] = "http://solana-validator:8899";
	environment["SOLANA_WS_URL"] = "ws://solana-validator:8900";
}

void Settings::parse(const boost::filesystem::path & config_file)
{
	nlohmann::json json_obj;
	{
		std::ifstream config_file_stream {config_file.string()};
		if (!config_file_stream) {
			throw SettingsException("config file [" + config_file.string() + "] open failed");
		}
		try {
			config_file_stream >> json_obj;
		} catch (const nlohmann::json::exception & e) {
			throw SettingsException("config file [" + config_file.string() + "] is not a valid json: " + e.what());
		}
	}
	this->parse_json(json_obj);
}

namespace
{
	template <typename Type>
	void load_if_exists(const nlohmann::json & node, const char * key, Type & dest)
	{
		auto it = node.find(key);
		if (it != node.end()) {
			dest = it->get<Type>();
		}
	}

	void load_path_if_exists(const nlohmann::json & node, const char * key, boost::filesystem::path & dest)
	{
		auto it = node.find(key);
		if (it != node.end()) {
			dest = it->get<std::string>();
		}
	}

	void load_command_if_exists(const nlohmann::json & node, const char * key, ExecuteArgs & dest)
	{
		auto it = node.find(key);
		if (it != node.end()) {
			dest = ExecuteArgs(it->get<std::vector<std::string>>());
		}
	}
}

void Settings::parse_json(const nlohmann::json & json_obj)
{
	try {
		if (!json_obj.is_object()) {
			throw SettingsException("config root must be an object");
		}

		if (json_obj.count("runtime")) {
			const auto & runtime_node = json_obj.at("runtime");
			load_path_if_exists(runtime_node, "log_file_path", runtime.log_file_path);
		}

		if (json_obj.count("server")) {
			const auto & server_node = json_obj.at("server");
			load_if_exists(server_node, "host", server.host);
			load_if_exists(server_node, "port", server.port);
			load_if_exists(server_node, "worker_threads", server.worker_threads);
			load_if_exists(server_node, "max_request_size", server.max_request_size);
			load_if_exists(server_node, "max_code_size", server.max_code_size);
		}

		if (json_obj.count("runner")) {
			const auto & runner_node = json_obj.at("runner");
			load_path_if_exists(runner_node, "capture_dir", runner.capture_dir);
			load_if_exists(runner_node, "max_output_size", runner.max_output_size);
		}

		if (json_obj.count("languages")) {
			const auto & languages_node = json_obj.at("languages");
			for (Language lang : all_languages) {
				auto it = languages_node.find(language_name(lang));
				if (it == languages_node.end()) {
					continue;
				}
				const nlohmann::json & language_node = *it;
				LanguageTemplate & language_template = languages[language_index(lang)];

				load_path_if_exists(language_node, "root", language_template.root);
				load_path_if_exists(language_node, "entry_file", language_template.entry_file);
				load_command_if_exists(language_node, "build_command", language_template.build_command);
				load_command_if_exists(language_node, "run_command", language_template.run_command);
				if (language_node.count("timeout_ms")) {
					language_template.timeout = std::chrono::milliseconds(language_node.at("timeout_ms").get<long>());
				}
				load_if_exists(language_node, "compile_error_patterns", language_template.compile_error_patterns);
			}
		}

		if (json_obj.count("environment")) {
			for (const auto & variable : json_obj.at("environment").items()) {
				environment[variable.key()] = variable.value().get<std::string>();
			}
		}
	} catch (const nlohmann::json::exception & e) {
		throw SettingsException(std::string("bad config item: ") + e.what());
	}

	this->validate();
}

namespace
{
	template <typename Type>
	Type env_value_cast(const char * name, const char * value)
	{
		try {
			return boost::lexical_cast<Type>(value);
		} catch (const boost::bad_lexical_cast & e) {
			throw SettingsException(std::string("environment variable ") + name + " has a bad value: " + value);
		}
	}

	/**
	 * @brief 秒数先与上限比较, 再换算成毫秒, 换算本身不会溢出
	 */
	std::chrono::milliseconds env_timeout_cast(const char * name, const char * value)
	{
		long seconds = env_value_cast<long>(name, value);
		if (seconds < 0 || seconds > std::chrono::duration_cast<std::chrono::seconds>(LanguageTemplate::max_timeout).count()) {
			throw SettingsException(std::string("environment variable ") + name + " is out of the timeout range: " + value);
		}
		return std::chrono::seconds(seconds);
	}
}

void Settings::apply_environment(const std::function<const char*(const char*)> & getenv_func)
{
	const char * value = nullptr;

	if ((value = getenv_func("LOG_FILE")) != nullptr) {
		runtime.log_file_path = value;
	}
	if ((value = getenv_func("HOST")) != nullptr) {
		server.host = value;
	}
	if ((value = getenv_func("PORT")) != nullptr) {
		server.port = env_value_cast<int>("PORT", value);
	}
	if ((value = getenv_func("WORKER_THREADS")) != nullptr) {
		server.worker_threads = env_value_cast<int>("WORKER_THREADS", value);
	}
	if ((value = getenv_func("CAPTURE_DIR")) != nullptr) {
		runner.capture_dir = value;
	}

	LanguageTemplate & rust = languages[language_index(Language::Rust)];
	if ((value = getenv_func("TEMPLATE_RS")) != nullptr) {
		rust.root = value;
	}
	if ((value = getenv_func("RUST_TIMEOUT_SECS")) != nullptr) {
		rust.timeout = env_timeout_cast("RUST_TIMEOUT_SECS", value);
	}

	LanguageTemplate & typescript = languages[language_index(Language::TypeScript)];
	if ((value = getenv_func("TEMPLATE_TS")) != nullptr) {
		typescript.root = value;
	}
	if ((value = getenv_func("TYPESCRIPT_TIMEOUT_SECS")) != nullptr) {
		typescript.timeout = env_timeout_cast("TYPESCRIPT_TIMEOUT_SECS", value);
	}

	for (const char * name : { "SOLANA_URL", "SOLANA_WS_URL" }) {
		if ((value = getenv_func(name)) != nullptr) {
			environment[name] = value;
		}
	}

	this->validate();
}

void Settings::validate()
{
	if (server.port <= 0 || server.port > 65535) {
		throw SettingsException("server.port out of range: " + std::to_string(server.port));
	}
	if (server.worker_threads <= 0) {
		throw SettingsException("server.worker_threads must be positive");
	}
	if (server.max_code_size == 0 || server.max_code_size > server.max_request_size) {
		throw SettingsException("server.max_code_size must be positive and no larger than server.max_request_size");
	}
	if (runner.capture_dir.empty()) {
		throw SettingsException("runner.capture_dir is empty");
	}
	if (runner.max_output_size == 0) {
		throw SettingsException("runner.max_output_size must be positive");
	}

	for (LanguageTemplate & language_template : languages) {
		try {
			language_template.validate();
		} catch (const std::invalid_argument & e) {
			throw SettingsException(e.what());
		}
	}
}

std::ostream& operator<<(std::ostream& out, const Settings & src)
{
	out << "log_file_path: " << src.runtime.log_file_path
		<< " host: " << src.server.host
		<< " port: " << src.server.port
		<< " worker_threads: " << src.server.worker_threads
		<< " max_request_size: " << src.server.max_request_size
		<< " max_code_size: " << src.server.max_code_size
		<< " capture_dir: " << src.runner.capture_dir
		<< " max_output_size: " << src.runner.max_output_size;
	for (const LanguageTemplate & language_template : src.languages) {
		out << " {" << language_template << "}";
	}
	for (const auto & variable : src.environment) {
		out << " " << variable.first << "=" << variable.second;
	}
	return out;
}

Settings __settings;

std::reference_wrapper<const Settings> settings(__settings);
