/*
 * server_settings.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_SERVER_SETTINGS_HPP_
#define SRC_SERVER_SERVER_SETTINGS_HPP_

#include <array>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include "united_resource.hpp"
#include "LanguageTemplate.hpp"

class SettingsException: public std::runtime_error
{
	public:
		SettingsException(const std::string & reason) :
				std::runtime_error(reason)
		{
		}
};

class Settings
{
	public:

		struct
		{
				boost::filesystem::path log_file_path;
		} runtime;

		struct
		{
				std::string host;
				int port;
				int worker_threads;
				std::size_t max_request_size;
				std::size_t max_code_size;
		} server;

		struct
		{
				boost::filesystem::path capture_dir;
				std::size_t max_output_size;
		} runner;

		/// 按 Language 的枚举值排列
		std::array<LanguageTemplate, language_count> languages;

		/// 原样传给子进程的环境变量
		std::map<std::string, std::string> environment;

		Settings();

		/**
		 * @brief 从 JSON 配置文件中读取配置, 文件中没有出现的项保持原值
		 * @throw SettingsException 文件无法打开, 不是合法的 JSON, 或某一项的类型不对
		 */
		void parse(const boost::filesystem::path & config_file);

		/**
		 * @brief 从 JSON 对象中读取配置
		 * @throw SettingsException
		 */
		void parse_json(const nlohmann::json & json_obj);

		/**
		 * @brief 用环境变量覆盖配置
		 * @param getenv_func 查询环境变量的函数, 变量不存在时返回空指针
		 * @throw SettingsException 环境变量的值无法解析
		 */
		void apply_environment(const std::function<const char*(const char*)> & getenv_func);

		/**
		 * @brief 检查配置是否合法, 并重新编译各语言的 compile_error_patterns
		 * @throw SettingsException
		 */
		void validate();

		const LanguageTemplate & language(Language lang) const
		{
			return languages[language_index(lang)];
		}

		friend std::ostream& operator<<(std::ostream& out, const Settings & src);
};

extern std::reference_wrapper<const Settings> settings;

#endif /* SRC_SERVER_SERVER_SETTINGS_HPP_ */
