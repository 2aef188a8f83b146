/*
 * ToolchainRunner.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "ToolchainRunner.hpp"

#include <fstream>
#include <vector>

#include <unistd.h>

#include "logger.hpp"

extern std::ofstream log_fp;

ToolchainRunner::ToolchainRunner(const boost::filesystem::path & capture_dir, std::size_t max_output_size,
								 const std::map<std::string, std::string> & extra_env) :
		capture_dir(capture_dir), max_output_size(max_output_size), env(make_environment(extra_env))
{
}

ExecuteArgs ToolchainRunner::make_environment(const std::map<std::string, std::string> & overrides)
{
	ExecuteArgs res;
	for (char ** p = environ; p != nullptr && *p != nullptr; ++p) {
		const std::string entry(*p);
		const std::string name = entry.substr(0, entry.find('='));
		if (overrides.count(name) == 0) {
			res.push_back(entry);
		}
	}
	for (const auto & variable : overrides) {
		res.push_back(variable.first + "=" + variable.second);
	}
	return res;
}

std::size_t utf8_cut_position(const char * data, std::size_t cut) noexcept
{
	// data[cut] 是 UTF-8 续字节时, 截断点落在一个多字节字符内部, 退回到该字符的首字节。
	// 一个字符至多 4 字节, 因此至多退 3 步; 更长的续字节串本身就不是合法的 UTF-8, 不再处理
	std::size_t pos = cut;
	for (int step = 0; step < 3 && pos > 0; ++step) {
		if ((static_cast<unsigned char>(data[pos]) & 0xC0) != 0x80) {
			return pos;
		}
		--pos;
	}
	if ((static_cast<unsigned char>(data[pos]) & 0xC0) != 0x80) {
		return pos;
	}
	return cut;
}

std::string read_captured_stream(const boost::filesystem::path & file_path, std::size_t max_size)
{
	std::ifstream fin(file_path.string(), std::ios::in | std::ios::binary);
	if (!fin) {
		throw CaptureFailedException("open captured stream [" + file_path.string() + "] failed");
	}

	std::vector<char> buffer(max_size + 1);
	fin.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
	if (fin.bad()) {
		throw CaptureFailedException("read captured stream [" + file_path.string() + "] failed");
	}

	std::size_t length_read = static_cast<std::size_t>(fin.gcount());
	if (length_read > max_size) {
		return std::string(buffer.data(), utf8_cut_position(buffer.data(), max_size)) + "\n[output truncated]";
	}
	return std::string(buffer.data(), length_read);
}

ToolchainOutcome ToolchainRunner::run(const LanguageTemplate & language_template, unsigned long request_id) const
{
	using namespace std::chrono;

	const Language lang = language_template.language;
	const boost::filesystem::path dir = capture_dir / language_name(lang);
	{
		boost::system::error_code ec;
		boost::filesystem::create_directories(dir, ec);
		if (ec) {
			throw CaptureFailedException("create capture directory [" + dir.string() + "] failed: " + ec.message());
		}
	}

	ToolchainOutcome outcome;
	const steady_clock::time_point deadline = steady_clock::now() + language_template.timeout;

	if (language_template.has_build_step()) {
		ProtectedProcessConfig config(language_template.root, dir / "build.out", dir / "build.err");
		config.set_deadline(deadline);

		LOG_DEBUG(lang, request_id, log_fp, "build start: ", language_template.build_command);
		ProtectedProcessDetails details = protected_process(language_template.build_command, config, env);
		LOG_DEBUG(lang, request_id, log_fp, "build finished. ", details);

		if (details.running_result() == ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED) {
			outcome.timed_out = true;
			return outcome;
		}

		outcome.build_exit = details.exit_code();
		outcome.signal = details.signal();
		if (!details.success()) {
			outcome.stderr_text = read_captured_stream(config.error_path, max_output_size);
			outcome.stdout_text = read_captured_stream(config.output_path, max_output_size);
			return outcome;
		}
	}

	ProtectedProcessConfig config(language_template.root, dir / "run.out", dir / "run.err");
	config.set_deadline(deadline);

	LOG_DEBUG(lang, request_id, log_fp, "run start: ", language_template.run_command);
	ProtectedProcessDetails details = protected_process(language_template.run_command, config, env);
	LOG_DEBUG(lang, request_id, log_fp, "run finished. ", details);

	if (details.running_result() == ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED) {
		outcome.timed_out = true;
		return outcome;
	}

	outcome.run_exit = details.exit_code();
	outcome.signal = details.signal();
	outcome.stderr_text = read_captured_stream(config.error_path, max_output_size);
	outcome.stdout_text = read_captured_stream(config.output_path, max_output_size);
	return outcome;
}
