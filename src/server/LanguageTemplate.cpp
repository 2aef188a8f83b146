/*
 * LanguageTemplate.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "LanguageTemplate.hpp"

#include <kerbal/compatibility/chrono_suffix.hpp>

LanguageTemplate::LanguageTemplate(Language language,
								   const boost::filesystem::path & root,
								   const boost::filesystem::path & entry_file,
								   const ExecuteArgs & build_command,
								   const ExecuteArgs & run_command,
								   std::chrono::milliseconds timeout,
								   const std::vector<std::string> & compile_error_patterns) :
		language(language), root(root), entry_file(entry_file),
		build_command(build_command), run_command(run_command),
		timeout(timeout), compile_error_patterns(compile_error_patterns)
{
	this->validate();
}

LanguageTemplate LanguageTemplate::default_template(Language language)
{
	using namespace kerbal::compatibility::chrono_suffix;

	switch (language) {
		case Language::Rust:
			return LanguageTemplate(language, "/app/template-rs", "src/main.rs",
									{"cargo", "build", "--quiet"},
									{"cargo", "run", "--quiet"},
									30_s,
									{R"(error\[E)", "could not compile", "error: aborting due to"});
		case Language::TypeScript:
			return LanguageTemplate(language, "/app/template-ts", "src/index.ts",
									{},
									{"pnpm", "run", "start"},
									30_s,
									{"TypeScript error", "TypeError", "SyntaxError"});
	}
	throw std::invalid_argument("Undefined language enumerate");
}

bool LanguageTemplate::looks_like_compile_error(const std::string & diagnostic) const
{
	for (const boost::regex & pattern : compiled_patterns) {
		if (boost::regex_search(diagnostic, pattern)) {
			return true;
		}
	}
	return false;
}

void LanguageTemplate::validate()
{
	if (root.empty()) {
		throw std::invalid_argument(std::string(language_name(language)) + ": template root is empty");
	}
	if (entry_file.empty() || entry_file.is_absolute()) {
		throw std::invalid_argument(std::string(language_name(language)) + ": entry file must be a path relative to the template root");
	}
	if (run_command.empty()) {
		throw std::invalid_argument(std::string(language_name(language)) + ": run command is empty");
	}
	if (timeout <= std::chrono::milliseconds::zero()) {
		throw std::invalid_argument(std::string(language_name(language)) + ": timeout must be positive");
	}
	if (timeout > max_timeout) {
		throw std::invalid_argument(std::string(language_name(language)) + ": timeout must not exceed " + std::to_string(max_timeout.count()) + " ms");
	}

	std::vector<boost::regex> patterns;
	for (const std::string & pattern : compile_error_patterns) {
		try {
			patterns.emplace_back(pattern, boost::regex::perl | boost::regex::icase);
		} catch (const boost::regex_error & e) {
			throw std::invalid_argument(std::string(language_name(language)) + ": bad compile error pattern: " + pattern);
		}
	}
	compiled_patterns.swap(patterns);
}

std::ostream& operator<<(std::ostream& out, const LanguageTemplate & src)
{
	out << src.language << " root: " << src.root << " entry: " << src.entry_file;
	if (src.has_build_step()) {
		out << " build: [" << src.build_command << "]";
	}
	return out << " run: [" << src.run_command << "]"
				<< " timeout: " << src.timeout.count() << " ms";
}
