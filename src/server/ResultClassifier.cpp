/*
 * ResultClassifier.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "ResultClassifier.hpp"

#include <csignal>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "boost_format_suffix.hpp"

const char INFRASTRUCTURE_ERROR_MESSAGE[] = "Internal error: the code could not be executed. Please try again later.";

std::string timeout_message(std::chrono::milliseconds timeout)
{
	if (timeout.count() % 1000 == 0) {
		return "Execution timed out after %d seconds. Your code took too long to run."_fmt(timeout.count() / 1000);
	}
	return "Execution timed out after %d milliseconds. Your code took too long to run."_fmt(timeout.count());
}

const char * signal_name(int signal) noexcept
{
	switch (signal) {
		case SIGHUP: return "SIGHUP";
		case SIGINT: return "SIGINT";
		case SIGQUIT: return "SIGQUIT";
		case SIGILL: return "SIGILL";
		case SIGTRAP: return "SIGTRAP";
		case SIGABRT: return "SIGABRT";
		case SIGBUS: return "SIGBUS";
		case SIGFPE: return "SIGFPE";
		case SIGKILL: return "SIGKILL";
		case SIGUSR1: return "SIGUSR1";
		case SIGSEGV: return "SIGSEGV";
		case SIGUSR2: return "SIGUSR2";
		case SIGPIPE: return "SIGPIPE";
		case SIGALRM: return "SIGALRM";
		case SIGTERM: return "SIGTERM";
		case SIGXCPU: return "SIGXCPU";
		case SIGXFSZ: return "SIGXFSZ";
		case SIGSYS: return "SIGSYS";
		default: return "unknown signal";
	}
}

namespace
{
	bool blank(const std::string & text)
	{
		return boost::algorithm::all(text, boost::algorithm::is_space());
	}

	std::string exit_status_message(int exit_code, int signal)
	{
		if (signal != 0) {
			return "Process terminated by signal %d (%s)"_fmt(signal, signal_name(signal));
		}
		return "Process exited with status %d"_fmt(exit_code);
	}

} /* namespace */

ExecutionResult classify_outcome(const ToolchainOutcome & outcome, const LanguageTemplate & language_template)
{
	if (outcome.timed_out) {
		return ExecutionResult::failed(FailureKind::TIMEOUT, timeout_message(language_template.timeout));
	}

	if (outcome.build_exit.has_value() && outcome.build_exit.value() != 0) {
		// 有的编译器 (如 tsc) 把诊断信息写到标准输出
		if (!blank(outcome.stderr_text)) {
			return ExecutionResult::failed(FailureKind::BUILD_FAILURE, outcome.stderr_text);
		}
		if (!blank(outcome.stdout_text)) {
			return ExecutionResult::failed(FailureKind::BUILD_FAILURE, outcome.stdout_text);
		}
		return ExecutionResult::failed(FailureKind::BUILD_FAILURE, exit_status_message(outcome.build_exit.value(), outcome.signal));
	}

	if (!outcome.run_exit.has_value()) {
		return ExecutionResult::failed(FailureKind::INFRASTRUCTURE, INFRASTRUCTURE_ERROR_MESSAGE);
	}

	if (outcome.run_exit.value() != 0) {
		FailureKind kind = FailureKind::RUN_FAILURE;
		if (!language_template.has_build_step() && language_template.looks_like_compile_error(outcome.stderr_text)) {
			kind = FailureKind::BUILD_FAILURE;
		}
		if (!blank(outcome.stderr_text)) {
			return ExecutionResult::failed(kind, outcome.stderr_text);
		}
		return ExecutionResult::failed(kind, exit_status_message(outcome.run_exit.value(), outcome.signal));
	}

	return ExecutionResult::succeeded(outcome.stdout_text);
}
