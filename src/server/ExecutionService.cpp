/*
 * ExecutionService.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "ExecutionService.hpp"

#include <fstream>

#include "logger.hpp"
#include "SourceStager.hpp"
#include "ResultClassifier.hpp"

extern std::ofstream log_fp;

ExecutionService::ExecutionService(const template_registry & templates, const ToolchainRunner & runner) :
		templates(templates), runner(runner), request_counter(0)
{
	for (Language lang : all_languages) {
		if (this->templates[language_index(lang)].language != lang) {
			throw std::invalid_argument(std::string("template registry slot of ") + language_name(lang) + " holds another language");
		}
	}
}

ExecutionResult ExecutionService::execute(const Submission & submission, unsigned long request_id) noexcept
{
	const Language lang = submission.language;
	const LanguageTemplate & language_template = this->language_template(lang);
	ExecutionGate & gate = this->gate(lang);

	ExecutionResult result;
	try {
		PROFILE_HEAD
		LOG_DEBUG(lang, request_id, log_fp, "waiting for gate, queue length: ", gate.queue_length());
		ExecutionGate::holder_t holder = gate.acquire();
		PROFILE_TAIL(lang, request_id, log_fp, "gate acquired")

		stage_source_code(language_template, submission.code);
		LOG_DEBUG(lang, request_id, log_fp, "staged ", submission.code.size(), " bytes to ", language_template.entry_file_path());

		ToolchainOutcome outcome = runner.run(language_template, request_id);
		result = classify_outcome(outcome, language_template);
	} catch (const StageFailedException & e) {
		EXCEPT_FATAL(lang, request_id, log_fp, "Stage source code failed.", e);
		result = ExecutionResult::failed(FailureKind::INFRASTRUCTURE, INFRASTRUCTURE_ERROR_MESSAGE);
	} catch (const SpawnFailedException & e) {
		EXCEPT_FATAL(lang, request_id, log_fp, "Spawn toolchain failed.", e);
		result = ExecutionResult::failed(FailureKind::INFRASTRUCTURE, INFRASTRUCTURE_ERROR_MESSAGE);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(lang, request_id, log_fp, "Execution failed.", e);
		result = ExecutionResult::failed(FailureKind::INFRASTRUCTURE, INFRASTRUCTURE_ERROR_MESSAGE);
	}

	switch (result.kind) {
		case FailureKind::NONE:
			LOG_INFO(lang, request_id, log_fp, "Execution succeeded. ", result);
			break;
		case FailureKind::BUILD_FAILURE:
		case FailureKind::RUN_FAILURE:
			LOG_INFO(lang, request_id, log_fp, "Execution failed. ", result);
			break;
		case FailureKind::TIMEOUT:
			LOG_WARNING(lang, request_id, log_fp, "Execution timed out after ", language_template.timeout.count(), " ms.");
			break;
		case FailureKind::INFRASTRUCTURE:
			LOG_FATAL(lang, request_id, log_fp, "Execution aborted by an infrastructure error.");
			break;
	}
	return result;
}
