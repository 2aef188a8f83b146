/*
 * Result.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "Result.hpp"

ExecutionResult ExecutionResult::succeeded(const std::string & output)
{
	ExecutionResult result;
	result.success = true;
	result.output = output;
	result.kind = FailureKind::NONE;
	return result;
}

ExecutionResult ExecutionResult::failed(FailureKind kind, const std::string & error)
{
	ExecutionResult result;
	result.success = false;
	result.error = error;
	result.kind = kind;
	return result;
}

nlohmann::json ExecutionResult::to_json() const
{
	nlohmann::json json_obj;
	json_obj["success"] = success;
	json_obj["output"] = output;
	if (error.has_value()) {
		json_obj["error"] = error.value();
	} else {
		json_obj["error"] = nullptr;
	}
	return json_obj;
}

std::ostream& operator<<(std::ostream& out, const ExecutionResult & src)
{
	return out << "success: " << std::boolalpha << src.success << std::noboolalpha
				<< " kind: " << src.kind
				<< " output length: " << src.output.size()
				<< " error length: " << (src.error.has_value() ? src.error.value().size() : 0);
}
