/*
 * united_resource.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SHARED_SRC_UNITED_RESOURCE_HPP_
#define SRC_SHARED_SRC_UNITED_RESOURCE_HPP_

#include <array>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief 枚举类，标识支持的语言。每种语言对应唯一的模板工作区与执行闸门
 */
enum class Language
{
	Rust = 0, TypeScript = 1
};

constexpr std::size_t language_count = 2;

constexpr std::array<Language, language_count> all_languages = { Language::Rust, Language::TypeScript };

constexpr std::size_t language_index(Language lang) noexcept
{
	return static_cast<std::size_t>(lang);
}

/*
 * 对于枚举中未定义的量不在 switch 语句的 default 分支处理, 而在函数末尾处理,
 * 这样未来加了新的枚举值而忘了加上描述时, 编译器会给出警告
 */
inline const char * language_name(Language lang)
{
	switch (lang) {
		case Language::Rust:
			return "rust";
		case Language::TypeScript:
			return "typescript";
	}
	throw std::invalid_argument("Undefined language enumerate");
}

inline std::ostream& operator<<(std::ostream& out, Language lang)
{
	return out << language_name(lang);
}

/**
 * @brief 枚举类，标识一次执行失败的原因
 */
enum class FailureKind
{
	NONE = 0, ///< 执行成功
	BUILD_FAILURE = 1, ///< 编译失败
	RUN_FAILURE = 2, ///< 运行时错误
	TIMEOUT = 3, ///< 墙上时间超时
	INFRASTRUCTURE = 4, ///< 系统错误, 如写入源文件失败, 创建子进程失败
};

inline const char * getFailureKindName(FailureKind kind)
{
	switch (kind) {
		case FailureKind::NONE:
			return "NONE";
		case FailureKind::BUILD_FAILURE:
			return "BUILD_FAILURE";
		case FailureKind::RUN_FAILURE:
			return "RUN_FAILURE";
		case FailureKind::TIMEOUT:
			return "TIMEOUT";
		case FailureKind::INFRASTRUCTURE:
			return "INFRASTRUCTURE";
	}
	return "UNKNOWN FAILURE";
}

inline std::ostream& operator<<(std::ostream& out, FailureKind kind)
{
	return out << getFailureKindName(kind);
}

#endif /* SRC_SHARED_SRC_UNITED_RESOURCE_HPP_ */
