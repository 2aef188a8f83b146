/*
 * logger.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SHARED_SRC_LOGGER_HPP_
#define SRC_SHARED_SRC_LOGGER_HPP_

#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <typeinfo>
#include <boost/format.hpp>
#include <boost/current_function.hpp>
#include <kerbal/utility/costream.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>
#include "united_resource.hpp"

namespace costream_ns = kerbal::utility::costream;

/**
 * @addtogroup log_level
 * @{
 */
enum class LogLevel
{
	LEVEL_FATAL = 0, LEVEL_WARNING = 1, LEVEL_INFO = 2, LEVEL_DEBUG = 3, LEVEL_PROFILE = 4
};

/**
 * 日志告警级别萃取器
 * @tparam level 日志告警级别
 */
template <LogLevel level>
struct Log_level_traits;

template <>
struct Log_level_traits<LogLevel::LEVEL_FATAL>
{
		static constexpr const char * str = "FATAL";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_INFO>
{
		static constexpr const char * str = "INFO";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_WARNING>
{
		static constexpr const char * str = "WARNING";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_DEBUG>
{
		static constexpr const char * str = "DEBUG";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_PROFILE>
{
		static constexpr const char * str = "PROF";
		static const costream_ns::costream<std::cout> outstream;
};

/**
 * @}
 */

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept;

template <typename Tp>
void multi_args_write(std::ostream & log_fp, Tp && arg0)
{
	log_fp << arg0;
}

template <typename Tp, typename ...Up>
void multi_args_write(std::ostream & log_fp, Tp && arg0, Up&& ...args)
{
	log_fp << arg0;
	multi_args_write(log_fp, std::forward<Up>(args)...);
}

namespace ts_coderun
{
	namespace log
	{
		/*           datetime logLevelStr scope request_id srcFileName line */
		constexpr const char * templ = "[%s] %s %s:%lu [%s:%d]";

		/// 多个 HTTP 工作线程共享同一日志文件, 写入需互斥
		std::mutex & log_mutex() noexcept;

		template <size_t N>
		constexpr const char* cptr_cast(const char (&src)[N]) noexcept
		{
			return src;
		}

		template <typename Type>
		Type && cptr_cast(Type && src) noexcept
		{
			return std::forward<Type>(src);
		}

		template <LogLevel level, typename ...T>
		void __log_write(const char * scope, unsigned long request_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
		{
			try {
				const time_t now = time(NULL);
				const std::string datetime = get_ymd_hms_in_local_time_zone(now);

				std::ostringstream buffer;

				multi_args_write(buffer, boost::format(log::templ) % datetime % (const char *) Log_level_traits<level>::str % scope % request_id % source_filename % line, std::forward<T>(args)...);

				std::lock_guard<std::mutex> lck(log_mutex());

				Log_level_traits<level>::outstream << buffer.str() << std::endl;

				if (!log_file) {
					std::cerr << "log file is not open!" << std::endl;
					return;
				}

				log_file << buffer.str() << std::endl;

				if (log_file.fail()) { //http://www.cplusplus.com/reference/ios/ios/fail/
					std::cerr << "write error!" << std::endl;
					log_file.clear();
					return;
				}
			} catch (const std::exception & e) {
				std::cerr << "log write failed: " << e.what() << std::endl;
			}
		}

	} /* namespace log */

} /* namespace ts_coderun */

template <LogLevel level, typename ...T>
void log_write(const char * scope, unsigned long request_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
{
	ts_coderun::log::__log_write<level>(scope, request_id, source_filename, line, log_file, ts_coderun::log::cptr_cast(std::forward<T>(args))...);
}

template <LogLevel level, typename ...T>
void log_write(Language lang, unsigned long request_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
{
	ts_coderun::log::__log_write<level>(language_name(lang), request_id, source_filename, line, log_file, ts_coderun::log::cptr_cast(std::forward<T>(args))...);
}

#ifdef LOG_DEBUG
#	undef LOG_DEBUG
#endif
#ifdef DEBUG
#	define LOG_DEBUG(scope, request_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_DEBUG>(scope, request_id, __FILE__, __LINE__, log_fp, ##x)
#else
#	define LOG_DEBUG(scope, request_id, log_fp, x...)
#endif

#ifdef LOG_INFO
#	undef LOG_INFO
#endif
#define LOG_INFO(scope, request_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_INFO>(scope, request_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_WARNING
#	undef LOG_WARNING
#endif
#define LOG_WARNING(scope, request_id, log_fp, x...)	 \
	log_write<LogLevel::LEVEL_WARNING>(scope, request_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_FATAL
#	undef LOG_FATAL
#endif
#define LOG_FATAL(scope, request_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_FATAL>(scope, request_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_PROFILE
#	undef LOG_PROFILE
#	undef PROFILE_HEAD
#	undef PROFILE_TAIL
#endif
#ifdef PROFILE
#	define LOG_PROFILE(scope, request_id, log_fp, args...) \
		log_write<LogLevel::LEVEL_PROFILE>(scope, request_id, __FILE__, __LINE__, log_fp, ##args)
#	define PROFILE_HEAD \
		auto __profile_start = std::chrono::steady_clock::now();
#	define PROFILE_TAIL(scope, request_id, log_fp, args...) \
		LOG_PROFILE(scope, request_id, log_fp, BOOST_CURRENT_FUNCTION, ": consume: ", \
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - __profile_start).count(), " ms ", ##args);
#else
#	define LOG_PROFILE(scope, request_id, log_fp, args...)
#	define PROFILE_HEAD
#	define PROFILE_TAIL(scope, request_id, log_fp, args...)
#endif

#ifdef EXCEPT_WARNING
#	undef EXCEPT_WARNING
#endif
#define EXCEPT_WARNING(scope, request_id, log_fp, events, exception, x...)	LOG_WARNING(scope, request_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)

#ifdef EXCEPT_FATAL
#	undef EXCEPT_FATAL
#endif
#define EXCEPT_FATAL(scope, request_id, log_fp, events, exception, x...)	    LOG_FATAL(scope, request_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)

#endif /* SRC_SHARED_SRC_LOGGER_HPP_ */
