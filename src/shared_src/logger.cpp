/*
 * logger.cpp
 *
 *  Created on: 2026年10月19日
 */

#include <time.h>

#include "logger.hpp"

const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_FATAL>::outstream(costream_ns::LIGHT_RED);
const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_INFO>::outstream(costream_ns::LAKE_BLUE);
const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_WARNING>::outstream(costream_ns::LIGHT_YELLOW);
const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_DEBUG>::outstream(costream_ns::LIGHT_PURPLE);
const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_PROFILE>::outstream(costream_ns::LIGHT_PURPLE);

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept
{
	char datetime[100];
	struct tm local_time;

	localtime_r(&time, &local_time);
	strftime(datetime, 99, "%Y-%m-%d %H:%M:%S", &local_time);

	return datetime;
}

std::mutex & ts_coderun::log::log_mutex() noexcept
{
	static std::mutex mtx;
	return mtx;
}
