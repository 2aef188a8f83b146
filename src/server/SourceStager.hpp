/*
 * SourceStager.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_SOURCESTAGER_HPP_
#define SRC_SERVER_SOURCESTAGER_HPP_

#include <cstring>
#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>

#include "LanguageTemplate.hpp"

class StageFailedException: public std::runtime_error
{
	private:
		static std::string make_exception_description(const char * operation, const boost::filesystem::path & file_path, int err)
		{
			return std::string(operation) + " [" + file_path.string() + "] failed: " + std::strerror(err);
		}

	public:
		const boost::filesystem::path file_path;

		StageFailedException(const char * operation, const boost::filesystem::path & file_path, int err) :
				std::runtime_error(make_exception_description(operation, file_path, err)), file_path(file_path)
		{
		}
};

/**
 * @brief 将提交的代码原样写入模板的入口源文件, 覆盖原有内容。
 * 返回前数据已经 fsync 到磁盘, 之后启动的编译过程一定读到新内容。
 * 不做任何语法检查。
 * @throw StageFailedException 打开, 写入或同步失败
 * @warning 调用者必须持有该语言的执行闸门
 */
void stage_source_code(const LanguageTemplate & language_template, const std::string & code);

#endif /* SRC_SERVER_SOURCESTAGER_HPP_ */
