/*
 * SourceStager.cpp
 *
 *  Created on: 2026年10月19日
 */

#include "SourceStager.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace
{
	/**
	 * @brief 一个辅助类, 用于确保将打开的文件描述符关闭
	 */
	struct fd_guard
	{
			int & fd;

			fd_guard(int & fd) noexcept :
					fd(fd)
			{
			}

			~fd_guard() noexcept
			{
				if (fd == -1) {
					return;
				}
				::close(fd);
			}
	};

} /* namespace */

void stage_source_code(const LanguageTemplate & language_template, const std::string & code)
{
	const boost::filesystem::path entry_file_path = language_template.entry_file_path();

	{
		boost::system::error_code ec;
		boost::filesystem::create_directories(entry_file_path.parent_path(), ec);
		if (ec) {
			throw StageFailedException("create directory of", entry_file_path, ec.value());
		}
	}

	int fd = ::open(entry_file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
	fd_guard guard(fd);
	if (fd == -1) {
		throw StageFailedException("open", entry_file_path, errno);
	}

	const char * p = code.data();
	std::size_t remain = code.size();
	while (remain != 0) {
		ssize_t written = ::write(fd, p, remain);
		if (written == -1) {
			if (errno == EINTR) {
				continue;
			}
			throw StageFailedException("write", entry_file_path, errno);
		}
		p += written;
		remain -= static_cast<std::size_t>(written);
	}

	if (::fsync(fd) != 0) {
		throw StageFailedException("fsync", entry_file_path, errno);
	}

	int closing = fd;
	fd = -1;
	if (::close(closing) != 0) {
		throw StageFailedException("close", entry_file_path, errno);
	}
}
