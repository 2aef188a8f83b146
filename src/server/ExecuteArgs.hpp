/*
 * ExecuteArgs.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SERVER_EXECUTEARGS_HPP_
#define SRC_SERVER_EXECUTEARGS_HPP_

#include <vector>
#include <string>
#include <memory>
#include <iostream>

/**
 * @brief 执行 exec 族的命令行参数与环境表。exec 族函数要求参数表末尾以一个空指针结尾,
 * 本类将其封装起来, 并保证 getArgs 返回的指针数组在本对象存活期间有效。
 */
class ExecuteArgs
{
	private:
		std::vector<std::string> args;

	public:
		ExecuteArgs();

		template<typename ForwardIterator>
		ExecuteArgs(ForwardIterator begin, ForwardIterator end) :
				args(begin, end)
		{
		}

		ExecuteArgs(std::initializer_list<std::string> list);

		explicit ExecuteArgs(std::vector<std::string> list);

		ExecuteArgs& operator=(std::initializer_list<std::string> list);

		void push_back(const std::string & arg);

		bool empty() const noexcept
		{
			return args.empty();
		}

		std::size_t size() const noexcept
		{
			return args.size();
		}

		const std::string & operator[](std::size_t i) const
		{
			return args[i];
		}

		const std::vector<std::string> & list() const noexcept
		{
			return args;
		}

		/**
		 * @brief 返回命令行参数列表
		 * @return 指向 char * 数组的指针，符合 Unix 的 exec 族函数的参数规范
		 */
		std::unique_ptr<char*[]> getArgs() const;

		friend std::ostream& operator<<(std::ostream& out, const ExecuteArgs & src);
};

#endif /* SRC_SERVER_EXECUTEARGS_HPP_ */
