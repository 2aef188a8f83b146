/*
 * boost_format_suffix.hpp
 *
 *  Created on: 2026年10月19日
 */

#ifndef SRC_SHARED_SRC_BOOST_FORMAT_SUFFIX_HPP_
#define SRC_SHARED_SRC_BOOST_FORMAT_SUFFIX_HPP_

#include <cstddef>
#include <string>

#include <boost/format.hpp>

/**
 * @brief 格式串字面量。"...%d..."_fmt(args...) 直接得到格式化后的 std::string
 * @throw boost::io::format_error 参数个数与格式串不符
 */
class format_literal
{
	private:
		const char * templ;

	public:
		constexpr explicit format_literal(const char * templ) noexcept :
				templ(templ)
		{
		}

		template <typename ... Args>
		std::string operator()(const Args & ... args) const
		{
			boost::format fmt(templ);
			return (fmt % ... % args).str();
		}
};

constexpr format_literal operator""_fmt(const char * s, std::size_t) noexcept
{
	return format_literal(s);
}

#endif /* SRC_SHARED_SRC_BOOST_FORMAT_SUFFIX_HPP_ */
