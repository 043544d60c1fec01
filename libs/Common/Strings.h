////////////////////////////////////////////////////////////////////
// Strings.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_STRING_H__
#define __TOOLS_STRING_H__


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

/// String class: enhanced std::string
class GENERAL_API String : public std::string
{
public:
	typedef std::string Base;

public:
	inline String() {}
	inline String(LPCTSTR sz) : Base(sz) {}
	inline String(const Base& str) : Base(str) {}
	inline String(Base&& str) : Base(std::move(str)) {}
	inline String(size_t n, value_type v) : Base(n, v) {}
	inline String(LPCTSTR sz, size_t count) : Base(sz, count) {}

	inline void Release() { return clear(); }
	inline bool IsEmpty() const { return empty(); }

	String& Format(LPCTSTR szFormat, ...) {
		va_list args;
		va_start(args, szFormat);
		*this = FormatStringSafe(szFormat, args);
		va_end(args);
		return *this;
	}

	String ToLower() const {
		String str(*this);
		std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return (char)::tolower(c); });
		return str;
	}
	String ToUpper() const {
		String str(*this);
		std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return (char)::toupper(c); });
		return str;
	}

	static String FormatString(LPCTSTR szFormat, ...) {
		va_list args;
		va_start(args, szFormat);
		const String str(FormatStringSafe(szFormat, args));
		va_end(args);
		return str;
	}
	static String FormatStringSafe(LPCTSTR szFormat, va_list args) {
		va_list argsCopy;
		va_copy(argsCopy, args);
		const int len(_vsntprintf(NULL, 0, szFormat, argsCopy));
		va_end(argsCopy);
		if (len <= 0)
			return String();
		std::vector<TCHAR> buffer((size_t)len+1);
		_vsntprintf(buffer.data(), buffer.size(), szFormat, args);
		return String(buffer.data(), (size_t)len);
	}

	// convert values to and from string,
	// with the maximum precision needed to restore floating point values exactly
	template <typename T>
	static String ToString(const T& val) {
		std::ostringstream os;
		os << std::setprecision(std::numeric_limits<double>::max_digits10) << val;
		return os.str();
	}
	template <typename T>
	static bool FromString(const String& str, T& val) {
		std::istringstream is(str);
		is >> val;
		return !is.fail();
	}
};
/*----------------------------------------------------------------*/

} // namespace TOOLS


namespace std {
// hash function for the String type, same as std::string
template <>
struct hash<TOOLS::String> {
	size_t operator()(const TOOLS::String& str) const {
		return hash<std::string>()(str);
	}
};
} // namespace std

#endif // __TOOLS_STRING_H__
