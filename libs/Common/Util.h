////////////////////////////////////////////////////////////////////
// Util.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_UTIL_H__
#define __TOOLS_UTIL_H__


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

class GENERAL_API Util
{
public:
	static String getAppName() {
		return getFileNameExt(getProcessPath());
	}
	static String getProcessPath();

	// generate a unique name based on the current date and time and process ID
	static String getUniqueName(TCHAR dash='-');

	// path manipulation
	static String& trimUnifySlash(String& path) {
		String::size_type start = 1;
		while ((start = path.find(PATH_SEPARATOR_STR PATH_SEPARATOR_STR, start)) != String::npos)
			path.erase(start, 1);
		return path;
	}
	static String& ensureUnifySlash(String& path) {
		std::replace(path.begin(), path.end(), REVERSE_PATH_SEPARATOR, PATH_SEPARATOR);
		return trimUnifySlash(path);
	}
	static String& ensureFolderSlash(String& path) {
		if (path.empty())
			return path;
		if (path.back() != PATH_SEPARATOR)
			path += PATH_SEPARATOR;
		return path;
	}
	static String& ensureValidPath(String& path) {
		return simplifyPath(ensureUnifySlash(strTrim(path, _T("\""))));
	}
	static String& ensureValidFolderPath(String& path) {
		return ensureFolderSlash(ensureValidPath(path));
	}
	// create the folders of the given file path (or folder path if it ends with a slash)
	static void ensureFolder(const String& path);

	static inline bool isFullPath(LPCTSTR path) {
		return path != NULL && path[0] == PATH_SEPARATOR;
	}
	static String getFullPath(const String& str);
	static String getCurrentFolder();

	// remove "." and ".." components from the path
	static String& simplifyPath(String& path);
	static String getSimplifiedPath(String path) {
		return simplifyPath(path);
	}

	static String getFilePath(const String& path) {
		const String::size_type i = path.rfind(PATH_SEPARATOR);
		return (i != String::npos) ? path.substr(0, i+1) : String();
	}
	static String getFileNameExt(const String& path) {
		const String::size_type i = path.rfind(PATH_SEPARATOR);
		return (i != String::npos) ? path.substr(i+1) : path;
	}
	static String getFileName(const String& path) {
		const String nameExt(getFileNameExt(path));
		const String::size_type j = nameExt.rfind(_T('.'));
		return (j != String::npos && j > 0) ? nameExt.substr(0, j) : nameExt;
	}
	static String getFileFullName(const String& path) {
		return getFilePath(path) + getFileName(path);
	}
	static String getFileExt(const String& path) {
		const String nameExt(getFileNameExt(path));
		const String::size_type i = nameExt.rfind(_T('.'));
		return (i != String::npos && i > 0) ? nameExt.substr(i) : String();
	}
	static String getLastDir(const String& path) {
		String folder(path);
		while (!folder.empty() && folder.back() == PATH_SEPARATOR)
			folder.pop_back();
		return getFileNameExt(folder);
	}

	static String& strTrim(String& str, const String& strTrim) {
		if (str.empty())
			return str;
		const String::size_type beg = str.find_first_not_of(strTrim);
		if (beg == String::npos) {
			str.clear();
			return str;
		}
		const String::size_type end = str.find_last_not_of(strTrim);
		str = str.substr(beg, end-beg+1);
		return str;
	}
	static void strSplit(const String& str, TCHAR delim, StringArr& values) {
		values.clear();
		std::istringstream f(str);
		String s;
		while (std::getline(f, s, delim))
			values.emplace_back(s);
	}

	static String formatBytes(int64_t aBytes);
	// format given time in milliseconds to a human readable string
	static String formatTime(int64_t sTime, uint32_t nAproximate = 0);

	static String CommandLineToString(size_t argc, LPCTSTR* argv) {
		String strCmdLine;
		for (size_t i=1; i<argc; ++i)
			strCmdLine += _T(" ") + String(argv[i]);
		return strCmdLine;
	}

	static void		LogBuild();
	static void		LogMemoryInfo();
};
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __TOOLS_UTIL_H__
