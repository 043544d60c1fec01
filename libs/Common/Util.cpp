////////////////////////////////////////////////////////////////////
// Util.cpp
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#include "Common.h"
#include "Util.h"
#include <sys/utsname.h>
#include <sys/resource.h>

using namespace TOOLS;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

String Util::getProcessPath()
{
	TCHAR buf[4096];
	const ssize_t len(::readlink("/proc/self/exe", buf, sizeof(buf)-1));
	if (len <= 0)
		return String();
	return String(buf, (size_t)len);
}

String Util::getUniqueName(TCHAR dash)
{
	TCHAR szDate[80], szTime[80];
	const time_t t = time(NULL);
	struct tm tmp;
	localtime_r(&t, &tmp);
	strftime(szDate, 80, "%y%m%d", &tmp);
	strftime(szTime, 80, "%H%M%S", &tmp);
	const uint32_t ID(((uint32_t)::getpid() + (uint32_t)std::random_device()())&0x00FFFFFF);
	if (dash)
		return String::FormatString("%s%c%s%c%06X", szDate, dash, szTime, dash, ID);
	return String::FormatString("%s%s%06X", szDate, szTime, ID);
}

void Util::ensureFolder(const String& path)
{
	const String folder(getFilePath(path));
	if (folder.empty())
		return;
	std::error_code ec;
	std::filesystem::create_directories(static_cast<const std::string&>(folder), ec);
}

String Util::getFullPath(const String& str)
{
	if (isFullPath(str.c_str()))
		return str;
	return getSimplifiedPath(getCurrentFolder() + str);
}

String Util::getCurrentFolder()
{
	std::error_code ec;
	String folder(std::filesystem::current_path(ec).string());
	return ensureFolderSlash(folder);
}

String& Util::simplifyPath(String& path)
{
	if (path.empty())
		return path;
	const bool bFull(path[0] == PATH_SEPARATOR);
	const bool bFolder(path.back() == PATH_SEPARATOR);
	StringArr components, simplified;
	strSplit(path, PATH_SEPARATOR, components);
	for (const String& c: components) {
		if (c.empty() || c == _T("."))
			continue;
		if (c == _T("..") && !simplified.empty() && simplified.back() != _T("..")) {
			simplified.pop_back();
			continue;
		}
		if (c == _T("..") && bFull)
			continue;
		simplified.emplace_back(c);
	}
	String result(bFull ? PATH_SEPARATOR_STR : _T(""));
	FOREACH(i, simplified) {
		if (i)
			result += PATH_SEPARATOR;
		result += simplified[i];
	}
	if (bFolder && !simplified.empty())
		result += PATH_SEPARATOR;
	if (result.empty() && bFolder)
		result = _T("./");
	path = result;
	return path;
}

String Util::formatBytes(int64_t aBytes)
{
	if (aBytes < (int64_t)1024)
		return String::FormatString("%dB", (uint32_t)aBytes&0xffffffff);
	if (aBytes < (int64_t)1024*1024)
		return String::FormatString("%.02fKB", (double)aBytes/1024.0);
	if (aBytes < (int64_t)1024*1024*1024)
		return String::FormatString("%.02fMB", (double)aBytes/(1024.0*1024.0));
	return String::FormatString("%.02fGB", (double)aBytes/(1024.0*1024.0*1024.0));
}

String Util::formatTime(int64_t sTime, uint32_t nAproximate)
{
	String str;
	uint32_t nrNumbers = 0;
	uint32_t rez = (uint32_t)(sTime / ((int64_t)24*3600*1000));
	if (rez) {
		++nrNumbers;
		str += String::FormatString("%ud", rez);
	}
	if (nAproximate > 3 && nrNumbers > 0)
		return str;
	rez = (uint32_t)((sTime%((int64_t)24*3600*1000)) / (3600*1000));
	if (rez) {
		++nrNumbers;
		str += String::FormatString("%uh", rez);
	}
	if (nAproximate > 2 && nrNumbers > 0)
		return str;
	rez = (uint32_t)((sTime%((int64_t)3600*1000)) / (60*1000));
	if (rez) {
		++nrNumbers;
		str += String::FormatString("%um", rez);
	}
	if (nAproximate > 1 && nrNumbers > 0)
		return str;
	rez = (uint32_t)((sTime%((int64_t)60*1000)) / (1*1000));
	if (rez) {
		++nrNumbers;
		str += String::FormatString("%us", rez);
	}
	if (nAproximate > 0 && nrNumbers > 0)
		return str;
	rez = (uint32_t)(sTime%((int64_t)1*1000));
	if (rez || !nrNumbers)
		str += String::FormatString("%ums", rez);
	return str;
}

// print details about the current build and PC
void Util::LogBuild()
{
	#if TD_VERBOSE == TD_VERBOSE_OFF
	LOG(_T("Build date: ") __DATE__);
	#else
	LOG(_T("Build date: ") __DATE__ _T(", ") __TIME__);
	#endif
	LOG(_T("OpenCV %s, Eigen %d.%d.%d"), CV_VERSION, EIGEN_WORLD_VERSION, EIGEN_MAJOR_VERSION, EIGEN_MINOR_VERSION);
	struct utsname name;
	if (uname(&name) == 0)
		LOG(_T("OS: %s %s (%s)"), name.sysname, name.release, name.machine);
}

// print information about the memory usage
void Util::LogMemoryInfo()
{
	struct rusage usage;
	if (getrusage(RUSAGE_SELF, &usage) != 0)
		return;
	LOG(_T("MEMORYINFO: {"));
	LOG(_T("\tPeakWorkingSetSize %s"), formatBytes((int64_t)usage.ru_maxrss*1024).c_str());
	LOG(_T("} ENDINFO"));
}
/*----------------------------------------------------------------*/
