////////////////////////////////////////////////////////////////////
// Log.cpp
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#include "Common.h"
#include "Log.h"

using namespace TOOLS;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

/*-----------------------------------------------------------*
 * Log class implementation                                  *
 *-----------------------------------------------------------*/

/**
 * Constructor
 */
Log::Log()
	:
	m_bOpen(false),
	m_nNextClbk(0)
{
	ResetTypes();
}

void Log::Open()
{
	std::lock_guard<std::mutex> l(m_cs);
	m_bOpen = true;
}
void Log::Close()
{
	std::lock_guard<std::mutex> l(m_cs);
	m_bOpen = false;
	m_mapRecordClbk.clear();
}

Log::Idx Log::RegisterListener(ClbkRecordMsg clbk)
{
	std::lock_guard<std::mutex> l(m_cs);
	const Idx idx(m_nNextClbk++);
	m_mapRecordClbk.emplace(idx, clbk);
	return idx;
}
void Log::UnregisterListener(Idx idx)
{
	std::lock_guard<std::mutex> l(m_cs);
	m_mapRecordClbk.erase(idx);
}

// register a new type of log messages (LOGTYPE_SIZE chars)
Log::Idx Log::RegisterType(LPCTSTR lt)
{
	std::lock_guard<std::mutex> l(m_cs);
	String logType(lt);
	logType.resize(LOGTYPE_SIZE, _T(' '));
	m_arrLogTypes.emplace_back(logType);
	return (Idx)m_arrLogTypes.size()-1;
}

/**
 * Empty the array with registered log types
 */
void Log::ResetTypes()
{
	m_arrLogTypes.clear();
}

void Log::Write(LPCTSTR szFormat, ...)
{
	if (!m_bOpen)
		return;
	va_list args;
	va_start(args, szFormat);
	_Record(NO_ID, szFormat, args);
	va_end(args);
}
void Log::Write(Idx lt, LPCTSTR szFormat, ...)
{
	if (!m_bOpen)
		return;
	va_list args;
	va_start(args, szFormat);
	_Record(lt, szFormat, args);
	va_end(args);
}

/**
 * Write message to the log if this exists
 * -> IN: Idx - log type
 *        LPCTSTR - format message
 *        ...  - values
 */
void Log::_Record(Idx lt, LPCTSTR szFormat, va_list args)
{
	const String message(String::FormatStringSafe(szFormat, args));
	// format a message by adding the time and the type (auto adds new line)
	TCHAR szTime[80] = {0};
	#ifdef LOG_TIME
	const time_t t = time(NULL);
	struct tm tmp;
	localtime_r(&t, &tmp);
	strftime(szTime, 80, "%H:%M:%S", &tmp);
	#endif
	std::lock_guard<std::mutex> l(m_cs);
	if (m_mapRecordClbk.empty())
		return;
	const String logType(lt < m_arrLogTypes.size() ? m_arrLogTypes[lt] : String(DEFAULT_LOGTYPE));
	const String record(String::FormatString("%s [%s] %s" LINE_SEPARATOR_STR, szTime, logType.c_str(), message.c_str()));
	// signal listeners
	for (const auto& clbk: m_mapRecordClbk)
		clbk.second(record);
}

void Log::_Write(const String& message)
{
	// messages received by stream are never used as format strings
	Write(_T("%s"), message.c_str());
}
/*----------------------------------------------------------------*/


/*-----------------------------------------------------------*
 * LogFile class implementation                              *
 *-----------------------------------------------------------*/

/**
 * Constructor
 */
LogFile::LogFile()
	:
	m_nListener(NO_ID)
{
}

bool LogFile::Open(const String& logName)
{
	Close();
	Util::ensureFolder(logName);
	m_file.open(logName, std::ios::out | std::ios::trunc);
	if (!m_file.is_open())
		return false;
	m_nListener = GET_LOG().RegisterListener([this](const String& msg) { Record(msg); });
	return true;
}
void LogFile::Close()
{
	if (m_nListener == NO_ID)
		return;
	GET_LOG().UnregisterListener(m_nListener);
	m_nListener = NO_ID;
	m_file.close();
}

void LogFile::Record(const String& msg)
{
	if (!m_file.is_open())
		return;
	m_file << msg;
	m_file.flush();
}
/*----------------------------------------------------------------*/


/*-----------------------------------------------------------*
 * LogConsole class implementation                           *
 *-----------------------------------------------------------*/

/**
 * Constructor
 */
LogConsole::LogConsole()
	:
	m_nListener(NO_ID)
{
}

void LogConsole::Open()
{
	if (IsOpen())
		return;
	m_nListener = GET_LOG().RegisterListener([this](const String& msg) { Record(msg); });
}
void LogConsole::Close()
{
	if (!IsOpen())
		return;
	GET_LOG().UnregisterListener(m_nListener);
	m_nListener = NO_ID;
}

void LogConsole::Record(const String& msg)
{
	fputs(msg.c_str(), stdout);
	fflush(stdout);
}
/*----------------------------------------------------------------*/
