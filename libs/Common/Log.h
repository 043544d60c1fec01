////////////////////////////////////////////////////////////////////
// Log.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_LOG_H__
#define __TOOLS_LOG_H__


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////

#define LOG_TIME // add time info for every log
#define LOG_THREAD // make log multi-thread safe
#define LOGTYPE_SIZE	8
#define DEFAULT_LOGTYPE	_T("App     ")


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

class GENERAL_API Log
{
	DECLARE_SINGLETON(Log);

public:
	typedef uint32_t Idx;
	typedef std::function<void (const String&)> ClbkRecordMsg;
	typedef std::map<Idx, ClbkRecordMsg> ClbkRecordMsgMap;

public:
	// log methods
	void		Open();
	void		Close();
	bool		IsOpen() const { return m_bOpen; }
	Idx			RegisterListener(ClbkRecordMsg);
	void		UnregisterListener(Idx);
	Idx 		RegisterType(LPCTSTR);
	void		ResetTypes();
	void		Write(LPCTSTR, ...);
	void		Write(Idx, LPCTSTR, ...);

	// stream support: the message is recorded when a new line is received
	template<class T> inline Log& operator<<(const T& val) {
		std::lock_guard<std::mutex> l(m_csStream);
		m_stream << val;
		const std::string line(m_stream.str());
		if (!line.empty() && *(line.end()-1) == _T('\n')) {
			m_stream.str(_T(""));
			_Write(line.substr(0, line.size()-1));
		}
		return *this;
	}
	// the type of std::cout
	typedef std::basic_ostream<char, std::char_traits<char> > CoutType;
	// the function signature of std::endl
	typedef CoutType& (*StandardEndLine)(CoutType&);
	// define an operator<< to take in std::endl
	inline Log& operator<<(StandardEndLine) {
		std::lock_guard<std::mutex> l(m_csStream);
		const std::string line(m_stream.str());
		m_stream.str(_T(""));
		_Write(line);
		return *this;
	}

protected:
	// write a message of a certain type to the log
	void		_Record(Idx, LPCTSTR, va_list);
	void		_Write(const String&);

protected:
	bool				m_bOpen;		// messages are recorded only while the log is open
	ClbkRecordMsgMap	m_mapRecordClbk;// all registered listeners
	Idx					m_nNextClbk;	// ID given to the next registered listener
	StringArr			m_arrLogTypes;	// all the registered log types
	std::mutex			m_cs;			// mutex used to ensure multi-thread safety
	std::ostringstream	m_stream;		// stream object used to handle one log with operator <<
	std::mutex			m_csStream;		// mutex used to ensure multi-thread safety for accessing m_stream
};
#define GET_LOG()			TOOLS::Log::GetInstance()
#define OPEN_LOG()			GET_LOG().Open()
#define CLOSE_LOG()			GET_LOG().Close()
#define REGISTER_LOG(lt)	GET_LOG().RegisterType(lt)
#define LOG					GET_LOG().Write
#define SLOG(msg)			GET_LOG() << msg
/*----------------------------------------------------------------*/


class GENERAL_API LogFile
{
	DECLARE_SINGLETON(LogFile);

public:
	~LogFile() { Close(); }

	// log methods
	bool			Open(const String&);
	void			Close();
	void			Record(const String&);

protected:
	std::ofstream	m_file;			// the log file
	Log::Idx		m_nListener;	// the ID of the registered listener
};
#define GET_LOGFILE()		TOOLS::LogFile::GetInstance()
#define OPEN_LOGFILE(log)	GET_LOGFILE().Open(log)
#define CLOSE_LOGFILE()		GET_LOGFILE().Close()
/*----------------------------------------------------------------*/


class GENERAL_API LogConsole
{
	DECLARE_SINGLETON(LogConsole);

public:
	~LogConsole() { Close(); }

	bool			IsOpen() const { return m_nListener != NO_ID; }

	// log methods
	void			Open();
	void			Close();
	void			Record(const String&);

protected:
	Log::Idx		m_nListener;	// the ID of the registered listener
};
#define GET_LOGCONSOLE()	TOOLS::LogConsole::GetInstance()
#define OPEN_LOGCONSOLE()	GET_LOGCONSOLE().Open()
#define CLOSE_LOGCONSOLE()	GET_LOGCONSOLE().Close()
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __TOOLS_LOG_H__
