////////////////////////////////////////////////////////////////////
// Timer.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef  __TOOLS_TIMER_H__
#define  __TOOLS_TIMER_H__


// I N C L U D E S /////////////////////////////////////////////////

#include <chrono>


// D E F I N E S ///////////////////////////////////////////////////


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

class GENERAL_API Timer
{
public:
	typedef int64_t SysType;
	typedef float Type;

public:
	Timer() { Reset(); }

	inline void		Reset()					{ m_nStartTime = m_nCrntTime = GetSysTime(); }
	inline void		Update()				{ m_nCrntTime = GetSysTime(); }
	inline Type		GetElapsed() const		{ return SysTime2Time(m_nCrntTime - m_nStartTime); }

private:
	SysType		m_nStartTime;			// time when the timer was started
	SysType		m_nCrntTime;			// time of the last update

public:
	// get current time in system units (microseconds)
	static inline SysType GetSysTime() {
		return std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::steady_clock::now().time_since_epoch()).count();
	}
	// get milliseconds scaling factor for time
	static inline Type GetTimeFactor() { return Type(0.001); }
	// get current time in milliseconds
	static inline Type GetTimeToMilliseconds() { return GetTimeFactor() * (Type)GetSysTime(); }
	// get current time in seconds
	static inline Type GetTimeToSeconds() { return GetTimeToMilliseconds() / Type(1000); }
	// convert given time to milliseconds
	static inline Type SysTime2Time(SysType t) { return GetTimeFactor() * (Type)t; }
	// convert given time to seconds
	static inline Type SysTime2TimeSec(SysType t) { return SysTime2Time(t) / Type(1000); }
};
/*----------------------------------------------------------------*/


#define TIMER_START()		TOOLS::Timer::SysType timerStart = TOOLS::Timer::GetSysTime()
#define TIMER_UPDATE()		timerStart = TOOLS::Timer::GetSysTime()
#define TIMER_GET()			TOOLS::Timer::SysTime2TimeSec(TOOLS::Timer::GetSysTime()-timerStart)
#define TIMER_GET_INT()		((int64_t)TOOLS::Timer::SysTime2Time(TOOLS::Timer::GetSysTime()-timerStart))
#define TIMER_GET_FORMAT()	TOOLS::Util::formatTime(TIMER_GET_INT())
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __TOOLS_TIMER_H__
