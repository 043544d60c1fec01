////////////////////////////////////////////////////////////////////
// Common.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_COMMON_H__
#define __TOOLS_COMMON_H__


// D E F I N E S ///////////////////////////////////////////////////

#include "Config.h"

// macros controlling the verbosity
#define TD_VERBOSE_OFF		0
#define TD_VERBOSE_ON		1
#define TD_VERBOSE_DEBUG	2
#ifndef TD_VERBOSE
#ifdef _RELEASE
#define TD_VERBOSE			TD_VERBOSE_ON
#else
#define TD_VERBOSE			TD_VERBOSE_DEBUG
#endif
#endif

#if TD_VERBOSE == TD_VERBOSE_OFF
#define VERBOSE LOG
#define DEBUG_LEVEL(n,...)
#else
#ifndef VERBOSITY_LEVEL
namespace TOOLS { extern int g_nVerbosityLevel; }
#define VERBOSITY_LEVEL TOOLS::g_nVerbosityLevel
#endif
#define VERBOSE LOG
#define DEBUG_LEVEL(n,...)	{ if (n < VERBOSITY_LEVEL) VERBOSE(__VA_ARGS__); }
#endif
#define DEBUG(...)			DEBUG_LEVEL(0, __VA_ARGS__)
#define DEBUG_EXTRA(...)	DEBUG_LEVEL(1, __VA_ARGS__)
#define DEBUG_ULTIMATE(...)	DEBUG_LEVEL(2, __VA_ARGS__)


// macros that simplify timing tasks
#define TD_TIMER_OFF		0
#define TD_TIMER_ON			1
#ifndef TD_TIMER
#define TD_TIMER			TD_TIMER_ON
#endif

#if TD_TIMER == TD_TIMER_OFF
#define TD_TIMER_START()
#define TD_TIMER_UPDATE()
#define TD_TIMER_GET() 0
#define TD_TIMER_GET_INT() 0
#define TD_TIMER_GET_FMT() TOOLS::String()
#define TD_TIMER_STARTD()
#define TD_TIMER_UPDATED()
#endif
#if TD_TIMER == TD_TIMER_ON
#define TD_TIMER_START()	TIMER_START()
#define TD_TIMER_UPDATE()	TIMER_UPDATE()
#define TD_TIMER_GET()		TIMER_GET()
#define TD_TIMER_GET_INT()	TIMER_GET_INT()
#define TD_TIMER_GET_FMT()	TIMER_GET_FORMAT()
#if TD_VERBOSE == TD_VERBOSE_OFF
#define TD_TIMER_STARTD()
#define TD_TIMER_UPDATED()
#else
#define TD_TIMER_STARTD()	TIMER_START()
#define TD_TIMER_UPDATED()	TIMER_UPDATE()
#endif
#endif


// macros redirecting standard streams to the log
#define LOG_OUT() GET_LOG() //or std::cout
#define LOG_ERR() GET_LOG() //or std::cerr


// macros simplifying the task of composing file paths;
// WORKING_FOLDER and WORKING_FOLDER_FULL must be defined as strings
// containing the relative/full path to the working folder
#ifndef WORKING_FOLDER
namespace TOOLS {
class String;
extern String g_strWorkingFolder; // empty by default (current folder)
extern String g_strWorkingFolderFull; // full path to current folder
}
#define WORKING_FOLDER		TOOLS::g_strWorkingFolder // empty by default (current folder)
#define WORKING_FOLDER_FULL	TOOLS::g_strWorkingFolderFull // full path to current folder
#endif
#define INIT_WORKING_FOLDER	{TOOLS::Util::ensureValidFolderPath(WORKING_FOLDER); WORKING_FOLDER_FULL = TOOLS::Util::getFullPath(WORKING_FOLDER);} // initialize working folders
#define MAKE_PATH(str)		TOOLS::Util::getSimplifiedPath(WORKING_FOLDER+(str)) // add working directory to the given file name
#define MAKE_PATH_SAFE(str)	(TOOLS::Util::isFullPath((str).c_str()) ? TOOLS::String(str) : MAKE_PATH(str)) // add working directory to the given file name only if not full path already
#define MAKE_PATH_FULL(p,s) (TOOLS::Util::isFullPath((s).c_str()) ? TOOLS::String(s) : TOOLS::Util::getSimplifiedPath((p)+(s))) // add the given path to the given file name


// I N C L U D E S /////////////////////////////////////////////////

#include "Types.h"
#include "Log.h"
#include "Timer.h"
#include "Util.h"
#include "File.h"
#include "Process.h"

#endif // __TOOLS_COMMON_H__
