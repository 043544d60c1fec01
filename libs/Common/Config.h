////////////////////////////////////////////////////////////////////
// Config.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_CONFIG_H__
#define __TOOLS_CONFIG_H__

// Configure everything that needs to be globally known


// D E F I N E S ///////////////////////////////////////////////////

#if !defined(_DEBUG) && !defined(NDEBUG)
#define _DEBUG
#endif

//----------------------------------------------------------------------
// symbol visibility is not used on the supported systems
//----------------------------------------------------------------------
#define GENERAL_API

#if !defined(_DEBUG) && !defined(_PROFILE)
#define _RELEASE // exclude code useful only for debug
#endif


// character type helpers
#ifndef _T
#define _T(s) s
#endif
typedef char TCHAR;
typedef const char* LPCTSTR;
#define _vsntprintf vsnprintf

#define LINE_SEPARATOR_STR _T("\n")
#define PATH_SEPARATOR _T('/')
#define PATH_SEPARATOR_STR _T("/")
#define REVERSE_PATH_SEPARATOR _T('\\')


// debug helpers
#ifdef _DEBUG
#include <assert.h>
#define ASSERT(exp)	assert(exp)
#else
#define ASSERT(exp)
#endif
#define ASSERTM(exp, msg) ASSERT(exp)


// singleton helper
#define DECLARE_SINGLETON(SClass) \
	protected: SClass(); SClass(const SClass&); \
	public: static inline SClass& GetInstance() { static SClass instance; return instance; }


// iterate helpers
#define FOREACH(var, arr) for (size_t var=0, var##Size=(arr).size(); var<var##Size; ++var)
#define RFOREACH(var, arr) for (size_t var=(arr).size(); var-->0; )

#define NO_ID ((uint32_t)-1)

#define SQUARE(a) ((a)*(a))
#define MINF(a,b) ((a) < (b) ? (a) : (b))
#define MAXF(a,b) ((a) > (b) ? (a) : (b))
#define CLAMP(v,l,h) ((v) < (l) ? (l) : ((v) > (h) ? (h) : (v)))
#define ISINSIDE(v,l,h) ((v) >= (l) && (v) < (h))

#endif // __TOOLS_CONFIG_H__
