////////////////////////////////////////////////////////////////////
// Process.cpp
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#include "Common.h"
#include "Process.h"
#include <sys/wait.h>

using namespace TOOLS;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

String Process::QuoteArgument(const String& arg)
{
	if (!arg.empty() && arg.find_first_not_of(_T("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=.,/:%")) == String::npos)
		return arg;
	String quoted(_T("'"));
	for (const TCHAR c: arg) {
		if (c == _T('\''))
			quoted += _T("'\\''");
		else
			quoted += c;
	}
	quoted += _T('\'');
	return quoted;
}

String Process::ComposeCommand(const String& program, const StringArr& args)
{
	String cmd(QuoteArgument(program));
	for (const String& arg: args)
		cmd += _T(' ') + QuoteArgument(arg);
	return cmd;
}

int Process::Execute(const String& program, const StringArr& args)
{
	const String cmd(ComposeCommand(program, args));
	DEBUG_EXTRA("Running: %s", cmd.c_str());
	std::cout.flush();
	const int status(std::system(cmd.c_str()));
	if (status == -1) {
		VERBOSE("error: can not run '%s'", program.c_str());
		return -1;
	}
	if (WIFEXITED(status))
		return WEXITSTATUS(status);
	if (WIFSIGNALED(status))
		return 128 + WTERMSIG(status);
	return -1;
}
/*----------------------------------------------------------------*/
