////////////////////////////////////////////////////////////////////
// Process.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_PROCESS_H__
#define __TOOLS_PROCESS_H__


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

// runs external programs and waits for them to finish
class GENERAL_API Process
{
public:
	// quote the argument so that the shell passes it unchanged
	static String QuoteArgument(const String& arg);
	static String ComposeCommand(const String& program, const StringArr& args);

	// run the program with the given arguments and block until it exits;
	// returns the exit status of the program, or -1 if it could not be run
	static int Execute(const String& program, const StringArr& args);
};
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __TOOLS_PROCESS_H__
