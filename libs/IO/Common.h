////////////////////////////////////////////////////////////////////
// Common.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __IO_COMMON_H__
#define __IO_COMMON_H__


// I N C L U D E S /////////////////////////////////////////////////

#include "../Common/Common.h"

#ifndef IO_API
#define IO_API GENERAL_API
#endif

#include "Endian.h"
#include "NPY.h"
/*----------------------------------------------------------------*/

#endif // __IO_COMMON_H__
