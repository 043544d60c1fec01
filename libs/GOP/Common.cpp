/*
* Common.cpp
*
* Copyright (c) 2014-2022 SEACAVE
*
* Author(s):
*
*      cDc <cdc.seacave@gmail.com>
*
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU Affero General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU Affero General Public License for more details.
*
* You should have received a copy of the GNU Affero General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*
*
* Additional Terms:
*
*      You are required to preserve legal notices and author attributions in
*      that material or in the Appropriate Legal Notices displayed by works
*      containing it.
*/

#include "Common.h"

using namespace GOP;

void GOP::Initialize(LPCTSTR appname) {
	DEBUG_EXTRA("Initializing %s", appname);
}

void GOP::Finalize() {
	#if TD_VERBOSE != TD_VERBOSE_OFF
	// print memory statistics
	Util::LogMemoryInfo();
	#endif
}
/*----------------------------------------------------------------*/

String GOP::FormatFrameName(uint32_t frame) {
	return String::FormatString("%05u.png", frame+1);
}

String GOP::FormatCameraName(uint32_t idx) {
	return String::FormatString("cam%02u", idx);
}
/*----------------------------------------------------------------*/
