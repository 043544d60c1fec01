/*
* GOP.h
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

#ifndef _GOP_GOP_H_
#define _GOP_GOP_H_


// D E F I N E S ///////////////////////////////////////////////////

#define GOP_VERSION_AT_LEAST(x,y,z) \
	(GOP_MAJOR_VERSION>x || (GOP_MAJOR_VERSION==x && \
	(GOP_MINOR_VERSION>y || (GOP_MINOR_VERSION==y && GOP_PATCH_VERSION>=z))))


// I N C L U D E S /////////////////////////////////////////////////

#include "Common/Common.h"
#include "IO/Common.h"
#include "Math/Common.h"
#include "GOP/Common.h"
#include "GOP/PoseConverter.h"
#include "GOP/ColmapModel.h"
#include "GOP/Database.h"
#include "GOP/Project.h"
#include "GOP/Reconstructor.h"
#include "GOP/GOPPlanner.h"
#include "GOP/Calibration.h"
#include "GOP/Dataset.h"


#endif // _GOP_GOP_H_
