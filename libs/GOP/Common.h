/*
* Common.h
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

#ifndef _GOP_COMMON_H_
#define _GOP_COMMON_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "../Common/Common.h"
#include "../IO/Common.h"
#include "../Math/Common.h"

#ifndef GOP_API
#define GOP_API GENERAL_API
#endif


// D E F I N E S ///////////////////////////////////////////////////

// names of the files and folders making a scene
#define GOP_PNG_FOLDER _T("png/")
#define GOP_POSES_FILE _T("poses_bounds.npy")
#define GOP_EXT_METADATA_FILE _T("ext_metadata.json")
#define GOP_PROJECT_PREFIX _T("colmap_")


// P R O T O T Y P E S /////////////////////////////////////////////

using namespace TOOLS;

namespace GOP {

// initialize/release the library state used by an application
GOP_API void Initialize(LPCTSTR appname);
GOP_API void Finalize();

// name of the frame image with the given 0-based index, as written by the transcoder: "%05d.png" of index+1
GOP_API String FormatFrameName(uint32_t frame);
// name of the camera with the given 0-based index: "camNN"
GOP_API String FormatCameraName(uint32_t idx);
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_COMMON_H_
