/*
* GOPPlanner.h
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

#ifndef _GOP_GOPPLANNER_H_
#define _GOP_GOPPLANNER_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "Reconstructor.h"


// D E F I N E S ///////////////////////////////////////////////////

#define GOP_FFMPEG_BIN _T("ffmpeg")
#define GOP_VIDEO_EXT _T(".mp4")


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

// options driving the preparation of the scenes
struct GOP_API PlannerOptions
{
	bool bExtractFrames; // extract the frames from the videos first
	unsigned nFrameRate; // frame rate used to extract the frames
	uint32_t nStartFrame; // first frame of the range
	uint32_t nEndFrame; // end (exclusive) of the frame range
	uint32_t nGOP; // number of frames in a group of pictures
	String strFFmpegBin; // path to the transcoder executable

	PlannerOptions()
		: bExtractFrames(false), nFrameRate(30), nStartFrame(0), nEndFrame(300), nGOP(60), strFFmpegBin(GOP_FFMPEG_BIN) {}
};

// keyframes of the frame range [start, end): start + k*GOP, for k in [0, ceil((end-start)/GOP))
GOP_API IndexArr ComputeKeyframes(uint32_t nStartFrame, uint32_t nEndFrame, uint32_t nGOP);

// extract the frames of each video of the scene (in lexicographic order)
// into the png/camNN/ folders using the transcoder;
// returns 0 on success, the exit code of the transcoder otherwise
GOP_API int ExtractFrames(const String& sceneFolder, unsigned nFrameRate, const String& ffmpegBin=GOP_FFMPEG_BIN);

// names of the camera folders of the scene, sorted lexicographically
GOP_API StringArr ListCameraFolders(const String& sceneFolder);

// copy the keyframe image of each camera into the project input folder as camNN.png
GOP_API bool StageKeyframe(const String& sceneFolder, const StringArr& cameraFolders, const ProjectLayout& project, uint32_t keyframe);

// prepare and reconstruct the project of each keyframe of the scene;
// returns 0 on success, the exit code of the first failure otherwise
GOP_API int ProcessScene(const String& sceneFolder, const PlannerOptions& options, Reconstructor& reconstructor);

// process every scene (immediate sub-folder) of the root folder, in lexicographic order,
// stopping at the first failure; returns 0 on success, the exit code of the failure otherwise
GOP_API int ProcessScenes(const String& rootFolder, const PlannerOptions& options, Reconstructor& reconstructor);
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_GOPPLANNER_H_
