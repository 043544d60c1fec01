/*
* GOPPlanner.cpp
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
#include "GOPPlanner.h"

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

IndexArr GOP::ComputeKeyframes(uint32_t nStartFrame, uint32_t nEndFrame, uint32_t nGOP)
{
	IndexArr keyframes;
	if (nGOP == 0 || nEndFrame <= nStartFrame)
		return keyframes;
	const uint32_t numGOPs((nEndFrame-nStartFrame+nGOP-1)/nGOP);
	keyframes.reserve(numGOPs);
	for (uint32_t k=0; k<numGOPs; ++k)
		keyframes.push_back(nStartFrame + k*nGOP);
	return keyframes;
} // ComputeKeyframes
/*----------------------------------------------------------------*/

int GOP::ExtractFrames(const String& sceneFolder, unsigned nFrameRate, const String& ffmpegBin)
{
	const String pngFolder(sceneFolder+GOP_PNG_FOLDER);
	const StringArr videos(File::listFolder(sceneFolder.c_str(), false, GOP_VIDEO_EXT));
	if (videos.empty())
		VERBOSE("warning: no videos found in '%s'", sceneFolder.c_str());
	FOREACH(idx, videos) {
		const String outputFolder(pngFolder+FormatCameraName((uint32_t)idx)+PATH_SEPARATOR_STR);
		if (!File::createFolder(outputFolder.c_str())) {
			VERBOSE("error: can not create folder '%s'", outputFolder.c_str());
			return EXIT_FAILURE;
		}
		const StringArr args{
			_T("-i"), sceneFolder+videos[idx],
			_T("-vf"), String::FormatString("fps=%u", nFrameRate),
			outputFolder+_T("%05d.png")
		};
		TD_TIMER_STARTD();
		const int nExitCode(Process::Execute(ffmpegBin, args));
		if (nExitCode != 0) {
			VERBOSE("error: frame extraction of '%s' failed with exit code %d", videos[idx].c_str(), nExitCode);
			return nExitCode;
		}
		DEBUG_EXTRA("Frames of '%s' extracted (%s)", videos[idx].c_str(), TD_TIMER_GET_FMT().c_str());
	}
	return EXIT_SUCCESS;
} // ExtractFrames
/*----------------------------------------------------------------*/

StringArr GOP::ListCameraFolders(const String& sceneFolder)
{
	return File::listFolder((sceneFolder+GOP_PNG_FOLDER).c_str(), true);
}

bool GOP::StageKeyframe(const String& sceneFolder, const StringArr& cameraFolders, const ProjectLayout& project, uint32_t keyframe)
{
	const String inputFolder(project.InputFolder());
	if (!File::createFolder(inputFolder.c_str())) {
		VERBOSE("error: can not create folder '%s'", inputFolder.c_str());
		return false;
	}
	const String frameName(FormatFrameName(keyframe));
	FOREACH(idx, cameraFolders) {
		const String source(sceneFolder+GOP_PNG_FOLDER+cameraFolders[idx]+PATH_SEPARATOR_STR+frameName);
		const String target(inputFolder+FormatImageName((uint32_t)idx));
		if (!File::copyFile(source.c_str(), target.c_str())) {
			VERBOSE("error: can not copy keyframe image '%s'", source.c_str());
			return false;
		}
	}
	return true;
} // StageKeyframe
/*----------------------------------------------------------------*/

int GOP::ProcessScene(const String& _sceneFolder, const PlannerOptions& options, Reconstructor& reconstructor)
{
	TD_TIMER_START();
	String sceneFolder(_sceneFolder);
	Util::ensureValidFolderPath(sceneFolder);
	VERBOSE("Processing scene '%s'", sceneFolder.c_str());
	const String pngFolder(sceneFolder+GOP_PNG_FOLDER);
	if (!File::createFolder(pngFolder.c_str())) {
		VERBOSE("error: can not create folder '%s'", pngFolder.c_str());
		return EXIT_FAILURE;
	}
	if (options.bExtractFrames) {
		const int nExitCode(ExtractFrames(sceneFolder, options.nFrameRate, options.strFFmpegBin));
		if (nExitCode != 0)
			return nExitCode;
	}

	// the camera folders must match the poses one to one
	const StringArr cameraFolders(ListCameraFolders(sceneFolder));
	PoseBundleArr poses;
	if (!LoadPoseBundles(sceneFolder+GOP_POSES_FILE, poses))
		return EXIT_FAILURE;
	if (poses.size() != cameraFolders.size()) {
		VERBOSE("error: scene '%s' has %u poses but %u camera folders", sceneFolder.c_str(), (unsigned)poses.size(), (unsigned)cameraFolders.size());
		return EXIT_FAILURE;
	}
	CameraPriorArr priors;
	ConvertPoses(poses, priors);

	const IndexArr keyframes(ComputeKeyframes(options.nStartFrame, options.nEndFrame, options.nGOP));
	for (const uint32_t keyframe: keyframes) {
		const ProjectLayout project(sceneFolder, keyframe);
		VERBOSE("Reconstructing keyframe %u: '%s'", keyframe, project.Folder().c_str());
		if (!StageKeyframe(sceneFolder, cameraFolders, project, keyframe))
			return EXIT_FAILURE;
		ColmapDatabase db;
		if (!MaterializeProject(project, priors, db))
			return EXIT_FAILURE;
		const int nExitCode(RunReconstruction(project, reconstructor));
		if (nExitCode != 0)
			return nExitCode;
	}
	VERBOSE("Scene '%s' processed: %u keyframes (%s)", sceneFolder.c_str(), (unsigned)keyframes.size(), TD_TIMER_GET_FMT().c_str());
	return EXIT_SUCCESS;
} // ProcessScene
/*----------------------------------------------------------------*/

int GOP::ProcessScenes(const String& _rootFolder, const PlannerOptions& options, Reconstructor& reconstructor)
{
	String rootFolder(_rootFolder);
	Util::ensureValidFolderPath(rootFolder);
	if (!File::isFolder(rootFolder.c_str())) {
		VERBOSE("error: root folder '%s' does not exist", rootFolder.c_str());
		return EXIT_FAILURE;
	}
	const StringArr scenes(File::listFolder(rootFolder.c_str(), true));
	for (const String& scene: scenes) {
		const int nExitCode(ProcessScene(rootFolder+scene, options, reconstructor));
		if (nExitCode != 0)
			return nExitCode;
	}
	return EXIT_SUCCESS;
} // ProcessScenes
/*----------------------------------------------------------------*/
