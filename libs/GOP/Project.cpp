/*
* Project.cpp
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
#include "Project.h"
#include "ColmapModel.h"

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

ProjectLayout::ProjectLayout(const String& folder)
	:
	m_folder(folder)
{
	Util::ensureValidFolderPath(m_folder);
}

ProjectLayout::ProjectLayout(const String& sceneFolder, uint32_t keyframe)
	:
	m_folder(sceneFolder)
{
	Util::ensureValidFolderPath(m_folder);
	m_folder += FolderName(keyframe);
}

String ProjectLayout::FolderName(uint32_t keyframe)
{
	return String::FormatString(GOP_PROJECT_PREFIX "%u/", keyframe);
}
/*----------------------------------------------------------------*/


bool GOP::WritePriorFiles(const String& manualFolder, const CameraPriorArr& priors)
{
	if (!File::createFolder(manualFolder.c_str())) {
		VERBOSE("error: can not create folder '%s'", manualFolder.c_str());
		return false;
	}
	const String fileImages(manualFolder+COLMAP_IMAGES_TXT);
	std::ofstream images(fileImages);
	if (!images.good()) {
		VERBOSE("error: unable to create file '%s'", fileImages.c_str());
		return false;
	}
	for (const CameraPrior& prior: priors)
		images << prior.ImageLine() << _T("\n") << _T("\n");
	const String fileCameras(manualFolder+COLMAP_CAMERAS_TXT);
	std::ofstream cameras(fileCameras);
	if (!cameras.good()) {
		VERBOSE("error: unable to create file '%s'", fileCameras.c_str());
		return false;
	}
	for (const CameraPrior& prior: priors)
		cameras << prior.CameraLine() << _T("\n");
	const String filePoints(manualFolder+COLMAP_POINTS_TXT);
	std::ofstream points(filePoints);
	if (!points.good()) {
		VERBOSE("error: unable to create file '%s'", filePoints.c_str());
		return false;
	}
	images.close(); cameras.close(); points.close();
	return !images.fail() && !cameras.fail() && !points.fail();
} // WritePriorFiles
/*----------------------------------------------------------------*/

bool GOP::PopulateDatabase(DatabaseWriter& db, const CameraPriorArr& priors)
{
	for (const CameraPrior& prior: priors) {
		const uint32_t cameraID(db.AddCamera(COLMAP::PINHOLE, prior.width, prior.height, prior.Params()));
		if (cameraID == 0)
			return false;
		if (db.AddImage(prior.name, cameraID, prior.q, prior.t, prior.ID) == 0)
			return false;
		if (!db.Commit())
			return false;
	}
	return true;
} // PopulateDatabase
/*----------------------------------------------------------------*/

bool GOP::MaterializeProject(const ProjectLayout& project, const CameraPriorArr& priors, DatabaseWriter& db)
{
	const String dbFile(project.DatabaseFile());
	if (File::isFile(dbFile.c_str()) && !File::deleteFile(dbFile.c_str())) {
		VERBOSE("error: can not remove stale database '%s'", dbFile.c_str());
		return false;
	}
	if (!WritePriorFiles(project.ManualFolder(), priors))
		return false;
	if (!db.Open(dbFile))
		return false;
	const bool bOK(db.CreateTables() && PopulateDatabase(db, priors));
	db.Close();
	if (!bOK) {
		VERBOSE("error: can not populate database '%s'", dbFile.c_str());
		return false;
	}
	DEBUG_EXTRA("Project '%s' materialized: %u cameras", project.Folder().c_str(), (unsigned)priors.size());
	return true;
} // MaterializeProject
/*----------------------------------------------------------------*/
