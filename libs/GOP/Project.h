/*
* Project.h
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

#ifndef _GOP_PROJECT_H_
#define _GOP_PROJECT_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "PoseConverter.h"
#include "Database.h"


// D E F I N E S ///////////////////////////////////////////////////

#define GOP_INPUT_FOLDER _T("input/")
#define GOP_MANUAL_FOLDER _T("manual/")
#define GOP_DATABASE_FILE _T("input.db")
#define GOP_DISTORTED_FOLDER _T("distorted/sparse/")
#define GOP_SPARSE_FOLDER _T("sparse/")
#define GOP_MODEL_FOLDER GOP_SPARSE_FOLDER _T("0/")


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

// folder layout of the reconstruction project of one keyframe:
//   colmap_K/
//     input/              keyframe images, one per camera (camNN.png)
//     manual/             camera and image priors (cameras.txt, images.txt, points3D.txt)
//     input.db            reconstruction tool database
//     distorted/sparse/   triangulated model
//     images/, sparse/0/  undistorted images and model
class GOP_API ProjectLayout
{
public:
	explicit ProjectLayout(const String& folder);
	ProjectLayout(const String& sceneFolder, uint32_t keyframe);

	const String& Folder() const { return m_folder; }
	String InputFolder() const { return m_folder + GOP_INPUT_FOLDER; }
	String ManualFolder() const { return m_folder + GOP_MANUAL_FOLDER; }
	String DatabaseFile() const { return m_folder + GOP_DATABASE_FILE; }
	String DistortedFolder() const { return m_folder + GOP_DISTORTED_FOLDER; }
	String SparseFolder() const { return m_folder + GOP_SPARSE_FOLDER; }
	String ModelFolder() const { return m_folder + GOP_MODEL_FOLDER; }

	// name of the project folder of the given keyframe: "colmap_K/"
	static String FolderName(uint32_t keyframe);

protected:
	String m_folder; // project folder, ending with a slash
};


// write the manual-initialization files of the reconstruction tool:
// images.txt (one line per image followed by an empty line), cameras.txt
// (one PINHOLE camera per image) and an empty points3D.txt
GOP_API bool WritePriorFiles(const String& manualFolder, const CameraPriorArr& priors);

// insert one camera and one image row per prior and commit
GOP_API bool PopulateDatabase(DatabaseWriter& db, const CameraPriorArr& priors);

// create the project of one keyframe: the manual folder with the prior files
// and a new database (any stale one is removed) filled with the priors
GOP_API bool MaterializeProject(const ProjectLayout& project, const CameraPriorArr& priors, DatabaseWriter& db);
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_PROJECT_H_
