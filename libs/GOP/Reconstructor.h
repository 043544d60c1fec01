/*
* Reconstructor.h
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

#ifndef _GOP_RECONSTRUCTOR_H_
#define _GOP_RECONSTRUCTOR_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "Project.h"


// D E F I N E S ///////////////////////////////////////////////////

#define GOP_COLMAP_BIN _T("colmap")


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

// structure-from-motion stages run on one project;
// each stage returns false on failure and the exit code
// of the last external call is kept
class GOP_API Reconstructor
{
public:
	Reconstructor() : m_nExitCode(0) {}
	virtual ~Reconstructor() {}

	virtual bool ExtractFeatures(const String& databaseFile, const String& imageFolder) = 0;
	virtual bool MatchFeatures(const String& databaseFile) = 0;
	// triangulate the points using the known camera poses
	virtual bool Triangulate(const String& databaseFile, const String& imageFolder, const String& priorFolder, const String& outputFolder) = 0;
	// undistort the images and the model into the output folder
	virtual bool Undistort(const String& imageFolder, const String& modelFolder, const String& outputFolder) = 0;

	int GetExitCode() const { return m_nExitCode; }

protected:
	int m_nExitCode; // exit code of the last stage
};
typedef std::shared_ptr<Reconstructor> ReconstructorPtr;


// runs the COLMAP executable for each stage
class GOP_API ColmapReconstructor : public Reconstructor
{
public:
	explicit ColmapReconstructor(const String& executable=GOP_COLMAP_BIN) : m_executable(executable) {}

	bool ExtractFeatures(const String& databaseFile, const String& imageFolder) override;
	bool MatchFeatures(const String& databaseFile) override;
	bool Triangulate(const String& databaseFile, const String& imageFolder, const String& priorFolder, const String& outputFolder) override;
	bool Undistort(const String& imageFolder, const String& modelFolder, const String& outputFolder) override;

	// command line arguments of each stage
	static StringArr FeatureExtractorArgs(const String& databaseFile, const String& imageFolder);
	static StringArr ExhaustiveMatcherArgs(const String& databaseFile);
	static StringArr PointTriangulatorArgs(const String& databaseFile, const String& imageFolder, const String& priorFolder, const String& outputFolder);
	static StringArr ImageUndistorterArgs(const String& imageFolder, const String& modelFolder, const String& outputFolder);

protected:
	bool Run(LPCTSTR stage, const StringArr& args);

protected:
	String m_executable; // path to the COLMAP executable
};


// run the reconstruction of the given project:
// feature extraction, exhaustive matching, triangulation from the
// prior poses and undistortion, then remove the input images and
// gather the undistorted model under sparse/0/;
// returns 0 on success, the exit code of the failed stage otherwise
GOP_API int RunReconstruction(const ProjectLayout& project, Reconstructor& reconstructor);

// move every entry of the sparse folder except "0" into "sparse/0/"
GOP_API bool GatherSparseModel(const ProjectLayout& project);
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_RECONSTRUCTOR_H_
