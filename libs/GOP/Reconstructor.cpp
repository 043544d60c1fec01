/*
* Reconstructor.cpp
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
#include "Reconstructor.h"

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////

// stop the pipeline at the first failed stage
#define RECONSTRUCTION_STAGE(stage) \
	if (!(stage)) { \
		const int nExitCode(reconstructor.GetExitCode() != 0 ? reconstructor.GetExitCode() : EXIT_FAILURE); \
		VERBOSE("error: reconstruction of '%s' failed (exit code %d)", project.Folder().c_str(), nExitCode); \
		return nExitCode; \
	}


// S T R U C T S ///////////////////////////////////////////////////

StringArr ColmapReconstructor::FeatureExtractorArgs(const String& databaseFile, const String& imageFolder)
{
	return StringArr{
		_T("feature_extractor"),
		_T("--database_path"), databaseFile,
		_T("--image_path"), imageFolder,
		_T("--SiftExtraction.max_image_size"), _T("4096"),
		_T("--SiftExtraction.max_num_features"), _T("106384"),
		_T("--SiftExtraction.estimate_affine_shape"), _T("1"),
		_T("--SiftExtraction.domain_size_pooling"), _T("1"),
		_T("--ImageReader.camera_model"), _T("PINHOLE")
	};
}

StringArr ColmapReconstructor::ExhaustiveMatcherArgs(const String& databaseFile)
{
	return StringArr{
		_T("exhaustive_matcher"),
		_T("--database_path"), databaseFile
	};
}

StringArr ColmapReconstructor::PointTriangulatorArgs(const String& databaseFile, const String& imageFolder, const String& priorFolder, const String& outputFolder)
{
	return StringArr{
		_T("point_triangulator"),
		_T("--database_path"), databaseFile,
		_T("--image_path"), imageFolder,
		_T("--output_path"), outputFolder,
		_T("--input_path"), priorFolder,
		_T("--Mapper.ba_global_function_tolerance=0.000001")
	};
}

StringArr ColmapReconstructor::ImageUndistorterArgs(const String& imageFolder, const String& modelFolder, const String& outputFolder)
{
	return StringArr{
		_T("image_undistorter"),
		_T("--image_path"), imageFolder,
		_T("--input_path"), modelFolder,
		_T("--output_path"), outputFolder,
		_T("--output_type"), _T("COLMAP")
	};
}
/*----------------------------------------------------------------*/

bool ColmapReconstructor::Run(LPCTSTR stage, const StringArr& args)
{
	TD_TIMER_STARTD();
	m_nExitCode = Process::Execute(m_executable, args);
	if (m_nExitCode != 0) {
		VERBOSE("error: %s failed with exit code %d", stage, m_nExitCode);
		return false;
	}
	DEBUG_EXTRA("%s completed (%s)", stage, TD_TIMER_GET_FMT().c_str());
	return true;
}

bool ColmapReconstructor::ExtractFeatures(const String& databaseFile, const String& imageFolder)
{
	return Run(_T("feature extraction"), FeatureExtractorArgs(databaseFile, imageFolder));
}

bool ColmapReconstructor::MatchFeatures(const String& databaseFile)
{
	return Run(_T("feature matching"), ExhaustiveMatcherArgs(databaseFile));
}

bool ColmapReconstructor::Triangulate(const String& databaseFile, const String& imageFolder, const String& priorFolder, const String& outputFolder)
{
	return Run(_T("point triangulation"), PointTriangulatorArgs(databaseFile, imageFolder, priorFolder, outputFolder));
}

bool ColmapReconstructor::Undistort(const String& imageFolder, const String& modelFolder, const String& outputFolder)
{
	return Run(_T("image undistortion"), ImageUndistorterArgs(imageFolder, modelFolder, outputFolder));
}
/*----------------------------------------------------------------*/


bool GOP::GatherSparseModel(const ProjectLayout& project)
{
	const String sparseFolder(project.SparseFolder());
	const String modelFolder(project.ModelFolder());
	// list the entries before creating the model folder
	const StringArr entries(File::listEntries(sparseFolder.c_str()));
	if (!File::createFolder(modelFolder.c_str())) {
		VERBOSE("error: can not create folder '%s'", modelFolder.c_str());
		return false;
	}
	for (const String& entry: entries) {
		if (entry == _T("0"))
			continue;
		if (!File::renameFile((sparseFolder+entry).c_str(), (modelFolder+entry).c_str())) {
			VERBOSE("error: can not move '%s' to '%s'", (sparseFolder+entry).c_str(), modelFolder.c_str());
			return false;
		}
	}
	return true;
} // GatherSparseModel

int GOP::RunReconstruction(const ProjectLayout& project, Reconstructor& reconstructor)
{
	TD_TIMER_START();
	if (!File::isFolder(project.Folder().c_str())) {
		VERBOSE("error: project folder '%s' does not exist", project.Folder().c_str());
		return EXIT_FAILURE;
	}
	const String distortedFolder(project.DistortedFolder());
	if (!File::createFolder(distortedFolder.c_str())) {
		VERBOSE("error: can not create folder '%s'", distortedFolder.c_str());
		return EXIT_FAILURE;
	}
	const String dbFile(project.DatabaseFile());
	const String inputFolder(project.InputFolder());
	RECONSTRUCTION_STAGE(reconstructor.ExtractFeatures(dbFile, inputFolder));
	RECONSTRUCTION_STAGE(reconstructor.MatchFeatures(dbFile));
	RECONSTRUCTION_STAGE(reconstructor.Triangulate(dbFile, inputFolder, project.ManualFolder(), distortedFolder));
	RECONSTRUCTION_STAGE(reconstructor.Undistort(inputFolder, distortedFolder, project.Folder()));
	if (!File::deleteFolder(inputFolder.c_str())) {
		VERBOSE("error: can not remove folder '%s'", inputFolder.c_str());
		return EXIT_FAILURE;
	}
	if (!GatherSparseModel(project))
		return EXIT_FAILURE;
	VERBOSE("Project '%s' reconstructed (%s)", project.Folder().c_str(), TD_TIMER_GET_FMT().c_str());
	return EXIT_SUCCESS;
} // RunReconstruction
/*----------------------------------------------------------------*/
