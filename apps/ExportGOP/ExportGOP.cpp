/*
* ExportGOP.cpp
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

#include "../../libs/GOP/Common.h"
#include "../../libs/GOP/Dataset.h"
#include <boost/program_options.hpp>

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////

#define APPNAME _T("ExportGOP")
#define CALIBRATION_FILE _T("calibration.json")


// S T R U C T S ///////////////////////////////////////////////////

namespace {

namespace OPT {
String strDataFolder;
String strOutputFolder;
unsigned nFactor;
bool bNormalize;
uint32_t nFirstFrame;
uint32_t nGOP;
String strSplit;
String strTestSet;
String strRemoveSet;
unsigned nPatchSize;
bool bLoadDepths;
unsigned nRandomSeed;
String strConfigFileName;
boost::program_options::variables_map vm;
} // namespace OPT

// parse a list of camera indices separated by commas
bool ParseIndexList(const String& str, IndexArr& indices)
{
	indices.clear();
	StringArr values;
	Util::strSplit(str, _T(','), values);
	for (String value: values) {
		Util::strTrim(value, _T(" \t"));
		if (value.empty())
			continue;
		char* end;
		const unsigned long idx(strtoul(value.c_str(), &end, 10));
		if (*end != '\0') {
			VERBOSE("error: invalid camera index '%s'", value.c_str());
			return false;
		}
		indices.push_back((uint32_t)idx);
	}
	return true;
}

// initialize and parse the command line parameters
bool Initialize(size_t argc, LPCTSTR* argv)
{
	// initialize log and console
	OPEN_LOG();
	OPEN_LOGCONSOLE();

	// group of options allowed only on command line
	boost::program_options::options_description generic("Generic options");
	generic.add_options()
		("help,h", "produce this help message")
		("working-folder,w", boost::program_options::value<std::string>(&WORKING_FOLDER), "working directory (default current directory)")
		("config-file,c", boost::program_options::value<std::string>(&OPT::strConfigFileName)->default_value(APPNAME _T(".cfg")), "file name containing program options")
		#if TD_VERBOSE != TD_VERBOSE_OFF
		("verbosity,v", boost::program_options::value(&g_nVerbosityLevel)->default_value(
			#if TD_VERBOSE == TD_VERBOSE_DEBUG
			3
			#else
			2
			#endif
			), "verbosity level")
		#endif
		;

	// group of options allowed both on command line and in config file
	boost::program_options::options_description config("Main options");
	config.add_options()
		("data-dir,i", boost::program_options::value<std::string>(&OPT::strDataFolder), "scene folder containing the frames and the reconstructed keyframes")
		("output-folder,o", boost::program_options::value<std::string>(&OPT::strOutputFolder)->default_value(_T("samples")), "folder where to store the exported samples")
		("factor", boost::program_options::value(&OPT::nFactor)->default_value(1), "downsample factor of the images")
		("normalize", boost::program_options::value(&OPT::bNormalize)->default_value(true), "bring the scene to a canonical frame")
		("first-frame", boost::program_options::value(&OPT::nFirstFrame)->default_value(0), "keyframe of the group to export")
		("gop", boost::program_options::value(&OPT::nGOP)->default_value(50), "number of frames in a group of pictures")
		("split", boost::program_options::value<std::string>(&OPT::strSplit)->default_value(GOP_SPLIT_TEST), "samples to export: train or test")
		("test-set", boost::program_options::value<std::string>(&OPT::strTestSet)->default_value(_T("0")), "comma separated indices of the test cameras")
		("remove-set", boost::program_options::value<std::string>(&OPT::strRemoveSet), "comma separated indices of the cameras to exclude")
		("patch-size", boost::program_options::value(&OPT::nPatchSize)->default_value(0), "size of the random crop of each sample (0 - full image)")
		("load-depths", boost::program_options::value(&OPT::bLoadDepths)->default_value(true), "project the sparse points in each sample and draw them")
		("random-seed", boost::program_options::value(&OPT::nRandomSeed)->default_value(0), "seed of the random crop generator")
		;

	boost::program_options::options_description cmdline_options;
	cmdline_options.add(generic).add(config);

	boost::program_options::options_description config_file_options;
	config_file_options.add(config);

	boost::program_options::positional_options_description p;
	p.add("data-dir", -1);

	try {
		// parse command line options
		boost::program_options::store(boost::program_options::command_line_parser((int)argc, argv).options(cmdline_options).positional(p).run(), OPT::vm);
		boost::program_options::notify(OPT::vm);
		INIT_WORKING_FOLDER;
		// parse configuration file
		std::ifstream ifs(MAKE_PATH_SAFE(OPT::strConfigFileName));
		if (ifs) {
			boost::program_options::store(parse_config_file(ifs, config_file_options), OPT::vm);
			boost::program_options::notify(OPT::vm);
		}
	}
	catch (const std::exception& e) {
		LOG(e.what());
		return false;
	}

	// initialize the log file
	OPEN_LOGFILE(MAKE_PATH(APPNAME _T("-")+Util::getUniqueName(0)+_T(".log")));

	// print application details: version and command line
	Util::LogBuild();
	LOG(_T("Command line: ") APPNAME _T("%s"), Util::CommandLineToString(argc, argv).c_str());

	// validate input
	Util::ensureValidFolderPath(OPT::strDataFolder);
	const bool bInvalidCommand(OPT::strDataFolder.empty() || OPT::nFactor == 0 || OPT::nGOP == 0);
	if (OPT::vm.count("help") || bInvalidCommand) {
		boost::program_options::options_description visible("Available options");
		visible.add(generic).add(config);
		GET_LOG() << _T("\n"
			"Load the calibration of a reconstructed keyframe and export the undistorted frames\n"
			"of the selected cameras of its group of pictures, with the projected sparse points.\n"
			"\n")
			<< visible;
	}
	if (bInvalidCommand)
		return false;

	// initialize optional options
	Util::ensureValidFolderPath(OPT::strOutputFolder);

	GOP::Initialize(APPNAME);
	return true;
}

// finalize application instance
void Finalize()
{
	GOP::Finalize();

	CLOSE_LOGFILE();
	CLOSE_LOGCONSOLE();
	CLOSE_LOG();
}

// save the sample as an 8-bit image with the projected points drawn on it
bool ExportSample(const Sample& sample, const String& fileName)
{
	cv::Mat image;
	sample.image.convertTo(image, CV_8UC3);
	for (const Point2f& x: sample.points)
		cv::circle(image, cv::Point((int)x.x(), (int)x.y()), 2, cv::Scalar(255,0,0), -1);
	cv::cvtColor(image, image, cv::COLOR_RGB2BGR);
	try {
		if (!cv::imwrite(fileName, image)) {
			VERBOSE("error: unable to write image '%s'", fileName.c_str());
			return false;
		}
	}
	catch (const cv::Exception& e) {
		VERBOSE("error: unable to write image '%s': %s", fileName.c_str(), e.what());
		return false;
	}
	return true;
}

} // unnamed namespace

int main(int argc, LPCTSTR* argv)
{
	if (!Initialize(argc, argv))
		return EXIT_FAILURE;

	TD_TIMER_START();

	// load the calibration of the keyframe
	ParserOptions parserOptions;
	parserOptions.strDataDir = MAKE_PATH_SAFE(OPT::strDataFolder);
	parserOptions.nFactor = OPT::nFactor;
	parserOptions.bNormalize = OPT::bNormalize;
	parserOptions.nFirstFrame = OPT::nFirstFrame;
	Calibration calibration;
	if (!calibration.Load(parserOptions))
		return EXIT_FAILURE;
	const String outputFolder(MAKE_PATH_SAFE(OPT::strOutputFolder));
	if (!calibration.SaveJSON(outputFolder+CALIBRATION_FILE))
		return EXIT_FAILURE;

	// export the samples
	DatasetOptions datasetOptions;
	datasetOptions.split = OPT::strSplit;
	datasetOptions.nPatchSize = OPT::nPatchSize;
	datasetOptions.bLoadDepths = OPT::bLoadDepths;
	datasetOptions.nStartFrame = OPT::nFirstFrame;
	datasetOptions.nGOP = OPT::nGOP;
	if (!ParseIndexList(OPT::strTestSet, datasetOptions.testSet) ||
		!ParseIndexList(OPT::strRemoveSet, datasetOptions.removeSet))
		return EXIT_FAILURE;
	const Dataset dataset(calibration, datasetOptions);
	std::mt19937 generator(OPT::nRandomSeed);
	size_t numPoints(0);
	for (size_t idx=0; idx<dataset.size(); ++idx) {
		Sample sample;
		if (!dataset.GetSample(idx, sample, &generator))
			return EXIT_FAILURE;
		uint32_t idxCamera, frame;
		dataset.IndexToCameraFrame(idx, idxCamera, frame);
		const String fileName(outputFolder+FormatCameraName(idxCamera)+_T("_")+FormatFrameName(frame));
		if (!ExportSample(sample, fileName))
			return EXIT_FAILURE;
		numPoints += sample.points.size();
		DEBUG_ULTIMATE("Sample %u: camera %u frame %u time %g, %u points", (unsigned)idx, idxCamera, frame, sample.time, (unsigned)sample.points.size());
	}
	VERBOSE("Exported %u '%s' samples with %u projected points (%s)", (unsigned)dataset.size(), OPT::strSplit.c_str(), (unsigned)numPoints, TD_TIMER_GET_FMT().c_str());

	Finalize();
	return EXIT_SUCCESS;
}
/*----------------------------------------------------------------*/
