/*
* PrepareGOP.cpp
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
#include "../../libs/GOP/GOPPlanner.h"
#include <boost/program_options.hpp>

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////

#define APPNAME _T("PrepareGOP")


// S T R U C T S ///////////////////////////////////////////////////

namespace {

namespace OPT {
String strRootFolder;
bool bExtractFrames;
unsigned nFrameRate;
uint32_t nStartFrame;
uint32_t nEndFrame;
uint32_t nGOP;
String strColmapBin;
String strFFmpegBin;
String strConfigFileName;
boost::program_options::variables_map vm;
} // namespace OPT

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
		("root-dir,i", boost::program_options::value<std::string>(&OPT::strRootFolder), "folder containing one sub-folder per scene")
		("extract-frames", boost::program_options::value(&OPT::bExtractFrames)->default_value(false), "extract the frames of the scene videos before the reconstruction")
		("frame-rate", boost::program_options::value(&OPT::nFrameRate)->default_value(30), "frame rate used to extract the frames")
		("start-frame", boost::program_options::value(&OPT::nStartFrame)->default_value(0), "first frame of the range to reconstruct")
		("end-frame", boost::program_options::value(&OPT::nEndFrame)->default_value(300), "end of the range to reconstruct (exclusive)")
		("gop", boost::program_options::value(&OPT::nGOP)->default_value(60), "number of frames in a group of pictures")
		("colmap-bin", boost::program_options::value<std::string>(&OPT::strColmapBin)->default_value(GOP_COLMAP_BIN), "path to the COLMAP executable")
		("ffmpeg-bin", boost::program_options::value<std::string>(&OPT::strFFmpegBin)->default_value(GOP_FFMPEG_BIN), "path to the FFmpeg executable")
		;

	boost::program_options::options_description cmdline_options;
	cmdline_options.add(generic).add(config);

	boost::program_options::options_description config_file_options;
	config_file_options.add(config);

	boost::program_options::positional_options_description p;
	p.add("root-dir", -1);

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
	Util::ensureValidFolderPath(OPT::strRootFolder);
	const bool bInvalidCommand(OPT::strRootFolder.empty() || OPT::nGOP == 0);
	if (OPT::vm.count("help") || bInvalidCommand) {
		boost::program_options::options_description visible("Available options");
		visible.add(generic).add(config);
		GET_LOG() << _T("\n"
			"Prepare multi-camera video scenes for dynamic reconstruction: for each scene folder\n"
			"(optionally extract the frames of each camera video first), split the frame range in\n"
			"groups of pictures and reconstruct the sparse model of the first frame of each group\n"
			"with COLMAP, using the known camera poses from poses_bounds.npy."
			"\n")
			<< visible;
	}
	if (bInvalidCommand)
		return false;

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

} // unnamed namespace

int main(int argc, LPCTSTR* argv)
{
	if (!Initialize(argc, argv))
		return EXIT_FAILURE;

	TD_TIMER_START();

	PlannerOptions options;
	options.bExtractFrames = OPT::bExtractFrames;
	options.nFrameRate = OPT::nFrameRate;
	options.nStartFrame = OPT::nStartFrame;
	options.nEndFrame = OPT::nEndFrame;
	options.nGOP = OPT::nGOP;
	options.strFFmpegBin = OPT::strFFmpegBin;
	ColmapReconstructor reconstructor(OPT::strColmapBin);
	const int nExitCode(ProcessScenes(MAKE_PATH_SAFE(OPT::strRootFolder), options, reconstructor));
	if (nExitCode != EXIT_SUCCESS) {
		VERBOSE("error: scene preparation failed with exit code %d (%s)", nExitCode, TD_TIMER_GET_FMT().c_str());
		Finalize();
		return nExitCode;
	}
	VERBOSE("Scenes prepared (%s)", TD_TIMER_GET_FMT().c_str());

	Finalize();
	return EXIT_SUCCESS;
}
/*----------------------------------------------------------------*/
