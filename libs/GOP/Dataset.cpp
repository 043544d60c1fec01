/*
* Dataset.cpp
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
#include "Dataset.h"

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

Dataset::Dataset(const Calibration& _calibration, const DatasetOptions& _options)
	:
	calibration(_calibration),
	options(_options)
{
	ASSERT(options.nGOP > 0);
	SelectIndices(calibration.NumCameras(), options, indices);
	DEBUG_EXTRA("Dataset '%s': %u samples of %u cameras", options.split.c_str(), (unsigned)indices.size(), (unsigned)calibration.NumCameras());
}

// the train split keeps the cameras not in the test set,
// any other split the cameras in the test set;
// the cameras in the remove set are dropped from both
void Dataset::SelectIndices(size_t numCameras, const DatasetOptions& options, IndexArr& indices)
{
	indices.clear();
	if (options.nGOP == 0)
		return;
	const auto contains = [](const IndexArr& set, uint32_t idx) {
		return std::find(set.begin(), set.end(), idx) != set.end();
	};
	const size_t numSamples(numCameras*(size_t)options.nGOP);
	if (numSamples/options.nGOP != numCameras || numSamples > std::numeric_limits<uint32_t>::max()) {
		VERBOSE("error: too many samples (%llu cameras with GOP %u)", (unsigned long long)numCameras, options.nGOP);
		return;
	}
	const bool bTrain(options.IsTrain());
	for (size_t i=0; i<numSamples; ++i) {
		const uint32_t idxCamera((uint32_t)(i/options.nGOP));
		if (contains(options.testSet, idxCamera) == bTrain)
			continue;
		if (contains(options.removeSet, idxCamera))
			continue;
		indices.push_back((uint32_t)i);
	}
} // SelectIndices
/*----------------------------------------------------------------*/

void Dataset::IndexToCameraFrame(size_t idx, uint32_t& idxCamera, uint32_t& frame) const
{
	const uint32_t i(indices[idx]);
	idxCamera = i/options.nGOP;
	frame = options.nStartFrame + i%options.nGOP;
}

REAL Dataset::ComputeTime(uint32_t frame) const
{
	if (options.nGOP <= 1)
		return REAL(0);
	return REAL(frame-options.nStartFrame)/REAL(options.nGOP-1);
}
/*----------------------------------------------------------------*/

bool Dataset::GetSample(size_t idx, Sample& sample, std::mt19937* pGenerator) const
{
	if (idx >= indices.size()) {
		VERBOSE("error: sample %u out of range (%u samples)", (unsigned)idx, (unsigned)indices.size());
		return false;
	}
	uint32_t idxCamera, frame;
	IndexToCameraFrame(idx, idxCamera, frame);
	const CalibrationRecord& record = calibration.GetRecord(idxCamera);

	// decode the frame at the training resolution
	const String fileName(calibration.GetFramePath(idxCamera, frame));
	cv::Mat image(cv::imread(fileName, cv::IMREAD_COLOR));
	if (image.empty()) {
		VERBOSE("error: unable to read image '%s'", fileName.c_str());
		return false;
	}
	cv::cvtColor(image, image, cv::COLOR_BGR2RGB);
	const unsigned nFactor(calibration.options.nFactor);
	cv::resize(image, image, cv::Size(image.cols/(int)nFactor, image.rows/(int)nFactor), 0, 0, cv::INTER_LINEAR);

	// undistort and crop to the valid region
	sample.K = record.K;
	if (record.HasDistortion()) {
		cv::Mat undistorted;
		cv::remap(image, undistorted, record.mapX, record.mapY, cv::INTER_LINEAR);
		const cv::Rect roi(record.roi & cv::Rect(cv::Point(0,0), undistorted.size()));
		image = undistorted(roi);
	}
	sample.mask = record.mask;

	if (options.nPatchSize > 0) {
		std::mt19937 generator;
		if (pGenerator == NULL) {
			std::random_device rd;
			generator.seed(rd());
			pGenerator = &generator;
		}
		const int patchSize((int)options.nPatchSize);
		std::uniform_int_distribution<int> distX(0, MAXF(image.cols-patchSize, 1)-1);
		std::uniform_int_distribution<int> distY(0, MAXF(image.rows-patchSize, 1)-1);
		const int x(distX(*pGenerator));
		const int y(distY(*pGenerator));
		const cv::Rect patch(cv::Rect(x, y, patchSize, patchSize) & cv::Rect(cv::Point(0,0), image.size()));
		image = image(patch);
		if (!sample.mask.empty())
			sample.mask = sample.mask(patch & cv::Rect(cv::Point(0,0), sample.mask.size()));
		sample.K(0,2) -= x;
		sample.K(1,2) -= y;
	}
	image.convertTo(sample.image, CV_32FC3);

	sample.camToWorld = calibration.camToWorlds[idxCamera];
	sample.imageID = (uint32_t)idx;
	sample.time = ComputeTime(frame);
	sample.cameraID = options.IsTrain() ? (int)record.ID-1 : -1;
	sample.points.clear();
	sample.depths.clear();
	if (options.bLoadDepths)
		ProjectPoints(idxCamera, sample);
	return true;
} // GetSample

// project the sparse points seen by the keyframe image of the camera
// and keep the ones in front of the camera and inside the sample image
void Dataset::ProjectPoints(size_t idxCamera, Sample& sample) const
{
	const auto itIndices(calibration.pointIndices.find(calibration.imageNames[idxCamera]));
	if (itIndices == calibration.pointIndices.end())
		return;
	const Matrix4x4 worldToCam(sample.camToWorld.inverse());
	const Matrix3x3 R(worldToCam.topLeftCorner<3,3>());
	const Point3 t(worldToCam.topRightCorner<3,1>());
	const REAL width(sample.image.cols), height(sample.image.rows);
	for (uint32_t idxPoint: itIndices->second) {
		const Point3 X(R*calibration.points[idxPoint].cast<REAL>() + t);
		const Point3 proj(sample.K*X);
		const Point2 x(proj.x()/proj.z(), proj.y()/proj.z());
		if (X.z() <= 0 || x.x() < 0 || x.x() >= width || x.y() < 0 || x.y() >= height)
			continue;
		sample.points.emplace_back(x.cast<float>());
		sample.depths.push_back((float)X.z());
	}
} // ProjectPoints
/*----------------------------------------------------------------*/
