/*
* Dataset.h
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

#ifndef _GOP_DATASET_H_
#define _GOP_DATASET_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "Calibration.h"


// D E F I N E S ///////////////////////////////////////////////////

#define GOP_SPLIT_TRAIN _T("train")
#define GOP_SPLIT_TEST _T("test")


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

// options selecting the samples of a dataset
struct GOP_API DatasetOptions
{
	String split; // "train", "test" or any other name (treated as test)
	unsigned nPatchSize; // size of the random crop (0 - full image)
	bool bLoadDepths; // project the sparse points seen by each sample
	uint32_t nStartFrame; // keyframe of the calibration
	uint32_t nGOP; // number of frames of the group
	IndexArr testSet; // cameras used for testing
	IndexArr removeSet; // cameras excluded from any split

	DatasetOptions() : split(GOP_SPLIT_TRAIN), nPatchSize(0), bLoadDepths(false), nStartFrame(0), nGOP(50), testSet{0} {}

	bool IsTrain() const { return split == GOP_SPLIT_TRAIN; }
};

// one undistorted frame of one camera
struct GOP_API Sample
{
	KMatrix K; // intrinsics of the image
	Matrix4x4 camToWorld; // camera-to-world pose of the keyframe
	cv::Mat image; // RGB image, CV_32FC3 in [0,255]
	uint32_t imageID; // index of the sample in the dataset
	REAL time; // normalized time of the frame in the group, in [0,1]
	int cameraID; // 0-based camera ID for training, -1 otherwise
	cv::Mat mask; // valid pixels (CV_8UC1), fisheye cameras only
	Point2fArr points; // projections of the sparse points seen by the camera
	std::vector<float> depths; // depth of each projected point

	EIGEN_MAKE_ALIGNED_OPERATOR_NEW
	Sample() : K(KMatrix::Identity()), camToWorld(Matrix4x4::Identity()), imageID(0), time(0), cameraID(-1) {}
};

// flat indexable sequence of the frames of all cameras in a group of pictures,
// loaded on demand from the frames of a calibrated keyframe:
// sample index i corresponds to camera i/GOP and frame start+i%GOP
class GOP_API Dataset
{
public:
	const Calibration& calibration;
	DatasetOptions options;
	IndexArr indices; // universe indices of the selected samples

public:
	Dataset(const Calibration& _calibration, const DatasetOptions& _options);

	size_t size() const { return indices.size(); }

	// camera index and frame of the given sample
	void IndexToCameraFrame(size_t idx, uint32_t& idxCamera, uint32_t& frame) const;
	// normalized time of the given frame in the group
	REAL ComputeTime(uint32_t frame) const;

	// decode and undistort the given sample;
	// the random crop uses the given generator, or a local one if NULL
	bool GetSample(size_t idx, Sample& sample, std::mt19937* pGenerator=NULL) const;

	static void SelectIndices(size_t numCameras, const DatasetOptions& options, IndexArr& indices);

protected:
	void ProjectPoints(size_t idxCamera, Sample& sample) const;
};
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_DATASET_H_
