/*
* Calibration.h
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

#ifndef _GOP_CALIBRATION_H_
#define _GOP_CALIBRATION_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "ColmapModel.h"


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

// projection model of a camera
enum CAMERA_TYPE {
	CAMERA_PERSPECTIVE = 0,
	CAMERA_FISHEYE
};
GOP_API LPCTSTR CameraTypeName(CAMERA_TYPE type);

// per camera intrinsics and undistortion data, at the training resolution
struct GOP_API CalibrationRecord
{
	uint32_t ID; // COLMAP camera ID
	KMatrix K; // intrinsics of the undistorted image
	CAMERA_TYPE type; // projection model
	std::vector<double> params; // distortion parameters (empty if none)
	cv::Mat mapX, mapY; // undistortion maps (CV_32FC1), destination to source
	cv::Mat mask; // valid pixels of the undistorted image (CV_8UC1), fisheye only
	cv::Rect roi; // region of the undistorted image kept
	cv::Size size; // image size after undistortion and cropping

	CalibrationRecord() : ID(0), K(KMatrix::Identity()), type(CAMERA_PERSPECTIVE) {}

	bool HasDistortion() const { return !params.empty(); }
};
typedef std::map<uint32_t,CalibrationRecord> CalibrationRecordMap;

// build the record of the given camera, with the intrinsics
// and size divided by the downsample factor;
// returns false if the camera model is not supported
GOP_API bool MakeCalibrationRecord(const COLMAP::Camera& camera, unsigned nFactor, CalibrationRecord& record);

// scale the intrinsics and the size of the record
GOP_API void ScaleCalibrationRecord(CalibrationRecord& record, REAL sx, REAL sy);

// compute the undistortion maps of the record and update its intrinsics, ROI and size;
// nothing is done if the record has no distortion
GOP_API bool ComputeUndistortion(CalibrationRecord& record);
GOP_API bool ComputePerspectiveUndistortion(CalibrationRecord& record);
GOP_API bool ComputeFisheyeUndistortion(CalibrationRecord& record);

// largest distance of a camera center to the mean of all camera centers
GOP_API REAL ComputeSceneScale(const Matrix4x4Arr& camToWorlds);


// extra scene metadata (ext_metadata.json)
struct GOP_API ExtMetadata
{
	REAL spiralRadiusScale;
	bool bNoFactorSuffix;

	ExtMetadata() : spiralRadiusScale(1), bNoFactorSuffix(false) {}

	// update the values present in the file
	bool Load(const String& fileName);
};

// options of the calibration parser
struct GOP_API ParserOptions
{
	String strDataDir; // scene folder
	unsigned nFactor; // downsample factor of the images
	bool bNormalize; // bring the scene to a canonical frame
	unsigned nTestEvery; // kept for compatibility, not used by the split
	uint32_t nFirstFrame; // keyframe of the reconstruction to load

	ParserOptions() : nFactor(1), bNormalize(false), nTestEvery(8), nFirstFrame(0) {}
};

// reads the reconstruction of one keyframe and prepares
// the per camera calibration used to undistort the frames
class GOP_API Calibration
{
public:
	typedef std::unordered_map<String,IndexArr> PointIndicesMap;

public:
	ParserOptions options;

	StringArr imageNames; // image names, sorted
	Matrix4x4Arr camToWorlds; // camera-to-world pose of each image
	IndexArr cameraIDs; // COLMAP camera ID of each image
	CalibrationRecordMap records; // calibration of each COLMAP camera
	StringArr cameraPaths; // folder with the frames of each camera, sorted

	Point3fArr points; // sparse points
	std::vector<float> pointsError; // reprojection error of each point
	std::vector<cv::Vec3b> pointsRGB; // color of each point
	PointIndicesMap pointIndices; // indices of the points seen by each image

	Matrix4x4 transform; // normalization transform applied to the scene
	std::vector<Point2> bounds; // near/far depth bounds of each camera
	ExtMetadata extMetadata;
	REAL sceneScale;

public:
	Calibration() : transform(Matrix4x4::Identity()), sceneScale(0) {}

	void Release();
	bool Load(const ParserOptions& _options);

	size_t NumCameras() const { return imageNames.size(); }
	const CalibrationRecord& GetRecord(size_t idxCamera) const { return records.at(cameraIDs[idxCamera]); }
	String GetFramePath(size_t idxCamera, uint32_t frame) const;

	// save a summary of the calibration as JSON
	bool SaveJSON(const String& fileName) const;

	// the folder of the model of the given keyframe: colmap_K/sparse/0/, else sparse/0/
	static String FindModelFolder(const String& dataDir, uint32_t nFirstFrame);

protected:
	bool LoadModel(const COLMAP::Model& model);
	void LoadPoints(const COLMAP::Model& model);
	bool LoadBounds();
	bool Normalize();
	bool ListCameraPaths();
	bool ReconcileResolution();
};
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_CALIBRATION_H_
