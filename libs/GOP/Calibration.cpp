/*
* Calibration.cpp
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
#include "Calibration.h"
#include "PoseConverter.h"
#include <nlohmann/json.hpp>

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////

// depth bounds used when the scene has no pose bundle file
#define DEFAULT_NEAR_BOUND 0.01
#define DEFAULT_FAR_BOUND 1.0


// S T R U C T S ///////////////////////////////////////////////////

LPCTSTR GOP::CameraTypeName(CAMERA_TYPE type)
{
	switch (type) {
	case CAMERA_PERSPECTIVE: return _T("perspective");
	case CAMERA_FISHEYE: return _T("fisheye");
	}
	return _T("unknown");
}

bool GOP::MakeCalibrationRecord(const COLMAP::Camera& camera, unsigned nFactor, CalibrationRecord& record)
{
	ASSERT(nFactor > 0);
	record = CalibrationRecord();
	record.ID = camera.ID;
	const int model(camera.ModelID());
	if (model < 0 || (int)camera.params.size() != COLMAP::CameraModelNumParams(model)) {
		VERBOSE("error: invalid camera %u of model '%s'", camera.ID, camera.model.c_str());
		return false;
	}
	const std::vector<double> extra(camera.ExtraParams());
	switch (model) {
	case COLMAP::SIMPLE_PINHOLE:
	case COLMAP::PINHOLE:
		break;
	case COLMAP::SIMPLE_RADIAL:
		record.params = {extra[0], 0.0, 0.0, 0.0};
		break;
	case COLMAP::RADIAL:
		record.params = {extra[0], extra[1], 0.0, 0.0};
		break;
	case COLMAP::OPENCV:
		record.params = {extra[0], extra[1], extra[2], extra[3]};
		break;
	case COLMAP::OPENCV_FISHEYE:
		record.params = {extra[0], extra[1], extra[2], extra[3]};
		record.type = CAMERA_FISHEYE;
		break;
	default:
		VERBOSE("error: camera %u: only perspective and fisheye cameras are supported, got '%s'", camera.ID, camera.model.c_str());
		return false;
	}
	record.K <<
		camera.fx(), 0, camera.cx(),
		0, camera.fy(), camera.cy(),
		0, 0, 1;
	record.K.topRows<2>() /= REAL(nFactor);
	record.size = cv::Size((int)(camera.width/nFactor), (int)(camera.height/nFactor));
	record.roi = cv::Rect(cv::Point(0,0), record.size);
	return true;
} // MakeCalibrationRecord
/*----------------------------------------------------------------*/

void GOP::ScaleCalibrationRecord(CalibrationRecord& record, REAL sx, REAL sy)
{
	record.K.row(0) *= sx;
	record.K.row(1) *= sy;
	record.size = cv::Size((int)(record.size.width*sx), (int)(record.size.height*sy));
	record.roi = cv::Rect(cv::Point(0,0), record.size);
} // ScaleCalibrationRecord
/*----------------------------------------------------------------*/

bool GOP::ComputeUndistortion(CalibrationRecord& record)
{
	if (!record.HasDistortion())
		return true;
	switch (record.type) {
	case CAMERA_PERSPECTIVE: return ComputePerspectiveUndistortion(record);
	case CAMERA_FISHEYE: return ComputeFisheyeUndistortion(record);
	}
	return false;
} // ComputeUndistortion

bool GOP::ComputePerspectiveUndistortion(CalibrationRecord& record)
{
	cv::Mat K;
	cv::eigen2cv(record.K, K);
	const cv::Mat distCoeffs(record.params, true);
	cv::Rect roi;
	const cv::Mat Knew(cv::getOptimalNewCameraMatrix(K, distCoeffs, record.size, 0, record.size, &roi));
	cv::initUndistortRectifyMap(K, distCoeffs, cv::Mat(), Knew, record.size, CV_32FC1, record.mapX, record.mapY);
	if (roi.area() <= 0) {
		VERBOSE("error: camera %u: empty undistorted image region", record.ID);
		return false;
	}
	cv::cv2eigen(Knew, record.K);
	record.roi = roi;
	record.size = roi.size();
	record.mask.release();
	return true;
} // ComputePerspectiveUndistortion

// closed form fisheye model: for each pixel of the undistorted image
// the source pixel is obtained by scaling its normalized coordinates
// with the polynomial r(theta) = 1 + k1*theta^2 + k2*theta^4 + k3*theta^6 + k4*theta^8
bool GOP::ComputeFisheyeUndistortion(CalibrationRecord& record)
{
	ASSERT(record.params.size() == 4);
	const REAL fx(record.K(0,0)), fy(record.K(1,1));
	const REAL cx(record.K(0,2)), cy(record.K(1,2));
	const REAL k1(record.params[0]), k2(record.params[1]), k3(record.params[2]), k4(record.params[3]);
	const int width(record.size.width), height(record.size.height);
	record.mapX.create(height, width, CV_32FC1);
	record.mapY.create(height, width, CV_32FC1);
	cv::Mat mask(height, width, CV_8UC1);
	for (int v=0; v<height; ++v) {
		float* const mapX(record.mapX.ptr<float>(v));
		float* const mapY(record.mapY.ptr<float>(v));
		uint8_t* const valid(mask.ptr<uint8_t>(v));
		for (int u=0; u<width; ++u) {
			const REAL x1((REAL(u)-cx)/fx);
			const REAL y1((REAL(v)-cy)/fy);
			const REAL theta2(SQUARE(x1)+SQUARE(y1));
			const REAL r(REAL(1) + theta2*(k1 + theta2*(k2 + theta2*(k3 + theta2*k4))));
			mapX[u] = (float)(fx*x1*r + REAL(width/2));
			mapY[u] = (float)(fy*y1*r + REAL(height/2));
			valid[u] = (mapX[u] > 0 && mapY[u] > 0 && mapX[u] < float(width-1) && mapY[u] < float(height-1)) ? 255 : 0;
		}
	}
	const cv::Rect roi(cv::boundingRect(mask));
	if (roi.area() <= 0) {
		VERBOSE("error: camera %u: fisheye undistortion leaves no valid pixel", record.ID);
		return false;
	}
	record.mask = mask(roi).clone();
	record.K(0,2) -= roi.x;
	record.K(1,2) -= roi.y;
	record.roi = roi;
	record.size = roi.size();
	return true;
} // ComputeFisheyeUndistortion
/*----------------------------------------------------------------*/

REAL GOP::ComputeSceneScale(const Matrix4x4Arr& camToWorlds)
{
	if (camToWorlds.empty())
		return REAL(0);
	Point3 center(Point3::Zero());
	for (const Matrix4x4& c2w: camToWorlds)
		center += c2w.block<3,1>(0,3);
	center /= REAL(camToWorlds.size());
	REAL scale(0);
	for (const Matrix4x4& c2w: camToWorlds)
		scale = MAXF(scale, (c2w.block<3,1>(0,3)-center).norm());
	return scale;
} // ComputeSceneScale
/*----------------------------------------------------------------*/


bool ExtMetadata::Load(const String& fileName)
{
	std::ifstream file(fileName);
	if (!file.good()) {
		VERBOSE("error: unable to open file '%s'", fileName.c_str());
		return false;
	}
	try {
		const nlohmann::json json(nlohmann::json::parse(file));
		if (json.contains("spiral_radius_scale"))
			spiralRadiusScale = json["spiral_radius_scale"].get<REAL>();
		if (json.contains("no_factor_suffix"))
			bNoFactorSuffix = json["no_factor_suffix"].get<bool>();
	}
	catch (const nlohmann::json::exception& e) {
		VERBOSE("error: invalid metadata file '%s': %s", fileName.c_str(), e.what());
		return false;
	}
	return true;
} // Load
/*----------------------------------------------------------------*/


void Calibration::Release()
{
	imageNames.clear();
	camToWorlds.clear();
	cameraIDs.clear();
	records.clear();
	cameraPaths.clear();
	points.clear();
	pointsError.clear();
	pointsRGB.clear();
	pointIndices.clear();
	transform.setIdentity();
	bounds.clear();
	extMetadata = ExtMetadata();
	sceneScale = 0;
}

String Calibration::FindModelFolder(const String& dataDir, uint32_t nFirstFrame)
{
	const String folderKeyframe(dataDir + String::FormatString(GOP_PROJECT_PREFIX "%u/sparse/0/", nFirstFrame));
	if (File::isFolder(folderKeyframe.c_str()))
		return folderKeyframe;
	const String folder(dataDir + _T("sparse/0/"));
	if (File::isFolder(folder.c_str()))
		return folder;
	VERBOSE("error: COLMAP folder '%s' does not exist", folderKeyframe.c_str());
	return String();
}

String Calibration::GetFramePath(size_t idxCamera, uint32_t frame) const
{
	return cameraPaths[idxCamera] + FormatFrameName(frame);
}

// extract the poses of the images and the calibration of their cameras;
// the images are sorted by name
bool Calibration::LoadModel(const COLMAP::Model& model)
{
	if (model.images.empty()) {
		VERBOSE("error: no images found in COLMAP model");
		return false;
	}
	struct ImageData {
		String name;
		Matrix4x4 camToWorld;
		uint32_t cameraID;
	};
	std::vector<ImageData, Eigen::aligned_allocator<ImageData> > images;
	images.reserve(model.images.size());
	bool bDistorted(false);
	for (const auto& itImage: model.images) {
		const COLMAP::Image& image = itImage.second;
		const auto itCamera(model.cameras.find(image.idCamera));
		if (itCamera == model.cameras.end()) {
			VERBOSE("error: image '%s' references missing camera %u", image.name.c_str(), image.idCamera);
			return false;
		}
		const COLMAP::Camera& camera = itCamera->second;
		if (records.find(camera.ID) == records.end()) {
			CalibrationRecord record;
			if (!MakeCalibrationRecord(camera, options.nFactor, record))
				return false;
			if (camera.ModelID() != COLMAP::SIMPLE_PINHOLE && camera.ModelID() != COLMAP::PINHOLE)
				bDistorted = true;
			records.emplace(camera.ID, std::move(record));
		}
		images.push_back(ImageData{image.name, image.WorldToCamera().inverse(), image.idCamera});
	}
	VERBOSE("COLMAP model: %u images, taken by %u cameras", (unsigned)images.size(), (unsigned)records.size());
	if (bDistorted)
		VERBOSE("warning: COLMAP cameras are not PINHOLE; images have distortion");
	std::stable_sort(images.begin(), images.end(), [](const ImageData& a, const ImageData& b) { return a.name < b.name; });
	for (const ImageData& image: images) {
		imageNames.push_back(image.name);
		camToWorlds.push_back(image.camToWorld);
		cameraIDs.push_back(image.cameraID);
	}
	return true;
} // LoadModel

void Calibration::LoadPoints(const COLMAP::Model& model)
{
	points.resize(model.points.size());
	pointsError.resize(model.points.size());
	pointsRGB.resize(model.points.size());
	FOREACH(idx, model.points) {
		const COLMAP::Point& point = model.points[idx];
		points[idx] = point.p.cast<float>();
		pointsError[idx] = (float)point.e;
		pointsRGB[idx] = point.c;
		for (const COLMAP::Point::Track& track: point.tracks) {
			const auto itImage(model.images.find(track.idImage));
			if (itImage == model.images.end())
				continue;
			pointIndices[itImage->second.name].push_back((uint32_t)idx);
		}
	}
} // LoadPoints

// depth bounds: the last two columns of the pose bundle if present
bool Calibration::LoadBounds()
{
	const String fileName(options.strDataDir + GOP_POSES_FILE);
	if (!File::isFile(fileName.c_str())) {
		bounds.assign(1, Point2(DEFAULT_NEAR_BOUND, DEFAULT_FAR_BOUND));
		return true;
	}
	NPY npy;
	if (!npy.Load(fileName))
		return false;
	if (npy.shape.size() != 2 || npy.cols() < 2) {
		VERBOSE("error: invalid pose bundle file '%s'", fileName.c_str());
		return false;
	}
	bounds.resize(npy.rows());
	FOREACH(i, bounds)
		bounds[i] = Point2(npy(i, npy.cols()-2), npy(i, npy.cols()-1));
	return true;
} // LoadBounds

bool Calibration::Normalize()
{
	const Matrix4x4 T1(SimilarityFromCameras(camToWorlds));
	TransformCameras(T1, camToWorlds);
	TransformPoints(T1, points);
	Matrix4x4 T2;
	if (!AlignPrincipalAxes(points, T2)) {
		VERBOSE("warning: not enough points to align the scene principal axes");
		T2.setIdentity();
	}
	TransformCameras(T2, camToWorlds);
	TransformPoints(T2, points);
	transform = T2*T1;
	#if TD_VERBOSE != TD_VERBOSE_OFF
	if (VERBOSITY_LEVEL > 1) {
		Matrix3x3 R; Point3 t; REAL s;
		DecomposeSimilarityTransform(transform, R, t, s);
		DEBUG_EXTRA("Scene normalized: scale %g, translation [%g %g %g]", s, t.x(), t.y(), t.z());
	}
	#endif
	return true;
} // Normalize

// the frames of each camera are stored in a sub-folder of png/;
// the sorted camera folders must correspond one to one to the sorted images
bool Calibration::ListCameraPaths()
{
	const String pngFolder(options.strDataDir + GOP_PNG_FOLDER);
	const StringArr folders(File::listFolder(pngFolder.c_str(), true));
	if (folders.size() != imageNames.size()) {
		VERBOSE("error: %u camera folders found in '%s' for %u images", (unsigned)folders.size(), pngFolder.c_str(), (unsigned)imageNames.size());
		return false;
	}
	FOREACH(i, imageNames) {
		if (imageNames[i] != FormatImageName((uint32_t)i)) {
			VERBOSE("error: image %u is named '%s' instead of '%s'", (unsigned)i, imageNames[i].c_str(), FormatImageName((uint32_t)i).c_str());
			return false;
		}
		cameraPaths.push_back(pngFolder + folders[i] + PATH_SEPARATOR_STR);
	}
	return true;
} // ListCameraPaths

// the reconstruction can be done at a different resolution than the frames:
// scale the intrinsics to the actual resolution of the frames
bool Calibration::ReconcileResolution()
{
	const String fileName(GetFramePath(0, options.nFirstFrame));
	const cv::Mat image(cv::imread(fileName, cv::IMREAD_COLOR));
	if (image.empty()) {
		VERBOSE("error: unable to read image '%s'", fileName.c_str());
		return false;
	}
	const int actualWidth(image.cols/(int)options.nFactor);
	const int actualHeight(image.rows/(int)options.nFactor);
	const cv::Size& colmapSize(records.at(cameraIDs.front()).size);
	if (colmapSize.area() <= 0) {
		VERBOSE("error: invalid size of camera %u", cameraIDs.front());
		return false;
	}
	const REAL sx(REAL(actualWidth)/REAL(colmapSize.width));
	const REAL sy(REAL(actualHeight)/REAL(colmapSize.height));
	if (sx != REAL(1) || sy != REAL(1))
		DEBUG("Frames resolution differs from the reconstruction: scaling intrinsics by %g x %g", sx, sy);
	for (auto& itRecord: records)
		ScaleCalibrationRecord(itRecord.second, sx, sy);
	return true;
} // ReconcileResolution

bool Calibration::Load(const ParserOptions& _options)
{
	TD_TIMER_START();
	Release();
	options = _options;
	Util::ensureValidFolderPath(options.strDataDir);
	if (options.nFactor == 0) {
		VERBOSE("error: invalid downsample factor");
		return false;
	}

	// load the sparse reconstruction
	const String modelFolder(FindModelFolder(options.strDataDir, options.nFirstFrame));
	if (modelFolder.empty())
		return false;
	COLMAP::Model model;
	if (!model.Load(modelFolder))
		return false;
	if (!LoadModel(model))
		return false;

	// load scene metadata
	const String fileMetadata(options.strDataDir + GOP_EXT_METADATA_FILE);
	if (File::isFile(fileMetadata.c_str()) && !extMetadata.Load(fileMetadata))
		return false;
	if (!LoadBounds())
		return false;

	LoadPoints(model);
	if (options.bNormalize && !Normalize())
		return false;

	if (!ListCameraPaths())
		return false;
	if (!ReconcileResolution())
		return false;
	for (auto& itRecord: records)
		if (!ComputeUndistortion(itRecord.second))
			return false;

	sceneScale = ComputeSceneScale(camToWorlds);
	VERBOSE("Calibration loaded from '%s': %u cameras, %u points, scene scale %g (%s)",
		modelFolder.c_str(), (unsigned)NumCameras(), (unsigned)points.size(), sceneScale, TD_TIMER_GET_FMT().c_str());
	return true;
} // Load
/*----------------------------------------------------------------*/

bool Calibration::SaveJSON(const String& fileName) const
{
	nlohmann::json json;
	json["data_dir"] = options.strDataDir;
	json["factor"] = options.nFactor;
	json["first_frame"] = options.nFirstFrame;
	json["normalize"] = options.bNormalize;
	json["scene_scale"] = sceneScale;
	json["num_points"] = points.size();
	for (int r=0; r<4; ++r)
		json["transform"].push_back(nlohmann::json::array({transform(r,0), transform(r,1), transform(r,2), transform(r,3)}));
	FOREACH(i, imageNames) {
		const CalibrationRecord& record = GetRecord(i);
		nlohmann::json camera;
		camera["name"] = imageNames[i];
		camera["camera_id"] = record.ID;
		camera["model"] = CameraTypeName(record.type);
		camera["params"] = record.params;
		camera["width"] = record.size.width;
		camera["height"] = record.size.height;
		camera["roi"] = nlohmann::json::array({record.roi.x, record.roi.y, record.roi.width, record.roi.height});
		for (int r=0; r<3; ++r)
			camera["K"].push_back(nlohmann::json::array({record.K(r,0), record.K(r,1), record.K(r,2)}));
		for (int r=0; r<4; ++r)
			camera["camtoworld"].push_back(nlohmann::json::array({camToWorlds[i](r,0), camToWorlds[i](r,1), camToWorlds[i](r,2), camToWorlds[i](r,3)}));
		json["cameras"].push_back(camera);
	}
	Util::ensureFolder(fileName);
	std::ofstream file(fileName);
	if (!file.good()) {
		VERBOSE("error: unable to create file '%s'", fileName.c_str());
		return false;
	}
	file << json.dump(1, '\t') << std::endl;
	return !file.fail();
} // SaveJSON
/*----------------------------------------------------------------*/
