/*
* ColmapModel.cpp
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
#include "ColmapModel.h"

using namespace GOP;
using namespace GOP::COLMAP;


// D E F I N E S ///////////////////////////////////////////////////

#define COLMAP_PRECISION std::numeric_limits<double>::max_digits10


// S T R U C T S ///////////////////////////////////////////////////

namespace {
struct CameraModelInfo {
	int id;
	LPCTSTR name;
	int numParams;
	bool bSingleFocal;
};
// see colmap/src/base/camera_models.h
const CameraModelInfo g_cameraModels[] = {
	{SIMPLE_PINHOLE, _T("SIMPLE_PINHOLE"), 3, true},
	{PINHOLE, _T("PINHOLE"), 4, false},
	{SIMPLE_RADIAL, _T("SIMPLE_RADIAL"), 4, true},
	{RADIAL, _T("RADIAL"), 5, true},
	{OPENCV, _T("OPENCV"), 8, false},
	{OPENCV_FISHEYE, _T("OPENCV_FISHEYE"), 8, false},
	{FULL_OPENCV, _T("FULL_OPENCV"), 12, false},
	{FOV, _T("FOV"), 5, false},
	{SIMPLE_RADIAL_FISHEYE, _T("SIMPLE_RADIAL_FISHEYE"), 4, true},
	{RADIAL_FISHEYE, _T("RADIAL_FISHEYE"), 5, true},
	{THIN_PRISM_FISHEYE, _T("THIN_PRISM_FISHEYE"), 12, false},
};
const CameraModelInfo* FindCameraModel(int model) {
	for (const CameraModelInfo& info: g_cameraModels)
		if (info.id == model)
			return &info;
	return NULL;
}
} // namespace

int COLMAP::CameraModelFromName(const String& name)
{
	for (const CameraModelInfo& info: g_cameraModels)
		if (name == info.name)
			return info.id;
	return UNKNOWN_MODEL;
}
LPCTSTR COLMAP::CameraModelName(int model)
{
	const CameraModelInfo* info(FindCameraModel(model));
	return info ? info->name : NULL;
}
int COLMAP::CameraModelNumParams(int model)
{
	const CameraModelInfo* info(FindCameraModel(model));
	return info ? info->numParams : -1;
}
/*----------------------------------------------------------------*/

bool COLMAP::NextLine(std::istream& stream, std::istringstream& in, bool bIgnoreEmpty)
{
	String line;
	do {
		std::getline(stream, line);
		Util::strTrim(line, _T(" \r"));
		if (stream.fail())
			return false;
	} while (((bIgnoreEmpty && line.empty()) || (!line.empty() && line[0u] == '#')) && stream.good());
	in.clear();
	in.str(line);
	return true;
}
/*----------------------------------------------------------------*/


bool Camera::HasSingleFocal() const
{
	const CameraModelInfo* info(FindCameraModel(ModelID()));
	return info != NULL && info->bSingleFocal;
}

std::vector<double> Camera::ExtraParams() const
{
	const size_t numIntrinsics(HasSingleFocal() ? 3 : 4);
	if (params.size() <= numIntrinsics)
		return std::vector<double>();
	return std::vector<double>(params.begin()+numIntrinsics, params.end());
}

bool Camera::ReadTXT(std::istream& stream)
{
	std::istringstream in;
	if (!NextLine(stream, in))
		return false;
	in >> ID >> model >> width >> height;
	if (in.fail())
		return false;
	const int numParams(CameraModelNumParams(ModelID()));
	if (numParams < 0) {
		VERBOSE("error: unknown camera model '%s'", model.c_str());
		return false;
	}
	params.resize(numParams);
	for (double& param: params)
		in >> param;
	return !in.fail();
}

// see: colmap/src/base/reconstruction.cc
// 		void Reconstruction::ReadCamerasBinary(const std::string& path)
bool Camera::ReadBIN(std::istream& stream)
{
	ID = ReadBinaryLittleEndian<camera_t>(&stream);
	const int modelID(ReadBinaryLittleEndian<int>(&stream));
	width = (uint32_t)ReadBinaryLittleEndian<uint64_t>(&stream);
	height = (uint32_t)ReadBinaryLittleEndian<uint64_t>(&stream);
	if (stream.fail())
		return false;
	const LPCTSTR name(CameraModelName(modelID));
	if (name == NULL) {
		VERBOSE("error: unknown camera model ID %d", modelID);
		return false;
	}
	model = name;
	params.resize(CameraModelNumParams(modelID));
	ReadBinaryLittleEndian<double>(&stream, &params);
	return !stream.fail();
}

bool Camera::WriteTXT(std::ostream& out) const
{
	out << ID << _T(" ") << model << _T(" ") << width << _T(" ") << height;
	for (double param: params)
		out << _T(" ") << std::setprecision(COLMAP_PRECISION) << param;
	out << std::endl;
	return !out.fail();
}

bool Camera::WriteBIN(std::ostream& out) const
{
	WriteBinaryLittleEndian<camera_t>(&out, ID);
	WriteBinaryLittleEndian<int>(&out, ModelID());
	WriteBinaryLittleEndian<uint64_t>(&out, width);
	WriteBinaryLittleEndian<uint64_t>(&out, height);
	WriteBinaryLittleEndian<double>(&out, params);
	return !out.fail();
}
/*----------------------------------------------------------------*/


Matrix4x4 Image::WorldToCamera() const
{
	Matrix4x4 worldToCamera(Matrix4x4::Identity());
	worldToCamera.topLeftCorner<3,3>() = R();
	worldToCamera.block<3,1>(0,3) = t;
	return worldToCamera;
}

bool Image::ReadTXT(std::istream& stream)
{
	std::istringstream in;
	if (!NextLine(stream, in))
		return false;
	in  >> ID
		>> q(0) >> q(1) >> q(2) >> q(3)
		>> t(0) >> t(1) >> t(2)
		>> idCamera >> name;
	if (in.fail())
		return false;
	projs.clear();
	if (!NextLine(stream, in, false))
		return true; // the last image might miss the projections line
	while (true) {
		Proj proj;
		int64_t idPoint;
		in >> proj.p(0) >> proj.p(1) >> idPoint;
		if (in.fail())
			break;
		proj.idPoint = (point3D_t)idPoint;
		projs.emplace_back(proj);
	}
	return true;
}

// see: colmap/src/base/reconstruction.cc
// 		void Reconstruction::ReadImagesBinary(const std::string& path)
bool Image::ReadBIN(std::istream& stream)
{
	ID = ReadBinaryLittleEndian<image_t>(&stream);
	q(0) = ReadBinaryLittleEndian<double>(&stream);
	q(1) = ReadBinaryLittleEndian<double>(&stream);
	q(2) = ReadBinaryLittleEndian<double>(&stream);
	q(3) = ReadBinaryLittleEndian<double>(&stream);
	t(0) = ReadBinaryLittleEndian<double>(&stream);
	t(1) = ReadBinaryLittleEndian<double>(&stream);
	t(2) = ReadBinaryLittleEndian<double>(&stream);
	idCamera = ReadBinaryLittleEndian<camera_t>(&stream);
	name.clear();
	char nameChar;
	while (stream.read(&nameChar, 1) && nameChar != '\0')
		name += nameChar;
	const size_t numPoints2D = ReadBinaryLittleEndian<uint64_t>(&stream);
	if (stream.fail())
		return false;
	projs.resize(numPoints2D);
	for (Proj& proj: projs) {
		proj.p(0) = ReadBinaryLittleEndian<double>(&stream);
		proj.p(1) = ReadBinaryLittleEndian<double>(&stream);
		proj.idPoint = ReadBinaryLittleEndian<point3D_t>(&stream);
	}
	return !stream.fail();
}

bool Image::WriteTXT(std::ostream& out) const
{
	out << std::setprecision(COLMAP_PRECISION)
		<< ID << _T(" ")
		<< q(0) << _T(" ") << q(1) << _T(" ") << q(2) << _T(" ") << q(3) << _T(" ")
		<< t(0) << _T(" ") << t(1) << _T(" ") << t(2) << _T(" ")
		<< idCamera << _T(" ") << name
		<< std::endl;
	for (const Proj& proj: projs) {
		out << proj.p(0) << _T(" ") << proj.p(1) << _T(" ") << (int64_t)proj.idPoint << _T(" ");
		if (out.fail())
			return false;
	}
	out << std::endl;
	return !out.fail();
}

bool Image::WriteBIN(std::ostream& out) const
{
	WriteBinaryLittleEndian<image_t>(&out, ID);
	for (int i=0; i<4; ++i)
		WriteBinaryLittleEndian<double>(&out, q(i));
	for (int i=0; i<3; ++i)
		WriteBinaryLittleEndian<double>(&out, t(i));
	WriteBinaryLittleEndian<camera_t>(&out, idCamera);
	out.write(name.c_str(), (std::streamsize)name.size()+1);
	WriteBinaryLittleEndian<uint64_t>(&out, projs.size());
	for (const Proj& proj: projs) {
		WriteBinaryLittleEndian<double>(&out, proj.p(0));
		WriteBinaryLittleEndian<double>(&out, proj.p(1));
		WriteBinaryLittleEndian<point3D_t>(&out, proj.idPoint);
	}
	return !out.fail();
}
/*----------------------------------------------------------------*/


bool Point::ReadTXT(std::istream& stream)
{
	std::istringstream in;
	if (!NextLine(stream, in))
		return false;
	int r,g,b;
	in  >> ID
		>> p(0) >> p(1) >> p(2)
		>> r >> g >> b
		>> e;
	if (in.fail())
		return false;
	c = cv::Vec3b((uint8_t)CLAMP(r,0,255), (uint8_t)CLAMP(g,0,255), (uint8_t)CLAMP(b,0,255));
	tracks.clear();
	while (true) {
		Track track;
		in >> track.idImage >> track.idProj;
		if (in.fail())
			break;
		tracks.emplace_back(track);
	}
	return true;
}

// see: colmap/src/base/reconstruction.cc
// 		void Reconstruction::ReadPoints3DBinary(const std::string& path)
bool Point::ReadBIN(std::istream& stream)
{
	ID = ReadBinaryLittleEndian<point3D_t>(&stream);
	p(0) = ReadBinaryLittleEndian<double>(&stream);
	p(1) = ReadBinaryLittleEndian<double>(&stream);
	p(2) = ReadBinaryLittleEndian<double>(&stream);
	c[0] = ReadBinaryLittleEndian<uint8_t>(&stream);
	c[1] = ReadBinaryLittleEndian<uint8_t>(&stream);
	c[2] = ReadBinaryLittleEndian<uint8_t>(&stream);
	e = ReadBinaryLittleEndian<double>(&stream);
	const size_t trackLength = ReadBinaryLittleEndian<uint64_t>(&stream);
	if (stream.fail())
		return false;
	tracks.resize(trackLength);
	for (Track& track: tracks) {
		track.idImage = ReadBinaryLittleEndian<image_t>(&stream);
		track.idProj = ReadBinaryLittleEndian<point2D_t>(&stream);
	}
	return !stream.fail();
}

bool Point::WriteTXT(std::ostream& out) const
{
	out << std::setprecision(COLMAP_PRECISION)
		<< ID << _T(" ")
		<< p(0) << _T(" ") << p(1) << _T(" ") << p(2) << _T(" ")
		<< (int)c[0] << _T(" ") << (int)c[1] << _T(" ") << (int)c[2] << _T(" ")
		<< e;
	for (const Track& track: tracks) {
		out << _T(" ") << track.idImage << _T(" ") << track.idProj;
		if (out.fail())
			return false;
	}
	out << std::endl;
	return !out.fail();
}

bool Point::WriteBIN(std::ostream& out) const
{
	WriteBinaryLittleEndian<point3D_t>(&out, ID);
	for (int i=0; i<3; ++i)
		WriteBinaryLittleEndian<double>(&out, p(i));
	for (int i=0; i<3; ++i)
		WriteBinaryLittleEndian<uint8_t>(&out, c[i]);
	WriteBinaryLittleEndian<double>(&out, e);
	WriteBinaryLittleEndian<uint64_t>(&out, tracks.size());
	for (const Track& track: tracks) {
		WriteBinaryLittleEndian<image_t>(&out, track.idImage);
		WriteBinaryLittleEndian<point2D_t>(&out, track.idProj);
	}
	return !out.fail();
}
/*----------------------------------------------------------------*/


bool Model::DetermineInputSource(const String& filenameTXT, const String& filenameBIN, std::ifstream& file, String& filename, bool& binary)
{
	file.open(filenameTXT);
	if (file.good()) {
		filename = filenameTXT;
		binary = false;
		return true;
	}
	file.clear();
	file.open(filenameBIN, std::ios::binary);
	if (file.good()) {
		filename = filenameBIN;
		binary = true;
		return true;
	}
	VERBOSE("error: unable to open file '%s'", filenameTXT.c_str());
	VERBOSE("error: unable to open file '%s'", filenameBIN.c_str());
	return false;
}

bool Model::Exists(const String& folder)
{
	return File::isFile((folder+COLMAP_CAMERAS_TXT).c_str()) || File::isFile((folder+COLMAP_CAMERAS_BIN).c_str());
}

namespace {
// read all the elements of one model file into the given container
template <typename TYPE, typename FUNC>
bool ReadModelFile(const String& filenameTXT, const String& filenameBIN, LPCTSTR what, FUNC insert)
{
	std::ifstream file;
	String filename;
	bool binary;
	if (!Model::DetermineInputSource(filenameTXT, filenameBIN, file, filename, binary))
		return false;
	DEBUG_EXTRA("Reading %s: %s", what, filename.c_str());
	if (binary) {
		const uint64_t num(ReadBinaryLittleEndian<uint64_t>(&file));
		if (file.fail()) {
			VERBOSE("error: invalid %s file '%s'", what, filename.c_str());
			return false;
		}
		for (uint64_t i=0; i<num; ++i) {
			TYPE elem;
			if (!elem.ReadBIN(file)) {
				VERBOSE("error: invalid %s file '%s'", what, filename.c_str());
				return false;
			}
			insert(std::move(elem));
		}
	} else {
		TYPE elem;
		while (file.good() && elem.ReadTXT(file))
			insert(std::move(elem));
	}
	return true;
}
} // namespace

bool Model::Load(const String& folder)
{
	Release();
	if (!ReadModelFile<Camera>(folder+COLMAP_CAMERAS_TXT, folder+COLMAP_CAMERAS_BIN, _T("cameras"),
		[this](Camera&& camera) { cameras[camera.ID] = std::move(camera); }))
		return false;
	if (!ReadModelFile<Image>(folder+COLMAP_IMAGES_TXT, folder+COLMAP_IMAGES_BIN, _T("images"),
		[this](Image&& image) { images[image.ID] = std::move(image); }))
		return false;
	if (!ReadModelFile<Point>(folder+COLMAP_POINTS_TXT, folder+COLMAP_POINTS_BIN, _T("points"),
		[this](Point&& point) { points.emplace_back(std::move(point)); }))
		return false;
	// validate the references
	for (const auto& image: images) {
		if (cameras.find(image.second.idCamera) == cameras.end()) {
			VERBOSE("error: image %u references missing camera %u", image.first, image.second.idCamera);
			return false;
		}
	}
	DEBUG("COLMAP model loaded: %u cameras, %u images, %u points",
		(unsigned)cameras.size(), (unsigned)images.size(), (unsigned)points.size());
	return true;
} // Load
/*----------------------------------------------------------------*/

bool Model::Save(const String& folder, bool bBinary) const
{
	if (!File::createFolder(folder.c_str())) {
		VERBOSE("error: can not create folder '%s'", folder.c_str());
		return false;
	}
	const std::ios::openmode mode(bBinary ? std::ios::out|std::ios::binary : std::ios::out);
	// cameras
	{
		const String filename(folder + (bBinary ? COLMAP_CAMERAS_BIN : COLMAP_CAMERAS_TXT));
		std::ofstream file(filename, mode);
		if (!file.good()) {
			VERBOSE("error: unable to create file '%s'", filename.c_str());
			return false;
		}
		if (bBinary) {
			WriteBinaryLittleEndian<uint64_t>(&file, cameras.size());
		} else {
			file << _T("# Camera list with one line of data per camera:") << std::endl;
			file << _T("#   CAMERA_ID, MODEL, WIDTH, HEIGHT, PARAMS[]") << std::endl;
		}
		for (const auto& camera: cameras)
			if (!(bBinary ? camera.second.WriteBIN(file) : camera.second.WriteTXT(file)))
				return false;
	}
	// images
	{
		const String filename(folder + (bBinary ? COLMAP_IMAGES_BIN : COLMAP_IMAGES_TXT));
		std::ofstream file(filename, mode);
		if (!file.good()) {
			VERBOSE("error: unable to create file '%s'", filename.c_str());
			return false;
		}
		if (bBinary) {
			WriteBinaryLittleEndian<uint64_t>(&file, images.size());
		} else {
			file << _T("# Image list with two lines of data per image:") << std::endl;
			file << _T("#   IMAGE_ID, QW, QX, QY, QZ, TX, TY, TZ, CAMERA_ID, NAME") << std::endl;
			file << _T("#   POINTS2D[] as (X, Y, POINT3D_ID)") << std::endl;
		}
		for (const auto& image: images)
			if (!(bBinary ? image.second.WriteBIN(file) : image.second.WriteTXT(file)))
				return false;
	}
	// points
	{
		const String filename(folder + (bBinary ? COLMAP_POINTS_BIN : COLMAP_POINTS_TXT));
		std::ofstream file(filename, mode);
		if (!file.good()) {
			VERBOSE("error: unable to create file '%s'", filename.c_str());
			return false;
		}
		if (bBinary) {
			WriteBinaryLittleEndian<uint64_t>(&file, points.size());
		} else {
			file << _T("# 3D point list with one line of data per point:") << std::endl;
			file << _T("#   POINT3D_ID, X, Y, Z, R, G, B, ERROR, TRACK[] as (IMAGE_ID, POINT2D_IDX)") << std::endl;
		}
		for (const Point& point: points)
			if (!(bBinary ? point.WriteBIN(file) : point.WriteTXT(file)))
				return false;
	}
	return true;
} // Save
/*----------------------------------------------------------------*/
