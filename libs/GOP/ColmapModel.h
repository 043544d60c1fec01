/*
* ColmapModel.h
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

#ifndef _GOP_COLMAPMODEL_H_
#define _GOP_COLMAPMODEL_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "Common.h"


// D E F I N E S ///////////////////////////////////////////////////

#define COLMAP_CAMERAS_TXT _T("cameras.txt")
#define COLMAP_IMAGES_TXT _T("images.txt")
#define COLMAP_POINTS_TXT _T("points3D.txt")
#define COLMAP_CAMERAS_BIN _T("cameras.bin")
#define COLMAP_IMAGES_BIN _T("images.bin")
#define COLMAP_POINTS_BIN _T("points3D.bin")


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

namespace COLMAP {

// see colmap/src/util/types.h
typedef uint32_t camera_t;
typedef uint32_t image_t;
typedef uint32_t point2D_t;
typedef uint64_t point3D_t;

enum CAMERA_MODEL {
	SIMPLE_PINHOLE = 0,
	PINHOLE = 1,
	SIMPLE_RADIAL = 2,
	RADIAL = 3,
	OPENCV = 4,
	OPENCV_FISHEYE = 5,
	FULL_OPENCV = 6,
	FOV = 7,
	SIMPLE_RADIAL_FISHEYE = 8,
	RADIAL_FISHEYE = 9,
	THIN_PRISM_FISHEYE = 10,
	UNKNOWN_MODEL = -1
};

// camera model name and number of parameters, by model ID
GOP_API int CameraModelFromName(const String& name);
GOP_API LPCTSTR CameraModelName(int model);
GOP_API int CameraModelNumParams(int model);

// read the next line containing data, skipping comments
GOP_API bool NextLine(std::istream& stream, std::istringstream& in, bool bIgnoreEmpty=true);

// structure describing a camera
struct GOP_API Camera {
	camera_t ID; // ID of the camera (1-based)
	String model; // camera model name
	uint32_t width, height; // camera resolution
	std::vector<double> params; // camera parameters

	Camera() : ID(0), width(0), height(0) {}
	bool operator < (const Camera& rhs) const { return ID < rhs.ID; }

	int ModelID() const { return CameraModelFromName(model); }
	// the model has a single focal length parameter
	bool HasSingleFocal() const;
	REAL fx() const { return params.empty() ? REAL(0) : params[0]; }
	REAL fy() const { return HasSingleFocal() ? fx() : params[1]; }
	REAL cx() const { return HasSingleFocal() ? params[1] : params[2]; }
	REAL cy() const { return HasSingleFocal() ? params[2] : params[3]; }
	// the distortion parameters following the focal length and principal point
	std::vector<double> ExtraParams() const;

	// Camera list with one line of data per camera:
	//   CAMERA_ID, MODEL, WIDTH, HEIGHT, PARAMS[]
	bool ReadTXT(std::istream& stream);
	bool ReadBIN(std::istream& stream);
	bool WriteTXT(std::ostream& out) const;
	bool WriteBIN(std::ostream& out) const;
};
typedef std::map<camera_t,Camera> CameraMap;

// structure describing an image
struct GOP_API Image {
	struct Proj {
		Point2 p;
		point3D_t idPoint;
	};
	image_t ID; // ID of the image (1-based)
	Vec4 q; // world-to-camera rotation (w, x, y, z)
	Point3 t; // world-to-camera translation
	camera_t idCamera; // ID of the associated camera
	String name; // image file name
	std::vector<Proj> projs; // known image projections

	Image() : ID(0), q(1,0,0,0), t(Point3::Zero()), idCamera(0) {}
	bool operator < (const Image& rhs) const { return ID < rhs.ID; }

	Matrix3x3 R() const { return QuaternionToRotation(q); }
	Matrix4x4 WorldToCamera() const;

	// Image list with two lines of data per image:
	//   IMAGE_ID, QW, QX, QY, QZ, TX, TY, TZ, CAMERA_ID, NAME
	//   POINTS2D[] as (X, Y, POINT3D_ID)
	bool ReadTXT(std::istream& stream);
	bool ReadBIN(std::istream& stream);
	bool WriteTXT(std::ostream& out) const;
	bool WriteBIN(std::ostream& out) const;
};
typedef std::map<image_t,Image> ImageMap;

// structure describing a 3D point
struct GOP_API Point {
	struct Track {
		image_t idImage;
		point2D_t idProj;
	};
	point3D_t ID; // ID of the point
	Point3 p; // position
	cv::Vec3b c; // RGB color
	REAL e; // reprojection error
	std::vector<Track> tracks; // point track

	Point() : ID(0), p(Point3::Zero()), c(0,0,0), e(0) {}

	// 3D point list with one line of data per point:
	//   POINT3D_ID, X, Y, Z, R, G, B, ERROR, TRACK[] as (IMAGE_ID, POINT2D_IDX)
	bool ReadTXT(std::istream& stream);
	bool ReadBIN(std::istream& stream);
	bool WriteTXT(std::ostream& out) const;
	bool WriteBIN(std::ostream& out) const;
};
typedef std::vector<Point> PointArr;

// sparse reconstruction as stored by COLMAP in a model folder
// (cameras, images and points3D in TXT or BIN format)
struct GOP_API Model {
	CameraMap cameras;
	ImageMap images;
	PointArr points;

	void Release() { cameras.clear(); images.clear(); points.clear(); }

	// load the model, preferring the TXT files if present
	bool Load(const String& folder);
	bool Save(const String& folder, bool bBinary=false) const;

	// find the file to read: the TXT file if present, else the BIN file
	static bool DetermineInputSource(const String& filenameTXT, const String& filenameBIN, std::ifstream& file, String& filename, bool& binary);
	// the folder contains a model in any of the two formats
	static bool Exists(const String& folder);
};
/*----------------------------------------------------------------*/

} // namespace COLMAP

} // namespace GOP

#endif // _GOP_COLMAPMODEL_H_
