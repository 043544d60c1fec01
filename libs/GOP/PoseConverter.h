/*
* PoseConverter.h
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

#ifndef _GOP_POSECONVERTER_H_
#define _GOP_POSECONVERTER_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "Common.h"


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

// camera pose as stored in the legacy bundle file (poses_bounds.npy):
// a 3x5 block [R | t | hwf] describing the camera-to-world transform
// with the camera axes ordered (down, right, backwards),
// followed optionally by the near/far depth bounds
struct GOP_API PoseBundle
{
	Matrix3x5 pose;
	REAL nearBound, farBound;
	bool bHasBounds;

	PoseBundle() : pose(Matrix3x5::Zero()), nearBound(0), farBound(0), bHasBounds(false) {}

	inline Matrix3x3 R() const { return pose.leftCols<3>(); }
	inline Point3 t() const { return pose.col(3); }
	inline REAL height() const { return pose(0,4); }
	inline REAL width() const { return pose(1,4); }
	inline REAL focal() const { return pose(2,4); }
};
typedef std::vector<PoseBundle> PoseBundleArr;

// load the pose bundles from a (N,15) or (N,17) float array
GOP_API bool LoadPoseBundles(const NPY& npy, PoseBundleArr& poses);
GOP_API bool LoadPoseBundles(const String& fileName, PoseBundleArr& poses);


// camera prior in the manual-initialization format of the reconstruction tool:
// world-to-camera rotation and translation and pinhole intrinsics
struct GOP_API CameraPrior
{
	uint32_t ID; // 1-based image and camera ID
	String name; // image file name
	Vec4 q; // world-to-camera rotation as quaternion (w, x, y, z), w >= 0
	Point3 t; // world-to-camera translation
	uint32_t width, height; // image resolution
	REAL f; // focal length
	uint32_t cx, cy; // principal point (integer image center)

	// prior camera intrinsics as stored by the reconstruction tool for a PINHOLE camera
	std::vector<double> Params() const { return std::vector<double>{f, f, (double)cx, (double)cy}; }

	// line of images.txt: ID QW QX QY QZ TX TY TZ CAMERA_ID NAME
	String ImageLine() const;
	// line of cameras.txt: ID PINHOLE WIDTH HEIGHT FX FY CX CY
	String CameraLine() const;
};
typedef std::vector<CameraPrior> CameraPriorArr;


// name of the image of the camera with the given 0-based index: "camNN.png"
GOP_API String FormatImageName(uint32_t idx);

// remap the axes of the legacy pose to the (right, down, forward) convention
// and return the corresponding camera-to-world matrix
GOP_API Matrix4x4 PoseToCameraToWorld(const Matrix3x5& pose);
// inverse of the axes remap, storing the given (height, width, focal) in the last column
GOP_API Matrix3x5 CameraToWorldToPose(const Matrix4x4& camToWorld, const Vec3& hwf);
// world-to-camera matrix of the legacy pose
GOP_API Matrix4x4 PoseToWorldToCamera(const Matrix3x5& pose);

// convert the pose bundles to camera priors, one per camera, in the same order
GOP_API void ConvertPoses(const PoseBundleArr& poses, CameraPriorArr& priors);
GOP_API CameraPrior ConvertPose(const PoseBundle& pose, uint32_t idx);
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_POSECONVERTER_H_
