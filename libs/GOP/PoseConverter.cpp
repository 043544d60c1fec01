/*
* PoseConverter.cpp
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
#include "PoseConverter.h"

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////

// values of a pose block, and with the depth bounds
#define POSE_VALUES 15
#define POSE_BOUNDS_VALUES 17


// S T R U C T S ///////////////////////////////////////////////////

bool GOP::LoadPoseBundles(const NPY& npy, PoseBundleArr& poses)
{
	poses.clear();
	if (npy.shape.size() != 2 || (npy.shape[1] != POSE_VALUES && npy.shape[1] != POSE_BOUNDS_VALUES)) {
		VERBOSE("error: invalid pose bundle array shape (expected Nx%d or Nx%d)", POSE_VALUES, POSE_BOUNDS_VALUES);
		return false;
	}
	poses.resize(npy.rows());
	FOREACH(i, poses) {
		PoseBundle& pose = poses[i];
		for (int r=0; r<3; ++r)
			for (int c=0; c<5; ++c)
				pose.pose(r,c) = npy(i, r*5+c);
		if (npy.cols() == POSE_BOUNDS_VALUES) {
			pose.nearBound = npy(i, POSE_VALUES);
			pose.farBound = npy(i, POSE_VALUES+1);
			pose.bHasBounds = true;
		}
	}
	return true;
} // LoadPoseBundles

bool GOP::LoadPoseBundles(const String& fileName, PoseBundleArr& poses)
{
	NPY npy;
	if (!npy.Load(fileName))
		return false;
	if (!LoadPoseBundles(npy, poses)) {
		VERBOSE("error: invalid pose bundle file '%s'", fileName.c_str());
		return false;
	}
	DEBUG_EXTRA("Loaded %u camera poses from '%s'", (unsigned)poses.size(), fileName.c_str());
	return true;
} // LoadPoseBundles
/*----------------------------------------------------------------*/


String CameraPrior::ImageLine() const
{
	return String::FormatString("%u %s %s %s %s %s %s %s %u %s",
		ID,
		String::ToString(q(0)).c_str(), String::ToString(q(1)).c_str(),
		String::ToString(q(2)).c_str(), String::ToString(q(3)).c_str(),
		String::ToString(t(0)).c_str(), String::ToString(t(1)).c_str(), String::ToString(t(2)).c_str(),
		ID, name.c_str());
}

String CameraPrior::CameraLine() const
{
	const String strF(String::ToString(f));
	return String::FormatString("%u PINHOLE %u %u %s %s %u %u",
		ID, width, height, strF.c_str(), strF.c_str(), cx, cy);
}
/*----------------------------------------------------------------*/


String GOP::FormatImageName(uint32_t idx)
{
	return FormatCameraName(idx) + _T(".png");
}

Matrix4x4 GOP::PoseToCameraToWorld(const Matrix3x5& pose)
{
	Matrix4x4 camToWorld(Matrix4x4::Identity());
	camToWorld.block<3,1>(0,0) = pose.col(1);
	camToWorld.block<3,1>(0,1) = pose.col(0);
	camToWorld.block<3,1>(0,2) = -pose.col(2);
	camToWorld.block<3,1>(0,3) = pose.col(3);
	return camToWorld;
}

Matrix3x5 GOP::CameraToWorldToPose(const Matrix4x4& camToWorld, const Vec3& hwf)
{
	Matrix3x5 pose;
	pose.col(0) = camToWorld.block<3,1>(0,1);
	pose.col(1) = camToWorld.block<3,1>(0,0);
	pose.col(2) = -camToWorld.block<3,1>(0,2);
	pose.col(3) = camToWorld.block<3,1>(0,3);
	pose.col(4) = hwf;
	return pose;
}

Matrix4x4 GOP::PoseToWorldToCamera(const Matrix3x5& pose)
{
	return PoseToCameraToWorld(pose).inverse();
}
/*----------------------------------------------------------------*/

CameraPrior GOP::ConvertPose(const PoseBundle& pose, uint32_t idx)
{
	const Matrix4x4 worldToCamera(PoseToWorldToCamera(pose.pose));
	CameraPrior prior;
	prior.ID = idx+1;
	prior.name = FormatImageName(idx);
	prior.q = RotationToQuaternion(worldToCamera.topLeftCorner<3,3>());
	prior.t = worldToCamera.block<3,1>(0,3);
	prior.width = (uint32_t)pose.width();
	prior.height = (uint32_t)pose.height();
	prior.f = pose.focal();
	prior.cx = prior.width/2;
	prior.cy = prior.height/2;
	return prior;
} // ConvertPose

void GOP::ConvertPoses(const PoseBundleArr& poses, CameraPriorArr& priors)
{
	priors.resize(poses.size());
	FOREACH(i, poses)
		priors[i] = ConvertPose(poses[i], (uint32_t)i);
} // ConvertPoses
/*----------------------------------------------------------------*/
