/*
* SimilarityTransform.h
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

#ifndef _TOOLS_SIMILARITY_TRANSFORM_H_
#define _TOOLS_SIMILARITY_TRANSFORM_H_


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

namespace TOOLS {

// decompose similarity transform into rotation, translation and scale
MATH_API void DecomposeSimilarityTransform(const Matrix4x4& transform, Matrix3x3& R, Point3& t, REAL& s);

// median of the given values (mean of the two middle values for an even count)
MATH_API REAL ComputeMedian(REALArr values);

// compute the similarity transform that brings the camera rig (camera-to-world poses)
// to a canonical frame: the average up direction of the cameras (-Y in camera space)
// is aligned to -Y, the origin is set to the median of the points on each camera
// optical axis closest to the rig center, and the scale makes the median camera
// distance to the origin equal to one
MATH_API Matrix4x4 SimilarityFromCameras(const Matrix4x4Arr& camToWorlds, bool bStrictScaling=false);

// compute the rigid transform that moves the median of the points to the origin
// and aligns the principal axes of the points to the X, Y, Z axes
// in decreasing order of variance; returns false if there are not enough points
MATH_API bool AlignPrincipalAxes(const Point3fArr& points, Matrix4x4& transform);

// apply the transform to the given points
MATH_API void TransformPoints(const Matrix4x4& transform, Point3fArr& points);

// apply the transform to the given camera-to-world poses
// and remove the scale from their rotation part
MATH_API void TransformCameras(const Matrix4x4& transform, Matrix4x4Arr& camToWorlds);
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // _TOOLS_SIMILARITY_TRANSFORM_H_
