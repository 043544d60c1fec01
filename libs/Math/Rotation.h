/*
* Rotation.h
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

#ifndef _TOOLS_ROTATION_H_
#define _TOOLS_ROTATION_H_


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

namespace TOOLS {

// convert the rotation matrix to an unit quaternion (w, x, y, z) with w >= 0;
// the quaternion is the eigenvector corresponding to the largest eigenvalue
// of the symmetric 4x4 matrix built from the rotation (Bar-Itzhack method),
// robust even if the matrix is not perfectly orthonormal
MATH_API Vec4 RotationToQuaternion(const Matrix3x3& R);

// convert the quaternion (w, x, y, z) to a rotation matrix
MATH_API Matrix3x3 QuaternionToRotation(const Vec4& qvec);

// normalize the quaternion and flip its sign so that w >= 0
MATH_API Vec4 NormalizeQuaternion(const Vec4& qvec);

// compute the angle in radians between the two rotations
MATH_API REAL RotationAngleDiff(const Matrix3x3& R0, const Matrix3x3& R1);
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // _TOOLS_ROTATION_H_
