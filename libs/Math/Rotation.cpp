/*
* Rotation.cpp
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
#include "Rotation.h"

using namespace TOOLS;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

Vec4 TOOLS::RotationToQuaternion(const Matrix3x3& R)
{
	const REAL Rxx(R(0,0)), Ryx(R(0,1)), Rzx(R(0,2));
	const REAL Rxy(R(1,0)), Ryy(R(1,1)), Rzy(R(1,2));
	const REAL Rxz(R(2,0)), Ryz(R(2,1)), Rzz(R(2,2));
	// only the lower triangle is filled, the solver reads just that part
	Matrix4x4 K(Matrix4x4::Zero());
	K(0,0) = Rxx - Ryy - Rzz;
	K(1,0) = Ryx + Rxy; K(1,1) = Ryy - Rxx - Rzz;
	K(2,0) = Rzx + Rxz; K(2,1) = Rzy + Ryz; K(2,2) = Rzz - Rxx - Ryy;
	K(3,0) = Ryz - Rzy; K(3,1) = Rzx - Rxz; K(3,2) = Rxy - Ryx; K(3,3) = Rxx + Ryy + Rzz;
	K /= REAL(3);
	const Eigen::SelfAdjointEigenSolver<Matrix4x4> es(K, Eigen::ComputeEigenvectors);
	// eigenvalues are sorted in increasing order
	const Vec4 v(es.eigenvectors().col(3));
	Vec4 qvec(v(3), v(0), v(1), v(2));
	if (qvec(0) < 0)
		qvec = -qvec;
	return qvec;
} // RotationToQuaternion
/*----------------------------------------------------------------*/

Matrix3x3 TOOLS::QuaternionToRotation(const Vec4& qvec)
{
	const Vec4 q(NormalizeQuaternion(qvec));
	return Quaternion(q(0), q(1), q(2), q(3)).toRotationMatrix();
} // QuaternionToRotation
/*----------------------------------------------------------------*/

Vec4 TOOLS::NormalizeQuaternion(const Vec4& qvec)
{
	const REAL norm(qvec.norm());
	if (norm == REAL(0))
		return Vec4(1, 0, 0, 0);
	const Vec4 q(qvec / norm);
	return q(0) < 0 ? Vec4(-q) : q;
} // NormalizeQuaternion
/*----------------------------------------------------------------*/

REAL TOOLS::RotationAngleDiff(const Matrix3x3& R0, const Matrix3x3& R1)
{
	const REAL cosAngle((R0.transpose()*R1).trace()*REAL(0.5) - REAL(0.5));
	return std::acos(CLAMP(cosAngle, REAL(-1), REAL(1)));
} // RotationAngleDiff
/*----------------------------------------------------------------*/
