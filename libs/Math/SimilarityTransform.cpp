/*
* SimilarityTransform.cpp
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
#include "SimilarityTransform.h"

using namespace TOOLS;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

void TOOLS::DecomposeSimilarityTransform(const Matrix4x4& transform, Matrix3x3& R, Point3& t, REAL& s)
{
	const Eigen::Transform<REAL,3,Eigen::Affine> T(transform);
	Matrix3x3 rotation, scaling;
	T.computeRotationScaling(&rotation, &scaling);
	R = rotation;
	t = T.translation();
	s = scaling.diagonal().mean();
} // DecomposeSimilarityTransform
/*----------------------------------------------------------------*/

REAL TOOLS::ComputeMedian(REALArr values)
{
	if (values.empty())
		return REAL(0);
	const size_t mid(values.size()/2);
	std::nth_element(values.begin(), values.begin()+mid, values.end());
	const REAL upper(values[mid]);
	if (values.size() % 2)
		return upper;
	const REAL lower(*std::max_element(values.begin(), values.begin()+mid));
	return (lower + upper) * REAL(0.5);
} // ComputeMedian
/*----------------------------------------------------------------*/

Matrix4x4 TOOLS::SimilarityFromCameras(const Matrix4x4Arr& camToWorlds, bool bStrictScaling)
{
	const size_t N(camToWorlds.size());
	if (N == 0)
		return Matrix4x4::Identity();

	// rotate the world so that the average camera up vector points to -Y
	Vec3 worldUp(Vec3::Zero());
	for (const Matrix4x4& c2w: camToWorlds)
		worldUp -= c2w.block<3,1>(0,1);
	worldUp /= REAL(N);
	worldUp.normalize();
	const Vec3 upCamSpace(0, -1, 0);
	const REAL c(upCamSpace.dot(worldUp));
	Matrix3x3 Ralign;
	if (c > REAL(-1)) {
		const Vec3 cross(worldUp.cross(upCamSpace));
		Matrix3x3 skew;
		skew <<
			0, -cross(2), cross(1),
			cross(2), 0, -cross(0),
			-cross(1), cross(0), 0;
		Ralign = Matrix3x3::Identity() + skew + skew*skew/(REAL(1)+c);
	} else {
		// the up vectors are exactly opposite: half turn around X
		Ralign = Vec3(1, -1, -1).asDiagonal();
	}

	// recenter the rig on the median of the points on the optical axes closest to the origin
	std::vector<Point3> centers(N);
	REALArr nearestX(N), nearestY(N), nearestZ(N);
	FOREACH(i, camToWorlds) {
		const Matrix3x3 R(Ralign*camToWorlds[i].topLeftCorner<3,3>());
		const Vec3 fwd(R.col(2));
		const Point3 t(Ralign*camToWorlds[i].block<3,1>(0,3));
		const Point3 nearest(t + fwd.dot(-t)*fwd);
		nearestX[i] = nearest.x();
		nearestY[i] = nearest.y();
		nearestZ[i] = nearest.z();
		centers[i] = t;
	}
	const Point3 translate(-ComputeMedian(nearestX), -ComputeMedian(nearestY), -ComputeMedian(nearestZ));

	Matrix4x4 transform(Matrix4x4::Identity());
	transform.topLeftCorner<3,3>() = Ralign;
	transform.block<3,1>(0,3) = translate;

	// rescale so that the typical camera distance to the origin is one
	REALArr dists(N);
	FOREACH(i, centers)
		dists[i] = (centers[i]+translate).norm();
	const REAL dist(bStrictScaling ? *std::max_element(dists.begin(), dists.end()) : ComputeMedian(dists));
	if (dist > REAL(0))
		transform.topRows<3>() *= REAL(1)/dist;
	return transform;
} // SimilarityFromCameras
/*----------------------------------------------------------------*/

bool TOOLS::AlignPrincipalAxes(const Point3fArr& points, Matrix4x4& transform)
{
	const size_t N(points.size());
	if (N < 2)
		return false;
	REALArr xs(N), ys(N), zs(N);
	Point3 mean(Point3::Zero());
	FOREACH(i, points) {
		const Point3 X(points[i].cast<REAL>());
		xs[i] = X.x(); ys[i] = X.y(); zs[i] = X.z();
		mean += X;
	}
	mean /= REAL(N);
	const Point3 centroid(ComputeMedian(xs), ComputeMedian(ys), ComputeMedian(zs));

	// sample covariance (the translation does not change it)
	Matrix3x3 covariance(Matrix3x3::Zero());
	for (const Point3f& p: points) {
		const Vec3 d(p.cast<REAL>()-mean);
		covariance += d*d.transpose();
	}
	covariance /= REAL(N-1);

	// eigenvectors sorted by decreasing eigenvalue
	const Eigen::SelfAdjointEigenSolver<Matrix3x3> es(covariance);
	if (es.info() != Eigen::Success)
		return false;
	Matrix3x3 eigenvectors;
	for (int i=0; i<3; ++i)
		eigenvectors.col(i) = es.eigenvectors().col(2-i);
	// keep a right handed coordinate system
	if (eigenvectors.determinant() < 0)
		eigenvectors.col(0) *= REAL(-1);
	const Matrix3x3 R(eigenvectors.transpose());

	transform.setIdentity();
	transform.topLeftCorner<3,3>() = R;
	transform.block<3,1>(0,3) = -R*centroid;
	return true;
} // AlignPrincipalAxes
/*----------------------------------------------------------------*/

void TOOLS::TransformPoints(const Matrix4x4& transform, Point3fArr& points)
{
	const Matrix3x3 R(transform.topLeftCorner<3,3>());
	const Vec3 t(transform.block<3,1>(0,3));
	for (Point3f& p: points)
		p = (R*p.cast<REAL>() + t).cast<float>();
} // TransformPoints
/*----------------------------------------------------------------*/

void TOOLS::TransformCameras(const Matrix4x4& transform, Matrix4x4Arr& camToWorlds)
{
	for (Matrix4x4& c2w: camToWorlds) {
		c2w = transform*c2w;
		const REAL scale(c2w.block<1,3>(0,0).norm());
		c2w.topLeftCorner<3,3>() /= scale;
	}
} // TransformCameras
/*----------------------------------------------------------------*/
