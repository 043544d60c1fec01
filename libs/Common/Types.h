////////////////////////////////////////////////////////////////////
// Types.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_TYPES_H__
#define __TOOLS_TYPES_H__


// I N C L U D E S /////////////////////////////////////////////////

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>
#include <unistd.h>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <initializer_list>
#include <new>
#include <memory>
#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <functional>
#include <algorithm>
#include <numeric>
#include <limits>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <list>
#include <iterator>
#include <cmath>
#include <ctime>
#include <random>
#include <mutex>

#include <Eigen/Core>
#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <Eigen/Eigenvalues>
#include <Eigen/StdVector>

#include <opencv2/core.hpp>
#include <opencv2/core/eigen.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/calib3d.hpp>

#include "Strings.h"


// D E F I N E S ///////////////////////////////////////////////////

namespace TOOLS {

typedef double REAL;

// geometry types
typedef Eigen::Matrix<REAL,2,1> Point2;
typedef Eigen::Matrix<REAL,3,1> Point3;
typedef Eigen::Matrix<REAL,3,1> Vec3;
typedef Eigen::Matrix<REAL,4,1> Vec4;
typedef Eigen::Matrix<REAL,3,3> Matrix3x3;
typedef Eigen::Matrix<REAL,3,4> Matrix3x4;
typedef Eigen::Matrix<REAL,4,4> Matrix4x4;
typedef Eigen::Matrix<REAL,3,5> Matrix3x5;
typedef Eigen::Quaternion<REAL> Quaternion;
typedef Eigen::Matrix<float,2,1> Point2f;
typedef Eigen::Matrix<float,3,1> Point3f;

// camera matrix types
typedef Matrix3x3 KMatrix;

typedef std::vector<Matrix4x4, Eigen::aligned_allocator<Matrix4x4> > Matrix4x4Arr;
typedef std::vector<Point3f> Point3fArr;
typedef std::vector<Point2f> Point2fArr;
typedef std::vector<REAL> REALArr;
typedef std::vector<uint32_t> IndexArr;
typedef std::vector<String> StringArr;
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __TOOLS_TYPES_H__
