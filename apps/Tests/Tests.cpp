/*
* Tests.cpp
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

#include "../../libs/GOP.h"

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////

#define APPNAME _T("Tests")

// log the failure and abort the current test
#define TEST_CHECK(exp, ...) \
	if (!(exp)) { \
		VERBOSE("ERROR: " __VA_ARGS__); \
		return false; \
	}

#define TEST_EPS 1e-9


// S T R U C T S ///////////////////////////////////////////////////

namespace {

// reconstruction stages recorded instead of running the external tool;
// the undistortion stage writes the model of the given priors at half resolution,
// with a mild lens distortion for the OPENCV and OPENCV_FISHEYE cameras
class FakeReconstructor : public Reconstructor
{
public:
	StringArr stages; // stages run so far
	String failStage; // stage to fail, if any
	int nFailExitCode; // exit code of the failed stage
	CameraPriorArr priors; // cameras of the written model
	StringArr models; // camera model of each prior, PINHOLE if not given
	std::vector<Point3> points; // points of the written model, seen by all images

public:
	FakeReconstructor() : nFailExitCode(0) {}

	bool ExtractFeatures(const String& databaseFile, const String& imageFolder) override {
		if (!File::isFile(databaseFile.c_str()) || File::listFolder(imageFolder.c_str(), false).empty())
			return false;
		return Stage(_T("extract"));
	}
	bool MatchFeatures(const String&) override {
		return Stage(_T("match"));
	}
	bool Triangulate(const String&, const String&, const String& priorFolder, const String& outputFolder) override {
		if (!File::isFile((priorFolder+COLMAP_IMAGES_TXT).c_str()) || !File::isFolder(outputFolder.c_str()))
			return false;
		return Stage(_T("triangulate"));
	}
	bool Undistort(const String&, const String&, const String& outputFolder) override {
		if (!Stage(_T("undistort")))
			return false;
		return File::createFolder((outputFolder+_T("images/")).c_str()) &&
			MakeModel().Save(outputFolder+GOP_SPARSE_FOLDER);
	}

protected:
	bool Stage(LPCTSTR stage) {
		stages.emplace_back(stage);
		if (failStage == stage) {
			m_nExitCode = nFailExitCode;
			return false;
		}
		m_nExitCode = 0;
		return true;
	}
	COLMAP::Model MakeModel() const {
		COLMAP::Model model;
		FOREACH(idx, priors) {
			const CameraPrior& prior = priors[idx];
			COLMAP::Camera& camera = model.cameras[prior.ID];
			camera.ID = prior.ID;
			camera.model = idx < models.size() ? models[idx] : String(_T("PINHOLE"));
			camera.width = prior.width/2;
			camera.height = prior.height/2;
			camera.params = {prior.f/2, prior.f/2, prior.cx/2.0, prior.cy/2.0};
			if (camera.model == _T("OPENCV"))
				camera.params.insert(camera.params.end(), {0.05, 0.01, 0.001, 0.001});
			else if (camera.model == _T("OPENCV_FISHEYE"))
				camera.params.insert(camera.params.end(), {0.05, 0.01, 0.0, 0.0});
			COLMAP::Image& image = model.images[prior.ID];
			image.ID = prior.ID;
			image.q = prior.q;
			image.t = prior.t;
			image.idCamera = prior.ID;
			image.name = prior.name;
		}
		FOREACH(i, points) {
			COLMAP::Point point;
			point.ID = i+1;
			point.p = points[i];
			point.c = cv::Vec3b(200, 100, 50);
			point.e = 0.5;
			for (const CameraPrior& prior: priors)
				point.tracks.push_back(COLMAP::Point::Track{prior.ID, 0});
			model.points.emplace_back(point);
		}
		return model;
	}
};

// camera-to-world poses of the test rig: cameras looking along +Z, spaced along X
Matrix4x4 RigCameraToWorld(uint32_t idx)
{
	Matrix4x4 camToWorld(Matrix4x4::Identity());
	camToWorld(0,3) = REAL(0.1)*idx;
	return camToWorld;
}

// rotation of the given angle around the given axis
Matrix3x3 MakeRotation(REAL angle, const Vec3& axis)
{
	return Eigen::AngleAxis<REAL>(angle, axis.normalized()).toRotationMatrix();
}

// create a scene with the frames of each camera and the pose bundle file
bool CreateScene(const String& sceneFolder, uint32_t numCameras, uint32_t numFrames, const cv::Size& size, REAL focal)
{
	const cv::Mat frame(size, CV_8UC3, cv::Scalar(10, 20, 30));
	for (uint32_t idx=0; idx<numCameras; ++idx) {
		for (uint32_t f=0; f<numFrames; ++f) {
			const String fileName(sceneFolder+GOP_PNG_FOLDER+FormatCameraName(idx)+PATH_SEPARATOR_STR+FormatFrameName(f));
			Util::ensureFolder(fileName);
			if (!cv::imwrite(fileName, frame))
				return false;
		}
	}
	NPY npy;
	npy.shape = {numCameras, 17};
	for (uint32_t idx=0; idx<numCameras; ++idx) {
		const Matrix3x5 pose(CameraToWorldToPose(RigCameraToWorld(idx), Vec3(size.height, size.width, focal)));
		for (int r=0; r<3; ++r)
			for (int c=0; c<5; ++c)
				npy.data.push_back(pose(r,c));
		npy.data.push_back(0.5);
		npy.data.push_back(10.0);
	}
	return npy.Save(sceneFolder+GOP_POSES_FILE);
}

bool WriteTextFile(const String& fileName, const String& content)
{
	Util::ensureFolder(fileName);
	std::ofstream file(fileName);
	file << content;
	return !file.fail();
}

String ReadTextFile(const String& fileName)
{
	std::ifstream file(fileName);
	std::stringstream ss;
	ss << file.rdbuf();
	return ss.str();
}

} // unnamed namespace
/*----------------------------------------------------------------*/


// keyframes cover the frame range with disjoint groups
bool TestKeyframes()
{
	TEST_CHECK(ComputeKeyframes(0, 300, 60) == IndexArr({0, 60, 120, 180, 240}), "keyframes of [0,300) with GOP 60");
	TEST_CHECK(ComputeKeyframes(10, 25, 10) == IndexArr({10, 20}), "keyframes of [10,25) with GOP 10");
	TEST_CHECK(ComputeKeyframes(0, 1, 60) == IndexArr({0}), "keyframes of a range shorter than the GOP");
	TEST_CHECK(ComputeKeyframes(5, 5, 10).empty(), "keyframes of an empty range");
	TEST_CHECK(ComputeKeyframes(0, 100, 0).empty(), "keyframes with GOP 0");
	TEST_CHECK(FormatFrameName(0) == _T("00001.png") && FormatFrameName(59) == _T("00060.png"), "frame names");
	TEST_CHECK(ProjectLayout(_T("/data/scene"), 120).Folder() == _T("/data/scene/colmap_120/"), "project folder name");
	return true;
}

// remapping the legacy pose axes forward then back recovers the pose
bool TestPoseRemap()
{
	std::mt19937 rnd(7);
	std::uniform_real_distribution<REAL> dist(-1, 1);
	for (int i=0; i<20; ++i) {
		Matrix3x5 pose;
		pose.leftCols<3>() = MakeRotation(dist(rnd)*M_PI, Vec3(dist(rnd), dist(rnd), dist(rnd)+2));
		pose.col(3) = Vec3(dist(rnd), dist(rnd), dist(rnd))*10;
		pose.col(4) = Vec3(1080, 1920, 1500);
		const Matrix4x4 camToWorld(PoseToCameraToWorld(pose));
		const Matrix3x5 poseBack(CameraToWorldToPose(camToWorld, pose.col(4)));
		TEST_CHECK((poseBack-pose).norm() < TEST_EPS, "pose remap is not invertible");
		TEST_CHECK(std::abs(camToWorld.topLeftCorner<3,3>().determinant()-1) < 1e-6, "remapped rotation is not proper");
		const Matrix4x4 worldToCamera(PoseToWorldToCamera(pose));
		TEST_CHECK((worldToCamera*camToWorld-Matrix4x4::Identity()).norm() < TEST_EPS, "world-to-camera is not the inverse pose");
	}
	// the legacy (down, right, backwards) axes map to (right, down, forward)
	Matrix3x5 pose(Matrix3x5::Zero());
	pose.leftCols<3>().setIdentity();
	const Matrix4x4 camToWorld(PoseToCameraToWorld(pose));
	TEST_CHECK(camToWorld.block<3,1>(0,0) == Vec3(0,1,0) && camToWorld.block<3,1>(0,1) == Vec3(1,0,0) && camToWorld.block<3,1>(0,2) == Vec3(0,0,-1), "axes remap");
	return true;
}

// the quaternion reproduces the rotation and has a non-negative scalar part
bool TestQuaternion()
{
	TEST_CHECK((RotationToQuaternion(Matrix3x3::Identity())-Vec4(1,0,0,0)).norm() < TEST_EPS, "quaternion of the identity");
	const Vec4 qz(RotationToQuaternion(MakeRotation(M_PI/2, Vec3(0,0,1))));
	TEST_CHECK((qz-Vec4(std::sqrt(0.5),0,0,std::sqrt(0.5))).norm() < TEST_EPS, "quaternion of a rotation around Z");
	std::mt19937 rnd(11);
	std::uniform_real_distribution<REAL> dist(-1, 1);
	for (int i=0; i<50; ++i) {
		const Matrix3x3 R(MakeRotation(dist(rnd)*M_PI, Vec3(dist(rnd), dist(rnd), dist(rnd)+2)));
		const Vec4 q(RotationToQuaternion(R));
		TEST_CHECK(q(0) >= 0, "quaternion scalar part is negative");
		TEST_CHECK(std::abs(q.norm()-1) < TEST_EPS, "quaternion is not unit");
		TEST_CHECK((QuaternionToRotation(q)-R).norm() < 1e-8, "quaternion does not reproduce the rotation");
		TEST_CHECK(RotationAngleDiff(QuaternionToRotation(q), R) < 1e-6, "rotation angle difference");
	}
	TEST_CHECK((NormalizeQuaternion(Vec4(-2,0,0,0))-Vec4(1,0,0,0)).norm() < TEST_EPS, "quaternion normalization");
	return true;
}

// priors and the text lines of the reconstruction tool
bool TestCameraPrior()
{
	PoseBundle bundle;
	bundle.pose = CameraToWorldToPose(RigCameraToWorld(3), Vec3(1080, 1920, 1500));
	const CameraPrior prior(ConvertPose(bundle, 3));
	TEST_CHECK(prior.ID == 4 && prior.name == _T("cam03.png"), "prior ID or name");
	TEST_CHECK(prior.width == 1920 && prior.height == 1080 && prior.cx == 960 && prior.cy == 540, "prior intrinsics");
	TEST_CHECK((prior.q-Vec4(1,0,0,0)).norm() < TEST_EPS && (prior.t-Point3(-0.3,0,0)).norm() < TEST_EPS, "prior pose");
	TEST_CHECK(prior.CameraLine() == _T("4 PINHOLE 1920 1080 1500 1500 960 540"), "camera line '%s'", prior.CameraLine().c_str());
	const String line(prior.ImageLine());
	std::istringstream in(line);
	uint32_t ID, cameraID;
	Vec4 q; Point3 t;
	String name;
	in >> ID >> q(0) >> q(1) >> q(2) >> q(3) >> t(0) >> t(1) >> t(2) >> cameraID >> name;
	TEST_CHECK(!in.fail() && ID == 4 && cameraID == 4 && name == prior.name, "image line '%s'", line.c_str());
	TEST_CHECK(q == prior.q && t == prior.t, "image line precision '%s'", line.c_str());
	// odd sizes use the integer center
	bundle.pose.col(4) = Vec3(1081, 1919, 1500);
	const CameraPrior priorOdd(ConvertPose(bundle, 0));
	TEST_CHECK(priorOdd.cx == 959 && priorOdd.cy == 540, "prior principal point of odd sizes");
	return true;
}

// NPY headers of the supported versions and orders
bool TestNPY()
{
	// version 1, little endian float32, Fortran order
	{
		const String header("{'descr': '<f4', 'fortran_order': True, 'shape': (2, 3), }\n");
		std::ostringstream os(std::ios::binary);
		os.write("\x93NUMPY", 6);
		WriteBinaryLittleEndian<uint8_t>(&os, 1);
		WriteBinaryLittleEndian<uint8_t>(&os, 0);
		WriteBinaryLittleEndian<uint16_t>(&os, (uint16_t)header.size());
		os.write(header.data(), (std::streamsize)header.size());
		// column-major values of [[1,2,3],[4,5,6]]
		for (float v: {1.f, 4.f, 2.f, 5.f, 3.f, 6.f})
			WriteBinaryLittleEndian<float>(&os, v);
		std::istringstream is(os.str(), std::ios::binary);
		NPY npy;
		TEST_CHECK(npy.Load(is), "loading a version 1 float32 array");
		TEST_CHECK(npy.rows() == 2 && npy.cols() == 3, "array shape");
		TEST_CHECK(npy(0,1) == 2 && npy(1,0) == 4 && npy(1,2) == 6, "Fortran order array values");
	}
	// version 2, big endian float64, 1-D
	{
		const String header("{'descr': '>f8', 'fortran_order': False, 'shape': (2,), }\n");
		std::ostringstream os(std::ios::binary);
		os.write("\x93NUMPY", 6);
		WriteBinaryLittleEndian<uint8_t>(&os, 2);
		WriteBinaryLittleEndian<uint8_t>(&os, 0);
		WriteBinaryLittleEndian<uint32_t>(&os, (uint32_t)header.size());
		os.write(header.data(), (std::streamsize)header.size());
		for (double v: {0.25, -8.0}) {
			v = NativeToLittleEndian(v);
			char bytes[sizeof(double)];
			memcpy(bytes, &v, sizeof(double));
			std::reverse(bytes, bytes+sizeof(double));
			os.write(bytes, sizeof(double));
		}
		std::istringstream is(os.str(), std::ios::binary);
		NPY npy;
		TEST_CHECK(npy.Load(is), "loading a version 2 big endian array");
		TEST_CHECK(npy.shape == NPY::Shape({2}) && npy.data[0] == 0.25 && npy.data[1] == -8.0, "big endian array values");
	}
	// integer arrays are not supported
	{
		String descr; bool bFortranOrder; NPY::Shape shape;
		TEST_CHECK(NPY::ParseHeader("{'descr': '<i8', 'fortran_order': False, 'shape': (4, 17), }", descr, bFortranOrder, shape), "parsing the header");
		TEST_CHECK(descr == _T("<i8") && !bFortranOrder && shape == NPY::Shape({4, 17}), "header values");
		TEST_CHECK(!NPY::ParseHeader("{'descr': '<f8', 'shape': (4, 17), }", descr, bFortranOrder, shape), "header without order");
	}
	// saved arrays are aligned and read back as pose bundles
	{
		NPY npy;
		npy.shape = {2, 15};
		for (int i=0; i<30; ++i)
			npy.data.push_back(i);
		std::ostringstream os(std::ios::binary);
		TEST_CHECK(npy.Save(os), "saving the array");
		const std::string bytes(os.str());
		TEST_CHECK((bytes.size()-30*sizeof(double)) % 64 == 0, "array data is not aligned");
		std::istringstream is(bytes, std::ios::binary);
		NPY npyLoaded;
		TEST_CHECK(npyLoaded.Load(is) && npyLoaded.shape == npy.shape && npyLoaded.data == npy.data, "reading the saved array");
		PoseBundleArr poses;
		TEST_CHECK(LoadPoseBundles(npyLoaded, poses) && poses.size() == 2, "pose bundles from a Nx15 array");
		TEST_CHECK(!poses[1].bHasBounds && poses[1].pose(0,4) == 19 && poses[1].height() == 19 && poses[1].focal() == 29, "pose bundle values");
		npyLoaded.shape = {3, 10};
		TEST_CHECK(!LoadPoseBundles(npyLoaded, poses), "pose bundles from an invalid array");
	}
	return true;
}

// COLMAP sparse models in TXT and BIN formats
bool TestColmapModel(const String& folder)
{
	const String folderTXT(folder+_T("txt/"));
	TEST_CHECK(WriteTextFile(folderTXT+COLMAP_CAMERAS_TXT,
		"# Camera list with one line of data per camera:\n"
		"1 OPENCV 640 480 500 510 320 240 0.1 -0.05 0.001 0.002\n"
		"2 SIMPLE_RADIAL 320 240 250 160 120 0.01\n"), "writing cameras");
	TEST_CHECK(WriteTextFile(folderTXT+COLMAP_IMAGES_TXT,
		"# Image list with two lines of data per image:\n"
		"2 1 0 0 0 1 2 3 2 cam01.png\n"
		"10.5 20.5 1 30 40 -1\n"
		"1 0.7071067811865476 0 0.7071067811865476 0 0 0 0 1 cam00.png\n"
		"\n"), "writing images");
	TEST_CHECK(WriteTextFile(folderTXT+COLMAP_POINTS_TXT,
		"1 0.5 1.5 2.5 255 128 0 0.25 1 0 2 0\n"), "writing points");
	COLMAP::Model model;
	TEST_CHECK(model.Load(folderTXT), "loading the TXT model");
	TEST_CHECK(model.cameras.size() == 2 && model.images.size() == 2 && model.points.size() == 1, "TXT model sizes");
	const COLMAP::Camera& camera = model.cameras.at(1);
	TEST_CHECK(camera.ModelID() == COLMAP::OPENCV && camera.fx() == 500 && camera.fy() == 510 && camera.cx() == 320 && camera.cy() == 240, "OPENCV camera intrinsics");
	TEST_CHECK(camera.ExtraParams() == std::vector<double>({0.1, -0.05, 0.001, 0.002}), "OPENCV camera distortion");
	const COLMAP::Camera& cameraRadial = model.cameras.at(2);
	TEST_CHECK(cameraRadial.HasSingleFocal() && cameraRadial.fy() == 250 && cameraRadial.cx() == 160 && cameraRadial.ExtraParams().size() == 1, "SIMPLE_RADIAL camera intrinsics");
	const COLMAP::Image& image = model.images.at(2);
	TEST_CHECK(image.name == _T("cam01.png") && image.idCamera == 2 && image.projs.size() == 2 && image.projs[0].idPoint == 1 && image.projs[1].p.y() == 40, "image projections");
	TEST_CHECK(model.images.at(1).projs.empty(), "image without projections");
	TEST_CHECK((model.images.at(1).R()-MakeRotation(M_PI/2, Vec3(0,1,0))).norm() < 1e-9, "image rotation");
	const COLMAP::Point& point = model.points.front();
	TEST_CHECK(point.c == cv::Vec3b(255,128,0) && point.e == 0.25 && point.tracks.size() == 2 && point.tracks[1].idImage == 2, "point values");

	// the binary model holds the same data
	const String folderBIN(folder+_T("bin/"));
	TEST_CHECK(model.Save(folderBIN, true), "saving the BIN model");
	TEST_CHECK(!File::isFile((folderBIN+COLMAP_CAMERAS_TXT).c_str()) && File::isFile((folderBIN+COLMAP_CAMERAS_BIN).c_str()), "BIN model files");
	COLMAP::Model modelBIN;
	TEST_CHECK(modelBIN.Load(folderBIN), "loading the BIN model");
	TEST_CHECK(modelBIN.cameras.at(1).params == camera.params && modelBIN.cameras.at(2).model == _T("SIMPLE_RADIAL"), "BIN cameras");
	TEST_CHECK(modelBIN.images.at(2).name == image.name && (modelBIN.images.at(2).t-Point3(1,2,3)).norm() == 0 && modelBIN.images.at(2).projs.size() == 2, "BIN images");
	TEST_CHECK(modelBIN.points.front().tracks.size() == 2 && modelBIN.points.front().p == point.p, "BIN points");

	// images referencing unknown cameras are rejected
	TEST_CHECK(WriteTextFile(folderTXT+COLMAP_IMAGES_TXT, "3 1 0 0 0 0 0 0 9 cam02.png\n\n"), "writing images");
	TEST_CHECK(!model.Load(folderTXT), "loading a model with a missing camera");
	return true;
}

// prior files and database rows of a project
bool TestProjectMaterialization(const String& folder)
{
	PoseBundleArr poses(2);
	poses[0].pose = CameraToWorldToPose(RigCameraToWorld(0), Vec3(480, 640, 500));
	poses[1].pose = CameraToWorldToPose(RigCameraToWorld(1), Vec3(480, 640, 500));
	CameraPriorArr priors;
	ConvertPoses(poses, priors);
	const ProjectLayout project(folder, 0);
	// a stale database is replaced
	TEST_CHECK(WriteTextFile(project.DatabaseFile(), "stale"), "writing a stale database");
	{
		ColmapDatabase db;
		TEST_CHECK(MaterializeProject(project, priors, db), "materializing the project");
		TEST_CHECK(!db.IsOpen(), "database left open");
	}
	const String images(ReadTextFile(project.ManualFolder()+COLMAP_IMAGES_TXT));
	TEST_CHECK(images == priors[0].ImageLine()+_T("\n\n")+priors[1].ImageLine()+_T("\n\n"), "images.txt content");
	const String cameras(ReadTextFile(project.ManualFolder()+COLMAP_CAMERAS_TXT));
	TEST_CHECK(cameras == priors[0].CameraLine()+_T("\n")+priors[1].CameraLine()+_T("\n"), "cameras.txt content");
	TEST_CHECK(File::isFile((project.ManualFolder()+COLMAP_POINTS_TXT).c_str()) && File::getSize((project.ManualFolder()+COLMAP_POINTS_TXT).c_str()) == 0, "points3D.txt is not empty");
	// the prior files are a valid model
	COLMAP::Model model;
	TEST_CHECK(model.Load(project.ManualFolder()) && model.images.size() == 2 && model.cameras.at(2).params == priors[1].Params(), "reading the prior files");

	ColmapDatabase db;
	TEST_CHECK(db.Open(project.DatabaseFile()), "opening the database");
	std::vector<ColmapDatabase::CameraRow> cameraRows;
	std::vector<ColmapDatabase::ImageRow> imageRows;
	TEST_CHECK(db.ReadCameras(cameraRows) && db.ReadImages(imageRows), "reading the database");
	TEST_CHECK(cameraRows.size() == 2 && imageRows.size() == 2, "database rows");
	FOREACH(i, priors) {
		TEST_CHECK(cameraRows[i].ID == priors[i].ID && cameraRows[i].model == COLMAP::PINHOLE && cameraRows[i].width == 640 && cameraRows[i].height == 480, "camera row %u", (unsigned)i);
		TEST_CHECK(cameraRows[i].params == std::vector<double>({500, 500, 320, 240}) && !cameraRows[i].bPriorFocalLength, "camera row %u params", (unsigned)i);
		TEST_CHECK(imageRows[i].ID == priors[i].ID && imageRows[i].name == priors[i].name && imageRows[i].cameraID == cameraRows[i].ID, "image row %u", (unsigned)i);
		TEST_CHECK((imageRows[i].q-priors[i].q).norm() == 0 && (imageRows[i].t-priors[i].t).norm() == 0, "image row %u pose prior", (unsigned)i);
	}
	db.Close();
	return true;
}

// the reconstruction stops at the first failed stage and reports its exit code
bool TestReconstructionDriver(const String& folder)
{
	const ProjectLayout project(folder, 60);
	const auto prepare = [&]() {
		return WriteTextFile(project.InputFolder()+_T("cam00.png"), "image") &&
			WriteTextFile(project.DatabaseFile(), "db") &&
			WriteTextFile(project.ManualFolder()+COLMAP_IMAGES_TXT, "");
	};
	{
		FakeReconstructor reconstructor;
		TEST_CHECK(RunReconstruction(ProjectLayout(folder, 1), reconstructor) == EXIT_FAILURE && reconstructor.stages.empty(), "reconstruction of a missing project");
	}
	TEST_CHECK(prepare(), "preparing the project");
	{
		FakeReconstructor reconstructor;
		reconstructor.failStage = _T("match");
		reconstructor.nFailExitCode = 3;
		TEST_CHECK(RunReconstruction(project, reconstructor) == 3, "exit code of the failed stage");
		TEST_CHECK(reconstructor.stages == StringArr({_T("extract"), _T("match")}), "stages run after a failure");
		TEST_CHECK(File::isFolder(project.InputFolder().c_str()), "input removed after a failure");
	}
	{
		FakeReconstructor reconstructor;
		reconstructor.failStage = _T("undistort");
		TEST_CHECK(RunReconstruction(project, reconstructor) == EXIT_FAILURE, "failed stage without exit code");
	}
	{
		FakeReconstructor reconstructor;
		PoseBundle bundle;
		bundle.pose = CameraToWorldToPose(RigCameraToWorld(0), Vec3(2, 2, 2));
		reconstructor.priors.assign(1, ConvertPose(bundle, 0));
		TEST_CHECK(RunReconstruction(project, reconstructor) == EXIT_SUCCESS, "reconstruction");
		TEST_CHECK(reconstructor.stages == StringArr({_T("extract"), _T("match"), _T("triangulate"), _T("undistort")}), "stages order");
		TEST_CHECK(!File::isFolder(project.InputFolder().c_str()), "input folder not removed");
		TEST_CHECK(File::isFolder(project.DistortedFolder().c_str()), "distorted folder not created");
		TEST_CHECK(COLMAP::Model::Exists(project.ModelFolder()) && !File::isFile((project.SparseFolder()+COLMAP_CAMERAS_TXT).c_str()), "sparse model not gathered");
	}

	// command lines of the external tool
	const StringArr extractor(ColmapReconstructor::FeatureExtractorArgs(_T("db"), _T("in/")));
	TEST_CHECK(extractor.front() == _T("feature_extractor") && extractor.back() == _T("PINHOLE") && extractor.size() == 13, "feature extractor arguments");
	const StringArr triangulator(ColmapReconstructor::PointTriangulatorArgs(_T("db"), _T("in/"), _T("manual/"), _T("out/")));
	TEST_CHECK(triangulator.back() == _T("--Mapper.ba_global_function_tolerance=0.000001") && triangulator[7] == _T("--input_path") && triangulator[8] == _T("manual/"), "point triangulator arguments");
	TEST_CHECK(Process::ComposeCommand(_T("colmap"), {_T("a b"), _T("it's")}) == _T("colmap 'a b' 'it'\\''s'"), "command quoting");
	TEST_CHECK(Process::Execute(_T("sh"), {_T("-c"), _T("exit 3")}) == 3, "exit status of a process");
	return true;
}

// scene preparation with a recorded reconstruction, then loading its calibration and samples
bool TestScene(const String& folder)
{
	const String sceneFolder(folder+_T("scene/"));
	const cv::Size size(32, 24);
	const uint32_t numCameras(3);
	TEST_CHECK(CreateScene(sceneFolder, numCameras, 4, size, 30), "creating the scene");

	// prepare the scene: keyframes 0 and 2
	PlannerOptions options;
	options.nStartFrame = 0;
	options.nEndFrame = 4;
	options.nGOP = 2;
	FakeReconstructor reconstructor;
	{
		PoseBundleArr poses;
		TEST_CHECK(LoadPoseBundles(sceneFolder+GOP_POSES_FILE, poses) && poses.size() == numCameras && poses[2].bHasBounds, "loading the poses");
		ConvertPoses(poses, reconstructor.priors);
	}
	reconstructor.points = {Point3(0,0,5), Point3(0.1,0.1,4), Point3(-0.1,0.05,6)};
	TEST_CHECK(ProcessScenes(folder, options, reconstructor) == EXIT_SUCCESS, "processing the scenes");
	TEST_CHECK(reconstructor.stages.size() == 8, "stages of two keyframes");
	for (uint32_t keyframe: {0u, 2u}) {
		const ProjectLayout project(sceneFolder, keyframe);
		TEST_CHECK(COLMAP::Model::Exists(project.ModelFolder()) && File::isFile(project.DatabaseFile().c_str()), "project of keyframe %u", keyframe);
	}
	TEST_CHECK(!File::isFolder((sceneFolder+_T("colmap_4/")).c_str()), "project outside of the frame range");

	// load the calibration of the second keyframe; the model is at half resolution
	ParserOptions parserOptions;
	parserOptions.strDataDir = sceneFolder;
	parserOptions.nFirstFrame = 2;
	Calibration calibration;
	TEST_CHECK(Calibration::FindModelFolder(sceneFolder, 2) == ProjectLayout(sceneFolder, 2).ModelFolder(), "model folder of the keyframe");
	TEST_CHECK(calibration.Load(parserOptions), "loading the calibration");
	TEST_CHECK(calibration.NumCameras() == numCameras && calibration.records.size() == numCameras && calibration.points.size() == 3, "calibration sizes");
	FOREACH(i, calibration.imageNames) {
		TEST_CHECK(calibration.imageNames[i] == FormatImageName((uint32_t)i) && calibration.cameraIDs[i] == i+1, "image %u order", (unsigned)i);
		TEST_CHECK((calibration.camToWorlds[i]-RigCameraToWorld((uint32_t)i)).norm() < TEST_EPS, "image %u pose", (unsigned)i);
		const CalibrationRecord& record = calibration.GetRecord(i);
		TEST_CHECK(record.size == size && !record.HasDistortion() && record.type == CAMERA_PERSPECTIVE, "camera %u size", (unsigned)i);
		TEST_CHECK(record.K(0,0) == 30 && record.K(1,1) == 30 && record.K(0,2) == 16 && record.K(1,2) == 12, "camera %u intrinsics not scaled to the frames", (unsigned)i);
		TEST_CHECK(calibration.bounds[i] == Point2(0.5, 10.0), "camera %u bounds", (unsigned)i);
		TEST_CHECK(calibration.pointIndices.at(calibration.imageNames[i]).size() == 3, "points seen by image %u", (unsigned)i);
	}
	TEST_CHECK(calibration.transform == Matrix4x4::Identity() && std::abs(calibration.sceneScale-0.1) < TEST_EPS, "scene scale");
	TEST_CHECK(calibration.SaveJSON(folder+_T("calibration.json")) && File::getSize((folder+_T("calibration.json")).c_str()) > 0, "saving the calibration");

	// train samples: cameras 1 and 2, frames 2 and 3
	DatasetOptions datasetOptions;
	datasetOptions.nStartFrame = 2;
	datasetOptions.nGOP = 2;
	datasetOptions.bLoadDepths = true;
	{
		const Dataset dataset(calibration, datasetOptions);
		TEST_CHECK(dataset.size() == 4, "train samples");
		Sample sample;
		TEST_CHECK(dataset.GetSample(1, sample), "reading a sample");
		TEST_CHECK(sample.image.type() == CV_32FC3 && sample.image.size() == size, "sample image format");
		TEST_CHECK(sample.image.at<cv::Vec3f>(5,5) == cv::Vec3f(30,20,10), "sample image is not RGB");
		TEST_CHECK(sample.time == 1 && sample.cameraID == 1 && sample.imageID == 1, "sample time or IDs");
		TEST_CHECK((sample.camToWorld-RigCameraToWorld(1)).norm() < TEST_EPS && sample.K == calibration.GetRecord(1).K, "sample camera");
		TEST_CHECK(sample.points.size() == 3 && sample.depths.size() == 3 && sample.depths[0] == 5.f, "sample depths");
		TEST_CHECK(std::abs(sample.points[0].x()-15.4f) < 1e-4f && std::abs(sample.points[0].y()-12.f) < 1e-4f, "projection of a point");
		TEST_CHECK(!dataset.GetSample(4, sample), "reading a sample out of range");
	}
	{
		datasetOptions.nPatchSize = 16;
		datasetOptions.bLoadDepths = false;
		const Dataset dataset(calibration, datasetOptions);
		std::mt19937 generator(3);
		for (size_t idx=0; idx<dataset.size(); ++idx) {
			Sample sample;
			TEST_CHECK(dataset.GetSample(idx, sample, &generator), "reading a patch");
			TEST_CHECK(sample.image.cols == 16 && sample.image.rows == 16 && sample.points.empty(), "patch size");
			const REAL x(16-sample.K(0,2)), y(12-sample.K(1,2));
			TEST_CHECK(x >= 0 && x < 16 && y >= 0 && y < 8 && x == std::floor(x) && y == std::floor(y), "patch principal point");
		}
	}
	{
		datasetOptions.split = GOP_SPLIT_TEST;
		datasetOptions.nPatchSize = 0;
		const Dataset dataset(calibration, datasetOptions);
		Sample sample;
		TEST_CHECK(dataset.size() == 2 && dataset.GetSample(0, sample) && sample.cameraID == -1 && sample.time == 0, "test samples");
	}

	// the normalized scene keeps the rig shape in a canonical frame
	{
		parserOptions.bNormalize = true;
		Calibration calibrationNormalized;
		TEST_CHECK(calibrationNormalized.Load(parserOptions), "loading the normalized calibration");
		Matrix3x3 R; Point3 t; REAL s;
		DecomposeSimilarityTransform(calibrationNormalized.transform, R, t, s);
		TEST_CHECK(std::abs(s-10) < 1e-6 && std::abs(R.determinant()-1) < 1e-6, "normalization scale");
		FOREACH(i, calibrationNormalized.camToWorlds) {
			const Matrix4x4& camToWorld = calibrationNormalized.camToWorlds[i];
			const Point3 center((calibrationNormalized.transform*RigCameraToWorld((uint32_t)i).col(3)).head<3>());
			TEST_CHECK((camToWorld.block<3,1>(0,3)-center).norm() < 1e-6, "normalized camera %u center", (unsigned)i);
			const Matrix3x3 Rc(camToWorld.topLeftCorner<3,3>());
			TEST_CHECK((Rc.transpose()*Rc-Matrix3x3::Identity()).norm() < 1e-6, "normalized camera %u rotation", (unsigned)i);
		}
		TEST_CHECK(std::abs(calibrationNormalized.sceneScale-1) < 1e-6, "normalized scene scale");
	}

	// camera folders and images must correspond one to one
	const String extraFolder(sceneFolder+GOP_PNG_FOLDER+_T("cam03/"));
	TEST_CHECK(File::createFolder(extraFolder.c_str()), "creating an extra camera folder");
	TEST_CHECK(!calibration.Load(parserOptions), "loading a scene with more camera folders than images");
	TEST_CHECK(ProcessScene(sceneFolder, options, reconstructor) == EXIT_FAILURE, "processing a scene with more camera folders than poses");
	TEST_CHECK(File::deleteFolder(extraFolder.c_str()), "removing the extra camera folder");

	// failures of the transcoder and the reconstruction are propagated
	TEST_CHECK(WriteTextFile(sceneFolder+_T("cam00.mp4"), ""), "writing a video");
	options.bExtractFrames = true;
	options.strFFmpegBin = _T("false");
	TEST_CHECK(ProcessScenes(folder, options, reconstructor) == 1, "transcoder failure");
	options.bExtractFrames = false;
	reconstructor.failStage = _T("triangulate");
	reconstructor.nFailExitCode = 7;
	TEST_CHECK(ProcessScenes(folder, options, reconstructor) == 7, "reconstruction failure");
	TEST_CHECK(ProcessScenes(folder+_T("missing/"), options, reconstructor) == EXIT_FAILURE, "missing root folder");
	return true;
}

// samples of distorted cameras are undistorted and cropped to the valid region
bool TestDistortedScene(const String& folder)
{
	const String sceneFolder(folder+_T("scene/"));
	const cv::Size size(64, 48);
	TEST_CHECK(CreateScene(sceneFolder, 3, 2, size, 60), "creating the scene");
	PlannerOptions options;
	options.nStartFrame = 0;
	options.nEndFrame = 1;
	options.nGOP = 1;
	FakeReconstructor reconstructor;
	{
		PoseBundleArr poses;
		TEST_CHECK(LoadPoseBundles(sceneFolder+GOP_POSES_FILE, poses), "loading the poses");
		ConvertPoses(poses, reconstructor.priors);
	}
	reconstructor.models = {_T("PINHOLE"), _T("OPENCV"), _T("OPENCV_FISHEYE")};
	TEST_CHECK(ProcessScenes(folder, options, reconstructor) == EXIT_SUCCESS, "processing the scene");

	ParserOptions parserOptions;
	parserOptions.strDataDir = sceneFolder;
	Calibration calibration;
	TEST_CHECK(calibration.Load(parserOptions), "loading the calibration");
	TEST_CHECK(!calibration.GetRecord(0).HasDistortion(), "pinhole camera");
	const CalibrationRecord& perspective = calibration.GetRecord(1);
	const CalibrationRecord& fisheye = calibration.GetRecord(2);
	TEST_CHECK(perspective.HasDistortion() && perspective.type == CAMERA_PERSPECTIVE && perspective.mask.empty(), "perspective camera");
	TEST_CHECK(fisheye.HasDistortion() && fisheye.type == CAMERA_FISHEYE && !fisheye.mask.empty(), "fisheye camera");
	TEST_CHECK(fisheye.mask.size() == fisheye.size && fisheye.roi.size() == fisheye.size, "fisheye region");
	TEST_CHECK(perspective.size.width <= size.width && perspective.size.height <= size.height && perspective.size.area() > 16*16, "perspective region");

	// train samples: the two distorted cameras
	DatasetOptions datasetOptions;
	datasetOptions.nGOP = 1;
	{
		const Dataset dataset(calibration, datasetOptions);
		TEST_CHECK(dataset.size() == 2, "train samples");
		for (size_t idx=0; idx<dataset.size(); ++idx) {
			const CalibrationRecord& record = calibration.GetRecord(idx+1);
			Sample sample;
			TEST_CHECK(dataset.GetSample(idx, sample), "reading sample %u", (unsigned)idx);
			TEST_CHECK(sample.image.size() == record.size && sample.K == record.K, "sample %u not cropped to the valid region", (unsigned)idx);
			TEST_CHECK(sample.image.at<cv::Vec3f>(sample.image.rows/2, sample.image.cols/2) == cv::Vec3f(30,20,10), "sample %u not remapped", (unsigned)idx);
			if (record.type == CAMERA_FISHEYE) {
				TEST_CHECK(sample.mask.size() == sample.image.size() && cv::countNonZero(sample.mask) > 0, "sample %u mask", (unsigned)idx);
			} else {
				TEST_CHECK(sample.mask.empty(), "sample %u mask", (unsigned)idx);
			}
		}
	}
	{
		datasetOptions.nPatchSize = 16;
		const Dataset dataset(calibration, datasetOptions);
		std::mt19937 generator(5);
		for (int i=0; i<10; ++i) {
			for (size_t idx=0; idx<dataset.size(); ++idx) {
				const CalibrationRecord& record = calibration.GetRecord(idx+1);
				Sample sample;
				TEST_CHECK(dataset.GetSample(idx, sample, &generator), "reading patch %u", (unsigned)idx);
				TEST_CHECK(sample.image.cols == 16 && sample.image.rows == 16, "patch %u size", (unsigned)idx);
				const REAL x(record.K(0,2)-sample.K(0,2)), y(record.K(1,2)-sample.K(1,2));
				TEST_CHECK(x >= 0 && y >= 0 && x == std::floor(x) && y == std::floor(y) && x+16 <= record.size.width && y+16 <= record.size.height, "patch %u principal point", (unsigned)idx);
				TEST_CHECK(sample.K(0,0) == record.K(0,0) && sample.K(1,1) == record.K(1,1), "patch %u focal", (unsigned)idx);
				if (record.type == CAMERA_FISHEYE)
					TEST_CHECK(sample.mask.size() == sample.image.size() && cv::countNonZero(sample.mask) > 0, "patch %u mask", (unsigned)idx);
			}
		}
	}
	return true;
}

// calibration records and undistortion maps
bool TestUndistortion()
{
	// intrinsics and distortion of the supported models
	{
		COLMAP::Camera camera;
		camera.ID = 5;
		camera.model = _T("OPENCV");
		camera.width = 640; camera.height = 480;
		camera.params = {500, 510, 320, 240, 0.1, -0.05, 0.001, 0.002};
		CalibrationRecord record;
		TEST_CHECK(MakeCalibrationRecord(camera, 2, record), "OPENCV calibration record");
		TEST_CHECK(record.ID == 5 && record.type == CAMERA_PERSPECTIVE && record.size == cv::Size(320,240), "OPENCV record size");
		TEST_CHECK(record.K(0,0) == 250 && record.K(1,1) == 255 && record.K(0,2) == 160 && record.K(1,2) == 120 && record.K(2,2) == 1, "OPENCV record intrinsics");
		TEST_CHECK(record.params == std::vector<double>({0.1, -0.05, 0.001, 0.002}), "OPENCV record distortion");
		camera.model = _T("SIMPLE_RADIAL");
		camera.params = {500, 320, 240, 0.1};
		TEST_CHECK(MakeCalibrationRecord(camera, 1, record) && record.params == std::vector<double>({0.1, 0, 0, 0}) && record.K(1,1) == 500, "SIMPLE_RADIAL record");
		camera.model = _T("RADIAL");
		camera.params = {500, 320, 240, 0.1, 0.2};
		TEST_CHECK(MakeCalibrationRecord(camera, 1, record) && record.params == std::vector<double>({0.1, 0.2, 0, 0}), "RADIAL record");
		camera.model = _T("OPENCV_FISHEYE");
		camera.params = {500, 500, 320, 240, 0.1, 0.2, 0.3, 0.4};
		TEST_CHECK(MakeCalibrationRecord(camera, 1, record) && record.type == CAMERA_FISHEYE && record.params.size() == 4, "OPENCV_FISHEYE record");
		camera.model = _T("PINHOLE");
		camera.params = {500, 500, 320, 240};
		TEST_CHECK(MakeCalibrationRecord(camera, 1, record) && !record.HasDistortion() && ComputeUndistortion(record) && record.mapX.empty(), "PINHOLE record");
		ScaleCalibrationRecord(record, 2, 2);
		TEST_CHECK(record.K(0,0) == 1000 && record.K(1,2) == 480 && record.size == cv::Size(1280,960), "scaled record");
		camera.model = _T("FULL_OPENCV");
		camera.params.assign(12, 0.0);
		TEST_CHECK(!MakeCalibrationRecord(camera, 1, record), "unsupported camera model");
	}
	// without distortion the perspective remap is the identity
	{
		CalibrationRecord record;
		record.K << 50, 0, 32, 0, 50, 24, 0, 0, 1;
		record.params = {0, 0, 0, 0};
		record.size = cv::Size(64, 48);
		TEST_CHECK(ComputeUndistortion(record), "perspective undistortion");
		TEST_CHECK(record.mapX.type() == CV_32FC1 && record.mapX.size() == cv::Size(64,48) && record.mask.empty(), "perspective maps");
		for (int v=0; v<48; v+=7)
			for (int u=0; u<64; u+=5)
				TEST_CHECK(std::abs(record.mapX.at<float>(v,u)-u) < 1e-2f && std::abs(record.mapY.at<float>(v,u)-v) < 1e-2f, "perspective map at (%d,%d)", u, v);
		TEST_CHECK(std::abs(record.K(0,0)-50) < 1e-3 && std::abs(record.K(0,2)-32) < 1e-3, "perspective intrinsics");
	}
	// without distortion the fisheye remap is the identity, cropped to the inner pixels
	{
		CalibrationRecord record;
		record.type = CAMERA_FISHEYE;
		record.K << 20, 0, 20, 0, 20, 15, 0, 0, 1;
		record.params = {0, 0, 0, 0};
		record.size = cv::Size(40, 30);
		TEST_CHECK(ComputeUndistortion(record), "fisheye undistortion");
		TEST_CHECK(record.mapX.at<float>(10,7) == 7.f && record.mapY.at<float>(10,7) == 10.f, "fisheye map");
		TEST_CHECK(record.roi == cv::Rect(1,1,38,28) && record.size == cv::Size(38,28), "fisheye region");
		TEST_CHECK(record.mask.size() == record.size && cv::countNonZero(record.mask) == 38*28, "fisheye mask");
		TEST_CHECK(record.K(0,2) == 19 && record.K(1,2) == 14 && record.K(0,0) == 20, "fisheye intrinsics");
	}
	// a barrel distortion shrinks the valid region
	{
		CalibrationRecord record;
		record.type = CAMERA_FISHEYE;
		record.K << 20, 0, 20, 0, 20, 15, 0, 0, 1;
		record.params = {0.5, 0, 0, 0};
		record.size = cv::Size(40, 30);
		TEST_CHECK(ComputeFisheyeUndistortion(record), "distorted fisheye undistortion");
		TEST_CHECK(record.roi.width < 38 && record.roi.height < 28 && record.roi.area() > 0, "distorted fisheye region");
		TEST_CHECK(record.K(0,2) == 20-record.roi.x && record.mask.size() == record.roi.size(), "distorted fisheye intrinsics");
	}
	return true;
}

// rig normalization and principal axes
bool TestNormalization()
{
	// cameras on a circle looking at its center, with Z up in the world
	const Point3 target(5, 5, 5);
	Matrix4x4Arr camToWorlds;
	for (int i=0; i<8; ++i) {
		const REAL angle(2*M_PI*i/8);
		const Point3 center(target + Point3(std::cos(angle), std::sin(angle), 0)*(3+(i%3)));
		const Vec3 forward((target-center).normalized());
		const Vec3 down(0, 0, -1);
		Matrix4x4 camToWorld(Matrix4x4::Identity());
		camToWorld.block<3,1>(0,0) = down.cross(forward);
		camToWorld.block<3,1>(0,1) = down;
		camToWorld.block<3,1>(0,2) = forward;
		camToWorld.block<3,1>(0,3) = center;
		camToWorlds.push_back(camToWorld);
	}
	const Matrix4x4 T(SimilarityFromCameras(camToWorlds));
	Matrix4x4Arr transformed(camToWorlds);
	TransformCameras(T, transformed);
	REALArr dists;
	Vec3 up(Vec3::Zero());
	for (const Matrix4x4& camToWorld: transformed) {
		const Matrix3x3 R(camToWorld.topLeftCorner<3,3>());
		TEST_CHECK((R.transpose()*R-Matrix3x3::Identity()).norm() < 1e-9, "rotation not orthonormal after normalization");
		dists.push_back(camToWorld.block<3,1>(0,3).norm());
		up -= R.col(1);
	}
	TEST_CHECK(std::abs(ComputeMedian(dists)-1) < 1e-9, "median camera distance");
	TEST_CHECK((up.normalized()-Vec3(0,-1,0)).norm() < 1e-9, "up direction");
	TEST_CHECK(ComputeMedian({3, 1, 2}) == 2 && ComputeMedian({4, 1, 3, 2}) == 2.5, "median");
	TEST_CHECK(SimilarityFromCameras(Matrix4x4Arr()) == Matrix4x4::Identity(), "normalization of an empty rig");

	// a rig mounted upside down is turned over, not mirrored
	{
		Matrix4x4Arr upsideDown;
		for (int i=0; i<3; ++i) {
			Matrix4x4 camToWorld(Matrix4x4::Identity());
			camToWorld.topLeftCorner<3,3>() = Matrix3x3(Vec3(1, -1, -1).asDiagonal());
			camToWorld(0,3) = i;
			upsideDown.push_back(camToWorld);
		}
		const Matrix4x4 U(SimilarityFromCameras(upsideDown));
		TEST_CHECK(U.topLeftCorner<3,3>().determinant() > 0, "normalization of an upside down rig is a reflection");
		TransformCameras(U, upsideDown);
		Vec3 upsideUp(Vec3::Zero());
		for (const Matrix4x4& camToWorld: upsideDown) {
			const Matrix3x3 Rc(camToWorld.topLeftCorner<3,3>());
			TEST_CHECK(std::abs(Rc.determinant()-1) < 1e-9 && (Rc.transpose()*Rc-Matrix3x3::Identity()).norm() < 1e-9, "upside down camera rotation after normalization");
			upsideUp -= Rc.col(1);
		}
		TEST_CHECK((upsideUp.normalized()-Vec3(0,-1,0)).norm() < 1e-9, "up direction of an upside down rig");
	}

	// points spread mostly along (1,1,0), then along Z
	Point3fArr points;
	for (int i=-5; i<=5; ++i)
		for (int j=-2; j<=2; ++j)
			points.emplace_back(Point3f(1,2,3) + Point3f(1,1,0)*(float)i + Point3f(0,0,1)*(0.5f*j) + Point3f(1,-1,0)*(0.1f*((i+j)%2)));
	Matrix4x4 A;
	TEST_CHECK(AlignPrincipalAxes(points, A), "principal axes");
	TEST_CHECK(std::abs(A.topLeftCorner<3,3>().determinant()-1) < 1e-6, "principal axes rotation");
	TransformPoints(A, points);
	Vec3 variance(Vec3::Zero());
	for (const Point3f& p: points)
		variance += p.cast<REAL>().cwiseAbs2();
	TEST_CHECK(variance.x() > variance.y() && variance.y() > variance.z(), "principal axes order");
	TEST_CHECK(!AlignPrincipalAxes(Point3fArr(1, Point3f(1,2,3)), A), "principal axes of a single point");

	// decomposition of a similarity
	const Matrix3x3 R(MakeRotation(0.3, Vec3(1,2,3)));
	Matrix4x4 S(Matrix4x4::Identity());
	S.topLeftCorner<3,3>() = R*2.5;
	S.block<3,1>(0,3) = Point3(1,-2,3);
	Matrix3x3 Rs; Point3 ts; REAL s;
	DecomposeSimilarityTransform(S, Rs, ts, s);
	TEST_CHECK(std::abs(s-2.5) < 1e-6 && RotationAngleDiff(Rs, R) < 1e-6 && (ts-Point3(1,-2,3)).norm() < 1e-6, "similarity transform decomposition");
	return true;
}

// samples index, split and time
bool TestDatasetIndexing()
{
	const Calibration calibration;
	DatasetOptions options;
	options.nGOP = 50;
	options.testSet = {0};
	IndexArr train, test;
	Dataset::SelectIndices(4, options, train);
	options.split = GOP_SPLIT_TEST;
	Dataset::SelectIndices(4, options, test);
	TEST_CHECK(test.size() == 50 && test.back() == 49, "test split");
	TEST_CHECK(train.size() == 150 && train.front() == 50, "train split");
	// train and test cover all samples exactly once
	IndexArr all(train);
	all.insert(all.end(), test.begin(), test.end());
	std::sort(all.begin(), all.end());
	FOREACH(i, all)
		TEST_CHECK(all[i] == i, "split coverage");
	// the sample count does not wrap around for huge rigs
	{
		DatasetOptions huge;
		huge.nGOP = 1;
		huge.split = GOP_SPLIT_TEST;
		huge.testSet = {1};
		IndexArr indices;
		Dataset::SelectIndices((size_t(1)<<32)+2, huge, indices);
		TEST_CHECK(indices.empty(), "sample count of a huge rig");
	}
	// removed cameras are in no split
	options.removeSet = {0, 2};
	Dataset::SelectIndices(4, options, test);
	TEST_CHECK(test.empty(), "removed test camera");
	options.split = _T("val");
	options.testSet = {1, 2};
	Dataset::SelectIndices(4, options, test);
	TEST_CHECK(test.size() == 50 && test.front() == 50, "other split");

	// sample index to camera and frame is a bijection
	options = DatasetOptions();
	options.nGOP = 50;
	options.nStartFrame = 100;
	options.testSet.clear();
	const Dataset dataset(calibration, options);
	TEST_CHECK(dataset.size() == 0, "samples without cameras");
	Dataset full(calibration, options);
	Dataset::SelectIndices(3, options, full.indices);
	std::set<std::pair<uint32_t,uint32_t>> pairs;
	for (size_t idx=0; idx<full.size(); ++idx) {
		uint32_t idxCamera, frame;
		full.IndexToCameraFrame(idx, idxCamera, frame);
		TEST_CHECK(idxCamera < 3 && frame >= 100 && frame < 150, "sample %u camera or frame", (unsigned)idx);
		pairs.emplace(idxCamera, frame);
	}
	TEST_CHECK(pairs.size() == 150, "samples are not a bijection");

	// normalized time in the group
	TEST_CHECK(full.ComputeTime(100) == 0 && full.ComputeTime(149) == 1, "time range");
	TEST_CHECK(std::abs(full.ComputeTime(125)-0.5102) < 1e-4, "time of the middle frame");
	options.nGOP = 1;
	TEST_CHECK(Dataset(calibration, options).ComputeTime(100) == 0, "time of a single frame group");
	return true;
}

// extended scene metadata
bool TestMetadata(const String& folder)
{
	const String fileName(folder+GOP_EXT_METADATA_FILE);
	TEST_CHECK(WriteTextFile(fileName, "{\"spiral_radius_scale\": 0.5, \"other\": 1}"), "writing the metadata");
	ExtMetadata metadata;
	TEST_CHECK(metadata.Load(fileName) && metadata.spiralRadiusScale == 0.5 && !metadata.bNoFactorSuffix, "metadata values");
	TEST_CHECK(WriteTextFile(fileName, "{\"no_factor_suffix\": true"), "writing invalid metadata");
	TEST_CHECK(!metadata.Load(fileName), "loading invalid metadata");
	TEST_CHECK(!metadata.Load(folder+_T("missing.json")), "loading missing metadata");
	return true;
}

// test various algorithms independently
bool UnitTests()
{
	TD_TIMER_START();
	const String folder(MAKE_PATH(_T("gop_tests/")));
	if (!File::deleteFolder(folder.c_str()) || !File::createFolder(folder.c_str())) {
		VERBOSE("ERROR: can not create the test folder '%s'", folder.c_str());
		return false;
	}
	if (!TestKeyframes()) {
		VERBOSE("ERROR: TestKeyframes failed!");
		return false;
	}
	if (!TestPoseRemap()) {
		VERBOSE("ERROR: TestPoseRemap failed!");
		return false;
	}
	if (!TestQuaternion()) {
		VERBOSE("ERROR: TestQuaternion failed!");
		return false;
	}
	if (!TestCameraPrior()) {
		VERBOSE("ERROR: TestCameraPrior failed!");
		return false;
	}
	if (!TestNPY()) {
		VERBOSE("ERROR: TestNPY failed!");
		return false;
	}
	if (!TestColmapModel(folder+_T("model/"))) {
		VERBOSE("ERROR: TestColmapModel failed!");
		return false;
	}
	if (!TestProjectMaterialization(folder+_T("project/"))) {
		VERBOSE("ERROR: TestProjectMaterialization failed!");
		return false;
	}
	if (!TestReconstructionDriver(folder+_T("driver/"))) {
		VERBOSE("ERROR: TestReconstructionDriver failed!");
		return false;
	}
	if (!TestUndistortion()) {
		VERBOSE("ERROR: TestUndistortion failed!");
		return false;
	}
	if (!TestNormalization()) {
		VERBOSE("ERROR: TestNormalization failed!");
		return false;
	}
	if (!TestDatasetIndexing()) {
		VERBOSE("ERROR: TestDatasetIndexing failed!");
		return false;
	}
	if (!TestMetadata(folder)) {
		VERBOSE("ERROR: TestMetadata failed!");
		return false;
	}
	if (!TestScene(folder+_T("scenes/"))) {
		VERBOSE("ERROR: TestScene failed!");
		return false;
	}
	if (!TestDistortedScene(folder+_T("distorted/"))) {
		VERBOSE("ERROR: TestDistortedScene failed!");
		return false;
	}
	File::deleteFolder(folder.c_str());
	VERBOSE("All unit tests passed (%s)", TD_TIMER_GET_FMT().c_str());
	return true;
}

// test GOP functionality
int main(int argc, LPCTSTR* argv)
{
	OPEN_LOG();
	OPEN_LOGCONSOLE();
	GOP::Initialize(APPNAME);
	WORKING_FOLDER = _DATA_PATH;
	INIT_WORKING_FOLDER;
	if (!UnitTests())
		return EXIT_FAILURE;
	GOP::Finalize();
	CLOSE_LOGCONSOLE();
	CLOSE_LOG();
	return EXIT_SUCCESS;
}
/*----------------------------------------------------------------*/
