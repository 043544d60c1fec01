/*
* Database.h
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

#ifndef _GOP_DATABASE_H_
#define _GOP_DATABASE_H_


// I N C L U D E S /////////////////////////////////////////////////

#include "Common.h"

struct sqlite3;
struct sqlite3_stmt;


// D E F I N E S ///////////////////////////////////////////////////

// maximum number of images allowed by the COLMAP database schema
#define GOP_MAX_IMAGE_ID 2147483647


// S T R U C T S ///////////////////////////////////////////////////

namespace GOP {

// write interface of the reconstruction tool database:
// the cameras and images with their pose priors are inserted
// before running the feature extraction and triangulation
class GOP_API DatabaseWriter
{
public:
	virtual ~DatabaseWriter() {}

	virtual bool Open(const String& fileName) = 0;
	virtual bool CreateTables() = 0;
	// insert a camera and return its ID (0 on failure)
	virtual uint32_t AddCamera(int model, uint32_t width, uint32_t height, const std::vector<double>& params, bool bPriorFocalLength=false) = 0;
	// insert an image with the given pose prior and return its ID (0 on failure)
	virtual uint32_t AddImage(const String& name, uint32_t cameraID, const Vec4& q, const Point3& t, uint32_t imageID) = 0;
	virtual bool Commit() = 0;
	virtual void Close() = 0;
};
typedef std::shared_ptr<DatabaseWriter> DatabaseWriterPtr;


// COLMAP database stored in a SQLite3 file
class GOP_API ColmapDatabase : public DatabaseWriter
{
public:
	struct CameraRow {
		uint32_t ID;
		int model;
		uint32_t width, height;
		std::vector<double> params;
		bool bPriorFocalLength;
	};
	struct ImageRow {
		uint32_t ID;
		String name;
		uint32_t cameraID;
		Vec4 q;
		Point3 t;
	};

public:
	ColmapDatabase();
	~ColmapDatabase() override;

	bool IsOpen() const { return m_db != NULL; }

	bool Open(const String& fileName) override;
	bool CreateTables() override;
	uint32_t AddCamera(int model, uint32_t width, uint32_t height, const std::vector<double>& params, bool bPriorFocalLength=false) override;
	uint32_t AddImage(const String& name, uint32_t cameraID, const Vec4& q, const Point3& t, uint32_t imageID) override;
	bool Commit() override;
	void Close() override;

	// read back the stored rows, ordered by ID
	bool ReadCameras(std::vector<CameraRow>& cameras) const;
	bool ReadImages(std::vector<ImageRow>& images) const;

protected:
	bool Execute(LPCTSTR sql);
	bool BeginTransaction();
	bool Prepare(LPCTSTR sql, sqlite3_stmt*& stmt) const;
	bool CheckError(int rc, LPCTSTR what) const;

protected:
	sqlite3* m_db; // database connection
	String m_fileName; // path to the database file
	bool m_bTransaction; // a transaction is open and waits to be committed
};
/*----------------------------------------------------------------*/

} // namespace GOP

#endif // _GOP_DATABASE_H_
