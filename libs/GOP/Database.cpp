/*
* Database.cpp
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
#include "Database.h"
#include <sqlite3.h>

using namespace GOP;


// D E F I N E S ///////////////////////////////////////////////////


// S T R U C T S ///////////////////////////////////////////////////

namespace {
// schema of the COLMAP database (version 3.x, with pose priors in the images table)
LPCTSTR const g_szCreateTables[] = {
	"CREATE TABLE IF NOT EXISTS cameras ("
	"    camera_id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL,"
	"    model INTEGER NOT NULL,"
	"    width INTEGER NOT NULL,"
	"    height INTEGER NOT NULL,"
	"    params BLOB,"
	"    prior_focal_length INTEGER NOT NULL)",
	"CREATE TABLE IF NOT EXISTS images ("
	"    image_id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL,"
	"    name TEXT NOT NULL UNIQUE,"
	"    camera_id INTEGER NOT NULL,"
	"    prior_qw REAL,"
	"    prior_qx REAL,"
	"    prior_qy REAL,"
	"    prior_qz REAL,"
	"    prior_tx REAL,"
	"    prior_ty REAL,"
	"    prior_tz REAL,"
	"    CONSTRAINT image_id_check CHECK(image_id >= 0 and image_id < 2147483647),"
	"    FOREIGN KEY(camera_id) REFERENCES cameras(camera_id))",
	"CREATE TABLE IF NOT EXISTS keypoints ("
	"    image_id INTEGER PRIMARY KEY NOT NULL,"
	"    rows INTEGER NOT NULL,"
	"    cols INTEGER NOT NULL,"
	"    data BLOB,"
	"    FOREIGN KEY(image_id) REFERENCES images(image_id) ON DELETE CASCADE)",
	"CREATE TABLE IF NOT EXISTS descriptors ("
	"    image_id INTEGER PRIMARY KEY NOT NULL,"
	"    rows INTEGER NOT NULL,"
	"    cols INTEGER NOT NULL,"
	"    data BLOB,"
	"    FOREIGN KEY(image_id) REFERENCES images(image_id) ON DELETE CASCADE)",
	"CREATE TABLE IF NOT EXISTS matches ("
	"    pair_id INTEGER PRIMARY KEY NOT NULL,"
	"    rows INTEGER NOT NULL,"
	"    cols INTEGER NOT NULL,"
	"    data BLOB)",
	"CREATE TABLE IF NOT EXISTS two_view_geometries ("
	"    pair_id INTEGER PRIMARY KEY NOT NULL,"
	"    rows INTEGER NOT NULL,"
	"    cols INTEGER NOT NULL,"
	"    data BLOB,"
	"    config INTEGER NOT NULL,"
	"    F BLOB,"
	"    E BLOB,"
	"    H BLOB,"
	"    qvec BLOB,"
	"    tvec BLOB)",
	"CREATE UNIQUE INDEX IF NOT EXISTS index_name ON images(name)",
};

// finalizes the prepared statement when going out of scope
struct StatementGuard {
	sqlite3_stmt* stmt;
	explicit StatementGuard(sqlite3_stmt* _stmt) : stmt(_stmt) {}
	~StatementGuard() { sqlite3_finalize(stmt); }
};
} // namespace


ColmapDatabase::ColmapDatabase()
	:
	m_db(NULL),
	m_bTransaction(false)
{
}

ColmapDatabase::~ColmapDatabase()
{
	Close();
}

bool ColmapDatabase::CheckError(int rc, LPCTSTR what) const
{
	if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
		return true;
	VERBOSE("error: database '%s' %s failed: %s", m_fileName.c_str(), what,
		m_db != NULL ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc));
	return false;
}

bool ColmapDatabase::Open(const String& fileName)
{
	Close();
	m_fileName = fileName;
	const int rc(sqlite3_open_v2(fileName.c_str(), &m_db, SQLITE_OPEN_READWRITE|SQLITE_OPEN_CREATE, NULL));
	if (rc != SQLITE_OK) {
		CheckError(rc, _T("open"));
		sqlite3_close(m_db);
		m_db = NULL;
		return false;
	}
	return true;
}

bool ColmapDatabase::Execute(LPCTSTR sql)
{
	ASSERT(IsOpen());
	char* szError(NULL);
	const int rc(sqlite3_exec(m_db, sql, NULL, NULL, &szError));
	if (rc != SQLITE_OK) {
		VERBOSE("error: database '%s' query failed: %s", m_fileName.c_str(), szError != NULL ? szError : sqlite3_errstr(rc));
		sqlite3_free(szError);
		return false;
	}
	return true;
}

bool ColmapDatabase::Prepare(LPCTSTR sql, sqlite3_stmt*& stmt) const
{
	stmt = NULL;
	return CheckError(sqlite3_prepare_v2(m_db, sql, -1, &stmt, NULL), _T("prepare"));
}

bool ColmapDatabase::BeginTransaction()
{
	if (m_bTransaction)
		return true;
	if (!Execute("BEGIN TRANSACTION"))
		return false;
	m_bTransaction = true;
	return true;
}

bool ColmapDatabase::CreateTables()
{
	if (!IsOpen())
		return false;
	for (LPCTSTR sql: g_szCreateTables)
		if (!Execute(sql))
			return false;
	return true;
}

uint32_t ColmapDatabase::AddCamera(int model, uint32_t width, uint32_t height, const std::vector<double>& params, bool bPriorFocalLength)
{
	if (!IsOpen() || !BeginTransaction())
		return 0;
	sqlite3_stmt* stmt;
	if (!Prepare("INSERT INTO cameras(camera_id, model, width, height, params, prior_focal_length) VALUES(NULL, ?, ?, ?, ?, ?)", stmt))
		return 0;
	const StatementGuard guard(stmt);
	// parameters are stored as a raw array of little endian doubles
	std::vector<double> blob(params.size());
	FOREACH(i, params)
		blob[i] = NativeToLittleEndian(params[i]);
	if (!CheckError(sqlite3_bind_int(stmt, 1, model), _T("bind")) ||
		!CheckError(sqlite3_bind_int64(stmt, 2, width), _T("bind")) ||
		!CheckError(sqlite3_bind_int64(stmt, 3, height), _T("bind")) ||
		!CheckError(sqlite3_bind_blob(stmt, 4, blob.data(), (int)(blob.size()*sizeof(double)), SQLITE_TRANSIENT), _T("bind")) ||
		!CheckError(sqlite3_bind_int(stmt, 5, bPriorFocalLength ? 1 : 0), _T("bind")))
		return 0;
	if (!CheckError(sqlite3_step(stmt), _T("insert camera")))
		return 0;
	return (uint32_t)sqlite3_last_insert_rowid(m_db);
}

uint32_t ColmapDatabase::AddImage(const String& name, uint32_t cameraID, const Vec4& q, const Point3& t, uint32_t imageID)
{
	if (!IsOpen() || !BeginTransaction())
		return 0;
	if (imageID >= GOP_MAX_IMAGE_ID) {
		VERBOSE("error: image ID %u out of range", imageID);
		return 0;
	}
	sqlite3_stmt* stmt;
	if (!Prepare("INSERT INTO images(image_id, name, camera_id, prior_qw, prior_qx, prior_qy, prior_qz, prior_tx, prior_ty, prior_tz) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", stmt))
		return 0;
	const StatementGuard guard(stmt);
	bool bOK(CheckError(sqlite3_bind_int64(stmt, 1, imageID), _T("bind")) &&
		CheckError(sqlite3_bind_text(stmt, 2, name.c_str(), (int)name.size(), SQLITE_TRANSIENT), _T("bind")) &&
		CheckError(sqlite3_bind_int64(stmt, 3, cameraID), _T("bind")));
	for (int i=0; i<4 && bOK; ++i)
		bOK = CheckError(sqlite3_bind_double(stmt, 4+i, q(i)), _T("bind"));
	for (int i=0; i<3 && bOK; ++i)
		bOK = CheckError(sqlite3_bind_double(stmt, 8+i, t(i)), _T("bind"));
	if (!bOK || !CheckError(sqlite3_step(stmt), _T("insert image")))
		return 0;
	return (uint32_t)sqlite3_last_insert_rowid(m_db);
}

bool ColmapDatabase::Commit()
{
	if (!IsOpen())
		return false;
	if (!m_bTransaction)
		return true;
	m_bTransaction = false;
	return Execute("COMMIT");
}

void ColmapDatabase::Close()
{
	if (m_db == NULL)
		return;
	if (m_bTransaction) {
		// uncommitted changes are dropped
		if (!Execute("ROLLBACK"))
			VERBOSE("error: database '%s' rollback failed", m_fileName.c_str());
		m_bTransaction = false;
	}
	sqlite3_close(m_db);
	m_db = NULL;
}
/*----------------------------------------------------------------*/

bool ColmapDatabase::ReadCameras(std::vector<CameraRow>& cameras) const
{
	cameras.clear();
	if (!IsOpen())
		return false;
	sqlite3_stmt* stmt;
	if (!Prepare("SELECT camera_id, model, width, height, params, prior_focal_length FROM cameras ORDER BY camera_id", stmt))
		return false;
	const StatementGuard guard(stmt);
	int rc;
	while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
		CameraRow camera;
		camera.ID = (uint32_t)sqlite3_column_int64(stmt, 0);
		camera.model = sqlite3_column_int(stmt, 1);
		camera.width = (uint32_t)sqlite3_column_int64(stmt, 2);
		camera.height = (uint32_t)sqlite3_column_int64(stmt, 3);
		const double* const blob((const double*)sqlite3_column_blob(stmt, 4));
		const size_t numParams((size_t)sqlite3_column_bytes(stmt, 4)/sizeof(double));
		camera.params.resize(numParams);
		for (size_t i=0; i<numParams; ++i) {
			double v;
			memcpy(&v, blob+i, sizeof(double));
			camera.params[i] = LittleEndianToNative(v);
		}
		camera.bPriorFocalLength = sqlite3_column_int(stmt, 5) != 0;
		cameras.emplace_back(std::move(camera));
	}
	return CheckError(rc, _T("read cameras"));
}

bool ColmapDatabase::ReadImages(std::vector<ImageRow>& images) const
{
	images.clear();
	if (!IsOpen())
		return false;
	sqlite3_stmt* stmt;
	if (!Prepare("SELECT image_id, name, camera_id, prior_qw, prior_qx, prior_qy, prior_qz, prior_tx, prior_ty, prior_tz FROM images ORDER BY image_id", stmt))
		return false;
	const StatementGuard guard(stmt);
	int rc;
	while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
		ImageRow image;
		image.ID = (uint32_t)sqlite3_column_int64(stmt, 0);
		image.name = (LPCTSTR)sqlite3_column_text(stmt, 1);
		image.cameraID = (uint32_t)sqlite3_column_int64(stmt, 2);
		for (int i=0; i<4; ++i)
			image.q(i) = sqlite3_column_double(stmt, 3+i);
		for (int i=0; i<3; ++i)
			image.t(i) = sqlite3_column_double(stmt, 7+i);
		images.emplace_back(std::move(image));
	}
	return CheckError(rc, _T("read images"));
}
/*----------------------------------------------------------------*/
