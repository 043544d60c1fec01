////////////////////////////////////////////////////////////////////
// File.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __TOOLS_FILE_H__
#define __TOOLS_FILE_H__


// I N C L U D E S /////////////////////////////////////////////////

#include <filesystem>


// D E F I N E S ///////////////////////////////////////////////////


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

// file system helpers; all of them report failure by returning false
class GENERAL_API File
{
public:
	typedef std::filesystem::path Path;

	static bool access(LPCTSTR aFileName) {
		std::error_code ec;
		return std::filesystem::exists(aFileName, ec);
	}
	static bool isFile(LPCTSTR aFileName) {
		std::error_code ec;
		return std::filesystem::is_regular_file(aFileName, ec);
	}
	static bool isFolder(LPCTSTR aFolderName) {
		std::error_code ec;
		return std::filesystem::is_directory(aFolderName, ec);
	}
	static int64_t getSize(LPCTSTR aFileName) {
		std::error_code ec;
		const std::uintmax_t size(std::filesystem::file_size(aFileName, ec));
		return ec ? int64_t(-1) : (int64_t)size;
	}

	static bool createFolder(LPCTSTR aFolderName) {
		std::error_code ec;
		std::filesystem::create_directories(aFolderName, ec);
		return !ec && isFolder(aFolderName);
	}
	static bool deleteFile(LPCTSTR aFileName) {
		std::error_code ec;
		return std::filesystem::remove(aFileName, ec) && !ec;
	}
	// remove the folder with all its content; succeeds if the folder does not exist
	static bool deleteFolder(LPCTSTR aFolderName) {
		std::error_code ec;
		std::filesystem::remove_all(aFolderName, ec);
		return !ec;
	}
	static bool copyFile(LPCTSTR source, LPCTSTR target) {
		std::error_code ec;
		return std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing, ec) && !ec;
	}
	static bool renameFile(LPCTSTR source, LPCTSTR target) {
		std::error_code ec;
		std::filesystem::rename(source, target, ec);
		return !ec;
	}

	// list the names of the entries found in the given folder, sorted lexicographically;
	// folders only if bFolders, regular files only otherwise;
	// if ext is not empty, only files with the given extension are listed
	static StringArr listFolder(LPCTSTR aFolderName, bool bFolders, LPCTSTR ext = _T("")) {
		StringArr names;
		std::error_code ec;
		for (const auto& entry: std::filesystem::directory_iterator(aFolderName, ec)) {
			if (bFolders) {
				if (!entry.is_directory(ec))
					continue;
			} else {
				if (!entry.is_regular_file(ec))
					continue;
				if (ext[0] != _T('\0') && entry.path().extension() != ext)
					continue;
			}
			names.emplace_back(entry.path().filename().string());
		}
		std::sort(names.begin(), names.end());
		return names;
	}
	// list all entries of the given folder (files and folders), sorted lexicographically
	static StringArr listEntries(LPCTSTR aFolderName) {
		StringArr names;
		std::error_code ec;
		for (const auto& entry: std::filesystem::directory_iterator(aFolderName, ec))
			names.emplace_back(entry.path().filename().string());
		std::sort(names.begin(), names.end());
		return names;
	}
};
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __TOOLS_FILE_H__
