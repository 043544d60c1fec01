////////////////////////////////////////////////////////////////////
// NPY.cpp
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#include "Common.h"
#include "NPY.h"

using namespace TOOLS;


// D E F I N E S ///////////////////////////////////////////////////

#define NPY_MAGIC "\x93NUMPY"
#define NPY_MAGIC_LEN 6
#define NPY_ALIGNMENT 64


// S T R U C T S ///////////////////////////////////////////////////

namespace {
// return the value following the given key in the header dictionary
String FindHeaderValue(const String& header, LPCTSTR key)
{
	const String::size_type k(header.find(String::FormatString("'%s'", key)));
	if (k == String::npos)
		return String();
	const String::size_type colon(header.find(_T(':'), k));
	if (colon == String::npos)
		return String();
	String::size_type beg(header.find_first_not_of(_T(" \t"), colon+1));
	if (beg == String::npos)
		return String();
	String::size_type end;
	if (header[beg] == _T('(')) {
		end = header.find(_T(')'), beg);
		if (end == String::npos)
			return String();
		++end;
	} else if (header[beg] == _T('\'') || header[beg] == _T('"')) {
		end = header.find(header[beg], beg+1);
		if (end == String::npos)
			return String();
		++beg;
	} else {
		end = header.find_first_of(_T(",}"), beg);
		if (end == String::npos)
			return String();
	}
	String value(header.substr(beg, end-beg));
	return Util::strTrim(value, _T(" \t"));
}
} // namespace


// parse the python dictionary literal describing the array, ex:
// {'descr': '<f8', 'fortran_order': False, 'shape': (20, 17), }
bool NPY::ParseHeader(const String& header, String& descr, bool& bFortranOrder, Shape& shape)
{
	descr = FindHeaderValue(header, "descr");
	if (descr.empty())
		return false;
	const String fortran(FindHeaderValue(header, "fortran_order"));
	if (fortran == _T("True"))
		bFortranOrder = true;
	else if (fortran == _T("False"))
		bFortranOrder = false;
	else
		return false;
	String strShape(FindHeaderValue(header, "shape"));
	if (strShape.size() < 2 || strShape.front() != _T('(') || strShape.back() != _T(')'))
		return false;
	strShape = strShape.substr(1, strShape.size()-2);
	StringArr dims;
	Util::strSplit(strShape, _T(','), dims);
	shape.clear();
	for (String& dim: dims) {
		Util::strTrim(dim, _T(" \t"));
		if (dim.empty())
			continue;
		size_t n;
		if (!String::FromString(dim, n))
			return false;
		shape.push_back(n);
	}
	return true;
} // ParseHeader
/*----------------------------------------------------------------*/

bool NPY::Load(const String& fileName)
{
	std::ifstream stream(fileName, std::ios::binary);
	if (!stream.good()) {
		VERBOSE("error: can not open NPY file '%s'", fileName.c_str());
		return false;
	}
	if (!Load(stream)) {
		VERBOSE("error: invalid NPY file '%s'", fileName.c_str());
		return false;
	}
	return true;
}

bool NPY::Load(std::istream& stream)
{
	Release();
	char magic[NPY_MAGIC_LEN];
	stream.read(magic, NPY_MAGIC_LEN);
	if (!stream || memcmp(magic, NPY_MAGIC, NPY_MAGIC_LEN) != 0)
		return false;
	const uint8_t major(ReadBinaryLittleEndian<uint8_t>(&stream));
	ReadBinaryLittleEndian<uint8_t>(&stream); // minor version
	size_t headerLen;
	if (major == 1)
		headerLen = ReadBinaryLittleEndian<uint16_t>(&stream);
	else if (major == 2 || major == 3)
		headerLen = ReadBinaryLittleEndian<uint32_t>(&stream);
	else
		return false;
	if (!stream)
		return false;
	String header(headerLen, _T('\0'));
	stream.read(&header[0], (std::streamsize)headerLen);
	if (!stream)
		return false;
	String descr;
	if (!ParseHeader(header, descr, bFortranOrder, shape))
		return false;
	if (descr.size() != 3 || descr[1] != _T('f'))
		return false;
	const bool bBigEndian(descr[0] == _T('>'));
	const size_t elemSize(descr[2] - _T('0'));
	if (elemSize != 4 && elemSize != 8)
		return false;
	const size_t numElems(std::accumulate(shape.begin(), shape.end(), size_t(1), std::multiplies<size_t>()));
	std::vector<char> buffer(numElems*elemSize);
	stream.read(buffer.data(), (std::streamsize)buffer.size());
	if (!stream)
		return false;
	data.resize(numElems);
	FOREACH(i, data) {
		const char* const ptr(buffer.data()+i*elemSize);
		if (elemSize == 8) {
			double v;
			memcpy(&v, ptr, sizeof(double));
			data[i] = bBigEndian ? BigEndianToNative(v) : LittleEndianToNative(v);
		} else {
			float v;
			memcpy(&v, ptr, sizeof(float));
			data[i] = bBigEndian ? BigEndianToNative(v) : LittleEndianToNative(v);
		}
	}
	if (bFortranOrder && shape.size() == 2) {
		// transpose to row-major
		const size_t R(shape[0]), C(shape[1]);
		REALArr rowMajor(data.size());
		for (size_t r=0; r<R; ++r)
			for (size_t c=0; c<C; ++c)
				rowMajor[r*C+c] = data[c*R+r];
		data.swap(rowMajor);
		bFortranOrder = false;
	} else if (bFortranOrder && shape.size() > 2) {
		return false;
	}
	return true;
} // Load
/*----------------------------------------------------------------*/

bool NPY::Save(const String& fileName) const
{
	Util::ensureFolder(fileName);
	std::ofstream stream(fileName, std::ios::binary);
	if (!stream.good()) {
		VERBOSE("error: can not create NPY file '%s'", fileName.c_str());
		return false;
	}
	return Save(stream);
}

// always stored as version 1, little endian float64, C order
bool NPY::Save(std::ostream& stream) const
{
	ASSERT(!bFortranOrder);
	String strShape;
	FOREACH(i, shape) {
		if (i)
			strShape += _T(", ");
		strShape += String::FormatString("%zu", shape[i]);
	}
	if (shape.size() == 1)
		strShape += _T(',');
	String header(String::FormatString("{'descr': '<f8', 'fortran_order': False, 'shape': (%s), }", strShape.c_str()));
	// pad with spaces so that the data starts aligned, the header ends with a new line
	const size_t preambleLen(NPY_MAGIC_LEN+2+2);
	const size_t total(((preambleLen+header.size()+1+NPY_ALIGNMENT-1)/NPY_ALIGNMENT)*NPY_ALIGNMENT);
	header.append(total-preambleLen-header.size()-1, _T(' '));
	header += _T('\n');
	stream.write(NPY_MAGIC, NPY_MAGIC_LEN);
	WriteBinaryLittleEndian<uint8_t>(&stream, 1);
	WriteBinaryLittleEndian<uint8_t>(&stream, 0);
	WriteBinaryLittleEndian<uint16_t>(&stream, (uint16_t)header.size());
	stream.write(header.data(), (std::streamsize)header.size());
	WriteBinaryLittleEndian<double>(&stream, data);
	return !stream.fail();
} // Save
/*----------------------------------------------------------------*/
