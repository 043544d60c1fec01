////////////////////////////////////////////////////////////////////
// NPY.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __IO_NPY_H__
#define __IO_NPY_H__


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

// reader/writer for NumPy .npy files storing a floating point array;
// version 1, 2 and 3 headers are supported, for little and big endian
// float32 or float64 data; the values are always converted to double
class IO_API NPY
{
public:
	typedef std::vector<size_t> Shape;

public:
	Shape shape;		// dimensions of the array, in C order
	REALArr data;		// values of the array, row-major
	bool bFortranOrder;	// the data is stored column-major

public:
	NPY() : bFortranOrder(false) {}

	bool IsEmpty() const { return data.empty(); }
	size_t rows() const { return shape.empty() ? 0 : shape[0]; }
	size_t cols() const { return shape.size() < 2 ? 1 : data.size()/MAXF(rows(),size_t(1)); }
	REAL operator()(size_t r, size_t c) const { ASSERT(r < rows() && c < cols()); return data[r*cols()+c]; }

	void Release() { shape.clear(); data.clear(); bFortranOrder = false; }

	bool Load(const String& fileName);
	bool Load(std::istream& stream);
	bool Save(const String& fileName) const;
	bool Save(std::ostream& stream) const;

	static bool ParseHeader(const String& header, String& descr, bool& bFortranOrder, Shape& shape);
};
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __IO_NPY_H__
