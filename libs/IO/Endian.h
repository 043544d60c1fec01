////////////////////////////////////////////////////////////////////
// Endian.h
//
// Copyright 2007 cDc@seacave
// Distributed under the Boost Software License, Version 1.0
// (See http://www.boost.org/LICENSE_1_0.txt)

#ifndef __IO_ENDIAN_H__
#define __IO_ENDIAN_H__


// I N C L U D E S /////////////////////////////////////////////////


// D E F I N E S ///////////////////////////////////////////////////


namespace TOOLS {

// S T R U C T S ///////////////////////////////////////////////////

inline bool IsLittleEndian() {
	const uint16_t number(1);
	return *reinterpret_cast<const uint8_t*>(&number) == 1;
}

// reverse the byte order of the given value
template <typename T>
inline T ReverseBytes(const T& data) {
	T reversed(data);
	uint8_t* const bytes(reinterpret_cast<uint8_t*>(&reversed));
	std::reverse(bytes, bytes+sizeof(T));
	return reversed;
}

template <typename T>
inline T LittleEndianToNative(const T x) {
	return IsLittleEndian() ? x : ReverseBytes(x);
}
template <typename T>
inline T BigEndianToNative(const T x) {
	return IsLittleEndian() ? ReverseBytes(x) : x;
}
template <typename T>
inline T NativeToLittleEndian(const T x) {
	return IsLittleEndian() ? x : ReverseBytes(x);
}

// read/write values stored in little endian order
template <typename T>
inline T ReadBinaryLittleEndian(std::istream* stream) {
	T data;
	stream->read(reinterpret_cast<char*>(&data), sizeof(T));
	return LittleEndianToNative(data);
}
template <typename T>
inline void ReadBinaryLittleEndian(std::istream* stream, std::vector<T>* data) {
	for (T& elem: *data)
		elem = ReadBinaryLittleEndian<T>(stream);
}
template <typename T>
inline void WriteBinaryLittleEndian(std::ostream* stream, const T& data) {
	const T dataLittleEndian(NativeToLittleEndian(data));
	stream->write(reinterpret_cast<const char*>(&dataLittleEndian), sizeof(T));
}
template <typename T>
inline void WriteBinaryLittleEndian(std::ostream* stream, const std::vector<T>& data) {
	for (const T& elem: data)
		WriteBinaryLittleEndian<T>(stream, elem);
}
/*----------------------------------------------------------------*/

} // namespace TOOLS

#endif // __IO_ENDIAN_H__
