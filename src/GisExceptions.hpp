#pragma once
#ifndef canoclass_gisexceptions_h
#define canoclass_gisexceptions_h

#include"canoclass_pch.hpp"

namespace canoclass {

	enum class ErrorKind {
		InputNotFound,
		AlignmentMismatch,
		InsufficientClasses,
		IOFailure,
		UnsupportedFormat
	};
	std::string errorKindName(ErrorKind kind);

	//base of every error this library reports for bad input data or a failed write
	//programming errors (bad window size, band out of range) use the standard exceptions instead
	class CanoClassException : public std::runtime_error {
	public:
		CanoClassException(ErrorKind kind, const std::string& error);
		ErrorKind kind() const;
	private:
		ErrorKind _kind;
	};

	class InputNotFoundException : public CanoClassException {
	public:
		InputNotFoundException(const std::string& error);
	};
	class AlignmentMismatchException : public CanoClassException {
	public:
		AlignmentMismatchException(const std::string& error);
	};
	class InsufficientClassesException : public CanoClassException {
	public:
		InsufficientClassesException(const std::string& error);
	};
	class IOFailureException : public CanoClassException {
	public:
		IOFailureException(const std::string& error);
	};
	class UnsupportedFormatException : public CanoClassException {
	public:
		UnsupportedFormatException(const std::string& error);
	};

	class WrongGeometryTypeException : public UnsupportedFormatException {
	public:
		WrongGeometryTypeException(const std::string& error);
	};
	class WrongFieldTypeException : public UnsupportedFormatException {
	public:
		WrongFieldTypeException(const std::string& error);
	};
}

#endif
